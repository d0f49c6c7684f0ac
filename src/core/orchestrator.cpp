/**
 * Extender Orchestrator Implementation
 * Goal reconciliation loop, operation dispatch and status publication
 */

#include "core/orchestrator.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/time_source.hpp"
#include "core/task_executor.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/process_launcher.hpp"
#include "infrastructure/radio_probe.hpp"
#include "infrastructure/interface_mode_controller.hpp"
#include "infrastructure/upstream_connection_manager.hpp"
#include "infrastructure/access_point_coordinator.hpp"
#include "infrastructure/bridge_coordinator.hpp"
#include "infrastructure/reconnect_policy.hpp"
#include "infrastructure/scan_results.hpp"
#include "services/status_event_service.hpp"

#include <algorithm>
#include <exception>

namespace extender
{
    namespace core
    {

        namespace
        {
            // Polling cadence while a reconnect deadline is pending
            const std::chrono::milliseconds kReconnectPoll(250);

            std::string join(const std::vector<std::string> &items)
            {
                std::string joined;
                for (const auto &item : items)
                {
                    if (!joined.empty())
                    {
                        joined += "; ";
                    }
                    joined += item;
                }
                return joined;
            }

            bool is_mode_action(Action action)
            {
                return action == Action::SET_MODE_STATION || action == Action::ATTACH_AP_INTERFACE;
            }
        }

        /**
         * Everything a dispatched operation needs, copied at dispatch time so
         * the worker never touches loop state
         */
        struct ExtenderOrchestrator::DispatchContext
        {
            uint64_t epoch = 0;
            std::string interface_name;
            std::shared_ptr<infrastructure::InterfaceModeController> controller;
            std::optional<UpstreamProfile> upstream_profile;
            APProfile ap_profile;
        };

        ExtenderOrchestrator::ExtenderOrchestrator(std::shared_ptr<ExtenderConfig> config, OrchestratorDependencies dependencies)
            : config_(std::move(config)),
              logger_(get_logger("ExtenderOrchestrator")),
              runner_(std::move(dependencies.command_runner)),
              launcher_(std::move(dependencies.process_launcher)),
              clock_(std::move(dependencies.clock)),
              executor_(std::move(dependencies.executor)),
              status_events_(std::move(dependencies.status_events)),
              start_time_(std::chrono::steady_clock::now())
        {
            if (!config_)
            {
                throw std::invalid_argument("Extender configuration cannot be null");
            }

            if (!runner_)
                runner_ = std::make_shared<infrastructure::PosixCommandRunner>();
            if (!launcher_)
                launcher_ = std::make_shared<infrastructure::PosixProcessLauncher>();
            if (!clock_)
                clock_ = std::make_shared<SteadyTimeSource>();
            if (!executor_)
                executor_ = std::make_shared<WorkerExecutor>();
            if (!status_events_)
                status_events_ = std::make_shared<services::StatusEventService>();
        }

        ExtenderOrchestrator::~ExtenderOrchestrator()
        {
            if (running_)
            {
                stop();
            }
            executor_->shutdown();
        }

        bool ExtenderOrchestrator::initialize()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (initialized_)
            {
                return true;
            }

            const auto &timeouts = config_->timeouts;
            auto command_timeout = std::chrono::milliseconds(timeouts.command_ms);

            probe_ = std::make_shared<infrastructure::RadioCapabilityProbe>(runner_, config_->paths.sysfs_net_dir, command_timeout);

            interface_name_ = config_->interface_name;
            if (interface_name_.empty())
            {
                auto candidates = probe_->find_suitable_interfaces();
                if (!candidates.empty())
                {
                    interface_name_ = candidates.front();
                    logger_->info("Auto-detected wireless interface",
                                  LogContext()
                                      .add("interface", interface_name_)
                                      .add("candidates", candidates.size()));
                }
                else
                {
                    logger_->error("No wireless interface found");
                }
            }

            if (!interface_name_.empty())
            {
                try
                {
                    radio_ = probe_->probe(interface_name_);
                    radio_present_ = true;
                    interface_seen_ = true;
                    controller_ = std::make_shared<infrastructure::InterfaceModeController>(
                        runner_, probe_, *radio_, command_timeout, std::chrono::milliseconds(timeouts.mode_verify_ms));
                    wire_controller_locked();
                    refresh_mode_locked();
                }
                catch (const ExtenderError &e)
                {
                    interface_seen_ = e.reason() != ReasonCode::NO_SUCH_INTERFACE;
                    if (e.reason() != ReasonCode::NO_SUCH_INTERFACE)
                    {
                        radio_fault_ = e.reason();
                    }
                    logger_->error("Radio probe failed",
                                   LogContext()
                                       .add("interface", interface_name_)
                                       .add("reason", reason_to_string(e.reason()))
                                       .add("error", e.what()));
                }
            }

            infrastructure::UpstreamSettings upstream_settings;
            upstream_settings.interface_name = interface_name_;
            upstream_settings.runtime_dir = config_->paths.runtime_dir;
            upstream_settings.command_timeout = command_timeout;
            upstream_settings.association_timeout = std::chrono::milliseconds(timeouts.association_ms);
            upstream_settings.dhcp_client_timeout = std::chrono::milliseconds(timeouts.dhcp_client_ms);
            upstream_settings.process_stop_timeout = std::chrono::milliseconds(timeouts.process_stop_ms);
            upstream_settings.scan_timeout = std::chrono::milliseconds(timeouts.scan_ms);

            infrastructure::ReconnectPolicy policy(std::chrono::milliseconds(config_->reconnect.base_delay_ms),
                                                   std::chrono::milliseconds(config_->reconnect.max_delay_ms),
                                                   config_->reconnect.max_attempts);

            upstream_ = std::make_shared<infrastructure::UpstreamConnectionManager>(runner_, launcher_, clock_,
                                                                                    upstream_settings, policy);
            upstream_->set_state_listener([this](const ConnectionState &state, ReasonCode reason)
                                          { enqueue(ExtenderEvent::connection_changed(state, reason)); });

            infrastructure::AccessPointSettings ap_settings;
            ap_settings.runtime_dir = config_->paths.runtime_dir;
            ap_settings.bridge_name = config_->bridge.name;
            ap_settings.command_timeout = command_timeout;
            ap_settings.hostapd_ready_timeout = std::chrono::milliseconds(timeouts.hostapd_ready_ms);
            ap_settings.dhcp_ready_timeout = std::chrono::milliseconds(timeouts.dhcp_ready_ms);
            ap_settings.process_stop_timeout = std::chrono::milliseconds(timeouts.process_stop_ms);
            ap_settings.lease_wait = std::chrono::milliseconds(timeouts.lease_wait_ms);

            access_point_ = std::make_shared<infrastructure::AccessPointCoordinator>(runner_, launcher_, clock_, ap_settings);
            ap_restart_policy_ = std::make_unique<infrastructure::ReconnectPolicy>(
                std::chrono::milliseconds(config_->supervision.ap_restart_base_delay_ms),
                std::chrono::milliseconds(config_->supervision.ap_restart_max_delay_ms),
                config_->supervision.ap_restart_max_attempts);
            access_point_->set_state_listener([this](const APState &state)
                                              { enqueue(ExtenderEvent::ap_state_changed(state)); });
            access_point_->set_client_listener([this](const infrastructure::ClientTable::Update &update)
                                               {
                                                   ClientChange change;
                                                   switch (update.change)
                                                   {
                                                   case infrastructure::ClientTable::Change::JOINED:
                                                       change = ClientChange::JOINED;
                                                       break;
                                                   case infrastructure::ClientTable::Change::UPDATED:
                                                       change = ClientChange::UPDATED;
                                                       break;
                                                   case infrastructure::ClientTable::Change::LEFT:
                                                       change = ClientChange::LEFT;
                                                       break;
                                                   default:
                                                       return;
                                                   }
                                                   enqueue(ExtenderEvent::client_changed(change, update.record)); });

            infrastructure::BridgeSettings bridge_settings;
            bridge_settings.bridge_name = config_->bridge.name;
            bridge_settings.ip_forward_path = config_->bridge.ip_forward_path;
            bridge_settings.command_timeout = command_timeout;

            bridge_ = std::make_shared<infrastructure::BridgeCoordinator>(runner_, bridge_settings);
            bridge_->set_state_listener([this](BridgeState state, const std::string &upstream, const std::string &ap)
                                        { enqueue(ExtenderEvent::bridge_changed(state, upstream, ap)); });

            if (config_->upstream)
            {
                upstream_profile_ = config_->upstream->to_profile();
            }
            ap_profile_ = config_->access_point.to_profile();

            initialized_ = true;

            logger_->info("Extender orchestrator initialized",
                          LogContext()
                              .add("interface", interface_name_.empty() ? "none" : interface_name_)
                              .add("radio_present", radio_present_)
                              .add("concurrent", radio_ && radio_->supports_concurrent)
                              .add("upstream_profile", upstream_profile_.has_value())
                              .add("ap_ssid", ap_profile_.ssid));
            return true;
        }

        bool ExtenderOrchestrator::start(std::optional<ExtenderGoal> initial_goal)
        {
            if (!initialize())
            {
                return false;
            }
            if (running_.exchange(true))
            {
                return true; // Already running
            }

            queue_.restart();
            if (initial_goal)
            {
                set_goal(*initial_goal);
            }

            loop_thread_ = std::make_unique<std::thread>(&ExtenderOrchestrator::run_loop, this);
            observer_thread_ = std::make_unique<std::thread>(&ExtenderOrchestrator::run_observer, this);

            logger_->info("Extender orchestrator started",
                          LogContext().add("goal", initial_goal ? goal_to_string(*initial_goal) : "unchanged"));
            return true;
        }

        void ExtenderOrchestrator::stop(std::chrono::milliseconds convergence_timeout)
        {
            if (!running_)
            {
                return;
            }

            logger_->info("Stopping extender orchestrator...");

            set_goal(ExtenderGoal::STOPPED);

            bool converged;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                converged = state_cv_.wait_for(lock, convergence_timeout, [this]
                                               { return goal_ == ExtenderGoal::STOPPED &&
                                                        overall_ == OverallState::STOPPED && !in_flight_; });
            }
            if (!converged)
            {
                logger_->warning("Orchestrator did not reach Stopped in time, forcing teardown",
                                 LogContext().add("timeout_ms", convergence_timeout.count()));
            }

            running_ = false;
            queue_.stop();
            observer_cv_.notify_all();

            if (loop_thread_ && loop_thread_->joinable())
            {
                loop_thread_->join();
            }
            if (observer_thread_ && observer_thread_->joinable())
            {
                observer_thread_->join();
            }
            executor_->shutdown();

            if (!converged)
            {
                // Worker is gone; nothing else touches the components now
                try
                {
                    auto bridge = bridge_->deactivate();
                    if (!bridge)
                    {
                        logger_->error("Forced bridge teardown incomplete",
                                       LogContext().add("error", bridge.message));
                    }
                    access_point_->stop();
                    upstream_->disconnect();
                    if (controller_)
                    {
                        controller_->detach_ap_interface();
                        controller_->request_mode(InterfaceMode::DOWN);
                    }
                }
                catch (const std::exception &e)
                {
                    logger_->error("Error during forced teardown", LogContext().add("error", e.what()));
                }
            }

            logger_->info("Extender orchestrator stopped");
        }

        Outcome ExtenderOrchestrator::set_goal(ExtenderGoal goal)
        {
            if (!enqueue(ExtenderEvent::goal_changed(goal)))
            {
                return Outcome::failure(ReasonCode::COMMAND_FAILED, "orchestrator is shutting down");
            }
            return Outcome::success();
        }

        Outcome ExtenderOrchestrator::request_scan()
        {
            if (!enqueue(ExtenderEvent::scan_requested()))
            {
                return Outcome::failure(ReasonCode::COMMAND_FAILED, "orchestrator is shutting down");
            }
            return Outcome::success();
        }

        Outcome ExtenderOrchestrator::connect_upstream(const UpstreamProfile &profile)
        {
            auto violations = validate_upstream_profile(profile);
            if (!violations.empty())
            {
                return Outcome::failure(ReasonCode::CONFIGURATION_INVALID, join(violations));
            }
            if (!enqueue(ExtenderEvent::upstream_profile_supplied(profile)))
            {
                return Outcome::failure(ReasonCode::COMMAND_FAILED, "orchestrator is shutting down");
            }
            return Outcome::success();
        }

        Outcome ExtenderOrchestrator::change_ap_profile(const APProfile &profile)
        {
            auto violations = validate_ap_profile(profile);
            if (!violations.empty())
            {
                return Outcome::failure(ReasonCode::CONFIGURATION_INVALID, join(violations));
            }
            if (!enqueue(ExtenderEvent::ap_profile_changed(profile)))
            {
                return Outcome::failure(ReasonCode::COMMAND_FAILED, "orchestrator is shutting down");
            }
            return Outcome::success();
        }

        Outcome ExtenderOrchestrator::change_ap_profile(const APProfilePatch &patch)
        {
            return change_ap_profile(patch.apply_to(ap_profile()));
        }

        Outcome ExtenderOrchestrator::manual_retry()
        {
            if (!enqueue(ExtenderEvent::manual_retry()))
            {
                return Outcome::failure(ReasonCode::COMMAND_FAILED, "orchestrator is shutting down");
            }
            return Outcome::success();
        }

        bool ExtenderOrchestrator::enqueue(ExtenderEvent event)
        {
            if (!queue_.enqueue(std::move(event)))
            {
                logger_->warning("Event dropped, queue stopped");
                return false;
            }
            return true;
        }

        void ExtenderOrchestrator::run_loop()
        {
            logger_->debug("Loop thread started");

            auto tick_interval = std::chrono::milliseconds(config_->supervision.tick_interval_ms);
            auto next_tick = std::chrono::steady_clock::now() + tick_interval;

            while (running_)
            {
                auto wait = tick_interval;
                if (connection_state().kind == ConnectionStateKind::RECONNECTING ||
                    ap_state().kind == APStateKind::FAILED)
                {
                    wait = std::min(wait, kReconnectPoll);
                }

                auto event = queue_.dequeue_for(wait);
                if (!running_)
                {
                    break;
                }

                try
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (event)
                    {
                        handle_event(*event);
                        while (auto more = queue_.try_dequeue())
                        {
                            handle_event(*more);
                        }
                    }

                    auto now = std::chrono::steady_clock::now();
                    if (now >= next_tick)
                    {
                        tick_locked();
                        next_tick = now + tick_interval;
                    }

                    reconcile_locked();
                }
                catch (const std::exception &e)
                {
                    logger_->error("Error in orchestrator loop", LogContext().add("error", e.what()));
                }
            }

            logger_->debug("Loop thread stopped");
        }

        void ExtenderOrchestrator::run_observer()
        {
            logger_->debug("Observer thread started");

            auto sample_interval = std::chrono::milliseconds(config_->supervision.signal_sample_interval_ms);
            auto status_interval = std::chrono::seconds(config_->logging.status_interval);
            auto next_status = std::chrono::steady_clock::now() + status_interval;

            while (running_)
            {
                {
                    std::unique_lock<std::mutex> lock(observer_mutex_);
                    observer_cv_.wait_for(lock, sample_interval, [this]
                                          { return !running_; });
                }
                if (!running_)
                {
                    break;
                }

                try
                {
                    sample_signals();

                    if (status_interval.count() > 0 && std::chrono::steady_clock::now() >= next_status)
                    {
                        log_status();
                        next_status = std::chrono::steady_clock::now() + status_interval;
                    }
                }
                catch (const std::exception &e)
                {
                    logger_->error("Error in observer", LogContext().add("error", e.what()));
                }
            }

            logger_->debug("Observer thread stopped");
        }

        size_t ExtenderOrchestrator::process_pending()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t handled = 0;
            while (auto event = queue_.try_dequeue())
            {
                handle_event(*event);
                ++handled;
            }
            reconcile_locked();
            return handled;
        }

        void ExtenderOrchestrator::tick()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            while (auto event = queue_.try_dequeue())
            {
                handle_event(*event);
            }
            tick_locked();
            reconcile_locked();
        }

        void ExtenderOrchestrator::sample_signals()
        {
            if (!upstream_ || !access_point_)
            {
                return;
            }

            auto signal = upstream_->sample_signal();
            access_point_->refresh_station_signals();

            nlohmann::json stations = nlohmann::json::object();
            for (const auto &client : access_point_->clients())
            {
                if (client.signal_dbm)
                {
                    stations[client.mac] = *client.signal_dbm;
                }
            }

            if (!signal && stations.empty())
            {
                return;
            }

            nlohmann::json details{
                {"interface", upstream_->interface_name()},
                {"upstream_signal_dbm", signal ? nlohmann::json(*signal) : nlohmann::json(nullptr)},
                {"stations", stations}};
            status_events_->publish(services::StatusEventType::LINK_QUALITY_SAMPLED, ReasonCode::NONE, std::move(details));
        }

        void ExtenderOrchestrator::handle_event(const ExtenderEvent &event)
        {
            logger_->debug("Handling event",
                           LogContext()
                               .add("type", event.type_name())
                               .add("age_ms", event.age_ms()));

            switch (event.type)
            {
            case ExtenderEventType::GOAL_CHANGED:
            {
                auto goal = std::get<GoalData>(event.data).goal;
                goal_ = goal;
                ++epoch_;
                terminal_.reset();
                blocked_action_ = Action::NONE;
                mode_failures_ = 0;
                ap_start_failures_ = 0;
                extending_reached_ = false;
                reset_ap_restarts_locked();

                upstream_->set_auto_reconnect(goal == ExtenderGoal::EXTENDING);
                upstream_->reset_reconnect();

                logger_->info("Goal changed",
                              LogContext()
                                  .add("goal", goal_to_string(goal))
                                  .add("epoch", epoch_));
                status_events_->publish(services::StatusEventType::GOAL_CHANGED, ReasonCode::OPERATOR_REQUEST,
                                        nlohmann::json{{"goal", goal_to_string(goal)}, {"epoch", epoch_}});
                break;
            }

            case ExtenderEventType::SCAN_REQUESTED:
                scan_pending_ = true;
                break;

            case ExtenderEventType::UPSTREAM_PROFILE_SUPPLIED:
            {
                const auto &profile = std::get<UpstreamProfileData>(event.data).profile;
                upstream_profile_ = profile;
                ++epoch_;
                upstream_restart_pending_ = true;
                terminal_.reset();
                blocked_action_ = Action::NONE;
                upstream_->reset_reconnect();

                logger_->info("Upstream profile supplied",
                              LogContext()
                                  .add("ssid", profile.ssid)
                                  .add("security", security_to_string(profile.security)));
                break;
            }

            case ExtenderEventType::AP_PROFILE_CHANGED:
            {
                ap_profile_ = std::get<APProfileData>(event.data).profile;
                ap_restart_pending_ = true;
                ap_start_failures_ = 0;
                reset_ap_restarts_locked();
                blocked_action_ = Action::NONE;
                if (terminal_ == ReasonCode::AP_START_FAILED || terminal_ == ReasonCode::AP_PROCESS_EXITED)
                {
                    terminal_.reset();
                }

                logger_->info("Access point profile changed",
                              LogContext()
                                  .add("ssid", ap_profile_.ssid)
                                  .add("channel", ap_profile_.channel));
                break;
            }

            case ExtenderEventType::MANUAL_RETRY:
                terminal_.reset();
                blocked_action_ = Action::NONE;
                mode_failures_ = 0;
                ap_start_failures_ = 0;
                reset_ap_restarts_locked();
                reprobe_pending_ = !interface_name_.empty();
                upstream_->reset_reconnect();
                logger_->info("Manual retry requested");
                break;

            case ExtenderEventType::OPERATION_COMPLETED:
                handle_completion(std::get<OperationResult>(event.data));
                break;

            case ExtenderEventType::MODE_CHANGED:
            {
                const auto &data = std::get<ModeData>(event.data);
                mode_ = data.mode;
                ap_interface_present_ = data.ap_interface_present;
                status_events_->publish(services::StatusEventType::MODE_CHANGED, ReasonCode::NONE,
                                        nlohmann::json{
                                            {"interface", interface_name_},
                                            {"mode", mode_to_string(data.mode)},
                                            {"ap_interface", ap_interface_name_locked()},
                                            {"ap_interface_present", data.ap_interface_present}});
                break;
            }

            case ExtenderEventType::CONNECTION_CHANGED:
            {
                const auto &data = std::get<ConnectionData>(event.data);
                auto details = data.state.to_json();
                if (upstream_profile_)
                {
                    details["ssid"] = upstream_profile_->ssid;
                }
                status_events_->publish(services::StatusEventType::CONNECTION_STATE_CHANGED, data.reason, std::move(details));
                break;
            }

            case ExtenderEventType::AP_STATE_CHANGED:
            {
                const auto &data = std::get<APStateData>(event.data);
                on_ap_state_locked(data.state);
                auto details = data.state.to_json();
                details["ssid"] = ap_profile_.ssid;
                status_events_->publish(services::StatusEventType::AP_STATE_CHANGED, data.state.reason, std::move(details));
                break;
            }

            case ExtenderEventType::BRIDGE_CHANGED:
            {
                const auto &data = std::get<BridgeData>(event.data);
                nlohmann::json details{
                    {"bridge", bridge_->bridge_name()},
                    {"state", bridge_state_to_string(data.state)},
                    {"upstream_interface", data.upstream_interface},
                    {"ap_interface", data.ap_interface}};
                if (data.state == BridgeState::ACTIVE && !bridge_reported_active_)
                {
                    bridge_reported_active_ = true;
                    status_events_->publish(services::StatusEventType::BRIDGE_ACTIVE, ReasonCode::NONE, std::move(details));
                }
                else if (data.state != BridgeState::ACTIVE && bridge_reported_active_)
                {
                    bridge_reported_active_ = false;
                    status_events_->publish(services::StatusEventType::BRIDGE_INACTIVE, ReasonCode::NONE, std::move(details));
                }
                break;
            }

            case ExtenderEventType::CLIENT_CHANGED:
            {
                const auto &data = std::get<ClientData>(event.data);
                services::StatusEventType type = services::StatusEventType::CLIENT_UPDATED;
                if (data.change == ClientChange::JOINED)
                    type = services::StatusEventType::CLIENT_JOINED;
                else if (data.change == ClientChange::LEFT)
                    type = services::StatusEventType::CLIENT_LEFT;
                status_events_->publish(type, ReasonCode::NONE, data.record.to_json());
                break;
            }
            }
        }

        void ExtenderOrchestrator::handle_completion(const OperationResult &result)
        {
            in_flight_.reset();

            // Nothing runs on the worker now, so the controller can be read without blocking
            refresh_mode_locked();

            if (result.action == Action::SCAN)
            {
                if (result.outcome)
                {
                    last_scan_ = result.networks;
                }
                nlohmann::json networks = nlohmann::json::array();
                for (const auto &network : result.networks)
                {
                    networks.push_back(network.to_json());
                }
                status_events_->publish(services::StatusEventType::SCAN_COMPLETED, result.outcome.reason,
                                        nlohmann::json{{"count", result.networks.size()}, {"networks", networks}});
                return;
            }

            if (result.action == Action::REPROBE)
            {
                if (result.outcome && result.radio)
                {
                    radio_ = *result.radio;
                    radio_present_ = true;
                    interface_seen_ = true;
                    radio_fault_.reset();
                    if (!controller_)
                    {
                        controller_ = std::make_shared<infrastructure::InterfaceModeController>(
                            runner_, probe_, *radio_,
                            std::chrono::milliseconds(config_->timeouts.command_ms),
                            std::chrono::milliseconds(config_->timeouts.mode_verify_ms));
                        wire_controller_locked();
                    }
                    refresh_mode_locked();
                    logger_->info("Radio re-probed",
                                  LogContext()
                                      .add("interface", radio_->interface_name)
                                      .add("concurrent", radio_->supports_concurrent));
                }
                else
                {
                    radio_present_ = false;
                    if (result.outcome.reason != ReasonCode::NO_SUCH_INTERFACE)
                    {
                        radio_fault_ = result.outcome.reason;
                    }
                    logger_->warning("Radio re-probe failed",
                                     LogContext()
                                         .add("reason", reason_to_string(result.outcome.reason))
                                         .add("error", result.outcome.message));
                }
                return;
            }

            if (result.epoch != epoch_)
            {
                logger_->info("Discarding result of superseded operation",
                              LogContext()
                                  .add("action", action_to_string(result.action))
                                  .add("epoch", result.epoch)
                                  .add("current_epoch", epoch_)
                                  .add("ok", result.outcome.ok));
                return;
            }

            if (result.outcome)
            {
                if (is_mode_action(result.action))
                {
                    mode_failures_ = 0;
                }
                else if (result.action == Action::START_ACCESS_POINT)
                {
                    ap_start_failures_ = 0;
                }
                logger_->debug("Operation completed", LogContext().add("action", action_to_string(result.action)));
                return;
            }

            if (is_mode_action(result.action))
            {
                ++mode_failures_;
            }
            else if (result.action == Action::START_ACCESS_POINT)
            {
                ++ap_start_failures_;
            }

            // Connection attempts are paced by the reconnect policy instead
            if (result.action != Action::CONNECT_UPSTREAM && result.action != Action::RECONNECT_UPSTREAM)
            {
                blocked_action_ = result.action;
            }

            logger_->warning("Operation failed",
                             LogContext()
                                 .add("action", action_to_string(result.action))
                                 .add("reason", reason_to_string(result.outcome.reason))
                                 .add("error", result.outcome.message)
                                 .add("mode_failures", mode_failures_)
                                 .add("ap_start_failures", ap_start_failures_));
        }

        void ExtenderOrchestrator::tick_locked()
        {
            blocked_action_ = Action::NONE;

            if (!interface_name_.empty())
            {
                bool exists = probe_->interface_exists(interface_name_);
                if (radio_present_ && !exists)
                {
                    radio_present_ = false;
                    interface_seen_ = false;
                    logger_->critical("Wireless interface disappeared", LogContext().add("interface", interface_name_));
                    latch_terminal_locked(ReasonCode::HARDWARE_UNAVAILABLE);
                }
                else if (!exists)
                {
                    interface_seen_ = false;
                }
                else if (!interface_seen_)
                {
                    interface_seen_ = true;
                    reprobe_pending_ = true;
                    logger_->info("Wireless interface reappeared", LogContext().add("interface", interface_name_));
                }
            }

            access_point_->expire_clients();
        }

        Snapshot ExtenderOrchestrator::snapshot_locked() const
        {
            Snapshot s;
            s.goal = goal_;
            s.radio_present = radio_present_ && controller_ != nullptr;
            s.radio_concurrent = radio_ && radio_->supports_concurrent;
            s.mode = mode_;
            s.ap_interface_present = ap_interface_present_;
            s.connection = upstream_->current_state();
            s.reconnect_due = upstream_->reconnect_due(clock_->now());
            s.has_upstream_profile = upstream_profile_.has_value();
            s.ap = access_point_->current_state();
            s.ap_restart_due = !ap_restart_at_ || clock_->now() >= *ap_restart_at_;
            s.bridge = bridge_->current_state();
            s.operation_in_flight = in_flight_.has_value();
            s.upstream_restart_pending = upstream_restart_pending_;
            s.ap_restart_pending = ap_restart_pending_;
            s.blocked_action = blocked_action_;
            s.mode_failures = mode_failures_;
            s.mode_failure_limit = config_->supervision.mode_transition_max_attempts;
            s.ap_start_failures = ap_start_failures_;
            s.ap_start_failure_limit = config_->supervision.ap_start_max_attempts;
            s.terminal = terminal_ ? terminal_ : radio_fault_;
            s.extending_reached = extending_reached_;
            return s;
        }

        void ExtenderOrchestrator::reconcile_locked()
        {
            if (!initialized_)
            {
                return;
            }

            // Operator requests that bypass reconciliation run whenever the worker is idle
            if (!in_flight_ && reprobe_pending_)
            {
                reprobe_pending_ = false;
                dispatch_locked(Action::REPROBE);
            }
            if (!in_flight_ && scan_pending_)
            {
                scan_pending_ = false;
                bool scannable = mode_ == InterfaceMode::STATION ||
                                 (goal_ == ExtenderGoal::STOPPED && mode_ == InterfaceMode::DOWN && !ap_interface_present_);
                if (radio_present_ && controller_ && scannable)
                {
                    dispatch_locked(Action::SCAN);
                }
                else
                {
                    auto reason = radio_present_ && controller_ ? ReasonCode::INCOMPATIBLE_MODE
                                                                : ReasonCode::HARDWARE_UNAVAILABLE;
                    logger_->warning("Scan rejected, radio cannot enter station mode now",
                                     LogContext()
                                         .add("mode", mode_to_string(mode_))
                                         .add("reason", reason_to_string(reason)));
                    status_events_->publish(services::StatusEventType::SCAN_COMPLETED, reason,
                                            nlohmann::json{{"count", 0}, {"networks", nlohmann::json::array()}});
                }
            }

            if (ap_crash_restarts_ > 0 && ap_running_since_ && access_point_->current_state().is_running() &&
                clock_->now() - *ap_running_since_ >= std::chrono::milliseconds(config_->supervision.ap_stable_after_ms))
            {
                logger_->info("Access point stable again, crash count cleared",
                              LogContext().add("crash_restarts", ap_crash_restarts_));
                ap_crash_restarts_ = 0;
                ap_restart_at_.reset();
            }

            Decision decision = reconcile(snapshot_locked());

            if (decision.request_bridge_teardown)
            {
                bridge_->request_teardown();
            }

            if (decision.terminal)
            {
                latch_terminal_locked(decision.reason);
            }

            if (decision.state == OverallState::EXTENDING)
            {
                extending_reached_ = true;
            }
            publish_overall_locked(decision.state, decision.reason);

            if (decision.action != Action::NONE)
            {
                dispatch_locked(decision.action);
            }

            state_cv_.notify_all();
        }

        bool ExtenderOrchestrator::dispatch_locked(Action action)
        {
            DispatchContext context;
            context.epoch = epoch_;
            context.interface_name = interface_name_;
            context.controller = controller_;
            context.upstream_profile = upstream_profile_;
            context.ap_profile = ap_profile_;

            if (action == Action::CONNECT_UPSTREAM || action == Action::RECONNECT_UPSTREAM)
            {
                upstream_restart_pending_ = false;
            }
            else if (action == Action::START_ACCESS_POINT)
            {
                ap_restart_pending_ = false;
            }

            logger_->info("Dispatching operation",
                          LogContext()
                              .add("action", action_to_string(action))
                              .add("epoch", context.epoch));

            in_flight_ = action;
            bool posted = executor_->post([this, action, context]()
                                          {
                                              OperationResult result = execute(action, context);
                                              enqueue(ExtenderEvent::operation_completed(std::move(result))); });
            if (!posted)
            {
                in_flight_.reset();
                logger_->warning("Executor rejected operation", LogContext().add("action", action_to_string(action)));
            }
            return posted;
        }

        OperationResult ExtenderOrchestrator::execute(Action action, const DispatchContext &context)
        {
            OperationResult result;
            result.action = action;
            result.epoch = context.epoch;

            auto missing_radio = Outcome::failure(ReasonCode::HARDWARE_UNAVAILABLE, "no radio under control");

            try
            {
                switch (action)
                {
                case Action::NONE:
                    break;
                case Action::DEACTIVATE_BRIDGE:
                    result.outcome = bridge_->deactivate();
                    break;
                case Action::STOP_ACCESS_POINT:
                    result.outcome = access_point_->stop();
                    break;
                case Action::DISCONNECT_UPSTREAM:
                    result.outcome = upstream_->disconnect();
                    break;
                case Action::DETACH_AP_INTERFACE:
                    result.outcome = context.controller ? context.controller->detach_ap_interface() : missing_radio;
                    break;
                case Action::SET_MODE_DOWN:
                    result.outcome = context.controller ? context.controller->request_mode(InterfaceMode::DOWN) : missing_radio;
                    break;
                case Action::SET_MODE_STATION:
                    result.outcome = context.controller ? context.controller->request_mode(InterfaceMode::STATION) : missing_radio;
                    break;
                case Action::ATTACH_AP_INTERFACE:
                    result.outcome = context.controller ? context.controller->attach_ap_interface() : missing_radio;
                    break;
                case Action::CONNECT_UPSTREAM:
                    if (!context.upstream_profile)
                    {
                        result.outcome = Outcome::failure(ReasonCode::NO_UPSTREAM_PROFILE, "no upstream profile");
                        break;
                    }
                    result.outcome = upstream_->connect(*context.upstream_profile);
                    break;
                case Action::RECONNECT_UPSTREAM:
                    result.outcome = upstream_->reconnect();
                    break;
                case Action::START_ACCESS_POINT:
                    if (!context.controller)
                    {
                        result.outcome = missing_radio;
                        break;
                    }
                    result.outcome = access_point_->start(context.ap_profile, context.controller->ap_interface_name());
                    break;
                case Action::ACTIVATE_BRIDGE:
                    if (!context.controller)
                    {
                        result.outcome = missing_radio;
                        break;
                    }
                    result.outcome = bridge_->activate(context.interface_name, context.controller->ap_interface_name(),
                                                       context.ap_profile.gateway_cidr());
                    break;
                case Action::SCAN:
                {
                    // A powered-down radio is lent station mode for the scan and put back afterwards
                    bool lent = false;
                    if (context.controller && context.controller->current_mode() == InterfaceMode::DOWN)
                    {
                        result.outcome = context.controller->request_mode(InterfaceMode::STATION);
                        if (!result.outcome)
                        {
                            break;
                        }
                        lent = true;
                    }

                    std::exception_ptr scan_error;
                    try
                    {
                        result.networks = upstream_->scan().collect();
                    }
                    catch (...)
                    {
                        scan_error = std::current_exception();
                    }

                    if (lent)
                    {
                        auto restored = context.controller->request_mode(InterfaceMode::DOWN);
                        if (!restored)
                        {
                            // Stopped reconciliation issues SetModeDown again
                            logger_->warning("Could not return radio to down after scan",
                                             LogContext().add("error", restored.message));
                        }
                    }
                    if (scan_error)
                    {
                        std::rethrow_exception(scan_error);
                    }
                    break;
                }
                case Action::REPROBE:
                {
                    auto identity = probe_->probe(context.interface_name);
                    if (context.controller)
                    {
                        context.controller->reset(identity);
                    }
                    result.radio = identity;
                    break;
                }
                }
            }
            catch (const ExtenderError &e)
            {
                result.outcome = Outcome::failure(e.reason(), e.what());
            }
            catch (const std::exception &e)
            {
                result.outcome = Outcome::failure(ReasonCode::COMMAND_FAILED, e.what());
            }

            return result;
        }

        void ExtenderOrchestrator::refresh_mode_locked()
        {
            if (controller_)
            {
                mode_ = controller_->current_mode();
                ap_interface_present_ = controller_->ap_interface_present();
            }
            else
            {
                mode_ = InterfaceMode::DOWN;
                ap_interface_present_ = false;
            }
        }

        std::string ExtenderOrchestrator::ap_interface_name_locked() const
        {
            // Derived from the physical name so the loop never waits on the controller
            if (!controller_ || interface_name_.empty())
            {
                return "";
            }
            return infrastructure::InterfaceModeController::make_ap_interface_name(interface_name_);
        }

        void ExtenderOrchestrator::wire_controller_locked()
        {
            controller_->set_mode_listener([this](InterfaceMode mode, bool ap_interface_present)
                                           { enqueue(ExtenderEvent::mode_changed(mode, ap_interface_present)); });
        }

        void ExtenderOrchestrator::publish_overall_locked(OverallState state, ReasonCode reason)
        {
            if (state == overall_)
            {
                return;
            }

            auto previous = overall_;
            overall_ = state;

            logger_->info("Overall state changed",
                          LogContext()
                              .add("from", overall_state_to_string(previous))
                              .add("to", overall_state_to_string(state))
                              .add("reason", reason_to_string(reason)));
            status_events_->publish(services::StatusEventType::OVERALL_STATE_CHANGED, reason,
                                    nlohmann::json{
                                        {"state", overall_state_to_string(state)},
                                        {"previous", overall_state_to_string(previous)},
                                        {"goal", goal_to_string(goal_)}});
        }

        void ExtenderOrchestrator::on_ap_state_locked(const APState &state)
        {
            if (state.is_running())
            {
                ap_running_since_ = clock_->now();
                return;
            }
            ap_running_since_.reset();

            if (state.kind != APStateKind::FAILED || state.reason != ReasonCode::AP_PROCESS_EXITED ||
                goal_ != ExtenderGoal::EXTENDING)
            {
                return;
            }

            ++ap_crash_restarts_;
            if (ap_restart_policy_->exhausted(ap_crash_restarts_))
            {
                logger_->error("Access point keeps crashing, giving up",
                               LogContext().add("crash_restarts", ap_crash_restarts_ - 1));
                latch_terminal_locked(ReasonCode::AP_PROCESS_EXITED);
                return;
            }

            auto delay = ap_restart_policy_->delay_for(ap_crash_restarts_);
            ap_restart_at_ = clock_->now() + delay;
            logger_->warning("Access point crashed, restart scheduled",
                             LogContext()
                                 .add("attempt", ap_crash_restarts_)
                                 .add("delay_ms", delay.count()));
        }

        void ExtenderOrchestrator::reset_ap_restarts_locked()
        {
            ap_crash_restarts_ = 0;
            ap_restart_at_.reset();
        }

        void ExtenderOrchestrator::latch_terminal_locked(ReasonCode reason)
        {
            if (terminal_)
            {
                return;
            }
            terminal_ = reason;

            logger_->error("Terminal condition, waiting for operator",
                           LogContext()
                               .add("reason", reason_to_string(reason))
                               .add("goal", goal_to_string(goal_)));
            status_events_->publish(services::StatusEventType::UNRECOVERABLE, reason,
                                    nlohmann::json{
                                        {"state", overall_state_to_string(OverallState::DEGRADED)},
                                        {"interface", interface_name_}});
        }

        void ExtenderOrchestrator::log_status()
        {
            auto connection = connection_state();
            auto ap = ap_state();
            logger_->info("Extender status",
                          LogContext()
                              .add("state", overall_state_to_string(overall_state()))
                              .add("goal", goal_to_string(goal()))
                              .add("upstream", connection.name())
                              .add("ap", ap.name())
                              .add("bridge", bridge_state_to_string(bridge_state()))
                              .add("clients", clients().size())
                              .add("uptime_s", std::chrono::duration_cast<std::chrono::seconds>(
                                                   std::chrono::steady_clock::now() - start_time_)
                                                   .count()));
        }

        nlohmann::json ExtenderOrchestrator::status() const
        {
            std::lock_guard<std::mutex> lock(mutex_);

            nlohmann::json clients = nlohmann::json::array();
            if (access_point_)
            {
                for (const auto &client : access_point_->clients())
                {
                    clients.push_back(client.to_json());
                }
            }

            auto terminal = terminal_ ? terminal_ : radio_fault_;

            nlohmann::json status{
                {"goal", goal_to_string(goal_)},
                {"state", overall_state_to_string(overall_)},
                {"reason", reason_to_string(terminal.value_or(ReasonCode::NONE))},
                {"epoch", epoch_},
                {"interface", interface_name_},
                {"radio", radio_ ? radio_->to_json() : nlohmann::json(nullptr)},
                {"radio_present", radio_present_},
                {"mode", mode_to_string(mode_)},
                {"ap_interface", ap_interface_name_locked()},
                {"ap_interface_present", ap_interface_present_},
                {"operation_in_flight", in_flight_ ? nlohmann::json(action_to_string(*in_flight_)) : nlohmann::json(nullptr)},
                {"mode_failures", mode_failures_},
                {"ap_start_failures", ap_start_failures_},
                {"clients", clients},
                {"uptime_s", std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start_time_).count()},
                {"last_event_sequence", status_events_->last_sequence()}};

            if (upstream_)
            {
                status["connection"] = upstream_->current_state().to_json();
            }
            status["upstream_profile"] = upstream_profile_ ? upstream_profile_->to_json() : nlohmann::json(nullptr);

            nlohmann::json ap{{"profile", ap_profile_.to_json()}};
            if (access_point_)
            {
                ap["state"] = access_point_->current_state().to_json();
            }
            status["access_point"] = ap;

            if (bridge_)
            {
                status["bridge"] = nlohmann::json{
                    {"name", bridge_->bridge_name()},
                    {"state", bridge_state_to_string(bridge_->current_state())}};
            }
            return status;
        }

        OverallState ExtenderOrchestrator::overall_state() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return overall_;
        }

        ExtenderGoal ExtenderOrchestrator::goal() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return goal_;
        }

        std::optional<ReasonCode> ExtenderOrchestrator::terminal_reason() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return terminal_ ? terminal_ : radio_fault_;
        }

        std::optional<RadioIdentity> ExtenderOrchestrator::radio() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return radio_;
        }

        std::vector<ClientRecord> ExtenderOrchestrator::clients() const
        {
            return access_point_ ? access_point_->clients() : std::vector<ClientRecord>{};
        }

        std::vector<DiscoveredNetwork> ExtenderOrchestrator::last_scan() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return last_scan_;
        }

        APProfile ExtenderOrchestrator::ap_profile() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return ap_profile_;
        }

        ConnectionState ExtenderOrchestrator::connection_state() const
        {
            return upstream_ ? upstream_->current_state() : ConnectionState{};
        }

        APState ExtenderOrchestrator::ap_state() const
        {
            return access_point_ ? access_point_->current_state() : APState{};
        }

        BridgeState ExtenderOrchestrator::bridge_state() const
        {
            return bridge_ ? bridge_->current_state() : BridgeState::TORN_DOWN;
        }

        std::optional<Action> ExtenderOrchestrator::operation_in_flight() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return in_flight_;
        }

    } // namespace core
} // namespace extender
