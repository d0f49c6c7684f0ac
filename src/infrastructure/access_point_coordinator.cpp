/**
 * Access Point Coordinator Implementation
 * hostapd + dnsmasq lifecycle and client tracking
 */

#include "infrastructure/access_point_coordinator.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/process_launcher.hpp"
#include "infrastructure/config_renderer.hpp"
#include "core/config.hpp"
#include "core/time_source.hpp"
#include "core/logger.hpp"

#include <regex>
#include <sstream>

namespace extender
{
    namespace infrastructure
    {

        namespace
        {
            const std::regex kStationEventRegex(R"(AP-STA-(CONNECTED|DISCONNECTED)\s+([0-9a-fA-F:]{17}))");
            const std::regex kDhcpAckRegex(R"(DHCPACK\(([^)]*)\)\s+(\S+)\s+([0-9a-fA-F:]{17})(?:\s+(\S+))?)");
            const std::regex kDhcpReleaseRegex(R"(DHCPRELEASE\(([^)]*)\)\s+(\S+)\s+([0-9a-fA-F:]{17}))");

            const char *leg_name(bool hostapd)
            {
                return hostapd ? "hostapd" : "dnsmasq";
            }
        }

        AccessPointCoordinator::AccessPointCoordinator(std::shared_ptr<CommandRunner> runner,
                                                       std::shared_ptr<ProcessLauncher> launcher,
                                                       std::shared_ptr<core::TimeSource> clock,
                                                       const AccessPointSettings &settings)
            : runner_(std::move(runner)),
              launcher_(std::move(launcher)),
              clock_(std::move(clock)),
              settings_(settings),
              logger_(core::get_logger("AccessPointCoordinator")),
              clients_(settings.lease_wait)
        {
        }

        AccessPointCoordinator::~AccessPointCoordinator()
        {
            pid_t hostapd_pid;
            pid_t dnsmasq_pid;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++generation_;
                hostapd_pid = hostapd_pid_;
                dnsmasq_pid = dnsmasq_pid_;
                hostapd_pid_ = -1;
                dnsmasq_pid_ = -1;
            }
            if (hostapd_pid > 0)
                launcher_->terminate(hostapd_pid, settings_.process_stop_timeout);
            if (dnsmasq_pid > 0)
                launcher_->terminate(dnsmasq_pid, settings_.process_stop_timeout);
        }

        core::Outcome AccessPointCoordinator::start(const core::APProfile &profile, const std::string &interface_name)
        {
            // Clean up a surviving leg from an earlier failure
            pid_t old_hostapd;
            pid_t old_dnsmasq;
            std::string old_interface;
            std::vector<ClientTable::Update> departed;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++generation_;
                old_hostapd = hostapd_pid_;
                old_dnsmasq = dnsmasq_pid_;
                old_interface = interface_;
                hostapd_pid_ = -1;
                dnsmasq_pid_ = -1;
                departed = clients_.clear();
            }
            cv_.notify_all();
            if (old_hostapd > 0 || old_dnsmasq > 0)
            {
                logger_->info("Cleaning up previous access point legs");
                teardown(old_hostapd, old_dnsmasq, old_interface);
            }
            publish_clients(departed);

            uint64_t generation;
            core::APState snapshot;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                generation = ++generation_;
                profile_ = profile;
                interface_ = interface_name;
                hostapd_ready_ = false;
                hostapd_exited_ = false;
                dnsmasq_ready_ = false;
                dnsmasq_exited_ = false;
                lease_duration_ = core::parse_lease_duration(profile.lease_time).value_or(std::chrono::hours(12));
                state_ = core::APState{core::APStateKind::STARTING, core::ReasonCode::NONE};
                snapshot = state_;
            }
            publish_state(snapshot);

            logger_->info("Starting access point",
                          core::LogContext()
                              .add("interface", interface_name)
                              .add("ssid", profile.ssid)
                              .add("channel", profile.channel)
                              .add("gateway", profile.gateway_cidr()));

            // Regenerate both configurations on every start
            std::string error;
            auto runtime_dir = std::filesystem::path(settings_.runtime_dir);
            auto hostapd_conf = render_hostapd_conf(profile, interface_name, (runtime_dir / "hostapd").string());
            auto dnsmasq_conf = render_dnsmasq_conf(profile, interface_name, settings_.bridge_name,
                                                    (runtime_dir / ("dnsmasq-" + interface_name + ".leases")).string());
            if (!write_private_file(hostapd_conf_path(interface_name), hostapd_conf, error) ||
                !write_private_file(dnsmasq_conf_path(interface_name), dnsmasq_conf, error))
            {
                return abort_start(generation, core::ReasonCode::AP_START_FAILED, error);
            }

            std::string cause;
            if (!run_step({"ip", "addr", "flush", "dev", interface_name}, cause) ||
                !run_step({"ip", "addr", "add", profile.gateway_cidr(), "dev", interface_name}, cause) ||
                !run_step({"ip", "link", "set", "dev", interface_name, "up"}, cause))
            {
                return abort_start(generation, core::ReasonCode::AP_START_FAILED, cause);
            }

            pid_t hostapd_pid = launcher_->spawn(
                {"hostapd", hostapd_conf_path(interface_name).string()},
                [this, generation](const std::string &line)
                { on_hostapd_line(generation, line); },
                [this, generation](int status)
                { on_leg_exit(generation, Leg::HOSTAPD, status); });
            if (hostapd_pid < 0)
            {
                return abort_start(generation, core::ReasonCode::AP_START_FAILED, "hostapd could not be started");
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (generation == generation_)
                {
                    hostapd_pid_ = hostapd_pid;
                }
            }

            if (!wait_for_leg(generation, Leg::HOSTAPD, settings_.hostapd_ready_timeout, cause))
            {
                return abort_start(generation, core::ReasonCode::AP_START_FAILED, cause);
            }

            pid_t dnsmasq_pid = launcher_->spawn(
                {"dnsmasq", "--keep-in-foreground", "--log-facility=-", "--log-dhcp",
                 "--conf-file=" + dnsmasq_conf_path(interface_name).string()},
                [this, generation](const std::string &line)
                { on_dnsmasq_line(generation, line); },
                [this, generation](int status)
                { on_leg_exit(generation, Leg::DNSMASQ, status); });
            if (dnsmasq_pid < 0)
            {
                return abort_start(generation, core::ReasonCode::DHCP_START_FAILED, "dnsmasq could not be started");
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (generation == generation_)
                {
                    dnsmasq_pid_ = dnsmasq_pid;
                }
            }

            if (!wait_for_leg(generation, Leg::DNSMASQ, settings_.dhcp_ready_timeout, cause))
            {
                return abort_start(generation, core::ReasonCode::DHCP_START_FAILED, cause);
            }

            // Either leg may have died after reporting ready; its exit was absorbed while STARTING
            bool hostapd_died = false;
            bool dnsmasq_died = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (generation != generation_)
                {
                    return core::Outcome::failure(core::ReasonCode::OPERATOR_REQUEST, "access point start superseded");
                }
                hostapd_died = hostapd_exited_;
                dnsmasq_died = dnsmasq_exited_;
                if (!hostapd_died && !dnsmasq_died)
                {
                    state_ = core::APState{core::APStateKind::RUNNING, core::ReasonCode::NONE};
                    snapshot = state_;
                }
            }
            if (hostapd_died)
            {
                return abort_start(generation, core::ReasonCode::AP_START_FAILED, "hostapd exited during start-up");
            }
            if (dnsmasq_died)
            {
                return abort_start(generation, core::ReasonCode::DHCP_START_FAILED, "dnsmasq exited during start-up");
            }
            publish_state(snapshot);

            logger_->info("Access point running",
                          core::LogContext()
                              .add("interface", interface_name)
                              .add("ssid", profile.ssid)
                              .add("hostapd_pid", hostapd_pid)
                              .add("dnsmasq_pid", dnsmasq_pid));
            return core::Outcome::success();
        }

        bool AccessPointCoordinator::wait_for_leg(uint64_t generation, Leg leg, std::chrono::milliseconds timeout,
                                                  std::string &cause)
        {
            bool hostapd = leg == Leg::HOSTAPD;
            std::unique_lock<std::mutex> lock(mutex_);

            cv_.wait_for(lock, timeout, [&]
                         {
                             if (generation != generation_)
                                 return true;
                             return hostapd ? (hostapd_ready_ || hostapd_exited_)
                                            : (dnsmasq_ready_ || dnsmasq_exited_); });

            if (generation != generation_)
            {
                cause = "start superseded";
                return false;
            }

            bool ready = hostapd ? hostapd_ready_ : dnsmasq_ready_;
            bool exited = hostapd ? hostapd_exited_ : dnsmasq_exited_;
            if (ready && !exited)
            {
                return true;
            }

            cause = exited ? std::string(leg_name(hostapd)) + " exited during start-up"
                           : std::string(leg_name(hostapd)) + " not ready within " + std::to_string(timeout.count()) + "ms";
            return false;
        }

        core::Outcome AccessPointCoordinator::abort_start(uint64_t generation, core::ReasonCode reason,
                                                          const std::string &message)
        {
            pid_t hostapd_pid;
            pid_t dnsmasq_pid;
            std::string interface_name;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (generation != generation_)
                {
                    return core::Outcome::failure(core::ReasonCode::OPERATOR_REQUEST, "access point start superseded");
                }
                ++generation_;
                hostapd_pid = hostapd_pid_;
                dnsmasq_pid = dnsmasq_pid_;
                hostapd_pid_ = -1;
                dnsmasq_pid_ = -1;
                interface_name = interface_;
            }
            cv_.notify_all();

            logger_->error("Access point start failed",
                           core::LogContext()
                               .add("reason", core::reason_to_string(reason))
                               .add("message", message));

            teardown(hostapd_pid, dnsmasq_pid, interface_name);

            std::vector<ClientTable::Update> departed;
            core::APState snapshot;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                departed = clients_.clear();
                state_ = core::APState{core::APStateKind::STOPPED, reason};
                snapshot = state_;
            }
            publish_clients(departed);
            publish_state(snapshot);

            return core::Outcome::failure(reason, message);
        }

        core::Outcome AccessPointCoordinator::stop()
        {
            pid_t hostapd_pid;
            pid_t dnsmasq_pid;
            std::string interface_name;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++generation_;
                hostapd_pid = hostapd_pid_;
                dnsmasq_pid = dnsmasq_pid_;
                hostapd_pid_ = -1;
                dnsmasq_pid_ = -1;
                interface_name = interface_;
            }
            cv_.notify_all();

            logger_->info("Stopping access point", core::LogContext().add("interface", interface_name));
            teardown(hostapd_pid, dnsmasq_pid, interface_name);

            std::vector<ClientTable::Update> departed;
            core::APState snapshot;
            bool changed;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                departed = clients_.clear();
                core::APState stopped{core::APStateKind::STOPPED, core::ReasonCode::NONE};
                changed = state_ != stopped;
                state_ = stopped;
                snapshot = state_;
            }
            publish_clients(departed);
            if (changed)
            {
                publish_state(snapshot);
            }
            return core::Outcome::success();
        }

        void AccessPointCoordinator::teardown(pid_t hostapd_pid, pid_t dnsmasq_pid, const std::string &interface_name)
        {
            if (dnsmasq_pid > 0 && !launcher_->terminate(dnsmasq_pid, settings_.process_stop_timeout))
            {
                logger_->warning("dnsmasq did not stop", core::LogContext().add("pid", dnsmasq_pid));
            }
            if (hostapd_pid > 0 && !launcher_->terminate(hostapd_pid, settings_.process_stop_timeout))
            {
                logger_->warning("hostapd did not stop", core::LogContext().add("pid", hostapd_pid));
            }

            if (interface_name.empty())
            {
                return;
            }

            std::error_code ec;
            std::filesystem::remove(hostapd_conf_path(interface_name), ec);
            std::filesystem::remove(dnsmasq_conf_path(interface_name), ec);

            std::string cause;
            if (!run_step({"ip", "addr", "flush", "dev", interface_name}, cause))
            {
                logger_->debug("Address flush failed", core::LogContext().add("cause", cause));
            }
        }

        void AccessPointCoordinator::on_hostapd_line(uint64_t generation, const std::string &line)
        {
            ClientTable::Update update;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (generation != generation_)
                {
                    return;
                }

                std::smatch match;
                if (line.find("AP-ENABLED") != std::string::npos)
                {
                    hostapd_ready_ = true;
                }
                else if (std::regex_search(line, match, kStationEventRegex))
                {
                    if (match[1].str() == "CONNECTED")
                    {
                        update = clients_.on_associated(match[2].str(), clock_->now());
                    }
                    else
                    {
                        update = clients_.on_disassociated(match[2].str());
                    }
                }
                else
                {
                    return;
                }
            }
            cv_.notify_all();

            if (update.change != ClientTable::Change::NONE)
            {
                publish_clients({update});
            }
        }

        void AccessPointCoordinator::on_dnsmasq_line(uint64_t generation, const std::string &line)
        {
            ClientTable::Update update;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (generation != generation_)
                {
                    return;
                }

                std::smatch match;
                if (line.find("DHCP, IP range") != std::string::npos)
                {
                    dnsmasq_ready_ = true;
                }
                else if (std::regex_search(line, match, kDhcpAckRegex))
                {
                    std::string hostname = match.size() > 4 && match[4].matched ? match[4].str() : "";
                    update = clients_.on_lease(match[3].str(), match[2].str(), hostname, clock_->now(), lease_duration_);
                }
                else if (std::regex_search(line, match, kDhcpReleaseRegex))
                {
                    update = clients_.on_released(match[3].str());
                }
                else
                {
                    return;
                }
            }
            cv_.notify_all();

            if (update.change != ClientTable::Change::NONE)
            {
                publish_clients({update});
            }
        }

        void AccessPointCoordinator::on_leg_exit(uint64_t generation, Leg leg, int status)
        {
            bool failed = false;
            core::APState snapshot;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (generation != generation_)
                {
                    return;
                }

                if (leg == Leg::HOSTAPD)
                {
                    hostapd_exited_ = true;
                }
                else
                {
                    dnsmasq_exited_ = true;
                }

                if (state_.kind == core::APStateKind::RUNNING)
                {
                    state_ = core::APState{core::APStateKind::FAILED, core::ReasonCode::AP_PROCESS_EXITED};
                    snapshot = state_;
                    failed = true;
                }
            }
            cv_.notify_all();

            if (failed)
            {
                logger_->error("Access point process exited unexpectedly",
                               core::LogContext()
                                   .add("process", leg_name(leg == Leg::HOSTAPD))
                                   .add("status", status));
                publish_state(snapshot);
            }
        }

        void AccessPointCoordinator::refresh_station_signals()
        {
            std::string interface_name;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (state_.kind != core::APStateKind::RUNNING)
                {
                    return;
                }
                interface_name = interface_;
            }

            auto result = runner_->run({"iw", "dev", interface_name, "station", "dump"}, settings_.command_timeout);
            if (!result.ok())
            {
                logger_->debug("Station dump failed", core::LogContext().add("interface", interface_name));
                return;
            }

            auto signals = parse_station_dump(result.output);
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &[mac, signal] : signals)
            {
                clients_.on_signal(mac, signal);
            }
        }

        void AccessPointCoordinator::expire_clients()
        {
            std::vector<ClientTable::Update> updates;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                updates = clients_.expire(clock_->now());
            }
            publish_clients(updates);
        }

        std::map<std::string, int> AccessPointCoordinator::parse_station_dump(const std::string &output)
        {
            static const std::regex station_regex(R"(^Station\s+([0-9a-fA-F:]{17}))");
            static const std::regex signal_regex(R"(^\s*signal:\s*(-?\d+))");

            std::map<std::string, int> signals;
            std::string current;
            std::istringstream stream(output);
            std::string line;
            while (std::getline(stream, line))
            {
                std::smatch match;
                if (std::regex_search(line, match, station_regex))
                {
                    current = ClientTable::normalize_mac(match[1].str());
                }
                else if (!current.empty() && std::regex_search(line, match, signal_regex))
                {
                    signals[current] = std::stoi(match[1].str());
                }
            }
            return signals;
        }

        core::APState AccessPointCoordinator::current_state() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return state_;
        }

        std::vector<core::ClientRecord> AccessPointCoordinator::clients() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return clients_.snapshot();
        }

        std::optional<core::APProfile> AccessPointCoordinator::profile() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return profile_;
        }

        std::string AccessPointCoordinator::interface_name() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return interface_;
        }

        void AccessPointCoordinator::set_state_listener(StateListener listener)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_listener_ = std::move(listener);
        }

        void AccessPointCoordinator::set_client_listener(ClientListener listener)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            client_listener_ = std::move(listener);
        }

        bool AccessPointCoordinator::run_step(const std::vector<std::string> &argv, std::string &cause)
        {
            auto result = runner_->run(argv, settings_.command_timeout);
            if (result.ok())
            {
                return true;
            }
            cause = join_command(argv) + ": " + (result.timed_out ? std::string("timed out") : result.output.substr(0, result.output.find('\n')));
            return false;
        }

        void AccessPointCoordinator::publish_state(const core::APState &state)
        {
            StateListener listener;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                listener = state_listener_;
            }
            if (listener)
            {
                listener(state);
            }
        }

        void AccessPointCoordinator::publish_clients(const std::vector<ClientTable::Update> &updates)
        {
            ClientListener listener;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                listener = client_listener_;
            }
            if (!listener)
            {
                return;
            }
            for (const auto &update : updates)
            {
                listener(update);
            }
        }

        std::filesystem::path AccessPointCoordinator::hostapd_conf_path(const std::string &interface_name) const
        {
            return std::filesystem::path(settings_.runtime_dir) / ("hostapd-" + interface_name + ".conf");
        }

        std::filesystem::path AccessPointCoordinator::dnsmasq_conf_path(const std::string &interface_name) const
        {
            return std::filesystem::path(settings_.runtime_dir) / ("dnsmasq-" + interface_name + ".conf");
        }

    } // namespace infrastructure
} // namespace extender
