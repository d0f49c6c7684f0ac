/**
 * Upstream Connection Manager Implementation
 * Drives wpa_supplicant and dhclient for the station side of the radio
 */

#include "infrastructure/upstream_connection_manager.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/process_launcher.hpp"
#include "infrastructure/config_renderer.hpp"
#include "core/time_source.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <regex>
#include <sstream>

namespace extender
{
    namespace infrastructure
    {

        UpstreamConnectionManager::UpstreamConnectionManager(std::shared_ptr<CommandRunner> runner,
                                                             std::shared_ptr<ProcessLauncher> launcher,
                                                             std::shared_ptr<core::TimeSource> clock,
                                                             const UpstreamSettings &settings,
                                                             const ReconnectPolicy &policy)
            : runner_(std::move(runner)),
              launcher_(std::move(launcher)),
              clock_(std::move(clock)),
              settings_(settings),
              policy_(policy),
              logger_(core::get_logger("UpstreamConnectionManager"))
        {
        }

        UpstreamConnectionManager::~UpstreamConnectionManager()
        {
            pid_t pid;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++generation_;
                pid = supplicant_pid_;
                supplicant_pid_ = -1;
            }
            if (pid > 0)
            {
                launcher_->terminate(pid, settings_.process_stop_timeout);
            }
        }

        ScanSequence UpstreamConnectionManager::scan()
        {
            std::string interface_name;
            bool entered_scanning = false;
            core::ConnectionState snapshot;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                interface_name = settings_.interface_name;
                if (state_.kind == core::ConnectionStateKind::DISCONNECTED)
                {
                    state_.kind = core::ConnectionStateKind::SCANNING;
                    entered_scanning = true;
                    snapshot = state_;
                }
            }
            if (entered_scanning)
            {
                publish(snapshot, core::ReasonCode::NONE);
            }

            logger_->info("Scanning for networks", core::LogContext().add("interface", interface_name));
            auto result = runner_->run({"iw", "dev", interface_name, "scan"}, settings_.scan_timeout);

            bool left_scanning = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (state_.kind == core::ConnectionStateKind::SCANNING)
                {
                    state_.kind = core::ConnectionStateKind::DISCONNECTED;
                    left_scanning = true;
                    snapshot = state_;
                }
            }
            if (left_scanning)
            {
                publish(snapshot, core::ReasonCode::NONE);
            }

            if (!result.ok())
            {
                throw core::ExtenderError(core::ReasonCode::COMMAND_FAILED,
                                          result.timed_out ? "scan timed out"
                                                           : "scan failed: " + result.output.substr(0, result.output.find('\n')));
            }
            return ScanSequence(result.output);
        }

        core::Outcome UpstreamConnectionManager::connect(const core::UpstreamProfile &profile)
        {
            uint64_t generation;
            pid_t previous_pid;
            core::ConnectionState snapshot;
            std::string interface_name;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                profile_ = profile;
                generation = ++generation_;
                previous_pid = supplicant_pid_;
                supplicant_pid_ = -1;
                associated_ = false;
                auth_failed_ = false;
                supplicant_exited_ = false;
                next_attempt_at_.reset();

                // attempt is kept so a failure continues the backoff sequence
                state_.kind = core::ConnectionStateKind::ASSOCIATING;
                state_.backoff = std::chrono::milliseconds(0);
                state_.unrecoverable = false;
                snapshot = state_;
                interface_name = settings_.interface_name;
            }
            publish(snapshot, core::ReasonCode::NONE);

            logger_->info("Connecting to upstream network",
                          core::LogContext()
                              .add("interface", interface_name)
                              .add("ssid", profile.ssid)
                              .add("security", core::security_to_string(profile.security))
                              .add("attempt", snapshot.attempt));

            if (previous_pid > 0)
            {
                launcher_->terminate(previous_pid, settings_.process_stop_timeout);
            }

            auto runtime_dir = std::filesystem::path(settings_.runtime_dir);
            auto conf_path = runtime_dir / ("wpa_supplicant-" + interface_name + ".conf");
            std::string error;
            try
            {
                auto conf = render_wpa_supplicant_conf(profile, (runtime_dir / "wpa_supplicant").string());
                if (!write_private_file(conf_path, conf, error))
                {
                    return fail_attempt(generation, core::ReasonCode::ASSOCIATION_FAILED, error);
                }
            }
            catch (const core::ExtenderError &e)
            {
                return fail_attempt(generation, e.reason(), e.what());
            }

            pid_t pid = launcher_->spawn(
                {"wpa_supplicant", "-i", interface_name, "-c", conf_path.string(), "-D", "nl80211"},
                [this, generation](const std::string &line)
                { on_supplicant_line(generation, line); },
                [this, generation](int status)
                { on_supplicant_exit(generation, status); });

            if (pid < 0)
            {
                return fail_attempt(generation, core::ReasonCode::ASSOCIATION_FAILED, "wpa_supplicant could not be started");
            }

            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (generation != generation_)
                {
                    lock.unlock();
                    launcher_->terminate(pid, settings_.process_stop_timeout);
                    return core::Outcome::failure(core::ReasonCode::OPERATOR_REQUEST, "connection attempt superseded");
                }
                supplicant_pid_ = pid;

                cv_.wait_for(lock, settings_.association_timeout, [&]
                             { return generation != generation_ || associated_ || auth_failed_ || supplicant_exited_; });

                if (generation != generation_)
                {
                    return core::Outcome::failure(core::ReasonCode::OPERATOR_REQUEST, "connection attempt superseded");
                }
                if (auth_failed_)
                {
                    lock.unlock();
                    return fail_attempt(generation, core::ReasonCode::ASSOCIATION_FAILED,
                                        "authentication rejected by " + profile.ssid);
                }
                if (supplicant_exited_)
                {
                    lock.unlock();
                    return fail_attempt(generation, core::ReasonCode::ASSOCIATION_FAILED, "wpa_supplicant exited");
                }
                if (!associated_)
                {
                    lock.unlock();
                    return fail_attempt(generation, core::ReasonCode::ASSOCIATION_FAILED,
                                        "no association within " + std::to_string(settings_.association_timeout.count()) + "ms");
                }
            }

            logger_->info("Associated, requesting address", core::LogContext().add("ssid", profile.ssid));

            auto dhcp = runner_->run({"dhclient", "-1", "-v", interface_name}, settings_.dhcp_client_timeout);
            if (!dhcp.ok())
            {
                return fail_attempt(generation, core::ReasonCode::ADDRESS_ACQUISITION_FAILED,
                                    dhcp.timed_out ? "dhclient timed out" : "dhclient failed");
            }

            auto addr = runner_->run({"ip", "-4", "-o", "addr", "show", "dev", interface_name}, settings_.command_timeout);
            if (!addr.ok() || addr.output.find("inet ") == std::string::npos)
            {
                return fail_attempt(generation, core::ReasonCode::ADDRESS_ACQUISITION_FAILED,
                                    "no IPv4 address on " + interface_name);
            }

            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (generation != generation_)
                {
                    return core::Outcome::failure(core::ReasonCode::OPERATOR_REQUEST, "connection attempt superseded");
                }
                if (supplicant_exited_ || !associated_)
                {
                    lock.unlock();
                    return fail_attempt(generation, core::ReasonCode::ASSOCIATION_FAILED,
                                        "association lost while acquiring address");
                }

                state_ = core::ConnectionState{};
                state_.kind = core::ConnectionStateKind::CONNECTED;
                snapshot = state_;
            }
            publish(snapshot, core::ReasonCode::NONE);

            logger_->info("Upstream connected",
                          core::LogContext()
                              .add("interface", interface_name)
                              .add("ssid", profile.ssid));
            return core::Outcome::success();
        }

        core::Outcome UpstreamConnectionManager::reconnect()
        {
            std::optional<core::UpstreamProfile> profile;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                profile = profile_;
            }
            if (!profile)
            {
                return core::Outcome::failure(core::ReasonCode::NO_UPSTREAM_PROFILE, "no upstream profile to reconnect with");
            }
            return connect(*profile);
        }

        core::Outcome UpstreamConnectionManager::disconnect()
        {
            pid_t pid;
            std::string interface_name;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++generation_;
                pid = supplicant_pid_;
                supplicant_pid_ = -1;
                interface_name = settings_.interface_name;
            }
            cv_.notify_all();

            logger_->info("Disconnecting upstream", core::LogContext().add("interface", interface_name));

            if (pid > 0 && !launcher_->terminate(pid, settings_.process_stop_timeout))
            {
                logger_->warning("wpa_supplicant did not stop", core::LogContext().add("pid", pid));
            }

            auto release = runner_->run({"dhclient", "-r", interface_name}, settings_.command_timeout);
            if (!release.ok())
            {
                logger_->warning("dhclient release failed", core::LogContext().add("interface", interface_name));
            }

            auto flush = runner_->run({"ip", "addr", "flush", "dev", interface_name}, settings_.command_timeout);
            if (!flush.ok())
            {
                logger_->warning("Address flush failed", core::LogContext().add("interface", interface_name));
            }

            core::ConnectionState snapshot;
            bool changed;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                core::ConnectionState next;
                next.unrecoverable = state_.unrecoverable;
                changed = next != state_;
                state_ = next;
                next_attempt_at_.reset();
                associated_ = false;
                snapshot = state_;
            }
            if (changed)
            {
                publish(snapshot, core::ReasonCode::OPERATOR_REQUEST);
            }
            return core::Outcome::success();
        }

        core::Outcome UpstreamConnectionManager::fail_attempt(uint64_t generation, core::ReasonCode reason,
                                                              const std::string &message)
        {
            pid_t pid;
            core::ConnectionState snapshot;
            core::ReasonCode published_reason = reason;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (generation != generation_)
                {
                    return core::Outcome::failure(core::ReasonCode::OPERATOR_REQUEST, "connection attempt superseded");
                }
                ++generation_;
                pid = supplicant_pid_;
                supplicant_pid_ = -1;
                associated_ = false;

                if (auto_reconnect_)
                {
                    int attempt = state_.attempt + 1;
                    if (policy_.exhausted(attempt))
                    {
                        state_.kind = core::ConnectionStateKind::DISCONNECTED;
                        state_.backoff = std::chrono::milliseconds(0);
                        state_.unrecoverable = true;
                        next_attempt_at_.reset();
                        published_reason = core::ReasonCode::UPSTREAM_UNRECOVERABLE;
                    }
                    else
                    {
                        state_.kind = core::ConnectionStateKind::RECONNECTING;
                        state_.attempt = attempt;
                        state_.backoff = policy_.delay_for(attempt);
                        next_attempt_at_ = clock_->now() + state_.backoff;
                    }
                }
                else
                {
                    state_ = core::ConnectionState{};
                    next_attempt_at_.reset();
                }
                snapshot = state_;
            }

            logger_->warning("Upstream connection attempt failed",
                             core::LogContext()
                                 .add("reason", core::reason_to_string(reason))
                                 .add("message", message)
                                 .add("state", snapshot.name())
                                 .add("attempt", snapshot.attempt)
                                 .add("backoff_ms", snapshot.backoff.count()));

            if (pid > 0)
            {
                launcher_->terminate(pid, settings_.process_stop_timeout);
            }
            publish(snapshot, published_reason);

            if (snapshot.unrecoverable)
            {
                return core::Outcome::failure(core::ReasonCode::UPSTREAM_UNRECOVERABLE,
                                              "reconnect attempts exhausted: " + message);
            }
            return core::Outcome::failure(reason, message);
        }

        void UpstreamConnectionManager::on_supplicant_line(uint64_t generation, const std::string &line)
        {
            bool lost = false;
            core::ConnectionState snapshot;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (generation != generation_)
                {
                    return;
                }

                if (line.find("CTRL-EVENT-CONNECTED") != std::string::npos)
                {
                    associated_ = true;
                }
                else if (line.find("CTRL-EVENT-SSID-TEMP-DISABLED") != std::string::npos &&
                         line.find("reason=WRONG_KEY") != std::string::npos)
                {
                    auth_failed_ = true;
                }
                else if (line.find("CTRL-EVENT-DISCONNECTED") != std::string::npos)
                {
                    associated_ = false;
                    lost = handle_link_lost_locked();
                }
                else
                {
                    return;
                }
                snapshot = state_;
            }
            cv_.notify_all();

            if (lost)
            {
                logger_->warning("Upstream link lost", core::LogContext().add("line", line));
                publish(snapshot, core::ReasonCode::ASSOCIATION_FAILED);
            }
        }

        void UpstreamConnectionManager::on_supplicant_exit(uint64_t generation, int status)
        {
            bool lost = false;
            core::ConnectionState snapshot;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (generation != generation_)
                {
                    return;
                }
                supplicant_exited_ = true;
                associated_ = false;
                lost = handle_link_lost_locked();
                snapshot = state_;
            }
            cv_.notify_all();

            if (lost)
            {
                logger_->warning("wpa_supplicant exited while connected", core::LogContext().add("status", status));
                publish(snapshot, core::ReasonCode::ASSOCIATION_FAILED);
            }
        }

        bool UpstreamConnectionManager::handle_link_lost_locked()
        {
            if (state_.kind != core::ConnectionStateKind::CONNECTED)
            {
                return false;
            }

            if (auto_reconnect_)
            {
                state_.kind = core::ConnectionStateKind::RECONNECTING;
                state_.attempt = 1;
                state_.backoff = policy_.delay_for(1);
                next_attempt_at_ = clock_->now() + state_.backoff;
            }
            else
            {
                state_ = core::ConnectionState{};
                next_attempt_at_.reset();
            }
            return true;
        }

        core::ConnectionState UpstreamConnectionManager::current_state() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return state_;
        }

        std::optional<core::UpstreamProfile> UpstreamConnectionManager::profile() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return profile_;
        }

        bool UpstreamConnectionManager::reconnect_due(std::chrono::steady_clock::time_point now) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return state_.kind == core::ConnectionStateKind::RECONNECTING &&
                   next_attempt_at_ && now >= *next_attempt_at_;
        }

        void UpstreamConnectionManager::reset_reconnect()
        {
            core::ConnectionState snapshot;
            bool changed;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto previous = state_;
                state_.attempt = 0;
                state_.unrecoverable = false;
                if (state_.kind == core::ConnectionStateKind::RECONNECTING)
                {
                    state_.kind = core::ConnectionStateKind::DISCONNECTED;
                    state_.backoff = std::chrono::milliseconds(0);
                    next_attempt_at_.reset();
                }
                changed = previous != state_;
                snapshot = state_;
            }
            if (changed)
            {
                publish(snapshot, core::ReasonCode::OPERATOR_REQUEST);
            }
        }

        void UpstreamConnectionManager::set_auto_reconnect(bool enabled)
        {
            core::ConnectionState snapshot;
            bool changed = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto_reconnect_ = enabled;
                if (!enabled && state_.kind == core::ConnectionStateKind::RECONNECTING)
                {
                    state_ = core::ConnectionState{};
                    next_attempt_at_.reset();
                    changed = true;
                }
                snapshot = state_;
            }
            if (changed)
            {
                publish(snapshot, core::ReasonCode::OPERATOR_REQUEST);
            }
        }

        bool UpstreamConnectionManager::auto_reconnect() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return auto_reconnect_;
        }

        std::optional<int> UpstreamConnectionManager::sample_signal()
        {
            std::string interface_name;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (state_.kind != core::ConnectionStateKind::CONNECTED)
                {
                    return std::nullopt;
                }
                interface_name = settings_.interface_name;
            }

            auto result = runner_->run({"iw", "dev", interface_name, "link"}, settings_.command_timeout);
            if (!result.ok())
            {
                return std::nullopt;
            }
            return parse_link_signal(result.output);
        }

        void UpstreamConnectionManager::set_interface(const std::string &interface_name)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            settings_.interface_name = interface_name;
        }

        std::string UpstreamConnectionManager::interface_name() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return settings_.interface_name;
        }

        void UpstreamConnectionManager::set_state_listener(StateListener listener)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            listener_ = std::move(listener);
        }

        void UpstreamConnectionManager::publish(const core::ConnectionState &state, core::ReasonCode reason)
        {
            StateListener listener;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                listener = listener_;
            }
            if (listener)
            {
                listener(state, reason);
            }
        }

        std::optional<int> UpstreamConnectionManager::parse_link_signal(const std::string &output)
        {
            static const std::regex signal_regex(R"(signal:\s*(-?\d+)\s*dBm)");

            if (output.find("Not connected") != std::string::npos)
            {
                return std::nullopt;
            }
            std::smatch match;
            if (std::regex_search(output, match, signal_regex))
            {
                return std::stoi(match[1].str());
            }
            return std::nullopt;
        }

    } // namespace infrastructure
} // namespace extender
