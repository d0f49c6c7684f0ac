/**
 * Interface Mode Controller Implementation
 * Station / access point / down transitions with verification and rollback
 */

#include "infrastructure/interface_mode_controller.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/radio_probe.hpp"
#include "core/logger.hpp"

#include <thread>
#include <cstdio>
#include <algorithm>

namespace extender
{
    namespace infrastructure
    {

        namespace
        {
            const std::chrono::milliseconds kVerifyPollInterval(100);

            std::string iw_type(core::InterfaceMode mode)
            {
                return mode == core::InterfaceMode::ACCESS_POINT ? "__ap" : "managed";
            }

            std::string first_line(const std::string &text)
            {
                auto line = text.substr(0, text.find('\n'));
                return line.empty() ? "no output" : line;
            }
        }

        InterfaceModeController::InterfaceModeController(std::shared_ptr<CommandRunner> runner,
                                                         std::shared_ptr<RadioCapabilityProbe> probe,
                                                         const core::RadioIdentity &identity,
                                                         std::chrono::milliseconds command_timeout,
                                                         std::chrono::milliseconds verify_timeout)
            : runner_(std::move(runner)),
              probe_(std::move(probe)),
              command_timeout_(command_timeout),
              verify_timeout_(verify_timeout),
              logger_(core::get_logger("InterfaceModeController"))
        {
            reset(identity);
        }

        void InterfaceModeController::reset(const core::RadioIdentity &identity)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                identity_ = identity;
                ap_interface_ = make_ap_interface_name(identity.interface_name);
                current_mode_ = probe_->current_mode(identity.interface_name).value_or(core::InterfaceMode::DOWN);

                // A sub-interface left behind by an earlier run is adopted so it gets cleaned up
                ap_interface_present_ = probe_->interface_exists(ap_interface_);

                logger_->info("Interface mode controller ready",
                              core::LogContext()
                                  .add("interface", identity_.interface_name)
                                  .add("mode", core::mode_to_string(current_mode_))
                                  .add("ap_interface", ap_interface_)
                                  .add("ap_interface_present", ap_interface_present_));
            }
            notify();
        }

        core::Outcome InterfaceModeController::request_mode(core::InterfaceMode target)
        {
            std::unique_lock<std::mutex> lock(mutex_);

            auto from = current_mode_;
            if (from == target && !(target != core::InterfaceMode::STATION && ap_interface_present_))
            {
                return core::Outcome::success();
            }

            auto describe = [&](const std::string &cause)
            {
                return core::mode_to_string(from) + " -> " + core::mode_to_string(target) + ": " + cause;
            };

            if (!identity_.supports(target))
            {
                return core::Outcome::failure(core::ReasonCode::INCOMPATIBLE_MODE,
                                              describe("mode not supported by " + identity_.driver));
            }

            logger_->info("Changing interface mode",
                          core::LogContext()
                              .add("interface", identity_.interface_name)
                              .add("from", core::mode_to_string(from))
                              .add("to", core::mode_to_string(target)));

            std::string cause;

            // The sub-interface only coexists with station mode
            bool detached = false;
            if (ap_interface_present_ && target != core::InterfaceMode::STATION)
            {
                detached = true;
                if (!detach_locked(cause))
                {
                    lock.unlock();
                    notify();
                    return core::Outcome::failure(core::ReasonCode::MODE_TRANSITION_FAILED, describe(cause));
                }
            }

            if (from == target || apply_locked(from, target, cause))
            {
                current_mode_ = target;
                logger_->info("Interface mode changed",
                              core::LogContext()
                                  .add("interface", identity_.interface_name)
                                  .add("mode", core::mode_to_string(target)));
                lock.unlock();
                notify();
                return core::Outcome::success();
            }

            logger_->warning("Mode transition failed, rolling back",
                             core::LogContext()
                                 .add("interface", identity_.interface_name)
                                 .add("from", core::mode_to_string(from))
                                 .add("to", core::mode_to_string(target))
                                 .add("cause", cause));

            std::string rollback_cause;
            if (apply_hard_locked(from, rollback_cause))
            {
                current_mode_ = from;
                if (detached && from == core::InterfaceMode::STATION)
                {
                    auto reattached = attach_locked();
                    if (!reattached)
                    {
                        // Reconciliation attaches it again once station mode is confirmed
                        logger_->warning("AP sub-interface not restored after rollback",
                                         core::LogContext()
                                             .add("interface", ap_interface_)
                                             .add("cause", reattached.message));
                    }
                }
            }
            else
            {
                logger_->error("Rollback failed",
                               core::LogContext()
                                   .add("interface", identity_.interface_name)
                                   .add("cause", rollback_cause));
                current_mode_ = probe_->current_mode(identity_.interface_name).value_or(core::InterfaceMode::DOWN);
            }

            lock.unlock();
            notify();
            return core::Outcome::failure(core::ReasonCode::MODE_TRANSITION_FAILED, describe(cause));
        }

        core::Outcome InterfaceModeController::attach_ap_interface()
        {
            std::unique_lock<std::mutex> lock(mutex_);
            auto outcome = attach_locked();
            lock.unlock();
            if (outcome)
            {
                notify();
            }
            return outcome;
        }

        core::Outcome InterfaceModeController::attach_locked()
        {
            if (ap_interface_present_)
            {
                return core::Outcome::success();
            }
            if (!identity_.supports_concurrent)
            {
                return core::Outcome::failure(core::ReasonCode::INCOMPATIBLE_MODE,
                                              identity_.interface_name + " cannot run station and AP concurrently");
            }
            if (current_mode_ != core::InterfaceMode::STATION)
            {
                return core::Outcome::failure(core::ReasonCode::INCOMPATIBLE_MODE,
                                              "AP sub-interface requires station mode, radio is " +
                                                  core::mode_to_string(current_mode_));
            }

            std::string cause;
            if (!run_step({"iw", "dev", identity_.interface_name, "interface", "add", ap_interface_, "type", "__ap"},
                          cause))
            {
                return core::Outcome::failure(core::ReasonCode::MODE_TRANSITION_FAILED, cause);
            }

            auto cleanup = [&]()
            {
                std::string ignored;
                if (!run_step({"iw", "dev", ap_interface_, "del"}, ignored))
                {
                    logger_->warning("Failed to remove partial AP interface",
                                     core::LogContext().add("interface", ap_interface_).add("cause", ignored));
                }
            };

            auto mac = derive_ap_mac(identity_.mac_address);
            if (mac.empty())
            {
                logger_->warning("Radio MAC unparseable, keeping driver-assigned address",
                                 core::LogContext().add("mac", identity_.mac_address));
            }
            else if (!run_step({"ip", "link", "set", "dev", ap_interface_, "address", mac}, cause))
            {
                cleanup();
                return core::Outcome::failure(core::ReasonCode::MODE_TRANSITION_FAILED, cause);
            }

            if (!wait_for_interface(ap_interface_))
            {
                cleanup();
                return core::Outcome::failure(core::ReasonCode::MODE_TRANSITION_FAILED,
                                              ap_interface_ + " did not appear");
            }

            ap_interface_present_ = true;
            logger_->info("AP sub-interface attached",
                          core::LogContext()
                              .add("interface", ap_interface_)
                              .add("mac", mac));
            return core::Outcome::success();
        }

        core::Outcome InterfaceModeController::detach_ap_interface()
        {
            std::unique_lock<std::mutex> lock(mutex_);
            std::string cause;
            bool ok = detach_locked(cause);
            lock.unlock();
            notify();

            if (!ok)
            {
                return core::Outcome::failure(core::ReasonCode::MODE_TRANSITION_FAILED, cause);
            }
            return core::Outcome::success();
        }

        bool InterfaceModeController::detach_locked(std::string &cause)
        {
            if (!probe_->interface_exists(ap_interface_))
            {
                ap_interface_present_ = false;
                return true;
            }

            if (!run_step({"iw", "dev", ap_interface_, "del"}, cause) && probe_->interface_exists(ap_interface_))
            {
                return false;
            }

            ap_interface_present_ = false;
            logger_->info("AP sub-interface detached", core::LogContext().add("interface", ap_interface_));
            return true;
        }

        bool InterfaceModeController::apply_locked(core::InterfaceMode from, core::InterfaceMode target,
                                                   std::string &cause)
        {
            if (target == core::InterfaceMode::DOWN)
            {
                return run_step({"ip", "link", "set", "dev", identity_.interface_name, "down"}, cause) &&
                       verify_mode(target, cause);
            }

            if (identity_.supports_concurrent && from != core::InterfaceMode::DOWN)
            {
                std::string soft_cause;
                if (run_step({"iw", "dev", identity_.interface_name, "set", "type", iw_type(target)}, soft_cause) &&
                    run_step({"ip", "link", "set", "dev", identity_.interface_name, "up"}, soft_cause) &&
                    verify_mode(target, soft_cause))
                {
                    logger_->debug("Soft mode switch succeeded", core::LogContext().add("interface", identity_.interface_name));
                    return true;
                }
                logger_->debug("Soft mode switch refused, using full rebuild",
                               core::LogContext().add("interface", identity_.interface_name).add("cause", soft_cause));
            }

            return apply_hard_locked(target, cause);
        }

        bool InterfaceModeController::apply_hard_locked(core::InterfaceMode target, std::string &cause)
        {
            if (!run_step({"ip", "link", "set", "dev", identity_.interface_name, "down"}, cause))
            {
                return false;
            }
            if (target == core::InterfaceMode::DOWN)
            {
                return verify_mode(target, cause);
            }

            return run_step({"iw", "dev", identity_.interface_name, "set", "type", iw_type(target)}, cause) &&
                   run_step({"ip", "link", "set", "dev", identity_.interface_name, "up"}, cause) &&
                   verify_mode(target, cause);
        }

        bool InterfaceModeController::run_step(const std::vector<std::string> &argv, std::string &cause)
        {
            auto result = runner_->run(argv, command_timeout_);
            if (result.ok())
            {
                return true;
            }

            cause = join_command(argv) + ": " +
                    (result.timed_out ? std::string("timed out") : first_line(result.output));
            return false;
        }

        bool InterfaceModeController::verify_mode(core::InterfaceMode target, std::string &cause)
        {
            auto deadline = std::chrono::steady_clock::now() + verify_timeout_;
            std::optional<core::InterfaceMode> observed;

            while (true)
            {
                observed = probe_->current_mode(identity_.interface_name);
                if (observed == target)
                {
                    return true;
                }
                auto now = std::chrono::steady_clock::now();
                if (now >= deadline)
                {
                    break;
                }
                std::this_thread::sleep_for(
                    std::min<std::chrono::steady_clock::duration>(kVerifyPollInterval, deadline - now));
            }

            cause = "verification timed out, interface reports " +
                    (observed ? core::mode_to_string(*observed) : std::string("unknown"));
            return false;
        }

        bool InterfaceModeController::wait_for_interface(const std::string &name)
        {
            auto deadline = std::chrono::steady_clock::now() + verify_timeout_;
            while (!probe_->interface_exists(name))
            {
                auto now = std::chrono::steady_clock::now();
                if (now >= deadline)
                {
                    return false;
                }
                std::this_thread::sleep_for(
                    std::min<std::chrono::steady_clock::duration>(kVerifyPollInterval, deadline - now));
            }
            return true;
        }

        void InterfaceModeController::notify()
        {
            ModeListener listener;
            core::InterfaceMode mode;
            bool present;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                listener = listener_;
                mode = current_mode_;
                present = ap_interface_present_;
            }
            if (listener)
            {
                listener(mode, present);
            }
        }

        core::InterfaceMode InterfaceModeController::current_mode() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return current_mode_;
        }

        bool InterfaceModeController::ap_interface_present() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return ap_interface_present_;
        }

        std::string InterfaceModeController::ap_interface_name() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return ap_interface_;
        }

        core::RadioIdentity InterfaceModeController::identity() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return identity_;
        }

        void InterfaceModeController::set_mode_listener(ModeListener listener)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            listener_ = std::move(listener);
        }

        std::string InterfaceModeController::derive_ap_mac(const std::string &mac_address)
        {
            unsigned int octets[6];
            char trailing;
            if (std::sscanf(mac_address.c_str(), "%2x:%2x:%2x:%2x:%2x:%2x%c",
                            &octets[0], &octets[1], &octets[2], &octets[3], &octets[4], &octets[5], &trailing) != 6)
            {
                return "";
            }

            // Locally administered; if the radio already uses such an address, flip the last bit instead
            if (octets[0] & 0x02)
            {
                octets[5] ^= 0x01;
            }
            else
            {
                octets[0] |= 0x02;
            }

            char buffer[18];
            std::snprintf(buffer, sizeof(buffer), "%02x:%02x:%02x:%02x:%02x:%02x",
                          octets[0], octets[1], octets[2], octets[3], octets[4], octets[5]);
            return buffer;
        }

        std::string InterfaceModeController::make_ap_interface_name(const std::string &interface_name)
        {
            // IFNAMSIZ - 1
            const size_t max_length = 15;
            const std::string suffix = "_ap0";
            if (interface_name.size() + suffix.size() <= max_length)
            {
                return interface_name + suffix;
            }
            return interface_name.substr(0, max_length - suffix.size()) + suffix;
        }

    } // namespace infrastructure
} // namespace extender
