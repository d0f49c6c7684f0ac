/**
 * Bridge Coordinator Implementation
 * Ledger-based bridge, forwarding and NAT setup
 */

#include "infrastructure/bridge_coordinator.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <fstream>

namespace extender
{
    namespace infrastructure
    {

        namespace
        {
            // The resource an undo step targets is already gone
            bool already_removed(const std::string &output)
            {
                return output.find("Cannot find device") != std::string::npos ||
                       output.find("does not exist") != std::string::npos ||
                       output.find("Bad rule") != std::string::npos ||
                       output.find("Cannot assign requested address") != std::string::npos;
            }
        }

        BridgeCoordinator::BridgeCoordinator(std::shared_ptr<CommandRunner> runner, const BridgeSettings &settings)
            : runner_(std::move(runner)),
              settings_(settings),
              logger_(core::get_logger("BridgeCoordinator"))
        {
        }

        core::Outcome BridgeCoordinator::activate(const std::string &upstream_interface,
                                                  const std::string &ap_interface,
                                                  const std::string &gateway_cidr)
        {
            std::lock_guard<std::mutex> operation_lock(operation_mutex_);

            core::BridgeState state;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                state = state_;
                if (state_ == core::BridgeState::ACTIVE && upstream_interface_ == upstream_interface &&
                    ap_interface_ == ap_interface && gateway_cidr_ == gateway_cidr)
                {
                    return core::Outcome::success();
                }
            }

            std::string cause;
            if (!ledger_.empty() || state != core::BridgeState::TORN_DOWN)
            {
                if (!deactivate_locked(cause))
                {
                    return core::Outcome::failure(core::ReasonCode::BRIDGE_ACTIVATION_FAILED,
                                                  "previous bridge could not be removed: " + cause);
                }
            }

            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                upstream_interface_ = upstream_interface;
                ap_interface_ = ap_interface;
                gateway_cidr_ = gateway_cidr;
            }
            set_state(core::BridgeState::BUILDING);

            logger_->info("Activating bridge",
                          core::LogContext()
                              .add("bridge", settings_.bridge_name)
                              .add("upstream", upstream_interface)
                              .add("ap", ap_interface));

            const auto &bridge = settings_.bridge_name;

            // A bridge left by a crashed run would make `ip link add` fail
            if (runner_->run({"ip", "link", "show", "dev", bridge}, settings_.command_timeout).ok())
            {
                logger_->warning("Removing stale bridge", core::LogContext().add("bridge", bridge));
                std::string ignored;
                if (!run_step({"ip", "link", "del", "dev", bridge}, ignored))
                {
                    logger_->warning("Stale bridge removal failed", core::LogContext().add("cause", ignored));
                }
            }

            auto command = [this](std::vector<std::string> argv)
            {
                return [this, argv](std::string &c)
                { return run_step(argv, c); };
            };
            auto undo_command = [this](std::vector<std::string> argv)
            {
                return [this, argv](std::string &c)
                { return run_undo(argv, c); };
            };

            bool ok =
                apply("create bridge " + bridge,
                      command({"ip", "link", "add", "name", bridge, "type", "bridge"}),
                      undo_command({"ip", "link", "del", "dev", bridge}), cause) &&
                apply("enslave " + ap_interface,
                      command({"ip", "link", "set", "dev", ap_interface, "master", bridge}),
                      undo_command({"ip", "link", "set", "dev", ap_interface, "nomaster"}), cause);

            if (ok && !gateway_cidr.empty())
            {
                ok = apply("move gateway off " + ap_interface,
                           command({"ip", "addr", "del", gateway_cidr, "dev", ap_interface}),
                           undo_command({"ip", "addr", "add", gateway_cidr, "dev", ap_interface}), cause) &&
                     apply("assign gateway to " + bridge,
                           command({"ip", "addr", "add", gateway_cidr, "dev", bridge}),
                           undo_command({"ip", "addr", "del", gateway_cidr, "dev", bridge}), cause);
            }

            ok = ok &&
                 apply("bring up " + bridge,
                       command({"ip", "link", "set", "dev", bridge, "up"}),
                       undo_command({"ip", "link", "set", "dev", bridge, "down"}), cause);

            if (ok)
            {
                // Undo restores whatever value was there before
                std::string prior;
                std::string step_cause;
                if (read_ip_forward(prior, step_cause) && write_ip_forward("1", step_cause))
                {
                    ledger_.push_back({"enable ip forwarding", [this, prior](std::string &c)
                                       { return write_ip_forward(prior, c); }});
                }
                else
                {
                    cause = "enable ip forwarding: " + step_cause;
                    ok = false;
                }
            }

            ok = ok &&
                 apply("masquerade via " + upstream_interface,
                       command({"iptables", "-w", "-t", "nat", "-A", "POSTROUTING", "-o", upstream_interface, "-j", "MASQUERADE"}),
                       undo_command({"iptables", "-w", "-t", "nat", "-D", "POSTROUTING", "-o", upstream_interface, "-j", "MASQUERADE"}), cause) &&
                 apply("forward " + bridge + " to " + upstream_interface,
                       command({"iptables", "-w", "-A", "FORWARD", "-i", bridge, "-o", upstream_interface, "-j", "ACCEPT"}),
                       undo_command({"iptables", "-w", "-D", "FORWARD", "-i", bridge, "-o", upstream_interface, "-j", "ACCEPT"}), cause) &&
                 apply("forward established from " + upstream_interface,
                       command({"iptables", "-w", "-A", "FORWARD", "-i", upstream_interface, "-o", bridge,
                                "-m", "conntrack", "--ctstate", "RELATED,ESTABLISHED", "-j", "ACCEPT"}),
                       undo_command({"iptables", "-w", "-D", "FORWARD", "-i", upstream_interface, "-o", bridge,
                                     "-m", "conntrack", "--ctstate", "RELATED,ESTABLISHED", "-j", "ACCEPT"}),
                       cause);

            if (!ok)
            {
                logger_->error("Bridge activation failed, reversing", core::LogContext().add("cause", cause));
                std::string undo_cause;
                if (!deactivate_locked(undo_cause))
                {
                    logger_->error("Bridge reversal incomplete", core::LogContext().add("cause", undo_cause));
                }
                return core::Outcome::failure(core::ReasonCode::BRIDGE_ACTIVATION_FAILED, cause);
            }

            set_state(core::BridgeState::ACTIVE);
            logger_->info("Bridge active",
                          core::LogContext()
                              .add("bridge", bridge)
                              .add("ledger_entries", ledger_.size()));
            return core::Outcome::success();
        }

        core::Outcome BridgeCoordinator::deactivate()
        {
            std::lock_guard<std::mutex> operation_lock(operation_mutex_);
            std::string cause;
            if (!deactivate_locked(cause))
            {
                return core::Outcome::failure(core::ReasonCode::COMMAND_FAILED, cause);
            }
            return core::Outcome::success();
        }

        void BridgeCoordinator::request_teardown()
        {
            bool changed = false;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                changed = state_ == core::BridgeState::ACTIVE;
            }
            if (changed)
            {
                set_state(core::BridgeState::TEARING_DOWN);
            }
        }

        bool BridgeCoordinator::deactivate_locked(std::string &cause)
        {
            if (ledger_.empty())
            {
                set_state(core::BridgeState::TORN_DOWN);
                return true;
            }

            set_state(core::BridgeState::TEARING_DOWN);
            logger_->info("Deactivating bridge",
                          core::LogContext()
                              .add("bridge", settings_.bridge_name)
                              .add("ledger_entries", ledger_.size()));

            std::vector<LedgerEntry> remaining;
            for (auto it = ledger_.rbegin(); it != ledger_.rend(); ++it)
            {
                std::string step_cause;
                if (it->undo(step_cause))
                {
                    logger_->debug("Undone", core::LogContext().add("step", it->description));
                }
                else
                {
                    logger_->warning("Undo failed, keeping in ledger",
                                     core::LogContext().add("step", it->description).add("cause", step_cause));
                    cause = it->description + ": " + step_cause;
                    remaining.insert(remaining.begin(), *it);
                }
            }

            ledger_ = std::move(remaining);
            if (!ledger_.empty())
            {
                return false;
            }

            set_state(core::BridgeState::TORN_DOWN);
            logger_->info("Bridge torn down", core::LogContext().add("bridge", settings_.bridge_name));
            return true;
        }

        bool BridgeCoordinator::apply(const std::string &description,
                                      const std::function<bool(std::string &)> &action,
                                      std::function<bool(std::string &)> undo,
                                      std::string &cause)
        {
            std::string step_cause;
            if (!action(step_cause))
            {
                cause = description + ": " + step_cause;
                return false;
            }
            ledger_.push_back({description, std::move(undo)});
            return true;
        }

        bool BridgeCoordinator::run_step(const std::vector<std::string> &argv, std::string &cause)
        {
            auto result = runner_->run(argv, settings_.command_timeout);
            if (result.ok())
            {
                return true;
            }
            cause = join_command(argv) + ": " +
                    (result.timed_out ? std::string("timed out") : result.output.substr(0, result.output.find('\n')));
            return false;
        }

        bool BridgeCoordinator::run_undo(const std::vector<std::string> &argv, std::string &cause)
        {
            auto result = runner_->run(argv, settings_.command_timeout);
            if (result.ok() || (!result.timed_out && already_removed(result.output)))
            {
                return true;
            }
            cause = join_command(argv) + ": " +
                    (result.timed_out ? std::string("timed out") : result.output.substr(0, result.output.find('\n')));
            return false;
        }

        bool BridgeCoordinator::read_ip_forward(std::string &value, std::string &cause) const
        {
            std::ifstream file(settings_.ip_forward_path);
            if (!file.is_open() || !std::getline(file, value))
            {
                cause = "cannot read " + settings_.ip_forward_path;
                return false;
            }
            return true;
        }

        bool BridgeCoordinator::write_ip_forward(const std::string &value, std::string &cause) const
        {
            std::ofstream file(settings_.ip_forward_path);
            if (!file.is_open())
            {
                cause = "cannot write " + settings_.ip_forward_path;
                return false;
            }
            file << value << "\n";
            file.flush();
            if (!file)
            {
                cause = "write to " + settings_.ip_forward_path + " failed";
                return false;
            }
            return true;
        }

        void BridgeCoordinator::set_state(core::BridgeState state)
        {
            StateListener listener;
            std::string upstream;
            std::string ap;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (state_ == state)
                {
                    return;
                }
                state_ = state;
                listener = listener_;
                upstream = upstream_interface_;
                ap = ap_interface_;
            }
            logger_->debug("Bridge state", core::LogContext().add("state", core::bridge_state_to_string(state)));
            if (listener)
            {
                listener(state, upstream, ap);
            }
        }

        core::BridgeState BridgeCoordinator::current_state() const
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return state_;
        }

        std::vector<std::string> BridgeCoordinator::ledger() const
        {
            std::lock_guard<std::mutex> operation_lock(operation_mutex_);
            std::vector<std::string> descriptions;
            for (const auto &entry : ledger_)
            {
                descriptions.push_back(entry.description);
            }
            return descriptions;
        }

        void BridgeCoordinator::set_state_listener(StateListener listener)
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            listener_ = std::move(listener);
        }

    } // namespace infrastructure
} // namespace extender
