#ifndef EXTENDER_INFRASTRUCTURE_BRIDGE_COORDINATOR_HPP
#define EXTENDER_INFRASTRUCTURE_BRIDGE_COORDINATOR_HPP

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <functional>
#include <chrono>
#include "core/types.hpp"
#include "core/errors.hpp"

namespace extender
{
    namespace core
    {
        class Logger;
    }
}

namespace extender
{
    namespace infrastructure
    {
        class CommandRunner;

        struct BridgeSettings
        {
            std::string bridge_name = "br-ext";
            std::string ip_forward_path = "/proc/sys/net/ipv4/ip_forward";
            std::chrono::milliseconds command_timeout{10000};
        };

        /**
         * Bridge Coordinator
         * Creates the bridge, enslaves the AP interface and installs forwarding
         * and NAT towards the upstream interface. Every change is recorded in a
         * ledger and undone in reverse order; an undo that fails stays in the
         * ledger for the next deactivation.
         */
        class BridgeCoordinator
        {
        public:
            using StateListener = std::function<void(core::BridgeState state, const std::string &upstream_interface,
                                                     const std::string &ap_interface)>;

            BridgeCoordinator(std::shared_ptr<CommandRunner> runner, const BridgeSettings &settings);

            // Idempotent for the same pair. gateway_cidr, when given, moves from the AP interface to the bridge.
            core::Outcome activate(const std::string &upstream_interface,
                                   const std::string &ap_interface,
                                   const std::string &gateway_cidr = "");
            core::Outcome deactivate();

            // Marks an active bridge as tearing down without touching the system;
            // the actual teardown follows through deactivate()
            void request_teardown();

            core::BridgeState current_state() const;
            std::vector<std::string> ledger() const;
            const std::string &bridge_name() const { return settings_.bridge_name; }

            void set_state_listener(StateListener listener);

        private:
            struct LedgerEntry
            {
                std::string description;
                std::function<bool(std::string &cause)> undo;
            };

            bool apply(const std::string &description,
                       const std::function<bool(std::string &)> &action,
                       std::function<bool(std::string &)> undo,
                       std::string &cause);
            bool deactivate_locked(std::string &cause);
            bool run_step(const std::vector<std::string> &argv, std::string &cause);
            bool run_undo(const std::vector<std::string> &argv, std::string &cause);
            bool read_ip_forward(std::string &value, std::string &cause) const;
            bool write_ip_forward(const std::string &value, std::string &cause) const;
            void set_state(core::BridgeState state);

            std::shared_ptr<CommandRunner> runner_;
            BridgeSettings settings_;
            std::shared_ptr<core::Logger> logger_;

            std::vector<LedgerEntry> ledger_;
            mutable std::mutex operation_mutex_;

            core::BridgeState state_ = core::BridgeState::TORN_DOWN;
            std::string upstream_interface_;
            std::string ap_interface_;
            std::string gateway_cidr_;
            StateListener listener_;
            mutable std::mutex state_mutex_;
        };

    } // namespace infrastructure
} // namespace extender

#endif // EXTENDER_INFRASTRUCTURE_BRIDGE_COORDINATOR_HPP
