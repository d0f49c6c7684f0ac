#ifndef EXTENDER_CORE_RECONCILER_HPP
#define EXTENDER_CORE_RECONCILER_HPP

#include <string>
#include <optional>
#include "core/types.hpp"
#include "core/errors.hpp"

namespace extender
{
    namespace core
    {

        /**
         * Work the orchestrator can dispatch to the worker thread.
         * SCAN and REPROBE are issued by the orchestrator itself, never by reconcile().
         */
        enum class Action
        {
            NONE,
            DEACTIVATE_BRIDGE,
            STOP_ACCESS_POINT,
            DISCONNECT_UPSTREAM,
            DETACH_AP_INTERFACE,
            SET_MODE_DOWN,
            SET_MODE_STATION,
            ATTACH_AP_INTERFACE,
            CONNECT_UPSTREAM,
            RECONNECT_UPSTREAM,
            START_ACCESS_POINT,
            ACTIVATE_BRIDGE,
            SCAN,
            REPROBE
        };

        std::string action_to_string(Action action);

        /**
         * Everything the reconciliation step looks at, captured at one instant
         */
        struct Snapshot
        {
            ExtenderGoal goal = ExtenderGoal::STOPPED;

            bool radio_present = false;
            bool radio_concurrent = false;
            InterfaceMode mode = InterfaceMode::DOWN;
            bool ap_interface_present = false;

            ConnectionState connection;
            bool reconnect_due = false;
            bool has_upstream_profile = false;

            APState ap;
            bool ap_restart_due = true; // crash restart backoff has elapsed
            BridgeState bridge = BridgeState::TORN_DOWN;

            bool operation_in_flight = false;
            bool upstream_restart_pending = false;
            bool ap_restart_pending = false;

            // A failed action is not repeated before the next tick
            Action blocked_action = Action::NONE;

            int mode_failures = 0;
            int mode_failure_limit = 3;
            int ap_start_failures = 0;
            int ap_start_failure_limit = 3;

            std::optional<ReasonCode> terminal;

            // Extending has been reached since the goal was last set
            bool extending_reached = false;
        };

        struct Decision
        {
            OverallState state = OverallState::STOPPED;
            Action action = Action::NONE;
            ReasonCode reason = ReasonCode::NONE;
            bool terminal = false;

            // Flip an Active bridge to TearingDown right away, before any dispatch
            bool request_bridge_teardown = false;
        };

        /**
         * Pure reconciliation of goal against observed component state.
         * Returns at most one action; the caller dispatches it and calls again
         * once it completes.
         */
        Decision reconcile(const Snapshot &snapshot);

    } // namespace core
} // namespace extender

#endif // EXTENDER_CORE_RECONCILER_HPP
