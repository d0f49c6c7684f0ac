#include "core/reconciler.hpp"

namespace extender
{
    namespace core
    {

        namespace
        {
            bool upstream_up(const Snapshot &s)
            {
                return s.connection.kind == ConnectionStateKind::CONNECTED;
            }

            bool ap_up(const Snapshot &s)
            {
                return s.ap.kind == APStateKind::RUNNING;
            }

            // Next step towards the all-down baseline, NONE once there
            Action teardown_step(const Snapshot &s)
            {
                if (s.bridge != BridgeState::TORN_DOWN)
                    return Action::DEACTIVATE_BRIDGE;
                if (s.ap.kind != APStateKind::STOPPED)
                    return Action::STOP_ACCESS_POINT;
                if (s.connection.kind != ConnectionStateKind::DISCONNECTED)
                    return Action::DISCONNECT_UPSTREAM;
                if (s.radio_present && s.ap_interface_present)
                    return Action::DETACH_AP_INTERFACE;
                if (s.radio_present && s.mode != InterfaceMode::DOWN)
                    return Action::SET_MODE_DOWN;
                return Action::NONE;
            }

            OverallState progress_state(const Snapshot &s)
            {
                return s.extending_reached ? OverallState::DEGRADED : OverallState::INITIALIZING;
            }

            Decision make(OverallState state, Action action, ReasonCode reason = ReasonCode::NONE, bool terminal = false)
            {
                Decision decision;
                decision.state = state;
                decision.action = action;
                decision.reason = reason;
                decision.terminal = terminal;
                return decision;
            }

            Decision reconcile_stopped(const Snapshot &s)
            {
                if (s.operation_in_flight)
                {
                    return make(OverallState::STOPPING, Action::NONE);
                }

                Action step = teardown_step(s);
                if (step == Action::NONE)
                {
                    return make(OverallState::STOPPED, Action::NONE);
                }
                return make(OverallState::STOPPING, step);
            }

            Decision reconcile_extending(const Snapshot &s)
            {
                bool both_up = upstream_up(s) && ap_up(s);
                bool restart_pending = s.upstream_restart_pending || s.ap_restart_pending;

                // Bridge first: it must never stay Active without both legs up
                bool bridge_must_fall = s.bridge == BridgeState::TEARING_DOWN ||
                                        (s.bridge == BridgeState::ACTIVE && (!both_up || restart_pending || s.terminal));
                if (bridge_must_fall)
                {
                    Decision decision = make(s.terminal ? OverallState::DEGRADED : progress_state(s),
                                             s.operation_in_flight ? Action::NONE : Action::DEACTIVATE_BRIDGE,
                                             s.terminal.value_or(ReasonCode::NONE), s.terminal.has_value());
                    decision.request_bridge_teardown = s.bridge == BridgeState::ACTIVE;
                    return decision;
                }

                if (s.terminal)
                {
                    // Lost hardware returns everything to baseline; other terminal conditions hold position
                    Action step = Action::NONE;
                    if (*s.terminal == ReasonCode::HARDWARE_UNAVAILABLE && !s.operation_in_flight)
                    {
                        step = teardown_step(s);
                    }
                    return make(OverallState::DEGRADED, step, *s.terminal, true);
                }

                if (s.operation_in_flight)
                {
                    return make(s.bridge == BridgeState::ACTIVE ? OverallState::EXTENDING : progress_state(s), Action::NONE);
                }

                if (s.upstream_restart_pending && s.connection.kind != ConnectionStateKind::DISCONNECTED)
                {
                    return make(progress_state(s), Action::DISCONNECT_UPSTREAM);
                }
                if (s.ap_restart_pending && s.ap.kind != APStateKind::STOPPED)
                {
                    return make(progress_state(s), Action::STOP_ACCESS_POINT);
                }

                if (!s.radio_present)
                {
                    return make(OverallState::DEGRADED, Action::NONE, ReasonCode::HARDWARE_UNAVAILABLE, true);
                }
                if (!s.radio_concurrent)
                {
                    return make(OverallState::DEGRADED, Action::NONE, ReasonCode::INCOMPATIBLE_MODE, true);
                }

                if (s.mode != InterfaceMode::STATION || !s.ap_interface_present)
                {
                    if (s.mode_failures >= s.mode_failure_limit)
                    {
                        return make(OverallState::DEGRADED, Action::NONE, ReasonCode::MODE_TRANSITION_FAILED, true);
                    }
                    return make(progress_state(s),
                                s.mode != InterfaceMode::STATION ? Action::SET_MODE_STATION : Action::ATTACH_AP_INTERFACE);
                }

                if (!s.has_upstream_profile)
                {
                    return make(OverallState::DEGRADED, Action::NONE, ReasonCode::NO_UPSTREAM_PROFILE, true);
                }
                if (s.connection.unrecoverable)
                {
                    return make(OverallState::DEGRADED, Action::NONE, ReasonCode::UPSTREAM_UNRECOVERABLE, true);
                }

                if (s.connection.kind == ConnectionStateKind::DISCONNECTED)
                {
                    return make(progress_state(s), Action::CONNECT_UPSTREAM);
                }
                if (s.connection.kind == ConnectionStateKind::RECONNECTING && s.reconnect_due)
                {
                    return make(progress_state(s), Action::RECONNECT_UPSTREAM);
                }

                if (s.ap.kind == APStateKind::STOPPED || s.ap.kind == APStateKind::FAILED)
                {
                    if (s.ap_start_failures >= s.ap_start_failure_limit)
                    {
                        return make(OverallState::DEGRADED, Action::NONE, ReasonCode::AP_START_FAILED, true);
                    }
                    if (!s.ap_restart_due)
                    {
                        return make(progress_state(s), Action::NONE);
                    }
                    return make(progress_state(s), Action::START_ACCESS_POINT);
                }

                if (both_up && s.bridge == BridgeState::TORN_DOWN)
                {
                    return make(progress_state(s), Action::ACTIVATE_BRIDGE);
                }

                if (s.bridge == BridgeState::ACTIVE)
                {
                    return make(OverallState::EXTENDING, Action::NONE);
                }
                return make(progress_state(s), Action::NONE);
            }
        }

        std::string action_to_string(Action action)
        {
            switch (action)
            {
            case Action::NONE:
                return "None";
            case Action::DEACTIVATE_BRIDGE:
                return "DeactivateBridge";
            case Action::STOP_ACCESS_POINT:
                return "StopAccessPoint";
            case Action::DISCONNECT_UPSTREAM:
                return "DisconnectUpstream";
            case Action::DETACH_AP_INTERFACE:
                return "DetachAPInterface";
            case Action::SET_MODE_DOWN:
                return "SetModeDown";
            case Action::SET_MODE_STATION:
                return "SetModeStation";
            case Action::ATTACH_AP_INTERFACE:
                return "AttachAPInterface";
            case Action::CONNECT_UPSTREAM:
                return "ConnectUpstream";
            case Action::RECONNECT_UPSTREAM:
                return "ReconnectUpstream";
            case Action::START_ACCESS_POINT:
                return "StartAccessPoint";
            case Action::ACTIVATE_BRIDGE:
                return "ActivateBridge";
            case Action::SCAN:
                return "Scan";
            case Action::REPROBE:
                return "Reprobe";
            }
            return "Unknown";
        }

        Decision reconcile(const Snapshot &snapshot)
        {
            Decision decision = snapshot.goal == ExtenderGoal::STOPPED ? reconcile_stopped(snapshot)
                                                                        : reconcile_extending(snapshot);

            if (decision.action != Action::NONE && decision.action == snapshot.blocked_action)
            {
                decision.action = Action::NONE;
            }
            return decision;
        }

    } // namespace core
} // namespace extender
