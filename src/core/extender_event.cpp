#include "core/extender_event.hpp"

namespace extender
{
    namespace core
    {

        namespace
        {
            ExtenderEvent make_event(ExtenderEventType type, ExtenderEventData data)
            {
                ExtenderEvent event;
                event.type = type;
                event.data = std::move(data);
                event.timestamp = std::chrono::steady_clock::now();
                return event;
            }
        }

        ExtenderEvent ExtenderEvent::goal_changed(ExtenderGoal goal)
        {
            return make_event(ExtenderEventType::GOAL_CHANGED, GoalData{goal});
        }

        ExtenderEvent ExtenderEvent::scan_requested()
        {
            return make_event(ExtenderEventType::SCAN_REQUESTED, EmptyData{});
        }

        ExtenderEvent ExtenderEvent::upstream_profile_supplied(const UpstreamProfile &profile)
        {
            return make_event(ExtenderEventType::UPSTREAM_PROFILE_SUPPLIED, UpstreamProfileData{profile});
        }

        ExtenderEvent ExtenderEvent::ap_profile_changed(const APProfile &profile)
        {
            return make_event(ExtenderEventType::AP_PROFILE_CHANGED, APProfileData{profile});
        }

        ExtenderEvent ExtenderEvent::manual_retry()
        {
            return make_event(ExtenderEventType::MANUAL_RETRY, EmptyData{});
        }

        ExtenderEvent ExtenderEvent::operation_completed(OperationResult result)
        {
            return make_event(ExtenderEventType::OPERATION_COMPLETED, std::move(result));
        }

        ExtenderEvent ExtenderEvent::mode_changed(InterfaceMode mode, bool ap_interface_present)
        {
            return make_event(ExtenderEventType::MODE_CHANGED, ModeData{mode, ap_interface_present});
        }

        ExtenderEvent ExtenderEvent::connection_changed(const ConnectionState &state, ReasonCode reason)
        {
            return make_event(ExtenderEventType::CONNECTION_CHANGED, ConnectionData{state, reason});
        }

        ExtenderEvent ExtenderEvent::ap_state_changed(const APState &state)
        {
            return make_event(ExtenderEventType::AP_STATE_CHANGED, APStateData{state});
        }

        ExtenderEvent ExtenderEvent::bridge_changed(BridgeState state, const std::string &upstream, const std::string &ap)
        {
            return make_event(ExtenderEventType::BRIDGE_CHANGED, BridgeData{state, upstream, ap});
        }

        ExtenderEvent ExtenderEvent::client_changed(ClientChange change, const ClientRecord &record)
        {
            return make_event(ExtenderEventType::CLIENT_CHANGED, ClientData{change, record});
        }

        std::string ExtenderEvent::type_name() const
        {
            switch (type)
            {
            case ExtenderEventType::GOAL_CHANGED:
                return "GOAL_CHANGED";
            case ExtenderEventType::SCAN_REQUESTED:
                return "SCAN_REQUESTED";
            case ExtenderEventType::UPSTREAM_PROFILE_SUPPLIED:
                return "UPSTREAM_PROFILE_SUPPLIED";
            case ExtenderEventType::AP_PROFILE_CHANGED:
                return "AP_PROFILE_CHANGED";
            case ExtenderEventType::MANUAL_RETRY:
                return "MANUAL_RETRY";
            case ExtenderEventType::OPERATION_COMPLETED:
                return "OPERATION_COMPLETED";
            case ExtenderEventType::MODE_CHANGED:
                return "MODE_CHANGED";
            case ExtenderEventType::CONNECTION_CHANGED:
                return "CONNECTION_CHANGED";
            case ExtenderEventType::AP_STATE_CHANGED:
                return "AP_STATE_CHANGED";
            case ExtenderEventType::BRIDGE_CHANGED:
                return "BRIDGE_CHANGED";
            case ExtenderEventType::CLIENT_CHANGED:
                return "CLIENT_CHANGED";
            default:
                return "UNKNOWN";
            }
        }

        int64_t ExtenderEvent::age_ms() const
        {
            auto now = std::chrono::steady_clock::now();
            return std::chrono::duration_cast<std::chrono::milliseconds>(now - timestamp).count();
        }

    } // namespace core
} // namespace extender
