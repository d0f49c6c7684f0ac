#ifndef EXTENDER_CORE_EXTENDER_EVENT_HPP
#define EXTENDER_CORE_EXTENDER_EVENT_HPP

#include <string>
#include <vector>
#include <chrono>
#include <variant>
#include <optional>
#include "core/types.hpp"
#include "core/errors.hpp"
#include "core/reconciler.hpp"

namespace extender
{
    namespace core
    {

        enum class ExtenderEventType
        {
            // Commands
            GOAL_CHANGED,
            SCAN_REQUESTED,
            UPSTREAM_PROFILE_SUPPLIED,
            AP_PROFILE_CHANGED,
            MANUAL_RETRY,

            // Worker results
            OPERATION_COMPLETED,

            // Component state reports
            MODE_CHANGED,
            CONNECTION_CHANGED,
            AP_STATE_CHANGED,
            BRIDGE_CHANGED,
            CLIENT_CHANGED
        };

        enum class ClientChange
        {
            JOINED,
            UPDATED,
            LEFT
        };

        struct GoalData
        {
            ExtenderGoal goal;
        };

        struct UpstreamProfileData
        {
            UpstreamProfile profile;
        };

        struct APProfileData
        {
            APProfile profile;
        };

        struct OperationResult
        {
            Action action = Action::NONE;
            uint64_t epoch = 0;
            Outcome outcome;
            std::vector<DiscoveredNetwork> networks; // SCAN
            std::optional<RadioIdentity> radio;      // REPROBE
        };

        struct ModeData
        {
            InterfaceMode mode;
            bool ap_interface_present;
        };

        struct ConnectionData
        {
            ConnectionState state;
            ReasonCode reason;
        };

        struct APStateData
        {
            APState state;
        };

        struct BridgeData
        {
            BridgeState state;
            std::string upstream_interface;
            std::string ap_interface;
        };

        struct ClientData
        {
            ClientChange change;
            ClientRecord record;
        };

        struct EmptyData
        {
        };

        using ExtenderEventData = std::variant<
            GoalData,
            UpstreamProfileData,
            APProfileData,
            OperationResult,
            ModeData,
            ConnectionData,
            APStateData,
            BridgeData,
            ClientData,
            EmptyData>;

        struct ExtenderEvent
        {
            ExtenderEventType type;
            ExtenderEventData data;
            std::chrono::steady_clock::time_point timestamp;

            static ExtenderEvent goal_changed(ExtenderGoal goal);
            static ExtenderEvent scan_requested();
            static ExtenderEvent upstream_profile_supplied(const UpstreamProfile &profile);
            static ExtenderEvent ap_profile_changed(const APProfile &profile);
            static ExtenderEvent manual_retry();
            static ExtenderEvent operation_completed(OperationResult result);
            static ExtenderEvent mode_changed(InterfaceMode mode, bool ap_interface_present);
            static ExtenderEvent connection_changed(const ConnectionState &state, ReasonCode reason);
            static ExtenderEvent ap_state_changed(const APState &state);
            static ExtenderEvent bridge_changed(BridgeState state, const std::string &upstream, const std::string &ap);
            static ExtenderEvent client_changed(ClientChange change, const ClientRecord &record);

            std::string type_name() const;
            int64_t age_ms() const;
        };

    } // namespace core
} // namespace extender

#endif // EXTENDER_CORE_EXTENDER_EVENT_HPP
