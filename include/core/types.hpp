#ifndef EXTENDER_CORE_TYPES_HPP
#define EXTENDER_CORE_TYPES_HPP

#include <string>
#include <set>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "core/errors.hpp"

namespace extender
{
    namespace core
    {

        /**
         * Operational mode of the physical interface. Station and access point
         * are mutually exclusive on the radio itself; concurrent hardware runs
         * the access point on a virtual sub-interface instead.
         */
        enum class InterfaceMode
        {
            DOWN,
            STATION,
            ACCESS_POINT
        };

        enum class SecurityType
        {
            OPEN,
            WEP, // reported by scans only, never configurable
            WPA_PSK,
            WPA2_PSK
        };

        enum class ExtenderGoal
        {
            STOPPED,
            EXTENDING
        };

        enum class OverallState
        {
            STOPPED,
            INITIALIZING,
            EXTENDING,
            DEGRADED,
            STOPPING
        };

        enum class BridgeState
        {
            TORN_DOWN,
            BUILDING,
            ACTIVE,
            TEARING_DOWN
        };

        std::string mode_to_string(InterfaceMode mode);
        std::string security_to_string(SecurityType security);
        std::optional<SecurityType> security_from_string(const std::string &value);
        std::string goal_to_string(ExtenderGoal goal);
        std::optional<ExtenderGoal> goal_from_string(const std::string &value);
        std::string overall_state_to_string(OverallState state);
        std::string bridge_state_to_string(BridgeState state);

        /**
         * Static identity of a radio, produced by the capability probe
         */
        struct RadioIdentity
        {
            std::string interface_name;
            std::string mac_address;
            std::string driver;
            std::string phy;
            std::set<InterfaceMode> supported_modes;
            bool supports_concurrent = false;

            bool supports(InterfaceMode mode) const
            {
                return mode == InterfaceMode::DOWN || supported_modes.count(mode) > 0;
            }

            nlohmann::json to_json() const;
        };

        struct UpstreamProfile
        {
            std::string ssid;
            SecurityType security = SecurityType::WPA2_PSK;
            std::string passphrase;
            std::optional<int> channel;

            nlohmann::json to_json() const; // passphrase is never serialized
        };

        struct APProfile
        {
            std::string ssid;
            SecurityType security = SecurityType::WPA2_PSK;
            std::string passphrase;
            int channel = 6;
            std::string hw_mode = "g";
            std::string gateway = "192.168.4.1";
            int prefix_length = 24;
            std::string dhcp_range_start = "192.168.4.2";
            std::string dhcp_range_end = "192.168.4.20";
            std::string lease_time = "12h";

            std::string gateway_cidr() const { return gateway + "/" + std::to_string(prefix_length); }
            nlohmann::json to_json() const;
        };

        /**
         * Partial access point update as received from an operator. Unset
         * fields keep the current profile's values, passphrase included.
         * Switching to an open network drops the passphrase.
         */
        struct APProfilePatch
        {
            std::optional<std::string> ssid;
            std::optional<SecurityType> security;
            std::optional<std::string> passphrase;
            std::optional<int> channel;
            std::optional<std::string> gateway;
            std::optional<int> prefix_length;
            std::optional<std::string> dhcp_range_start;
            std::optional<std::string> dhcp_range_end;
            std::optional<std::string> lease_time;

            APProfile apply_to(const APProfile &current) const;
        };

        enum class ConnectionStateKind
        {
            DISCONNECTED,
            SCANNING,
            ASSOCIATING,
            CONNECTED,
            RECONNECTING
        };

        /**
         * Upstream link state. attempt and backoff are meaningful while
         * RECONNECTING (and while ASSOCIATING during a reconnect attempt).
         * unrecoverable is set once the reconnect budget is spent.
         */
        struct ConnectionState
        {
            ConnectionStateKind kind = ConnectionStateKind::DISCONNECTED;
            int attempt = 0;
            std::chrono::milliseconds backoff{0};
            bool unrecoverable = false;

            bool is_connected() const { return kind == ConnectionStateKind::CONNECTED; }
            std::string name() const;
            nlohmann::json to_json() const;

            bool operator==(const ConnectionState &other) const
            {
                return kind == other.kind && attempt == other.attempt &&
                       backoff == other.backoff && unrecoverable == other.unrecoverable;
            }
            bool operator!=(const ConnectionState &other) const { return !(*this == other); }
        };

        enum class APStateKind
        {
            STOPPED,
            STARTING,
            RUNNING,
            FAILED
        };

        struct APState
        {
            APStateKind kind = APStateKind::STOPPED;
            ReasonCode reason = ReasonCode::NONE; // set when FAILED

            bool is_running() const { return kind == APStateKind::RUNNING; }
            std::string name() const;
            nlohmann::json to_json() const;

            bool operator==(const APState &other) const { return kind == other.kind && reason == other.reason; }
            bool operator!=(const APState &other) const { return !(*this == other); }
        };

        /**
         * A station associated with the access point, merged by MAC address
         */
        struct ClientRecord
        {
            std::string mac;
            std::optional<std::string> ip; // empty until a lease is granted
            std::string hostname;
            std::optional<int> signal_dbm;
            int64_t associated_at_ms = 0;
            bool lease_overdue = false;

            nlohmann::json to_json() const;
        };

        struct DiscoveredNetwork
        {
            std::string bssid;
            std::string ssid;
            int frequency_mhz = 0;
            int channel = 0;
            double signal_dbm = 0.0;
            SecurityType security = SecurityType::OPEN;
            bool associated = false;

            nlohmann::json to_json() const;
        };

        int channel_from_frequency(int frequency_mhz);
        int frequency_from_channel(int channel);

        int64_t system_now_ms();

    } // namespace core
} // namespace extender

#endif // EXTENDER_CORE_TYPES_HPP
