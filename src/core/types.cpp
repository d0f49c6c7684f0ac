#include "core/types.hpp"
#include <algorithm>
#include <cctype>

namespace extender
{
    namespace core
    {

        namespace
        {
            std::string lower(std::string value)
            {
                std::transform(value.begin(), value.end(), value.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return value;
            }
        }

        std::string mode_to_string(InterfaceMode mode)
        {
            switch (mode)
            {
            case InterfaceMode::DOWN:
                return "down";
            case InterfaceMode::STATION:
                return "station";
            case InterfaceMode::ACCESS_POINT:
                return "access-point";
            }
            return "unknown";
        }

        std::string security_to_string(SecurityType security)
        {
            switch (security)
            {
            case SecurityType::OPEN:
                return "open";
            case SecurityType::WEP:
                return "wep";
            case SecurityType::WPA_PSK:
                return "wpa-psk";
            case SecurityType::WPA2_PSK:
                return "wpa2-psk";
            }
            return "unknown";
        }

        std::optional<SecurityType> security_from_string(const std::string &value)
        {
            auto key = lower(value);
            if (key == "open" || key == "none")
                return SecurityType::OPEN;
            if (key == "wpa-psk" || key == "wpa")
                return SecurityType::WPA_PSK;
            if (key == "wpa2-psk" || key == "wpa2")
                return SecurityType::WPA2_PSK;
            return std::nullopt;
        }

        std::string goal_to_string(ExtenderGoal goal)
        {
            return goal == ExtenderGoal::EXTENDING ? "extending" : "stopped";
        }

        std::optional<ExtenderGoal> goal_from_string(const std::string &value)
        {
            auto key = lower(value);
            if (key == "extending")
                return ExtenderGoal::EXTENDING;
            if (key == "stopped")
                return ExtenderGoal::STOPPED;
            return std::nullopt;
        }

        std::string overall_state_to_string(OverallState state)
        {
            switch (state)
            {
            case OverallState::STOPPED:
                return "Stopped";
            case OverallState::INITIALIZING:
                return "Initializing";
            case OverallState::EXTENDING:
                return "Extending";
            case OverallState::DEGRADED:
                return "Degraded";
            case OverallState::STOPPING:
                return "Stopping";
            }
            return "Unknown";
        }

        std::string bridge_state_to_string(BridgeState state)
        {
            switch (state)
            {
            case BridgeState::TORN_DOWN:
                return "TornDown";
            case BridgeState::BUILDING:
                return "Building";
            case BridgeState::ACTIVE:
                return "Active";
            case BridgeState::TEARING_DOWN:
                return "TearingDown";
            }
            return "Unknown";
        }

        nlohmann::json RadioIdentity::to_json() const
        {
            nlohmann::json modes = nlohmann::json::array();
            for (auto mode : supported_modes)
            {
                modes.push_back(mode_to_string(mode));
            }
            return nlohmann::json{
                {"interface", interface_name},
                {"mac_address", mac_address},
                {"driver", driver},
                {"phy", phy},
                {"supported_modes", modes},
                {"supports_concurrent", supports_concurrent}};
        }

        nlohmann::json UpstreamProfile::to_json() const
        {
            nlohmann::json j{
                {"ssid", ssid},
                {"security", security_to_string(security)}};
            j["channel"] = channel ? nlohmann::json(*channel) : nlohmann::json(nullptr);
            return j;
        }

        nlohmann::json APProfile::to_json() const
        {
            return nlohmann::json{
                {"ssid", ssid},
                {"security", security_to_string(security)},
                {"channel", channel},
                {"hw_mode", hw_mode},
                {"gateway", gateway},
                {"prefix_length", prefix_length},
                {"dhcp_range_start", dhcp_range_start},
                {"dhcp_range_end", dhcp_range_end},
                {"lease_time", lease_time}};
        }

        APProfile APProfilePatch::apply_to(const APProfile &current) const
        {
            APProfile merged = current;
            merged.ssid = ssid.value_or(current.ssid);
            merged.security = security.value_or(current.security);
            merged.channel = channel.value_or(current.channel);
            merged.gateway = gateway.value_or(current.gateway);
            merged.prefix_length = prefix_length.value_or(current.prefix_length);
            merged.dhcp_range_start = dhcp_range_start.value_or(current.dhcp_range_start);
            merged.dhcp_range_end = dhcp_range_end.value_or(current.dhcp_range_end);
            merged.lease_time = lease_time.value_or(current.lease_time);

            if (passphrase)
            {
                merged.passphrase = *passphrase;
            }
            else if (merged.security == SecurityType::OPEN)
            {
                merged.passphrase.clear();
            }
            return merged;
        }

        std::string ConnectionState::name() const
        {
            switch (kind)
            {
            case ConnectionStateKind::DISCONNECTED:
                return "Disconnected";
            case ConnectionStateKind::SCANNING:
                return "Scanning";
            case ConnectionStateKind::ASSOCIATING:
                return "Associating";
            case ConnectionStateKind::CONNECTED:
                return "Connected";
            case ConnectionStateKind::RECONNECTING:
                return "Reconnecting";
            }
            return "Unknown";
        }

        nlohmann::json ConnectionState::to_json() const
        {
            nlohmann::json j{{"state", name()}, {"unrecoverable", unrecoverable}};
            if (kind == ConnectionStateKind::RECONNECTING || attempt > 0)
            {
                j["attempt"] = attempt;
                j["backoff_ms"] = backoff.count();
            }
            return j;
        }

        std::string APState::name() const
        {
            switch (kind)
            {
            case APStateKind::STOPPED:
                return "Stopped";
            case APStateKind::STARTING:
                return "Starting";
            case APStateKind::RUNNING:
                return "Running";
            case APStateKind::FAILED:
                return "Failed";
            }
            return "Unknown";
        }

        nlohmann::json APState::to_json() const
        {
            nlohmann::json j{{"state", name()}};
            if (kind == APStateKind::FAILED)
            {
                j["reason"] = reason_to_string(reason);
            }
            return j;
        }

        nlohmann::json ClientRecord::to_json() const
        {
            nlohmann::json j{
                {"mac", mac},
                {"hostname", hostname},
                {"associated_at", associated_at_ms},
                {"lease_overdue", lease_overdue}};
            j["ip"] = ip ? nlohmann::json(*ip) : nlohmann::json(nullptr);
            j["signal_dbm"] = signal_dbm ? nlohmann::json(*signal_dbm) : nlohmann::json(nullptr);
            return j;
        }

        nlohmann::json DiscoveredNetwork::to_json() const
        {
            return nlohmann::json{
                {"bssid", bssid},
                {"ssid", ssid},
                {"frequency_mhz", frequency_mhz},
                {"channel", channel},
                {"signal_dbm", signal_dbm},
                {"security", security_to_string(security)},
                {"associated", associated}};
        }

        int channel_from_frequency(int frequency_mhz)
        {
            if (frequency_mhz == 2484)
                return 14;
            if (frequency_mhz >= 2412 && frequency_mhz <= 2472)
                return (frequency_mhz - 2407) / 5;
            if (frequency_mhz >= 5000 && frequency_mhz <= 5900)
                return (frequency_mhz - 5000) / 5;
            return 0;
        }

        int frequency_from_channel(int channel)
        {
            if (channel == 14)
                return 2484;
            if (channel >= 1 && channel <= 13)
                return 2407 + channel * 5;
            if (channel >= 32 && channel <= 177)
                return 5000 + channel * 5;
            return 0;
        }

        int64_t system_now_ms()
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

    } // namespace core
} // namespace extender
