#ifndef EXTENDER_CORE_CONFIG_HPP
#define EXTENDER_CORE_CONFIG_HPP

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <chrono>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace extender
{
    namespace core
    {

        /**
         * Upstream network the radio joins in station mode
         */
        struct UpstreamConfig
        {
            std::string ssid;
            std::string security = "wpa2-psk";
            std::string password;
            int channel = 0; // 0 = unknown

            void from_json(const nlohmann::json &j, std::vector<std::string> &violations);
            nlohmann::json to_json() const;
            UpstreamProfile to_profile() const;
        };

        /**
         * Local hotspot and its DHCP subnet
         */
        struct AccessPointConfig
        {
            std::string ssid = "WiFi-Extender";
            std::string security = "wpa2-psk";
            std::string password;
            int channel = 6;
            std::string hw_mode = "g";
            std::string gateway = "192.168.4.1";
            int prefix_length = 24;
            std::string dhcp_range_start = "192.168.4.2";
            std::string dhcp_range_end = "192.168.4.20";
            std::string lease_time = "12h";

            void from_json(const nlohmann::json &j, std::vector<std::string> &violations);
            nlohmann::json to_json() const;
            APProfile to_profile() const;
        };

        /**
         * Upstream reconnection backoff
         */
        struct ReconnectConfig
        {
            int base_delay_ms = 2000;
            int max_delay_ms = 60000;
            int max_attempts = 8;

            void from_json(const nlohmann::json &j, std::vector<std::string> &violations);
            nlohmann::json to_json() const;
        };

        /**
         * Bounds on every blocking external call
         */
        struct TimeoutConfig
        {
            int command_ms = 10000;
            int mode_verify_ms = 5000;
            int association_ms = 20000;
            int dhcp_client_ms = 30000;
            int hostapd_ready_ms = 10000;
            int dhcp_ready_ms = 5000;
            int lease_wait_ms = 60000;
            int process_stop_ms = 3000;
            int scan_ms = 15000;

            void from_json(const nlohmann::json &j, std::vector<std::string> &violations);
            nlohmann::json to_json() const;
        };

        /**
         * Control loop cadence and retry budgets
         */
        struct SupervisionConfig
        {
            int tick_interval_ms = 5000;
            int signal_sample_interval_ms = 10000;
            int mode_transition_max_attempts = 3;
            int ap_start_max_attempts = 3;

            // Restarts after the AP crashes while running
            int ap_restart_base_delay_ms = 2000;
            int ap_restart_max_delay_ms = 60000;
            int ap_restart_max_attempts = 5;
            int ap_stable_after_ms = 60000; // running this long clears the crash count

            void from_json(const nlohmann::json &j, std::vector<std::string> &violations);
            nlohmann::json to_json() const;
        };

        struct BridgeConfig
        {
            std::string name = "br-ext";
            std::string ip_forward_path = "/proc/sys/net/ipv4/ip_forward";

            void from_json(const nlohmann::json &j, std::vector<std::string> &violations);
            nlohmann::json to_json() const;
        };

        struct PathsConfig
        {
            std::string runtime_dir = "/run/wifi-extender";
            std::string sysfs_net_dir = "/sys/class/net";
            std::string state_db = "/var/lib/wifi-extender/events.db"; // empty disables the journal

            void from_json(const nlohmann::json &j, std::vector<std::string> &violations);
            nlohmann::json to_json() const;
        };

        struct ApiConfig
        {
            bool enabled = true;
            std::string host = "127.0.0.1";
            int port = 8089;
            std::string token; // empty disables bearer authentication

            void from_json(const nlohmann::json &j, std::vector<std::string> &violations);
            nlohmann::json to_json() const;
        };

        /**
         * Logging configuration
         */
        struct LoggingConfig
        {
            int status_interval = 30;
            std::string log_level = "INFO";
            std::string log_file; // Empty means console output
            std::string format = "text";

            void from_json(const nlohmann::json &j, std::vector<std::string> &violations);
            nlohmann::json to_json() const;
        };

        /**
         * Complete extender configuration. Loaded once at start and passed by
         * value into each component.
         */
        class ExtenderConfig
        {
        public:
            std::string interface_name; // empty = auto-detect

            std::optional<UpstreamConfig> upstream;
            AccessPointConfig access_point;
            ReconnectConfig reconnect;
            TimeoutConfig timeouts;
            SupervisionConfig supervision;
            BridgeConfig bridge;
            PathsConfig paths;
            ApiConfig api;
            LoggingConfig logging;

        public:
            ExtenderConfig() = default;

            // Factory methods; both throw ConfigError listing every violation
            static std::unique_ptr<ExtenderConfig> from_file(const std::string &config_path);
            static std::unique_ptr<ExtenderConfig> from_json(const nlohmann::json &j);
            static std::unique_ptr<ExtenderConfig> create_default();

            nlohmann::json to_json() const;
            void save_to_file(const std::string &config_path) const;

            std::vector<std::string> validate() const;
        };

        std::vector<std::string> validate_upstream_profile(const UpstreamProfile &profile);
        std::vector<std::string> validate_ap_profile(const APProfile &profile);

        /**
         * dnsmasq lease time ("45m", "12h", "3600", "infinite").
         * infinite maps to seconds::max().
         */
        std::optional<std::chrono::seconds> parse_lease_duration(const std::string &value);

        std::optional<uint32_t> parse_ipv4(const std::string &address);
        std::string format_ipv4(uint32_t address);
        std::string prefix_to_netmask(int prefix_length);

    } // namespace core
} // namespace extender

#endif // EXTENDER_CORE_CONFIG_HPP
