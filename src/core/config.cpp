#include "core/config.hpp"
#include "core/logger.hpp"
#include <fstream>
#include <stdexcept>
#include <set>
#include <cctype>
#include <type_traits>
#include <arpa/inet.h>

namespace extender
{
    namespace core
    {

        namespace
        {
            template <typename T>
            std::string expected_type()
            {
                if constexpr (std::is_same_v<T, bool>)
                    return "boolean";
                else if constexpr (std::is_integral_v<T>)
                    return "integer";
                else
                    return "string";
            }

            template <typename T>
            bool type_matches(const nlohmann::json &value)
            {
                if constexpr (std::is_same_v<T, bool>)
                    return value.is_boolean();
                else if constexpr (std::is_integral_v<T>)
                    return value.is_number_integer();
                else
                    return value.is_string();
            }

            template <typename T>
            void read_field(const nlohmann::json &j, const std::string &key, T &target,
                            const std::string &section, std::vector<std::string> &violations)
            {
                if (!j.contains(key))
                {
                    return;
                }

                const auto &value = j.at(key);
                if constexpr (std::is_same_v<T, std::string>)
                {
                    // null keeps the default, as for an absent optional string
                    if (value.is_null())
                    {
                        return;
                    }
                }

                if (!type_matches<T>(value))
                {
                    violations.push_back(section + "." + key + ": expected " + expected_type<T>() +
                                         ", got " + value.type_name());
                    return;
                }
                target = value.get<T>();
            }

            void check_keys(const nlohmann::json &j, const std::set<std::string> &allowed,
                            const std::string &section, std::vector<std::string> &violations)
            {
                for (const auto &item : j.items())
                {
                    if (allowed.count(item.key()) == 0)
                    {
                        violations.push_back((section.empty() ? "" : section + ".") + item.key() + ": unknown key");
                    }
                }
            }

            bool is_object_section(const nlohmann::json &j, const std::string &section,
                                   std::vector<std::string> &violations)
            {
                if (!j.is_object())
                {
                    violations.push_back(section + ": expected object, got " + std::string(j.type_name()));
                    return false;
                }
                return true;
            }

            bool valid_channel(int channel)
            {
                return (channel >= 1 && channel <= 14) || (channel >= 32 && channel <= 177);
            }

            void check_ssid(const std::string &ssid, const std::string &field, std::vector<std::string> &violations)
            {
                if (ssid.empty() || ssid.size() > 32)
                {
                    violations.push_back(field + ": must be 1-32 bytes");
                    return;
                }
                for (unsigned char c : ssid)
                {
                    if (std::iscntrl(c))
                    {
                        violations.push_back(field + ": must not contain control characters");
                        return;
                    }
                }
            }

            void check_passphrase(SecurityType security, const std::string &passphrase,
                                  const std::string &field, std::vector<std::string> &violations)
            {
                if (security == SecurityType::OPEN)
                {
                    return;
                }
                if (passphrase.size() < 8 || passphrase.size() > 63)
                {
                    violations.push_back(field + ": WPA passphrase must be 8-63 characters");
                    return;
                }
                for (unsigned char c : passphrase)
                {
                    if (c < 32 || c > 126)
                    {
                        violations.push_back(field + ": WPA passphrase must be printable ASCII");
                        return;
                    }
                }
            }

            void check_security(const std::string &value, const std::string &field,
                                std::vector<std::string> &violations)
            {
                if (!security_from_string(value))
                {
                    violations.push_back(field + ": must be one of open, wpa-psk, wpa2-psk");
                }
            }

            void check_positive(int value, const std::string &field, std::vector<std::string> &violations)
            {
                if (value <= 0)
                {
                    violations.push_back(field + ": must be positive");
                }
            }
        }

        // UpstreamConfig implementation
        void UpstreamConfig::from_json(const nlohmann::json &j, std::vector<std::string> &violations)
        {
            if (!is_object_section(j, "upstream", violations))
                return;
            check_keys(j, {"ssid", "security", "password", "channel"}, "upstream", violations);
            read_field(j, "ssid", ssid, "upstream", violations);
            read_field(j, "security", security, "upstream", violations);
            read_field(j, "password", password, "upstream", violations);
            read_field(j, "channel", channel, "upstream", violations);
        }

        nlohmann::json UpstreamConfig::to_json() const
        {
            nlohmann::json j{
                {"ssid", ssid},
                {"security", security},
                {"password", password}};
            if (channel > 0)
            {
                j["channel"] = channel;
            }
            return j;
        }

        UpstreamProfile UpstreamConfig::to_profile() const
        {
            UpstreamProfile profile;
            profile.ssid = ssid;
            profile.security = security_from_string(security).value_or(SecurityType::WPA2_PSK);
            profile.passphrase = password;
            if (channel > 0)
            {
                profile.channel = channel;
            }
            return profile;
        }

        // AccessPointConfig implementation
        void AccessPointConfig::from_json(const nlohmann::json &j, std::vector<std::string> &violations)
        {
            if (!is_object_section(j, "ap", violations))
                return;
            check_keys(j, {"ssid", "security", "password", "channel", "hw_mode", "gateway", "prefix_length",
                           "dhcp_range_start", "dhcp_range_end", "lease_time"},
                       "ap", violations);
            read_field(j, "ssid", ssid, "ap", violations);
            read_field(j, "security", security, "ap", violations);
            read_field(j, "password", password, "ap", violations);
            read_field(j, "channel", channel, "ap", violations);
            read_field(j, "hw_mode", hw_mode, "ap", violations);
            read_field(j, "gateway", gateway, "ap", violations);
            read_field(j, "prefix_length", prefix_length, "ap", violations);
            read_field(j, "dhcp_range_start", dhcp_range_start, "ap", violations);
            read_field(j, "dhcp_range_end", dhcp_range_end, "ap", violations);
            read_field(j, "lease_time", lease_time, "ap", violations);
        }

        nlohmann::json AccessPointConfig::to_json() const
        {
            return nlohmann::json{
                {"ssid", ssid},
                {"security", security},
                {"password", password},
                {"channel", channel},
                {"hw_mode", hw_mode},
                {"gateway", gateway},
                {"prefix_length", prefix_length},
                {"dhcp_range_start", dhcp_range_start},
                {"dhcp_range_end", dhcp_range_end},
                {"lease_time", lease_time}};
        }

        APProfile AccessPointConfig::to_profile() const
        {
            APProfile profile;
            profile.ssid = ssid;
            profile.security = security_from_string(security).value_or(SecurityType::WPA2_PSK);
            profile.passphrase = password;
            profile.channel = channel;
            profile.hw_mode = hw_mode;
            profile.gateway = gateway;
            profile.prefix_length = prefix_length;
            profile.dhcp_range_start = dhcp_range_start;
            profile.dhcp_range_end = dhcp_range_end;
            profile.lease_time = lease_time;
            return profile;
        }

        // ReconnectConfig implementation
        void ReconnectConfig::from_json(const nlohmann::json &j, std::vector<std::string> &violations)
        {
            if (!is_object_section(j, "reconnect", violations))
                return;
            check_keys(j, {"base_delay_ms", "max_delay_ms", "max_attempts"}, "reconnect", violations);
            read_field(j, "base_delay_ms", base_delay_ms, "reconnect", violations);
            read_field(j, "max_delay_ms", max_delay_ms, "reconnect", violations);
            read_field(j, "max_attempts", max_attempts, "reconnect", violations);
        }

        nlohmann::json ReconnectConfig::to_json() const
        {
            return nlohmann::json{
                {"base_delay_ms", base_delay_ms},
                {"max_delay_ms", max_delay_ms},
                {"max_attempts", max_attempts}};
        }

        // TimeoutConfig implementation
        void TimeoutConfig::from_json(const nlohmann::json &j, std::vector<std::string> &violations)
        {
            if (!is_object_section(j, "timeouts", violations))
                return;
            check_keys(j, {"command_ms", "mode_verify_ms", "association_ms", "dhcp_client_ms", "hostapd_ready_ms",
                           "dhcp_ready_ms", "lease_wait_ms", "process_stop_ms", "scan_ms"},
                       "timeouts", violations);
            read_field(j, "command_ms", command_ms, "timeouts", violations);
            read_field(j, "mode_verify_ms", mode_verify_ms, "timeouts", violations);
            read_field(j, "association_ms", association_ms, "timeouts", violations);
            read_field(j, "dhcp_client_ms", dhcp_client_ms, "timeouts", violations);
            read_field(j, "hostapd_ready_ms", hostapd_ready_ms, "timeouts", violations);
            read_field(j, "dhcp_ready_ms", dhcp_ready_ms, "timeouts", violations);
            read_field(j, "lease_wait_ms", lease_wait_ms, "timeouts", violations);
            read_field(j, "process_stop_ms", process_stop_ms, "timeouts", violations);
            read_field(j, "scan_ms", scan_ms, "timeouts", violations);
        }

        nlohmann::json TimeoutConfig::to_json() const
        {
            return nlohmann::json{
                {"command_ms", command_ms},
                {"mode_verify_ms", mode_verify_ms},
                {"association_ms", association_ms},
                {"dhcp_client_ms", dhcp_client_ms},
                {"hostapd_ready_ms", hostapd_ready_ms},
                {"dhcp_ready_ms", dhcp_ready_ms},
                {"lease_wait_ms", lease_wait_ms},
                {"process_stop_ms", process_stop_ms},
                {"scan_ms", scan_ms}};
        }

        // SupervisionConfig implementation
        void SupervisionConfig::from_json(const nlohmann::json &j, std::vector<std::string> &violations)
        {
            if (!is_object_section(j, "supervision", violations))
                return;
            check_keys(j, {"tick_interval_ms", "signal_sample_interval_ms", "mode_transition_max_attempts",
                           "ap_start_max_attempts", "ap_restart_base_delay_ms", "ap_restart_max_delay_ms",
                           "ap_restart_max_attempts", "ap_stable_after_ms"},
                       "supervision", violations);
            read_field(j, "tick_interval_ms", tick_interval_ms, "supervision", violations);
            read_field(j, "signal_sample_interval_ms", signal_sample_interval_ms, "supervision", violations);
            read_field(j, "mode_transition_max_attempts", mode_transition_max_attempts, "supervision", violations);
            read_field(j, "ap_start_max_attempts", ap_start_max_attempts, "supervision", violations);
            read_field(j, "ap_restart_base_delay_ms", ap_restart_base_delay_ms, "supervision", violations);
            read_field(j, "ap_restart_max_delay_ms", ap_restart_max_delay_ms, "supervision", violations);
            read_field(j, "ap_restart_max_attempts", ap_restart_max_attempts, "supervision", violations);
            read_field(j, "ap_stable_after_ms", ap_stable_after_ms, "supervision", violations);
        }

        nlohmann::json SupervisionConfig::to_json() const
        {
            return nlohmann::json{
                {"tick_interval_ms", tick_interval_ms},
                {"signal_sample_interval_ms", signal_sample_interval_ms},
                {"mode_transition_max_attempts", mode_transition_max_attempts},
                {"ap_start_max_attempts", ap_start_max_attempts},
                {"ap_restart_base_delay_ms", ap_restart_base_delay_ms},
                {"ap_restart_max_delay_ms", ap_restart_max_delay_ms},
                {"ap_restart_max_attempts", ap_restart_max_attempts},
                {"ap_stable_after_ms", ap_stable_after_ms}};
        }

        // BridgeConfig implementation
        void BridgeConfig::from_json(const nlohmann::json &j, std::vector<std::string> &violations)
        {
            if (!is_object_section(j, "bridge", violations))
                return;
            check_keys(j, {"name", "ip_forward_path"}, "bridge", violations);
            read_field(j, "name", name, "bridge", violations);
            read_field(j, "ip_forward_path", ip_forward_path, "bridge", violations);
        }

        nlohmann::json BridgeConfig::to_json() const
        {
            return nlohmann::json{
                {"name", name},
                {"ip_forward_path", ip_forward_path}};
        }

        // PathsConfig implementation
        void PathsConfig::from_json(const nlohmann::json &j, std::vector<std::string> &violations)
        {
            if (!is_object_section(j, "paths", violations))
                return;
            check_keys(j, {"runtime_dir", "sysfs_net_dir", "state_db"}, "paths", violations);
            read_field(j, "runtime_dir", runtime_dir, "paths", violations);
            read_field(j, "sysfs_net_dir", sysfs_net_dir, "paths", violations);
            read_field(j, "state_db", state_db, "paths", violations);
        }

        nlohmann::json PathsConfig::to_json() const
        {
            return nlohmann::json{
                {"runtime_dir", runtime_dir},
                {"sysfs_net_dir", sysfs_net_dir},
                {"state_db", state_db}};
        }

        // ApiConfig implementation
        void ApiConfig::from_json(const nlohmann::json &j, std::vector<std::string> &violations)
        {
            if (!is_object_section(j, "api", violations))
                return;
            check_keys(j, {"enabled", "host", "port", "token"}, "api", violations);
            read_field(j, "enabled", enabled, "api", violations);
            read_field(j, "host", host, "api", violations);
            read_field(j, "port", port, "api", violations);
            read_field(j, "token", token, "api", violations);
        }

        nlohmann::json ApiConfig::to_json() const
        {
            nlohmann::json j{
                {"enabled", enabled},
                {"host", host},
                {"port", port}};
            if (!token.empty())
            {
                j["token"] = token;
            }
            return j;
        }

        // LoggingConfig implementation
        void LoggingConfig::from_json(const nlohmann::json &j, std::vector<std::string> &violations)
        {
            if (!is_object_section(j, "logging", violations))
                return;
            check_keys(j, {"status_interval", "log_level", "log_file", "format"}, "logging", violations);
            read_field(j, "status_interval", status_interval, "logging", violations);
            read_field(j, "log_level", log_level, "logging", violations);
            read_field(j, "log_file", log_file, "logging", violations);
            read_field(j, "format", format, "logging", violations);
        }

        nlohmann::json LoggingConfig::to_json() const
        {
            nlohmann::json j{
                {"status_interval", status_interval},
                {"log_level", log_level},
                {"format", format}};
            if (!log_file.empty())
            {
                j["log_file"] = log_file;
            }
            return j;
        }

        // ExtenderConfig implementation
        std::unique_ptr<ExtenderConfig> ExtenderConfig::from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                throw ConfigError({"configuration file not found: " + config_path});
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw ConfigError({"invalid JSON: " + std::string(e.what())});
            }

            return from_json(j);
        }

        std::unique_ptr<ExtenderConfig> ExtenderConfig::from_json(const nlohmann::json &j)
        {
            std::vector<std::string> violations;
            auto config = std::make_unique<ExtenderConfig>();

            if (!j.is_object())
            {
                throw ConfigError({"document: expected object, got " + std::string(j.type_name())});
            }

            check_keys(j, {"interface", "upstream", "ap", "reconnect", "timeouts", "supervision", "bridge",
                           "paths", "api", "logging"},
                       "", violations);

            read_field(j, "interface", config->interface_name, "document", violations);

            if (j.contains("upstream") && !j["upstream"].is_null())
            {
                UpstreamConfig upstream;
                upstream.from_json(j["upstream"], violations);
                config->upstream = upstream;
            }
            if (j.contains("ap"))
            {
                config->access_point.from_json(j["ap"], violations);
            }
            else
            {
                violations.push_back("ap: required section missing");
            }
            if (j.contains("reconnect"))
            {
                config->reconnect.from_json(j["reconnect"], violations);
            }
            if (j.contains("timeouts"))
            {
                config->timeouts.from_json(j["timeouts"], violations);
            }
            if (j.contains("supervision"))
            {
                config->supervision.from_json(j["supervision"], violations);
            }
            if (j.contains("bridge"))
            {
                config->bridge.from_json(j["bridge"], violations);
            }
            if (j.contains("paths"))
            {
                config->paths.from_json(j["paths"], violations);
            }
            if (j.contains("api"))
            {
                config->api.from_json(j["api"], violations);
            }
            if (j.contains("logging"))
            {
                config->logging.from_json(j["logging"], violations);
            }

            // Semantic checks only make sense once the structure is sound
            if (violations.empty())
            {
                violations = config->validate();
            }

            if (!violations.empty())
            {
                throw ConfigError(violations);
            }

            return config;
        }

        std::unique_ptr<ExtenderConfig> ExtenderConfig::create_default()
        {
            return std::make_unique<ExtenderConfig>();
        }

        nlohmann::json ExtenderConfig::to_json() const
        {
            nlohmann::json j{
                {"ap", access_point.to_json()},
                {"reconnect", reconnect.to_json()},
                {"timeouts", timeouts.to_json()},
                {"supervision", supervision.to_json()},
                {"bridge", bridge.to_json()},
                {"paths", paths.to_json()},
                {"api", api.to_json()},
                {"logging", logging.to_json()}};
            if (!interface_name.empty())
            {
                j["interface"] = interface_name;
            }
            if (upstream)
            {
                j["upstream"] = upstream->to_json();
            }
            return j;
        }

        void ExtenderConfig::save_to_file(const std::string &config_path) const
        {
            std::ofstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open configuration file for writing: " + config_path);
            }

            file << to_json().dump(4);
        }

        std::vector<std::string> ExtenderConfig::validate() const
        {
            std::vector<std::string> violations;

            if (interface_name.size() > 15)
            {
                violations.push_back("interface: name longer than 15 characters");
            }

            if (upstream)
            {
                check_security(upstream->security, "upstream.security", violations);
                if (upstream->channel != 0 && !valid_channel(upstream->channel))
                {
                    violations.push_back("upstream.channel: not a valid WiFi channel");
                }
                for (const auto &violation : validate_upstream_profile(upstream->to_profile()))
                {
                    violations.push_back("upstream." + violation);
                }
            }

            check_security(access_point.security, "ap.security", violations);
            for (const auto &violation : validate_ap_profile(access_point.to_profile()))
            {
                violations.push_back("ap." + violation);
            }

            check_positive(reconnect.base_delay_ms, "reconnect.base_delay_ms", violations);
            if (reconnect.max_delay_ms < reconnect.base_delay_ms)
            {
                violations.push_back("reconnect.max_delay_ms: must be >= base_delay_ms");
            }
            if (reconnect.max_attempts < 1)
            {
                violations.push_back("reconnect.max_attempts: must be at least 1");
            }

            check_positive(timeouts.command_ms, "timeouts.command_ms", violations);
            check_positive(timeouts.mode_verify_ms, "timeouts.mode_verify_ms", violations);
            check_positive(timeouts.association_ms, "timeouts.association_ms", violations);
            check_positive(timeouts.dhcp_client_ms, "timeouts.dhcp_client_ms", violations);
            check_positive(timeouts.hostapd_ready_ms, "timeouts.hostapd_ready_ms", violations);
            check_positive(timeouts.dhcp_ready_ms, "timeouts.dhcp_ready_ms", violations);
            check_positive(timeouts.lease_wait_ms, "timeouts.lease_wait_ms", violations);
            check_positive(timeouts.process_stop_ms, "timeouts.process_stop_ms", violations);
            check_positive(timeouts.scan_ms, "timeouts.scan_ms", violations);

            check_positive(supervision.tick_interval_ms, "supervision.tick_interval_ms", violations);
            check_positive(supervision.signal_sample_interval_ms, "supervision.signal_sample_interval_ms", violations);
            if (supervision.mode_transition_max_attempts < 1)
            {
                violations.push_back("supervision.mode_transition_max_attempts: must be at least 1");
            }
            if (supervision.ap_start_max_attempts < 1)
            {
                violations.push_back("supervision.ap_start_max_attempts: must be at least 1");
            }
            check_positive(supervision.ap_restart_base_delay_ms, "supervision.ap_restart_base_delay_ms", violations);
            if (supervision.ap_restart_max_delay_ms < supervision.ap_restart_base_delay_ms)
            {
                violations.push_back("supervision.ap_restart_max_delay_ms: must be >= ap_restart_base_delay_ms");
            }
            if (supervision.ap_restart_max_attempts < 1)
            {
                violations.push_back("supervision.ap_restart_max_attempts: must be at least 1");
            }
            check_positive(supervision.ap_stable_after_ms, "supervision.ap_stable_after_ms", violations);

            if (bridge.name.empty() || bridge.name.size() > 15 ||
                bridge.name.find_first_of("/ \t") != std::string::npos)
            {
                violations.push_back("bridge.name: must be a valid interface name");
            }
            if (bridge.ip_forward_path.empty())
            {
                violations.push_back("bridge.ip_forward_path: must not be empty");
            }

            if (paths.runtime_dir.empty())
            {
                violations.push_back("paths.runtime_dir: must not be empty");
            }
            if (paths.sysfs_net_dir.empty())
            {
                violations.push_back("paths.sysfs_net_dir: must not be empty");
            }

            if (api.port < 1 || api.port > 65535)
            {
                violations.push_back("api.port: must be between 1 and 65535");
            }
            if (api.enabled && api.host.empty())
            {
                violations.push_back("api.host: must not be empty");
            }

            if (!LoggerManager::is_valid_level(logging.log_level))
            {
                violations.push_back("logging.log_level: unrecognized level '" + logging.log_level + "'");
            }
            if (logging.format != "text" && logging.format != "json")
            {
                violations.push_back("logging.format: must be text or json");
            }
            if (logging.status_interval < 0)
            {
                violations.push_back("logging.status_interval: must not be negative");
            }

            return violations;
        }

        std::vector<std::string> validate_upstream_profile(const UpstreamProfile &profile)
        {
            std::vector<std::string> violations;
            check_ssid(profile.ssid, "ssid", violations);
            if (profile.security == SecurityType::WEP)
            {
                violations.push_back("security: WEP is not supported");
            }
            check_passphrase(profile.security, profile.passphrase, "password", violations);
            if (profile.channel && !valid_channel(*profile.channel))
            {
                violations.push_back("channel: not a valid WiFi channel");
            }
            return violations;
        }

        std::vector<std::string> validate_ap_profile(const APProfile &profile)
        {
            std::vector<std::string> violations;
            check_ssid(profile.ssid, "ssid", violations);
            if (profile.security == SecurityType::WEP)
            {
                violations.push_back("security: WEP is not supported");
            }
            check_passphrase(profile.security, profile.passphrase, "password", violations);

            if (!valid_channel(profile.channel))
            {
                violations.push_back("channel: not a valid WiFi channel");
            }
            if (profile.hw_mode != "a" && profile.hw_mode != "b" && profile.hw_mode != "g")
            {
                violations.push_back("hw_mode: must be a, b or g");
            }
            else if ((profile.channel > 14) != (profile.hw_mode == "a"))
            {
                violations.push_back("hw_mode: '" + profile.hw_mode + "' does not match channel " +
                                     std::to_string(profile.channel));
            }

            if (profile.prefix_length < 8 || profile.prefix_length > 30)
            {
                violations.push_back("prefix_length: must be between 8 and 30");
                return violations;
            }

            auto gateway = parse_ipv4(profile.gateway);
            auto start = parse_ipv4(profile.dhcp_range_start);
            auto end = parse_ipv4(profile.dhcp_range_end);
            if (!gateway)
                violations.push_back("gateway: not a valid IPv4 address");
            if (!start)
                violations.push_back("dhcp_range_start: not a valid IPv4 address");
            if (!end)
                violations.push_back("dhcp_range_end: not a valid IPv4 address");

            if (gateway && start && end)
            {
                uint32_t mask = profile.prefix_length == 0 ? 0 : (0xFFFFFFFFu << (32 - profile.prefix_length));
                uint32_t network = *gateway & mask;
                if ((*start & mask) != network || (*end & mask) != network)
                {
                    violations.push_back("dhcp range: must lie inside the gateway subnet");
                }
                if (*start > *end)
                {
                    violations.push_back("dhcp range: start must not be after end");
                }
                if (*gateway >= *start && *gateway <= *end)
                {
                    violations.push_back("dhcp range: must not contain the gateway address");
                }
                uint32_t host = *gateway & ~mask;
                if (host == 0 || host == ~mask)
                {
                    violations.push_back("gateway: must be a host address");
                }
            }

            if (!parse_lease_duration(profile.lease_time))
            {
                violations.push_back("lease_time: expected seconds, <n>m, <n>h, <n>d or infinite");
            }

            return violations;
        }

        std::optional<std::chrono::seconds> parse_lease_duration(const std::string &value)
        {
            if (value == "infinite")
            {
                return std::chrono::seconds::max();
            }
            if (value.empty())
            {
                return std::nullopt;
            }

            size_t digits = 0;
            while (digits < value.size() && std::isdigit(static_cast<unsigned char>(value[digits])))
            {
                ++digits;
            }
            if (digits == 0 || digits > 9 || value.size() - digits > 1)
            {
                return std::nullopt;
            }

            long amount = std::stol(value.substr(0, digits));
            char unit = digits < value.size() ? value[digits] : 's';
            switch (unit)
            {
            case 's':
                break;
            case 'm':
                amount *= 60;
                break;
            case 'h':
                amount *= 3600;
                break;
            case 'd':
                amount *= 86400;
                break;
            default:
                return std::nullopt;
            }

            // dnsmasq refuses leases shorter than two minutes
            if (amount < 120)
            {
                return std::nullopt;
            }
            return std::chrono::seconds(amount);
        }

        std::optional<uint32_t> parse_ipv4(const std::string &address)
        {
            in_addr parsed{};
            if (inet_pton(AF_INET, address.c_str(), &parsed) != 1)
            {
                return std::nullopt;
            }
            return ntohl(parsed.s_addr);
        }

        std::string format_ipv4(uint32_t address)
        {
            in_addr raw{};
            raw.s_addr = htonl(address);
            char buffer[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &raw, buffer, sizeof(buffer));
            return buffer;
        }

        std::string prefix_to_netmask(int prefix_length)
        {
            if (prefix_length <= 0)
            {
                return "0.0.0.0";
            }
            if (prefix_length >= 32)
            {
                return "255.255.255.255";
            }
            return format_ipv4(0xFFFFFFFFu << (32 - prefix_length));
        }

    } // namespace core
} // namespace extender
