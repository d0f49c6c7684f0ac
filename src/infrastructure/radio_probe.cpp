#include "infrastructure/radio_probe.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <fstream>
#include <sstream>
#include <regex>
#include <algorithm>

namespace extender
{
    namespace infrastructure
    {

        namespace
        {
            std::string trim(const std::string &value)
            {
                auto begin = value.find_first_not_of(" \t\r\n");
                if (begin == std::string::npos)
                {
                    return "";
                }
                auto end = value.find_last_not_of(" \t\r\n");
                return value.substr(begin, end - begin + 1);
            }

            struct ComboGroup
            {
                std::set<std::string> types;
                int limit = 0;
            };

            bool combination_is_concurrent(const std::string &combination)
            {
                static const std::regex group_regex(R"(#\{([^}]*)\}\s*<=\s*(\d+))");
                static const std::regex total_regex(R"(total\s*<=\s*(\d+))");

                std::vector<ComboGroup> groups;
                for (auto it = std::sregex_iterator(combination.begin(), combination.end(), group_regex);
                     it != std::sregex_iterator(); ++it)
                {
                    ComboGroup group;
                    std::stringstream types((*it)[1].str());
                    std::string type;
                    while (std::getline(types, type, ','))
                    {
                        group.types.insert(trim(type));
                    }
                    group.limit = std::stoi((*it)[2].str());
                    groups.push_back(group);
                }

                std::smatch total_match;
                if (!std::regex_search(combination, total_match, total_regex) ||
                    std::stoi(total_match[1].str()) < 2)
                {
                    return false;
                }

                for (size_t i = 0; i < groups.size(); ++i)
                {
                    for (size_t k = 0; k < groups.size(); ++k)
                    {
                        if (groups[i].types.count("managed") == 0 || groups[k].types.count("AP") == 0)
                        {
                            continue;
                        }
                        if (i != k && groups[i].limit >= 1 && groups[k].limit >= 1)
                        {
                            return true;
                        }
                        if (i == k && groups[i].limit >= 2)
                        {
                            return true;
                        }
                    }
                }
                return false;
            }
        }

        RadioCapabilityProbe::RadioCapabilityProbe(std::shared_ptr<CommandRunner> runner,
                                                   const std::string &sysfs_net_dir,
                                                   std::chrono::milliseconds command_timeout)
            : runner_(std::move(runner)),
              sysfs_net_dir_(sysfs_net_dir),
              command_timeout_(command_timeout),
              logger_(core::get_logger("RadioProbe"))
        {
        }

        core::RadioIdentity RadioCapabilityProbe::probe(const std::string &interface_name) const
        {
            auto if_dir = sysfs_net_dir_ / interface_name;
            std::error_code ec;
            if (interface_name.empty() || !std::filesystem::exists(if_dir, ec))
            {
                throw core::ExtenderError(core::ReasonCode::NO_SUCH_INTERFACE,
                                          "No such interface: " + interface_name);
            }

            if (!std::filesystem::exists(if_dir / "phy80211", ec))
            {
                throw core::ExtenderError(core::ReasonCode::UNSUPPORTED_HARDWARE,
                                          interface_name + " is not a wireless interface");
            }

            core::RadioIdentity identity;
            identity.interface_name = interface_name;
            identity.mac_address = read_attribute(if_dir / "address");

            auto driver_link = if_dir / "device" / "driver";
            if (std::filesystem::is_symlink(driver_link, ec))
            {
                identity.driver = std::filesystem::read_symlink(driver_link, ec).filename().string();
            }
            if (identity.driver.empty())
            {
                identity.driver = "unknown";
            }

            identity.phy = read_attribute(if_dir / "phy80211" / "name");
            if (identity.phy.empty() && std::filesystem::is_symlink(if_dir / "phy80211", ec))
            {
                identity.phy = std::filesystem::read_symlink(if_dir / "phy80211", ec).filename().string();
            }
            if (identity.phy.empty())
            {
                throw core::ExtenderError(core::ReasonCode::UNSUPPORTED_HARDWARE,
                                          "Cannot determine phy for " + interface_name);
            }

            auto result = runner_->run({"iw", "phy", identity.phy, "info"}, command_timeout_);
            if (!result.ok())
            {
                throw core::ExtenderError(core::ReasonCode::UNSUPPORTED_HARDWARE,
                                          "iw phy " + identity.phy + " info failed: " + trim(result.output));
            }

            auto capabilities = parse_phy_info(result.output);
            identity.supported_modes = capabilities.modes;
            identity.supports_concurrent = capabilities.concurrent;

            if (!identity.supports(core::InterfaceMode::STATION) ||
                !identity.supports(core::InterfaceMode::ACCESS_POINT))
            {
                throw core::ExtenderError(core::ReasonCode::UNSUPPORTED_HARDWARE,
                                          interface_name + " lacks station or access point support");
            }

            logger_->info("Radio probed",
                          core::LogContext()
                              .add("interface", interface_name)
                              .add("mac", identity.mac_address)
                              .add("driver", identity.driver)
                              .add("phy", identity.phy)
                              .add("concurrent", identity.supports_concurrent));
            return identity;
        }

        std::optional<core::InterfaceMode> RadioCapabilityProbe::current_mode(const std::string &interface_name) const
        {
            if (!interface_exists(interface_name))
            {
                return std::nullopt;
            }

            auto flags_text = read_attribute(sysfs_net_dir_ / interface_name / "flags");
            unsigned long flags = 0;
            try
            {
                flags = std::stoul(flags_text, nullptr, 16);
            }
            catch (const std::exception &)
            {
                logger_->warning("Unreadable interface flags",
                                 core::LogContext().add("interface", interface_name).add("flags", flags_text));
                return std::nullopt;
            }

            // IFF_UP
            if ((flags & 0x1) == 0)
            {
                return core::InterfaceMode::DOWN;
            }

            auto result = runner_->run({"iw", "dev", interface_name, "info"}, command_timeout_);
            if (!result.ok())
            {
                return std::nullopt;
            }
            return parse_interface_type(result.output);
        }

        bool RadioCapabilityProbe::interface_exists(const std::string &interface_name) const
        {
            std::error_code ec;
            return !interface_name.empty() && std::filesystem::exists(sysfs_net_dir_ / interface_name, ec);
        }

        std::vector<std::string> RadioCapabilityProbe::find_suitable_interfaces() const
        {
            std::vector<std::string> suitable;
            std::error_code ec;

            for (const auto &entry : std::filesystem::directory_iterator(sysfs_net_dir_, ec))
            {
                auto name = entry.path().filename().string();
                if (!std::filesystem::exists(entry.path() / "phy80211", ec))
                {
                    continue;
                }

                try
                {
                    probe(name);
                    suitable.push_back(name);
                }
                catch (const core::ExtenderError &e)
                {
                    logger_->debug("Skipping interface", core::LogContext().add("interface", name).add("reason", e.what()));
                }
            }

            std::sort(suitable.begin(), suitable.end());
            return suitable;
        }

        RadioCapabilityProbe::PhyCapabilities RadioCapabilityProbe::parse_phy_info(const std::string &output)
        {
            enum class Section
            {
                NONE,
                MODES,
                COMBINATIONS
            };

            PhyCapabilities capabilities;
            std::vector<std::string> combinations;
            Section section = Section::NONE;

            std::istringstream stream(output);
            std::string raw;
            while (std::getline(stream, raw))
            {
                auto line = trim(raw);

                if (line == "Supported interface modes:")
                {
                    section = Section::MODES;
                    continue;
                }
                if (line == "valid interface combinations:")
                {
                    section = Section::COMBINATIONS;
                    continue;
                }

                if (section == Section::MODES)
                {
                    if (line.rfind("* ", 0) != 0)
                    {
                        section = Section::NONE;
                        continue;
                    }
                    auto mode = trim(line.substr(2));
                    if (mode == "managed")
                    {
                        capabilities.modes.insert(core::InterfaceMode::STATION);
                    }
                    else if (mode == "AP")
                    {
                        capabilities.modes.insert(core::InterfaceMode::ACCESS_POINT);
                    }
                }
                else if (section == Section::COMBINATIONS)
                {
                    if (line.rfind("* ", 0) == 0)
                    {
                        combinations.push_back(line.substr(2));
                    }
                    else if (!combinations.empty() && line.find("<=") != std::string::npos)
                    {
                        // wrapped continuation of the previous combination
                        combinations.back() += " " + line;
                    }
                    else
                    {
                        section = Section::NONE;
                    }
                }
            }

            for (const auto &combination : combinations)
            {
                if (combination_is_concurrent(combination))
                {
                    capabilities.concurrent = true;
                    break;
                }
            }

            return capabilities;
        }

        std::optional<core::InterfaceMode> RadioCapabilityProbe::parse_interface_type(const std::string &output)
        {
            static const std::regex type_regex(R"(^\s*type\s+(\S+))");

            std::istringstream stream(output);
            std::string line;
            while (std::getline(stream, line))
            {
                std::smatch match;
                if (std::regex_search(line, match, type_regex))
                {
                    auto type = match[1].str();
                    if (type == "managed")
                        return core::InterfaceMode::STATION;
                    if (type == "AP")
                        return core::InterfaceMode::ACCESS_POINT;
                    return std::nullopt;
                }
            }
            return std::nullopt;
        }

        std::string RadioCapabilityProbe::read_attribute(const std::filesystem::path &path) const
        {
            std::ifstream file(path);
            if (!file.is_open())
            {
                return "";
            }
            std::string value;
            std::getline(file, value);
            return trim(value);
        }

    } // namespace infrastructure
} // namespace extender
