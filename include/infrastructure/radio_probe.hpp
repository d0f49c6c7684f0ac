#ifndef EXTENDER_INFRASTRUCTURE_RADIO_PROBE_HPP
#define EXTENDER_INFRASTRUCTURE_RADIO_PROBE_HPP

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <optional>
#include <chrono>
#include <filesystem>
#include "core/types.hpp"

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

        /**
         * Radio Capability Probe
         * Reads sysfs and `iw` to describe a wireless interface. Never changes
         * anything on the system.
         */
        class RadioCapabilityProbe
        {
        public:
            struct PhyCapabilities
            {
                std::set<core::InterfaceMode> modes;
                bool concurrent = false;
            };

            RadioCapabilityProbe(std::shared_ptr<CommandRunner> runner,
                                 const std::string &sysfs_net_dir,
                                 std::chrono::milliseconds command_timeout);

            // Throws core::ExtenderError (NO_SUCH_INTERFACE or UNSUPPORTED_HARDWARE)
            core::RadioIdentity probe(const std::string &interface_name) const;

            // Live read path used to verify mode transitions. nullopt when the
            // interface is absent or reports a type we do not manage.
            std::optional<core::InterfaceMode> current_mode(const std::string &interface_name) const;
            bool interface_exists(const std::string &interface_name) const;

            // Wireless interfaces supporting both station and AP, sorted by name
            std::vector<std::string> find_suitable_interfaces() const;

            // Parsers for `iw phy <phy> info` and `iw dev <if> info`
            static PhyCapabilities parse_phy_info(const std::string &output);
            static std::optional<core::InterfaceMode> parse_interface_type(const std::string &output);

        private:
            std::string read_attribute(const std::filesystem::path &path) const;

            std::shared_ptr<CommandRunner> runner_;
            std::filesystem::path sysfs_net_dir_;
            std::chrono::milliseconds command_timeout_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace extender

#endif // EXTENDER_INFRASTRUCTURE_RADIO_PROBE_HPP
