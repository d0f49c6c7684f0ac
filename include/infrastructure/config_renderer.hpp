#ifndef EXTENDER_INFRASTRUCTURE_CONFIG_RENDERER_HPP
#define EXTENDER_INFRASTRUCTURE_CONFIG_RENDERER_HPP

#include <string>
#include <filesystem>
#include "core/types.hpp"

namespace extender
{
    namespace infrastructure
    {

        /**
         * WPA pre-shared key: PBKDF2-HMAC-SHA1(passphrase, ssid, 4096 rounds, 256 bits),
         * hex encoded.
         * Throws core::ExtenderError if the key cannot be derived.
         */
        std::string derive_wpa_psk(const std::string &passphrase, const std::string &ssid);

        std::string hex_encode(const std::string &data);

        std::string render_wpa_supplicant_conf(const core::UpstreamProfile &profile,
                                               const std::string &ctrl_dir);

        std::string render_hostapd_conf(const core::APProfile &profile,
                                        const std::string &interface_name,
                                        const std::string &ctrl_dir);

        // Serves both the AP interface and the bridge it is later enslaved to
        std::string render_dnsmasq_conf(const core::APProfile &profile,
                                        const std::string &interface_name,
                                        const std::string &bridge_name,
                                        const std::string &lease_file);

        // Writes with mode 0600, creating parent directories. Returns false and fills error on failure.
        bool write_private_file(const std::filesystem::path &path, const std::string &content, std::string &error);

    } // namespace infrastructure
} // namespace extender

#endif // EXTENDER_INFRASTRUCTURE_CONFIG_RENDERER_HPP
