/**
 * Configuration Renderer Implementation
 * Generates wpa_supplicant, hostapd and dnsmasq configuration files
 */

#include "infrastructure/config_renderer.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"

#include <openssl/evp.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <iomanip>

namespace extender
{
    namespace infrastructure
    {

        std::string derive_wpa_psk(const std::string &passphrase, const std::string &ssid)
        {
            unsigned char key[32];
            if (PKCS5_PBKDF2_HMAC_SHA1(passphrase.data(), static_cast<int>(passphrase.size()),
                                       reinterpret_cast<const unsigned char *>(ssid.data()),
                                       static_cast<int>(ssid.size()),
                                       4096, sizeof(key), key) != 1)
            {
                throw core::ExtenderError(core::ReasonCode::ASSOCIATION_FAILED, "PSK derivation failed");
            }
            return hex_encode(std::string(reinterpret_cast<const char *>(key), sizeof(key)));
        }

        std::string hex_encode(const std::string &data)
        {
            std::ostringstream hex;
            hex << std::hex << std::setfill('0');
            for (unsigned char c : data)
            {
                hex << std::setw(2) << static_cast<int>(c);
            }
            return hex.str();
        }

        std::string render_wpa_supplicant_conf(const core::UpstreamProfile &profile,
                                               const std::string &ctrl_dir)
        {
            std::ostringstream conf;
            conf << "# Auto-generated by wifi_extenderd - do not edit manually\n";
            conf << "ctrl_interface=" << ctrl_dir << "\n";
            conf << "update_config=0\n\n";

            conf << "network={\n";
            // unquoted ssid= is parsed as hex
            conf << "\tssid=" << hex_encode(profile.ssid) << "\n";
            conf << "\tscan_ssid=1\n";

            switch (profile.security)
            {
            case core::SecurityType::WPA_PSK:
            case core::SecurityType::WPA2_PSK:
                conf << "\tkey_mgmt=WPA-PSK\n";
                conf << "\tproto=" << (profile.security == core::SecurityType::WPA2_PSK ? "RSN" : "WPA") << "\n";
                conf << "\tpsk=" << derive_wpa_psk(profile.passphrase, profile.ssid) << "\n";
                break;
            case core::SecurityType::OPEN:
            case core::SecurityType::WEP:
                conf << "\tkey_mgmt=NONE\n";
                break;
            }

            if (profile.channel)
            {
                int frequency = core::frequency_from_channel(*profile.channel);
                if (frequency > 0)
                {
                    conf << "\tscan_freq=" << frequency << "\n";
                }
            }
            conf << "}\n";
            return conf.str();
        }

        std::string render_hostapd_conf(const core::APProfile &profile,
                                        const std::string &interface_name,
                                        const std::string &ctrl_dir)
        {
            std::ostringstream conf;
            conf << "# Auto-generated by wifi_extenderd - do not edit manually\n";
            conf << "interface=" << interface_name << "\n";
            conf << "driver=nl80211\n";
            conf << "ctrl_interface=" << ctrl_dir << "\n";
            conf << "ssid=" << profile.ssid << "\n";
            conf << "hw_mode=" << profile.hw_mode << "\n";
            conf << "channel=" << profile.channel << "\n";
            conf << "wmm_enabled=1\n";
            conf << "auth_algs=1\n";
            conf << "ignore_broadcast_ssid=0\n";

            if (profile.security == core::SecurityType::WPA_PSK || profile.security == core::SecurityType::WPA2_PSK)
            {
                bool wpa2 = profile.security == core::SecurityType::WPA2_PSK;
                conf << "wpa=" << (wpa2 ? 2 : 1) << "\n";
                conf << "wpa_key_mgmt=WPA-PSK\n";
                if (wpa2)
                {
                    conf << "rsn_pairwise=CCMP\n";
                }
                else
                {
                    conf << "wpa_pairwise=TKIP CCMP\n";
                }
                conf << "wpa_passphrase=" << profile.passphrase << "\n";
            }
            return conf.str();
        }

        std::string render_dnsmasq_conf(const core::APProfile &profile,
                                        const std::string &interface_name,
                                        const std::string &bridge_name,
                                        const std::string &lease_file)
        {
            std::ostringstream conf;
            conf << "# Auto-generated by wifi_extenderd - do not edit manually\n";
            conf << "interface=" << interface_name << "\n";
            if (!bridge_name.empty())
            {
                conf << "interface=" << bridge_name << "\n";
            }
            conf << "bind-dynamic\n";
            conf << "except-interface=lo\n";
            conf << "dhcp-range=" << profile.dhcp_range_start << "," << profile.dhcp_range_end << ","
                 << core::prefix_to_netmask(profile.prefix_length) << "," << profile.lease_time << "\n";
            conf << "dhcp-option=option:router," << profile.gateway << "\n";
            conf << "dhcp-option=option:dns-server," << profile.gateway << "\n";
            conf << "server=8.8.8.8\n";
            conf << "domain-needed\n";
            conf << "bogus-priv\n";
            conf << "dhcp-authoritative\n";
            conf << "dhcp-leasefile=" << lease_file << "\n";
            return conf.str();
        }

        bool write_private_file(const std::filesystem::path &path, const std::string &content, std::string &error)
        {
            std::error_code ec;
            if (path.has_parent_path())
            {
                std::filesystem::create_directories(path.parent_path(), ec);
                if (ec)
                {
                    error = "cannot create " + path.parent_path().string() + ": " + ec.message();
                    return false;
                }
            }

            int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
            if (fd < 0)
            {
                error = "cannot open " + path.string() + ": " + std::strerror(errno);
                return false;
            }

            // Tighten permissions of a file that pre-existed with a looser mode
            if (fchmod(fd, 0600) != 0)
            {
                error = "cannot chmod " + path.string() + ": " + std::strerror(errno);
                close(fd);
                return false;
            }

            size_t written = 0;
            while (written < content.size())
            {
                ssize_t n = write(fd, content.data() + written, content.size() - written);
                if (n < 0)
                {
                    if (errno == EINTR)
                        continue;
                    error = "cannot write " + path.string() + ": " + std::strerror(errno);
                    close(fd);
                    return false;
                }
                written += static_cast<size_t>(n);
            }

            if (close(fd) != 0)
            {
                error = "cannot close " + path.string() + ": " + std::strerror(errno);
                return false;
            }
            return true;
        }

    } // namespace infrastructure
} // namespace extender
