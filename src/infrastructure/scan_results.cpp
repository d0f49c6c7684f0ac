#include "infrastructure/scan_results.hpp"

#include <regex>
#include <cctype>

namespace extender
{
    namespace infrastructure
    {

        namespace
        {
            const std::regex kBssRegex(R"(^BSS\s+([0-9a-fA-F:]{17}))");
            const std::regex kFreqRegex(R"(^\s*freq:\s*([0-9.]+))");
            const std::regex kSignalRegex(R"(^\s*signal:\s*(-?[0-9.]+)\s*dBm)");
            const std::regex kSsidRegex(R"(^\s*SSID:\s?(.*)$)");
            const std::regex kCapabilityRegex(R"(^\s*capability:.*\bPrivacy\b)");
        }

        ScanSequence::ScanSequence(std::string output)
            : stream_(std::move(output))
        {
        }

        std::optional<core::DiscoveredNetwork> ScanSequence::next()
        {
            if (finished_)
            {
                return std::nullopt;
            }

            core::DiscoveredNetwork network;
            std::string line;

            // Find the start of the next BSS block
            if (pending_header_)
            {
                start_block(*pending_header_, network);
                pending_header_.reset();
            }
            else
            {
                bool found = false;
                while (std::getline(stream_, line))
                {
                    if (start_block(line, network))
                    {
                        found = true;
                        break;
                    }
                }
                if (!found)
                {
                    finished_ = true;
                    return std::nullopt;
                }
            }

            bool privacy = false;
            bool rsn = false;
            bool wpa = false;

            while (std::getline(stream_, line))
            {
                if (std::regex_search(line, kBssRegex))
                {
                    pending_header_ = line;
                    break;
                }
                apply_line(line, network, privacy, rsn, wpa);
            }
            if (!pending_header_)
            {
                finished_ = true;
            }

            if (rsn)
                network.security = core::SecurityType::WPA2_PSK;
            else if (wpa)
                network.security = core::SecurityType::WPA_PSK;
            else if (privacy)
                network.security = core::SecurityType::WEP;
            else
                network.security = core::SecurityType::OPEN;

            network.channel = core::channel_from_frequency(network.frequency_mhz);
            return network;
        }

        std::vector<core::DiscoveredNetwork> ScanSequence::collect()
        {
            std::vector<core::DiscoveredNetwork> networks;
            while (auto network = next())
            {
                networks.push_back(*network);
            }
            return networks;
        }

        bool ScanSequence::start_block(const std::string &line, core::DiscoveredNetwork &network)
        {
            std::smatch match;
            if (!std::regex_search(line, match, kBssRegex))
            {
                return false;
            }
            network.bssid = match[1].str();
            for (auto &c : network.bssid)
            {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            network.associated = line.find("-- associated") != std::string::npos;
            return true;
        }

        void ScanSequence::apply_line(const std::string &line, core::DiscoveredNetwork &network,
                                      bool &privacy, bool &rsn, bool &wpa)
        {
            std::smatch match;
            if (std::regex_search(line, match, kFreqRegex))
            {
                network.frequency_mhz = static_cast<int>(std::stod(match[1].str()));
            }
            else if (std::regex_search(line, match, kSignalRegex))
            {
                network.signal_dbm = std::stod(match[1].str());
            }
            else if (std::regex_search(line, match, kSsidRegex))
            {
                network.ssid = match[1].str();
            }
            else if (std::regex_search(line, kCapabilityRegex))
            {
                privacy = true;
            }
            else if (line.find("\tRSN:") != std::string::npos || line.rfind("RSN:", 0) == 0)
            {
                rsn = true;
            }
            else if (line.find("\tWPA:") != std::string::npos || line.rfind("WPA:", 0) == 0)
            {
                wpa = true;
            }
        }

    } // namespace infrastructure
} // namespace extender
