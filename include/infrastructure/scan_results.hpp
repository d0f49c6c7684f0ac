#ifndef EXTENDER_INFRASTRUCTURE_SCAN_RESULTS_HPP
#define EXTENDER_INFRASTRUCTURE_SCAN_RESULTS_HPP

#include <string>
#include <vector>
#include <sstream>
#include <optional>
#include "core/types.hpp"

namespace extender
{
    namespace infrastructure
    {

        /**
         * Single-pass sequence over `iw dev <if> scan` output. Networks are
         * parsed on demand as next() is called; the sequence cannot be
         * rewound or copied.
         */
        class ScanSequence
        {
        public:
            explicit ScanSequence(std::string output);

            ScanSequence(const ScanSequence &) = delete;
            ScanSequence &operator=(const ScanSequence &) = delete;
            ScanSequence(ScanSequence &&) = default;
            ScanSequence &operator=(ScanSequence &&) = default;

            std::optional<core::DiscoveredNetwork> next();

            // Drains what is left of the sequence
            std::vector<core::DiscoveredNetwork> collect();

        private:
            bool start_block(const std::string &line, core::DiscoveredNetwork &network);
            void apply_line(const std::string &line, core::DiscoveredNetwork &network,
                            bool &privacy, bool &rsn, bool &wpa);

            std::istringstream stream_;
            std::optional<std::string> pending_header_;
            bool finished_ = false;
        };

    } // namespace infrastructure
} // namespace extender

#endif // EXTENDER_INFRASTRUCTURE_SCAN_RESULTS_HPP
