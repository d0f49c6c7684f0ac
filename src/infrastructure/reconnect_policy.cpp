#include "infrastructure/reconnect_policy.hpp"

#include <algorithm>

namespace extender
{
    namespace infrastructure
    {

        ReconnectPolicy::ReconnectPolicy(std::chrono::milliseconds base_delay,
                                         std::chrono::milliseconds max_delay,
                                         int max_attempts)
            : base_delay_(base_delay),
              max_delay_(std::max(max_delay, base_delay)),
              max_attempts_(max_attempts)
        {
        }

        std::chrono::milliseconds ReconnectPolicy::delay_for(int attempt) const
        {
            if (attempt <= 1)
            {
                return base_delay_;
            }

            auto delay = base_delay_;
            for (int i = 1; i < attempt; ++i)
            {
                // stop doubling once capped so large attempt numbers cannot overflow
                if (delay >= max_delay_ / 2)
                {
                    return max_delay_;
                }
                delay *= 2;
            }
            return std::min(delay, max_delay_);
        }

    } // namespace infrastructure
} // namespace extender
