#ifndef EXTENDER_INFRASTRUCTURE_RECONNECT_POLICY_HPP
#define EXTENDER_INFRASTRUCTURE_RECONNECT_POLICY_HPP

#include <chrono>

namespace extender
{
    namespace infrastructure
    {

        /**
         * Exponential backoff for upstream reconnection.
         * Attempts are numbered from 1; attempt n waits base * 2^(n-1), capped.
         */
        class ReconnectPolicy
        {
        public:
            ReconnectPolicy(std::chrono::milliseconds base_delay,
                            std::chrono::milliseconds max_delay,
                            int max_attempts);

            std::chrono::milliseconds delay_for(int attempt) const;
            bool exhausted(int attempt) const { return attempt > max_attempts_; }

            int max_attempts() const { return max_attempts_; }
            std::chrono::milliseconds base_delay() const { return base_delay_; }
            std::chrono::milliseconds max_delay() const { return max_delay_; }

        private:
            std::chrono::milliseconds base_delay_;
            std::chrono::milliseconds max_delay_;
            int max_attempts_;
        };

    } // namespace infrastructure
} // namespace extender

#endif // EXTENDER_INFRASTRUCTURE_RECONNECT_POLICY_HPP
