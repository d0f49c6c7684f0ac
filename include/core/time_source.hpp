#ifndef EXTENDER_CORE_TIME_SOURCE_HPP
#define EXTENDER_CORE_TIME_SOURCE_HPP

#include <chrono>

namespace extender
{
    namespace core
    {

        /**
         * Monotonic clock seam. Backoff deadlines and lease bookkeeping read
         * time through this so they can be driven deterministically.
         */
        class TimeSource
        {
        public:
            virtual ~TimeSource() = default;
            virtual std::chrono::steady_clock::time_point now() const = 0;
        };

        class SteadyTimeSource : public TimeSource
        {
        public:
            std::chrono::steady_clock::time_point now() const override
            {
                return std::chrono::steady_clock::now();
            }
        };

    } // namespace core
} // namespace extender

#endif // EXTENDER_CORE_TIME_SOURCE_HPP
