#ifndef EXTENDER_CORE_EVENT_QUEUE_HPP
#define EXTENDER_CORE_EVENT_QUEUE_HPP

#include "core/extender_event.hpp"
#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <atomic>
#include <chrono>

namespace extender
{
    namespace core
    {

        class EventQueue
        {
        public:
            // max_size 0 means unbounded
            explicit EventQueue(size_t max_size = 0);
            ~EventQueue() = default;

            EventQueue(const EventQueue &) = delete;
            EventQueue &operator=(const EventQueue &) = delete;

            bool enqueue(ExtenderEvent event);
            std::optional<ExtenderEvent> dequeue_for(std::chrono::milliseconds timeout);
            std::optional<ExtenderEvent> try_dequeue();
            void stop();
            void restart();

            bool is_stopped() const { return stopped_; }

            size_t total_enqueued() const { return total_enqueued_; }
            size_t total_dequeued() const { return total_dequeued_; }
            size_t total_dropped() const { return total_dropped_; }

        private:
            std::queue<ExtenderEvent> queue_;
            mutable std::mutex mutex_;
            std::condition_variable cv_;
            size_t max_size_;
            std::atomic<bool> stopped_{false};

            // Statistics
            std::atomic<size_t> total_enqueued_{0};
            std::atomic<size_t> total_dequeued_{0};
            std::atomic<size_t> total_dropped_{0};
        };

    } // namespace core
} // namespace extender

#endif // EXTENDER_CORE_EVENT_QUEUE_HPP
