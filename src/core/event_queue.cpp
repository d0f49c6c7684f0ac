#include "core/event_queue.hpp"

namespace extender
{
    namespace core
    {

        EventQueue::EventQueue(size_t max_size)
            : max_size_(max_size)
        {
        }

        bool EventQueue::enqueue(ExtenderEvent event)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (stopped_)
            {
                return false;
            }

            if (max_size_ > 0 && queue_.size() >= max_size_)
            {
                total_dropped_++;
                return false;
            }

            queue_.push(std::move(event));
            total_enqueued_++;

            cv_.notify_one();
            return true;
        }

        std::optional<ExtenderEvent> EventQueue::dequeue_for(std::chrono::milliseconds timeout)
        {
            std::unique_lock<std::mutex> lock(mutex_);

            cv_.wait_for(lock, timeout, [this]
                         { return !queue_.empty() || stopped_; });

            if (queue_.empty())
            {
                return std::nullopt;
            }

            ExtenderEvent event = std::move(queue_.front());
            queue_.pop();
            total_dequeued_++;
            return event;
        }

        std::optional<ExtenderEvent> EventQueue::try_dequeue()
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (queue_.empty())
            {
                return std::nullopt;
            }

            ExtenderEvent event = std::move(queue_.front());
            queue_.pop();
            total_dequeued_++;
            return event;
        }

        void EventQueue::stop()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stopped_ = true;
            }
            cv_.notify_all();
        }

        void EventQueue::restart()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = false;
        }

    } // namespace core
} // namespace extender
