#ifndef EXTENDER_SERVICES_STATUS_EVENT_SERVICE_HPP
#define EXTENDER_SERVICES_STATUS_EVENT_SERVICE_HPP

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <deque>
#include <thread>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <nlohmann/json.hpp>
#include "core/errors.hpp"
#include "database/models.hpp"

namespace extender
{
    namespace core
    {
        class Logger;
    }

    namespace services
    {
        enum class StatusEventType
        {
            GOAL_CHANGED,
            OVERALL_STATE_CHANGED,
            MODE_CHANGED,
            CONNECTION_STATE_CHANGED,
            AP_STATE_CHANGED,
            CLIENT_JOINED,
            CLIENT_UPDATED,
            CLIENT_LEFT,
            BRIDGE_ACTIVE,
            BRIDGE_INACTIVE,
            LINK_QUALITY_SAMPLED,
            SCAN_COMPLETED,
            UNRECOVERABLE
        };

        std::string status_event_type_to_string(StatusEventType type);

        /**
         * One entry of the status stream. details carries the full new value of
         * whatever changed.
         */
        struct StatusEvent
        {
            uint64_t sequence = 0;
            int64_t timestamp_ms = 0;
            std::string type;
            core::ReasonCode reason = core::ReasonCode::NONE;
            nlohmann::json details = nlohmann::json::object();

            nlohmann::json to_json() const;
        };

        /**
         * Status event stream: numbering, in-memory window, subscribers and an
         * asynchronous SQLite journal
         */
        class StatusEventService
        {
        public:
            using Subscriber = std::function<void(const StatusEvent &event)>;

            StatusEventService(std::shared_ptr<extender::db::Storage> storage = nullptr,
                               size_t window_size = 512);
            ~StatusEventService();

            // Start/stop the async writer thread
            void start();
            void stop();

            StatusEvent publish(StatusEventType type, core::ReasonCode reason,
                                nlohmann::json details = nlohmann::json::object());

            void subscribe(Subscriber subscriber);

            // Events with sequence > since, oldest first
            std::vector<StatusEvent> events_since(uint64_t since, size_t limit = 100) const;
            uint64_t last_sequence() const { return sequence_.load(); }
            size_t dropped_writes() const { return dropped_writes_.load(); }

            // Block until the journal has caught up
            void flush();

        private:
            void writer_thread_func();
            void save_event_to_db(const StatusEvent &event);
            std::vector<StatusEvent> load_from_db(uint64_t since, size_t limit) const;

            std::shared_ptr<core::Logger> logger_;
            std::shared_ptr<core::Logger> event_logger_;
            std::shared_ptr<extender::db::Storage> storage_;
            mutable std::mutex db_mutex_;

            size_t window_size_;
            std::atomic<uint64_t> sequence_{0};
            mutable std::mutex window_mutex_;
            std::deque<StatusEvent> window_;

            std::mutex publish_mutex_;
            std::vector<Subscriber> subscribers_;

            // Async database writer
            std::thread writer_thread_;
            std::atomic<bool> writer_running_{false};
            std::mutex queue_mutex_;
            std::condition_variable queue_cv_;
            std::condition_variable drained_cv_;
            std::deque<StatusEvent> write_queue_;
            bool writing_ = false;
            std::atomic<size_t> dropped_writes_{0};
            static constexpr size_t MAX_QUEUE_SIZE = 1000;
        };

    } // namespace services
} // namespace extender

#endif // EXTENDER_SERVICES_STATUS_EVENT_SERVICE_HPP
