#include "services/status_event_service.hpp"
#include "core/logger.hpp"
#include <algorithm>

namespace extender
{
    namespace services
    {

        std::string status_event_type_to_string(StatusEventType type)
        {
            switch (type)
            {
            case StatusEventType::GOAL_CHANGED:
                return "GoalChanged";
            case StatusEventType::OVERALL_STATE_CHANGED:
                return "OverallStateChanged";
            case StatusEventType::MODE_CHANGED:
                return "ModeChanged";
            case StatusEventType::CONNECTION_STATE_CHANGED:
                return "ConnectionStateChanged";
            case StatusEventType::AP_STATE_CHANGED:
                return "APStateChanged";
            case StatusEventType::CLIENT_JOINED:
                return "ClientJoined";
            case StatusEventType::CLIENT_UPDATED:
                return "ClientUpdated";
            case StatusEventType::CLIENT_LEFT:
                return "ClientLeft";
            case StatusEventType::BRIDGE_ACTIVE:
                return "BridgeActive";
            case StatusEventType::BRIDGE_INACTIVE:
                return "BridgeInactive";
            case StatusEventType::LINK_QUALITY_SAMPLED:
                return "LinkQualitySampled";
            case StatusEventType::SCAN_COMPLETED:
                return "ScanCompleted";
            case StatusEventType::UNRECOVERABLE:
                return "Unrecoverable";
            default:
                return "Unknown";
            }
        }

        nlohmann::json StatusEvent::to_json() const
        {
            return nlohmann::json{
                {"sequence", sequence},
                {"timestamp_ms", timestamp_ms},
                {"type", type},
                {"reason", core::reason_to_string(reason)},
                {"details", details}};
        }

        StatusEventService::StatusEventService(std::shared_ptr<extender::db::Storage> storage, size_t window_size)
            : logger_(core::get_logger("StatusEventService")),
              event_logger_(core::get_logger("StatusEvents")),
              storage_(storage),
              window_size_(std::max<size_t>(window_size, 1))
        {
            if (storage_)
            {
                try
                {
                    std::lock_guard<std::mutex> lock(db_mutex_);
                    auto max_sequence = storage_->max(&extender::db::StatusEventRecord::sequence);
                    if (max_sequence)
                    {
                        sequence_ = static_cast<uint64_t>(*max_sequence);
                    }
                }
                catch (const std::exception &e)
                {
                    logger_->error("Failed to read journal position",
                                   core::LogContext().add("error", e.what()));
                }
            }

            logger_->info("Status event service initialized",
                          core::LogContext()
                              .add("journal_enabled", storage_ != nullptr)
                              .add("next_sequence", sequence_.load() + 1));
        }

        StatusEventService::~StatusEventService()
        {
            stop();
        }

        void StatusEventService::start()
        {
            if (!storage_ || writer_running_.exchange(true))
            {
                return;
            }
            writer_thread_ = std::thread(&StatusEventService::writer_thread_func, this);
        }

        void StatusEventService::stop()
        {
            if (!writer_running_.exchange(false))
            {
                return;
            }
            queue_cv_.notify_all();
            if (writer_thread_.joinable())
            {
                writer_thread_.join();
            }
        }

        StatusEvent StatusEventService::publish(StatusEventType type, core::ReasonCode reason, nlohmann::json details)
        {
            // Serializes numbering with subscriber delivery so observers see events in order
            std::lock_guard<std::mutex> publish_lock(publish_mutex_);

            StatusEvent event;
            event.sequence = sequence_.fetch_add(1) + 1;
            event.timestamp_ms = extender::db::getCurrentTimestampMs();
            event.type = status_event_type_to_string(type);
            event.reason = reason;
            event.details = std::move(details);

            {
                std::lock_guard<std::mutex> lock(window_mutex_);
                window_.push_back(event);
                while (window_.size() > window_size_)
                {
                    window_.pop_front();
                }
            }

            event_logger_->info(event.type,
                                core::LogContext()
                                    .add("seq", event.sequence)
                                    .add("reason", core::reason_to_string(reason))
                                    .add("details", event.details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)));

            if (storage_)
            {
                if (writer_running_)
                {
                    std::lock_guard<std::mutex> lock(queue_mutex_);
                    if (write_queue_.size() >= MAX_QUEUE_SIZE)
                    {
                        write_queue_.pop_front();
                        dropped_writes_++;
                    }
                    write_queue_.push_back(event);
                    queue_cv_.notify_one();
                }
                else
                {
                    save_event_to_db(event);
                }
            }

            for (const auto &subscriber : subscribers_)
            {
                try
                {
                    subscriber(event);
                }
                catch (const std::exception &e)
                {
                    logger_->error("Status subscriber failed", core::LogContext().add("error", e.what()));
                }
            }

            return event;
        }

        void StatusEventService::subscribe(Subscriber subscriber)
        {
            std::lock_guard<std::mutex> lock(publish_mutex_);
            subscribers_.push_back(std::move(subscriber));
        }

        std::vector<StatusEvent> StatusEventService::events_since(uint64_t since, size_t limit) const
        {
            std::vector<StatusEvent> result;
            if (limit == 0)
            {
                return result;
            }

            {
                std::lock_guard<std::mutex> lock(window_mutex_);
                bool covered = window_.empty() || window_.front().sequence <= since + 1;
                if (covered || !storage_)
                {
                    for (const auto &event : window_)
                    {
                        if (event.sequence > since)
                        {
                            result.push_back(event);
                            if (result.size() >= limit)
                            {
                                break;
                            }
                        }
                    }
                    return result;
                }
            }

            // Older than the in-memory window: read the journal
            return load_from_db(since, limit);
        }

        void StatusEventService::flush()
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            drained_cv_.wait(lock, [this]
                             { return (write_queue_.empty() && !writing_) || !writer_running_; });
        }

        void StatusEventService::writer_thread_func()
        {
            logger_->debug("Journal writer started");

            while (true)
            {
                std::deque<StatusEvent> batch;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex_);
                    queue_cv_.wait(lock, [this]
                                   { return !write_queue_.empty() || !writer_running_; });

                    if (write_queue_.empty())
                    {
                        break;
                    }
                    batch.swap(write_queue_);
                    writing_ = true;
                }

                for (const auto &event : batch)
                {
                    save_event_to_db(event);
                }

                {
                    std::lock_guard<std::mutex> lock(queue_mutex_);
                    writing_ = false;
                }
                drained_cv_.notify_all();
            }

            // Drain whatever arrived during shutdown
            std::deque<StatusEvent> remaining;
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                remaining.swap(write_queue_);
            }
            for (const auto &event : remaining)
            {
                save_event_to_db(event);
            }
            drained_cv_.notify_all();

            logger_->debug("Journal writer stopped");
        }

        void StatusEventService::save_event_to_db(const StatusEvent &event)
        {
            try
            {
                extender::db::StatusEventRecord record;
                record.sequence = static_cast<int64_t>(event.sequence);
                record.timestamp_ms = event.timestamp_ms;
                record.type = event.type;
                record.reason = core::reason_to_string(event.reason);
                record.details = event.details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

                std::lock_guard<std::mutex> lock(db_mutex_);
                storage_->insert(record);
            }
            catch (const std::exception &e)
            {
                logger_->error("Failed to journal status event",
                               core::LogContext()
                                   .add("sequence", event.sequence)
                                   .add("error", e.what()));
            }
        }

        std::vector<StatusEvent> StatusEventService::load_from_db(uint64_t since, size_t limit) const
        {
            std::vector<StatusEvent> result;
            try
            {
                using namespace sqlite_orm;
                using extender::db::StatusEventRecord;

                std::lock_guard<std::mutex> lock(db_mutex_);
                auto rows = storage_->get_all<StatusEventRecord>(
                    where(c(&StatusEventRecord::sequence) > static_cast<int64_t>(since)),
                    order_by(&StatusEventRecord::sequence),
                    sqlite_orm::limit(static_cast<int>(limit)));

                result.reserve(rows.size());
                for (const auto &row : rows)
                {
                    StatusEvent event;
                    event.sequence = static_cast<uint64_t>(row.sequence);
                    event.timestamp_ms = row.timestamp_ms;
                    event.type = row.type;
                    event.reason = core::reason_from_string(row.reason).value_or(core::ReasonCode::NONE);
                    event.details = nlohmann::json::parse(row.details, nullptr, false);
                    if (event.details.is_discarded())
                    {
                        event.details = nlohmann::json::object();
                    }
                    result.push_back(std::move(event));
                }
            }
            catch (const std::exception &e)
            {
                logger_->error("Failed to read status journal",
                               core::LogContext().add("error", e.what()));
            }
            return result;
        }

    } // namespace services
} // namespace extender
