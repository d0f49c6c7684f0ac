#include "core/task_executor.hpp"
#include "core/logger.hpp"

namespace extender
{
    namespace core
    {

        WorkerExecutor::WorkerExecutor()
            : logger_(get_logger("WorkerExecutor"))
        {
            worker_thread_ = std::make_unique<std::thread>(&WorkerExecutor::worker_loop, this);
        }

        WorkerExecutor::~WorkerExecutor()
        {
            shutdown();
        }

        bool WorkerExecutor::post(Task task)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!running_)
                {
                    return false;
                }
                tasks_.push(std::move(task));
            }
            cv_.notify_one();
            return true;
        }

        void WorkerExecutor::shutdown()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!running_.exchange(false))
                {
                    return;
                }
            }
            cv_.notify_all();

            if (worker_thread_ && worker_thread_->joinable())
            {
                worker_thread_->join();
            }
        }

        void WorkerExecutor::worker_loop()
        {
            logger_->debug("Worker thread started");

            while (true)
            {
                Task task;
                {
                    std::unique_lock<std::mutex> lock(mutex_);
                    cv_.wait(lock, [this]
                             { return !tasks_.empty() || !running_; });

                    // Drain what was already accepted before exiting
                    if (tasks_.empty())
                    {
                        break;
                    }
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }

                try
                {
                    task();
                }
                catch (const std::exception &e)
                {
                    logger_->error("Worker task failed", LogContext().add("error", e.what()));
                }
            }

            logger_->debug("Worker thread stopped");
        }

    } // namespace core
} // namespace extender
