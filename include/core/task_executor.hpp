#ifndef EXTENDER_CORE_TASK_EXECUTOR_HPP
#define EXTENDER_CORE_TASK_EXECUTOR_HPP

#include <functional>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <atomic>

namespace extender
{
    namespace core
    {
        class Logger;

        /**
         * Where long-running radio operations execute. Tasks run one at a
         * time, in posting order.
         */
        class TaskExecutor
        {
        public:
            using Task = std::function<void()>;

            virtual ~TaskExecutor() = default;

            // False once shut down
            virtual bool post(Task task) = 0;
            virtual void shutdown() = 0;
        };

        /**
         * Single worker thread; also the serialization point for radio access
         */
        class WorkerExecutor : public TaskExecutor
        {
        public:
            WorkerExecutor();
            ~WorkerExecutor() override;

            WorkerExecutor(const WorkerExecutor &) = delete;
            WorkerExecutor &operator=(const WorkerExecutor &) = delete;

            bool post(Task task) override;
            void shutdown() override;

        private:
            void worker_loop();

            std::unique_ptr<std::thread> worker_thread_;
            std::queue<Task> tasks_;
            std::mutex mutex_;
            std::condition_variable cv_;
            std::atomic<bool> running_{true};
            std::shared_ptr<Logger> logger_;
        };

    } // namespace core
} // namespace extender

#endif // EXTENDER_CORE_TASK_EXECUTOR_HPP
