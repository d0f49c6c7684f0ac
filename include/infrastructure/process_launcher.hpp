#ifndef EXTENDER_INFRASTRUCTURE_PROCESS_LAUNCHER_HPP
#define EXTENDER_INFRASTRUCTURE_PROCESS_LAUNCHER_HPP

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <chrono>
#include <sys/types.h>

namespace extender
{
    namespace core
    {
        class Logger;
    }
}

namespace extender
{
    namespace infrastructure
    {

        /**
         * Supervises long-running daemons kept in the foreground (hostapd,
         * dnsmasq, wpa_supplicant). Output is delivered line by line from a
         * reader thread; on_exit fires once the child has been reaped.
         *
         * Handlers run on the reader thread and must not call back into the
         * launcher.
         */
        class ProcessLauncher
        {
        public:
            using LineHandler = std::function<void(const std::string &line)>;
            using ExitHandler = std::function<void(int wait_status)>;

            virtual ~ProcessLauncher() = default;

            // Returns the child pid, or -1 if it could not be started
            virtual pid_t spawn(const std::vector<std::string> &argv,
                                LineHandler on_line,
                                ExitHandler on_exit) = 0;

            virtual bool is_alive(pid_t pid) = 0;

            // SIGTERM, then SIGKILL after the grace period. True once the child is gone.
            virtual bool terminate(pid_t pid, std::chrono::milliseconds grace) = 0;
        };

        class PosixProcessLauncher : public ProcessLauncher
        {
        public:
            PosixProcessLauncher();
            ~PosixProcessLauncher() override;

            pid_t spawn(const std::vector<std::string> &argv,
                        LineHandler on_line,
                        ExitHandler on_exit) override;
            bool is_alive(pid_t pid) override;
            bool terminate(pid_t pid, std::chrono::milliseconds grace) override;

        private:
            struct Child
            {
                pid_t pid = -1;
                std::string name;
                std::thread reader;
                bool exited = false;
                int status = 0;
            };

            void reader_loop(std::shared_ptr<Child> child, int fd, LineHandler on_line, ExitHandler on_exit);
            void reap_finished();

            std::shared_ptr<core::Logger> logger_;
            std::map<pid_t, std::shared_ptr<Child>> children_;
            std::mutex mutex_;
            std::condition_variable exit_cv_;
        };

    } // namespace infrastructure
} // namespace extender

#endif // EXTENDER_INFRASTRUCTURE_PROCESS_LAUNCHER_HPP
