#ifndef EXTENDER_INFRASTRUCTURE_COMMAND_RUNNER_HPP
#define EXTENDER_INFRASTRUCTURE_COMMAND_RUNNER_HPP

#include <string>
#include <vector>
#include <memory>
#include <chrono>

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

        struct CommandResult
        {
            int exit_code = -1;
            std::string output; // stdout and stderr, merged
            bool timed_out = false;

            bool ok() const { return !timed_out && exit_code == 0; }
        };

        /**
         * Runs short-lived system tools (ip, iw, iptables, dhclient) to completion.
         * Every call is bounded by a timeout; a child that outlives it is killed.
         */
        class CommandRunner
        {
        public:
            virtual ~CommandRunner() = default;

            virtual CommandResult run(const std::vector<std::string> &argv,
                                      std::chrono::milliseconds timeout) = 0;
        };

        /**
         * fork/execvp implementation, no shell involved
         */
        class PosixCommandRunner : public CommandRunner
        {
        public:
            PosixCommandRunner();

            CommandResult run(const std::vector<std::string> &argv,
                              std::chrono::milliseconds timeout) override;

        private:
            std::shared_ptr<core::Logger> logger_;
        };

        std::string join_command(const std::vector<std::string> &argv);

    } // namespace infrastructure
} // namespace extender

#endif // EXTENDER_INFRASTRUCTURE_COMMAND_RUNNER_HPP
