/**
 * Command Runner Implementation
 * Executes system tools with a hard deadline and captures their output
 */

#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <sstream>

namespace extender
{
    namespace infrastructure
    {

        PosixCommandRunner::PosixCommandRunner()
            : logger_(core::get_logger("CommandRunner"))
        {
        }

        CommandResult PosixCommandRunner::run(const std::vector<std::string> &argv,
                                              std::chrono::milliseconds timeout)
        {
            CommandResult result;
            if (argv.empty())
            {
                result.output = "empty command";
                return result;
            }

            int pipe_fds[2];
            if (pipe(pipe_fds) != 0)
            {
                result.output = std::string("pipe failed: ") + std::strerror(errno);
                logger_->error("Failed to create pipe", core::LogContext().add("command", argv[0]));
                return result;
            }

            pid_t pid = fork();
            if (pid == 0)
            {
                // Child process
                int null_fd = open("/dev/null", O_RDONLY);
                if (null_fd >= 0)
                {
                    dup2(null_fd, STDIN_FILENO);
                    close(null_fd);
                }
                dup2(pipe_fds[1], STDOUT_FILENO);
                dup2(pipe_fds[1], STDERR_FILENO);
                close(pipe_fds[0]);
                close(pipe_fds[1]);

                std::vector<char *> args;
                for (const auto &arg : argv)
                {
                    args.push_back(const_cast<char *>(arg.c_str()));
                }
                args.push_back(nullptr);

                execvp(args[0], args.data());
                _exit(127); // If execvp fails
            }
            else if (pid < 0)
            {
                close(pipe_fds[0]);
                close(pipe_fds[1]);
                result.output = std::string("fork failed: ") + std::strerror(errno);
                logger_->error("Failed to fork", core::LogContext().add("command", argv[0]));
                return result;
            }

            close(pipe_fds[1]);

            auto deadline = std::chrono::steady_clock::now() + timeout;
            char buffer[1024];
            bool eof = false;

            while (!eof)
            {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0)
                {
                    result.timed_out = true;
                    break;
                }

                pollfd pfd{pipe_fds[0], POLLIN, 0};
                int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
                if (ready < 0)
                {
                    if (errno == EINTR)
                        continue;
                    break;
                }
                if (ready == 0)
                {
                    continue;
                }

                ssize_t n = read(pipe_fds[0], buffer, sizeof(buffer));
                if (n > 0)
                {
                    result.output.append(buffer, static_cast<size_t>(n));
                }
                else if (n == 0 || errno != EINTR)
                {
                    eof = true;
                }
            }

            close(pipe_fds[0]);

            if (result.timed_out)
            {
                kill(pid, SIGKILL);
                logger_->warning("Command timed out",
                                 core::LogContext()
                                     .add("command", join_command(argv))
                                     .add("timeout_ms", timeout.count()));
            }

            int status = 0;
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
            {
            }

            if (!result.timed_out)
            {
                if (WIFEXITED(status))
                {
                    result.exit_code = WEXITSTATUS(status);
                }
                else if (WIFSIGNALED(status))
                {
                    result.exit_code = 128 + WTERMSIG(status);
                }
            }

            logger_->debug("Command finished",
                           core::LogContext()
                               .add("command", join_command(argv))
                               .add("exit_code", result.exit_code));
            return result;
        }

        std::string join_command(const std::vector<std::string> &argv)
        {
            std::ostringstream cmd;
            for (size_t i = 0; i < argv.size(); ++i)
            {
                if (i > 0)
                    cmd << " ";
                cmd << argv[i];
            }
            return cmd.str();
        }

    } // namespace infrastructure
} // namespace extender
