/**
 * Process Launcher Implementation
 * fork/execvp with merged output pipes and a reader thread per child
 */

#include "infrastructure/process_launcher.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

namespace extender
{
    namespace infrastructure
    {

        PosixProcessLauncher::PosixProcessLauncher()
            : logger_(core::get_logger("ProcessLauncher"))
        {
        }

        PosixProcessLauncher::~PosixProcessLauncher()
        {
            std::vector<pid_t> pids;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (const auto &[pid, child] : children_)
                {
                    pids.push_back(pid);
                }
            }

            for (pid_t pid : pids)
            {
                terminate(pid, std::chrono::milliseconds(1000));
            }
        }

        pid_t PosixProcessLauncher::spawn(const std::vector<std::string> &argv,
                                          LineHandler on_line,
                                          ExitHandler on_exit)
        {
            if (argv.empty())
            {
                return -1;
            }

            reap_finished();

            int pipe_fds[2];
            if (pipe2(pipe_fds, O_CLOEXEC) != 0)
            {
                logger_->error("Failed to create pipe",
                               core::LogContext().add("command", argv[0]).add("error", std::strerror(errno)));
                return -1;
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

                std::vector<char *> args;
                for (const auto &arg : argv)
                {
                    args.push_back(const_cast<char *>(arg.c_str()));
                }
                args.push_back(nullptr);

                execvp(args[0], args.data());
                _exit(127);
            }
            else if (pid < 0)
            {
                close(pipe_fds[0]);
                close(pipe_fds[1]);
                logger_->error("Failed to fork",
                               core::LogContext().add("command", argv[0]).add("error", std::strerror(errno)));
                return -1;
            }

            close(pipe_fds[1]);

            auto child = std::make_shared<Child>();
            child->pid = pid;
            child->name = argv[0];

            {
                std::lock_guard<std::mutex> lock(mutex_);
                children_[pid] = child;
                child->reader = std::thread(&PosixProcessLauncher::reader_loop, this, child, pipe_fds[0],
                                            std::move(on_line), std::move(on_exit));
            }

            logger_->info("Process started",
                          core::LogContext()
                              .add("command", join_command(argv))
                              .add("pid", pid));
            return pid;
        }

        bool PosixProcessLauncher::is_alive(pid_t pid)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = children_.find(pid);
            return it != children_.end() && !it->second->exited;
        }

        bool PosixProcessLauncher::terminate(pid_t pid, std::chrono::milliseconds grace)
        {
            std::shared_ptr<Child> child;
            std::thread reader;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                auto it = children_.find(pid);
                if (it == children_.end())
                {
                    return true;
                }
                child = it->second;

                if (!child->exited)
                {
                    logger_->debug("Stopping process", core::LogContext().add("pid", pid).add("name", child->name));
                    kill(pid, SIGTERM);

                    if (!exit_cv_.wait_for(lock, grace, [&]
                                           { return child->exited; }))
                    {
                        logger_->warning("Process ignored SIGTERM, killing",
                                         core::LogContext().add("pid", pid).add("name", child->name));
                        kill(pid, SIGKILL);
                        exit_cv_.wait_for(lock, grace, [&]
                                          { return child->exited; });
                    }
                }

                if (!child->exited)
                {
                    logger_->error("Process did not exit", core::LogContext().add("pid", pid).add("name", child->name));
                    return false;
                }

                reader = std::move(child->reader);
                children_.erase(pid);
            }

            if (reader.joinable())
            {
                if (reader.get_id() == std::this_thread::get_id())
                {
                    reader.detach();
                }
                else
                {
                    reader.join();
                }
            }
            return true;
        }

        void PosixProcessLauncher::reader_loop(std::shared_ptr<Child> child, int fd,
                                               LineHandler on_line, ExitHandler on_exit)
        {
            std::string pending;
            char buffer[512];

            auto deliver = [&](const std::string &line)
            {
                if (!on_line)
                    return;
                try
                {
                    on_line(line);
                }
                catch (const std::exception &e)
                {
                    logger_->error("Output handler failed",
                                   core::LogContext().add("name", child->name).add("error", e.what()));
                }
            };

            while (true)
            {
                ssize_t n = read(fd, buffer, sizeof(buffer));
                if (n < 0 && errno == EINTR)
                {
                    continue;
                }
                if (n <= 0)
                {
                    break;
                }

                pending.append(buffer, static_cast<size_t>(n));
                size_t newline;
                while ((newline = pending.find('\n')) != std::string::npos)
                {
                    std::string line = pending.substr(0, newline);
                    pending.erase(0, newline + 1);
                    if (!line.empty() && line.back() == '\r')
                    {
                        line.pop_back();
                    }
                    deliver(line);
                }
            }

            if (!pending.empty())
            {
                deliver(pending);
            }
            close(fd);

            int status = 0;
            while (waitpid(child->pid, &status, 0) < 0 && errno == EINTR)
            {
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                child->exited = true;
                child->status = status;
            }
            exit_cv_.notify_all();

            logger_->debug("Process exited",
                           core::LogContext()
                               .add("pid", child->pid)
                               .add("name", child->name)
                               .add("status", WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status)));

            if (on_exit)
            {
                try
                {
                    on_exit(status);
                }
                catch (const std::exception &e)
                {
                    logger_->error("Exit handler failed",
                                   core::LogContext().add("name", child->name).add("error", e.what()));
                }
            }
        }

        void PosixProcessLauncher::reap_finished()
        {
            std::vector<std::thread> finished;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (auto it = children_.begin(); it != children_.end();)
                {
                    if (it->second->exited && it->second->reader.get_id() != std::this_thread::get_id())
                    {
                        finished.push_back(std::move(it->second->reader));
                        it = children_.erase(it);
                    }
                    else
                    {
                        ++it;
                    }
                }
            }

            for (auto &thread : finished)
            {
                if (thread.joinable())
                {
                    thread.join();
                }
            }
        }

    } // namespace infrastructure
} // namespace extender
