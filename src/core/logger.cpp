#include "core/logger.hpp"
#include <iostream>
#include <iomanip>
#include <cctype>
#include <nlohmann/json.hpp>

namespace extender
{
    namespace core
    {

        namespace
        {
            std::string to_upper(std::string value)
            {
                std::transform(value.begin(), value.end(), value.begin(),
                               [](unsigned char c)
                               { return static_cast<char>(std::toupper(c)); });
                return value;
            }

            const std::map<std::string, LogLevel> &level_names()
            {
                static const std::map<std::string, LogLevel> names{
                    {"DEBUG", LogLevel::DEBUG},
                    {"INFO", LogLevel::INFO},
                    {"WARNING", LogLevel::WARNING},
                    {"WARN", LogLevel::WARNING},
                    {"ERROR", LogLevel::ERROR},
                    {"CRITICAL", LogLevel::CRITICAL},
                    {"CRIT", LogLevel::CRITICAL}};
                return names;
            }
        }

        std::string LogContext::format() const
        {
            std::string joined;
            for (const auto &[key, value] : context_)
            {
                if (!joined.empty())
                {
                    joined += ' ';
                }
                joined += key + "=" + value;
            }
            return joined;
        }

        // LogSink

        LogSink::LogSink(bool console_output, LogFormat format, const std::string &log_file)
            : console_output_(console_output), format_(format)
        {
            if (log_file.empty())
            {
                return;
            }

            file_output_ = std::make_unique<std::ofstream>(log_file, std::ios::app);
            if (!file_output_->is_open())
            {
                std::cerr << "Failed to open log file: " << log_file << std::endl;
                file_output_.reset();
                console_output_ = true;
            }
        }

        LogSink::~LogSink()
        {
            if (file_output_)
            {
                file_output_->flush();
            }
        }

        void LogSink::write(LogLevel level, const std::string &logger_name, const std::string &message,
                            const LogContext &context)
        {
            std::string line = format_ == LogFormat::JSON ? render_json(level, logger_name, message, context)
                                                          : render_text(level, logger_name, message, context);

            std::lock_guard<std::mutex> lock(mutex_);
            if (console_output_)
            {
                (level >= LogLevel::ERROR ? std::cerr : std::cout) << line << std::endl;
            }
            if (file_output_)
            {
                *file_output_ << line << '\n';
                file_output_->flush();
            }
        }

        std::string LogSink::render_text(LogLevel level, const std::string &logger_name, const std::string &message,
                                         const LogContext &context) const
        {
            std::string line = current_timestamp() + " [" + level_to_string(level) + "] " + logger_name + ": " + message;
            if (!context.empty())
            {
                line += " " + context.format();
            }
            return line;
        }

        std::string LogSink::render_json(LogLevel level, const std::string &logger_name, const std::string &message,
                                         const LogContext &context) const
        {
            nlohmann::json line{
                {"ts", current_timestamp()},
                {"level", level_to_string(level)},
                {"logger", logger_name},
                {"msg", message}};

            for (const auto &[key, value] : context.fields())
            {
                line[key] = value;
            }

            // tool output may carry invalid UTF-8
            return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

        std::string LogSink::level_to_string(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            case LogLevel::CRITICAL:
                return "CRIT";
            }
            return "UNKNOWN";
        }

        std::string LogSink::current_timestamp()
        {
            auto now = std::chrono::system_clock::now();
            auto seconds = std::chrono::system_clock::to_time_t(now);
            auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

            std::tm local_tm{};
            localtime_r(&seconds, &local_tm);

            std::ostringstream out;
            out << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << '.'
                << std::setfill('0') << std::setw(3) << millis;
            return out.str();
        }

        // Logger

        Logger::Logger(const std::string &name, LogLevel level, std::shared_ptr<LogSink> sink)
            : name_(name), level_(level), sink_(std::move(sink))
        {
        }

        void Logger::set_sink(std::shared_ptr<LogSink> sink)
        {
            std::lock_guard<std::mutex> lock(sink_mutex_);
            sink_ = std::move(sink);
        }

        void Logger::log(LogLevel level, const std::string &message, const LogContext &context)
        {
            if (!is_enabled(level))
            {
                return;
            }

            std::shared_ptr<LogSink> sink;
            {
                std::lock_guard<std::mutex> lock(sink_mutex_);
                sink = sink_;
            }
            if (sink)
            {
                sink->write(level, name_, message, context);
            }
        }

        // LoggerManager

        LoggerManager::LoggerManager()
            : sink_(std::make_shared<LogSink>(true, LogFormat::TEXT))
        {
        }

        LoggerManager &LoggerManager::instance()
        {
            static LoggerManager instance;
            return instance;
        }

        void LoggerManager::setup_logging(LogLevel level, const std::string &log_file, bool console_output, LogFormat format)
        {
            auto sink = std::make_shared<LogSink>(console_output, format, log_file);

            std::lock_guard<std::mutex> lock(mutex_);
            level_ = level;
            sink_ = sink;
            for (auto &[name, logger] : loggers_)
            {
                logger->set_level(level);
                logger->set_sink(sink);
            }
        }

        std::shared_ptr<Logger> LoggerManager::get_logger(const std::string &name)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto &logger = loggers_[name];
            if (!logger)
            {
                logger = std::make_shared<Logger>(name, level_, sink_);
            }
            return logger;
        }

        LogLevel LoggerManager::string_to_level(const std::string &level_str)
        {
            auto it = level_names().find(to_upper(level_str));
            return it != level_names().end() ? it->second : LogLevel::INFO;
        }

        bool LoggerManager::is_valid_level(const std::string &level_str)
        {
            return level_names().count(to_upper(level_str)) > 0;
        }

        LogFormat LoggerManager::string_to_format(const std::string &format_str)
        {
            return to_upper(format_str) == "JSON" ? LogFormat::JSON : LogFormat::TEXT;
        }

        std::shared_ptr<Logger> get_logger(const std::string &name)
        {
            return LoggerManager::instance().get_logger(name);
        }

        void setup_logging(LogLevel level, const std::string &log_file, bool console_output, LogFormat format)
        {
            LoggerManager::instance().setup_logging(level, log_file, console_output, format);
        }

    } // namespace core
} // namespace extender
