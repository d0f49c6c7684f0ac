#ifndef EXTENDER_CORE_LOGGER_HPP
#define EXTENDER_CORE_LOGGER_HPP

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <atomic>
#include <chrono>
#include <sstream>
#include <map>
#include <algorithm>

namespace extender
{
    namespace core
    {

        /**
         * Log levels
         */
        enum class LogLevel
        {
            DEBUG = 0,
            INFO = 1,
            WARNING = 2,
            ERROR = 3,
            CRITICAL = 4
        };

        /**
         * Line format: human readable text or one JSON object per line
         */
        enum class LogFormat
        {
            TEXT,
            JSON
        };

        /**
         * Structured logging context for key-value pairs
         */
        class LogContext
        {
        public:
            LogContext() = default;

            template <typename T>
            LogContext &add(const std::string &key, const T &value)
            {
                std::stringstream ss;
                ss << value;
                context_[key] = ss.str();
                return *this;
            }

            LogContext &add(const std::string &key, bool value)
            {
                context_[key] = value ? "true" : "false";
                return *this;
            }

            std::string format() const;
            bool empty() const { return context_.empty(); }
            const std::map<std::string, std::string> &fields() const { return context_; }

        private:
            std::map<std::string, std::string> context_;
        };

        /**
         * Output shared by every logger: console (stderr for ERROR and above)
         * and an optional append-only file. One sink per setup_logging call so
         * lines from different components never interleave mid-line.
         */
        class LogSink
        {
        public:
            LogSink(bool console_output, LogFormat format, const std::string &log_file = "");
            ~LogSink();

            LogSink(const LogSink &) = delete;
            LogSink &operator=(const LogSink &) = delete;

            void write(LogLevel level, const std::string &logger_name, const std::string &message,
                       const LogContext &context);

            LogFormat format() const { return format_; }
            bool has_file() const { return file_output_ != nullptr; }

            static std::string level_to_string(LogLevel level);

        private:
            std::string render_text(LogLevel level, const std::string &logger_name, const std::string &message,
                                    const LogContext &context) const;
            std::string render_json(LogLevel level, const std::string &logger_name, const std::string &message,
                                    const LogContext &context) const;
            static std::string current_timestamp();

            bool console_output_;
            LogFormat format_;
            std::unique_ptr<std::ofstream> file_output_;
            std::mutex mutex_;
        };

        /**
         * Named logger handed to each component
         */
        class Logger
        {
        public:
            Logger(const std::string &name, LogLevel level, std::shared_ptr<LogSink> sink);

            void set_level(LogLevel level) { level_ = level; }
            void set_sink(std::shared_ptr<LogSink> sink);

            void debug(const std::string &message, const LogContext &context = LogContext{}) { log(LogLevel::DEBUG, message, context); }
            void info(const std::string &message, const LogContext &context = LogContext{}) { log(LogLevel::INFO, message, context); }
            void warning(const std::string &message, const LogContext &context = LogContext{}) { log(LogLevel::WARNING, message, context); }
            void error(const std::string &message, const LogContext &context = LogContext{}) { log(LogLevel::ERROR, message, context); }
            void critical(const std::string &message, const LogContext &context = LogContext{}) { log(LogLevel::CRITICAL, message, context); }

            void log(LogLevel level, const std::string &message, const LogContext &context);

            bool is_enabled(LogLevel level) const { return level >= level_.load(); }

            const std::string &name() const { return name_; }

        private:
            std::string name_;
            std::atomic<LogLevel> level_;
            std::shared_ptr<LogSink> sink_;
            mutable std::mutex sink_mutex_;
        };

        /**
         * Logger registry. Loggers are created on first use and re-pointed at
         * the new sink whenever logging is set up again.
         */
        class LoggerManager
        {
        public:
            static LoggerManager &instance();

            void setup_logging(LogLevel level = LogLevel::INFO,
                               const std::string &log_file = "",
                               bool console_output = true,
                               LogFormat format = LogFormat::TEXT);

            std::shared_ptr<Logger> get_logger(const std::string &name);

            static LogLevel string_to_level(const std::string &level_str);
            static bool is_valid_level(const std::string &level_str);
            static LogFormat string_to_format(const std::string &format_str);

        private:
            LoggerManager();

            LogLevel level_ = LogLevel::INFO;
            std::shared_ptr<LogSink> sink_;
            std::map<std::string, std::shared_ptr<Logger>> loggers_;
            std::mutex mutex_;
        };

        std::shared_ptr<Logger> get_logger(const std::string &name);
        void setup_logging(LogLevel level = LogLevel::INFO,
                           const std::string &log_file = "",
                           bool console_output = true,
                           LogFormat format = LogFormat::TEXT);

    } // namespace core
} // namespace extender

#endif // EXTENDER_CORE_LOGGER_HPP
