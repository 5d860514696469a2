#ifndef AIRBEACON_CORE_LOGGER_HPP
#define AIRBEACON_CORE_LOGGER_HPP

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <map>
#include <functional>

namespace airbeacon
{
    namespace core
    {

        enum class LogLevel
        {
            DEBUG = 0,
            INFO = 1,
            WARNING = 2,
            ERROR = 3
        };

        /**
         * Receives every formatted line, in addition to the console and file
         * outputs.
         */
        using LogSink = std::function<void(LogLevel level, const std::string &logger_name, const std::string &line)>;

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

            std::string format() const;
            bool empty() const { return context_.empty(); }

        private:
            std::map<std::string, std::string> context_;
        };

        /**
         * Destinations shared by all loggers. One file handle, one lock, so
         * lines from different loggers never interleave.
         */
        class LogOutput
        {
        public:
            void configure(bool console_output, const std::string &log_file);
            void set_sink(LogSink sink);
            void write(LogLevel level, const std::string &logger_name, const std::string &line);

        private:
            std::mutex mutex_;
            bool console_output_ = true;
            std::ofstream file_;
            LogSink sink_;
        };

        /**
         * Named logger with its own level threshold
         */
        class Logger
        {
        public:
            Logger(const std::string &name, std::shared_ptr<LogOutput> output, LogLevel level);

            void set_level(LogLevel level) { level_.store(level); }
            bool is_enabled(LogLevel level) const { return level >= level_.load(); }

            void debug(const std::string &message, const LogContext &context = LogContext{});
            void info(const std::string &message, const LogContext &context = LogContext{});
            void warning(const std::string &message, const LogContext &context = LogContext{});
            void error(const std::string &message, const LogContext &context = LogContext{});

        private:
            void log(LogLevel level, const std::string &message, const LogContext &context);

            std::string name_;
            std::atomic<LogLevel> level_;
            std::shared_ptr<LogOutput> output_;
        };

        /**
         * Logger factory and management
         */
        class LoggerManager
        {
        public:
            static LoggerManager &instance();

            // Applies to existing and future loggers. An empty log_file
            // closes any open file.
            void setup_logging(LogLevel level, const std::string &log_file, bool console_output);

            // Empty function removes the sink
            void set_sink(LogSink sink) { output_->set_sink(std::move(sink)); }

            std::shared_ptr<Logger> get_logger(const std::string &name);

            static const char *level_to_string(LogLevel level);

        private:
            LoggerManager();

            LogLevel default_level_ = LogLevel::INFO;
            std::shared_ptr<LogOutput> output_;
            std::map<std::string, std::shared_ptr<Logger>> loggers_;
            std::mutex mutex_;
        };

        std::shared_ptr<Logger> get_logger(const std::string &name);
        void setup_logging(LogLevel level = LogLevel::INFO,
                           const std::string &log_file = "",
                           bool console_output = true);

    } // namespace core
} // namespace airbeacon

#endif // AIRBEACON_CORE_LOGGER_HPP
