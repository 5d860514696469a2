#include "core/logger.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <ctime>

namespace airbeacon
{
    namespace core
    {

        namespace
        {
            std::string current_timestamp()
            {
                auto now = std::chrono::system_clock::now();
                auto seconds = std::chrono::system_clock::to_time_t(now);
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

                std::tm local_tm{};
                localtime_r(&seconds, &local_tm);

                std::stringstream ss;
                ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
                   << "." << std::setfill('0') << std::setw(3) << ms.count();
                return ss.str();
            }
        } // namespace

        std::string LogContext::format() const
        {
            std::string out;
            for (const auto &[key, value] : context_)
            {
                if (!out.empty())
                {
                    out += ' ';
                }
                out += key + "=" + value;
            }
            return out;
        }

        // LogOutput implementation
        void LogOutput::configure(bool console_output, const std::string &log_file)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            console_output_ = console_output;
            if (file_.is_open())
            {
                file_.close();
            }
            if (!log_file.empty())
            {
                file_.open(log_file, std::ios::app);
                if (!file_.is_open())
                {
                    std::cerr << "Failed to open log file: " << log_file << std::endl;
                }
            }
        }

        void LogOutput::set_sink(LogSink sink)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = std::move(sink);
        }

        void LogOutput::write(LogLevel level, const std::string &logger_name, const std::string &line)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (console_output_)
            {
                std::ostream &stream = level >= LogLevel::ERROR ? std::cerr : std::cout;
                stream << line << std::endl;
            }
            if (file_.is_open())
            {
                file_ << line << std::endl;
            }
            if (sink_)
            {
                sink_(level, logger_name, line);
            }
        }

        // Logger implementation
        Logger::Logger(const std::string &name, std::shared_ptr<LogOutput> output, LogLevel level)
            : name_(name), level_(level), output_(std::move(output))
        {
        }

        void Logger::debug(const std::string &message, const LogContext &context)
        {
            log(LogLevel::DEBUG, message, context);
        }

        void Logger::info(const std::string &message, const LogContext &context)
        {
            log(LogLevel::INFO, message, context);
        }

        void Logger::warning(const std::string &message, const LogContext &context)
        {
            log(LogLevel::WARNING, message, context);
        }

        void Logger::error(const std::string &message, const LogContext &context)
        {
            log(LogLevel::ERROR, message, context);
        }

        void Logger::log(LogLevel level, const std::string &message, const LogContext &context)
        {
            if (!is_enabled(level))
            {
                return;
            }

            std::string line = current_timestamp() + " [" + LoggerManager::level_to_string(level) + "] " +
                               name_ + ": " + message;
            if (!context.empty())
            {
                line += " " + context.format();
            }

            output_->write(level, name_, line);
        }

        // LoggerManager implementation
        LoggerManager::LoggerManager()
            : output_(std::make_shared<LogOutput>())
        {
        }

        LoggerManager &LoggerManager::instance()
        {
            static LoggerManager instance;
            return instance;
        }

        void LoggerManager::setup_logging(LogLevel level, const std::string &log_file, bool console_output)
        {
            output_->configure(console_output, log_file);

            std::lock_guard<std::mutex> lock(mutex_);
            default_level_ = level;
            for (auto &[name, logger] : loggers_)
            {
                logger->set_level(level);
            }
        }

        std::shared_ptr<Logger> LoggerManager::get_logger(const std::string &name)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto it = loggers_.find(name);
            if (it != loggers_.end())
            {
                return it->second;
            }

            auto logger = std::make_shared<Logger>(name, output_, default_level_);
            loggers_[name] = logger;
            return logger;
        }

        const char *LoggerManager::level_to_string(LogLevel level)
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
            }
            return "UNKNOWN";
        }

        std::shared_ptr<Logger> get_logger(const std::string &name)
        {
            return LoggerManager::instance().get_logger(name);
        }

        void setup_logging(LogLevel level, const std::string &log_file, bool console_output)
        {
            LoggerManager::instance().setup_logging(level, log_file, console_output);
        }

    } // namespace core
} // namespace airbeacon
