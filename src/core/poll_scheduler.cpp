#include "core/poll_scheduler.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace airbeacon
{
    namespace core
    {

        static_assert(std::atomic<bool>::is_always_lock_free, "request_stop() must be usable from a signal handler");

        PollScheduler::PollScheduler()
            : logger_(get_logger("PollScheduler"))
        {
        }

        void PollScheduler::every(std::chrono::milliseconds period, const std::string &name, Callback callback)
        {
            if (period.count() <= 0)
            {
                throw std::invalid_argument("Task period must be positive: " + name);
            }
            tasks_.push_back(Task{name, period, std::move(callback), Clock::time_point{}});
        }

        void PollScheduler::stop()
        {
            stop_requested_.store(true);
            std::lock_guard<std::mutex> lock(mutex_);
            wake_cv_.notify_all();
        }

        void PollScheduler::run_task(Task &task)
        {
            try
            {
                task.callback();
            }
            catch (const std::exception &e)
            {
                logger_->error("Error in scheduled task",
                               LogContext().add("task", task.name).add("error", e.what()));
            }
        }

        void PollScheduler::run()
        {
            if (tasks_.empty())
            {
                logger_->warning("Poll loop started with no tasks");
                return;
            }

            auto start = Clock::now();
            auto shortest = tasks_.front().period;
            for (auto &task : tasks_)
            {
                task.next_run = start + task.period;
                shortest = std::min(shortest, task.period);
            }

            logger_->debug("Poll loop started", LogContext().add("tasks", tasks_.size()));

            while (!stop_requested_.load())
            {
                auto now = Clock::now();
                for (auto &task : tasks_)
                {
                    if (stop_requested_.load())
                    {
                        break;
                    }
                    if (task.next_run <= now)
                    {
                        run_task(task);
                        // Skip missed periods rather than bursting to catch up
                        while (task.next_run <= now)
                        {
                            task.next_run += task.period;
                        }
                    }
                }

                auto next = tasks_.front().next_run;
                for (const auto &task : tasks_)
                {
                    next = std::min(next, task.next_run);
                }
                // Bounded wait so a request_stop() from a signal handler is seen
                next = std::min(next, Clock::now() + shortest);

                std::unique_lock<std::mutex> lock(mutex_);
                wake_cv_.wait_until(lock, next, [this] { return stop_requested_.load(); });
            }

            logger_->debug("Poll loop stopped");
        }

    } // namespace core
} // namespace airbeacon
