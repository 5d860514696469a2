#ifndef AIRBEACON_CORE_POLL_SCHEDULER_HPP
#define AIRBEACON_CORE_POLL_SCHEDULER_HPP

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <chrono>
#include <atomic>
#include <mutex>
#include <condition_variable>

namespace airbeacon
{
    namespace core
    {
        class Logger;

        /**
         * Runs recurring callbacks on a single thread.
         *
         * Each task first fires one period after run() starts. Tasks due at
         * the same instant run in registration order. Callbacks never overlap.
         */
        class PollScheduler
        {
        public:
            using Clock = std::chrono::steady_clock;
            using Callback = std::function<void()>;

            PollScheduler();

            // Must be called before run()
            void every(std::chrono::milliseconds period, const std::string &name, Callback callback);

            // Blocks until stop() or request_stop()
            void run();

            // Async-signal-safe; noticed within one period of the shortest task.
            void request_stop() { stop_requested_.store(true); }

            // Thread-safe; wakes the loop immediately.
            void stop();

            bool stop_requested() const { return stop_requested_.load(); }

        private:
            struct Task
            {
                std::string name;
                std::chrono::milliseconds period;
                Callback callback;
                Clock::time_point next_run;
            };

            void run_task(Task &task);

            std::vector<Task> tasks_;
            std::atomic<bool> stop_requested_{false};
            std::mutex mutex_;
            std::condition_variable wake_cv_;
            std::shared_ptr<Logger> logger_;
        };

    } // namespace core
} // namespace airbeacon

#endif // AIRBEACON_CORE_POLL_SCHEDULER_HPP
