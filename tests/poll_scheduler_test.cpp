// airbeacon headers
#include "core/poll_scheduler.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace airbeacon::test {

  using airbeacon::core::PollScheduler;
  using namespace std::chrono_literals;

  TEST(PollSchedulerTest, fastTaskRunsMoreOftenThanSlowTask) {
    PollScheduler scheduler;
    int slow = 0;
    int fast = 0;

    scheduler.every(50ms, "slow", [&] {
      if (++slow == 3) {
        scheduler.stop();
      }
    });
    scheduler.every(10ms, "fast", [&] { ++fast; });

    scheduler.run();

    EXPECT_EQ(slow, 3);
    EXPECT_GT(fast, slow);
  }

  TEST(PollSchedulerTest, tasksDueTogetherRunInRegistrationOrder) {
    PollScheduler scheduler;
    std::vector<std::string> order;

    scheduler.every(10ms, "observe", [&] { order.push_back("observe"); });
    scheduler.every(10ms, "apply", [&] {
      order.push_back("apply");
      if (order.size() >= 6) {
        scheduler.stop();
      }
    });

    scheduler.run();

    ASSERT_EQ(order.size(), 6u);
    for (size_t i = 0; i < order.size(); i += 2) {
      EXPECT_EQ(order[i], "observe");
      EXPECT_EQ(order[i + 1], "apply");
    }
  }

  TEST(PollSchedulerTest, firstRunIsOnePeriodAfterStart) {
    PollScheduler scheduler;
    auto started = PollScheduler::Clock::now();
    PollScheduler::Clock::time_point first_run;

    scheduler.every(40ms, "once", [&] {
      first_run = PollScheduler::Clock::now();
      scheduler.stop();
    });
    scheduler.run();

    EXPECT_GE(first_run - started, 40ms);
  }

  TEST(PollSchedulerTest, throwingTaskDoesNotStopLoop) {
    PollScheduler scheduler;
    int calls = 0;

    scheduler.every(5ms, "flaky", [&] {
      if (++calls == 1) {
        throw std::runtime_error("boom");
      }
      if (calls == 3) {
        scheduler.stop();
      }
    });

    EXPECT_NO_THROW(scheduler.run());
    EXPECT_EQ(calls, 3);
  }

  TEST(PollSchedulerTest, stopFromAnotherThreadWakesLoopImmediately) {
    PollScheduler scheduler;
    scheduler.every(std::chrono::hours(1), "idle", [] {});

    auto started = PollScheduler::Clock::now();
    std::thread loop([&] { scheduler.run(); });
    std::this_thread::sleep_for(20ms);
    scheduler.stop();
    loop.join();

    EXPECT_LT(PollScheduler::Clock::now() - started, 5s);
    EXPECT_TRUE(scheduler.stop_requested());
  }

  TEST(PollSchedulerTest, requestStopIsNoticedWithinShortestPeriod) {
    PollScheduler scheduler;
    scheduler.every(1s, "slow", [] {});
    scheduler.every(20ms, "fast", [] {});

    std::thread loop([&] { scheduler.run(); });
    std::this_thread::sleep_for(30ms);
    auto requested = PollScheduler::Clock::now();
    scheduler.request_stop();
    loop.join();

    EXPECT_LT(PollScheduler::Clock::now() - requested, 500ms);
  }

  TEST(PollSchedulerTest, rejectsNonPositivePeriod) {
    PollScheduler scheduler;
    EXPECT_THROW(scheduler.every(0ms, "bad", [] {}), std::invalid_argument);
  }

  TEST(PollSchedulerTest, runWithoutTasksReturnsImmediately) {
    PollScheduler scheduler;
    scheduler.run();
    SUCCEED();
  }

} // namespace airbeacon::test
