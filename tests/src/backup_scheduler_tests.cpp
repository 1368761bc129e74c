/**
 * @file backup_scheduler_tests.cpp
 * @brief Tests for timer-driven backups.
 */
#include "AutoBackup/BackupScheduler.hpp"
#include "AutoBackup/Logging.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

TEST(BackupSchedulerTest, RunsImmediatelyOnStart)
{
    std::promise<void> firstRun;
    std::atomic<int> runs{0};
    BackupScheduler scheduler(std::chrono::hours(1), true,
                              [&firstRun, &runs]()
                              {
                                  if (1 == ++runs)
                                  {
                                      firstRun.set_value();
                                  }
                                  return true;
                              },
                              CreateNullLogger("scheduler-test"));

    scheduler.Start();
    EXPECT_EQ(std::future_status::ready, firstRun.get_future().wait_for(5s));
    scheduler.Stop();

    EXPECT_EQ(1, runs.load());
}

TEST(BackupSchedulerTest, StopEndsWaitAndReturnsRunCount)
{
    std::atomic<int> runs{0};
    BackupScheduler scheduler(std::chrono::hours(1), false,
                              [&runs]()
                              {
                                  ++runs;
                                  return true;
                              },
                              CreateNullLogger("scheduler-test"));

    std::future<std::size_t> triggered = std::async(std::launch::async, [&scheduler]() { return scheduler.Run(); });
    std::this_thread::sleep_for(50ms);
    scheduler.Stop();

    ASSERT_EQ(std::future_status::ready, triggered.wait_for(5s));
    EXPECT_EQ(0u, triggered.get());
    EXPECT_EQ(0, runs.load());
}

TEST(BackupSchedulerTest, FailingRunDoesNotStopSchedule)
{
    std::promise<void> secondRun;
    std::atomic<int> runs{0};
    BackupScheduler scheduler(1s, true,
                              [&secondRun, &runs]() -> bool
                              {
                                  const int run = ++runs;
                                  if (1 == run)
                                  {
                                      throw std::runtime_error("container not running");
                                  }
                                  if (2 == run)
                                  {
                                      secondRun.set_value();
                                  }
                                  return false;
                              },
                              CreateNullLogger("scheduler-test"));

    scheduler.Start();
    EXPECT_EQ(std::future_status::ready, secondRun.get_future().wait_for(10s));
    scheduler.Stop();

    EXPECT_LE(2, runs.load());
}
