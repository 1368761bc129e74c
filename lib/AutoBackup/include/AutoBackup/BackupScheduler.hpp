#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include <spdlog/logger.h>

/**
 * @brief Timer-only mode: runs a backup at a fixed interval until stopped.
 *
 * The interval is measured from the end of the previous run, so runs never overlap.
 */
class BackupScheduler
{
  public:
    using Trigger = std::function<bool()>;

    BackupScheduler(std::chrono::seconds interval, bool runOnStart, Trigger trigger, std::shared_ptr<spdlog::logger> logger);
    ~BackupScheduler();

    BackupScheduler(const BackupScheduler&) = delete;
    BackupScheduler& operator=(const BackupScheduler&) = delete;

    /**
     * @brief Run the schedule on the calling thread until Stop() is called.
     *
     * @return Number of backups that were triggered
     */
    std::size_t Run();

    /**
     * @brief Run the schedule on a background thread.
     */
    void Start();

    /**
     * @brief Stop the schedule and join the background thread, if any.
     *
     * A backup that is already running finishes first.
     */
    void Stop();

  private:
    bool WaitForNextRun();

    std::chrono::seconds _interval;
    bool _runOnStart;
    Trigger _trigger;
    std::shared_ptr<spdlog::logger> _logger;
    std::mutex _mutex;
    std::condition_variable _stopCondition;
    bool _stopRequested;
    std::thread _thread;
};
