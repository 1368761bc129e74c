#include "AutoBackup/BackupScheduler.hpp"

#include <stdexcept>
#include <utility>

BackupScheduler::BackupScheduler(std::chrono::seconds interval, bool runOnStart, Trigger trigger, std::shared_ptr<spdlog::logger> logger)
    : _interval(interval), _runOnStart(runOnStart), _trigger(std::move(trigger)), _logger(std::move(logger)), _stopRequested(false)
{
}

BackupScheduler::~BackupScheduler()
{
    Stop();
}

std::size_t BackupScheduler::Run()
{
    std::size_t triggered = 0;
    bool runNow = _runOnStart;

    _logger->info("Scheduled backups every {}s", _interval.count());
    while (true)
    {
        if ((false == runNow) && (false == WaitForNextRun()))
        {
            break;
        }
        runNow = false;

        try
        {
            if (false == _trigger())
            {
                _logger->warn("Scheduled backup did not succeed");
            }
        }
        catch (const std::runtime_error& error)
        {
            _logger->error("Scheduled backup failed: {}", error.what());
        }
        ++triggered;
    }
    _logger->info("Schedule stopped after {} backup(s)", triggered);
    return triggered;
}

void BackupScheduler::Start()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _stopRequested = false;
    }
    _thread = std::thread([this]() { Run(); });
}

void BackupScheduler::Stop()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _stopRequested = true;
    }
    _stopCondition.notify_all();

    if (true == _thread.joinable())
    {
        _thread.join();
    }
}

/**
 * @brief Wait one interval.
 *
 * @return false if the schedule was stopped while waiting
 */
bool BackupScheduler::WaitForNextRun()
{
    std::unique_lock<std::mutex> lock(_mutex);
    return false == _stopCondition.wait_for(lock, _interval, [this]() { return _stopRequested; });
}
