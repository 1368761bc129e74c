#include "ChangeWatcher/ChangeWatcher.hpp"

#include "AutoBackup/BackupErrors.hpp"

#include <utility>

ChangeWatcher::ChangeWatcher(fs::path rootPath, BackendFactory backendFactory, std::chrono::milliseconds restartDelay,
                             std::shared_ptr<spdlog::logger> logger)
    : _rootPath(std::move(rootPath)), _backendFactory(std::move(backendFactory)), _restartDelay(restartDelay), _logger(std::move(logger)),
      _stopRequested(false), _restartCount(0), _batchCount(0)
{
}

ChangeWatcher::~ChangeWatcher()
{
    Stop();
}

void ChangeWatcher::Run(const ChangeHandler& onChange)
{
    std::unique_ptr<WatchBackend> backend;

    _logger->info("Monitoring {} for changes", _rootPath.string());
    while (false == StopRequested())
    {
        try
        {
            if (nullptr == backend)
            {
                backend = _backendFactory();
                backend->Open(_rootPath);
                _logger->debug("Watch established on {}", _rootPath.string());
            }

            ChangeBatch batch;
            if (WaitStatus::Changes == backend->WaitForChanges(PollInterval, batch))
            {
                ++_batchCount;
                for (const auto& event : batch.events)
                {
                    _logger->debug("{} {}", ChangeEventTypeToString(event.type), event.path.string());
                }
                onChange(batch);
            }
        }
        catch (const WatchBackendError& error)
        {
            if (nullptr != backend)
            {
                backend->Close();
                backend.reset();
            }
            ++_restartCount;
            _logger->warn("{}, sleeping {}ms before retry", error.what(), _restartDelay.count());
            if (false == WaitBeforeRestart())
            {
                break;
            }
        }
    }

    if (nullptr != backend)
    {
        backend->Close();
    }
    _logger->info("Stopped monitoring {}", _rootPath.string());
}

void ChangeWatcher::Start(ChangeHandler onChange)
{
    _stopRequested = false;
    _thread = std::thread([this, handler = std::move(onChange)]() { Run(handler); });
}

void ChangeWatcher::Stop()
{
    {
        std::lock_guard<std::mutex> lock(_stopMutex);
        _stopRequested = true;
    }
    _stopCondition.notify_all();

    if ((true == _thread.joinable()) && (std::this_thread::get_id() != _thread.get_id()))
    {
        _thread.join();
    }
}

std::size_t ChangeWatcher::RestartCount() const
{
    return _restartCount.load();
}

std::size_t ChangeWatcher::BatchCount() const
{
    return _batchCount.load();
}

bool ChangeWatcher::StopRequested() const
{
    return _stopRequested.load();
}

/**
 * @brief Sleep for the restart delay unless the watcher is stopped first.
 *
 * @return false if the watcher was stopped while waiting
 */
bool ChangeWatcher::WaitBeforeRestart()
{
    std::unique_lock<std::mutex> lock(_stopMutex);
    return false == _stopCondition.wait_for(lock, _restartDelay, [this]() { return _stopRequested.load(); });
}
