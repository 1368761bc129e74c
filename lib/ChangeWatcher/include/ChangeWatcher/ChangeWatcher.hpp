#pragma once

#include "ChangeWatcher/WatchBackend.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include <spdlog/logger.h>

/**
 * @brief Supervised watch loop that reports one change signal per batch of filesystem events.
 *
 * The backend is re-created after every failure, after a fixed delay, for as
 * long as the watcher runs. Batches are handed to the handler one at a time
 * on the loop's thread; the next wait starts only after the handler returns.
 */
class ChangeWatcher
{
  public:
    using BackendFactory = std::function<std::unique_ptr<WatchBackend>()>;
    using ChangeHandler = std::function<void(const ChangeBatch&)>;

    static constexpr std::chrono::milliseconds PollInterval{500};

    /**
     * @param[in] rootPath Directory tree to watch
     * @param[in] backendFactory Creates a fresh backend for every (re)start
     * @param[in] restartDelay Wait between a failure and the next attempt
     * @param[in] logger Logger for watch state changes
     */
    ChangeWatcher(fs::path rootPath, BackendFactory backendFactory, std::chrono::milliseconds restartDelay,
                  std::shared_ptr<spdlog::logger> logger);
    ~ChangeWatcher();

    ChangeWatcher(const ChangeWatcher&) = delete;
    ChangeWatcher& operator=(const ChangeWatcher&) = delete;

    /**
     * @brief Watch on the calling thread until Stop() is called.
     *
     * @param[in] onChange Handler invoked once per batch
     */
    void Run(const ChangeHandler& onChange);

    /**
     * @brief Watch on a background thread.
     *
     * @param[in] onChange Handler invoked once per batch, on the background thread
     */
    void Start(ChangeHandler onChange);

    /**
     * @brief Cancel the watch and join the background thread, if any.
     *
     * A handler that is already running finishes first.
     */
    void Stop();

    std::size_t RestartCount() const;
    std::size_t BatchCount() const;

  private:
    bool StopRequested() const;
    bool WaitBeforeRestart();

    fs::path _rootPath;
    BackendFactory _backendFactory;
    std::chrono::milliseconds _restartDelay;
    std::shared_ptr<spdlog::logger> _logger;

    std::atomic<bool> _stopRequested;
    std::atomic<std::size_t> _restartCount;
    std::atomic<std::size_t> _batchCount;
    mutable std::mutex _stopMutex;
    std::condition_variable _stopCondition;
    std::thread _thread;
};
