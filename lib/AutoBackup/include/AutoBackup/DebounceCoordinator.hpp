#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include <spdlog/logger.h>

/**
 * @brief What the coordinator did with one change signal.
 */
enum class DebounceDecision
{
    Triggered, /**< A backup was run */
    Suppressed /**< The signal arrived inside the cooldown window and was dropped */
};

inline const char* DebounceDecisionToString(DebounceDecision decision)
{
    switch (decision)
    {
    case DebounceDecision::Triggered:
        return "Triggered";
    case DebounceDecision::Suppressed:
        return "Suppressed";
    }
    return "Unknown";
}

/**
 * @brief Debounce bookkeeping for one watch loop.
 */
struct DebounceState
{
    using TimePoint = std::chrono::steady_clock::time_point;

    std::optional<TimePoint> lastTriggerTime; /**< When the last triggered backup returned, empty if never */
    std::chrono::seconds minInterval;         /**< Required spacing between triggered backups */
};

/**
 * @brief Leading-edge debounce with cooldown measured from the end of the last triggered backup.
 *
 * A signal triggers when no backup ran yet or at least minInterval elapsed
 * since the previous triggered backup returned. Everything else is
 * suppressed. Failed backups consume the cooldown like successful ones.
 * Not thread-safe: signals are expected from a single consumer.
 */
class DebounceCoordinator
{
  public:
    using Clock = std::function<DebounceState::TimePoint()>;
    using Trigger = std::function<bool()>;

    /**
     * @param[in] minInterval Required spacing between triggered backups
     * @param[in] trigger Runs one backup synchronously and reports success
     * @param[in] logger Logger for triggered and suppressed signals
     * @param[in] clock Monotonic clock, defaults to steady_clock::now
     */
    DebounceCoordinator(std::chrono::seconds minInterval, Trigger trigger, std::shared_ptr<spdlog::logger> logger, Clock clock = nullptr);

    /**
     * @brief Handle one change signal.
     *
     * @return Whether a backup was triggered
     */
    DebounceDecision OnChangeSignal();

    const DebounceState& State() const;

  private:
    DebounceState _state;
    Trigger _trigger;
    std::shared_ptr<spdlog::logger> _logger;
    Clock _clock;
};
