#include "AutoBackup/DebounceCoordinator.hpp"

#include <stdexcept>
#include <utility>

DebounceCoordinator::DebounceCoordinator(std::chrono::seconds minInterval, Trigger trigger, std::shared_ptr<spdlog::logger> logger, Clock clock)
    : _state{std::nullopt, minInterval}, _trigger(std::move(trigger)), _logger(std::move(logger)), _clock(std::move(clock))
{
    if (nullptr == _clock)
    {
        _clock = []() { return std::chrono::steady_clock::now(); };
    }
}

DebounceDecision DebounceCoordinator::OnChangeSignal()
{
    const DebounceState::TimePoint now = _clock();

    if (true == _state.lastTriggerTime.has_value())
    {
        const auto elapsed = now - _state.lastTriggerTime.value();
        if (elapsed < _state.minInterval)
        {
            const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(_state.minInterval - elapsed);
            _logger->info("Changes detected, but waiting for debounce period ({}s, {}s remaining)", _state.minInterval.count(),
                          remaining.count());
            return DebounceDecision::Suppressed;
        }
    }

    _logger->info("Changes detected, running backup...");
    try
    {
        if (false == _trigger())
        {
            _logger->warn("Triggered backup did not succeed");
        }
    }
    catch (const std::runtime_error& error)
    {
        _logger->error("Triggered backup failed: {}", error.what());
    }

    _state.lastTriggerTime = _clock();
    return DebounceDecision::Triggered;
}

const DebounceState& DebounceCoordinator::State() const
{
    return _state;
}
