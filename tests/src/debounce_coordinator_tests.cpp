/**
 * @file debounce_coordinator_tests.cpp
 * @brief Tests for leading-edge debouncing of change signals.
 */
#include "AutoBackup/DebounceCoordinator.hpp"
#include "AutoBackup/Logging.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

using namespace std::chrono_literals;

class DebounceCoordinatorTest : public ::testing::Test
{
  protected:
    DebounceState::TimePoint now{};
    int triggerCount = 0;
    std::chrono::seconds runDuration{0};
    bool runSucceeds = true;

    DebounceCoordinator MakeCoordinator(std::chrono::seconds minInterval)
    {
        return DebounceCoordinator(
            minInterval,
            [this]()
            {
                ++triggerCount;
                now += runDuration;
                return runSucceeds;
            },
            CreateNullLogger("debounce-test"), [this]() { return now; });
    }

    void At(std::chrono::seconds offset)
    {
        now = DebounceState::TimePoint{} + offset;
    }
};

TEST_F(DebounceCoordinatorTest, FirstSignalTriggersImmediately)
{
    DebounceCoordinator coordinator = MakeCoordinator(150s);
    EXPECT_FALSE(coordinator.State().lastTriggerTime.has_value());

    EXPECT_EQ(DebounceDecision::Triggered, coordinator.OnChangeSignal());

    EXPECT_EQ(1, triggerCount);
    ASSERT_TRUE(coordinator.State().lastTriggerTime.has_value());
}

TEST_F(DebounceCoordinatorTest, SignalInsideWindowIsSuppressed)
{
    DebounceCoordinator coordinator = MakeCoordinator(150s);

    At(0s);
    EXPECT_EQ(DebounceDecision::Triggered, coordinator.OnChangeSignal());
    At(10s);
    EXPECT_EQ(DebounceDecision::Suppressed, coordinator.OnChangeSignal());
    At(149s);
    EXPECT_EQ(DebounceDecision::Suppressed, coordinator.OnChangeSignal());
    At(150s);
    EXPECT_EQ(DebounceDecision::Triggered, coordinator.OnChangeSignal());

    EXPECT_EQ(2, triggerCount);
}

TEST_F(DebounceCoordinatorTest, SuppressedSignalsAreNotQueued)
{
    DebounceCoordinator coordinator = MakeCoordinator(150s);

    At(0s);
    coordinator.OnChangeSignal();
    for (int second = 1; second < 150; second += 7)
    {
        At(std::chrono::seconds(second));
        coordinator.OnChangeSignal();
    }

    At(400s);
    EXPECT_EQ(1, triggerCount);
}

TEST_F(DebounceCoordinatorTest, CooldownStartsWhenRunCompletes)
{
    runDuration = 30s;
    DebounceCoordinator coordinator = MakeCoordinator(150s);

    At(0s);
    EXPECT_EQ(DebounceDecision::Triggered, coordinator.OnChangeSignal());
    EXPECT_EQ(DebounceState::TimePoint{} + 30s, coordinator.State().lastTriggerTime.value());

    At(170s);
    EXPECT_EQ(DebounceDecision::Suppressed, coordinator.OnChangeSignal());
    At(180s);
    EXPECT_EQ(DebounceDecision::Triggered, coordinator.OnChangeSignal());
}

TEST_F(DebounceCoordinatorTest, FailedRunConsumesCooldown)
{
    runSucceeds = false;
    DebounceCoordinator coordinator = MakeCoordinator(150s);

    At(0s);
    EXPECT_EQ(DebounceDecision::Triggered, coordinator.OnChangeSignal());
    At(10s);
    EXPECT_EQ(DebounceDecision::Suppressed, coordinator.OnChangeSignal());

    EXPECT_EQ(1, triggerCount);
}

TEST_F(DebounceCoordinatorTest, ThrowingRunIsContainedAndConsumesCooldown)
{
    DebounceCoordinator coordinator(
        150s,
        [this]() -> bool
        {
            ++triggerCount;
            throw std::runtime_error("environment unavailable");
        },
        CreateNullLogger("debounce-test"), [this]() { return now; });

    At(0s);
    EXPECT_EQ(DebounceDecision::Triggered, coordinator.OnChangeSignal());
    At(20s);
    EXPECT_EQ(DebounceDecision::Suppressed, coordinator.OnChangeSignal());
    EXPECT_EQ(1, triggerCount);
}

TEST_F(DebounceCoordinatorTest, ZeroIntervalNeverSuppresses)
{
    DebounceCoordinator coordinator = MakeCoordinator(0s);

    At(0s);
    coordinator.OnChangeSignal();
    coordinator.OnChangeSignal();
    coordinator.OnChangeSignal();

    EXPECT_EQ(3, triggerCount);
}

TEST(DebounceDecisionTest, ToString)
{
    EXPECT_STREQ("Triggered", DebounceDecisionToString(DebounceDecision::Triggered));
    EXPECT_STREQ("Suppressed", DebounceDecisionToString(DebounceDecision::Suppressed));
}
