/**
 * @file snapshot_directory_tests.cpp
 * @brief Tests for snapshot naming and exclusive snapshot directory creation.
 */
#include "SnapshotDirectoryProvider/SnapshotDirectoryProvider.hpp"
#include "TimestampProvider/TimestampProvider.hpp"
#include "helpers/TestHelpers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

TEST(TimestampProviderTest, FormatsSnapshotNameAsSortableLocalTime)
{
    const std::string name = TimestampProvider::FormatSnapshotName(ReferenceTime());

    EXPECT_EQ("20240615_120000", name);
    EXPECT_TRUE(TimestampProvider::IsSnapshotName(name));
    EXPECT_EQ("2024-06-15 12:00:00", TimestampProvider::FormatReadable(ReferenceTime()));
}

TEST(TimestampProviderTest, LaterTimesSortAfterEarlierTimes)
{
    const auto base = ReferenceTime();

    EXPECT_LT(TimestampProvider::FormatSnapshotName(base), TimestampProvider::FormatSnapshotName(base + std::chrono::seconds(1)));
    EXPECT_LT(TimestampProvider::FormatSnapshotName(base), TimestampProvider::FormatSnapshotName(base + std::chrono::hours(36)));
}

TEST(TimestampProviderTest, RecognizesOnlyTimestampNames)
{
    EXPECT_TRUE(TimestampProvider::IsSnapshotName("20240101_000000"));

    EXPECT_FALSE(TimestampProvider::IsSnapshotName(""));
    EXPECT_FALSE(TimestampProvider::IsSnapshotName("backup-history.db"));
    EXPECT_FALSE(TimestampProvider::IsSnapshotName("20240101-000000"));
    EXPECT_FALSE(TimestampProvider::IsSnapshotName("20240101_00000"));
    EXPECT_FALSE(TimestampProvider::IsSnapshotName("2024010a_000000"));
    EXPECT_FALSE(TimestampProvider::IsSnapshotName("20240101_0000001"));
}

class SnapshotDirectoryProviderTest : public ::testing::Test
{
  protected:
    fs::path snapshotRoot;

    void SetUp() override
    {
        snapshotRoot = MakeTestDirectory("snapshots") / "auto-backups";
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(snapshotRoot.parent_path(), ec);
    }
};

TEST_F(SnapshotDirectoryProviderTest, CreatesRootAndTimestampNamedDirectory)
{
    ManualTimestampProvider clock(ReferenceTime());
    SnapshotDirectoryProvider provider(clock);

    const fs::path directory = provider.Create(snapshotRoot);

    EXPECT_EQ(snapshotRoot / "20240615_120000", directory);
    EXPECT_TRUE(fs::is_directory(directory));
    EXPECT_TRUE(fs::is_empty(directory));
}

TEST_F(SnapshotDirectoryProviderTest, WaitsForClockWhenNameIsTaken)
{
    ManualTimestampProvider clock(ReferenceTime());
    int sleeps = 0;
    SnapshotDirectoryProvider provider(clock,
                                       [&clock, &sleeps](std::chrono::milliseconds)
                                       {
                                           ++sleeps;
                                           clock.Advance(std::chrono::seconds(1));
                                       });

    const fs::path first = provider.Create(snapshotRoot);
    const fs::path second = provider.Create(snapshotRoot);

    EXPECT_EQ(1, sleeps);
    EXPECT_LT(first.filename().string(), second.filename().string());
    EXPECT_EQ("20240615_120001", second.filename().string());
}

TEST_F(SnapshotDirectoryProviderTest, NeverReusesNameOlderThanNewestSnapshot)
{
    fs::create_directories(snapshotRoot / "20240615_130000");
    ManualTimestampProvider clock(ReferenceTime());
    int sleeps = 0;
    SnapshotDirectoryProvider provider(clock, [&sleeps](std::chrono::milliseconds) { ++sleeps; });

    EXPECT_THROW(provider.Create(snapshotRoot), std::runtime_error);
    EXPECT_EQ(SnapshotDirectoryProvider::MaxPollAttempts, sleeps);
    EXPECT_EQ(std::vector<std::string>{"20240615_130000"}, GetDirectoryEntries(snapshotRoot));
}

TEST_F(SnapshotDirectoryProviderTest, ConsecutiveRunsGetStrictlyIncreasingNames)
{
    SteppingTimestampProvider clock(ReferenceTime());
    SnapshotDirectoryProvider provider(clock);

    std::vector<std::string> names;
    for (int run = 0; run < 5; ++run)
    {
        names.push_back(provider.Create(snapshotRoot).filename().string());
    }

    for (std::size_t index = 1; index < names.size(); ++index)
    {
        EXPECT_LT(names[index - 1], names[index]);
    }
    EXPECT_EQ(names.back(), SnapshotDirectoryProvider::LatestSnapshotName(snapshotRoot));
}

TEST_F(SnapshotDirectoryProviderTest, LatestSnapshotNameIgnoresForeignEntries)
{
    fs::create_directories(snapshotRoot / "20240101_000000");
    fs::create_directories(snapshotRoot / "zz-not-a-snapshot");
    CreateFile(snapshotRoot / "20991231_235959", "a file, not a directory");

    EXPECT_EQ("20240101_000000", SnapshotDirectoryProvider::LatestSnapshotName(snapshotRoot));
    EXPECT_EQ("", SnapshotDirectoryProvider::LatestSnapshotName(snapshotRoot / "missing"));
}
