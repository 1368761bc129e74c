/**
 * @file run_history_tests.cpp
 * @brief Tests for the SQLite run history and the enum conversions it stores.
 */
#include "AutoBackup/AutoBackup.hpp"
#include "AutoBackup/BackupErrors.hpp"
#include "AutoBackup/RunHistoryRepository.hpp"
#include "FileHasher/FileHasher.hpp"
#include "SQLiteSession/SQLiteConnection.hpp"
#include "SQLiteSession/SQLiteError.hpp"
#include "SQLiteSession/SQLiteSession.hpp"
#include "SQLiteSession/SQLiteStatement.hpp"
#include "helpers/TestHelpers.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

class RunHistoryRepositoryTest : public ::testing::Test
{
  protected:
    fs::path directory;
    fs::path databasePath;

    void SetUp() override
    {
        directory = MakeTestDirectory("history");
        databasePath = directory / "backup-history.db";
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(directory, ec);
    }

    static RunRecord MakeRun(TriggerSource trigger, bool succeeded, const std::string& snapshot)
    {
        RunRecord runRecord{};
        runRecord.trigger = trigger;
        runRecord.startedAt = "2024-06-15 12:00:00";
        runRecord.durationMs = 4200;
        runRecord.succeeded = succeeded;
        runRecord.reason = succeeded ? "" : "backup failed or could not be verified";
        runRecord.snapshotDirectory = snapshot;
        if (true == succeeded)
        {
            runRecord.artifacts = {{"workflows.json", 120, "a1"}, {"credentials.json", 2, "b2"}, {"full_backup.tar.gz", 4096, "c3"}};
        }
        return runRecord;
    }
};

TEST_F(RunHistoryRepositoryTest, StoresRunsNewestFirst)
{
    SQLiteSession session(databasePath);
    RunHistoryRepository history(session);
    ASSERT_TRUE(history.InitializeSchema());

    ASSERT_TRUE(history.RecordRun(MakeRun(TriggerSource::Manual, true, "/backup/auto-backups/20240615_120000")));
    ASSERT_TRUE(history.RecordRun(MakeRun(TriggerSource::Change, false, "/backup/auto-backups/20240615_120000")));

    const std::vector<RunRecord> runs = history.GetRecentRuns(10);
    ASSERT_EQ(2u, runs.size());

    EXPECT_GT(runs[0].id, runs[1].id);
    EXPECT_EQ(TriggerSource::Change, runs[0].trigger);
    EXPECT_FALSE(runs[0].succeeded);
    EXPECT_EQ("backup failed or could not be verified", runs[0].reason);
    EXPECT_TRUE(runs[0].artifacts.empty());

    EXPECT_EQ(TriggerSource::Manual, runs[1].trigger);
    EXPECT_TRUE(runs[1].succeeded);
    EXPECT_EQ(4200, runs[1].durationMs);
    EXPECT_EQ("2024-06-15 12:00:00", runs[1].startedAt);
    ASSERT_EQ(3u, runs[1].artifacts.size());
    EXPECT_EQ("credentials.json", runs[1].artifacts[0].name);
    EXPECT_EQ(4096u, runs[1].artifacts[1].size);
    EXPECT_EQ("a1", runs[1].artifacts[2].hash);
}

TEST_F(RunHistoryRepositoryTest, LimitsNumberOfRuns)
{
    SQLiteSession session(databasePath);
    RunHistoryRepository history(session);
    ASSERT_TRUE(history.InitializeSchema());

    for (int index = 0; index < 5; ++index)
    {
        ASSERT_TRUE(history.RecordRun(MakeRun(TriggerSource::Timer, true, "/backup/auto-backups/2024061" + std::to_string(index) + "_000000")));
    }

    const std::vector<RunRecord> runs = history.GetRecentRuns(2);
    ASSERT_EQ(2u, runs.size());
    EXPECT_EQ("/backup/auto-backups/20240614_000000", runs[0].snapshotDirectory);
}

TEST_F(RunHistoryRepositoryTest, DuplicateArtifactRollsBackWholeRun)
{
    SQLiteSession session(databasePath);
    RunHistoryRepository history(session);
    ASSERT_TRUE(history.InitializeSchema());

    RunRecord broken = MakeRun(TriggerSource::Manual, true, "/backup/auto-backups/20240615_120000");
    broken.artifacts.push_back({"workflows.json", 1, "dd"});

    EXPECT_FALSE(history.RecordRun(broken));
    EXPECT_TRUE(history.GetRecentRuns(10).empty());
    EXPECT_TRUE(history.RecordRun(MakeRun(TriggerSource::Manual, true, "/backup/auto-backups/20240615_120001")));
}

TEST_F(RunHistoryRepositoryTest, HistorySurvivesReopening)
{
    {
        SQLiteSession session(databasePath);
        RunHistoryRepository history(session);
        ASSERT_TRUE(history.InitializeSchema());
        ASSERT_TRUE(history.RecordRun(MakeRun(TriggerSource::Manual, true, "/backup/auto-backups/20240615_120000")));
    }

    SQLiteSession session(databasePath);
    RunHistoryRepository history(session);
    ASSERT_TRUE(history.InitializeSchema());
    EXPECT_EQ(1u, history.GetRecentRuns(10).size());
}

TEST_F(RunHistoryRepositoryTest, RecordsFromSeveralThreads)
{
    SQLiteSession session(databasePath);
    RunHistoryRepository history(session);
    ASSERT_TRUE(history.InitializeSchema());

    std::vector<std::thread> threads;
    for (int index = 0; index < 4; ++index)
    {
        threads.emplace_back([&history, index]()
                             { EXPECT_TRUE(history.RecordRun(MakeRun(TriggerSource::Change, true, "run-" + std::to_string(index)))); });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(4u, history.GetRecentRuns(10).size());
}

TEST_F(RunHistoryRepositoryTest, UnopenableDatabaseFailsSchemaInitialization)
{
    SQLiteSession session(directory / "missing" / "nested" / "history.db");
    RunHistoryRepository history(session);

    EXPECT_FALSE(history.InitializeSchema());
}

TEST_F(RunHistoryRepositoryTest, SchemaVersionIsRecorded)
{
    SQLiteSession session(databasePath);
    RunHistoryRepository history(session);

    EXPECT_EQ(0, session.Acquire().UserVersion());
    ASSERT_TRUE(history.InitializeSchema());
    EXPECT_EQ(1, session.Acquire().UserVersion());
    EXPECT_TRUE(history.InitializeSchema());
}

TEST_F(RunHistoryRepositoryTest, TransactionRollsBackWithoutCommit)
{
    SQLiteSession session(databasePath);
    SQLiteConnection& connection = session.Acquire();
    connection.Execute("CREATE TABLE notes(text TEXT NOT NULL);");

    {
        SQLiteTransaction transaction(connection);
        connection.Execute("INSERT INTO notes VALUES('discarded');");
    }
    {
        SQLiteTransaction transaction(connection);
        auto insert = connection.Prepare("INSERT INTO notes VALUES(?1);");
        insert.Bind(1, std::string("kept"));
        insert.Run();
        insert.Reset();
        transaction.Commit();
    }

    auto select = connection.Prepare("SELECT text FROM notes;");
    ASSERT_TRUE(select.Step());
    EXPECT_EQ("kept", select.Text(0));
    EXPECT_FALSE(select.Step());
}

TEST_F(RunHistoryRepositoryTest, InvalidSqlReportsResultCode)
{
    SQLiteSession session(databasePath);

    try
    {
        session.Acquire().Prepare("SELECT FROM nowhere;");
        FAIL() << "Expected SQLiteError";
    }
    catch (const SQLiteError& error)
    {
        EXPECT_NE(0, error.ResultCode());
    }
}

TEST(FileHasherTest, FingerprintsContentAndSize)
{
    const fs::path directory = MakeTestDirectory("hasher");
    CreateFile(directory / "a.json", "[1,2,3]");
    CreateFile(directory / "b.json", "[1,2,3]");
    CreateFile(directory / "c.json", "[1,2,4]");
    FileHasher fileHasher;

    const auto first = fileHasher.Fingerprint(directory / "a.json");
    const auto same = fileHasher.Fingerprint(directory / "b.json");
    const auto different = fileHasher.Fingerprint(directory / "c.json");

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(same.has_value());
    ASSERT_TRUE(different.has_value());
    EXPECT_EQ(7u, first->size);
    EXPECT_EQ(first->hash, same->hash);
    EXPECT_NE(first->hash, different->hash);
    EXPECT_EQ(16u, first->hash.size());
    EXPECT_FALSE(fileHasher.Fingerprint(directory / "missing.json").has_value());

    fs::remove_all(directory);
}

TEST(FileHasherTest, EmptyFileAndDigestFormat)
{
    const fs::path directory = MakeTestDirectory("hasher");
    CreateFile(directory / ".backup_verified", "");
    FileHasher fileHasher;

    const auto marker = fileHasher.Fingerprint(directory / ".backup_verified");

    ASSERT_TRUE(marker.has_value());
    EXPECT_EQ(0u, marker->size);
    EXPECT_EQ("0000000000000001", FileHasher::FormatDigest(1));
    EXPECT_EQ("ffffffffffffffff", FileHasher::FormatDigest(~0ull));

    fs::remove_all(directory);
}

TEST(EnumConversionTest, TriggerSourceToStringAndBack)
{
    const std::vector<TriggerSource> allSources = {TriggerSource::Manual, TriggerSource::Change, TriggerSource::Timer};

    for (const auto& triggerSource : allSources)
    {
        ASSERT_EQ(triggerSource, StringToTriggerSource(TriggerSourceToString(triggerSource)));
    }
}

TEST(EnumConversionTest, BackupErrorKindToStringAndBack)
{
    const std::vector<BackupErrorKind> allKinds = {BackupErrorKind::Permission,   BackupErrorKind::DirectoryCreation,
                                                   BackupErrorKind::Export,       BackupErrorKind::Verification,
                                                   BackupErrorKind::WatchBackend, BackupErrorKind::Prune};

    for (const auto& errorKind : allKinds)
    {
        ASSERT_EQ(errorKind, StringToBackupErrorKind(BackupErrorKindToString(errorKind)));
    }
}

TEST(EnumConversionTest, ArtifactFileNames)
{
    EXPECT_STREQ("workflows.json", ArtifactFileName(ArtifactKind::Workflows));
    EXPECT_STREQ("credentials.json", ArtifactFileName(ArtifactKind::Credentials));
    EXPECT_STREQ("full_backup.tar.gz", ArtifactFileName(ArtifactKind::FullArchive));
}
