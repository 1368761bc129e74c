// file RunHistoryRepository.cpp

#include "AutoBackup/RunHistoryRepository.hpp"

#include "SQLiteSession/SQLiteConnection.hpp"
#include "SQLiteSession/SQLiteError.hpp"

namespace
{
constexpr int SchemaVersion = 1;

constexpr const char* SqlCreateSchema = "CREATE TABLE IF NOT EXISTS runs ("
                                        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                                        "trigger_source TEXT NOT NULL,"
                                        "started_at TEXT NOT NULL,"
                                        "duration_ms INTEGER NOT NULL,"
                                        "status TEXT NOT NULL,"
                                        "reason TEXT NOT NULL,"
                                        "directory TEXT NOT NULL);"
                                        "CREATE TABLE IF NOT EXISTS artifacts ("
                                        "run_id INTEGER NOT NULL REFERENCES runs(id) ON DELETE CASCADE,"
                                        "name TEXT NOT NULL,"
                                        "size INTEGER NOT NULL,"
                                        "hash TEXT NOT NULL,"
                                        "PRIMARY KEY(run_id, name));";

constexpr const char* SqlInsertRun = "INSERT INTO runs(trigger_source, started_at, duration_ms, status, reason, directory) "
                                     "VALUES(?1, ?2, ?3, ?4, ?5, ?6);";
constexpr const char* SqlInsertArtifact = "INSERT INTO artifacts(run_id, name, size, hash) VALUES(?1, ?2, ?3, ?4);";

constexpr const char* StatusVerified = "verified";
constexpr const char* StatusFailed = "failed";
}

RunHistoryRepository::RunHistoryRepository(SQLiteSession& databaseSession) : _databaseSession(databaseSession)
{
}

bool RunHistoryRepository::InitializeSchema()
{
    try
    {
        auto& connection = _databaseSession.Acquire();
        if (SchemaVersion <= connection.UserVersion())
        {
            return true;
        }

        SQLiteTransaction transaction(connection);
        connection.Execute(SqlCreateSchema);
        connection.SetUserVersion(SchemaVersion);
        transaction.Commit();
        return true;
    }
    catch (const SQLiteError&)
    {
        return false;
    }
}

bool RunHistoryRepository::RecordRun(const RunRecord& runRecord)
{
    try
    {
        auto& connection = _databaseSession.Acquire();
        SQLiteTransaction transaction(connection);

        auto runStatement = connection.Prepare(SqlInsertRun);
        runStatement.Bind(1, TriggerSourceToString(runRecord.trigger));
        runStatement.Bind(2, runRecord.startedAt);
        runStatement.Bind(3, runRecord.durationMs);
        runStatement.Bind(4, std::string((true == runRecord.succeeded) ? StatusVerified : StatusFailed));
        runStatement.Bind(5, runRecord.reason);
        runStatement.Bind(6, runRecord.snapshotDirectory);
        runStatement.Run();

        const std::int64_t runId = connection.LastInsertRowId();
        auto artifactStatement = connection.Prepare(SqlInsertArtifact);
        for (const auto& artifact : runRecord.artifacts)
        {
            artifactStatement.Bind(1, runId);
            artifactStatement.Bind(2, artifact.name);
            artifactStatement.Bind(3, static_cast<std::int64_t>(artifact.size));
            artifactStatement.Bind(4, artifact.hash);
            artifactStatement.Run();
            artifactStatement.Reset();
        }

        transaction.Commit();
        return true;
    }
    catch (const SQLiteError&)
    {
        return false;
    }
}

std::vector<RunRecord> RunHistoryRepository::GetRecentRuns(std::size_t limit)
{
    auto& connection = _databaseSession.Acquire();
    auto statement = connection.Prepare("SELECT id, trigger_source, started_at, duration_ms, status, reason, directory "
                                        "FROM runs ORDER BY id DESC LIMIT ?1;");
    statement.Bind(1, static_cast<std::int64_t>(limit));

    std::vector<RunRecord> results;
    while (statement.Step())
    {
        RunRecord runRecord{};
        runRecord.id = statement.Integer(0);
        runRecord.trigger = StringToTriggerSource(statement.Text(1));
        runRecord.startedAt = statement.Text(2);
        runRecord.durationMs = statement.Integer(3);
        runRecord.succeeded = (StatusVerified == statement.Text(4));
        runRecord.reason = statement.Text(5);
        runRecord.snapshotDirectory = statement.Text(6);
        results.push_back(runRecord);
    }

    for (auto& runRecord : results)
    {
        auto artifactStatement = connection.Prepare("SELECT name, size, hash FROM artifacts WHERE run_id=?1 ORDER BY name;");
        artifactStatement.Bind(1, runRecord.id);
        while (artifactStatement.Step())
        {
            runRecord.artifacts.push_back({artifactStatement.Text(0),
                                           static_cast<std::uintmax_t>(artifactStatement.Integer(1)),
                                           artifactStatement.Text(2)});
        }
    }

    return results;
}
