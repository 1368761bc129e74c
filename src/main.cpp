// file main.cpp:

#include "AutoBackup/ArtifactExporter.hpp"
#include "AutoBackup/AutoBackup.hpp"
#include "AutoBackup/BackupErrors.hpp"
#include "AutoBackup/BackupOrchestrator.hpp"
#include "AutoBackup/BackupScheduler.hpp"
#include "AutoBackup/DebounceCoordinator.hpp"
#include "AutoBackup/ExecutionEnvironment.hpp"
#include "AutoBackup/Logging.hpp"
#include "AutoBackup/OuterInvoker.hpp"
#include "AutoBackup/PrincipalProvider.hpp"
#include "AutoBackup/RetentionManager.hpp"
#include "AutoBackup/RunHistoryRepository.hpp"
#include "AutoBackup/SnapshotVerifier.hpp"
#include "ChangeWatcher/ChangeWatcher.hpp"
#include "ChangeWatcher/CommandWatchBackend.hpp"
#include "ChangeWatcher/InotifyWatchBackend.hpp"
#include "CommandRunner/CommandRunner.hpp"
#include "FileHasher/FileHasher.hpp"
#include "SQLiteSession/SQLiteSession.hpp"
#include "SnapshotDirectoryProvider/SnapshotDirectoryProvider.hpp"
#include "TimestampProvider/TimestampProvider.hpp"
#include "cxxopts.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <pthread.h>

namespace fs = std::filesystem;

namespace
{

constexpr const char* HistoryDatabaseFileName = "backup-history.db";

/**
 * @brief Everything the subcommands need, resolved from the command line.
 */
struct ApplicationConfig
{
    std::string command;
    bool verbose;
    std::string expectedUser;
    OrchestratorConfig orchestrator;
    InvokerConfig invoker;
    WatchConfig watch;
    ScheduleConfig schedule;
    std::string container;
    std::string containerEngine;
    std::size_t historyLimit;

    ApplicationConfig()
        : verbose(false)
        , expectedUser("1000")
        , containerEngine("docker")
        , historyLimit(20)
    {
    }
};

/**
 * @brief Outcome of command-line parsing.
 */
enum class ParseStatus
{
    Parsed,     /**< A command was given and every option parsed */
    HelpShown,  /**< --help was requested */
    Invalid     /**< Unknown option, malformed value or missing command */
};

/**
 * @brief Parses command-line arguments using cxxopts.
 *
 * @param[in] argc Argument count.
 * @param[in] argv Argument values.
 * @param[out] helpText Usage text, for callers that reject the parsed values.
 * @param[out] parseResult Parsed options, set only when ParseStatus::Parsed is returned.
 * @return Whether a command can run, help was shown, or the arguments were rejected.
 */
ParseStatus ParseCommandLineOptions(int argc, char* argv[], std::string& helpText, std::optional<cxxopts::ParseResult>& parseResult)
{
    cxxopts::Options options("autobackup", "Change-triggered application backups");
    options.positional_help("<run|watch|schedule|orchestrate|prune|history>");

    // clang-format off
    options.add_options()
        ("command",                 "Command to execute", cxxopts::value<std::string>())
        ("b,backup-root",           "Backup root on the host", cxxopts::value<std::string>())
        ("environment-backup-root", "Backup root inside the execution environment", cxxopts::value<std::string>()->default_value("/backup"))
        ("w,watch-root",            "Directory tree watched for changes", cxxopts::value<std::string>()->default_value("/home/node/.n8n"))
        ("min-interval",            "Minimum seconds between change-triggered backups", cxxopts::value<int>()->default_value("150"))
        ("max-age-days",            "Snapshots older than this many days are pruned", cxxopts::value<int>()->default_value("7"))
        ("u,expected-user",         "User (uid or name) the orchestrator must run as", cxxopts::value<std::string>()->default_value("1000"))
        ("principal",               "User the environment runs the orchestrator as", cxxopts::value<std::string>()->default_value("node"))
        ("c,container",             "Container running the application, empty runs on the host", cxxopts::value<std::string>()->default_value("n8n"))
        ("container-engine",        "Container engine executable", cxxopts::value<std::string>()->default_value("docker"))
        ("app-cli",                 "Application export tool", cxxopts::value<std::string>()->default_value("n8n"))
        ("state-dir",               "Application state directory archived in full", cxxopts::value<std::string>()->default_value("/home/node/.n8n"))
        ("orchestrator-binary",     "Path of this tool inside the environment", cxxopts::value<std::string>()->default_value("autobackup"))
        ("orchestrator-command",    "Shell command replacing the default orchestrator invocation", cxxopts::value<std::string>())
        ("stage-orchestrator",      "Host binary copied into the environment before each run", cxxopts::value<std::string>())
        ("watch-command",           "Shell command of an external watcher helper, default is native inotify", cxxopts::value<std::string>())
        ("watch-teardown",          "Shell command removing the watcher helper's resources", cxxopts::value<std::string>())
        ("restart-delay",           "Seconds to wait before re-establishing a failed watch", cxxopts::value<int>()->default_value("5"))
        ("interval",                "Seconds between scheduled backups", cxxopts::value<int>()->default_value("3600"))
        ("history-db",              "Run history database", cxxopts::value<std::string>())
        ("no-history",              "Do not record runs")
        ("history-limit",           "Number of runs shown by history", cxxopts::value<std::size_t>()->default_value("20"))
        ("v,verbose",               "Verbose output")
        ("h,help",                  "Print help");
    // clang-format on

    options.parse_positional({"command"});
    helpText = options.help();

    try
    {
        cxxopts::ParseResult parsed = options.parse(argc, argv);
        if (0 < parsed.count("help"))
        {
            std::cout << helpText << '\n';
            return ParseStatus::HelpShown;
        }
        if (0 == parsed.count("command"))
        {
            std::cerr << "No command given\n" << helpText << '\n';
            return ParseStatus::Invalid;
        }
        parseResult = std::move(parsed);
        return ParseStatus::Parsed;
    }
    catch (const cxxopts::exceptions::exception& error)
    {
        std::cerr << error.what() << '\n' << helpText << '\n';
        return ParseStatus::Invalid;
    }
}

std::vector<std::string> ShellCommand(const std::string& commandLine)
{
    return {"/bin/sh", "-c", commandLine};
}

std::vector<std::string> BuildOrchestratorCommand(const ApplicationConfig& config, const std::string& orchestratorBinary)
{
    std::vector<std::string> command = {orchestratorBinary,
                                        "orchestrate",
                                        "--backup-root",
                                        config.invoker.environmentBackupRoot.string(),
                                        "--expected-user",
                                        config.expectedUser,
                                        "--max-age-days",
                                        std::to_string(config.orchestrator.maxAgeDays),
                                        "--app-cli",
                                        config.orchestrator.appCli,
                                        "--state-dir",
                                        config.orchestrator.stateDir.string()};
    if (true == config.verbose)
    {
        command.emplace_back("--verbose");
    }
    return command;
}

/**
 * @brief Sets up the ApplicationConfig based on parsed command-line options and validates them.
 *
 * @param[in] parseResult The parsed command-line options.
 * @return std::optional<ApplicationConfig> if configuration is valid,
 *         otherwise returns an empty optional.
 */
std::optional<ApplicationConfig> SetupConfiguration(const cxxopts::ParseResult& parseResult)
{
    ApplicationConfig config;

    config.command = parseResult["command"].as<std::string>();
    config.verbose = (0 < parseResult.count("verbose"));
    config.expectedUser = parseResult["expected-user"].as<std::string>();
    config.container = parseResult["container"].as<std::string>();
    config.containerEngine = parseResult["container-engine"].as<std::string>();
    config.historyLimit = parseResult["history-limit"].as<std::size_t>();

    const std::optional<unsigned int> expectedUserId = ResolveUserId(config.expectedUser);
    if (false == expectedUserId.has_value())
    {
        std::cerr << "Unknown user: " << config.expectedUser << '\n';
        return std::nullopt;
    }

    const int minInterval = parseResult["min-interval"].as<int>();
    const int maxAgeDays = parseResult["max-age-days"].as<int>();
    const int restartDelay = parseResult["restart-delay"].as<int>();
    const int interval = parseResult["interval"].as<int>();
    if ((0 > minInterval) || (0 > maxAgeDays) || (0 > restartDelay) || (0 >= interval))
    {
        std::cerr << "Intervals and ages must not be negative\n";
        return std::nullopt;
    }
    if (1 > maxAgeDays)
    {
        std::cerr << "--max-age-days must be at least 1\n";
        return std::nullopt;
    }

    const bool orchestrating = ("orchestrate" == config.command);
    if (true == parseResult.count("backup-root"))
    {
        const fs::path backupRoot = fs::path(parseResult["backup-root"].as<std::string>());
        config.invoker.hostBackupRoot = backupRoot;
        config.orchestrator.backupRoot = backupRoot;
    }
    else if (true == orchestrating)
    {
        config.orchestrator.backupRoot = fs::path(parseResult["environment-backup-root"].as<std::string>());
    }
    else
    {
        std::cerr << "--backup-root is required\n";
        return std::nullopt;
    }

    config.orchestrator.expectedUserId = expectedUserId.value();
    config.orchestrator.maxAgeDays = maxAgeDays;
    config.orchestrator.appCli = parseResult["app-cli"].as<std::string>();
    config.orchestrator.stateDir = fs::path(parseResult["state-dir"].as<std::string>());

    config.invoker.environmentBackupRoot = fs::path(parseResult["environment-backup-root"].as<std::string>());
    config.invoker.principal = parseResult["principal"].as<std::string>();
    if (true == config.container.empty())
    {
        // Without a container the host backup root is the environment backup root.
        config.invoker.environmentBackupRoot = config.invoker.hostBackupRoot;
    }

    std::string orchestratorBinary = parseResult["orchestrator-binary"].as<std::string>();
    if (true == parseResult.count("stage-orchestrator"))
    {
        config.invoker.stageSource = fs::path(parseResult["stage-orchestrator"].as<std::string>());
        config.invoker.stageTarget = fs::path("/tmp") / config.invoker.stageSource.filename();
        orchestratorBinary = config.invoker.stageTarget.string();
    }
    if (true == parseResult.count("orchestrator-command"))
    {
        config.invoker.orchestratorCommand = ShellCommand(parseResult["orchestrator-command"].as<std::string>());
    }
    else
    {
        config.invoker.orchestratorCommand = BuildOrchestratorCommand(config, orchestratorBinary);
    }

    if (false == parseResult.count("no-history"))
    {
        config.invoker.historyDatabase = (true == parseResult.count("history-db"))
                                             ? fs::path(parseResult["history-db"].as<std::string>())
                                             : config.invoker.hostBackupRoot / HistoryDatabaseFileName;
    }

    config.watch.watchRoot = fs::path(parseResult["watch-root"].as<std::string>());
    config.watch.minInterval = std::chrono::seconds(minInterval);
    config.watch.restartDelay = std::chrono::seconds(restartDelay);
    if (true == parseResult.count("watch-command"))
    {
        config.watch.helperCommand = ShellCommand(parseResult["watch-command"].as<std::string>());
    }
    if (true == parseResult.count("watch-teardown"))
    {
        config.watch.helperTeardown = ShellCommand(parseResult["watch-teardown"].as<std::string>());
    }

    config.schedule.interval = std::chrono::seconds(interval);

    return config;
}

/**
 * @brief Block termination signals in every thread so the main thread can sigwait for them.
 */
sigset_t BlockTerminationSignals()
{
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGHUP);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    return signals;
}

int WaitForTerminationSignal(const sigset_t& signals, const std::shared_ptr<spdlog::logger>& logger)
{
    int signalNumber = 0;
    sigwait(&signals, &signalNumber);
    logger->info("Received signal {}, cleaning up...", signalNumber);
    return signalNumber;
}

/**
 * @brief Host-side wiring shared by run, watch and schedule.
 */
class InvokerContext
{
  public:
    InvokerContext(const ApplicationConfig& config, std::shared_ptr<spdlog::logger> logger) : _logger(std::move(logger))
    {
        if (true == config.container.empty())
        {
            _environment = std::make_unique<HostExecutionEnvironment>(_commandRunner, _logger);
        }
        else
        {
            _environment = std::make_unique<ContainerExecutionEnvironment>(_commandRunner, config.container, config.containerEngine);
        }

        if (false == config.invoker.historyDatabase.empty())
        {
            OpenHistory(config.invoker.historyDatabase);
        }

        _invoker = std::make_unique<OuterInvoker>(config.invoker, *_environment, _fileHasher, _timestampProvider, _logger, _runHistory.get());
    }

    OuterInvoker& Invoker()
    {
        return *_invoker;
    }

    CommandRunner& Runner()
    {
        return _commandRunner;
    }

  private:
    void OpenHistory(const fs::path& databasePath)
    {
        try
        {
            std::error_code errorCode;
            fs::create_directories(databasePath.parent_path(), errorCode);
            _historySession = std::make_unique<SQLiteSession>(databasePath);
            _runHistory = std::make_unique<RunHistoryRepository>(*_historySession);
            if (true == _runHistory->InitializeSchema())
            {
                return;
            }
            _logger->warn("Cannot initialize run history in {}, runs will not be recorded", databasePath.string());
        }
        catch (const std::runtime_error& error)
        {
            _logger->warn("Cannot open run history {}: {}", databasePath.string(), error.what());
        }
        _runHistory.reset();
        _historySession.reset();
    }

    std::shared_ptr<spdlog::logger> _logger;
    PosixCommandRunner _commandRunner;
    FileHasher _fileHasher;
    TimestampProvider _timestampProvider;
    std::unique_ptr<ExecutionEnvironment> _environment;
    std::unique_ptr<SQLiteSession> _historySession;
    std::unique_ptr<RunHistoryRepository> _runHistory;
    std::unique_ptr<OuterInvoker> _invoker;
};

int RunOnce(const ApplicationConfig& config, const std::shared_ptr<spdlog::logger>& logger)
{
    InvokerContext context(config, logger);
    const InvocationResult result = context.Invoker().TriggerBackup(TriggerSource::Manual);

    if (false == result.succeeded)
    {
        std::cerr << "Backup failed or could not be verified";
        if (result.reason != UnverifiedBackupReason)
        {
            std::cerr << ": " << result.reason;
        }
        std::cerr << '\n';
        return 1;
    }

    std::cout << "Backup completed and verified successfully\n";
    std::cout << "Backup location: " << result.directory.string() << "\n\n";
    std::cout << "Backup contents:\n";
    for (const auto& artifact : result.contents)
    {
        std::cout << "  " << artifact.name << "  " << artifact.size << " bytes  xxh64:" << artifact.hash << '\n';
    }
    return 0;
}

int RunWatch(const ApplicationConfig& config, const std::shared_ptr<spdlog::logger>& logger)
{
    const sigset_t signals = BlockTerminationSignals();
    InvokerContext context(config, logger);

    DebounceCoordinator debounceCoordinator(
        config.watch.minInterval, [&context]() { return context.Invoker().TriggerBackup(TriggerSource::Change).succeeded; }, logger);

    ChangeWatcher::BackendFactory backendFactory;
    if (true == config.watch.helperCommand.empty())
    {
        backendFactory = [logger]() { return std::make_unique<InotifyWatchBackend>(logger); };
    }
    else
    {
        backendFactory = [&config, &context, &logger]()
        { return std::make_unique<CommandWatchBackend>(config.watch.helperCommand, config.watch.helperTeardown, context.Runner(), logger); };
    }

    logger->info("Starting file watcher, debounce period {}s", config.watch.minInterval.count());
    ChangeWatcher changeWatcher(config.watch.watchRoot, backendFactory, config.watch.restartDelay, logger);
    changeWatcher.Start([&debounceCoordinator](const ChangeBatch&) { debounceCoordinator.OnChangeSignal(); });

    WaitForTerminationSignal(signals, logger);
    changeWatcher.Stop();
    return 0;
}

int RunSchedule(const ApplicationConfig& config, const std::shared_ptr<spdlog::logger>& logger)
{
    const sigset_t signals = BlockTerminationSignals();
    InvokerContext context(config, logger);

    BackupScheduler scheduler(config.schedule.interval, config.schedule.runOnStart,
                              [&context]() { return context.Invoker().TriggerBackup(TriggerSource::Timer).succeeded; }, logger);
    scheduler.Start();

    WaitForTerminationSignal(signals, logger);
    scheduler.Stop();
    return 0;
}

int RunOrchestrate(const ApplicationConfig& config, const std::shared_ptr<spdlog::logger>& logger)
{
    PosixCommandRunner commandRunner;
    PrincipalProvider principalProvider;
    TimestampProvider timestampProvider;
    SnapshotDirectoryProvider snapshotDirectoryProvider(timestampProvider);
    CommandArtifactExporter artifactExporter(commandRunner, config.orchestrator.appCli, config.orchestrator.stateDir, logger);
    RetentionManager retentionManager(logger);
    SnapshotVerifier snapshotVerifier(logger);

    BackupOrchestrator orchestrator(config.orchestrator, principalProvider, snapshotDirectoryProvider, artifactExporter, retentionManager,
                                    snapshotVerifier, logger);
    try
    {
        const SnapshotRun snapshotRun = orchestrator.RunBackup();
        std::cout << "Backup completed at " << snapshotRun.timestamp << '\n';
        return 0;
    }
    catch (const BackupError& error)
    {
        std::cerr << BackupErrorKindToString(error.Kind()) << ": " << error.what() << '\n';
        return 1;
    }
}

int RunPrune(const ApplicationConfig& config, const std::shared_ptr<spdlog::logger>& logger)
{
    RetentionManager retentionManager(logger);
    const fs::path snapshotRoot = config.invoker.HostSnapshotRoot();
    const PruneReport report = retentionManager.Prune(snapshotRoot, config.orchestrator.maxAgeDays);

    if (true == report.skipped)
    {
        std::cout << "No write permission on " << snapshotRoot.string() << ", nothing pruned\n";
        return 0;
    }
    std::cout << "Pruned " << report.removed.size() << " snapshot(s)";
    if (false == report.failed.empty())
    {
        std::cout << ", " << report.failed.size() << " could not be removed";
    }
    std::cout << '\n';
    return 0;
}

int RunHistory(const ApplicationConfig& config)
{
    if (true == config.invoker.historyDatabase.empty())
    {
        std::cerr << "Run history is disabled\n";
        return 1;
    }

    try
    {
        SQLiteSession session(config.invoker.historyDatabase);
        RunHistoryRepository repository(session);
        if (false == repository.InitializeSchema())
        {
            std::cerr << "Cannot open run history " << config.invoker.historyDatabase.string() << '\n';
            return 1;
        }

        for (const auto& run : repository.GetRecentRuns(config.historyLimit))
        {
            std::cout << run.startedAt << "  " << TriggerSourceToString(run.trigger) << "  " << (run.succeeded ? "verified" : "FAILED")
                      << "  " << run.durationMs << "ms  " << run.snapshotDirectory;
            if (false == run.reason.empty())
            {
                std::cout << "  (" << run.reason << ")";
            }
            std::cout << '\n';
            for (const auto& artifact : run.artifacts)
            {
                std::cout << "    " << artifact.name << "  " << artifact.size << " bytes  xxh64:" << artifact.hash << '\n';
            }
        }
        return 0;
    }
    catch (const std::runtime_error& error)
    {
        std::cerr << "Cannot read run history: " << error.what() << '\n';
        return 1;
    }
}

} // namespace

int main(int argc, char* argv[])
{
    std::string helpText;
    std::optional<cxxopts::ParseResult> parseResult;
    const ParseStatus parseStatus = ParseCommandLineOptions(argc, argv, helpText, parseResult);

    if (ParseStatus::HelpShown == parseStatus)
    {
        return 0;
    }
    if (ParseStatus::Invalid == parseStatus)
    {
        return 1; // Error and usage already printed.
    }

    std::optional<ApplicationConfig> configuration = SetupConfiguration(parseResult.value());

    if (false == configuration.has_value())
    {
        return 1; // Configuration failed, error message already printed.
    }

    const ApplicationConfig& config = configuration.value();
    std::shared_ptr<spdlog::logger> logger = CreateConsoleLogger("autobackup", config.verbose);

    if ("run" == config.command)
    {
        return RunOnce(config, logger);
    }
    if ("watch" == config.command)
    {
        return RunWatch(config, logger);
    }
    if ("schedule" == config.command)
    {
        return RunSchedule(config, logger);
    }
    if ("orchestrate" == config.command)
    {
        return RunOrchestrate(config, logger);
    }
    if ("prune" == config.command)
    {
        return RunPrune(config, logger);
    }
    if ("history" == config.command)
    {
        return RunHistory(config);
    }

    std::cerr << "Unknown command: " << config.command << '\n' << helpText << '\n';
    return 1;
}
