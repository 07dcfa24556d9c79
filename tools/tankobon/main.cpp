#include <tankobon/archive/archiver.hpp>
#include <tankobon/archive/importer.hpp>
#include <tankobon/config/settings.hpp>
#include <tankobon/offline/file_system.hpp>
#include <tankobon/offline/paths.hpp>
#include <tankobon/offline/repository.hpp>
#include <tankobon/offline/storage_manager.hpp>
#include <tankobon/version.hpp>
#include <tankobon/worker/protocol.hpp>
#include <tankobon/worker/worker_channel.hpp>
#include <tankobon/worker/worker_process.hpp>
#include <tankobon/worker/worker_supervisor.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace tankobon;
using json = nlohmann::json;
namespace fs = std::filesystem;

void configureLogging(const std::string& level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("tankobon", sink);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%l] %v");
    spdlog::set_level(spdlog::level::from_str(level));
}

fs::path resolveWorkerExecutable(const config::Settings& settings) {
    if (!settings.worker.executable.empty()) {
        return settings.worker.executable;
    }
    if (auto dir = worker::currentExecutableDir()) {
        auto sibling = *dir / "tankobon-worker";
        std::error_code ec;
        if (fs::exists(sibling, ec)) {
            return sibling;
        }
    }
    return "tankobon-worker";
}

worker::SupervisorOptions supervisorOptions(const config::Settings& settings) {
    using std::chrono::milliseconds;

    worker::SupervisorOptions options;
    options.init.dataDir = settings.dataDir.string();
    options.init.dbPath = settings.dbPath.string();
    options.init.extensionPath = settings.catalog.source;
    options.init.extensionId = settings.catalog.extensionId;

    auto& wo = options.init.workerOptions;
    wo.concurrency = settings.downloads.concurrency;
    wo.pageConcurrency = settings.downloads.pageConcurrency;
    wo.pollingIntervalMs = settings.downloads.pollingIntervalMs;
    wo.maxRetries = settings.downloads.maxRetries;
    wo.retryDelayMs = settings.downloads.retryDelayMs;
    wo.pageTimeoutMs = settings.downloads.pageTimeoutMs;
    wo.frozenAfterMs = settings.downloads.frozenAfterMs;
    wo.progressFlushMs = settings.downloads.progressFlushMs;
    wo.cacheMaxEntries = static_cast<std::size_t>(settings.cache.maxEntries);
    wo.cacheTtlMs = settings.cache.ttlMs;

    options.autoRestart = settings.worker.autoRestart;
    options.maxRestarts = settings.worker.maxRestarts;
    options.restartWindow = milliseconds(settings.worker.restartWindowMs);
    options.restartDelay = milliseconds(settings.worker.restartDelayMs);
    options.killGrace = milliseconds(settings.worker.killGraceMs);
    options.readyTimeout = milliseconds(settings.ipc.readyTimeoutMs);
    options.startTimeout = milliseconds(settings.ipc.startTimeoutMs);
    options.stopTimeout = milliseconds(settings.ipc.stopTimeoutMs);
    options.queryTimeout = milliseconds(settings.ipc.queryTimeoutMs);
    return options;
}

/**
 * One supervisor on a private io_context for the lifetime of a command.
 *
 * run() returns once finish() has been called; the work guard keeps the
 * context alive while the worker's pipes are still being read.
 */
class HostSession {
public:
    explicit HostSession(const config::Settings& settings)
        : guard_(boost::asio::make_work_guard(io_)),
          supervisor_(io_.get_executor(),
                       worker::makeProcessChannelFactory(worker::WorkerProcessConfig{
                           resolveWorkerExecutable(settings),
                           {"--log-level", settings.logLevel},
                           {}}),
                       supervisorOptions(settings)) {}

    worker::WorkerSupervisor& supervisor() { return supervisor_; }
    boost::asio::io_context& io() { return io_; }

    void markFailed(const Error& error) {
        spdlog::error("{}", error.message);
        status_ = 1;
    }

    void fail(const Error& error) {
        markFailed(error);
        finish();
    }

    // Best-effort stop, then tear everything down.
    void shutdown() {
        supervisor_.stop([this](Result<void>) { finish(); });
    }

    void finish() {
        if (finished_) {
            return;
        }
        finished_ = true;
        supervisor_.destroy();
        guard_.reset();
        io_.stop();
    }

    int run() {
        try {
            io_.run();
        } catch (const std::exception& e) {
            spdlog::critical("tankobon: {}", e.what());
            status_ = 1;
        }
        return status_;
    }

private:
    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard_;
    worker::WorkerSupervisor supervisor_;
    bool finished_{false};
    int status_{0};
};

void printJson(const json& value) {
    std::cout << value.dump(2) << std::endl;
}

Result<void> requireCatalog(const config::Settings& settings) {
    if (settings.catalog.source.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "No catalog source configured (use --catalog or [catalog] source)"};
    }
    return {};
}

int runWorkerCommand(const config::Settings& settings, worker::Command command, json payload) {
    if (auto ok = requireCatalog(settings); !ok) {
        spdlog::error("{}", ok.error().message);
        return 1;
    }

    HostSession session(settings);
    boost::asio::post(session.io(), [&, payload = std::move(payload)]() mutable {
        session.supervisor().start([&, payload = std::move(payload)](Result<void> started) mutable {
            if (!started) {
                session.fail(started.error());
                return;
            }
            session.supervisor().request(
                command, std::move(payload), [&](Result<json> result) {
                    if (!result) {
                        session.markFailed(Error{result.error().code,
                                                 fmt::format("{} failed: {}",
                                                             worker::commandName(command),
                                                             result.error().message)});
                        session.shutdown();
                        return;
                    }
                    printJson(result.value());
                    session.shutdown();
                });
        });
    });
    return session.run();
}

// Starts the worker so the queue drains, printing every event until a signal.
int runWatch(const config::Settings& settings) {
    if (auto ok = requireCatalog(settings); !ok) {
        spdlog::error("{}", ok.error().message);
        return 1;
    }

    HostSession session(settings);
    session.supervisor().addEventListener(
        [](const json& event) { std::cout << event.dump() << std::endl; });

    boost::asio::signal_set signals(session.io(), SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        spdlog::info("tankobon: received signal {}, stopping worker", signo);
        session.shutdown();
    });

    boost::asio::post(session.io(), [&] {
        session.supervisor().start([&](Result<void> started) {
            if (!started) {
                signals.cancel();
                session.fail(started.error());
                return;
            }
            spdlog::info("tankobon: worker started, watching downloads (Ctrl+C to stop)");
        });
    });
    return session.run();
}

// --- archive commands work on the data directory without a worker ---

std::vector<archive::BulkArchiveItem> scanDownloadedManga(const config::Settings& settings,
                                                          const std::string& extensionFilter) {
    std::vector<archive::BulkArchiveItem> found;
    offline::PathBuilder paths(settings.dataDir);
    std::error_code ec;
    if (!fs::is_directory(paths.offlineDir(), ec)) {
        return found;
    }
    for (const auto& ext : fs::directory_iterator(paths.offlineDir(), ec)) {
        if (!ext.is_directory()) {
            continue;
        }
        auto extensionId = ext.path().filename().string();
        if (!extensionFilter.empty() && extensionId != extensionFilter) {
            continue;
        }
        for (const auto& mangaDir : fs::directory_iterator(ext.path(), ec)) {
            if (!mangaDir.is_directory()) {
                continue;
            }
            auto slug = mangaDir.path().filename().string();
            auto manga = offline::fsutil::readDocument<offline::OfflineMangaMetadata>(
                paths.mangaMetadataFile(extensionId, slug));
            if (!manga) {
                spdlog::warn("tankobon: skipping {}: {}", mangaDir.path().string(),
                             manga.error().message);
                continue;
            }
            found.push_back({extensionId, std::move(manga).value()});
        }
    }
    return found;
}

json describe(const archive::ArchiveResult& result) {
    json out{{"success", result.success},
             {"outputPath", result.outputPath.string()},
             {"sizeBytes", result.sizeBytes}};
    if (result.error) {
        out["error"] = *result.error;
    }
    return out;
}

archive::ArchiveOptions archiveOptions(int level, bool noMetadata, bool noCover, bool quiet) {
    archive::ArchiveOptions options;
    options.compressionLevel = level;
    options.includeMetadata = !noMetadata;
    options.includeCover = !noCover;
    if (!quiet) {
        options.onProgress = [](int current, int total) {
            std::cerr << "\r" << current << "/" << total << std::flush;
            if (current == total) {
                std::cerr << std::endl;
            }
        };
    }
    return options;
}

// Import opens the repository in this process, so it must not overlap a
// running worker on the same data directory.
int runImport(const config::Settings& settings, const fs::path& archivePath,
              const archive::ImportOptions& options, bool validateOnly) {
    const fs::path dbPath =
        settings.dbPath.empty() ? settings.dataDir / "offline.json" : settings.dbPath;
    auto repo = offline::JsonOfflineRepository::open(dbPath);
    if (!repo) {
        spdlog::error("Cannot open repository {}: {}", dbPath.string(), repo.error().message);
        return 1;
    }
    auto storage = std::make_shared<offline::StorageManager>(
        settings.dataDir, std::shared_ptr<offline::IOfflineRepository>(std::move(repo).value()),
        nullptr);
    archive::Importer importer(storage);

    if (validateOnly) {
        auto v = importer.validateArchive(archivePath);
        json out{{"valid", v.valid},
                 {"errors", v.errors},
                 {"warnings", v.warnings},
                 {"chapterCount", v.chapterCount}};
        if (v.title) {
            out["title"] = *v.title;
        }
        if (v.extensionId) {
            out["extensionId"] = *v.extensionId;
        }
        printJson(out);
        return v.valid ? 0 : 1;
    }

    auto result = importer.importMangaArchive(archivePath, options);
    json out{{"success", result.success},
             {"skipped", result.skipped},
             {"mangaId", result.mangaId},
             {"extensionId", result.extensionId},
             {"mangaSlug", result.mangaSlug},
             {"chaptersImported", result.chaptersImported}};
    if (result.error) {
        out["error"] = *result.error;
    }
    printJson(out);
    return result.success ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"tankobon - offline manga downloads"};
    app.require_subcommand(1);
    app.set_version_flag("--version", std::string(TANKOBON_VERSION_STRING));

    config::SettingsOverrides overrides;
    auto optionalString = [](CLI::App* cmd, const std::string& name,
                             std::optional<std::string>& target, const std::string& help) {
        cmd->add_option_function<std::string>(
            name, [&target](const std::string& value) { target = value; }, help);
    };
    optionalString(&app, "-c,--config", overrides.configPath, "Config file");
    optionalString(&app, "--data-dir", overrides.dataDir, "Data directory");
    optionalString(&app, "--db-path", overrides.dbPath, "Repository file");
    optionalString(&app, "-l,--log-level", overrides.logLevel,
                   "Log level (trace, debug, info, warn, error)");
    optionalString(&app, "--worker", overrides.workerExecutable, "tankobon-worker executable");
    optionalString(&app, "--catalog", overrides.catalogSource,
                   "Catalog directory or http(s):// base URL");
    optionalString(&app, "-e,--extension", overrides.extensionId, "Extension id");

    // Each worker-backed subcommand fills in what to send once parsing is done.
    std::optional<worker::Command> command;
    json payload = json::object();
    std::string mangaId;
    std::string chapterId;
    std::vector<std::string> chapterIds;
    int priority = 0;
    std::int64_t queueId = 0;
    std::optional<int> limit;

    auto withManga = [&](CLI::App* cmd) {
        cmd->add_option("manga", mangaId, "Manga id")->required();
    };
    auto withChapter = [&](CLI::App* cmd) {
        withManga(cmd);
        cmd->add_option("chapter", chapterId, "Chapter id")->required();
    };
    auto withQueueId = [&](CLI::App* cmd) {
        cmd->add_option("queue-id", queueId, "Queue item id")->required();
    };
    auto workerCommand = [&](const std::string& name, const std::string& help,
                             worker::Command which) {
        auto* cmd = app.add_subcommand(name, help);
        cmd->callback([&command, which] { command = which; });
        return cmd;
    };

    auto* queueChapter =
        workerCommand("queue-chapter", "Queue one chapter for download", worker::Command::QueueChapter);
    withChapter(queueChapter);
    queueChapter->add_option("-p,--priority", priority, "Queue priority (higher first)");

    auto* queueManga = workerCommand("queue-manga", "Queue every chapter not yet downloaded",
                                     worker::Command::QueueManga);
    withManga(queueManga);
    queueManga->add_option("-p,--priority", priority, "Queue priority (higher first)");
    queueManga->add_option("--chapters", chapterIds, "Only these chapter ids");

    withQueueId(workerCommand("cancel", "Cancel a queued or running download",
                              worker::Command::CancelDownload));
    withQueueId(
        workerCommand("retry", "Retry a failed download", worker::Command::RetryDownload));
    workerCommand("retry-frozen", "Requeue downloads that stopped making progress",
                  worker::Command::RetryFrozenDownloads);
    workerCommand("queue", "Show the download queue", worker::Command::GetQueuedDownloads);
    withQueueId(workerCommand("progress", "Show progress of one download",
                              worker::Command::GetDownloadProgress));
    workerCommand("stats", "Show storage statistics", worker::Command::GetStorageStats);
    workerCommand("list", "List downloaded manga", worker::Command::GetDownloadedManga);
    withManga(workerCommand("chapters", "List downloaded chapters of a manga",
                            worker::Command::GetDownloadedChapters));
    withChapter(workerCommand("delete-chapter", "Delete a downloaded chapter",
                              worker::Command::DeleteChapter));
    withManga(workerCommand("delete-manga", "Delete a downloaded manga and its chapters",
                            worker::Command::DeleteManga));
    auto* history =
        workerCommand("history", "Show download history", worker::Command::GetDownloadHistory);
    history->add_option_function<int>(
        "-n,--limit", [&limit](const int& n) { limit = n; }, "Newest entries to show");
    workerCommand("metrics", "Show download performance metrics", worker::Command::GetMetrics);
    workerCommand("pause", "Pause every queued download", worker::Command::PauseDownloads);
    workerCommand("resume", "Resume paused downloads", worker::Command::ResumeDownloads);
    workerCommand("usage", "Show bytes used by downloaded manga", worker::Command::GetStorageUsage);

    // Unset cleanup flags fall back to the [storage] config section.
    std::optional<double> maxGb;
    std::optional<std::string> strategy;
    std::optional<double> threshold;
    double targetFreeGb = 1.0;
    bool ifNeeded = false;
    auto* cleanup = workerCommand("cleanup", "Delete whole manga until under the storage limit",
                                  worker::Command::PerformStorageCleanup);
    cleanup->add_option_function<double>(
        "--max-gb", [&maxGb](const double& v) { maxGb = v; }, "Storage limit in GB");
    cleanup
        ->add_option_function<std::string>(
            "--strategy", [&strategy](const std::string& v) { strategy = v; },
            "What goes first: oldest, largest or least-accessed")
        ->check(CLI::IsMember({"oldest", "largest", "least-accessed"}));
    cleanup->add_option_function<double>(
        "--threshold", [&threshold](const double& v) { threshold = v; },
        "Usage percent that triggers --if-needed");
    cleanup->add_option("--target-free-gb", targetFreeGb, "Headroom to leave below the limit");
    cleanup->add_flag("--if-needed", ifNeeded, "Only clean up once the threshold is reached");

    bool watch = false;
    app.add_subcommand("watch", "Run the worker and print download events until interrupted")
        ->callback([&watch] { watch = true; });

    // archive-manga / archive-all
    std::string archiveTarget;
    std::string output;
    int level = 6;
    bool noMetadata = false;
    bool noCover = false;
    bool quiet = false;
    auto archiveFlags = [&](CLI::App* cmd) {
        cmd->add_option("--level", level, "Compression level, 0 stores")
            ->check(CLI::Range(0, 9));
        cmd->add_flag("--no-metadata", noMetadata, "Leave metadata.json files out");
        cmd->add_flag("--no-cover", noCover, "Leave the cover image out");
        cmd->add_flag("-q,--quiet", quiet, "No progress output");
    };
    std::optional<std::string> archiveMode;
    auto* archiveManga =
        app.add_subcommand("archive-manga", "Write one downloaded manga to a ZIP file");
    archiveManga->add_option("manga", archiveTarget, "Manga id or slug")->required();
    archiveManga->add_option("-o,--output", output, "Output .zip (default <title>.zip)");
    archiveFlags(archiveManga);
    archiveManga->callback([&archiveMode] { archiveMode = "manga"; });

    auto* archiveAll =
        app.add_subcommand("archive-all", "Write every downloaded manga to its own ZIP file");
    archiveAll->add_option("-o,--output", output, "Output directory")->required();
    archiveFlags(archiveAll);
    archiveAll->callback([&archiveMode] { archiveMode = "all"; });

    std::string importPath;
    std::string onConflict = "skip";
    bool noValidate = false;
    bool validateOnly = false;
    bool importing = false;
    auto* importCmd =
        app.add_subcommand("import", "Import a manga ZIP written by archive-manga");
    importCmd->add_option("archive", importPath, "Archive to import")
        ->required()
        ->check(CLI::ExistingFile);
    importCmd->add_option("--on-conflict", onConflict, "skip, overwrite or rename")
        ->check(CLI::IsMember({"skip", "overwrite", "rename"}));
    importCmd->add_flag("--no-validate", noValidate, "Skip the structure check");
    importCmd->add_flag("--validate-only", validateOnly, "Check the archive, import nothing");
    importCmd->add_flag("-q,--quiet", quiet, "No progress output");
    importCmd->callback([&importing] { importing = true; });

    CLI11_PARSE(app, argc, argv);

    auto loaded = config::loadSettings(overrides);
    if (!loaded) {
        configureLogging("info");
        spdlog::error("{}", loaded.error().message);
        return 2;
    }
    const auto& settings = loaded.value();
    configureLogging(settings.logLevel);

    if (archiveMode) {
        archive::Archiver archiver(settings.dataDir);
        auto options = archiveOptions(level, noMetadata, noCover, quiet);
        auto extensionFilter = overrides.extensionId.value_or("");

        if (*archiveMode == "all") {
            auto items = scanDownloadedManga(settings, extensionFilter);
            if (items.empty()) {
                spdlog::error("No downloaded manga under {}", settings.dataDir.string());
                return 1;
            }
            auto results = archiver.archiveBulk(items, output, options);
            json out = json::array();
            bool allOk = true;
            for (const auto& r : results) {
                allOk = allOk && r.success;
                out.push_back(describe(r));
            }
            printJson(out);
            return allOk ? 0 : 1;
        }

        for (auto& item : scanDownloadedManga(settings, extensionFilter)) {
            if (item.manga.mangaId != archiveTarget && item.manga.slug != archiveTarget) {
                continue;
            }
            fs::path target = output.empty()
                                  ? fs::path(archive::safeArchiveName(item.manga.title) + ".zip")
                                  : fs::path(output);
            auto result = archiver.archiveManga(item.extensionId, item.manga, target, options);
            printJson(describe(result));
            return result.success ? 0 : 1;
        }
        spdlog::error("No downloaded manga matches '{}'", archiveTarget);
        return 1;
    }

    if (importing) {
        archive::ImportOptions options;
        options.conflictResolution =
            archive::parseConflictResolution(onConflict).value_or(archive::ConflictResolution::Skip);
        options.validate = !noValidate;
        if (!quiet) {
            options.onProgress = [](int current, int total, const std::string& message) {
                std::cerr << "[" << current << "/" << total << "] " << message << std::endl;
            };
        }
        return runImport(settings, importPath, options, validateOnly);
    }

    if (watch) {
        return runWatch(settings);
    }
    if (!command) {
        return 2;
    }

    using worker::Command;
    switch (*command) {
        case Command::QueueChapter:
            payload = {{"mangaId", mangaId},
                       {"chapterId", chapterId},
                       {"options", {{"priority", priority}}}};
            break;
        case Command::QueueManga: {
            json opts{{"priority", priority}};
            if (!chapterIds.empty()) {
                opts["chapterIds"] = chapterIds;
            }
            payload = {{"mangaId", mangaId}, {"options", opts}};
            break;
        }
        case Command::CancelDownload:
        case Command::RetryDownload:
        case Command::GetDownloadProgress:
            payload = {{"queueId", queueId}};
            break;
        case Command::GetDownloadedChapters:
        case Command::DeleteManga:
            payload = {{"mangaId", mangaId}};
            break;
        case Command::DeleteChapter:
            payload = {{"mangaId", mangaId}, {"chapterId", chapterId}};
            break;
        case Command::GetDownloadHistory:
            if (limit) {
                payload = {{"limit", *limit}};
            }
            break;
        case Command::PerformStorageCleanup: {
            const auto& st = settings.storage;
            json cleanupSettings{
                {"maxStorageGB", maxGb.value_or(st.maxStorageGb)},
                // --if-needed asks whether the threshold is reached, so it implies auto cleanup.
                {"autoCleanupEnabled", st.autoCleanup || ifNeeded},
                {"cleanupStrategy", strategy.value_or(st.cleanupStrategy)},
                {"cleanupThresholdPercent", threshold.value_or(st.cleanupThresholdPercent)}};
            payload = {{"settings", cleanupSettings},
                       {"targetFreeGb", targetFreeGb},
                       {"onlyIfNeeded", ifNeeded}};
            break;
        }
        default:
            break;
    }
    if (overrides.extensionId) {
        payload["extensionId"] = *overrides.extensionId;
    }
    return runWorkerCommand(settings, *command, std::move(payload));
}
