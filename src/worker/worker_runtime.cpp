#include <tankobon/worker/worker_runtime.hpp>

#include <tankobon/offline/file_system.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <type_traits>

namespace tankobon::worker {

namespace {

constexpr const char* kDefaultDbFile = "offline.json";

template <typename T> Result<json> toJson(const Result<T>& outcome) {
    if (!outcome) {
        return outcome.error();
    }
    return json(outcome.value());
}

Result<json> toJson(const Result<void>& outcome) {
    if (!outcome) {
        return outcome.error();
    }
    return json(nullptr);
}

template <typename T> json optionalJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

Result<std::string> requireString(const json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_string() || it->get<std::string>().empty()) {
        return Error{ErrorCode::InvalidArgument, fmt::format("Missing '{}' in payload", key)};
    }
    return it->get<std::string>();
}

Result<std::int64_t> requireInteger(const json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_number_integer()) {
        return Error{ErrorCode::InvalidArgument, fmt::format("Missing '{}' in payload", key)};
    }
    return it->get<std::int64_t>();
}

const json& options(const json& payload) {
    static const json empty = json::object();
    auto it = payload.find("options");
    return it != payload.end() && it->is_object() ? *it : empty;
}

} // namespace

WorkerRuntime::WorkerRuntime(boost::asio::any_io_executor executor, LineSink sink,
                             ExitRequest exit, Hooks hooks)
    : executor_(std::move(executor)), sink_(std::move(sink)), exit_(std::move(exit)),
      hooks_(std::move(hooks)) {}

WorkerRuntime::~WorkerRuntime() {
    shutdown();
}

void WorkerRuntime::shutdown() {
    if (queue_ && queue_->isActive()) {
        queue_->stop();
    }
    if (storage_) {
        storage_->stopBackgroundSync();
    }
}

void WorkerRuntime::send(const WorkerMessage& message) {
    sink_(encode(message));
}

void WorkerRuntime::forward(const offline::OfflineEvent& event) {
    send(EventMessage{offline::eventToJson(event)});
}

std::string WorkerRuntime::extensionOf(const json& payload) const {
    auto it = payload.find("extensionId");
    if (it != payload.end() && it->is_string() && !it->get<std::string>().empty()) {
        return it->get<std::string>();
    }
    return config_ ? config_->extensionId : std::string{};
}

void WorkerRuntime::handleLine(const std::string& line) {
    auto decoded = decodeHostMessage(line);
    if (!decoded) {
        spdlog::warn("WorkerRuntime: rejected host message: {}", decoded.error().message);
        send(ErrorMessage{std::nullopt, "Invalid message: " + decoded.error().message,
                          std::nullopt});
        return;
    }

    std::visit(
        [this](const auto& message) {
            using T = std::decay_t<decltype(message)>;
            if constexpr (std::is_same_v<T, InitMessage>) {
                if (initialized()) {
                    spdlog::warn("WorkerRuntime: ignoring repeated init");
                    return;
                }
                if (auto ready = initialize(message.config); !ready) {
                    spdlog::error("WorkerRuntime: initialization failed: {}",
                                  ready.error().message);
                    send(FatalErrorMessage{ready.error().message, std::nullopt});
                    exit_(1);
                    return;
                }
                send(ReadyMessage{nowMillis()});
            } else {
                handleCommand(message);
            }
        },
        decoded.value());
}

Result<void> WorkerRuntime::initialize(const WorkerInitConfig& config) {
    if (config.dataDir.empty()) {
        return Error{ErrorCode::InvalidArgument, "init config has no dataDir"};
    }
    if (config.extensionPath.empty()) {
        return Error{ErrorCode::InvalidArgument, "init config has no extensionPath"};
    }
    if (auto made = offline::fsutil::ensureDir(config.dataDir); !made) {
        return made.error();
    }

    const std::filesystem::path dbPath =
        config.dbPath.empty() ? std::filesystem::path(config.dataDir) / kDefaultDbFile
                              : std::filesystem::path(config.dbPath);
    auto opened = offline::JsonOfflineRepository::open(dbPath);
    if (!opened) {
        return Error{opened.error().code, "Failed to open repository: " + opened.error().message};
    }
    repository_ = std::shared_ptr<offline::IOfflineRepository>(std::move(opened).value());

    const auto& opts = config.workerOptions;
    metrics_ = std::make_shared<offline::PerformanceMetricsTracker>();

    std::shared_ptr<downloader::IPageFetcher> fetcher = hooks_.fetcher;
    if (!fetcher) {
        fetcher = downloader::makeCurlPageFetcher();
    }

    offline::MetadataCacheConfig cacheConfig;
    cacheConfig.maxEntries = opts.cacheMaxEntries;
    cacheConfig.ttl = std::chrono::milliseconds(opts.cacheTtlMs);
    cache_ = std::make_shared<offline::MetadataCache>(cacheConfig);
    catalog_ = std::make_shared<offline::CachedCatalog>(
        offline::makeCatalogSource(config.extensionPath, fetcher), cache_, metrics_);

    storage_ = std::make_shared<offline::StorageManager>(
        config.dataDir, repository_, catalog_, [this](const offline::OfflineEvent& event) {
            metrics_->eventEmitted();
            forward(event);
        });

    downloader::ImageDownloadOptions imageOptions;
    imageOptions.maxAttempts = std::max(1, opts.maxRetries);
    imageOptions.retryDelay = std::chrono::milliseconds(opts.retryDelayMs);
    imageOptions.timeout = std::chrono::milliseconds(opts.pageTimeoutMs);
    auto images =
        std::make_shared<downloader::ImageDownloader>(fetcher, imageOptions, hooks_.sleeper);

    offline::DownloadQueueOptions queueOptions;
    queueOptions.concurrency = std::max(1, opts.concurrency);
    queueOptions.pageConcurrency = std::max(1, opts.pageConcurrency);
    queueOptions.pollingInterval = std::chrono::milliseconds(opts.pollingIntervalMs);
    queueOptions.frozenAfter = std::chrono::milliseconds(opts.frozenAfterMs);
    queueOptions.progressFlush = std::chrono::milliseconds(opts.progressFlushMs);

    offline::DownloadQueue::Dependencies deps{repository_, catalog_, images, storage_, metrics_};
    queue_ = std::make_unique<offline::DownloadQueue>(
        executor_, deps, queueOptions,
        [this](const offline::OfflineEvent& event) { forward(event); });

    config_ = config;
    spdlog::info("WorkerRuntime: initialized (data dir {}, catalog {}, extension {})",
                 config.dataDir, config.extensionPath, config.extensionId);
    return {};
}

void WorkerRuntime::handleCommand(const CommandMessage& message) {
    const auto name = std::string(commandName(message.command));
    if (!initialized()) {
        send(ErrorMessage{message.requestId, "worker not initialised", std::nullopt});
        return;
    }

    spdlog::debug("WorkerRuntime: {} #{}", name, message.requestId);
    Result<json> outcome = Error{ErrorCode::InternalError, "unhandled"};
    try {
        const json payload = message.payload.is_null() ? json::object() : message.payload;
        outcome = dispatch(message.command, payload);
    } catch (const std::exception& e) {
        // Payload fields of the wrong JSON type surface here.
        outcome = Error{ErrorCode::InvalidArgument, e.what()};
    }

    if (!outcome) {
        spdlog::warn("WorkerRuntime: {} #{} failed: {}", name, message.requestId,
                     outcome.error().message);
        send(ErrorMessage{message.requestId, outcome.error().message, std::nullopt});
        return;
    }

    json result = std::move(outcome).value();
    if (const auto key = resultKey(message.command); !key.empty()) {
        result = json{{std::string(key), std::move(result)}};
    }
    send(ResultMessage{message.requestId, name, std::move(result)});

    if (message.command == Command::Start) {
        send(StartedMessage{nowMillis()});
    } else if (message.command == Command::Stop) {
        send(StoppedMessage{nowMillis()});
    }
}

Result<json> WorkerRuntime::dispatch(Command command, const json& payload) {
    switch (command) {
        case Command::Start:
            queue_->start();
            return json(nullptr);

        case Command::Stop:
            queue_->stop();
            return json(nullptr);

        case Command::QueueChapter: {
            auto mangaId = requireString(payload, "mangaId");
            if (!mangaId)
                return mangaId.error();
            auto chapterId = requireString(payload, "chapterId");
            if (!chapterId)
                return chapterId.error();
            offline::QueueChapterRequest request;
            request.extensionId = extensionOf(payload);
            request.mangaId = mangaId.value();
            request.chapterId = chapterId.value();
            request.priority = options(payload).value("priority", 0);
            return toJson(queue_->queueChapter(request));
        }

        case Command::QueueManga: {
            auto mangaId = requireString(payload, "mangaId");
            if (!mangaId)
                return mangaId.error();
            const auto& opts = options(payload);
            offline::QueueMangaRequest request;
            request.extensionId = extensionOf(payload);
            request.mangaId = mangaId.value();
            request.priority = opts.value("priority", 0);
            if (auto it = opts.find("chapterIds"); it != opts.end() && it->is_array()) {
                request.chapterIds = it->get<std::vector<std::string>>();
            }
            return toJson(queue_->queueManga(request));
        }

        case Command::CancelDownload: {
            auto id = requireInteger(payload, "queueId");
            if (!id)
                return id.error();
            return toJson(queue_->cancel(id.value()));
        }

        case Command::RetryDownload: {
            auto id = requireInteger(payload, "queueId");
            if (!id)
                return id.error();
            return toJson(queue_->retry(id.value()));
        }

        case Command::RetryFrozenDownloads:
            return json(queue_->retryFrozen());

        case Command::GetQueuedDownloads:
            return json(queue_->queued());

        case Command::GetDownloadProgress: {
            auto id = requireInteger(payload, "queueId");
            if (!id)
                return id.error();
            return optionalJson(storage_->downloadProgress(id.value()));
        }

        case Command::GetStorageStats:
            return json(storage_->storageStats());

        case Command::GetDownloadedManga:
            return json(storage_->downloadedManga());

        case Command::GetMangaMetadata: {
            auto mangaId = requireString(payload, "mangaId");
            if (!mangaId)
                return mangaId.error();
            return optionalJson(storage_->mangaMetadata(extensionOf(payload), mangaId.value()));
        }

        case Command::GetDownloadedChapters: {
            auto mangaId = requireString(payload, "mangaId");
            if (!mangaId)
                return mangaId.error();
            return json(storage_->downloadedChapters(extensionOf(payload), mangaId.value()));
        }

        case Command::GetChapterPages:
        case Command::IsChapterDownloaded:
        case Command::DeleteChapter: {
            auto mangaId = requireString(payload, "mangaId");
            if (!mangaId)
                return mangaId.error();
            auto chapterId = requireString(payload, "chapterId");
            if (!chapterId)
                return chapterId.error();
            const auto ext = extensionOf(payload);
            if (command == Command::GetChapterPages) {
                return optionalJson(
                    storage_->chapterPages(ext, mangaId.value(), chapterId.value()));
            }
            if (command == Command::IsChapterDownloaded) {
                return json(storage_->isChapterDownloaded(ext, mangaId.value(), chapterId.value()));
            }
            return toJson(storage_->deleteChapter(ext, mangaId.value(), chapterId.value()));
        }

        case Command::DeleteManga: {
            auto mangaId = requireString(payload, "mangaId");
            if (!mangaId)
                return mangaId.error();
            return toJson(storage_->deleteManga(extensionOf(payload), mangaId.value()));
        }

        case Command::NukeOfflineData: {
            auto nuked = storage_->nuke();
            if (nuked) {
                cache_->clear();
            }
            return toJson(nuked);
        }

        case Command::GetDownloadHistory: {
            std::size_t limit = 0;
            if (auto it = payload.find("limit"); it != payload.end() && it->is_number_integer()) {
                limit = static_cast<std::size_t>(std::max<std::int64_t>(0, it->get<std::int64_t>()));
            }
            return json(repository_->history(limit));
        }

        case Command::DeleteHistoryItem: {
            auto id = requireInteger(payload, "historyId");
            if (!id)
                return id.error();
            return toJson(repository_->deleteHistoryItem(id.value()));
        }

        case Command::ClearDownloadHistory:
            return toJson(repository_->clearHistory());

        case Command::ValidateMangaChapterCount: {
            auto mangaId = requireString(payload, "mangaId");
            if (!mangaId)
                return mangaId.error();
            auto validation = storage_->validateMangaChapterCount(extensionOf(payload),
                                                                  mangaId.value());
            return json{{"valid", validation.valid}, {"rebuilt", validation.rebuilt}};
        }

        case Command::StartBackgroundSync: {
            offline::BackgroundSyncOptions sync;
            sync.ttl = std::chrono::milliseconds(
                payload.value("ttlMs", static_cast<std::int64_t>(sync.ttl.count())));
            sync.concurrency = std::max(1, payload.value("concurrency", sync.concurrency));
            sync.delay = std::chrono::milliseconds(
                payload.value("delayMs", static_cast<std::int64_t>(sync.delay.count())));
            storage_->startBackgroundSync(sync);
            return json(nullptr);
        }

        case Command::GetPagePath: {
            auto mangaId = requireString(payload, "mangaId");
            if (!mangaId)
                return mangaId.error();
            auto chapterId = requireString(payload, "chapterId");
            if (!chapterId)
                return chapterId.error();
            auto filename = requireString(payload, "filename");
            if (!filename)
                return filename.error();
            auto path = storage_->pagePath(mangaId.value(), chapterId.value(), filename.value());
            return path ? json(path->string()) : json(nullptr);
        }

        case Command::GetMetrics:
            return json(metrics_->snapshot());

        case Command::ResetMetrics:
            metrics_->reset();
            return json(nullptr);

        case Command::IsActive:
            return json(queue_->isActive());

        case Command::GetActiveDownloads:
            return json(queue_->activeDownloads());

        case Command::PauseDownloads:
            return toJson(queue_->pauseAll());

        case Command::ResumeDownloads:
            return toJson(queue_->resumeAll());

        case Command::GetStorageUsage:
            return json(storage_->storageUsage());

        case Command::PerformStorageCleanup: {
            offline::CleanupSettings settings;
            if (auto it = payload.find("settings"); it != payload.end() && it->is_object()) {
                settings = it->get<offline::CleanupSettings>();
            }
            const double targetFreeGb = payload.value("targetFreeGb", 1.0);
            if (payload.value("onlyIfNeeded", false) && !storage_->shouldCleanup(settings)) {
                offline::CleanupResult skipped;
                return json(skipped);
            }
            return json(storage_->performCleanup(settings, targetFreeGb));
        }

        case Command::Ping:
            return json(nowMillis());
    }
    return Error{ErrorCode::InvalidArgument,
                 fmt::format("Unknown command {}", static_cast<int>(command))};
}

} // namespace tankobon::worker
