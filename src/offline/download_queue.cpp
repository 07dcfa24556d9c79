#include <spdlog/spdlog.h>
#include <tankobon/offline/download_queue.hpp>
#include <tankobon/offline/file_system.hpp>
#include <tankobon/offline/paths.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <cmath>
#include <functional>
#include <mutex>
#include <set>
#include <stdexcept>

namespace tankobon::offline {

struct DownloadQueue::Job {
    QueuedDownload item;
    std::atomic<bool> cancelled{false};
    // Held across the final cancellation check and each chapter commit.
    std::mutex commitMutex;
    bool settled{false}; // last chapter committed; guarded by commitMutex

    // False once the last chapter is stored; the transfer then completes.
    bool abandon() {
        std::lock_guard<std::mutex> lock(commitMutex);
        if (settled) {
            return false;
        }
        cancelled = true;
        return true;
    }
    // (current, total, chapterId); called from pool threads.
    std::function<void(int, int, std::optional<std::string>)> report;
};

namespace {

Result<std::string> resolveMangaSlug(const CatalogManga& manga, const std::string& mangaId) {
    const std::string preferred = manga.slug && !manga.slug->empty() ? *manga.slug : manga.title;
    for (const auto* candidate : {&preferred, &mangaId}) {
        if (candidate->empty()) {
            continue;
        }
        try {
            return sanitizeSlug(*candidate);
        } catch (const std::invalid_argument& e) {
            spdlog::warn("DownloadQueue: rejected slug source '{}': {}", *candidate, e.what());
        }
    }
    return Error{ErrorCode::InvalidArgument,
                 "Cannot derive a safe directory name for manga " + mangaId};
}

std::optional<ChapterSummary> findChapter(const CatalogManga& manga, const std::string& chapterId) {
    auto it = std::find_if(manga.chapters.begin(), manga.chapters.end(),
                           [&](const auto& c) { return c.id == chapterId; });
    if (it == manga.chapters.end()) {
        return std::nullopt;
    }
    return *it;
}

// Best effort: a missing cover never fails the download.
std::optional<std::string> downloadCover(const DownloadQueue::Dependencies& deps,
                                         const QueuedDownload& item, const std::string& url,
                                         const downloader::ShouldCancel& shouldCancel) {
    auto image = deps.downloader->download(url, shouldCancel);
    if (!image) {
        spdlog::warn("DownloadQueue: cover download failed for {}: {}", item.mangaSlug,
                     image.error().message);
        return std::nullopt;
    }
    const auto name = "cover." + imageExtension(url, image.value().mimeType);
    auto written = fsutil::writeBytes(
        deps.storage->paths().coverFile(item.extensionId, item.mangaSlug, name),
        image.value().bytes);
    if (!written) {
        spdlog::warn("DownloadQueue: failed to store cover for {}: {}", item.mangaSlug,
                     written.error().message);
        return std::nullopt;
    }
    deps.metrics->bytesDownloaded(image.value().bytes.size());
    return name;
}

// Writes the pages and the chapter document; the caller commits the chapter.
Result<OfflineChapterPages> downloadChapter(const DownloadQueue::Dependencies& deps,
                                      const DownloadQueueOptions& options,
                                      const QueuedDownload& item, const ChapterSummary& chapter,
                                      const std::vector<CatalogPage>& pages,
                                      const std::atomic<bool>& cancelled,
                                      const std::function<void(int, int)>& progress) {
    const auto& paths = deps.storage->paths();
    const auto folder = chapterFolderName(
        chapter.number && !chapter.number->empty() ? *chapter.number : chapter.id);
    const auto pagesDir = paths.pagesDir(item.extensionId, item.mangaSlug, folder);
    if (auto r = fsutil::ensureDir(pagesDir); !r) {
        return r.error();
    }

    const int total = static_cast<int>(pages.size());
    std::vector<OfflinePageMetadata> written(pages.size());
    std::atomic<int> completed{0};
    std::atomic<bool> failed{false};
    std::mutex errorMutex;
    std::mutex progressMutex;
    std::optional<Error> firstError;

    const downloader::ShouldCancel stop = [&] { return cancelled.load() || failed.load(); };
    auto fail = [&](Error error) {
        std::lock_guard<std::mutex> lock(errorMutex);
        if (!firstError) {
            firstError = std::move(error);
        }
        failed = true;
    };

    {
        boost::asio::thread_pool pool(static_cast<std::size_t>(std::max(1, options.pageConcurrency)));
        for (std::size_t k = 0; k < pages.size(); ++k) {
            boost::asio::post(pool, [&, k] {
                if (stop()) {
                    return;
                }
                const auto& page = pages[k];
                auto image = deps.downloader->download(page.url, stop);
                if (!image) {
                    fail(image.error());
                    return;
                }
                const auto filename =
                    pageFilename(page.index, imageExtension(page.url, image.value().mimeType));
                if (auto w = fsutil::writeBytes(pagesDir / filename, image.value().bytes); !w) {
                    fail(w.error());
                    return;
                }

                OfflinePageMetadata meta;
                meta.index = page.index;
                meta.originalUrl = page.url;
                meta.filename = filename;
                meta.width = page.width;
                meta.height = page.height;
                meta.sizeBytes = image.value().bytes.size();
                meta.mimeType = image.value().mimeType;
                written[k] = std::move(meta);

                deps.metrics->bytesDownloaded(image.value().bytes.size());
                // Reports leave in counting order so the latest one is the highest.
                std::lock_guard<std::mutex> lock(progressMutex);
                progress(++completed, total);
            });
        }
        pool.join();
    }

    if (cancelled) {
        return Error{ErrorCode::OperationCancelled, "Download cancelled"};
    }
    if (firstError) {
        return *firstError;
    }

    std::sort(written.begin(), written.end(),
              [](const auto& a, const auto& b) { return a.index < b.index; });

    OfflineChapterPages doc;
    doc.downloadedAt = nowMillis();
    doc.chapterId = chapter.id;
    doc.mangaId = item.mangaId;
    doc.folderName = folder;
    doc.pages = std::move(written);
    if (auto w = fsutil::writeDocument(
            paths.chapterMetadataFile(item.extensionId, item.mangaSlug, folder), doc);
        !w) {
        return w.error();
    }
    return doc;
}

} // namespace

DownloadQueue::DownloadQueue(boost::asio::any_io_executor executor, Dependencies deps,
                             DownloadQueueOptions options, EventSink events)
    : executor_(executor), deps_(std::move(deps)), options_(options), events_(std::move(events)),
      pollTimer_(executor),
      jobPool_(static_cast<std::size_t>(std::max(1, options.concurrency))) {
    ProgressBatcher::Options batchOptions;
    batchOptions.flushInterval = options_.progressFlush;
    batchOptions.flushOnComplete = true;
    batchOptions.onBatch = [this](const std::vector<ProgressUpdate>& batch) {
        std::vector<QueueProgressRow> rows;
        rows.reserve(batch.size());
        for (const auto& u : batch) {
            rows.push_back({u.queueId, u.progressCurrent, u.progressTotal});
        }
        if (auto r = deps_.repository->updateQueueProgressBatch(rows); !r) {
            spdlog::warn("DownloadQueue: progress write failed: {}", r.error().message);
            return;
        }
        deps_.metrics->databaseBatchWrite(rows.size());
    };
    batcher_ = std::make_unique<ProgressBatcher>(
        executor_,
        [this](const ProgressUpdate& u) {
            emit(DownloadProgressed{u.queueId, u.mangaId, u.chapterId, u.progressCurrent,
                                    u.progressTotal});
        },
        std::move(batchOptions));
}

DownloadQueue::~DownloadQueue() {
    running_ = false;
    ++generation_;
    alive_.reset();
    for (auto& [id, job] : active_) {
        job->abandon();
    }
    pollTimer_.cancel();
    jobPool_.join();
}

void DownloadQueue::emit(const OfflineEvent& event) {
    deps_.metrics->eventEmitted();
    if (!events_) {
        return;
    }
    try {
        events_(event);
    } catch (const std::exception& e) {
        spdlog::warn("DownloadQueue: event listener threw: {}", e.what());
    } catch (...) {
        spdlog::warn("DownloadQueue: event listener threw a non-standard exception");
    }
}

// --- lifecycle ---------------------------------------------------------------

void DownloadQueue::start() {
    if (running_) {
        spdlog::debug("DownloadQueue: already running");
        return;
    }
    running_ = true;
    const auto generation = ++generation_;
    spdlog::info("DownloadQueue: started (concurrency={}, pages={}, poll={}ms)",
                 options_.concurrency, options_.pageConcurrency, options_.pollingInterval.count());
    boost::asio::co_spawn(executor_, pollLoop(generation), boost::asio::detached);
}

void DownloadQueue::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    ++generation_;
    pollTimer_.cancel();
    spdlog::info("DownloadQueue: stopped ({} transfers still in flight)", active_.size());
}

boost::asio::awaitable<void> DownloadQueue::pollLoop(std::uint64_t generation) {
    std::weak_ptr<bool> alive = alive_;
    while (true) {
        pump();
        pollTimer_.expires_after(options_.pollingInterval);
        boost::system::error_code ec;
        co_await pollTimer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (alive.expired() || !running_ || generation != generation_) {
            co_return;
        }
    }
}

void DownloadQueue::pump() {
    if (!running_) {
        return;
    }
    const auto limit = static_cast<std::size_t>(std::max(1, options_.concurrency));
    if (active_.size() >= limit) {
        return;
    }
    // Items reset by the frozen sweep can still have their old transfer winding down.
    for (const auto& item : deps_.repository->nextQueued(limit + active_.size())) {
        if (active_.size() >= limit) {
            break;
        }
        if (active_.contains(item.id)) {
            continue;
        }
        launch(item);
    }
}

void DownloadQueue::launch(const QueuedDownload& item) {
    if (auto r = deps_.repository->updateQueueStatus(item.id, DownloadStatus::Downloading); !r) {
        spdlog::error("DownloadQueue: cannot start item {}: {}", item.id, r.error().message);
        return;
    }
    deps_.metrics->databaseWrite();
    deps_.metrics->downloadStarted(item.id);
    emit(DownloadStarted{item.id, item.mangaId, item.chapterId});
    spdlog::info("DownloadQueue: downloading {} {} (queue item {})", item.mangaSlug,
                 item.chapterId.value_or("<all chapters>"), item.id);

    auto job = std::make_shared<Job>();
    job->item = item;
    std::weak_ptr<bool> alive = alive_;
    job->report = [this, alive, exec = executor_, id = item.id,
                   mangaId = item.mangaId](int current, int total,
                                           std::optional<std::string> chapterId) {
        boost::asio::post(exec, [this, alive, update = ProgressUpdate{id, mangaId, std::move(chapterId),
                                                                      current, total}]() {
            if (alive.expired()) {
                return;
            }
            auto it = active_.find(update.queueId);
            if (it == active_.end() || it->second->cancelled) {
                return;
            }
            batcher_->update(update);
        });
    };
    active_[item.id] = job;

    boost::asio::post(jobPool_, [this, alive, job, deps = deps_, options = options_,
                                 exec = executor_]() {
        Result<std::uint64_t> outcome{Error{ErrorCode::InternalError, "Download did not run"}};
        try {
            outcome = runJob(deps, options, job->item, *job);
        } catch (const std::exception& e) {
            outcome = Error{ErrorCode::InternalError, e.what()};
        }
        boost::asio::post(exec, [this, alive, id = job->item.id,
                                 outcome = std::move(outcome)]() mutable {
            if (alive.expired()) {
                return;
            }
            finish(id, std::move(outcome));
        });
    });
}

void DownloadQueue::finish(QueueId queueId, Result<std::uint64_t> outcome) {
    auto it = active_.find(queueId);
    if (it == active_.end()) {
        return;
    }
    auto job = it->second;
    active_.erase(it);
    const auto& item = job->item;

    if (job->cancelled) {
        // cancel() or the frozen sweep already settled the row and told listeners.
        batcher_->remove(queueId);
        deps_.metrics->downloadFailed(queueId);
        spdlog::info("DownloadQueue: abandoned transfer for item {} wound down", queueId);
        pump();
        return;
    }

    if (outcome) {
        batcher_->flush();
        if (auto r = deps_.repository->updateQueueStatus(queueId, DownloadStatus::Completed); !r) {
            spdlog::error("DownloadQueue: cannot complete item {}: {}", queueId,
                          r.error().message);
        } else if (auto h = deps_.repository->moveToHistory(queueId); !h) {
            spdlog::error("DownloadQueue: cannot archive item {}: {}", queueId, h.error().message);
        }
        deps_.metrics->databaseWrite();
        deps_.metrics->downloadCompleted(queueId, outcome.value());
        spdlog::info("DownloadQueue: item {} complete ({} pages)", queueId, outcome.value());
        emit(DownloadCompleted{queueId, item.mangaId, item.chapterId});
    } else {
        const auto& message = outcome.error().message;
        batcher_->remove(queueId);
        if (auto r = deps_.repository->updateQueueStatus(queueId, DownloadStatus::Failed, message);
            !r) {
            spdlog::error("DownloadQueue: cannot fail item {}: {}", queueId, r.error().message);
        }
        deps_.metrics->databaseWrite();
        deps_.metrics->downloadFailed(queueId);
        spdlog::error("DownloadQueue: item {} ({}) failed: {}", queueId, item.mangaSlug, message);
        emit(DownloadFailed{queueId, item.mangaId, item.chapterId, message});
    }
    pump();
}

Result<std::uint64_t> DownloadQueue::runJob(const Dependencies& deps,
                                            const DownloadQueueOptions& options,
                                            const QueuedDownload& item, Job& job) {
    const downloader::ShouldCancel cancelled = [&job] { return job.cancelled.load(); };

    auto manga = deps.catalog->fetchManga(item.extensionId, item.mangaId);
    if (!manga) {
        return manga.error();
    }
    const auto& details = manga.value();

    std::vector<ChapterSummary> chapters;
    if (item.chapterId) {
        auto chapter = findChapter(details, *item.chapterId);
        if (!chapter) {
            return Error{ErrorCode::NotFound,
                         "Chapter " + *item.chapterId + " not found in manga " + item.mangaId};
        }
        chapters.push_back(std::move(*chapter));
    } else {
        chapters = details.chapters;
    }

    std::optional<std::string> coverFile;
    const auto& paths = deps.storage->paths();
    if (!fsutil::fileExists(paths.mangaMetadataFile(item.extensionId, item.mangaSlug)) &&
        details.coverUrl && !details.coverUrl->empty()) {
        if (auto r = fsutil::ensureDir(paths.mangaDir(item.extensionId, item.mangaSlug)); r) {
            coverFile = downloadCover(deps, item, *details.coverUrl, cancelled);
        }
    }
    if (auto prepared = deps.storage->prepareManga(item.extensionId, details, item.mangaSlug,
                                                   coverFile);
        !prepared) {
        return prepared.error();
    }

    const int chapterCount = static_cast<int>(chapters.size());
    std::uint64_t pagesDownloaded = 0;
    for (int i = 0; i < chapterCount; ++i) {
        if (cancelled()) {
            return Error{ErrorCode::OperationCancelled, "Download cancelled"};
        }
        const auto& chapter = chapters[static_cast<std::size_t>(i)];
        auto pages = deps.catalog->fetchChapterPages(item.extensionId, item.mangaId, chapter.id);
        if (!pages) {
            return pages.error();
        }
        if (pages.value().pages.empty()) {
            return Error{ErrorCode::InvalidData, "No pages found for this chapter"};
        }

        // Single chapters count pages; whole-manga items count chapters x 100.
        std::function<void(int, int)> progress;
        if (item.chapterId) {
            progress = [&job, &chapter](int current, int total) {
                job.report(current, total, chapter.id);
            };
        } else {
            progress = [&job, &chapter, i, chapterCount](int current, int total) {
                const double fraction = total > 0 ? static_cast<double>(current) / total : 0.0;
                job.report(static_cast<int>(std::floor((i + fraction) * 100)), chapterCount * 100,
                           chapter.id);
            };
        }
        progress(0, static_cast<int>(pages.value().pages.size()));

        auto stored = downloadChapter(deps, options, item, chapter, pages.value().pages,
                                      job.cancelled, progress);
        if (!stored) {
            return stored.error();
        }
        const auto& doc = stored.value();
        {
            std::lock_guard<std::mutex> lock(job.commitMutex);
            if (job.cancelled) {
                return Error{ErrorCode::OperationCancelled, "Download cancelled"};
            }
            auto committed =
                deps.storage->commitChapter(item.extensionId, item.mangaSlug, chapter, doc);
            if (!committed) {
                return committed.error();
            }
            job.settled = i + 1 == chapterCount;
        }
        spdlog::debug("DownloadQueue: stored {} pages for chapter {} of {}", doc.pages.size(),
                      chapter.id, item.mangaSlug);
        pagesDownloaded += doc.pages.size();
    }
    return pagesDownloaded;
}

// --- commands ----------------------------------------------------------------

Result<QueueId> DownloadQueue::queueChapter(const QueueChapterRequest& request) {
    if (deps_.storage->isChapterDownloaded(request.extensionId, request.mangaId,
                                           request.chapterId)) {
        spdlog::warn("DownloadQueue: chapter {} of {} already downloaded", request.chapterId,
                     request.mangaId);
        return Error{ErrorCode::InvalidState, "Chapter already downloaded"};
    }
    auto manga = deps_.catalog->fetchManga(request.extensionId, request.mangaId);
    if (!manga) {
        return manga.error();
    }
    auto slug = resolveMangaSlug(manga.value(), request.mangaId);
    if (!slug) {
        return slug.error();
    }
    const auto chapter = findChapter(manga.value(), request.chapterId);

    QueuedDownload q;
    q.extensionId = request.extensionId;
    q.mangaId = request.mangaId;
    q.mangaSlug = slug.value();
    q.mangaTitle = manga.value().title;
    q.chapterId = request.chapterId;
    if (chapter) {
        q.chapterNumber = chapter->number;
        q.chapterTitle = chapter->title;
    }
    q.priority = request.priority;
    q.queuedAt = nowMillis();

    auto id = deps_.repository->enqueue(q);
    if (!id) {
        return id.error();
    }
    deps_.metrics->databaseWrite();
    spdlog::info("DownloadQueue: queued chapter {} of {} as item {}", request.chapterId,
                 q.mangaSlug, id.value());
    emit(DownloadQueued{id.value(), {id.value()}, request.mangaId, request.chapterId});
    pump();
    return id;
}

Result<std::vector<QueueId>> DownloadQueue::queueManga(const QueueMangaRequest& request) {
    auto manga = deps_.catalog->fetchManga(request.extensionId, request.mangaId);
    if (!manga) {
        return manga.error();
    }
    auto slug = resolveMangaSlug(manga.value(), request.mangaId);
    if (!slug) {
        return slug.error();
    }

    std::optional<std::set<std::string>> wanted;
    if (request.chapterIds) {
        wanted.emplace(request.chapterIds->begin(), request.chapterIds->end());
    }

    std::vector<QueueId> ids;
    const auto now = nowMillis();
    for (const auto& chapter : manga.value().chapters) {
        if (wanted && !wanted->contains(chapter.id)) {
            continue;
        }
        if (deps_.storage->isChapterDownloaded(request.extensionId, request.mangaId, chapter.id)) {
            spdlog::debug("DownloadQueue: skipping downloaded chapter {}",
                          chapter.number.value_or(chapter.id));
            continue;
        }
        QueuedDownload q;
        q.extensionId = request.extensionId;
        q.mangaId = request.mangaId;
        q.mangaSlug = slug.value();
        q.mangaTitle = manga.value().title;
        q.chapterId = chapter.id;
        q.chapterNumber = chapter.number;
        q.chapterTitle = chapter.title;
        q.priority = request.priority;
        q.queuedAt = now;
        auto id = deps_.repository->enqueue(q);
        if (!id) {
            spdlog::error("DownloadQueue: failed to queue chapter {}: {}", chapter.id,
                          id.error().message);
            continue;
        }
        deps_.metrics->databaseWrite();
        ids.push_back(id.value());
    }

    spdlog::info("DownloadQueue: queued {} chapters of {}", ids.size(), slug.value());
    if (!ids.empty()) {
        emit(DownloadQueued{ids.front(), ids, request.mangaId, std::nullopt});
        pump();
    }
    return ids;
}

Result<void> DownloadQueue::cancel(QueueId queueId) {
    auto item = deps_.repository->getQueueItem(queueId);
    if (!item) {
        return Error{ErrorCode::NotFound, "Queue item " + std::to_string(queueId) + " not found"};
    }
    if (isTerminal(item->status)) {
        return {};
    }
    if (auto it = active_.find(queueId); it != active_.end() && !it->second->abandon()) {
        spdlog::info("DownloadQueue: item {} already stored, cancel has no effect", queueId);
        return {};
    }
    if (auto r = deps_.repository->updateQueueStatus(queueId, DownloadStatus::Failed,
                                                     std::string("Cancelled by user"));
        !r) {
        return r;
    }
    deps_.metrics->databaseWrite();
    batcher_->remove(queueId);
    spdlog::info("DownloadQueue: cancelled item {}", queueId);
    emit(DownloadFailed{queueId, item->mangaId, item->chapterId, "Cancelled by user"});
    return {};
}

Result<void> DownloadQueue::retry(QueueId queueId) {
    auto item = deps_.repository->getQueueItem(queueId);
    if (!item) {
        return Error{ErrorCode::NotFound, "Queue item " + std::to_string(queueId) + " not found"};
    }
    if (item->status != DownloadStatus::Failed) {
        return Error{ErrorCode::InvalidState, "Only failed downloads can be retried (item " +
                                                  std::to_string(queueId) + " is " +
                                                  toString(item->status) + ")"};
    }
    if (auto r = deps_.repository->resetQueueItem(queueId); !r) {
        return r;
    }
    deps_.metrics->databaseWrite();
    emit(DownloadRetried{queueId, item->mangaId, item->chapterId});
    pump();
    return {};
}

std::vector<QueueId> DownloadQueue::retryFrozen() {
    std::vector<QueueId> retried;
    const auto now = nowMillis();
    const auto frozenAfter = options_.frozenAfter.count();
    for (const auto& item : deps_.repository->listActiveQueue()) {
        if (item.status != DownloadStatus::Downloading || !item.startedAt) {
            continue;
        }
        const auto elapsed = now - *item.startedAt;
        const bool stalled = elapsed > frozenAfter && item.progressCurrent == 0;
        const bool crawling = elapsed > 4 * frozenAfter && item.progressTotal > 0 &&
                              item.progressCurrent * 10 < item.progressTotal;
        if (!stalled && !crawling) {
            continue;
        }
        if (auto it = active_.find(item.id); it != active_.end() && !it->second->abandon()) {
            continue;
        }
        batcher_->remove(item.id);
        if (auto r = deps_.repository->resetQueueItem(item.id); !r) {
            spdlog::error("DownloadQueue: cannot requeue frozen item {}: {}", item.id,
                          r.error().message);
            continue;
        }
        deps_.metrics->databaseWrite();
        spdlog::warn("DownloadQueue: requeued frozen item {} ({}ms without progress)", item.id,
                     elapsed);
        retried.push_back(item.id);
        emit(DownloadRetried{item.id, item.mangaId, item.chapterId});
    }
    return retried;
}

Result<int> DownloadQueue::pauseAll() {
    auto paused = deps_.repository->pauseQueued();
    if (!paused) {
        return paused.error();
    }
    deps_.metrics->databaseWrite();
    spdlog::info("DownloadQueue: paused {} queued items", paused.value());
    return paused;
}

Result<int> DownloadQueue::resumeAll() {
    auto resumed = deps_.repository->resumePaused();
    if (!resumed) {
        return resumed.error();
    }
    deps_.metrics->databaseWrite();
    spdlog::info("DownloadQueue: resumed {} paused items", resumed.value());
    pump();
    return resumed;
}

std::vector<QueueId> DownloadQueue::activeDownloads() const {
    std::vector<QueueId> ids;
    ids.reserve(active_.size());
    for (const auto& [id, job] : active_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<QueuedDownload> DownloadQueue::queued() const {
    return deps_.repository->listActiveQueue();
}

} // namespace tankobon::offline
