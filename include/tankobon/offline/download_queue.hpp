#pragma once

#include <tankobon/core/types.h>
#include <tankobon/downloader/image_downloader.hpp>
#include <tankobon/offline/catalog.hpp>
#include <tankobon/offline/events.hpp>
#include <tankobon/offline/performance_metrics.hpp>
#include <tankobon/offline/progress_batcher.hpp>
#include <tankobon/offline/repository.hpp>
#include <tankobon/offline/storage_manager.hpp>
#include <tankobon/offline/types.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tankobon::offline {

struct DownloadQueueOptions {
    int concurrency{3};     // queue items in flight
    int pageConcurrency{3}; // pages in flight per chapter
    std::chrono::milliseconds pollingInterval{1000};
    std::chrono::milliseconds frozenAfter{30000};
    std::chrono::milliseconds progressFlush{1500};
};

struct QueueChapterRequest {
    std::string extensionId;
    std::string mangaId;
    std::string chapterId;
    int priority{0};
};

struct QueueMangaRequest {
    std::string extensionId;
    std::string mangaId;
    // Restricts the batch to these chapters when set.
    std::optional<std::vector<std::string>> chapterIds;
    int priority{0};
};

/**
 * Drains the persisted download queue.
 *
 * Every method must be called on the executor the queue was built with; that
 * executor owns the queue rows and the in-flight table. Transfers run on an
 * internal thread pool and report progress and completion back through the
 * executor.
 */
class DownloadQueue {
public:
    struct Dependencies {
        std::shared_ptr<IOfflineRepository> repository;
        std::shared_ptr<ICatalogSource> catalog;
        std::shared_ptr<downloader::ImageDownloader> downloader;
        std::shared_ptr<StorageManager> storage;
        std::shared_ptr<PerformanceMetricsTracker> metrics;
    };

    DownloadQueue(boost::asio::any_io_executor executor, Dependencies deps,
                  DownloadQueueOptions options = {}, EventSink events = {});
    ~DownloadQueue();

    DownloadQueue(const DownloadQueue&) = delete;
    DownloadQueue& operator=(const DownloadQueue&) = delete;

    void start();
    // In-flight transfers are left to finish; nothing new is picked up.
    void stop();
    bool isActive() const { return running_; }

    Result<QueueId> queueChapter(const QueueChapterRequest& request);
    // Empty result when every requested chapter is already downloaded.
    Result<std::vector<QueueId>> queueManga(const QueueMangaRequest& request);

    Result<void> cancel(QueueId queueId);
    Result<void> retry(QueueId queueId);
    std::vector<QueueId> retryFrozen();

    // Parks every queued item; transfers already running are not interrupted.
    Result<int> pauseAll();
    // Returns paused items to the queue and starts draining them.
    Result<int> resumeAll();

    std::vector<QueueId> activeDownloads() const;
    std::vector<QueuedDownload> queued() const;

    const DownloadQueueOptions& options() const { return options_; }

private:
    struct Job;

    boost::asio::awaitable<void> pollLoop(std::uint64_t generation);
    void pump();
    void launch(const QueuedDownload& item);
    void finish(QueueId queueId, Result<std::uint64_t> outcome);
    void emit(const OfflineEvent& event);

    // Pool side.
    static Result<std::uint64_t> runJob(const Dependencies& deps, const DownloadQueueOptions& options,
                                        const QueuedDownload& item, Job& job);

    boost::asio::any_io_executor executor_;
    Dependencies deps_;
    DownloadQueueOptions options_;
    EventSink events_;

    std::unique_ptr<ProgressBatcher> batcher_;
    boost::asio::steady_timer pollTimer_;
    boost::asio::thread_pool jobPool_;

    bool running_ = false;
    std::uint64_t generation_ = 0;
    std::map<QueueId, std::shared_ptr<Job>> active_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace tankobon::offline
