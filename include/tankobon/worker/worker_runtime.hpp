#pragma once

#include <tankobon/core/types.h>
#include <tankobon/downloader/page_fetcher.hpp>
#include <tankobon/offline/catalog.hpp>
#include <tankobon/offline/download_queue.hpp>
#include <tankobon/offline/metadata_cache.hpp>
#include <tankobon/offline/performance_metrics.hpp>
#include <tankobon/offline/repository.hpp>
#include <tankobon/offline/storage_manager.hpp>
#include <tankobon/worker/protocol.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tankobon::worker {

/**
 * Worker-process side of the protocol.
 *
 * Consumes host lines one at a time on its executor, which must be a strand
 * or a single-threaded context: it owns the download queue and every other
 * piece of mutable worker state. Replies and events leave through the line
 * sink, which is called from the executor and from transfer and sync threads
 * and must therefore be thread-safe.
 */
class WorkerRuntime {
public:
    using LineSink = std::function<void(const std::string&)>;
    using ExitRequest = std::function<void(int status)>;

    struct Hooks {
        // Replaces the libcurl fetcher; used by tests.
        std::shared_ptr<downloader::IPageFetcher> fetcher;
        // Replaces the sliced sleep between page retries.
        downloader::ImageDownloader::Sleeper sleeper;
    };

    WorkerRuntime(boost::asio::any_io_executor executor, LineSink sink, ExitRequest exit,
                  Hooks hooks = {});
    ~WorkerRuntime();

    WorkerRuntime(const WorkerRuntime&) = delete;
    WorkerRuntime& operator=(const WorkerRuntime&) = delete;

    void handleLine(const std::string& line);

    /// Stops draining and background sync. Safe to call more than once.
    void shutdown();

    bool initialized() const { return queue_ != nullptr; }
    const std::optional<WorkerInitConfig>& config() const { return config_; }

private:
    Result<void> initialize(const WorkerInitConfig& config);
    void handleCommand(const CommandMessage& message);
    Result<json> dispatch(Command command, const json& payload);
    void forward(const offline::OfflineEvent& event);
    void send(const WorkerMessage& message);
    std::string extensionOf(const json& payload) const;

    boost::asio::any_io_executor executor_;
    LineSink sink_;
    ExitRequest exit_;
    Hooks hooks_;

    std::optional<WorkerInitConfig> config_;
    std::shared_ptr<offline::IOfflineRepository> repository_;
    std::shared_ptr<offline::PerformanceMetricsTracker> metrics_;
    std::shared_ptr<offline::MetadataCache> cache_;
    std::shared_ptr<offline::ICatalogSource> catalog_;
    std::shared_ptr<offline::StorageManager> storage_;
    std::unique_ptr<offline::DownloadQueue> queue_;
};

} // namespace tankobon::worker
