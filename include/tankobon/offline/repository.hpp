#pragma once

#include <tankobon/core/types.h>
#include <tankobon/offline/types.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tankobon::offline {

struct QueueProgressRow {
    QueueId queueId{0};
    int progressCurrent{0};
    int progressTotal{0};
};

/**
 * Persistence for downloaded manga/chapter rows, the download queue and its
 * history.
 *
 * Mutations return Result so a failed write surfaces to the caller; reads
 * return whatever is currently held.
 */
class IOfflineRepository {
public:
    virtual ~IOfflineRepository() = default;

    // --- manga ---
    // Insert, or refresh lastUpdatedAt/size of the existing (extensionId, mangaId) row.
    virtual Result<std::int64_t> upsertManga(const OfflineMangaRow& row) = 0;
    virtual std::optional<OfflineMangaRow> getManga(const std::string& extensionId,
                                                    const std::string& mangaId) const = 0;
    // First match across extensions.
    virtual std::optional<OfflineMangaRow> findManga(const std::string& mangaId) const = 0;
    // Newest download first.
    virtual std::vector<OfflineMangaRow> listManga() const = 0;
    // Also drops the manga's chapter rows.
    virtual Result<void> deleteManga(const std::string& extensionId,
                                     const std::string& mangaId) = 0;
    virtual Result<void> updateMangaSize(const std::string& extensionId,
                                         const std::string& mangaId,
                                         std::uint64_t totalSizeBytes) = 0;

    // --- chapters ---
    virtual Result<std::int64_t> upsertChapter(const OfflineChapterRow& row) = 0;
    virtual std::optional<OfflineChapterRow> getChapter(std::int64_t offlineMangaId,
                                                        const std::string& chapterId) const = 0;
    virtual std::vector<OfflineChapterRow> listChapters(std::int64_t offlineMangaId) const = 0;
    virtual Result<void> deleteChapter(std::int64_t offlineMangaId,
                                       const std::string& chapterId) = 0;

    // --- queue ---
    // Re-queueing the same (extensionId, mangaId, chapterId) reuses its row.
    virtual Result<QueueId> enqueue(const QueuedDownload& item) = 0;
    virtual std::optional<QueuedDownload> getQueueItem(QueueId id) const = 0;
    // Status queued, downloading or paused, priority DESC then queuedAt ASC.
    virtual std::vector<QueuedDownload> listActiveQueue() const = 0;
    // Up to limit items with status queued, in drain order.
    virtual std::vector<QueuedDownload> nextQueued(std::size_t limit) const = 0;
    // Sets startedAt on the first transition to downloading and completedAt
    // on completed/failed.
    virtual Result<void> updateQueueStatus(QueueId id, DownloadStatus status,
                                           std::optional<std::string> errorMessage = {}) = 0;
    // Back to queued: clears error, start/completion times and progress.
    virtual Result<void> resetQueueItem(QueueId id) = 0;
    virtual Result<void> updateQueueProgress(QueueId id, int current, int total) = 0;
    virtual Result<void> updateQueueProgressBatch(const std::vector<QueueProgressRow>& rows) = 0;
    virtual Result<void> deleteQueueItem(QueueId id) = 0;
    // Bulk queued -> paused and paused -> queued; both return the rows moved.
    virtual Result<int> pauseQueued() = 0;
    virtual Result<int> resumePaused() = 0;

    // --- history ---
    // Copies a terminal queue item into history and removes it from the queue.
    virtual Result<void> moveToHistory(QueueId id) = 0;
    // Newest completion first; limit 0 means all.
    virtual std::vector<DownloadHistoryItem> history(std::size_t limit = 0) const = 0;
    virtual Result<void> deleteHistoryItem(std::int64_t historyId) = 0;
    virtual Result<void> clearHistory() = 0;

    // --- totals ---
    virtual std::uint64_t totalStorageBytes() const = 0;
    virtual int chapterCount() const = 0;
    virtual int pageCount() const = 0;
    virtual std::map<std::string, std::uint64_t> storageByExtension() const = 0;

    // Drops manga, chapters, queue and history.
    virtual Result<void> clearAll() = 0;
};

/**
 * In-memory store snapshotted to a JSON file after every mutation.
 *
 * An empty path keeps everything in memory. A file that fails to parse is
 * logged and replaced by an empty store.
 */
class JsonOfflineRepository final : public IOfflineRepository {
public:
    explicit JsonOfflineRepository(std::filesystem::path dbPath = {});

    static Result<std::unique_ptr<JsonOfflineRepository>> open(std::filesystem::path dbPath);

    const std::filesystem::path& path() const { return path_; }

    Result<std::int64_t> upsertManga(const OfflineMangaRow& row) override;
    std::optional<OfflineMangaRow> getManga(const std::string& extensionId,
                                            const std::string& mangaId) const override;
    std::optional<OfflineMangaRow> findManga(const std::string& mangaId) const override;
    std::vector<OfflineMangaRow> listManga() const override;
    Result<void> deleteManga(const std::string& extensionId, const std::string& mangaId) override;
    Result<void> updateMangaSize(const std::string& extensionId, const std::string& mangaId,
                                 std::uint64_t totalSizeBytes) override;

    Result<std::int64_t> upsertChapter(const OfflineChapterRow& row) override;
    std::optional<OfflineChapterRow> getChapter(std::int64_t offlineMangaId,
                                                const std::string& chapterId) const override;
    std::vector<OfflineChapterRow> listChapters(std::int64_t offlineMangaId) const override;
    Result<void> deleteChapter(std::int64_t offlineMangaId, const std::string& chapterId) override;

    Result<QueueId> enqueue(const QueuedDownload& item) override;
    std::optional<QueuedDownload> getQueueItem(QueueId id) const override;
    std::vector<QueuedDownload> listActiveQueue() const override;
    std::vector<QueuedDownload> nextQueued(std::size_t limit) const override;
    Result<void> updateQueueStatus(QueueId id, DownloadStatus status,
                                   std::optional<std::string> errorMessage = {}) override;
    Result<void> resetQueueItem(QueueId id) override;
    Result<void> updateQueueProgress(QueueId id, int current, int total) override;
    Result<void> updateQueueProgressBatch(const std::vector<QueueProgressRow>& rows) override;
    Result<void> deleteQueueItem(QueueId id) override;
    Result<int> pauseQueued() override;
    Result<int> resumePaused() override;

    Result<void> moveToHistory(QueueId id) override;
    std::vector<DownloadHistoryItem> history(std::size_t limit = 0) const override;
    Result<void> deleteHistoryItem(std::int64_t historyId) override;
    Result<void> clearHistory() override;

    std::uint64_t totalStorageBytes() const override;
    int chapterCount() const override;
    int pageCount() const override;
    std::map<std::string, std::uint64_t> storageByExtension() const override;

    Result<void> clearAll() override;

private:
    Result<void> load();
    Result<void> persistLocked() const;
    std::vector<QueuedDownload> sortedQueueLocked(bool queuedOnly) const;
    Result<int> moveStatusLocked(DownloadStatus from, DownloadStatus to);

    std::filesystem::path path_;
    mutable std::mutex mutex_;

    std::int64_t nextMangaId_{1};
    std::int64_t nextChapterId_{1};
    QueueId nextQueueId_{1};
    std::int64_t nextHistoryId_{1};

    std::map<std::int64_t, OfflineMangaRow> manga_;
    std::map<std::int64_t, OfflineChapterRow> chapters_;
    std::map<QueueId, QueuedDownload> queue_;
    std::map<std::int64_t, DownloadHistoryItem> history_;
};

} // namespace tankobon::offline
