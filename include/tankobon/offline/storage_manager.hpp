#pragma once

#include <tankobon/core/types.h>
#include <tankobon/offline/catalog.hpp>
#include <tankobon/offline/events.hpp>
#include <tankobon/offline/paths.hpp>
#include <tankobon/offline/repository.hpp>
#include <tankobon/offline/types.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tankobon::offline {

struct BackgroundSyncOptions {
    std::chrono::milliseconds ttl{std::chrono::hours(24)};
    int concurrency{2};
    std::chrono::milliseconds delay{1000}; // between batches
};

/**
 * Owns the on-disk offline tree and keeps the metadata documents in step with
 * the repository rows.
 *
 * Every read-modify-write of a manga document is serialized on one mutex, so
 * the download queue, host commands and the background sync thread can share
 * an instance. Events are raised on whichever thread made the change.
 */
class StorageManager {
public:
    StorageManager(std::filesystem::path dataDir, std::shared_ptr<IOfflineRepository> repository,
                   std::shared_ptr<ICatalogSource> catalog, EventSink events = {});
    ~StorageManager();

    StorageManager(const StorageManager&) = delete;
    StorageManager& operator=(const StorageManager&) = delete;

    const PathBuilder& paths() const { return paths_; }

    // --- download side ---

    /// Creates the manga directory, document and row on first download; later
    /// calls only bump lastUpdatedAt. coverFile is the file name of an already
    /// written cover, if any.
    Result<OfflineMangaMetadata> prepareManga(const std::string& extensionId,
                                              const CatalogManga& manga,
                                              const std::string& mangaSlug,
                                              const std::optional<std::string>& coverFile);

    /// Records a chapter whose pages and metadata.json are already on disk:
    /// replaces its entry in the manga document, upserts the chapter row and
    /// recomputes the manga size.
    Result<OfflineChapterMetadata> commitChapter(const std::string& extensionId,
                                                 const std::string& mangaSlug,
                                                 const ChapterSummary& chapter,
                                                 const OfflineChapterPages& pages);

    bool isChapterDownloaded(const std::string& extensionId, const std::string& mangaId,
                             const std::string& chapterId) const;
    bool isMangaDownloaded(const std::string& extensionId, const std::string& mangaId) const;

    // --- queries ---

    std::vector<OfflineMangaMetadata> downloadedManga();
    std::optional<OfflineMangaMetadata> mangaMetadata(const std::string& extensionId,
                                                      const std::string& mangaId);
    std::vector<OfflineChapterMetadata> downloadedChapters(const std::string& extensionId,
                                                           const std::string& mangaId);
    std::optional<OfflineChapterPages> chapterPages(const std::string& extensionId,
                                                    const std::string& mangaId,
                                                    const std::string& chapterId);

    std::optional<DownloadProgress> downloadProgress(QueueId queueId);

    // Absolute page path, or nullopt for unknown chapters or non-plain filenames.
    std::optional<std::filesystem::path> pagePath(const std::string& mangaId,
                                                  const std::string& chapterId,
                                                  const std::string& filename) const;

    StorageStats storageStats();

    // --- maintenance ---

    std::optional<OfflineMangaMetadata> rebuildMangaMetadata(const std::string& extensionId,
                                                             const std::string& mangaId);
    ValidationResult validateMangaChapterCount(const std::string& extensionId,
                                               const std::string& mangaId);

    /// Refreshes stale manga documents from the catalog on a background
    /// thread. A sync already in progress makes this a no-op.
    void startBackgroundSync(BackgroundSyncOptions options);
    bool backgroundSyncRunning() const { return syncRunning_.load(); }
    void stopBackgroundSync();

    Result<void> deleteChapter(const std::string& extensionId, const std::string& mangaId,
                               const std::string& chapterId);
    Result<void> deleteManga(const std::string& extensionId, const std::string& mangaId);

    /// Removes the whole offline tree and every repository row, then recreates
    /// the empty offline directory.
    Result<void> nuke();

    // --- storage limits ---

    StorageUsage storageUsage();
    // True when auto cleanup is on and usage has reached thresholdPercent of
    // maxStorageGb.
    bool shouldCleanup(const CleanupSettings& settings);
    /// Deletes whole manga in strategy order until usage drops to
    /// maxStorageGb - targetFreeGb. A manga that fails to delete is recorded
    /// in errors and the pass moves on.
    CleanupResult performCleanup(const CleanupSettings& settings, double targetFreeGb = 1.0);

private:
    std::optional<OfflineMangaMetadata>
    ensureMangaMetadataLocked(const std::string& extensionId, const std::string& mangaId,
                              bool force, const std::optional<CatalogManga>& details = std::nullopt);
    // Catalog lookup for a forced rebuild; call without docMutex_ held.
    std::optional<CatalogManga> fetchCatalogDetails(const std::string& extensionId,
                                                    const std::string& mangaId) const;
    OfflineMangaMetadata buildMangaMetadataLocked(const OfflineMangaRow& row,
                                                  const std::vector<OfflineChapterRow>& chapters,
                                                  const std::optional<OfflineMangaMetadata>& existing,
                                                  const std::optional<CatalogManga>& details);
    OfflineChapterMetadata buildChapterMetadata(const OfflineMangaRow& manga,
                                                const OfflineChapterRow& row,
                                                const std::optional<ChapterSummary>& details) const;
    std::string resolveCoverPath(const std::filesystem::path& mangaDir,
                                 const std::optional<OfflineMangaMetadata>& existing) const;
    Result<void> deleteMangaLocked(const std::string& extensionId, const std::string& mangaId);

    struct CleanupCandidate {
        OfflineMangaRow row;
        std::string title;
        EpochMillis downloadedAt{0};
        std::uint64_t totalBytes{0};
        std::int64_t lastAccessedAt{0};
    };
    std::vector<CleanupCandidate> cleanupCandidatesLocked() const;
    void syncOne(const OfflineMangaRow& row);
    void runSync(std::stop_token stop, BackgroundSyncOptions options);
    void emit(const OfflineEvent& event) const;

    PathBuilder paths_;
    std::shared_ptr<IOfflineRepository> repository_;
    std::shared_ptr<ICatalogSource> catalog_;
    EventSink events_;

    mutable std::mutex docMutex_;

    std::mutex syncMutex_;
    std::jthread syncThread_;
    std::atomic<bool> syncRunning_{false};
};

} // namespace tankobon::offline
