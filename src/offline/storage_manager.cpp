#include <spdlog/spdlog.h>
#include <tankobon/offline/file_system.hpp>
#include <tankobon/offline/storage_manager.hpp>

#include <sys/stat.h>

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <set>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>

namespace tankobon::offline {

namespace {

// Chapter slugs come from catalog numbers/titles, which may carry characters
// sanitizeSlug rejects.
std::string chapterSlug(const std::vector<std::string>& candidates) {
    for (const auto& candidate : candidates) {
        if (candidate.empty()) {
            continue;
        }
        try {
            return sanitizeSlug(candidate);
        } catch (const std::invalid_argument&) {
            continue;
        }
    }
    return "chapter";
}

} // namespace

StorageManager::StorageManager(std::filesystem::path dataDir,
                               std::shared_ptr<IOfflineRepository> repository,
                               std::shared_ptr<ICatalogSource> catalog, EventSink events)
    : paths_(std::move(dataDir)), repository_(std::move(repository)),
      catalog_(std::move(catalog)), events_(std::move(events)) {}

StorageManager::~StorageManager() {
    stopBackgroundSync();
}

void StorageManager::emit(const OfflineEvent& event) const {
    if (!events_) {
        return;
    }
    try {
        events_(event);
    } catch (const std::exception& e) {
        spdlog::warn("StorageManager: event listener threw: {}", e.what());
    } catch (...) {
        spdlog::warn("StorageManager: event listener threw a non-standard exception");
    }
}

// --- download side -----------------------------------------------------------

Result<OfflineMangaMetadata> StorageManager::prepareManga(const std::string& extensionId,
                                                          const CatalogManga& manga,
                                                          const std::string& mangaSlug,
                                                          const std::optional<std::string>& coverFile) {
    std::lock_guard<std::mutex> lock(docMutex_);
    const auto mangaDir = paths_.mangaDir(extensionId, mangaSlug);
    const auto metadataFile = paths_.mangaMetadataFile(extensionId, mangaSlug);
    const auto now = nowMillis();

    auto existing = fsutil::readDocument<OfflineMangaMetadata>(metadataFile);
    if (existing) {
        auto doc = std::move(existing).value();
        doc.lastUpdatedAt = now;
        if (coverFile) {
            doc.coverPath = *coverFile;
        }
        if (auto w = fsutil::writeDocument(metadataFile, doc); !w) {
            return w.error();
        }
        if (!repository_->getManga(extensionId, manga.id)) {
            // Document survived a lost repository; re-register it.
            OfflineMangaRow row{0,   extensionId, manga.id, mangaSlug, mangaDir.string(),
                                doc.downloadedAt, now, fsutil::dirSize(mangaDir)};
            if (auto r = repository_->upsertManga(row); !r) {
                return r.error();
            }
        }
        return doc;
    }
    if (existing.error().code != ErrorCode::FileNotFound) {
        spdlog::warn("StorageManager: replacing unreadable {}: {}", metadataFile.string(),
                     existing.error().message);
    }

    if (auto r = fsutil::ensureDir(paths_.chaptersDir(extensionId, mangaSlug)); !r) {
        return r.error();
    }

    OfflineMangaMetadata doc;
    doc.downloadedAt = now;
    doc.lastUpdatedAt = now;
    doc.mangaId = manga.id;
    doc.slug = mangaSlug;
    doc.extensionId = extensionId;
    doc.title = manga.title;
    doc.description = manga.description;
    doc.coverUrl = manga.coverUrl;
    doc.coverPath = coverFile.value_or("cover.jpg");
    doc.authors = manga.authors;
    doc.artists = manga.artists;
    doc.genres = manga.genres;
    doc.tags = manga.tags;
    doc.rating = manga.rating;
    doc.year = manga.year;
    doc.status = manga.status;
    doc.demographic = manga.demographic;
    doc.altTitles = manga.altTitles;

    if (auto w = fsutil::writeDocument(metadataFile, doc); !w) {
        return w.error();
    }

    OfflineMangaRow row;
    row.extensionId = extensionId;
    row.mangaId = manga.id;
    row.mangaSlug = mangaSlug;
    row.downloadPath = mangaDir.string();
    row.downloadedAt = now;
    row.lastUpdatedAt = now;
    row.totalSizeBytes = fsutil::dirSize(mangaDir);
    if (auto r = repository_->upsertManga(row); !r) {
        return r.error();
    }

    spdlog::info("StorageManager: created offline entry for '{}' ({}/{})", manga.title,
                 extensionId, mangaSlug);
    return doc;
}

Result<OfflineChapterMetadata> StorageManager::commitChapter(const std::string& extensionId,
                                                             const std::string& mangaSlug,
                                                             const ChapterSummary& chapter,
                                                             const OfflineChapterPages& pages) {
    std::lock_guard<std::mutex> lock(docMutex_);
    const auto metadataFile = paths_.mangaMetadataFile(extensionId, mangaSlug);
    auto doc = fsutil::readDocument<OfflineMangaMetadata>(metadataFile);
    if (!doc) {
        return Error{ErrorCode::InvalidState,
                     "Manga metadata missing for " + mangaSlug + ": " + doc.error().message};
    }
    auto& manga = doc.value();
    const auto now = nowMillis();
    const auto chapterDir = paths_.chapterDir(extensionId, mangaSlug, pages.folderName);

    OfflineChapterMetadata entry;
    entry.chapterId = chapter.id;
    entry.slug = chapterSlug({chapter.number.value_or(""), chapter.id});
    entry.number = chapter.number;
    entry.title = chapter.title;
    entry.displayTitle = formatChapterTitle(chapter);
    entry.volume = chapter.volume;
    entry.publishedAt = chapter.publishedAt;
    entry.languageCode = chapter.languageCode;
    entry.scanlators = chapter.scanlators;
    entry.folderName = pages.folderName;
    entry.totalPages = static_cast<int>(pages.pages.size());
    entry.downloadedAt = now;
    entry.sizeBytes = fsutil::dirSize(chapterDir);

    auto it = std::find_if(manga.chapters.begin(), manga.chapters.end(),
                           [&](const auto& c) { return c.chapterId == chapter.id; });
    if (it != manga.chapters.end()) {
        *it = entry;
    } else {
        manga.chapters.push_back(entry);
    }
    manga.lastUpdatedAt = now;
    if (auto w = fsutil::writeDocument(metadataFile, manga); !w) {
        return w.error();
    }

    auto row = repository_->getManga(extensionId, manga.mangaId);
    if (!row) {
        return Error{ErrorCode::NotFound, "Manga not found in offline storage"};
    }
    OfflineChapterRow chapterRow;
    chapterRow.offlineMangaId = row->id;
    chapterRow.chapterId = chapter.id;
    chapterRow.chapterNumber = chapter.number;
    chapterRow.chapterTitle = chapter.title;
    chapterRow.folderName = pages.folderName;
    chapterRow.totalPages = entry.totalPages;
    chapterRow.downloadedAt = now;
    chapterRow.sizeBytes = entry.sizeBytes;
    if (auto r = repository_->upsertChapter(chapterRow); !r) {
        return r.error();
    }
    if (auto r = repository_->updateMangaSize(
            extensionId, manga.mangaId, fsutil::dirSize(paths_.mangaDir(extensionId, mangaSlug)));
        !r) {
        return r.error();
    }
    return entry;
}

bool StorageManager::isChapterDownloaded(const std::string& extensionId,
                                         const std::string& mangaId,
                                         const std::string& chapterId) const {
    auto manga = repository_->getManga(extensionId, mangaId);
    return manga && repository_->getChapter(manga->id, chapterId).has_value();
}

bool StorageManager::isMangaDownloaded(const std::string& extensionId,
                                       const std::string& mangaId) const {
    return repository_->getManga(extensionId, mangaId).has_value();
}

// --- queries -----------------------------------------------------------------

std::vector<OfflineMangaMetadata> StorageManager::downloadedManga() {
    std::lock_guard<std::mutex> lock(docMutex_);
    std::vector<OfflineMangaMetadata> out;
    for (const auto& row : repository_->listManga()) {
        if (auto doc = ensureMangaMetadataLocked(row.extensionId, row.mangaId, false)) {
            out.push_back(std::move(*doc));
        }
    }
    return out;
}

std::optional<OfflineMangaMetadata> StorageManager::mangaMetadata(const std::string& extensionId,
                                                                  const std::string& mangaId) {
    std::lock_guard<std::mutex> lock(docMutex_);
    return ensureMangaMetadataLocked(extensionId, mangaId, false);
}

std::vector<OfflineChapterMetadata>
StorageManager::downloadedChapters(const std::string& extensionId, const std::string& mangaId) {
    auto doc = mangaMetadata(extensionId, mangaId);
    return doc ? doc->chapters : std::vector<OfflineChapterMetadata>{};
}

std::optional<OfflineChapterPages> StorageManager::chapterPages(const std::string& extensionId,
                                                                const std::string& mangaId,
                                                                const std::string& chapterId) {
    auto doc = mangaMetadata(extensionId, mangaId);
    if (!doc) {
        return std::nullopt;
    }
    auto it = std::find_if(doc->chapters.begin(), doc->chapters.end(),
                           [&](const auto& c) { return c.chapterId == chapterId; });
    if (it == doc->chapters.end()) {
        return std::nullopt;
    }
    auto pages = fsutil::readDocument<OfflineChapterPages>(
        paths_.chapterMetadataFile(extensionId, doc->slug, it->folderName));
    if (!pages) {
        spdlog::debug("StorageManager: no pages document for {}/{}: {}", mangaId, chapterId,
                      pages.error().message);
        return std::nullopt;
    }
    return std::move(pages).value();
}

std::optional<DownloadProgress> StorageManager::downloadProgress(QueueId queueId) {
    auto item = repository_->getQueueItem(queueId);
    if (!item) {
        return std::nullopt;
    }

    DownloadProgress progress;
    progress.queueId = item->id;
    progress.mangaTitle = item->mangaTitle.value_or("");
    if (item->chapterId && (item->chapterNumber || item->chapterTitle)) {
        progress.chapterTitle = formatChapterTitle(
            ChapterSummary{*item->chapterId, item->chapterNumber, item->chapterTitle});
    }

    if ((progress.mangaTitle.empty() || (item->chapterId && !progress.chapterTitle)) && catalog_) {
        auto manga = catalog_->fetchManga(item->extensionId, item->mangaId);
        if (manga) {
            if (progress.mangaTitle.empty()) {
                progress.mangaTitle = manga.value().title;
            }
            if (item->chapterId && !progress.chapterTitle) {
                for (const auto& c : manga.value().chapters) {
                    if (c.id == *item->chapterId) {
                        progress.chapterTitle = formatChapterTitle(c);
                        break;
                    }
                }
            }
        }
    }
    if (progress.mangaTitle.empty()) {
        progress.mangaTitle = "Unknown";
    }

    progress.status = item->status;
    progress.progressCurrent = item->progressCurrent;
    progress.progressTotal = item->progressTotal;
    progress.progressPercent =
        item->progressTotal > 0
            ? static_cast<int>(std::lround(100.0 * item->progressCurrent / item->progressTotal))
            : 0;
    progress.errorMessage = item->errorMessage;
    return progress;
}

std::optional<std::filesystem::path> StorageManager::pagePath(const std::string& mangaId,
                                                              const std::string& chapterId,
                                                              const std::string& filename) const {
    if (!isPlainFilename(filename)) {
        return std::nullopt;
    }
    auto manga = repository_->findManga(mangaId);
    if (!manga) {
        return std::nullopt;
    }
    auto chapter = repository_->getChapter(manga->id, chapterId);
    if (!chapter) {
        return std::nullopt;
    }
    return paths_.pagePath(manga->extensionId, manga->mangaSlug, chapter->folderName, filename);
}

StorageStats StorageManager::storageStats() {
    StorageStats stats;
    const auto rows = repository_->listManga();
    stats.totalBytes = repository_->totalStorageBytes();
    stats.mangaCount = static_cast<int>(rows.size());
    stats.chapterCount = repository_->chapterCount();
    stats.pageCount = repository_->pageCount();
    stats.byExtension = repository_->storageByExtension();

    std::lock_guard<std::mutex> lock(docMutex_);
    for (const auto& row : rows) {
        MangaStorageInfo info;
        info.mangaId = row.mangaId;
        info.mangaSlug = row.mangaSlug;
        info.extensionId = row.extensionId;
        info.totalBytes = row.totalSizeBytes;
        info.downloadedAt = row.downloadedAt;
        info.chapterCount = static_cast<int>(repository_->listChapters(row.id).size());

        auto doc = fsutil::readDocument<OfflineMangaMetadata>(
            paths_.mangaMetadataFile(row.extensionId, row.mangaSlug));
        info.title = doc ? doc.value().title : row.mangaId;
        const auto cover = doc ? doc.value().coverPath : std::string("cover.jpg");
        info.coverPath = (paths_.mangaDir(row.extensionId, row.mangaSlug) / cover).string();
        stats.byManga.push_back(std::move(info));
    }
    return stats;
}

// --- maintenance -------------------------------------------------------------

std::optional<OfflineMangaMetadata>
StorageManager::ensureMangaMetadataLocked(const std::string& extensionId,
                                          const std::string& mangaId, bool force,
                                          const std::optional<CatalogManga>& details) {
    auto row = repository_->getManga(extensionId, mangaId);
    if (!row) {
        return std::nullopt;
    }
    const auto chapterRows = repository_->listChapters(row->id);

    std::optional<OfflineMangaMetadata> existing;
    auto read = fsutil::readDocument<OfflineMangaMetadata>(
        paths_.mangaMetadataFile(extensionId, row->mangaSlug));
    if (read) {
        existing = std::move(read).value();
    } else if (!force) {
        spdlog::warn("StorageManager: metadata for manga {} missing or unreadable: {}", mangaId,
                     read.error().message);
    }

    std::set<std::string> docIds;
    if (existing) {
        for (const auto& c : existing->chapters) {
            docIds.insert(c.chapterId);
        }
    }
    std::set<std::string> rowIds;
    for (const auto& c : chapterRows) {
        rowIds.insert(c.chapterId);
    }

    if (!force && existing && docIds == rowIds) {
        return existing;
    }

    if (force) {
        spdlog::info("StorageManager: rebuilding metadata for manga {}: forced", mangaId);
    } else if (!existing) {
        spdlog::warn("StorageManager: rebuilding metadata for manga {}: metadata missing",
                     mangaId);
    } else {
        spdlog::warn("StorageManager: rebuilding metadata for manga {}: chapter mismatch "
                     "(db={}, metadata={})",
                     mangaId, rowIds.size(), docIds.size());
    }

    return buildMangaMetadataLocked(*row, chapterRows, existing, details);
}

std::optional<CatalogManga> StorageManager::fetchCatalogDetails(const std::string& extensionId,
                                                                const std::string& mangaId) const {
    if (!catalog_) {
        return std::nullopt;
    }
    auto fetched = catalog_->refreshManga(extensionId, mangaId);
    if (!fetched) {
        spdlog::warn("StorageManager: catalog lookup failed while rebuilding {}: {}", mangaId,
                     fetched.error().message);
        return std::nullopt;
    }
    return std::move(fetched).value();
}

OfflineMangaMetadata
StorageManager::buildMangaMetadataLocked(const OfflineMangaRow& row,
                                         const std::vector<OfflineChapterRow>& chapters,
                                         const std::optional<OfflineMangaMetadata>& existing,
                                         const std::optional<CatalogManga>& details) {
    std::unordered_map<std::string, ChapterSummary> catalogChapters;
    if (details) {
        for (const auto& c : details->chapters) {
            catalogChapters.emplace(c.id, c);
        }
    }

    OfflineMangaMetadata doc;
    for (const auto& chapterRow : chapters) {
        std::optional<ChapterSummary> summary;
        if (auto it = catalogChapters.find(chapterRow.chapterId); it != catalogChapters.end()) {
            summary = it->second;
        }
        doc.chapters.push_back(buildChapterMetadata(row, chapterRow, summary));
    }
    std::stable_sort(doc.chapters.begin(), doc.chapters.end(),
                     [](const auto& a, const auto& b) { return a.downloadedAt < b.downloadedAt; });

    const auto mangaDir = paths_.mangaDir(row.extensionId, row.mangaSlug);
    doc.downloadedAt = existing ? existing->downloadedAt
                                : (row.downloadedAt > 0 ? row.downloadedAt : nowMillis());
    doc.lastUpdatedAt = nowMillis();
    doc.mangaId = row.mangaId;
    doc.slug = row.mangaSlug;
    doc.extensionId = row.extensionId;

    // Catalog values win over whatever the previous document held.
    auto merged = [&](auto catalogMember, auto docMember) {
        using T = std::decay_t<decltype((*existing).*docMember)>;
        if (details && ((*details).*catalogMember)) {
            return T((*details).*catalogMember);
        }
        return existing ? T((*existing).*docMember) : T{};
    };

    if (details && !details->title.empty()) {
        doc.title = details->title;
    } else if (existing && !existing->title.empty()) {
        doc.title = existing->title;
    } else {
        doc.title = row.mangaId;
    }
    doc.description = merged(&CatalogManga::description, &OfflineMangaMetadata::description);
    doc.coverUrl = merged(&CatalogManga::coverUrl, &OfflineMangaMetadata::coverUrl);
    doc.coverPath = resolveCoverPath(mangaDir, existing);
    doc.authors = merged(&CatalogManga::authors, &OfflineMangaMetadata::authors);
    doc.artists = merged(&CatalogManga::artists, &OfflineMangaMetadata::artists);
    doc.genres = merged(&CatalogManga::genres, &OfflineMangaMetadata::genres);
    doc.tags = merged(&CatalogManga::tags, &OfflineMangaMetadata::tags);
    doc.rating = merged(&CatalogManga::rating, &OfflineMangaMetadata::rating);
    doc.year = merged(&CatalogManga::year, &OfflineMangaMetadata::year);
    doc.status = merged(&CatalogManga::status, &OfflineMangaMetadata::status);
    doc.demographic = merged(&CatalogManga::demographic, &OfflineMangaMetadata::demographic);
    doc.altTitles = merged(&CatalogManga::altTitles, &OfflineMangaMetadata::altTitles);

    if (auto w = fsutil::writeDocument(paths_.mangaMetadataFile(row.extensionId, row.mangaSlug),
                                       doc);
        !w) {
        spdlog::error("StorageManager: failed to write rebuilt metadata for {}: {}", row.mangaId,
                      w.error().message);
    }
    if (auto r =
            repository_->updateMangaSize(row.extensionId, row.mangaId, fsutil::dirSize(mangaDir));
        !r) {
        spdlog::warn("StorageManager: size update failed for {}: {}", row.mangaId,
                     r.error().message);
    }
    return doc;
}

OfflineChapterMetadata
StorageManager::buildChapterMetadata(const OfflineMangaRow& manga, const OfflineChapterRow& row,
                                     const std::optional<ChapterSummary>& details) const {
    const auto chapterDir = paths_.chapterDir(manga.extensionId, manga.mangaSlug, row.folderName);
    std::optional<OfflineChapterPages> pages;
    if (auto read = fsutil::readDocument<OfflineChapterPages>(
            paths_.chapterMetadataFile(manga.extensionId, manga.mangaSlug, row.folderName))) {
        pages = std::move(read).value();
    }

    OfflineChapterMetadata meta;
    meta.chapterId = row.chapterId;
    meta.number = details && details->number ? details->number : row.chapterNumber;
    meta.title = details && details->title ? details->title : row.chapterTitle;
    meta.slug = chapterSlug({meta.number.value_or(""), meta.title.value_or(""), row.chapterId});
    meta.displayTitle = formatChapterTitle(ChapterSummary{row.chapterId, meta.number, meta.title});
    if (details) {
        meta.volume = details->volume;
        meta.publishedAt = details->publishedAt;
        meta.languageCode = details->languageCode;
        meta.scanlators = details->scanlators;
    }
    meta.folderName = row.folderName;
    meta.totalPages = pages ? static_cast<int>(pages->pages.size()) : row.totalPages;
    meta.downloadedAt = pages && pages->downloadedAt > 0
                            ? pages->downloadedAt
                            : (row.downloadedAt > 0 ? row.downloadedAt : nowMillis());
    meta.sizeBytes = row.sizeBytes > 0 ? row.sizeBytes : fsutil::dirSize(chapterDir);
    return meta;
}

std::string
StorageManager::resolveCoverPath(const std::filesystem::path& mangaDir,
                                 const std::optional<OfflineMangaMetadata>& existing) const {
    if (existing && !existing->coverPath.empty() &&
        fsutil::fileExists(mangaDir / existing->coverPath)) {
        return existing->coverPath;
    }
    for (const char* candidate : {"cover.webp", "cover.png", "cover.jpeg", "cover.jpg"}) {
        if (fsutil::fileExists(mangaDir / candidate)) {
            return candidate;
        }
    }
    return existing && !existing->coverPath.empty() ? existing->coverPath : "cover.jpg";
}

std::optional<OfflineMangaMetadata>
StorageManager::rebuildMangaMetadata(const std::string& extensionId, const std::string& mangaId) {
    auto details = fetchCatalogDetails(extensionId, mangaId);
    std::lock_guard<std::mutex> lock(docMutex_);
    return ensureMangaMetadataLocked(extensionId, mangaId, true, details);
}

ValidationResult StorageManager::validateMangaChapterCount(const std::string& extensionId,
                                                           const std::string& mangaId) {
    std::lock_guard<std::mutex> lock(docMutex_);
    auto row = repository_->getManga(extensionId, mangaId);
    if (!row) {
        return {true, false};
    }
    auto doc = fsutil::readDocument<OfflineMangaMetadata>(
        paths_.mangaMetadataFile(extensionId, row->mangaSlug));
    const auto rows = repository_->listChapters(row->id);
    if (!doc || doc.value().chapters.size() == rows.size()) {
        return {true, false};
    }

    spdlog::info("StorageManager: chapter count mismatch for {} (metadata={}, db={}), rebuilding",
                 mangaId, doc.value().chapters.size(), rows.size());
    std::optional<OfflineMangaMetadata> existing = std::move(doc).value();
    buildMangaMetadataLocked(*row, rows, existing, std::nullopt);
    return {false, true};
}

void StorageManager::startBackgroundSync(BackgroundSyncOptions options) {
    std::lock_guard<std::mutex> lock(syncMutex_);
    if (syncRunning_.exchange(true)) {
        spdlog::debug("StorageManager: background sync already running");
        return;
    }
    if (syncThread_.joinable()) {
        syncThread_.join();
    }
    options.concurrency = std::max(1, options.concurrency);
    syncThread_ = std::jthread(
        [this, options](std::stop_token stop) { runSync(std::move(stop), options); });
}

void StorageManager::stopBackgroundSync() {
    std::lock_guard<std::mutex> lock(syncMutex_);
    if (syncThread_.joinable()) {
        syncThread_.request_stop();
        syncThread_.join();
    }
    syncRunning_ = false;
}

void StorageManager::runSync(std::stop_token stop, BackgroundSyncOptions options) {
    const auto now = nowMillis();
    std::vector<OfflineMangaRow> stale;
    const auto all = repository_->listManga();
    {
        std::lock_guard<std::mutex> lock(docMutex_);
        for (const auto& row : all) {
            auto doc = fsutil::readDocument<OfflineMangaMetadata>(
                paths_.mangaMetadataFile(row.extensionId, row.mangaSlug));
            const auto lastUpdated = doc ? doc.value().lastUpdatedAt : row.lastUpdatedAt;
            if (now - lastUpdated > options.ttl.count()) {
                stale.push_back(row);
            }
        }
    }
    spdlog::info("StorageManager: background sync found {}/{} manga with stale metadata",
                 stale.size(), all.size());

    std::mutex waitMutex;
    std::condition_variable_any waitCv;
    for (std::size_t i = 0; i < stale.size() && !stop.stop_requested();
         i += static_cast<std::size_t>(options.concurrency)) {
        const auto end = std::min(stale.size(), i + static_cast<std::size_t>(options.concurrency));
        {
            std::vector<std::jthread> batch;
            for (std::size_t j = i; j < end; ++j) {
                batch.emplace_back([this, &stale, j] { syncOne(stale[j]); });
            }
        }
        if (end < stale.size()) {
            std::unique_lock<std::mutex> lock(waitMutex);
            waitCv.wait_for(lock, stop, options.delay, [] { return false; });
        }
    }
    spdlog::info("StorageManager: background sync complete");
    syncRunning_ = false;
}

void StorageManager::syncOne(const OfflineMangaRow& row) {
    try {
        // The catalog round trip happens before docMutex_ is taken so queries
        // and chapter commits are not held up by the network.
        const auto details = fetchCatalogDetails(row.extensionId, row.mangaId);

        std::optional<OfflineMangaMetadata> before;
        std::optional<OfflineMangaMetadata> after;
        {
            std::lock_guard<std::mutex> lock(docMutex_);
            if (auto doc = fsutil::readDocument<OfflineMangaMetadata>(
                    paths_.mangaMetadataFile(row.extensionId, row.mangaSlug))) {
                before = std::move(doc).value();
            }
            after = ensureMangaMetadataLocked(row.extensionId, row.mangaId, true, details);
        }
        if (!before || !after || after->chapters.size() <= before->chapters.size()) {
            return;
        }
        const auto added = static_cast<int>(after->chapters.size() - before->chapters.size());
        spdlog::info("StorageManager: discovered {} new chapters for {}", added, row.mangaSlug);
        emit(NewChaptersAvailable{row.mangaId, added});
    } catch (const std::exception& e) {
        spdlog::error("StorageManager: failed to sync metadata for {}: {}", row.mangaSlug,
                      e.what());
    } catch (...) {
        spdlog::error("StorageManager: failed to sync metadata for {}: non-standard exception",
                      row.mangaSlug);
    }
}

Result<void> StorageManager::deleteChapter(const std::string& extensionId,
                                           const std::string& mangaId,
                                           const std::string& chapterId) {
    std::unique_lock<std::mutex> lock(docMutex_);
    auto manga = repository_->getManga(extensionId, mangaId);
    if (!manga) {
        return Error{ErrorCode::NotFound, "Manga not found in offline storage"};
    }
    auto chapter = repository_->getChapter(manga->id, chapterId);
    if (!chapter) {
        return Error{ErrorCode::NotFound, "Chapter not found in offline storage"};
    }

    if (auto r = fsutil::removeAll(
            paths_.chapterDir(extensionId, manga->mangaSlug, chapter->folderName));
        !r) {
        return r.error();
    }
    if (auto r = repository_->deleteChapter(manga->id, chapterId); !r) {
        return r.error();
    }

    const auto metadataFile = paths_.mangaMetadataFile(extensionId, manga->mangaSlug);
    if (auto doc = fsutil::readDocument<OfflineMangaMetadata>(metadataFile)) {
        auto& m = doc.value();
        std::erase_if(m.chapters, [&](const auto& c) { return c.chapterId == chapterId; });
        m.lastUpdatedAt = nowMillis();
        if (auto w = fsutil::writeDocument(metadataFile, m); !w) {
            return w.error();
        }
    }

    if (auto r = repository_->updateMangaSize(
            extensionId, mangaId, fsutil::dirSize(paths_.mangaDir(extensionId, manga->mangaSlug)));
        !r) {
        return r.error();
    }

    if (repository_->listChapters(manga->id).empty()) {
        if (auto r = deleteMangaLocked(extensionId, mangaId); !r) {
            return r.error();
        }
    }
    lock.unlock();

    emit(ChapterDeleted{mangaId, chapterId});
    return {};
}

Result<void> StorageManager::deleteManga(const std::string& extensionId,
                                         const std::string& mangaId) {
    std::lock_guard<std::mutex> lock(docMutex_);
    return deleteMangaLocked(extensionId, mangaId);
}

Result<void> StorageManager::deleteMangaLocked(const std::string& extensionId,
                                               const std::string& mangaId) {
    auto manga = repository_->getManga(extensionId, mangaId);
    if (!manga) {
        return Error{ErrorCode::NotFound, "Manga not found in offline storage"};
    }
    if (auto r = fsutil::removeAll(paths_.mangaDir(extensionId, manga->mangaSlug)); !r) {
        return r.error();
    }
    if (auto r = repository_->deleteManga(extensionId, mangaId); !r) {
        return r.error();
    }
    spdlog::info("StorageManager: deleted manga {}/{}", extensionId, manga->mangaSlug);
    emit(MangaDeleted{mangaId});
    return {};
}

Result<void> StorageManager::nuke() {
    stopBackgroundSync();
    std::lock_guard<std::mutex> lock(docMutex_);
    for (const auto& row : repository_->listManga()) {
        if (auto r = fsutil::removeAll(paths_.mangaDir(row.extensionId, row.mangaSlug)); !r) {
            return r.error();
        }
    }
    if (auto r = fsutil::removeAll(paths_.offlineDir()); !r) {
        return r.error();
    }
    if (auto r = repository_->clearAll(); !r) {
        return r.error();
    }
    spdlog::warn("StorageManager: offline data wiped");
    return fsutil::ensureDir(paths_.offlineDir());
}

// --- storage limits ----------------------------------------------------------

namespace {

constexpr double kBytesPerGb = 1024.0 * 1024.0 * 1024.0;

// Last access time of a path in epoch milliseconds; 0 when it cannot be read.
std::int64_t lastAccessMillis(const std::filesystem::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return 0;
    }
    return static_cast<std::int64_t>(st.st_atim.tv_sec) * 1000 + st.st_atim.tv_nsec / 1000000;
}

} // namespace

std::vector<StorageManager::CleanupCandidate> StorageManager::cleanupCandidatesLocked() const {
    std::vector<CleanupCandidate> candidates;
    for (const auto& row : repository_->listManga()) {
        auto doc = fsutil::readDocument<OfflineMangaMetadata>(
            paths_.mangaMetadataFile(row.extensionId, row.mangaSlug));
        if (!doc) {
            spdlog::warn("StorageManager: skipping {}/{} in usage scan: {}", row.extensionId,
                         row.mangaSlug, doc.error().message);
            continue;
        }
        CleanupCandidate candidate;
        candidate.row = row;
        candidate.title = doc.value().title;
        candidate.downloadedAt = doc.value().downloadedAt;
        for (const auto& chapter : doc.value().chapters) {
            candidate.totalBytes += chapter.sizeBytes;
        }
        candidate.lastAccessedAt =
            lastAccessMillis(paths_.mangaDir(row.extensionId, row.mangaSlug));
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

StorageUsage StorageManager::storageUsage() {
    std::lock_guard<std::mutex> lock(docMutex_);
    StorageUsage usage;
    for (const auto& candidate : cleanupCandidatesLocked()) {
        usage.totalBytes += candidate.totalBytes;
        ++usage.mangaCount;
    }
    return usage;
}

bool StorageManager::shouldCleanup(const CleanupSettings& settings) {
    if (!settings.autoCleanupEnabled || settings.maxStorageGb <= 0) {
        return false;
    }
    const auto usage = storageUsage();
    const double usedGb = static_cast<double>(usage.totalBytes) / kBytesPerGb;
    return usedGb / settings.maxStorageGb * 100.0 >= settings.thresholdPercent;
}

CleanupResult StorageManager::performCleanup(const CleanupSettings& settings,
                                             double targetFreeGb) {
    std::lock_guard<std::mutex> lock(docMutex_);
    CleanupResult result;
    auto candidates = cleanupCandidatesLocked();

    switch (settings.strategy) {
        case CleanupStrategy::Oldest:
            std::stable_sort(candidates.begin(), candidates.end(),
                             [](const auto& a, const auto& b) {
                                 return a.downloadedAt < b.downloadedAt;
                             });
            break;
        case CleanupStrategy::Largest:
            std::stable_sort(candidates.begin(), candidates.end(),
                             [](const auto& a, const auto& b) {
                                 return a.totalBytes > b.totalBytes;
                             });
            break;
        case CleanupStrategy::LeastAccessed:
            std::stable_sort(candidates.begin(), candidates.end(),
                             [](const auto& a, const auto& b) {
                                 return a.lastAccessedAt < b.lastAccessedAt;
                             });
            break;
    }

    std::uint64_t currentBytes = 0;
    for (const auto& candidate : candidates) {
        currentBytes += candidate.totalBytes;
    }
    const double targetBytes = (settings.maxStorageGb - targetFreeGb) * kBytesPerGb;
    const double needToFree = static_cast<double>(currentBytes) - targetBytes;
    if (needToFree <= 0) {
        spdlog::debug("StorageManager: cleanup not needed ({} bytes in use)", currentBytes);
        return result;
    }

    result.performed = true;
    spdlog::info("StorageManager: cleanup ({}) needs to free {:.2f} GB",
                 toString(settings.strategy), needToFree / kBytesPerGb);
    for (const auto& candidate : candidates) {
        if (static_cast<double>(result.freedBytes) >= needToFree) {
            break;
        }
        spdlog::info("StorageManager: cleanup removing '{}' ({:.2f} MB)", candidate.title,
                     static_cast<double>(candidate.totalBytes) / (1024.0 * 1024.0));
        if (auto r = deleteMangaLocked(candidate.row.extensionId, candidate.row.mangaId); !r) {
            auto message = fmt::format("Failed to delete {}/{}: {}", candidate.row.extensionId,
                                       candidate.row.mangaId, r.error().message);
            spdlog::error("StorageManager: {}", message);
            result.errors.push_back(std::move(message));
            continue;
        }
        result.freedBytes += candidate.totalBytes;
        ++result.itemsRemoved;
        result.removedMangaIds.push_back(candidate.row.mangaId);
    }
    result.success = result.errors.empty();
    spdlog::info("StorageManager: cleanup freed {:.2f} GB by removing {} manga",
                 static_cast<double>(result.freedBytes) / kBytesPerGb, result.itemsRemoved);
    return result;
}

} // namespace tankobon::offline
