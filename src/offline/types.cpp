#include <tankobon/offline/types.hpp>

#include <stdexcept>

namespace tankobon::offline {

using nlohmann::json;

namespace {

template <typename T> void putOpt(json& j, const char* key, const std::optional<T>& v) {
    if (v) {
        j[key] = *v;
    }
}

template <typename T> void getOpt(const json& j, const char* key, std::optional<T>& out) {
    out.reset();
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

// Catalog feeds are loose about chapter numbers ("1.5" vs 1.5); keep them as text.
void getOptText(const json& j, const char* key, std::optional<std::string>& out) {
    out.reset();
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    if (it->is_string()) {
        out = it->get<std::string>();
    } else if (it->is_number_integer()) {
        out = std::to_string(it->get<std::int64_t>());
    } else if (it->is_number()) {
        out = it->dump();
    }
}

std::string text(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

bool hasText(const std::optional<std::string>& v) {
    if (!v) {
        return false;
    }
    return v->find_first_not_of(" \t\r\n") != std::string::npos;
}

} // namespace

const char* toString(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::Queued:
            return "queued";
        case DownloadStatus::Downloading:
            return "downloading";
        case DownloadStatus::Completed:
            return "completed";
        case DownloadStatus::Failed:
            return "failed";
        case DownloadStatus::Paused:
            return "paused";
    }
    return "queued";
}

std::optional<DownloadStatus> parseDownloadStatus(std::string_view text) {
    if (text == "queued")
        return DownloadStatus::Queued;
    if (text == "downloading")
        return DownloadStatus::Downloading;
    if (text == "completed")
        return DownloadStatus::Completed;
    if (text == "failed")
        return DownloadStatus::Failed;
    if (text == "paused")
        return DownloadStatus::Paused;
    return std::nullopt;
}

const char* toString(CleanupStrategy strategy) {
    switch (strategy) {
        case CleanupStrategy::Oldest:
            return "oldest";
        case CleanupStrategy::Largest:
            return "largest";
        case CleanupStrategy::LeastAccessed:
            return "least-accessed";
    }
    return "oldest";
}

std::optional<CleanupStrategy> parseCleanupStrategy(std::string_view text) {
    if (text == "oldest")
        return CleanupStrategy::Oldest;
    if (text == "largest")
        return CleanupStrategy::Largest;
    if (text == "least-accessed")
        return CleanupStrategy::LeastAccessed;
    return std::nullopt;
}

std::string formatChapterTitle(const ChapterSummary& chapter) {
    if (hasText(chapter.title)) {
        if (hasText(chapter.number)) {
            return "Chapter " + *chapter.number + " - " + *chapter.title;
        }
        return *chapter.title;
    }
    if (hasText(chapter.number)) {
        return "Chapter " + *chapter.number;
    }
    return "Chapter " + chapter.id;
}

void to_json(json& j, DownloadStatus status) {
    j = toString(status);
}

void from_json(const json& j, DownloadStatus& status) {
    auto parsed = parseDownloadStatus(j.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument("unknown download status: " + j.get<std::string>());
    }
    status = *parsed;
}

// --- documents --------------------------------------------------------------

void to_json(json& j, const OfflinePageMetadata& v) {
    j = json{{"index", v.index},
             {"originalUrl", v.originalUrl},
             {"filename", v.filename},
             {"sizeBytes", v.sizeBytes},
             {"mimeType", v.mimeType}};
    putOpt(j, "width", v.width);
    putOpt(j, "height", v.height);
}

void from_json(const json& j, OfflinePageMetadata& v) {
    v.index = j.value("index", 0);
    v.originalUrl = j.value("originalUrl", "");
    v.filename = j.value("filename", "");
    getOpt(j, "width", v.width);
    getOpt(j, "height", v.height);
    v.sizeBytes = j.value("sizeBytes", std::uint64_t{0});
    v.mimeType = j.value("mimeType", "");
}

void to_json(json& j, const OfflineChapterPages& v) {
    j = json{{"version", v.version},       {"downloadedAt", v.downloadedAt},
             {"chapterId", v.chapterId},   {"mangaId", v.mangaId},
             {"folderName", v.folderName}, {"pages", v.pages}};
}

void from_json(const json& j, OfflineChapterPages& v) {
    v.version = j.value("version", kSchemaVersion);
    v.downloadedAt = j.value("downloadedAt", EpochMillis{0});
    v.chapterId = j.value("chapterId", "");
    v.mangaId = j.value("mangaId", "");
    v.folderName = j.value("folderName", "");
    v.pages = j.value("pages", std::vector<OfflinePageMetadata>{});
}

void to_json(json& j, const OfflineChapterMetadata& v) {
    j = json{{"chapterId", v.chapterId},       {"slug", v.slug},
             {"displayTitle", v.displayTitle}, {"folderName", v.folderName},
             {"totalPages", v.totalPages},     {"downloadedAt", v.downloadedAt},
             {"sizeBytes", v.sizeBytes}};
    putOpt(j, "number", v.number);
    putOpt(j, "title", v.title);
    putOpt(j, "volume", v.volume);
    putOpt(j, "publishedAt", v.publishedAt);
    putOpt(j, "languageCode", v.languageCode);
    putOpt(j, "scanlators", v.scanlators);
}

void from_json(const json& j, OfflineChapterMetadata& v) {
    v.chapterId = text(j, "chapterId");
    v.slug = j.value("slug", "");
    getOptText(j, "number", v.number);
    getOpt(j, "title", v.title);
    v.displayTitle = j.value("displayTitle", "");
    getOpt(j, "volume", v.volume);
    getOpt(j, "publishedAt", v.publishedAt);
    getOpt(j, "languageCode", v.languageCode);
    getOpt(j, "scanlators", v.scanlators);
    v.folderName = j.value("folderName", "");
    v.totalPages = j.value("totalPages", 0);
    v.downloadedAt = j.value("downloadedAt", EpochMillis{0});
    v.sizeBytes = j.value("sizeBytes", std::uint64_t{0});
}

void to_json(json& j, const OfflineMangaMetadata& v) {
    j = json{{"version", v.version},
             {"downloadedAt", v.downloadedAt},
             {"lastUpdatedAt", v.lastUpdatedAt},
             {"mangaId", v.mangaId},
             {"slug", v.slug},
             {"extensionId", v.extensionId},
             {"title", v.title},
             {"coverPath", v.coverPath},
             {"chapters", v.chapters}};
    putOpt(j, "description", v.description);
    putOpt(j, "coverUrl", v.coverUrl);
    putOpt(j, "authors", v.authors);
    putOpt(j, "artists", v.artists);
    putOpt(j, "genres", v.genres);
    putOpt(j, "tags", v.tags);
    putOpt(j, "rating", v.rating);
    putOpt(j, "year", v.year);
    putOpt(j, "status", v.status);
    putOpt(j, "demographic", v.demographic);
    putOpt(j, "altTitles", v.altTitles);
}

void from_json(const json& j, OfflineMangaMetadata& v) {
    v.version = j.value("version", kSchemaVersion);
    v.downloadedAt = j.value("downloadedAt", EpochMillis{0});
    v.lastUpdatedAt = j.value("lastUpdatedAt", EpochMillis{0});
    v.mangaId = text(j, "mangaId");
    v.slug = j.value("slug", "");
    v.extensionId = j.value("extensionId", "");
    v.title = j.value("title", "");
    getOpt(j, "description", v.description);
    getOpt(j, "coverUrl", v.coverUrl);
    v.coverPath = j.value("coverPath", "cover.jpg");
    getOpt(j, "authors", v.authors);
    getOpt(j, "artists", v.artists);
    getOpt(j, "genres", v.genres);
    getOpt(j, "tags", v.tags);
    getOpt(j, "rating", v.rating);
    getOpt(j, "year", v.year);
    getOpt(j, "status", v.status);
    getOpt(j, "demographic", v.demographic);
    getOpt(j, "altTitles", v.altTitles);
    v.chapters = j.value("chapters", std::vector<OfflineChapterMetadata>{});
}

// --- rows -----------------------------------------------------------------

void to_json(json& j, const OfflineMangaRow& v) {
    j = json{{"id", v.id},
             {"extensionId", v.extensionId},
             {"mangaId", v.mangaId},
             {"mangaSlug", v.mangaSlug},
             {"downloadPath", v.downloadPath},
             {"downloadedAt", v.downloadedAt},
             {"lastUpdatedAt", v.lastUpdatedAt},
             {"totalSizeBytes", v.totalSizeBytes}};
}

void from_json(const json& j, OfflineMangaRow& v) {
    v.id = j.value("id", std::int64_t{0});
    v.extensionId = j.value("extensionId", "");
    v.mangaId = j.value("mangaId", "");
    v.mangaSlug = j.value("mangaSlug", "");
    v.downloadPath = j.value("downloadPath", "");
    v.downloadedAt = j.value("downloadedAt", EpochMillis{0});
    v.lastUpdatedAt = j.value("lastUpdatedAt", EpochMillis{0});
    v.totalSizeBytes = j.value("totalSizeBytes", std::uint64_t{0});
}

void to_json(json& j, const OfflineChapterRow& v) {
    j = json{{"id", v.id},
             {"offlineMangaId", v.offlineMangaId},
             {"chapterId", v.chapterId},
             {"folderName", v.folderName},
             {"totalPages", v.totalPages},
             {"downloadedAt", v.downloadedAt},
             {"sizeBytes", v.sizeBytes}};
    putOpt(j, "chapterNumber", v.chapterNumber);
    putOpt(j, "chapterTitle", v.chapterTitle);
}

void from_json(const json& j, OfflineChapterRow& v) {
    v.id = j.value("id", std::int64_t{0});
    v.offlineMangaId = j.value("offlineMangaId", std::int64_t{0});
    v.chapterId = j.value("chapterId", "");
    getOptText(j, "chapterNumber", v.chapterNumber);
    getOpt(j, "chapterTitle", v.chapterTitle);
    v.folderName = j.value("folderName", "");
    v.totalPages = j.value("totalPages", 0);
    v.downloadedAt = j.value("downloadedAt", EpochMillis{0});
    v.sizeBytes = j.value("sizeBytes", std::uint64_t{0});
}

void to_json(json& j, const QueuedDownload& v) {
    j = json{{"id", v.id},
             {"extensionId", v.extensionId},
             {"mangaId", v.mangaId},
             {"mangaSlug", v.mangaSlug},
             {"status", v.status},
             {"priority", v.priority},
             {"queuedAt", v.queuedAt},
             {"progressCurrent", v.progressCurrent},
             {"progressTotal", v.progressTotal}};
    putOpt(j, "mangaTitle", v.mangaTitle);
    putOpt(j, "chapterId", v.chapterId);
    putOpt(j, "chapterNumber", v.chapterNumber);
    putOpt(j, "chapterTitle", v.chapterTitle);
    putOpt(j, "startedAt", v.startedAt);
    putOpt(j, "completedAt", v.completedAt);
    putOpt(j, "errorMessage", v.errorMessage);
}

void from_json(const json& j, QueuedDownload& v) {
    v.id = j.value("id", QueueId{0});
    v.extensionId = j.value("extensionId", "");
    v.mangaId = j.value("mangaId", "");
    v.mangaSlug = j.value("mangaSlug", "");
    getOpt(j, "mangaTitle", v.mangaTitle);
    getOpt(j, "chapterId", v.chapterId);
    getOptText(j, "chapterNumber", v.chapterNumber);
    getOpt(j, "chapterTitle", v.chapterTitle);
    v.status = j.value("status", DownloadStatus::Queued);
    v.priority = j.value("priority", 0);
    v.queuedAt = j.value("queuedAt", EpochMillis{0});
    getOpt(j, "startedAt", v.startedAt);
    getOpt(j, "completedAt", v.completedAt);
    getOpt(j, "errorMessage", v.errorMessage);
    v.progressCurrent = j.value("progressCurrent", 0);
    v.progressTotal = j.value("progressTotal", 0);
}

void to_json(json& j, const DownloadHistoryItem& v) {
    j = json{{"id", v.id},
             {"extensionId", v.extensionId},
             {"mangaId", v.mangaId},
             {"mangaSlug", v.mangaSlug},
             {"status", v.status},
             {"queuedAt", v.queuedAt},
             {"completedAt", v.completedAt},
             {"progressCurrent", v.progressCurrent},
             {"progressTotal", v.progressTotal}};
    putOpt(j, "mangaTitle", v.mangaTitle);
    putOpt(j, "chapterId", v.chapterId);
    putOpt(j, "chapterNumber", v.chapterNumber);
    putOpt(j, "chapterTitle", v.chapterTitle);
    putOpt(j, "startedAt", v.startedAt);
    putOpt(j, "errorMessage", v.errorMessage);
}

void from_json(const json& j, DownloadHistoryItem& v) {
    v.id = j.value("id", std::int64_t{0});
    v.extensionId = j.value("extensionId", "");
    v.mangaId = j.value("mangaId", "");
    v.mangaSlug = j.value("mangaSlug", "");
    getOpt(j, "mangaTitle", v.mangaTitle);
    getOpt(j, "chapterId", v.chapterId);
    getOptText(j, "chapterNumber", v.chapterNumber);
    getOpt(j, "chapterTitle", v.chapterTitle);
    v.status = j.value("status", DownloadStatus::Completed);
    v.queuedAt = j.value("queuedAt", EpochMillis{0});
    getOpt(j, "startedAt", v.startedAt);
    v.completedAt = j.value("completedAt", EpochMillis{0});
    getOpt(j, "errorMessage", v.errorMessage);
    v.progressCurrent = j.value("progressCurrent", 0);
    v.progressTotal = j.value("progressTotal", 0);
}

// --- query results ----------------------------------------------------------

void to_json(json& j, const DownloadProgress& v) {
    j = json{{"queueId", v.queueId},
             {"mangaTitle", v.mangaTitle},
             {"status", v.status},
             {"progressCurrent", v.progressCurrent},
             {"progressTotal", v.progressTotal},
             {"progressPercent", v.progressPercent},
             {"downloadedBytes", v.downloadedBytes},
             {"totalBytes", v.totalBytes}};
    putOpt(j, "chapterTitle", v.chapterTitle);
    putOpt(j, "errorMessage", v.errorMessage);
}

void from_json(const json& j, DownloadProgress& v) {
    v.queueId = j.value("queueId", QueueId{0});
    v.mangaTitle = j.value("mangaTitle", "");
    getOpt(j, "chapterTitle", v.chapterTitle);
    v.status = j.value("status", DownloadStatus::Queued);
    v.progressCurrent = j.value("progressCurrent", 0);
    v.progressTotal = j.value("progressTotal", 0);
    v.progressPercent = j.value("progressPercent", 0);
    v.downloadedBytes = j.value("downloadedBytes", std::uint64_t{0});
    v.totalBytes = j.value("totalBytes", std::uint64_t{0});
    getOpt(j, "errorMessage", v.errorMessage);
}

void to_json(json& j, const MangaStorageInfo& v) {
    j = json{{"mangaId", v.mangaId},         {"mangaSlug", v.mangaSlug},
             {"title", v.title},             {"coverPath", v.coverPath},
             {"extensionId", v.extensionId}, {"chapterCount", v.chapterCount},
             {"totalBytes", v.totalBytes},   {"downloadedAt", v.downloadedAt}};
}

void from_json(const json& j, MangaStorageInfo& v) {
    v.mangaId = j.value("mangaId", "");
    v.mangaSlug = j.value("mangaSlug", "");
    v.title = j.value("title", "");
    v.coverPath = j.value("coverPath", "");
    v.extensionId = j.value("extensionId", "");
    v.chapterCount = j.value("chapterCount", 0);
    v.totalBytes = j.value("totalBytes", std::uint64_t{0});
    v.downloadedAt = j.value("downloadedAt", EpochMillis{0});
}

void to_json(json& j, const StorageStats& v) {
    j = json{{"totalBytes", v.totalBytes},   {"mangaCount", v.mangaCount},
             {"chapterCount", v.chapterCount}, {"pageCount", v.pageCount},
             {"byExtension", v.byExtension}, {"byManga", v.byManga}};
}

void from_json(const json& j, StorageStats& v) {
    v.totalBytes = j.value("totalBytes", std::uint64_t{0});
    v.mangaCount = j.value("mangaCount", 0);
    v.chapterCount = j.value("chapterCount", 0);
    v.pageCount = j.value("pageCount", 0);
    v.byExtension = j.value("byExtension", std::map<std::string, std::uint64_t>{});
    v.byManga = j.value("byManga", std::vector<MangaStorageInfo>{});
}

// --- storage limits ---------------------------------------------------------

void to_json(json& j, CleanupStrategy strategy) {
    j = toString(strategy);
}

void from_json(const json& j, CleanupStrategy& strategy) {
    auto parsed = parseCleanupStrategy(j.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument("unknown cleanup strategy: " + j.get<std::string>());
    }
    strategy = *parsed;
}

void to_json(json& j, const CleanupSettings& v) {
    j = json{{"maxStorageGB", v.maxStorageGb},
             {"autoCleanupEnabled", v.autoCleanupEnabled},
             {"cleanupStrategy", v.strategy},
             {"cleanupThresholdPercent", v.thresholdPercent}};
}

void from_json(const json& j, CleanupSettings& v) {
    CleanupSettings defaults;
    v.maxStorageGb = j.value("maxStorageGB", defaults.maxStorageGb);
    v.autoCleanupEnabled = j.value("autoCleanupEnabled", defaults.autoCleanupEnabled);
    v.strategy = j.value("cleanupStrategy", defaults.strategy);
    v.thresholdPercent = j.value("cleanupThresholdPercent", defaults.thresholdPercent);
}

void to_json(json& j, const StorageUsage& v) {
    j = json{{"totalBytes", v.totalBytes}, {"mangaCount", v.mangaCount}};
}

void from_json(const json& j, StorageUsage& v) {
    v.totalBytes = j.value("totalBytes", std::uint64_t{0});
    v.mangaCount = j.value("mangaCount", 0);
}

void to_json(json& j, const CleanupResult& v) {
    j = json{{"success", v.success},
             {"performed", v.performed},
             {"freedBytes", v.freedBytes},
             {"itemsRemoved", v.itemsRemoved},
             {"removedMangaIds", v.removedMangaIds},
             {"errors", v.errors}};
}

void from_json(const json& j, CleanupResult& v) {
    v.success = j.value("success", true);
    v.performed = j.value("performed", false);
    v.freedBytes = j.value("freedBytes", std::uint64_t{0});
    v.itemsRemoved = j.value("itemsRemoved", 0);
    v.removedMangaIds = j.value("removedMangaIds", std::vector<std::string>{});
    v.errors = j.value("errors", std::vector<std::string>{});
}

// --- catalog ----------------------------------------------------------------

void to_json(json& j, const ChapterSummary& v) {
    j = json{{"id", v.id}};
    putOpt(j, "number", v.number);
    putOpt(j, "title", v.title);
    putOpt(j, "volume", v.volume);
    putOpt(j, "publishedAt", v.publishedAt);
    putOpt(j, "languageCode", v.languageCode);
    putOpt(j, "scanlators", v.scanlators);
}

void from_json(const json& j, ChapterSummary& v) {
    v.id = text(j, "id");
    getOptText(j, "number", v.number);
    getOpt(j, "title", v.title);
    getOptText(j, "volume", v.volume);
    getOpt(j, "publishedAt", v.publishedAt);
    getOpt(j, "languageCode", v.languageCode);
    getOpt(j, "scanlators", v.scanlators);
}

void to_json(json& j, const CatalogManga& v) {
    j = json{{"id", v.id}, {"title", v.title}, {"chapters", v.chapters}};
    putOpt(j, "slug", v.slug);
    putOpt(j, "description", v.description);
    putOpt(j, "coverUrl", v.coverUrl);
    putOpt(j, "authors", v.authors);
    putOpt(j, "artists", v.artists);
    putOpt(j, "genres", v.genres);
    putOpt(j, "tags", v.tags);
    putOpt(j, "rating", v.rating);
    putOpt(j, "year", v.year);
    putOpt(j, "status", v.status);
    putOpt(j, "demographic", v.demographic);
    putOpt(j, "altTitles", v.altTitles);
}

void from_json(const json& j, CatalogManga& v) {
    v.id = text(j, "id");
    v.title = j.value("title", "");
    getOpt(j, "slug", v.slug);
    getOpt(j, "description", v.description);
    getOpt(j, "coverUrl", v.coverUrl);
    getOpt(j, "authors", v.authors);
    getOpt(j, "artists", v.artists);
    getOpt(j, "genres", v.genres);
    getOpt(j, "tags", v.tags);
    getOpt(j, "rating", v.rating);
    getOpt(j, "year", v.year);
    getOpt(j, "status", v.status);
    getOpt(j, "demographic", v.demographic);
    getOpt(j, "altTitles", v.altTitles);
    v.chapters = j.value("chapters", std::vector<ChapterSummary>{});
}

void to_json(json& j, const CatalogPage& v) {
    j = json{{"index", v.index}, {"url", v.url}};
    putOpt(j, "width", v.width);
    putOpt(j, "height", v.height);
}

void from_json(const json& j, CatalogPage& v) {
    v.index = j.value("index", 0);
    v.url = j.value("url", "");
    getOpt(j, "width", v.width);
    getOpt(j, "height", v.height);
}

void to_json(json& j, const CatalogChapterPages& v) {
    j = json{{"chapterId", v.chapterId}, {"mangaId", v.mangaId}, {"pages", v.pages}};
}

void from_json(const json& j, CatalogChapterPages& v) {
    v.chapterId = text(j, "chapterId");
    v.mangaId = text(j, "mangaId");
    v.pages = j.value("pages", std::vector<CatalogPage>{});
}

} // namespace tankobon::offline
