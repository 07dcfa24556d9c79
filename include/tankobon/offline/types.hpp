#pragma once

/*
 * Offline storage data model.
 *
 * Two families of types live here:
 *  - the versioned documents persisted beside downloaded files
 *    (manga metadata.json, chapter metadata.json),
 *  - the queue/history/storage records exchanged with the host over the
 *    worker protocol.
 *
 * All JSON readers use value-or-default lookups so documents written by a
 * newer schema (extra fields) still load.
 */

#include <nlohmann/json.hpp>
#include <tankobon/core/types.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tankobon::offline {

using QueueId = std::int64_t;

inline constexpr int kSchemaVersion = 1;

enum class DownloadStatus { Queued, Downloading, Completed, Failed, Paused };

const char* toString(DownloadStatus status);
std::optional<DownloadStatus> parseDownloadStatus(std::string_view text);

inline bool isTerminal(DownloadStatus status) {
    return status == DownloadStatus::Completed || status == DownloadStatus::Failed;
}

// ---------------------------------------------------------------------------
// Persisted documents
// ---------------------------------------------------------------------------

struct OfflinePageMetadata {
    int index{0};
    std::string originalUrl;
    std::string filename;
    std::optional<int> width;
    std::optional<int> height;
    std::uint64_t sizeBytes{0};
    std::string mimeType;
};

// chapters/<folder>/metadata.json
struct OfflineChapterPages {
    int version{kSchemaVersion};
    EpochMillis downloadedAt{0};
    std::string chapterId;
    std::string mangaId;
    std::string folderName;
    std::vector<OfflinePageMetadata> pages;
};

// Entry for one downloaded chapter inside the manga document.
struct OfflineChapterMetadata {
    std::string chapterId;
    std::string slug;
    std::optional<std::string> number;
    std::optional<std::string> title;
    std::string displayTitle;
    std::optional<std::string> volume;
    std::optional<std::string> publishedAt;
    std::optional<std::string> languageCode;
    std::optional<std::vector<std::string>> scanlators;
    std::string folderName;
    int totalPages{0};
    EpochMillis downloadedAt{0};
    std::uint64_t sizeBytes{0};
};

// <mangaSlug>/metadata.json
struct OfflineMangaMetadata {
    int version{kSchemaVersion};
    EpochMillis downloadedAt{0};
    EpochMillis lastUpdatedAt{0};
    std::string mangaId;
    std::string slug;
    std::string extensionId;
    std::string title;
    std::optional<std::string> description;
    std::optional<std::string> coverUrl;
    std::string coverPath{"cover.jpg"};
    std::optional<std::vector<std::string>> authors;
    std::optional<std::vector<std::string>> artists;
    std::optional<std::vector<std::string>> genres;
    std::optional<std::vector<std::string>> tags;
    std::optional<double> rating;
    std::optional<int> year;
    std::optional<std::string> status;
    std::optional<std::string> demographic;
    std::optional<std::vector<std::string>> altTitles;
    std::vector<OfflineChapterMetadata> chapters;
};

// ---------------------------------------------------------------------------
// Repository rows
// ---------------------------------------------------------------------------

struct OfflineMangaRow {
    std::int64_t id{0};
    std::string extensionId;
    std::string mangaId;
    std::string mangaSlug;
    std::string downloadPath;
    EpochMillis downloadedAt{0};
    EpochMillis lastUpdatedAt{0};
    std::uint64_t totalSizeBytes{0};
};

struct OfflineChapterRow {
    std::int64_t id{0};
    std::int64_t offlineMangaId{0};
    std::string chapterId;
    std::optional<std::string> chapterNumber;
    std::optional<std::string> chapterTitle;
    std::string folderName;
    int totalPages{0};
    EpochMillis downloadedAt{0};
    std::uint64_t sizeBytes{0};
};

struct QueuedDownload {
    QueueId id{0};
    std::string extensionId;
    std::string mangaId;
    std::string mangaSlug;
    std::optional<std::string> mangaTitle;
    // Empty means "whole manga".
    std::optional<std::string> chapterId;
    std::optional<std::string> chapterNumber;
    std::optional<std::string> chapterTitle;
    DownloadStatus status{DownloadStatus::Queued};
    int priority{0};
    EpochMillis queuedAt{0};
    std::optional<EpochMillis> startedAt;
    std::optional<EpochMillis> completedAt;
    std::optional<std::string> errorMessage;
    int progressCurrent{0};
    int progressTotal{0};
};

struct DownloadHistoryItem {
    std::int64_t id{0};
    std::string extensionId;
    std::string mangaId;
    std::string mangaSlug;
    std::optional<std::string> mangaTitle;
    std::optional<std::string> chapterId;
    std::optional<std::string> chapterNumber;
    std::optional<std::string> chapterTitle;
    DownloadStatus status{DownloadStatus::Completed};
    EpochMillis queuedAt{0};
    std::optional<EpochMillis> startedAt;
    EpochMillis completedAt{0};
    std::optional<std::string> errorMessage;
    int progressCurrent{0};
    int progressTotal{0};
};

// ---------------------------------------------------------------------------
// Query results
// ---------------------------------------------------------------------------

struct DownloadProgress {
    QueueId queueId{0};
    std::string mangaTitle;
    std::optional<std::string> chapterTitle;
    DownloadStatus status{DownloadStatus::Queued};
    int progressCurrent{0};
    int progressTotal{0};
    int progressPercent{0};
    std::uint64_t downloadedBytes{0};
    std::uint64_t totalBytes{0};
    std::optional<std::string> errorMessage;
};

struct MangaStorageInfo {
    std::string mangaId;
    std::string mangaSlug;
    std::string title;
    std::string coverPath;
    std::string extensionId;
    int chapterCount{0};
    std::uint64_t totalBytes{0};
    EpochMillis downloadedAt{0};
};

struct StorageStats {
    std::uint64_t totalBytes{0};
    int mangaCount{0};
    int chapterCount{0};
    int pageCount{0};
    std::map<std::string, std::uint64_t> byExtension;
    std::vector<MangaStorageInfo> byManga;
};

struct ValidationResult {
    bool valid{true};
    bool rebuilt{false};
};

// ---------------------------------------------------------------------------
// Storage limits
// ---------------------------------------------------------------------------

// Order in which manga are removed when storage runs over its limit.
enum class CleanupStrategy { Oldest, Largest, LeastAccessed };

const char* toString(CleanupStrategy strategy);
std::optional<CleanupStrategy> parseCleanupStrategy(std::string_view text);

struct CleanupSettings {
    double maxStorageGb{10.0};
    bool autoCleanupEnabled{false};
    CleanupStrategy strategy{CleanupStrategy::Oldest};
    double thresholdPercent{90.0};
};

// Sizes come from the chapter entries recorded in each manga document.
struct StorageUsage {
    std::uint64_t totalBytes{0};
    int mangaCount{0};
};

struct CleanupResult {
    bool success{true};
    bool performed{false}; // false when nothing had to be freed
    std::uint64_t freedBytes{0};
    int itemsRemoved{0};
    std::vector<std::string> removedMangaIds;
    std::vector<std::string> errors;
};

// ---------------------------------------------------------------------------
// Catalog model (what a catalog source returns)
// ---------------------------------------------------------------------------

struct ChapterSummary {
    std::string id;
    std::optional<std::string> number;
    std::optional<std::string> title;
    std::optional<std::string> volume;
    std::optional<std::string> publishedAt;
    std::optional<std::string> languageCode;
    std::optional<std::vector<std::string>> scanlators;
};

struct CatalogManga {
    std::string id;
    std::string title;
    std::optional<std::string> slug;
    std::optional<std::string> description;
    std::optional<std::string> coverUrl;
    std::optional<std::vector<std::string>> authors;
    std::optional<std::vector<std::string>> artists;
    std::optional<std::vector<std::string>> genres;
    std::optional<std::vector<std::string>> tags;
    std::optional<double> rating;
    std::optional<int> year;
    std::optional<std::string> status;
    std::optional<std::string> demographic;
    std::optional<std::vector<std::string>> altTitles;
    std::vector<ChapterSummary> chapters;
};

struct CatalogPage {
    int index{0};
    std::string url;
    std::optional<int> width;
    std::optional<int> height;
};

struct CatalogChapterPages {
    std::string chapterId;
    std::string mangaId;
    std::vector<CatalogPage> pages;
};

// "Chapter N - Title", "Title", "Chapter N" or "Chapter <id>".
std::string formatChapterTitle(const ChapterSummary& chapter);

// JSON mapping
void to_json(nlohmann::json& j, DownloadStatus status);
void from_json(const nlohmann::json& j, DownloadStatus& status);

void to_json(nlohmann::json& j, const OfflinePageMetadata& v);
void from_json(const nlohmann::json& j, OfflinePageMetadata& v);
void to_json(nlohmann::json& j, const OfflineChapterPages& v);
void from_json(const nlohmann::json& j, OfflineChapterPages& v);
void to_json(nlohmann::json& j, const OfflineChapterMetadata& v);
void from_json(const nlohmann::json& j, OfflineChapterMetadata& v);
void to_json(nlohmann::json& j, const OfflineMangaMetadata& v);
void from_json(const nlohmann::json& j, OfflineMangaMetadata& v);

void to_json(nlohmann::json& j, const OfflineMangaRow& v);
void from_json(const nlohmann::json& j, OfflineMangaRow& v);
void to_json(nlohmann::json& j, const OfflineChapterRow& v);
void from_json(const nlohmann::json& j, OfflineChapterRow& v);
void to_json(nlohmann::json& j, const QueuedDownload& v);
void from_json(const nlohmann::json& j, QueuedDownload& v);
void to_json(nlohmann::json& j, const DownloadHistoryItem& v);
void from_json(const nlohmann::json& j, DownloadHistoryItem& v);

void to_json(nlohmann::json& j, const DownloadProgress& v);
void from_json(const nlohmann::json& j, DownloadProgress& v);
void to_json(nlohmann::json& j, const MangaStorageInfo& v);
void from_json(const nlohmann::json& j, MangaStorageInfo& v);
void to_json(nlohmann::json& j, const StorageStats& v);
void from_json(const nlohmann::json& j, StorageStats& v);

void to_json(nlohmann::json& j, CleanupStrategy strategy);
void from_json(const nlohmann::json& j, CleanupStrategy& strategy);
void to_json(nlohmann::json& j, const CleanupSettings& v);
void from_json(const nlohmann::json& j, CleanupSettings& v);
void to_json(nlohmann::json& j, const StorageUsage& v);
void from_json(const nlohmann::json& j, StorageUsage& v);
void to_json(nlohmann::json& j, const CleanupResult& v);
void from_json(const nlohmann::json& j, CleanupResult& v);

void to_json(nlohmann::json& j, const ChapterSummary& v);
void from_json(const nlohmann::json& j, ChapterSummary& v);
void to_json(nlohmann::json& j, const CatalogManga& v);
void from_json(const nlohmann::json& j, CatalogManga& v);
void to_json(nlohmann::json& j, const CatalogPage& v);
void from_json(const nlohmann::json& j, CatalogPage& v);
void to_json(nlohmann::json& j, const CatalogChapterPages& v);
void from_json(const nlohmann::json& j, CatalogChapterPages& v);

} // namespace tankobon::offline
