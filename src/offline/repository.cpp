#include <spdlog/spdlog.h>
#include <tankobon/offline/file_system.hpp>
#include <tankobon/offline/repository.hpp>

#include <algorithm>

namespace tankobon::offline {

namespace {

constexpr int kStoreVersion = 1;

template <typename Row>
void loadRows(const nlohmann::json& root, const char* key, std::map<std::int64_t, Row>& out) {
    if (!root.contains(key)) {
        return;
    }
    for (const auto& entry : root.at(key)) {
        auto row = entry.get<Row>();
        out[row.id] = std::move(row);
    }
}

template <typename Map> std::int64_t nextIdAfter(const Map& rows) {
    return rows.empty() ? 1 : rows.rbegin()->first + 1;
}

} // namespace

JsonOfflineRepository::JsonOfflineRepository(std::filesystem::path dbPath)
    : path_(std::move(dbPath)) {}

Result<std::unique_ptr<JsonOfflineRepository>>
JsonOfflineRepository::open(std::filesystem::path dbPath) {
    auto repo = std::make_unique<JsonOfflineRepository>(std::move(dbPath));
    if (auto r = repo->load(); !r) {
        return r.error();
    }
    return repo;
}

Result<void> JsonOfflineRepository::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path_.empty() || !fsutil::fileExists(path_)) {
        return {};
    }

    auto doc = fsutil::readJson(path_);
    if (!doc) {
        if (doc.error().code == ErrorCode::CorruptedData) {
            spdlog::warn("OfflineRepository: {} is unreadable ({}), starting with an empty store",
                         path_.string(), doc.error().message);
            return {};
        }
        return doc.error();
    }

    try {
        const auto& root = doc.value();
        loadRows(root, "manga", manga_);
        loadRows(root, "chapters", chapters_);
        loadRows(root, "queue", queue_);
        loadRows(root, "history", history_);
    } catch (const std::exception& e) {
        spdlog::warn("OfflineRepository: {} has unexpected content ({}), starting empty",
                     path_.string(), e.what());
        manga_.clear();
        chapters_.clear();
        queue_.clear();
        history_.clear();
    }

    nextMangaId_ = nextIdAfter(manga_);
    nextChapterId_ = nextIdAfter(chapters_);
    nextQueueId_ = nextIdAfter(queue_);
    nextHistoryId_ = nextIdAfter(history_);

    spdlog::debug("OfflineRepository: loaded {} manga, {} chapters, {} queued, {} history rows",
                  manga_.size(), chapters_.size(), queue_.size(), history_.size());
    return {};
}

Result<void> JsonOfflineRepository::persistLocked() const {
    if (path_.empty()) {
        return {};
    }
    nlohmann::json root;
    root["version"] = kStoreVersion;
    auto dump = [](const auto& rows) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& [id, row] : rows) {
            arr.push_back(row);
        }
        return arr;
    };
    root["manga"] = dump(manga_);
    root["chapters"] = dump(chapters_);
    root["queue"] = dump(queue_);
    root["history"] = dump(history_);
    return fsutil::writeJson(path_, root);
}

// --- manga -----------------------------------------------------------------

Result<std::int64_t> JsonOfflineRepository::upsertManga(const OfflineMangaRow& row) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, existing] : manga_) {
        if (existing.extensionId == row.extensionId && existing.mangaId == row.mangaId) {
            existing.lastUpdatedAt = row.lastUpdatedAt;
            existing.totalSizeBytes = row.totalSizeBytes;
            if (auto r = persistLocked(); !r) {
                return r.error();
            }
            return id;
        }
    }
    OfflineMangaRow stored = row;
    stored.id = nextMangaId_++;
    manga_[stored.id] = stored;
    if (auto r = persistLocked(); !r) {
        return r.error();
    }
    return stored.id;
}

std::optional<OfflineMangaRow> JsonOfflineRepository::getManga(const std::string& extensionId,
                                                               const std::string& mangaId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, row] : manga_) {
        if (row.extensionId == extensionId && row.mangaId == mangaId) {
            return row;
        }
    }
    return std::nullopt;
}

std::optional<OfflineMangaRow> JsonOfflineRepository::findManga(const std::string& mangaId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, row] : manga_) {
        if (row.mangaId == mangaId) {
            return row;
        }
    }
    return std::nullopt;
}

std::vector<OfflineMangaRow> JsonOfflineRepository::listManga() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OfflineMangaRow> rows;
    rows.reserve(manga_.size());
    for (const auto& [id, row] : manga_) {
        rows.push_back(row);
    }
    std::stable_sort(rows.begin(), rows.end(),
                     [](const auto& a, const auto& b) { return a.downloadedAt > b.downloadedAt; });
    return rows;
}

Result<void> JsonOfflineRepository::deleteManga(const std::string& extensionId,
                                                const std::string& mangaId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(manga_.begin(), manga_.end(), [&](const auto& entry) {
        return entry.second.extensionId == extensionId && entry.second.mangaId == mangaId;
    });
    if (it == manga_.end()) {
        return {};
    }
    const auto offlineId = it->first;
    manga_.erase(it);
    std::erase_if(chapters_,
                  [offlineId](const auto& entry) { return entry.second.offlineMangaId == offlineId; });
    return persistLocked();
}

Result<void> JsonOfflineRepository::updateMangaSize(const std::string& extensionId,
                                                    const std::string& mangaId,
                                                    std::uint64_t totalSizeBytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, row] : manga_) {
        if (row.extensionId == extensionId && row.mangaId == mangaId) {
            row.totalSizeBytes = totalSizeBytes;
            row.lastUpdatedAt = nowMillis();
            return persistLocked();
        }
    }
    return Error{ErrorCode::NotFound, "Manga not found in offline storage"};
}

// --- chapters ----------------------------------------------------------------

Result<std::int64_t> JsonOfflineRepository::upsertChapter(const OfflineChapterRow& row) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (manga_.find(row.offlineMangaId) == manga_.end()) {
        return Error{ErrorCode::NotFound, "Manga row missing for chapter " + row.chapterId};
    }
    for (auto& [id, existing] : chapters_) {
        if (existing.offlineMangaId == row.offlineMangaId && existing.chapterId == row.chapterId) {
            existing.totalPages = row.totalPages;
            existing.sizeBytes = row.sizeBytes;
            if (auto r = persistLocked(); !r) {
                return r.error();
            }
            return id;
        }
    }
    OfflineChapterRow stored = row;
    stored.id = nextChapterId_++;
    chapters_[stored.id] = stored;
    if (auto r = persistLocked(); !r) {
        return r.error();
    }
    return stored.id;
}

std::optional<OfflineChapterRow>
JsonOfflineRepository::getChapter(std::int64_t offlineMangaId, const std::string& chapterId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, row] : chapters_) {
        if (row.offlineMangaId == offlineMangaId && row.chapterId == chapterId) {
            return row;
        }
    }
    return std::nullopt;
}

std::vector<OfflineChapterRow> JsonOfflineRepository::listChapters(std::int64_t offlineMangaId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OfflineChapterRow> rows;
    for (const auto& [id, row] : chapters_) {
        if (row.offlineMangaId == offlineMangaId) {
            rows.push_back(row);
        }
    }
    return rows;
}

Result<void> JsonOfflineRepository::deleteChapter(std::int64_t offlineMangaId,
                                                  const std::string& chapterId) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto removed = std::erase_if(chapters_, [&](const auto& entry) {
        return entry.second.offlineMangaId == offlineMangaId && entry.second.chapterId == chapterId;
    });
    if (removed == 0) {
        return {};
    }
    return persistLocked();
}

// --- queue -----------------------------------------------------------------

Result<QueueId> JsonOfflineRepository::enqueue(const QueuedDownload& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, existing] : queue_) {
        if (existing.extensionId == item.extensionId && existing.mangaId == item.mangaId &&
            existing.chapterId == item.chapterId) {
            existing.status = item.status;
            existing.priority = item.priority;
            existing.queuedAt = item.queuedAt;
            if (auto r = persistLocked(); !r) {
                return r.error();
            }
            return id;
        }
    }
    QueuedDownload stored = item;
    stored.id = nextQueueId_++;
    queue_[stored.id] = stored;
    if (auto r = persistLocked(); !r) {
        return r.error();
    }
    return stored.id;
}

std::optional<QueuedDownload> JsonOfflineRepository::getQueueItem(QueueId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queue_.find(id);
    if (it == queue_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<QueuedDownload> JsonOfflineRepository::sortedQueueLocked(bool queuedOnly) const {
    std::vector<QueuedDownload> items;
    for (const auto& [id, item] : queue_) {
        const bool wanted = queuedOnly ? item.status == DownloadStatus::Queued
                                       : (item.status == DownloadStatus::Queued ||
                                          item.status == DownloadStatus::Downloading ||
                                          item.status == DownloadStatus::Paused);
        if (wanted) {
            items.push_back(item);
        }
    }
    std::stable_sort(items.begin(), items.end(), [](const auto& a, const auto& b) {
        if (a.priority != b.priority) {
            return a.priority > b.priority;
        }
        return a.queuedAt < b.queuedAt;
    });
    return items;
}

std::vector<QueuedDownload> JsonOfflineRepository::listActiveQueue() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sortedQueueLocked(false);
}

std::vector<QueuedDownload> JsonOfflineRepository::nextQueued(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto items = sortedQueueLocked(true);
    if (items.size() > limit) {
        items.resize(limit);
    }
    return items;
}

Result<void> JsonOfflineRepository::updateQueueStatus(QueueId id, DownloadStatus status,
                                                      std::optional<std::string> errorMessage) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queue_.find(id);
    if (it == queue_.end()) {
        return Error{ErrorCode::NotFound, "Queue item " + std::to_string(id) + " not found"};
    }
    auto& item = it->second;
    const auto now = nowMillis();
    item.status = status;
    if (status == DownloadStatus::Downloading && !item.startedAt) {
        item.startedAt = now;
    }
    if (isTerminal(status)) {
        item.completedAt = now;
    }
    item.errorMessage = std::move(errorMessage);
    return persistLocked();
}

Result<void> JsonOfflineRepository::resetQueueItem(QueueId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queue_.find(id);
    if (it == queue_.end()) {
        return Error{ErrorCode::NotFound, "Queue item " + std::to_string(id) + " not found"};
    }
    auto& item = it->second;
    item.status = DownloadStatus::Queued;
    item.errorMessage.reset();
    item.startedAt.reset();
    item.completedAt.reset();
    item.progressCurrent = 0;
    item.progressTotal = 0;
    return persistLocked();
}

Result<int> JsonOfflineRepository::moveStatusLocked(DownloadStatus from, DownloadStatus to) {
    int moved = 0;
    for (auto& [id, item] : queue_) {
        if (item.status == from) {
            item.status = to;
            ++moved;
        }
    }
    if (moved > 0) {
        if (auto r = persistLocked(); !r) {
            return r.error();
        }
    }
    return moved;
}

Result<int> JsonOfflineRepository::pauseQueued() {
    std::lock_guard<std::mutex> lock(mutex_);
    return moveStatusLocked(DownloadStatus::Queued, DownloadStatus::Paused);
}

Result<int> JsonOfflineRepository::resumePaused() {
    std::lock_guard<std::mutex> lock(mutex_);
    return moveStatusLocked(DownloadStatus::Paused, DownloadStatus::Queued);
}

Result<void> JsonOfflineRepository::updateQueueProgress(QueueId id, int current, int total) {
    return updateQueueProgressBatch({QueueProgressRow{id, current, total}});
}

Result<void> JsonOfflineRepository::updateQueueProgressBatch(
    const std::vector<QueueProgressRow>& rows) {
    if (rows.empty()) {
        return {};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    bool changed = false;
    for (const auto& row : rows) {
        auto it = queue_.find(row.queueId);
        if (it == queue_.end()) {
            // Cancelled or finished while the update was buffered.
            continue;
        }
        it->second.progressCurrent = row.progressCurrent;
        it->second.progressTotal = row.progressTotal;
        changed = true;
    }
    return changed ? persistLocked() : Result<void>{};
}

Result<void> JsonOfflineRepository::deleteQueueItem(QueueId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.erase(id) == 0) {
        return {};
    }
    return persistLocked();
}

// --- history ---------------------------------------------------------------

Result<void> JsonOfflineRepository::moveToHistory(QueueId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queue_.find(id);
    if (it == queue_.end()) {
        return Error{ErrorCode::NotFound, "Queue item " + std::to_string(id) + " not found"};
    }
    const auto& item = it->second;
    if (!item.completedAt) {
        return Error{ErrorCode::InvalidState,
                     "Queue item " + std::to_string(id) + " has not finished"};
    }

    DownloadHistoryItem h;
    h.id = nextHistoryId_++;
    h.extensionId = item.extensionId;
    h.mangaId = item.mangaId;
    h.mangaSlug = item.mangaSlug;
    h.mangaTitle = item.mangaTitle;
    h.chapterId = item.chapterId;
    h.chapterNumber = item.chapterNumber;
    h.chapterTitle = item.chapterTitle;
    h.status = item.status;
    h.queuedAt = item.queuedAt;
    h.startedAt = item.startedAt;
    h.completedAt = *item.completedAt;
    h.errorMessage = item.errorMessage;
    h.progressCurrent = item.progressCurrent;
    h.progressTotal = item.progressTotal;

    history_[h.id] = std::move(h);
    queue_.erase(it);
    return persistLocked();
}

std::vector<DownloadHistoryItem> JsonOfflineRepository::history(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DownloadHistoryItem> items;
    items.reserve(history_.size());
    for (const auto& [id, item] : history_) {
        items.push_back(item);
    }
    std::stable_sort(items.begin(), items.end(),
                     [](const auto& a, const auto& b) { return a.completedAt > b.completedAt; });
    if (limit > 0 && items.size() > limit) {
        items.resize(limit);
    }
    return items;
}

Result<void> JsonOfflineRepository::deleteHistoryItem(std::int64_t historyId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (history_.erase(historyId) == 0) {
        return {};
    }
    return persistLocked();
}

Result<void> JsonOfflineRepository::clearHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
    return persistLocked();
}

// --- totals ----------------------------------------------------------------

std::uint64_t JsonOfflineRepository::totalStorageBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t total = 0;
    for (const auto& [id, row] : manga_) {
        total += row.totalSizeBytes;
    }
    return total;
}

int JsonOfflineRepository::chapterCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(chapters_.size());
}

int JsonOfflineRepository::pageCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int pages = 0;
    for (const auto& [id, row] : chapters_) {
        pages += row.totalPages;
    }
    return pages;
}

std::map<std::string, std::uint64_t> JsonOfflineRepository::storageByExtension() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::uint64_t> totals;
    for (const auto& [id, row] : manga_) {
        totals[row.extensionId] += row.totalSizeBytes;
    }
    return totals;
}

Result<void> JsonOfflineRepository::clearAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    manga_.clear();
    chapters_.clear();
    queue_.clear();
    history_.clear();
    return persistLocked();
}

} // namespace tankobon::offline
