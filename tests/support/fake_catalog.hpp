#pragma once

#include <tankobon/offline/catalog.hpp>

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace tankobon::test_support {

// In-memory catalog keyed by manga id; the extension id is ignored.
class FakeCatalog final : public offline::ICatalogSource {
public:
    void addManga(offline::CatalogManga manga) {
        std::lock_guard<std::mutex> lock(mutex_);
        manga_[manga.id] = std::move(manga);
    }

    void addPages(const std::string& chapterId, offline::CatalogChapterPages pages) {
        std::lock_guard<std::mutex> lock(mutex_);
        pages_[chapterId] = std::move(pages);
    }

    void failManga(const std::string& mangaId, Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[mangaId] = std::move(error);
    }

    // Simulates a slow network lookup in fetchManga.
    void setMangaDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        mangaDelay_ = delay;
    }

    int mangaCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return mangaCalls_;
    }

    Result<offline::CatalogManga> fetchManga(const std::string&,
                                             const std::string& mangaId) override {
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++mangaCalls_;
            delay = mangaDelay_;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = failures_.find(mangaId); it != failures_.end()) {
            return it->second;
        }
        auto it = manga_.find(mangaId);
        if (it == manga_.end()) {
            return Error{ErrorCode::NotFound, "Manga " + mangaId + " not found in catalog"};
        }
        return it->second;
    }

    Result<offline::CatalogChapterPages> fetchChapterPages(const std::string&,
                                                           const std::string& mangaId,
                                                           const std::string& chapterId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pages_.find(chapterId);
        if (it == pages_.end()) {
            return Error{ErrorCode::NotFound, "Chapter " + chapterId + " not found in catalog"};
        }
        auto pages = it->second;
        pages.mangaId = mangaId;
        pages.chapterId = chapterId;
        return pages;
    }

    static offline::ChapterSummary chapter(const std::string& id, const std::string& number,
                                           std::optional<std::string> title = std::nullopt) {
        offline::ChapterSummary c;
        c.id = id;
        c.number = number;
        c.title = std::move(title);
        return c;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, offline::CatalogManga> manga_;
    std::map<std::string, offline::CatalogChapterPages> pages_;
    std::map<std::string, Error> failures_;
    int mangaCalls_{0};
    std::chrono::milliseconds mangaDelay_{0};
};

} // namespace tankobon::test_support
