#pragma once

#include <tankobon/offline/types.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tankobon::offline {

/**
 * @brief Configuration for the catalog metadata cache
 */
struct MetadataCacheConfig {
    std::size_t maxEntries = 100;                           ///< Per cache, not total
    std::chrono::milliseconds ttl{std::chrono::minutes(5)}; ///< Since insertion
};

using SteadyNow = std::function<std::chrono::steady_clock::time_point()>;

/**
 * @brief Insertion-ordered cache with lazy TTL expiry
 *
 * Expired entries are dropped when read. When the cache is full and a new key
 * arrives, the oldest inserted entry is evicted; reads do not refresh order.
 */
template <typename V> class TtlCache {
public:
    explicit TtlCache(MetadataCacheConfig config = {}, SteadyNow now = {})
        : config_(config), now_(now ? std::move(now) : SteadyNow{[] {
              return std::chrono::steady_clock::now();
          }}) {}

    std::optional<V> get(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        if (now_() - it->second->insertedAt > config_.ttl) {
            order_.erase(it->second);
            index_.erase(it);
            return std::nullopt;
        }
        return it->second->value;
    }

    void set(const std::string& key, V value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto existing = index_.find(key);
        if (existing != index_.end()) {
            // Overwrite keeps the original eviction slot.
            existing->second->value = std::move(value);
            existing->second->insertedAt = now_();
            return;
        }
        if (config_.maxEntries > 0 && index_.size() >= config_.maxEntries) {
            index_.erase(order_.front().key);
            order_.pop_front();
        }
        order_.push_back(Entry{key, std::move(value), now_()});
        index_.emplace(key, std::prev(order_.end()));
    }

    bool erase(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        order_.erase(it->second);
        index_.erase(it);
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        order_.clear();
        index_.clear();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

private:
    struct Entry {
        std::string key;
        V value;
        std::chrono::steady_clock::time_point insertedAt;
    };

    MetadataCacheConfig config_;
    SteadyNow now_;
    mutable std::mutex mutex_;
    std::list<Entry> order_;
    std::unordered_map<std::string, typename std::list<Entry>::iterator> index_;
};

/**
 * @brief Catalog lookups kept for one worker session
 *
 * Bulk downloads fetch the same manga details once per chapter; this keeps
 * those round trips off the network.
 */
class MetadataCache {
public:
    explicit MetadataCache(MetadataCacheConfig config = {}, SteadyNow now = {});

    std::optional<CatalogManga> getManga(const std::string& extensionId,
                                         const std::string& mangaId);
    void setManga(const std::string& extensionId, const std::string& mangaId,
                  CatalogManga manga);
    void invalidateManga(const std::string& extensionId, const std::string& mangaId);

    std::optional<CatalogChapterPages> getChapterPages(const std::string& extensionId,
                                                       const std::string& mangaId,
                                                       const std::string& chapterId);
    void setChapterPages(const std::string& extensionId, const std::string& mangaId,
                         const std::string& chapterId, CatalogChapterPages pages);

    void clear();

    struct Stats {
        std::size_t mangaEntries = 0;
        std::size_t chapterPagesEntries = 0;
    };
    Stats stats() const;

    static std::string mangaKey(const std::string& extensionId, const std::string& mangaId);
    static std::string chapterPagesKey(const std::string& extensionId, const std::string& mangaId,
                                       const std::string& chapterId);

private:
    TtlCache<CatalogManga> manga_;
    TtlCache<CatalogChapterPages> chapterPages_;
};

} // namespace tankobon::offline
