#include <tankobon/offline/metadata_cache.hpp>

namespace tankobon::offline {

MetadataCache::MetadataCache(MetadataCacheConfig config, SteadyNow now)
    : manga_(config, now), chapterPages_(config, now) {}

std::string MetadataCache::mangaKey(const std::string& extensionId, const std::string& mangaId) {
    return extensionId + ":" + mangaId;
}

std::string MetadataCache::chapterPagesKey(const std::string& extensionId,
                                           const std::string& mangaId,
                                           const std::string& chapterId) {
    return extensionId + ":" + mangaId + ":" + chapterId;
}

std::optional<CatalogManga> MetadataCache::getManga(const std::string& extensionId,
                                                    const std::string& mangaId) {
    return manga_.get(mangaKey(extensionId, mangaId));
}

void MetadataCache::setManga(const std::string& extensionId, const std::string& mangaId,
                             CatalogManga manga) {
    manga_.set(mangaKey(extensionId, mangaId), std::move(manga));
}

void MetadataCache::invalidateManga(const std::string& extensionId, const std::string& mangaId) {
    manga_.erase(mangaKey(extensionId, mangaId));
}

std::optional<CatalogChapterPages> MetadataCache::getChapterPages(const std::string& extensionId,
                                                                  const std::string& mangaId,
                                                                  const std::string& chapterId) {
    return chapterPages_.get(chapterPagesKey(extensionId, mangaId, chapterId));
}

void MetadataCache::setChapterPages(const std::string& extensionId, const std::string& mangaId,
                                    const std::string& chapterId, CatalogChapterPages pages) {
    chapterPages_.set(chapterPagesKey(extensionId, mangaId, chapterId), std::move(pages));
}

void MetadataCache::clear() {
    manga_.clear();
    chapterPages_.clear();
}

MetadataCache::Stats MetadataCache::stats() const {
    return Stats{manga_.size(), chapterPages_.size()};
}

} // namespace tankobon::offline
