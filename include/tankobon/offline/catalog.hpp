#pragma once

#include <tankobon/core/types.h>
#include <tankobon/downloader/page_fetcher.hpp>
#include <tankobon/offline/metadata_cache.hpp>
#include <tankobon/offline/performance_metrics.hpp>
#include <tankobon/offline/types.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace tankobon::offline {

/**
 * Where manga details and chapter page lists come from.
 */
class ICatalogSource {
public:
    virtual ~ICatalogSource() = default;

    virtual Result<CatalogManga> fetchManga(const std::string& extensionId,
                                            const std::string& mangaId) = 0;
    virtual Result<CatalogChapterPages> fetchChapterPages(const std::string& extensionId,
                                                          const std::string& mangaId,
                                                          const std::string& chapterId) = 0;

    // Skips any caching layer.
    virtual Result<CatalogManga> refreshManga(const std::string& extensionId,
                                              const std::string& mangaId) {
        return fetchManga(extensionId, mangaId);
    }
};

// Reads <root>/<extensionId>/<mangaId>.json and
// <root>/<extensionId>/<mangaId>/<chapterId>.json.
class FileCatalogSource final : public ICatalogSource {
public:
    explicit FileCatalogSource(std::filesystem::path root) : root_(std::move(root)) {}

    Result<CatalogManga> fetchManga(const std::string& extensionId,
                                    const std::string& mangaId) override;
    Result<CatalogChapterPages> fetchChapterPages(const std::string& extensionId,
                                                  const std::string& mangaId,
                                                  const std::string& chapterId) override;

private:
    std::filesystem::path root_;
};

// GET <base>/extensions/<ext>/manga/<id> and <base>/extensions/<ext>/manga/<id>/chapters/<ch>/pages.
class HttpCatalogSource final : public ICatalogSource {
public:
    HttpCatalogSource(std::string baseUrl, std::shared_ptr<downloader::IPageFetcher> fetcher,
                      std::chrono::milliseconds timeout = std::chrono::seconds(30));

    Result<CatalogManga> fetchManga(const std::string& extensionId,
                                    const std::string& mangaId) override;
    Result<CatalogChapterPages> fetchChapterPages(const std::string& extensionId,
                                                  const std::string& mangaId,
                                                  const std::string& chapterId) override;

    std::string mangaUrl(const std::string& extensionId, const std::string& mangaId) const;
    std::string chapterPagesUrl(const std::string& extensionId, const std::string& mangaId,
                                const std::string& chapterId) const;

private:
    Result<nlohmann::json> getJson(const std::string& url);

    std::string baseUrl_;
    std::shared_ptr<downloader::IPageFetcher> fetcher_;
    std::chrono::milliseconds timeout_;
};

/**
 * Serves repeated lookups from the metadata cache. Misses go to the inner
 * source and are counted as network requests; hits are counted as cache hits.
 */
class CachedCatalog final : public ICatalogSource {
public:
    CachedCatalog(std::shared_ptr<ICatalogSource> inner, std::shared_ptr<MetadataCache> cache,
                  std::shared_ptr<PerformanceMetricsTracker> metrics = {});

    Result<CatalogManga> fetchManga(const std::string& extensionId,
                                    const std::string& mangaId) override;
    Result<CatalogChapterPages> fetchChapterPages(const std::string& extensionId,
                                                  const std::string& mangaId,
                                                  const std::string& chapterId) override;

    // Bypasses and refreshes the cached manga entry.
    Result<CatalogManga> refreshManga(const std::string& extensionId,
                                      const std::string& mangaId) override;

private:
    std::shared_ptr<ICatalogSource> inner_;
    std::shared_ptr<MetadataCache> cache_;
    std::shared_ptr<PerformanceMetricsTracker> metrics_;
};

// "http://" / "https://" sources go over the fetcher, anything else is a directory.
std::shared_ptr<ICatalogSource>
makeCatalogSource(const std::string& location, std::shared_ptr<downloader::IPageFetcher> fetcher);

} // namespace tankobon::offline
