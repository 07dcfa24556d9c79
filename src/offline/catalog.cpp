#include <spdlog/spdlog.h>
#include <tankobon/offline/catalog.hpp>
#include <tankobon/offline/file_system.hpp>
#include <tankobon/offline/paths.hpp>

#include <cctype>
#include <cstdio>

namespace tankobon::offline {

namespace {

// RFC 3986 unreserved characters pass through, everything else is %XX.
std::string urlEncode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

Result<void> checkIds(std::initializer_list<const std::string*> ids) {
    for (const auto* id : ids) {
        if (!isPlainFilename(*id)) {
            return Error{ErrorCode::InvalidArgument, "Invalid identifier: '" + *id + "'"};
        }
    }
    return {};
}

template <typename T> Result<T> decode(const nlohmann::json& doc, const std::string& what) {
    try {
        return doc.get<T>();
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, what + ": " + e.what()};
    }
}

} // namespace

// --- FileCatalogSource -------------------------------------------------------

Result<CatalogManga> FileCatalogSource::fetchManga(const std::string& extensionId,
                                                   const std::string& mangaId) {
    if (auto ok = checkIds({&extensionId, &mangaId}); !ok) {
        return ok.error();
    }
    auto file = root_ / extensionId / (mangaId + ".json");
    auto manga = fsutil::readDocument<CatalogManga>(file);
    if (!manga && manga.error().code == ErrorCode::FileNotFound) {
        return Error{ErrorCode::NotFound, "Manga " + mangaId + " not found in catalog"};
    }
    if (manga && manga.value().id.empty()) {
        manga.value().id = mangaId;
    }
    return manga;
}

Result<CatalogChapterPages> FileCatalogSource::fetchChapterPages(const std::string& extensionId,
                                                                 const std::string& mangaId,
                                                                 const std::string& chapterId) {
    if (auto ok = checkIds({&extensionId, &mangaId, &chapterId}); !ok) {
        return ok.error();
    }
    auto file = root_ / extensionId / mangaId / (chapterId + ".json");
    auto pages = fsutil::readDocument<CatalogChapterPages>(file);
    if (!pages && pages.error().code == ErrorCode::FileNotFound) {
        return Error{ErrorCode::NotFound, "Chapter " + chapterId + " not found in catalog"};
    }
    if (pages) {
        pages.value().chapterId = chapterId;
        pages.value().mangaId = mangaId;
    }
    return pages;
}

// --- HttpCatalogSource -------------------------------------------------------

HttpCatalogSource::HttpCatalogSource(std::string baseUrl,
                                     std::shared_ptr<downloader::IPageFetcher> fetcher,
                                     std::chrono::milliseconds timeout)
    : baseUrl_(std::move(baseUrl)), fetcher_(std::move(fetcher)), timeout_(timeout) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') {
        baseUrl_.pop_back();
    }
}

std::string HttpCatalogSource::mangaUrl(const std::string& extensionId,
                                        const std::string& mangaId) const {
    return baseUrl_ + "/extensions/" + urlEncode(extensionId) + "/manga/" + urlEncode(mangaId);
}

std::string HttpCatalogSource::chapterPagesUrl(const std::string& extensionId,
                                               const std::string& mangaId,
                                               const std::string& chapterId) const {
    return mangaUrl(extensionId, mangaId) + "/chapters/" + urlEncode(chapterId) + "/pages";
}

Result<nlohmann::json> HttpCatalogSource::getJson(const std::string& url) {
    auto fetched = fetcher_->fetch(url, timeout_, {});
    if (!fetched) {
        if (fetched.error().code == ErrorCode::NotFound) {
            return Error{ErrorCode::NotFound, url + ": " + fetched.error().message};
        }
        return fetched.error();
    }
    const auto& bytes = fetched.value().bytes;
    std::string_view body(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded()) {
        return Error{ErrorCode::InvalidData, url + ": response is not JSON"};
    }
    return doc;
}

Result<CatalogManga> HttpCatalogSource::fetchManga(const std::string& extensionId,
                                                   const std::string& mangaId) {
    auto doc = getJson(mangaUrl(extensionId, mangaId));
    if (!doc) {
        return doc.error();
    }
    auto manga = decode<CatalogManga>(doc.value(), "manga " + mangaId);
    if (manga && manga.value().id.empty()) {
        manga.value().id = mangaId;
    }
    return manga;
}

Result<CatalogChapterPages> HttpCatalogSource::fetchChapterPages(const std::string& extensionId,
                                                                 const std::string& mangaId,
                                                                 const std::string& chapterId) {
    auto doc = getJson(chapterPagesUrl(extensionId, mangaId, chapterId));
    if (!doc) {
        return doc.error();
    }
    // Servers may answer with a bare page array.
    if (doc.value().is_array()) {
        nlohmann::json wrapped{{"pages", doc.value()}};
        doc = Result<nlohmann::json>(std::move(wrapped));
    }
    auto pages = decode<CatalogChapterPages>(doc.value(), "chapter " + chapterId);
    if (pages) {
        pages.value().chapterId = chapterId;
        pages.value().mangaId = mangaId;
    }
    return pages;
}

// --- CachedCatalog -----------------------------------------------------------

CachedCatalog::CachedCatalog(std::shared_ptr<ICatalogSource> inner,
                             std::shared_ptr<MetadataCache> cache,
                             std::shared_ptr<PerformanceMetricsTracker> metrics)
    : inner_(std::move(inner)), cache_(std::move(cache)), metrics_(std::move(metrics)) {}

Result<CatalogManga> CachedCatalog::fetchManga(const std::string& extensionId,
                                               const std::string& mangaId) {
    if (auto hit = cache_->getManga(extensionId, mangaId)) {
        if (metrics_)
            metrics_->cacheHit();
        return std::move(*hit);
    }
    return refreshManga(extensionId, mangaId);
}

Result<CatalogManga> CachedCatalog::refreshManga(const std::string& extensionId,
                                                 const std::string& mangaId) {
    if (metrics_)
        metrics_->networkRequest();
    auto manga = inner_->refreshManga(extensionId, mangaId);
    if (manga) {
        cache_->setManga(extensionId, mangaId, manga.value());
    } else {
        spdlog::debug("CachedCatalog: manga {}/{} lookup failed: {}", extensionId, mangaId,
                      manga.error().message);
    }
    return manga;
}

Result<CatalogChapterPages> CachedCatalog::fetchChapterPages(const std::string& extensionId,
                                                             const std::string& mangaId,
                                                             const std::string& chapterId) {
    if (auto hit = cache_->getChapterPages(extensionId, mangaId, chapterId)) {
        if (metrics_)
            metrics_->cacheHit();
        return std::move(*hit);
    }
    if (metrics_)
        metrics_->networkRequest();
    auto pages = inner_->fetchChapterPages(extensionId, mangaId, chapterId);
    if (pages) {
        cache_->setChapterPages(extensionId, mangaId, chapterId, pages.value());
    }
    return pages;
}

std::shared_ptr<ICatalogSource>
makeCatalogSource(const std::string& location, std::shared_ptr<downloader::IPageFetcher> fetcher) {
    if (location.starts_with("http://") || location.starts_with("https://")) {
        return std::make_shared<HttpCatalogSource>(location, std::move(fetcher));
    }
    return std::make_shared<FileCatalogSource>(location);
}

} // namespace tankobon::offline
