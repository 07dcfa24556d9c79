/*
 * curl_page_fetcher.cpp
 *
 * Notes
 * - Single GET per call through the libcurl easy API; the whole body is kept
 *   in memory (page images are small).
 * - Honors a hard per-request timeout, follows redirects, sends a User-Agent.
 * - Cooperative cancellation: the write callback returns 0 when shouldCancel()
 *   fires, which makes curl abort with CURLE_WRITE_ERROR.
 */

#include <tankobon/downloader/page_fetcher.hpp>
#include <tankobon/version.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace tankobon::downloader {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

Error makeCurlError(CURLcode code, std::string_view url) {
    Error err;
    err.message = std::string(curl_easy_strerror(code)) + " (" + std::string(url) + ")";
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_PARTIAL_FILE:
        case CURLE_TOO_MANY_REDIRECTS:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_WRITE_ERROR:
            err.code = ErrorCode::IoError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

struct HeaderContext {
    std::string contentType;
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return total;

    auto* ctx = static_cast<HeaderContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    // Each redirect hop starts a new header block
    if (line.starts_with("HTTP/")) {
        ctx->contentType.clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    if (to_lower(trim(line.substr(0, colon))) == "content-type") {
        auto value = trim(line.substr(colon + 1));
        auto semi = value.find(';');
        ctx->contentType = to_lower(trim(std::string_view(value).substr(0, semi)));
    }
    return total;
}

struct WriteContext {
    std::vector<std::byte>* body{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    bool cancelRequested{false};
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 0;
    }

    const auto* first = reinterpret_cast<const std::byte*>(ptr);
    ctx->body->insert(ctx->body->end(), first, first + total);
    return total;
}

// Progress callback keeps cancellation responsive while waiting for the first byte
int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 1;
    }
    return 0;
}

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

class CurlPageFetcher final : public IPageFetcher {
public:
    explicit CurlPageFetcher(std::string userAgent) : userAgent_(std::move(userAgent)) {
        ensureCurlGlobalInit();
    }

    Result<FetchedResource> fetch(std::string_view url, std::chrono::milliseconds timeout,
                                  const ShouldCancel& shouldCancel) override {
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(),
                                                                 &curl_easy_cleanup);
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        const std::string urlStr(url);
        FetchedResource resource;
        HeaderContext hctx;
        WriteContext wctx;
        wctx.body = &resource.bytes;
        wctx.shouldCancel = &shouldCancel;

        CURL* h = curl.get();
        curl_easy_setopt(h, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_USERAGENT, userAgent_.c_str());
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(std::min<long long>(timeout.count(), 30000)));
        curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
        curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &wctx);
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);

        const CURLcode rc = curl_easy_perform(h);

        long status = 0;
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
        resource.httpStatus = status;
        resource.mimeType = hctx.contentType;

        if (wctx.cancelRequested) {
            return Error{ErrorCode::OperationCancelled, "Download cancelled"};
        }
        if (rc != CURLE_OK) {
            spdlog::debug("CurlPageFetcher: {} failed: {}", urlStr, curl_easy_strerror(rc));
            return makeCurlError(rc, urlStr);
        }
        if (status >= 400) {
            return httpStatusError(status);
        }

        spdlog::trace("CurlPageFetcher: {} -> {} ({} bytes, {})", urlStr, status,
                      resource.bytes.size(), resource.mimeType);
        return resource;
    }

private:
    std::string userAgent_;
};

} // namespace

std::string defaultUserAgent() {
    return std::string("tankobon/") + version::string_v;
}

Error httpStatusError(long status) {
    auto message = "HTTP " + std::to_string(status);
    if (status == 404) {
        return Error{ErrorCode::NotFound, std::move(message)};
    }
    if (status >= 400 && status < 500) {
        return Error{ErrorCode::HttpClientError, std::move(message)};
    }
    return Error{ErrorCode::HttpError, std::move(message)};
}

bool isClientError(const Error& error) {
    return error.code == ErrorCode::HttpClientError || error.code == ErrorCode::NotFound;
}

std::unique_ptr<IPageFetcher> makeCurlPageFetcher(std::string userAgent) {
    return std::make_unique<CurlPageFetcher>(std::move(userAgent));
}

} // namespace tankobon::downloader
