#pragma once

#include <tankobon/core/types.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tankobon::downloader {

// Returns true when the transfer should be aborted
using ShouldCancel = std::function<bool()>;

struct FetchedResource {
    std::vector<std::byte> bytes;
    std::string mimeType; // Content-Type without parameters, may be empty
    long httpStatus{0};
};

/**
 * Network fetch primitive used for page images, covers and remote catalog
 * documents.
 *
 * Implementations report a response with status >= 400 through
 * httpStatusError(), so the message is always "HTTP <status>".
 */
class IPageFetcher {
public:
    virtual ~IPageFetcher() = default;

    virtual Result<FetchedResource> fetch(std::string_view url, std::chrono::milliseconds timeout,
                                          const ShouldCancel& shouldCancel) = 0;
};

std::string defaultUserAgent();

// 404 maps to NotFound, any other 4xx to HttpClientError and the rest to
// HttpError.
Error httpStatusError(long status);

// True for 4xx responses: the server refused the request and retrying will
// not help.
bool isClientError(const Error& error);

/// libcurl-backed fetcher; follows redirects and aborts on cancellation from
/// inside the write callback.
std::unique_ptr<IPageFetcher> makeCurlPageFetcher(std::string userAgent = defaultUserAgent());

} // namespace tankobon::downloader
