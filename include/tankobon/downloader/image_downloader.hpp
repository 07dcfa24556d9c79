#pragma once

#include <tankobon/core/types.h>
#include <tankobon/downloader/page_fetcher.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace tankobon::downloader {

enum class ImageFormat { Unknown, Jpeg, Png, Gif, WebP };

// Sniffs the leading magic bytes; WebP is recognised by its "WE" marker at offset 8.
ImageFormat detectImageFormat(std::span<const std::byte> bytes);

struct ImageDownloadOptions {
    int maxAttempts{3};
    std::chrono::milliseconds retryDelay{1000}; // first backoff, doubled per attempt
    std::chrono::milliseconds maxRetryDelay{15000};
    std::chrono::milliseconds timeout{30000};
};

struct DownloadedImage {
    std::vector<std::byte> bytes;
    std::string mimeType; // "image/jpeg" when the server did not say
    ImageFormat format{ImageFormat::Unknown};
};

/**
 * Retrying image fetch.
 *
 * Each attempt is bounded by options.timeout. Failed attempts back off
 * exponentially; 4xx responses and cancellation end the loop at once.
 * A body without a recognised image signature counts as a failed attempt.
 */
class ImageDownloader {
public:
    // Waits between attempts; returns early when shouldCancel fires.
    using Sleeper = std::function<void(std::chrono::milliseconds, const ShouldCancel&)>;

    explicit ImageDownloader(std::shared_ptr<IPageFetcher> fetcher,
                             ImageDownloadOptions options = {}, Sleeper sleeper = {});

    Result<DownloadedImage> download(const std::string& url,
                                     const ShouldCancel& shouldCancel = {}) const;

    const ImageDownloadOptions& options() const { return options_; }

private:
    Result<DownloadedImage> attempt(const std::string& url, const ShouldCancel& shouldCancel) const;

    std::shared_ptr<IPageFetcher> fetcher_;
    ImageDownloadOptions options_;
    Sleeper sleeper_;
};

} // namespace tankobon::downloader
