#include <tankobon/downloader/image_downloader.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace tankobon::downloader {

namespace {

constexpr std::chrono::milliseconds kCancelPollInterval{50};

// Sleeps in short slices so a cancel request is noticed quickly.
void sliceSleep(std::chrono::milliseconds total, const ShouldCancel& shouldCancel) {
    auto deadline = std::chrono::steady_clock::now() + total;
    while (std::chrono::steady_clock::now() < deadline) {
        if (shouldCancel && shouldCancel()) {
            return;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::clamp(remaining, std::chrono::milliseconds(0),
                                               kCancelPollInterval));
    }
}

std::uint8_t at(std::span<const std::byte> bytes, std::size_t i) {
    return static_cast<std::uint8_t>(bytes[i]);
}

} // namespace

ImageFormat detectImageFormat(std::span<const std::byte> bytes) {
    if (bytes.size() >= 2) {
        if (at(bytes, 0) == 0xFF && at(bytes, 1) == 0xD8)
            return ImageFormat::Jpeg;
        if (at(bytes, 0) == 0x89 && at(bytes, 1) == 0x50)
            return ImageFormat::Png;
        if (at(bytes, 0) == 0x47 && at(bytes, 1) == 0x49)
            return ImageFormat::Gif;
    }
    if (bytes.size() >= 10 && at(bytes, 8) == 0x57 && at(bytes, 9) == 0x45) {
        return ImageFormat::WebP;
    }
    return ImageFormat::Unknown;
}

ImageDownloader::ImageDownloader(std::shared_ptr<IPageFetcher> fetcher,
                                 ImageDownloadOptions options, Sleeper sleeper)
    : fetcher_(std::move(fetcher)), options_(options), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = sliceSleep;
    }
    options_.maxAttempts = std::max(1, options_.maxAttempts);
}

Result<DownloadedImage> ImageDownloader::attempt(const std::string& url,
                                                 const ShouldCancel& shouldCancel) const {
    auto fetched = fetcher_->fetch(url, options_.timeout, shouldCancel);
    if (!fetched) {
        return fetched.error();
    }
    auto& resource = fetched.value();
    if (resource.bytes.empty()) {
        return Error{ErrorCode::InvalidData, "Empty response body"};
    }
    const auto format = detectImageFormat(resource.bytes);
    if (format == ImageFormat::Unknown) {
        return Error{ErrorCode::InvalidData, "Response is not a recognised image"};
    }

    DownloadedImage image;
    image.bytes = std::move(resource.bytes);
    image.mimeType = resource.mimeType.empty() ? "image/jpeg" : resource.mimeType;
    image.format = format;
    return image;
}

Result<DownloadedImage> ImageDownloader::download(const std::string& url,
                                                  const ShouldCancel& shouldCancel) const {
    if (!fetcher_) {
        return Error{ErrorCode::NotInitialized, "ImageDownloader has no fetcher"};
    }

    auto backoff = options_.retryDelay;
    Error last{ErrorCode::Unknown, "no attempt made"};
    for (int attempt = 1; attempt <= options_.maxAttempts; ++attempt) {
        if (shouldCancel && shouldCancel()) {
            return Error{ErrorCode::OperationCancelled, "Download cancelled"};
        }

        auto r = this->attempt(url, shouldCancel);
        if (r) {
            return r;
        }
        last = r.error();

        if (last.code == ErrorCode::OperationCancelled) {
            return last;
        }
        if (isClientError(last)) {
            spdlog::debug("ImageDownloader: {} refused ({}), not retrying", url, last.message);
            return last;
        }
        if (attempt == options_.maxAttempts) {
            break;
        }

        spdlog::debug("ImageDownloader: retrying {} after {} ms (attempt {}/{}): {}", url,
                      backoff.count(), attempt, options_.maxAttempts, last.message);
        sleeper_(backoff, shouldCancel);
        backoff = std::min(backoff * 2, options_.maxRetryDelay);
    }

    spdlog::warn("ImageDownloader: giving up on {} after {} attempts: {}", url,
                 options_.maxAttempts, last.message);
    return last;
}

} // namespace tankobon::downloader
