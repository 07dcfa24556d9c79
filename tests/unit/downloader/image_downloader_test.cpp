#include <gtest/gtest.h>
#include <tankobon/downloader/image_downloader.hpp>

#include "../../support/fake_page_fetcher.hpp"
#include "../../support/temp_dir_scope.hpp"

#include <vector>

using namespace tankobon;
using namespace tankobon::downloader;
using tankobon::test_support::FakePageFetcher;

namespace {

std::vector<std::byte> bytesOf(const std::string& s) {
    return FakePageFetcher::makeResource(s, "").bytes;
}

class ImageDownloaderTest : public ::testing::Test {
protected:
    ImageDownloader makeDownloader(int attempts = 3) {
        ImageDownloadOptions options;
        options.maxAttempts = attempts;
        options.retryDelay = std::chrono::milliseconds(100);
        return ImageDownloader(fetcher_, options,
                               [this](std::chrono::milliseconds d, const ShouldCancel&) {
                                   sleeps_.push_back(d);
                               });
    }

    std::shared_ptr<FakePageFetcher> fetcher_ = std::make_shared<FakePageFetcher>();
    std::vector<std::chrono::milliseconds> sleeps_;
};

const std::string kUrl = "https://cdn.example/p/1.jpg";

} // namespace

TEST(ImageFormatTest, RecognisesMagicBytes) {
    EXPECT_EQ(detectImageFormat(bytesOf(test_support::jpegBytes())), ImageFormat::Jpeg);
    EXPECT_EQ(detectImageFormat(bytesOf(test_support::pngBytes())), ImageFormat::Png);
    EXPECT_EQ(detectImageFormat(bytesOf("GIF89a....")), ImageFormat::Gif);
    const std::string webp("RIFF\x10\x00\x00\x00WEBPVP8 ", 16);
    EXPECT_EQ(detectImageFormat(bytesOf(webp)), ImageFormat::WebP);
    EXPECT_EQ(detectImageFormat(bytesOf("<html>nope</html>")), ImageFormat::Unknown);
    EXPECT_EQ(detectImageFormat({}), ImageFormat::Unknown);
}

TEST_F(ImageDownloaderTest, ReturnsBodyAndMimeOnSuccess) {
    fetcher_->respond(kUrl, test_support::pngBytes(128), "image/png");
    auto r = makeDownloader().download(kUrl);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().bytes.size(), 128u);
    EXPECT_EQ(r.value().mimeType, "image/png");
    EXPECT_EQ(r.value().format, ImageFormat::Png);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(ImageDownloaderTest, MissingContentTypeDefaultsToJpeg) {
    fetcher_->respond(kUrl, test_support::jpegBytes(), "");
    auto r = makeDownloader().download(kUrl);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().mimeType, "image/jpeg");
}

TEST_F(ImageDownloaderTest, RetriesTransientFailuresWithExponentialBackoff) {
    fetcher_->failOnce(kUrl, Error{ErrorCode::NetworkError, "connection reset"});
    fetcher_->failOnce(kUrl, httpStatusError(503));
    fetcher_->respond(kUrl, test_support::jpegBytes());

    auto r = makeDownloader().download(kUrl);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(fetcher_->calls(kUrl), 3);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0].count(), 100);
    EXPECT_EQ(sleeps_[1].count(), 200);
}

TEST_F(ImageDownloaderTest, ClientErrorsAreNotRetried) {
    fetcher_->fail(kUrl, httpStatusError(404));
    auto r = makeDownloader().download(kUrl);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().message, "HTTP 404");
    EXPECT_EQ(fetcher_->calls(kUrl), 1);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(ImageDownloaderTest, GivesUpAfterMaxAttempts) {
    fetcher_->fail(kUrl, Error{ErrorCode::Timeout, "timed out"});
    auto r = makeDownloader(3).download(kUrl);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
    EXPECT_EQ(fetcher_->calls(kUrl), 3);
    EXPECT_EQ(sleeps_.size(), 2u);
}

TEST_F(ImageDownloaderTest, NonImageBodyCountsAsFailedAttempt) {
    fetcher_->respondOnce(kUrl, FakePageFetcher::makeResource("<html>", "text/html"));
    fetcher_->respond(kUrl, test_support::jpegBytes());
    auto r = makeDownloader().download(kUrl);
    ASSERT_TRUE(r);
    EXPECT_EQ(fetcher_->calls(kUrl), 2);
}

TEST_F(ImageDownloaderTest, CancellationStopsBeforeFetching) {
    fetcher_->respond(kUrl, test_support::jpegBytes());
    auto r = makeDownloader().download(kUrl, [] { return true; });
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
    EXPECT_EQ(fetcher_->totalCalls(), 0);
}

TEST(PageFetcherTest, ClientErrorClassification) {
    EXPECT_TRUE(isClientError(httpStatusError(404)));
    EXPECT_TRUE(isClientError(httpStatusError(429)));
    EXPECT_FALSE(isClientError(httpStatusError(500)));
    EXPECT_FALSE(isClientError(httpStatusError(302)));
    // Classification follows the code, never the message text.
    EXPECT_FALSE(isClientError(Error{ErrorCode::HttpError, "HTTP 404"}));
    EXPECT_FALSE(isClientError(Error{ErrorCode::NetworkError, "HTTP 404"}));
}

TEST(PageFetcherTest, StatusErrorsKeepStatusInMessage) {
    auto missing = httpStatusError(404);
    EXPECT_EQ(missing.code, ErrorCode::NotFound);
    EXPECT_EQ(missing.message, "HTTP 404");

    auto forbidden = httpStatusError(403);
    EXPECT_EQ(forbidden.code, ErrorCode::HttpClientError);
    EXPECT_EQ(forbidden.message, "HTTP 403");

    auto unavailable = httpStatusError(503);
    EXPECT_EQ(unavailable.code, ErrorCode::HttpError);
    EXPECT_EQ(unavailable.message, "HTTP 503");
}
