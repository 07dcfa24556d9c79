#pragma once

#include <tankobon/downloader/page_fetcher.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>

namespace tankobon::test_support {

// Scripted fetcher: per-URL queue of responses, then a sticky fallback.
class FakePageFetcher final : public downloader::IPageFetcher {
public:
    void respond(const std::string& url, std::string body, std::string mime = "image/jpeg") {
        std::lock_guard<std::mutex> lock(mutex_);
        sticky_[url] = makeResource(std::move(body), std::move(mime));
    }

    void respondOnce(const std::string& url, Result<downloader::FetchedResource> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripted_[url].push_back(std::move(response));
    }

    void failOnce(const std::string& url, Error error) {
        respondOnce(url, Result<downloader::FetchedResource>(std::move(error)));
    }

    void fail(const std::string& url, Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        stickyErrors_[url] = std::move(error);
        sticky_.erase(url);
    }

    int calls(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(url);
        return it == calls_.end() ? 0 : it->second;
    }

    int totalCalls() const { return total_.load(); }

    // Parks the next fetch of url until release() is called.
    void holdNext(const std::string& url) {
        std::lock_guard<std::mutex> lock(gateMutex_);
        gateUrl_ = url;
        held_ = false;
        released_ = false;
    }

    bool waitUntilHeld(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(gateMutex_);
        return gateCv_.wait_for(lock, timeout, [this] { return held_; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(gateMutex_);
        released_ = true;
        gateCv_.notify_all();
    }

    Result<downloader::FetchedResource> fetch(std::string_view url, std::chrono::milliseconds,
                                              const downloader::ShouldCancel& shouldCancel) override {
        total_.fetch_add(1);
        {
            std::unique_lock<std::mutex> gate(gateMutex_);
            if (!gateUrl_.empty() && gateUrl_ == url) {
                gateUrl_.clear();
                held_ = true;
                gateCv_.notify_all();
                gateCv_.wait(gate, [this] { return released_; });
            }
        }
        if (shouldCancel && shouldCancel()) {
            return Error{ErrorCode::OperationCancelled, "Download cancelled"};
        }
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string key(url);
        ++calls_[key];
        if (auto it = scripted_.find(key); it != scripted_.end() && !it->second.empty()) {
            auto next = std::move(it->second.front());
            it->second.pop_front();
            return next;
        }
        if (auto it = stickyErrors_.find(key); it != stickyErrors_.end()) {
            return it->second;
        }
        if (auto it = sticky_.find(key); it != sticky_.end()) {
            return it->second;
        }
        return downloader::httpStatusError(404);
    }

    static downloader::FetchedResource makeResource(std::string body, std::string mime) {
        downloader::FetchedResource r;
        r.bytes.resize(body.size());
        for (std::size_t i = 0; i < body.size(); ++i) {
            r.bytes[i] = static_cast<std::byte>(body[i]);
        }
        r.mimeType = std::move(mime);
        r.httpStatus = 200;
        return r;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<Result<downloader::FetchedResource>>> scripted_;
    std::map<std::string, downloader::FetchedResource> sticky_;
    std::map<std::string, Error> stickyErrors_;
    std::map<std::string, int> calls_;
    std::atomic<int> total_{0};

    std::mutex gateMutex_;
    std::condition_variable gateCv_;
    std::string gateUrl_;
    bool held_{false};
    bool released_{false};
};

} // namespace tankobon::test_support
