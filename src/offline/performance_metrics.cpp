#include <tankobon/offline/performance_metrics.hpp>

#include <algorithm>

namespace tankobon::offline {

PerformanceMetricsTracker::PerformanceMetricsTracker(Clock clock)
    : clock_(clock ? std::move(clock) : Clock{[] { return nowMillis(); }}) {
    std::lock_guard<std::mutex> lock(mutex_);
    resetLocked();
}

void PerformanceMetricsTracker::downloadStarted(QueueId queueId) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++totalDownloads_;
    activeStarts_[queueId] = clock_();
}

void PerformanceMetricsTracker::downloadCompleted(QueueId queueId, std::uint64_t pagesDownloaded) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++completedDownloads_;
    totalPages_ += pagesDownloaded;

    auto it = activeStarts_.find(queueId);
    if (it != activeStarts_.end()) {
        const auto elapsed = std::max<EpochMillis>(0, clock_() - it->second);
        ++timedDownloads_;
        timedDurationMs_ += static_cast<std::uint64_t>(elapsed);
        timedPages_ += pagesDownloaded;
        activeStarts_.erase(it);
    }
}

void PerformanceMetricsTracker::downloadFailed(QueueId queueId) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++failedDownloads_;
    activeStarts_.erase(queueId);
}

void PerformanceMetricsTracker::bytesDownloaded(std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    totalBytes_ += bytes;
}

void PerformanceMetricsTracker::eventEmitted() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    ++eventsEmitted_;
    lastEventTimestamp_ = now;
    eventTimes_.push_back(now);
    prune(eventTimes_, now);
}

void PerformanceMetricsTracker::databaseWrite() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    ++databaseWrites_;
    writeTimes_.push_back(now);
    prune(writeTimes_, now);
}

void PerformanceMetricsTracker::databaseBatchWrite(std::uint64_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    batchedWrites_ += count;
    writeTimes_.push_back(now);
    prune(writeTimes_, now);
}

void PerformanceMetricsTracker::networkRequest() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    ++networkRequests_;
    networkTimes_.push_back(now);
    prune(networkTimes_, now);
}

void PerformanceMetricsTracker::cacheHit() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++cachedRequests_;
}

PerformanceMetrics PerformanceMetricsTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();

    PerformanceMetrics m;
    m.totalDownloads = totalDownloads_;
    m.activeDownloads = activeStarts_.size();
    m.completedDownloads = completedDownloads_;
    m.failedDownloads = failedDownloads_;
    m.totalPagesDownloaded = totalPages_;
    m.totalBytesDownloaded = totalBytes_;

    m.eventsEmitted = eventsEmitted_;
    m.eventsPerSecond = rate(eventTimes_, now);
    m.lastEventTimestamp = lastEventTimestamp_;

    m.databaseWrites = databaseWrites_;
    m.databaseWritesPerSecond = rate(writeTimes_, now);
    m.batchedWrites = batchedWrites_;
    const auto totalWrites = databaseWrites_ + batchedWrites_;
    m.batchSavingsPercent =
        totalWrites > 0 ? static_cast<double>(batchedWrites_) / totalWrites * 100.0 : 0.0;

    m.networkRequests = networkRequests_;
    m.networkRequestsPerSecond = rate(networkTimes_, now);
    m.cachedRequests = cachedRequests_;
    const auto totalRequests = networkRequests_ + cachedRequests_;
    m.cacheHitRate =
        totalRequests > 0 ? static_cast<double>(cachedRequests_) / totalRequests * 100.0 : 0.0;

    m.averageDownloadTimeMs =
        timedDownloads_ > 0 ? static_cast<double>(timedDurationMs_) / timedDownloads_ : 0.0;
    m.averagePageDownloadTimeMs =
        timedPages_ > 0 ? static_cast<double>(timedDurationMs_) / timedPages_ : 0.0;

    m.startTime = startTime_;
    m.uptimeMs = std::max<EpochMillis>(0, now - startTime_);
    return m;
}

void PerformanceMetricsTracker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    resetLocked();
}

void PerformanceMetricsTracker::resetLocked() {
    startTime_ = clock_();
    totalDownloads_ = 0;
    completedDownloads_ = 0;
    failedDownloads_ = 0;
    totalPages_ = 0;
    totalBytes_ = 0;
    activeStarts_.clear();
    timedDownloads_ = 0;
    timedDurationMs_ = 0;
    timedPages_ = 0;
    eventsEmitted_ = 0;
    lastEventTimestamp_ = startTime_;
    eventTimes_.clear();
    databaseWrites_ = 0;
    batchedWrites_ = 0;
    writeTimes_.clear();
    networkRequests_ = 0;
    cachedRequests_ = 0;
    networkTimes_.clear();
}

void PerformanceMetricsTracker::prune(std::deque<EpochMillis>& window, EpochMillis now) const {
    const auto cutoff = now - kRetentionMs;
    while (!window.empty() && window.front() < cutoff) {
        window.pop_front();
    }
}

double PerformanceMetricsTracker::rate(const std::deque<EpochMillis>& window,
                                       EpochMillis now) const {
    const auto cutoff = now - kRateWindowMs;
    return static_cast<double>(
        std::count_if(window.begin(), window.end(), [cutoff](EpochMillis t) { return t >= cutoff; }));
}

void to_json(nlohmann::json& j, const PerformanceMetrics& m) {
    j = nlohmann::json{{"totalDownloads", m.totalDownloads},
                       {"activeDownloads", m.activeDownloads},
                       {"completedDownloads", m.completedDownloads},
                       {"failedDownloads", m.failedDownloads},
                       {"totalPagesDownloaded", m.totalPagesDownloaded},
                       {"totalBytesDownloaded", m.totalBytesDownloaded},
                       {"eventsEmitted", m.eventsEmitted},
                       {"eventsPerSecond", m.eventsPerSecond},
                       {"lastEventTimestamp", m.lastEventTimestamp},
                       {"databaseWrites", m.databaseWrites},
                       {"databaseWritesPerSecond", m.databaseWritesPerSecond},
                       {"batchedWrites", m.batchedWrites},
                       {"batchSavingsPercent", m.batchSavingsPercent},
                       {"networkRequests", m.networkRequests},
                       {"networkRequestsPerSecond", m.networkRequestsPerSecond},
                       {"cachedRequests", m.cachedRequests},
                       {"cacheHitRate", m.cacheHitRate},
                       {"averageDownloadTimeMs", m.averageDownloadTimeMs},
                       {"averagePageDownloadTimeMs", m.averagePageDownloadTimeMs},
                       {"uptimeMs", m.uptimeMs},
                       {"startTime", m.startTime}};
}

void from_json(const nlohmann::json& j, PerformanceMetrics& m) {
    m.totalDownloads = j.value("totalDownloads", std::uint64_t{0});
    m.activeDownloads = j.value("activeDownloads", std::uint64_t{0});
    m.completedDownloads = j.value("completedDownloads", std::uint64_t{0});
    m.failedDownloads = j.value("failedDownloads", std::uint64_t{0});
    m.totalPagesDownloaded = j.value("totalPagesDownloaded", std::uint64_t{0});
    m.totalBytesDownloaded = j.value("totalBytesDownloaded", std::uint64_t{0});
    m.eventsEmitted = j.value("eventsEmitted", std::uint64_t{0});
    m.eventsPerSecond = j.value("eventsPerSecond", 0.0);
    m.lastEventTimestamp = j.value("lastEventTimestamp", EpochMillis{0});
    m.databaseWrites = j.value("databaseWrites", std::uint64_t{0});
    m.databaseWritesPerSecond = j.value("databaseWritesPerSecond", 0.0);
    m.batchedWrites = j.value("batchedWrites", std::uint64_t{0});
    m.batchSavingsPercent = j.value("batchSavingsPercent", 0.0);
    m.networkRequests = j.value("networkRequests", std::uint64_t{0});
    m.networkRequestsPerSecond = j.value("networkRequestsPerSecond", 0.0);
    m.cachedRequests = j.value("cachedRequests", std::uint64_t{0});
    m.cacheHitRate = j.value("cacheHitRate", 0.0);
    m.averageDownloadTimeMs = j.value("averageDownloadTimeMs", 0.0);
    m.averagePageDownloadTimeMs = j.value("averagePageDownloadTimeMs", 0.0);
    m.uptimeMs = j.value("uptimeMs", EpochMillis{0});
    m.startTime = j.value("startTime", EpochMillis{0});
}

} // namespace tankobon::offline
