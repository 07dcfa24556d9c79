#pragma once

#include <nlohmann/json.hpp>
#include <tankobon/core/types.h>
#include <tankobon/offline/types.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace tankobon::offline {

struct PerformanceMetrics {
    // Downloads
    std::uint64_t totalDownloads{0};
    std::uint64_t activeDownloads{0};
    std::uint64_t completedDownloads{0};
    std::uint64_t failedDownloads{0};
    std::uint64_t totalPagesDownloaded{0};
    std::uint64_t totalBytesDownloaded{0};

    // Events
    std::uint64_t eventsEmitted{0};
    double eventsPerSecond{0};
    EpochMillis lastEventTimestamp{0};

    // Repository writes
    std::uint64_t databaseWrites{0};
    double databaseWritesPerSecond{0};
    std::uint64_t batchedWrites{0};
    double batchSavingsPercent{0};

    // Network
    std::uint64_t networkRequests{0};
    double networkRequestsPerSecond{0};
    std::uint64_t cachedRequests{0};
    double cacheHitRate{0};

    // Timing
    double averageDownloadTimeMs{0};
    double averagePageDownloadTimeMs{0};

    EpochMillis uptimeMs{0};
    EpochMillis startTime{0};
};

void to_json(nlohmann::json& j, const PerformanceMetrics& m);
void from_json(const nlohmann::json& j, PerformanceMetrics& m);

/**
 * Rolling counters for the worker.
 *
 * Per-second rates count the timestamps seen in the last second; each window
 * keeps at most ten seconds of history and is pruned on every record.
 * Download durations are paired by queue id, so concurrent downloads do not
 * borrow each other's start time.
 */
class PerformanceMetricsTracker {
public:
    using Clock = std::function<EpochMillis()>;

    explicit PerformanceMetricsTracker(Clock clock = {});

    void downloadStarted(QueueId queueId);
    void downloadCompleted(QueueId queueId, std::uint64_t pagesDownloaded);
    void downloadFailed(QueueId queueId);
    void bytesDownloaded(std::uint64_t bytes);

    void eventEmitted();
    void databaseWrite();
    void databaseBatchWrite(std::uint64_t count);
    void networkRequest();
    void cacheHit();

    PerformanceMetrics snapshot() const;
    void reset();

private:
    static constexpr EpochMillis kRateWindowMs = 1000;
    static constexpr EpochMillis kRetentionMs = 10000;

    void prune(std::deque<EpochMillis>& window, EpochMillis now) const;
    double rate(const std::deque<EpochMillis>& window, EpochMillis now) const;
    void resetLocked();

    Clock clock_;
    mutable std::mutex mutex_;

    EpochMillis startTime_{0};

    std::uint64_t totalDownloads_{0};
    std::uint64_t completedDownloads_{0};
    std::uint64_t failedDownloads_{0};
    std::uint64_t totalPages_{0};
    std::uint64_t totalBytes_{0};
    std::unordered_map<QueueId, EpochMillis> activeStarts_;

    std::uint64_t timedDownloads_{0};
    std::uint64_t timedDurationMs_{0};
    std::uint64_t timedPages_{0};

    std::uint64_t eventsEmitted_{0};
    EpochMillis lastEventTimestamp_{0};
    std::deque<EpochMillis> eventTimes_;

    std::uint64_t databaseWrites_{0};
    std::uint64_t batchedWrites_{0};
    std::deque<EpochMillis> writeTimes_;

    std::uint64_t networkRequests_{0};
    std::uint64_t cachedRequests_{0};
    std::deque<EpochMillis> networkTimes_;
};

} // namespace tankobon::offline
