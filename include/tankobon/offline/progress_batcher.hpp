#pragma once

#include <tankobon/offline/types.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tankobon::offline {

struct ProgressUpdate {
    QueueId queueId{0};
    std::string mangaId;
    std::optional<std::string> chapterId;
    int progressCurrent{0};
    int progressTotal{0};
};

/**
 * Coalesces download progress so a chapter of 200 pages produces a handful of
 * events and repository writes instead of 200.
 *
 * Only the latest update per queueId is kept. The first buffered update arms
 * one timer; everything arriving before it fires rides the same flush. An
 * update that reaches its total flushes at once when flushOnComplete is set.
 *
 * Not thread-safe: call it from the executor it was built with.
 */
class ProgressBatcher {
public:
    using Callback = std::function<void(const ProgressUpdate&)>;
    using BatchCallback = std::function<void(const std::vector<ProgressUpdate>&)>;

    struct Options {
        std::chrono::milliseconds flushInterval{1500};
        bool flushOnComplete = true;
        // Runs once per flush with every delivered update, after the per-update callbacks.
        BatchCallback onBatch;
    };

    ProgressBatcher(boost::asio::any_io_executor executor, Callback callback);
    ProgressBatcher(boost::asio::any_io_executor executor, Callback callback, Options options);
    ~ProgressBatcher();

    ProgressBatcher(const ProgressBatcher&) = delete;
    ProgressBatcher& operator=(const ProgressBatcher&) = delete;

    void update(ProgressUpdate update);
    void flush();
    void remove(QueueId queueId);

    bool hasPending() const { return !buffered_.empty(); }
    std::size_t pendingCount() const { return buffered_.size(); }

private:
    void armTimer();

    Callback callback_;
    Options options_;
    boost::asio::steady_timer timer_;
    bool timerArmed_ = false;
    std::uint64_t generation_ = 0;
    std::map<QueueId, ProgressUpdate> buffered_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace tankobon::offline
