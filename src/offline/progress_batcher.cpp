#include <spdlog/spdlog.h>
#include <tankobon/offline/progress_batcher.hpp>

#include <exception>

namespace tankobon::offline {

ProgressBatcher::ProgressBatcher(boost::asio::any_io_executor executor, Callback callback)
    : ProgressBatcher(std::move(executor), std::move(callback), Options{}) {}

ProgressBatcher::ProgressBatcher(boost::asio::any_io_executor executor, Callback callback,
                                 Options options)
    : callback_(std::move(callback)), options_(std::move(options)), timer_(executor) {}

ProgressBatcher::~ProgressBatcher() {
    alive_.reset();
    timer_.cancel();
}

void ProgressBatcher::update(ProgressUpdate update) {
    const bool complete = update.progressTotal > 0 && update.progressCurrent >= update.progressTotal;
    buffered_[update.queueId] = std::move(update);

    if (options_.flushOnComplete && complete) {
        flush();
        return;
    }
    if (!timerArmed_) {
        armTimer();
    }
}

void ProgressBatcher::armTimer() {
    timerArmed_ = true;
    const auto generation = ++generation_;
    timer_.expires_after(options_.flushInterval);
    std::weak_ptr<bool> alive = alive_;
    timer_.async_wait([this, alive, generation](const boost::system::error_code& ec) {
        if (ec || alive.expired() || generation != generation_) {
            return;
        }
        timerArmed_ = false;
        flush();
    });
}

void ProgressBatcher::flush() {
    if (timerArmed_) {
        timerArmed_ = false;
        ++generation_;
        timer_.cancel();
    }
    if (buffered_.empty()) {
        return;
    }

    std::vector<ProgressUpdate> batch;
    batch.reserve(buffered_.size());
    for (auto& [queueId, update] : buffered_) {
        batch.push_back(std::move(update));
    }
    buffered_.clear();

    for (const auto& update : batch) {
        try {
            callback_(update);
        } catch (const std::exception& e) {
            spdlog::error("ProgressBatcher: callback failed for queue item {}: {}", update.queueId,
                          e.what());
        } catch (...) {
            spdlog::error("ProgressBatcher: callback for queue item {} threw a non-standard exception",
                          update.queueId);
        }
    }

    if (options_.onBatch) {
        try {
            options_.onBatch(batch);
        } catch (const std::exception& e) {
            spdlog::error("ProgressBatcher: batch callback failed: {}", e.what());
        } catch (...) {
            spdlog::error("ProgressBatcher: batch callback threw a non-standard exception");
        }
    }
}

void ProgressBatcher::remove(QueueId queueId) {
    buffered_.erase(queueId);
}

} // namespace tankobon::offline
