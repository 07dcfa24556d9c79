#pragma once

#include <tankobon/core/types.h>
#include <tankobon/worker/worker_process.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tankobon::worker {

struct ChannelHandlers {
    // One complete line from the worker's protocol stream, newline stripped.
    std::function<void(std::string)> onLine;
    // The worker is gone; nullopt when no exit status could be read.
    std::function<void(std::optional<int>)> onExit;
};

/**
 * Line-oriented duplex link to one worker instance.
 *
 * Handlers run on a channel-owned thread and must not block; the supervisor
 * only posts from them. onExit fires at most once, after the last onLine.
 */
class IWorkerChannel {
public:
    virtual ~IWorkerChannel() = default;

    virtual Result<void> open(ChannelHandlers handlers) = 0;
    virtual Result<void> send(const std::string& line) = 0;
    /// Asks the worker to exit and escalates to a hard kill after grace.
    /// Returns at once; completion is reported through onExit.
    virtual void terminate(std::chrono::milliseconds grace) = 0;
};

using ChannelFactory = std::function<std::unique_ptr<IWorkerChannel>()>;

// NDJSON over the stdin/stdout pipes of a spawned tankobon-worker. The
// worker's stderr is re-logged at debug level.
ChannelFactory makeProcessChannelFactory(WorkerProcessConfig config);

} // namespace tankobon::worker
