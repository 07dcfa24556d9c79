#pragma once

#include <tankobon/worker/protocol.hpp>
#include <tankobon/worker/worker_channel.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tankobon::test_support {

// Shared state behind every channel a FakeWorkerChannel factory hands out;
// the test plays the worker side through it.
struct FakeWorker {
    bool autoReady = true;          // answer init with ready
    bool autoAck = true;            // answer start/stop with a null result
    bool exitOnTerminate = true;    // terminate() reports exit code 0
    std::optional<Error> openError; // next open() fails with this

    // Commands other than acknowledged start/stop land here.
    std::function<void(const worker::CommandMessage&)> onCommand;

    int opened = 0;
    int terminated = 0;
    std::vector<std::string> sent;
    std::vector<worker::CommandMessage> commands;
    worker::ChannelHandlers handlers;

    void emit(const worker::WorkerMessage& message) {
        if (handlers.onLine) {
            handlers.onLine(worker::encode(message));
        }
    }
    void emitRaw(const std::string& line) {
        if (handlers.onLine) {
            handlers.onLine(line);
        }
    }
    void reply(worker::RequestId id, worker::json result = nullptr) {
        emit(worker::ResultMessage{id, std::nullopt, std::move(result)});
    }
    void fail(worker::RequestId id, const std::string& error) {
        emit(worker::ErrorMessage{id, error, std::nullopt});
    }
    void exit(std::optional<int> code) {
        auto onExit = std::move(handlers.onExit);
        handlers = {};
        if (onExit) {
            onExit(code);
        }
    }

    std::vector<worker::CommandMessage> commandsOf(worker::Command command) const {
        std::vector<worker::CommandMessage> out;
        for (const auto& c : commands) {
            if (c.command == command) {
                out.push_back(c);
            }
        }
        return out;
    }
};

class FakeWorkerChannel final : public worker::IWorkerChannel {
public:
    explicit FakeWorkerChannel(std::shared_ptr<FakeWorker> worker) : worker_(std::move(worker)) {}

    Result<void> open(worker::ChannelHandlers handlers) override {
        if (worker_->openError) {
            auto error = *worker_->openError;
            worker_->openError.reset();
            return error;
        }
        ++worker_->opened;
        worker_->handlers = std::move(handlers);
        return {};
    }

    Result<void> send(const std::string& line) override {
        worker_->sent.push_back(line);
        auto decoded = worker::decodeHostMessage(line);
        if (!decoded) {
            return decoded.error();
        }
        if (std::holds_alternative<worker::InitMessage>(decoded.value())) {
            if (worker_->autoReady) {
                worker_->emit(worker::ReadyMessage{nowMillis()});
            }
            return {};
        }
        const auto& command = std::get<worker::CommandMessage>(decoded.value());
        worker_->commands.push_back(command);
        const bool lifecycle =
            command.command == worker::Command::Start || command.command == worker::Command::Stop;
        if (lifecycle && worker_->autoAck) {
            worker_->reply(command.requestId);
        } else if (worker_->onCommand) {
            worker_->onCommand(command);
        }
        return {};
    }

    void terminate(std::chrono::milliseconds) override {
        ++worker_->terminated;
        if (worker_->exitOnTerminate) {
            worker_->exit(0);
        }
    }

private:
    std::shared_ptr<FakeWorker> worker_;
};

inline worker::ChannelFactory fakeChannelFactory(std::shared_ptr<FakeWorker> worker) {
    return [worker]() -> std::unique_ptr<worker::IWorkerChannel> {
        return std::make_unique<FakeWorkerChannel>(worker);
    };
}

} // namespace tankobon::test_support
