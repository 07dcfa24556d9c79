#include <tankobon/worker/protocol.hpp>

#include <algorithm>
#include <charconv>
#include <type_traits>

namespace tankobon::worker {

namespace {

struct CommandInfo {
    Command command;
    std::string_view name;
    TimeoutClass timeout;
    std::string_view resultKey;
};

constexpr std::array<CommandInfo, kAllCommands.size()> kCommandTable{{
    {Command::Start, "start", TimeoutClass::Start, ""},
    {Command::Stop, "stop", TimeoutClass::Stop, ""},
    {Command::QueueChapter, "queue-chapter", TimeoutClass::Query, "queueId"},
    {Command::QueueManga, "queue-manga", TimeoutClass::Query, "queueIds"},
    {Command::CancelDownload, "cancel-download", TimeoutClass::Query, ""},
    {Command::RetryDownload, "retry-download", TimeoutClass::Query, ""},
    {Command::RetryFrozenDownloads, "retry-frozen-downloads", TimeoutClass::Query,
     "retriedQueueIds"},
    {Command::GetQueuedDownloads, "get-queued-downloads", TimeoutClass::Query, "queue"},
    {Command::GetDownloadProgress, "get-download-progress", TimeoutClass::Query, "progress"},
    {Command::GetStorageStats, "get-storage-stats", TimeoutClass::Query, "stats"},
    {Command::GetDownloadedManga, "get-downloaded-manga", TimeoutClass::Query, "manga"},
    {Command::GetMangaMetadata, "get-manga-metadata", TimeoutClass::Query, "metadata"},
    {Command::GetDownloadedChapters, "get-downloaded-chapters", TimeoutClass::Query, "chapters"},
    {Command::GetChapterPages, "get-chapter-pages", TimeoutClass::Query, "pages"},
    {Command::IsChapterDownloaded, "is-chapter-downloaded", TimeoutClass::Query, "downloaded"},
    {Command::DeleteChapter, "delete-chapter", TimeoutClass::Query, ""},
    {Command::DeleteManga, "delete-manga", TimeoutClass::Query, ""},
    {Command::NukeOfflineData, "nuke-offline-data", TimeoutClass::Query, ""},
    {Command::GetDownloadHistory, "get-download-history", TimeoutClass::Query, "history"},
    {Command::DeleteHistoryItem, "delete-history-item", TimeoutClass::Query, ""},
    {Command::ClearDownloadHistory, "clear-download-history", TimeoutClass::Query, ""},
    {Command::ValidateMangaChapterCount, "validate-manga-chapter-count", TimeoutClass::Query, ""},
    {Command::StartBackgroundSync, "start-background-sync", TimeoutClass::Query, ""},
    {Command::GetPagePath, "get-page-path", TimeoutClass::Query, "path"},
    {Command::GetMetrics, "get-metrics", TimeoutClass::Query, "metrics"},
    {Command::ResetMetrics, "reset-metrics", TimeoutClass::Query, ""},
    {Command::IsActive, "is-active", TimeoutClass::Query, "isActive"},
    {Command::GetActiveDownloads, "get-active-downloads", TimeoutClass::Query,
     "activeDownloads"},
    {Command::PauseDownloads, "pause-downloads", TimeoutClass::Query, "paused"},
    {Command::ResumeDownloads, "resume-downloads", TimeoutClass::Query, "resumed"},
    {Command::GetStorageUsage, "get-storage-usage", TimeoutClass::Query, "usage"},
    {Command::PerformStorageCleanup, "perform-storage-cleanup", TimeoutClass::Query, ""},
    {Command::Ping, "ping", TimeoutClass::Query, "timestamp"},
}};

constexpr bool tableInEnumOrder() {
    for (std::size_t i = 0; i < kCommandTable.size(); ++i) {
        if (static_cast<std::size_t>(kCommandTable[i].command) != i) {
            return false;
        }
    }
    return true;
}
static_assert(tableInEnumOrder(), "command table must follow the Command enum");

const CommandInfo& info(Command command) {
    return kCommandTable[static_cast<std::size_t>(command)];
}

Error invalid(std::string message) {
    return Error{ErrorCode::InvalidData, std::move(message)};
}

Result<json> parseObject(std::string_view line) {
    json j = json::parse(line.begin(), line.end(), nullptr, false);
    if (j.is_discarded()) {
        return invalid("Message is not valid JSON");
    }
    if (!j.is_object()) {
        return invalid("Message is not a JSON object");
    }
    auto type = j.find("type");
    if (type == j.end() || !type->is_string()) {
        return invalid("Message has no string 'type'");
    }
    return j;
}

std::string encodeRequestId(RequestId id) {
    return std::to_string(id);
}

// Request ids travel as decimal strings.
std::optional<RequestId> decodeRequestId(const json& value) {
    if (!value.is_string()) {
        return std::nullopt;
    }
    const auto& text = value.get_ref<const std::string&>();
    RequestId id = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return id;
}

std::optional<std::string> optionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

EpochMillis timestampOf(const json& j) {
    auto it = j.find("timestamp");
    return it != j.end() && it->is_number() ? it->get<EpochMillis>() : 0;
}

} // namespace

std::string_view commandName(Command command) {
    return info(command).name;
}

std::optional<Command> parseCommand(std::string_view name) {
    auto it = std::find_if(kCommandTable.begin(), kCommandTable.end(),
                           [name](const CommandInfo& c) { return c.name == name; });
    if (it == kCommandTable.end()) {
        return std::nullopt;
    }
    return it->command;
}

TimeoutClass timeoutClass(Command command) {
    return info(command).timeout;
}

std::string_view resultKey(Command command) {
    return info(command).resultKey;
}

// ---------------------------------------------------------------------------
// Init configuration
// ---------------------------------------------------------------------------

void to_json(json& j, const WorkerOptions& v) {
    j = json{{"concurrency", v.concurrency},
             {"pageConcurrency", v.pageConcurrency},
             {"pollingInterval", v.pollingIntervalMs},
             {"maxRetries", v.maxRetries},
             {"retryDelayMs", v.retryDelayMs},
             {"pageTimeoutMs", v.pageTimeoutMs},
             {"frozenAfterMs", v.frozenAfterMs},
             {"progressFlushMs", v.progressFlushMs},
             {"cacheMaxEntries", v.cacheMaxEntries},
             {"cacheTtlMs", v.cacheTtlMs}};
}

void from_json(const json& j, WorkerOptions& v) {
    const WorkerOptions defaults;
    v.concurrency = j.value("concurrency", defaults.concurrency);
    v.pageConcurrency = j.value("pageConcurrency", defaults.pageConcurrency);
    v.pollingIntervalMs = j.value("pollingInterval", defaults.pollingIntervalMs);
    v.maxRetries = j.value("maxRetries", defaults.maxRetries);
    v.retryDelayMs = j.value("retryDelayMs", defaults.retryDelayMs);
    v.pageTimeoutMs = j.value("pageTimeoutMs", defaults.pageTimeoutMs);
    v.frozenAfterMs = j.value("frozenAfterMs", defaults.frozenAfterMs);
    v.progressFlushMs = j.value("progressFlushMs", defaults.progressFlushMs);
    v.cacheMaxEntries = j.value("cacheMaxEntries", defaults.cacheMaxEntries);
    v.cacheTtlMs = j.value("cacheTtlMs", defaults.cacheTtlMs);
}

void to_json(json& j, const WorkerInitConfig& v) {
    j = json{{"dataDir", v.dataDir},
             {"dbPath", v.dbPath},
             {"extensionPath", v.extensionPath},
             {"extensionId", v.extensionId},
             {"workerOptions", v.workerOptions}};
}

void from_json(const json& j, WorkerInitConfig& v) {
    j.at("dataDir").get_to(v.dataDir);
    j.at("dbPath").get_to(v.dbPath);
    v.extensionPath = j.value("extensionPath", std::string{});
    v.extensionId = j.value("extensionId", std::string{});
    if (auto it = j.find("workerOptions"); it != j.end() && it->is_object()) {
        it->get_to(v.workerOptions);
    }
}

// ---------------------------------------------------------------------------
// Envelopes
// ---------------------------------------------------------------------------

std::string_view messageType(const HostMessage& message) {
    return std::visit(
        [](auto&& m) -> std::string_view {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, InitMessage>) {
                return "init";
            } else {
                return commandName(m.command);
            }
        },
        message);
}

std::string_view messageType(const WorkerMessage& message) {
    return std::visit(
        [](auto&& m) -> std::string_view {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, ReadyMessage>) {
                return "ready";
            } else if constexpr (std::is_same_v<T, StartedMessage>) {
                return "started";
            } else if constexpr (std::is_same_v<T, StoppedMessage>) {
                return "stopped";
            } else if constexpr (std::is_same_v<T, ResultMessage>) {
                return "result";
            } else if constexpr (std::is_same_v<T, ErrorMessage>) {
                return "error";
            } else if constexpr (std::is_same_v<T, FatalErrorMessage>) {
                return "fatal-error";
            } else {
                static_assert(std::is_same_v<T, EventMessage>);
                return "event";
            }
        },
        message);
}

std::string encode(const HostMessage& message) {
    json j{{"type", messageType(message)}};
    std::visit(
        [&j](auto&& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, InitMessage>) {
                j["config"] = m.config;
            } else {
                j["requestId"] = encodeRequestId(m.requestId);
                if (!m.payload.is_null()) {
                    j["payload"] = m.payload;
                }
            }
        },
        message);
    return j.dump();
}

std::string encode(const WorkerMessage& message) {
    json j{{"type", messageType(message)}};
    std::visit(
        [&j](auto&& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, ReadyMessage> || std::is_same_v<T, StartedMessage> ||
                          std::is_same_v<T, StoppedMessage>) {
                j["timestamp"] = m.timestamp;
            } else if constexpr (std::is_same_v<T, ResultMessage>) {
                j["requestId"] = encodeRequestId(m.requestId);
                if (m.command) {
                    j["command"] = *m.command;
                }
                j["result"] = m.result;
            } else if constexpr (std::is_same_v<T, ErrorMessage>) {
                if (m.requestId) {
                    j["requestId"] = encodeRequestId(*m.requestId);
                }
                j["error"] = m.error;
                if (m.stack) {
                    j["stack"] = *m.stack;
                }
            } else if constexpr (std::is_same_v<T, FatalErrorMessage>) {
                j["error"] = m.error;
                if (m.stack) {
                    j["stack"] = *m.stack;
                }
            } else {
                j["event"] = m.event;
            }
        },
        message);
    return j.dump();
}

Result<HostMessage> decodeHostMessage(std::string_view line) {
    auto parsed = parseObject(line);
    if (!parsed) {
        return parsed.error();
    }
    const json& j = parsed.value();
    const auto type = j.at("type").get<std::string>();

    if (type == "init") {
        auto config = j.find("config");
        if (config == j.end() || !config->is_object()) {
            return invalid("init message has no 'config' object");
        }
        try {
            return HostMessage{InitMessage{config->get<WorkerInitConfig>()}};
        } catch (const json::exception& e) {
            return invalid(std::string("Malformed init config: ") + e.what());
        }
    }

    auto command = parseCommand(type);
    if (!command) {
        return invalid("Unknown message type '" + type + "'");
    }
    auto rid = j.find("requestId");
    auto requestId = rid == j.end() ? std::nullopt : decodeRequestId(*rid);
    if (!requestId) {
        return invalid("'" + type + "' message has no valid requestId");
    }
    CommandMessage message{*command, *requestId, nullptr};
    if (auto payload = j.find("payload"); payload != j.end()) {
        if (!payload->is_object() && !payload->is_null()) {
            return invalid("'" + type + "' payload must be an object");
        }
        message.payload = *payload;
    }
    return HostMessage{std::move(message)};
}

Result<WorkerMessage> decodeWorkerMessage(std::string_view line) {
    auto parsed = parseObject(line);
    if (!parsed) {
        return parsed.error();
    }
    const json& j = parsed.value();
    const auto type = j.at("type").get<std::string>();

    if (type == "ready") {
        return WorkerMessage{ReadyMessage{timestampOf(j)}};
    }
    if (type == "started") {
        return WorkerMessage{StartedMessage{timestampOf(j)}};
    }
    if (type == "stopped") {
        return WorkerMessage{StoppedMessage{timestampOf(j)}};
    }
    if (type == "result") {
        auto rid = j.find("requestId");
        auto requestId = rid == j.end() ? std::nullopt : decodeRequestId(*rid);
        if (!requestId) {
            return invalid("result message has no valid requestId");
        }
        auto result = j.find("result");
        return WorkerMessage{ResultMessage{*requestId, optionalString(j, "command"),
                                           result == j.end() ? json(nullptr) : *result}};
    }
    if (type == "error") {
        auto error = optionalString(j, "error");
        if (!error) {
            return invalid("error message has no 'error' text");
        }
        std::optional<RequestId> requestId;
        if (auto rid = j.find("requestId"); rid != j.end() && !rid->is_null()) {
            requestId = decodeRequestId(*rid);
            if (!requestId) {
                return invalid("error message has a malformed requestId");
            }
        }
        return WorkerMessage{ErrorMessage{requestId, std::move(*error), optionalString(j, "stack")}};
    }
    if (type == "fatal-error") {
        auto error = optionalString(j, "error");
        if (!error) {
            return invalid("fatal-error message has no 'error' text");
        }
        return WorkerMessage{FatalErrorMessage{std::move(*error), optionalString(j, "stack")}};
    }
    if (type == "event") {
        auto event = j.find("event");
        if (event == j.end() || !event->is_object()) {
            return invalid("event message has no 'event' object");
        }
        return WorkerMessage{EventMessage{*event}};
    }
    return invalid("Unknown message type '" + type + "'");
}

} // namespace tankobon::worker
