#pragma once

#include <nlohmann/json.hpp>
#include <tankobon/core/types.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tankobon::worker {

using json = nlohmann::json;
using RequestId = std::uint64_t;

// Every host -> worker operation except init. Wire names are kebab-case.
enum class Command {
    Start,
    Stop,
    QueueChapter,
    QueueManga,
    CancelDownload,
    RetryDownload,
    RetryFrozenDownloads,
    GetQueuedDownloads,
    GetDownloadProgress,
    GetStorageStats,
    GetDownloadedManga,
    GetMangaMetadata,
    GetDownloadedChapters,
    GetChapterPages,
    IsChapterDownloaded,
    DeleteChapter,
    DeleteManga,
    NukeOfflineData,
    GetDownloadHistory,
    DeleteHistoryItem,
    ClearDownloadHistory,
    ValidateMangaChapterCount,
    StartBackgroundSync,
    GetPagePath,
    GetMetrics,
    ResetMetrics,
    IsActive,
    GetActiveDownloads,
    PauseDownloads,
    ResumeDownloads,
    GetStorageUsage,
    PerformStorageCleanup,
    Ping,
};

inline constexpr std::array kAllCommands{
    Command::Start,
    Command::Stop,
    Command::QueueChapter,
    Command::QueueManga,
    Command::CancelDownload,
    Command::RetryDownload,
    Command::RetryFrozenDownloads,
    Command::GetQueuedDownloads,
    Command::GetDownloadProgress,
    Command::GetStorageStats,
    Command::GetDownloadedManga,
    Command::GetMangaMetadata,
    Command::GetDownloadedChapters,
    Command::GetChapterPages,
    Command::IsChapterDownloaded,
    Command::DeleteChapter,
    Command::DeleteManga,
    Command::NukeOfflineData,
    Command::GetDownloadHistory,
    Command::DeleteHistoryItem,
    Command::ClearDownloadHistory,
    Command::ValidateMangaChapterCount,
    Command::StartBackgroundSync,
    Command::GetPagePath,
    Command::GetMetrics,
    Command::ResetMetrics,
    Command::IsActive,
    Command::GetActiveDownloads,
    Command::PauseDownloads,
    Command::ResumeDownloads,
    Command::GetStorageUsage,
    Command::PerformStorageCleanup,
    Command::Ping,
};

std::string_view commandName(Command command);
std::optional<Command> parseCommand(std::string_view name);

// Selects the supervisor-side timeout budget.
enum class TimeoutClass { Start, Stop, Query };
TimeoutClass timeoutClass(Command command);

// Field the command's result object wraps its value in; empty when the
// result is null or carries several fields.
std::string_view resultKey(Command command);

// ---------------------------------------------------------------------------
// Init configuration
// ---------------------------------------------------------------------------

struct WorkerOptions {
    int concurrency{3};
    int pageConcurrency{3};
    std::int64_t pollingIntervalMs{1000};
    int maxRetries{3};
    std::int64_t retryDelayMs{1000};
    std::int64_t pageTimeoutMs{30000};
    std::int64_t frozenAfterMs{30000};
    std::int64_t progressFlushMs{1500};
    std::size_t cacheMaxEntries{100};
    std::int64_t cacheTtlMs{300000};
};

// Sent once, right after spawn. extensionPath names the catalog source
// (a directory or an http(s):// base URL).
struct WorkerInitConfig {
    std::string dataDir;
    std::string dbPath;
    std::string extensionPath;
    std::string extensionId;
    WorkerOptions workerOptions;
};

void to_json(json& j, const WorkerOptions& v);
void from_json(const json& j, WorkerOptions& v);
void to_json(json& j, const WorkerInitConfig& v);
void from_json(const json& j, WorkerInitConfig& v);

// ---------------------------------------------------------------------------
// Envelopes
// ---------------------------------------------------------------------------

struct InitMessage {
    WorkerInitConfig config;
};

struct CommandMessage {
    Command command{Command::Ping};
    RequestId requestId{0};
    json payload; // null when the command takes none
};

using HostMessage = std::variant<InitMessage, CommandMessage>;

struct ReadyMessage {
    EpochMillis timestamp{0};
};
struct StartedMessage {
    EpochMillis timestamp{0};
};
struct StoppedMessage {
    EpochMillis timestamp{0};
};
struct ResultMessage {
    RequestId requestId{0};
    std::optional<std::string> command;
    json result;
};
struct ErrorMessage {
    std::optional<RequestId> requestId;
    std::string error;
    std::optional<std::string> stack;
};
struct FatalErrorMessage {
    std::string error;
    std::optional<std::string> stack;
};
struct EventMessage {
    json event;
};

using WorkerMessage = std::variant<ReadyMessage, StartedMessage, StoppedMessage, ResultMessage,
                                   ErrorMessage, FatalErrorMessage, EventMessage>;

std::string_view messageType(const HostMessage& message);
std::string_view messageType(const WorkerMessage& message);

/// One JSON object, no trailing newline.
std::string encode(const HostMessage& message);
std::string encode(const WorkerMessage& message);

/// Rejects anything that is not a JSON object with a known string "type" and
/// the fields that type requires.
Result<HostMessage> decodeHostMessage(std::string_view line);
Result<WorkerMessage> decodeWorkerMessage(std::string_view line);

} // namespace tankobon::worker
