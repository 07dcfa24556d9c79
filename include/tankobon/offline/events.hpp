#pragma once

#include <nlohmann/json.hpp>
#include <tankobon/core/types.h>
#include <tankobon/offline/types.hpp>

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tankobon::offline {

// Events raised by the worker and forwarded to every host listener.

struct DownloadQueued {
    QueueId queueId{0};
    std::vector<QueueId> queueIds;
    std::string mangaId;
    std::optional<std::string> chapterId;
};

struct DownloadStarted {
    QueueId queueId{0};
    std::string mangaId;
    std::optional<std::string> chapterId;
};

struct DownloadProgressed {
    QueueId queueId{0};
    std::string mangaId;
    std::optional<std::string> chapterId;
    int progressCurrent{0};
    int progressTotal{0};
};

struct DownloadCompleted {
    QueueId queueId{0};
    std::string mangaId;
    std::optional<std::string> chapterId;
};

struct DownloadFailed {
    QueueId queueId{0};
    std::string mangaId;
    std::optional<std::string> chapterId;
    std::string error;
};

struct DownloadRetried {
    QueueId queueId{0};
    std::string mangaId;
    std::optional<std::string> chapterId;
};

struct ChapterDeleted {
    std::string mangaId;
    std::string chapterId;
};

struct MangaDeleted {
    std::string mangaId;
};

struct NewChaptersAvailable {
    std::string mangaId;
    int newChapterCount{0};
};

using OfflineEvent =
    std::variant<DownloadQueued, DownloadStarted, DownloadProgressed, DownloadCompleted,
                 DownloadFailed, DownloadRetried, ChapterDeleted, MangaDeleted,
                 NewChaptersAvailable>;

using EventSink = std::function<void(const OfflineEvent&)>;

// Wire name, e.g. "download-progress".
const char* eventTypeName(const OfflineEvent& event);

nlohmann::json eventToJson(const OfflineEvent& event);
Result<OfflineEvent> eventFromJson(const nlohmann::json& j);

} // namespace tankobon::offline
