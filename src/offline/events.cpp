#include <tankobon/offline/events.hpp>

namespace tankobon::offline {

using nlohmann::json;

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void putChapter(json& j, const std::optional<std::string>& chapterId) {
    if (chapterId) {
        j["chapterId"] = *chapterId;
    }
}

std::optional<std::string> readChapter(const json& j) {
    auto it = j.find("chapterId");
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

const char* eventTypeName(const OfflineEvent& event) {
    return std::visit(overloaded{
                          [](const DownloadQueued&) { return "download-queued"; },
                          [](const DownloadStarted&) { return "download-started"; },
                          [](const DownloadProgressed&) { return "download-progress"; },
                          [](const DownloadCompleted&) { return "download-completed"; },
                          [](const DownloadFailed&) { return "download-failed"; },
                          [](const DownloadRetried&) { return "download-retried"; },
                          [](const ChapterDeleted&) { return "chapter-deleted"; },
                          [](const MangaDeleted&) { return "manga-deleted"; },
                          [](const NewChaptersAvailable&) { return "new-chapters-available"; },
                      },
                      event);
}

json eventToJson(const OfflineEvent& event) {
    json j = std::visit(
        overloaded{
            [](const DownloadQueued& e) {
                json out{{"queueId", e.queueId}, {"mangaId", e.mangaId}};
                if (!e.queueIds.empty()) {
                    out["queueIds"] = e.queueIds;
                }
                putChapter(out, e.chapterId);
                return out;
            },
            [](const DownloadStarted& e) {
                json out{{"queueId", e.queueId}, {"mangaId", e.mangaId}};
                putChapter(out, e.chapterId);
                return out;
            },
            [](const DownloadProgressed& e) {
                json out{{"queueId", e.queueId},
                         {"mangaId", e.mangaId},
                         {"progressCurrent", e.progressCurrent},
                         {"progressTotal", e.progressTotal}};
                putChapter(out, e.chapterId);
                return out;
            },
            [](const DownloadCompleted& e) {
                json out{{"queueId", e.queueId}, {"mangaId", e.mangaId}};
                putChapter(out, e.chapterId);
                return out;
            },
            [](const DownloadFailed& e) {
                json out{{"queueId", e.queueId}, {"mangaId", e.mangaId}, {"error", e.error}};
                putChapter(out, e.chapterId);
                return out;
            },
            [](const DownloadRetried& e) {
                json out{{"queueId", e.queueId}, {"mangaId", e.mangaId}};
                putChapter(out, e.chapterId);
                return out;
            },
            [](const ChapterDeleted& e) {
                return json{{"mangaId", e.mangaId}, {"chapterId", e.chapterId}};
            },
            [](const MangaDeleted& e) { return json{{"mangaId", e.mangaId}}; },
            [](const NewChaptersAvailable& e) {
                return json{{"mangaId", e.mangaId}, {"newChapterCount", e.newChapterCount}};
            },
        },
        event);
    j["type"] = eventTypeName(event);
    return j;
}

Result<OfflineEvent> eventFromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "event is not an object"};
    }
    auto typeIt = j.find("type");
    if (typeIt == j.end() || !typeIt->is_string()) {
        return Error{ErrorCode::InvalidData, "event has no type"};
    }
    const auto type = typeIt->get<std::string>();

    try {
        const QueueId queueId = j.value("queueId", QueueId{0});
        const std::string mangaId = j.value("mangaId", "");

        if (type == "download-queued") {
            return OfflineEvent{DownloadQueued{queueId,
                                               j.value("queueIds", std::vector<QueueId>{}),
                                               mangaId, readChapter(j)}};
        }
        if (type == "download-started") {
            return OfflineEvent{DownloadStarted{queueId, mangaId, readChapter(j)}};
        }
        if (type == "download-progress") {
            return OfflineEvent{DownloadProgressed{queueId, mangaId, readChapter(j),
                                                   j.value("progressCurrent", 0),
                                                   j.value("progressTotal", 0)}};
        }
        if (type == "download-completed") {
            return OfflineEvent{DownloadCompleted{queueId, mangaId, readChapter(j)}};
        }
        if (type == "download-failed") {
            return OfflineEvent{
                DownloadFailed{queueId, mangaId, readChapter(j), j.value("error", "")}};
        }
        if (type == "download-retried") {
            return OfflineEvent{DownloadRetried{queueId, mangaId, readChapter(j)}};
        }
        if (type == "chapter-deleted") {
            return OfflineEvent{ChapterDeleted{mangaId, j.value("chapterId", "")}};
        }
        if (type == "manga-deleted") {
            return OfflineEvent{MangaDeleted{mangaId}};
        }
        if (type == "new-chapters-available") {
            return OfflineEvent{NewChaptersAvailable{mangaId, j.value("newChapterCount", 0)}};
        }
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("malformed event: ") + e.what()};
    }
    return Error{ErrorCode::InvalidData, "unknown event type: " + type};
}

} // namespace tankobon::offline
