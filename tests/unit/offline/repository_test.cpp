#include <gtest/gtest.h>
#include <tankobon/offline/repository.hpp>

#include "../../support/temp_dir_scope.hpp"

using namespace tankobon;
using namespace tankobon::offline;
using tankobon::test_support::TempDirScope;

namespace {

QueuedDownload queued(const std::string& manga, const std::string& chapter, int priority,
                      EpochMillis queuedAt) {
    QueuedDownload q;
    q.extensionId = "ext";
    q.mangaId = manga;
    q.mangaSlug = manga;
    q.chapterId = chapter;
    q.priority = priority;
    q.queuedAt = queuedAt;
    return q;
}

OfflineMangaRow mangaRow(const std::string& id, EpochMillis downloadedAt, std::uint64_t size = 0) {
    OfflineMangaRow row;
    row.extensionId = "ext";
    row.mangaId = id;
    row.mangaSlug = id;
    row.downloadPath = "/data/offline/ext/" + id;
    row.downloadedAt = downloadedAt;
    row.lastUpdatedAt = downloadedAt;
    row.totalSizeBytes = size;
    return row;
}

} // namespace

TEST(JsonOfflineRepositoryTest, QueueDrainsByPriorityThenAge) {
    JsonOfflineRepository repo;
    auto low = repo.enqueue(queued("m", "c1", 0, 100)).value();
    auto highLate = repo.enqueue(queued("m", "c2", 5, 300)).value();
    auto highEarly = repo.enqueue(queued("m", "c3", 5, 200)).value();

    auto next = repo.nextQueued(10);
    ASSERT_EQ(next.size(), 3u);
    EXPECT_EQ(next[0].id, highEarly);
    EXPECT_EQ(next[1].id, highLate);
    EXPECT_EQ(next[2].id, low);

    EXPECT_EQ(repo.nextQueued(1).size(), 1u);
}

TEST(JsonOfflineRepositoryTest, RequeueSameChapterReusesRow) {
    JsonOfflineRepository repo;
    auto first = repo.enqueue(queued("m", "c1", 0, 100)).value();
    ASSERT_TRUE(repo.updateQueueStatus(first, DownloadStatus::Failed, std::string("boom")));

    auto second = repo.enqueue(queued("m", "c1", 3, 500)).value();
    EXPECT_EQ(first, second);
    auto item = repo.getQueueItem(first);
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->status, DownloadStatus::Queued);
    EXPECT_EQ(item->priority, 3);
    EXPECT_EQ(item->queuedAt, 500);
}

TEST(JsonOfflineRepositoryTest, PauseParksOnlyQueuedItems) {
    JsonOfflineRepository repo;
    auto waiting = repo.enqueue(queued("m", "c1", 0, 100)).value();
    auto running = repo.enqueue(queued("m", "c2", 0, 200)).value();
    auto failed = repo.enqueue(queued("m", "c3", 0, 300)).value();
    ASSERT_TRUE(repo.updateQueueStatus(running, DownloadStatus::Downloading));
    ASSERT_TRUE(repo.updateQueueStatus(failed, DownloadStatus::Failed, std::string("boom")));

    auto paused = repo.pauseQueued();
    ASSERT_TRUE(paused);
    EXPECT_EQ(paused.value(), 1);
    EXPECT_EQ(repo.getQueueItem(waiting)->status, DownloadStatus::Paused);
    EXPECT_EQ(repo.getQueueItem(running)->status, DownloadStatus::Downloading);
    EXPECT_EQ(repo.getQueueItem(failed)->status, DownloadStatus::Failed);
    EXPECT_TRUE(repo.nextQueued(10).empty());
    // Paused items stay visible in the active queue.
    EXPECT_EQ(repo.listActiveQueue().size(), 2u);

    EXPECT_EQ(repo.pauseQueued().value(), 0);
    auto resumed = repo.resumePaused();
    ASSERT_TRUE(resumed);
    EXPECT_EQ(resumed.value(), 1);
    ASSERT_EQ(repo.nextQueued(10).size(), 1u);
    EXPECT_EQ(repo.nextQueued(10)[0].id, waiting);
}

TEST(JsonOfflineRepositoryTest, StatusTransitionsStampTimes) {
    JsonOfflineRepository repo;
    auto id = repo.enqueue(queued("m", "c1", 0, 100)).value();

    ASSERT_TRUE(repo.updateQueueStatus(id, DownloadStatus::Downloading));
    auto started = repo.getQueueItem(id)->startedAt;
    ASSERT_TRUE(started.has_value());
    EXPECT_FALSE(repo.getQueueItem(id)->completedAt.has_value());

    // A second downloading transition keeps the original start.
    ASSERT_TRUE(repo.updateQueueStatus(id, DownloadStatus::Downloading));
    EXPECT_EQ(repo.getQueueItem(id)->startedAt, started);

    ASSERT_TRUE(repo.updateQueueStatus(id, DownloadStatus::Failed, std::string("HTTP 404")));
    auto failed = repo.getQueueItem(id);
    EXPECT_TRUE(failed->completedAt.has_value());
    EXPECT_EQ(failed->errorMessage.value_or(""), "HTTP 404");

    ASSERT_TRUE(repo.resetQueueItem(id));
    auto reset = repo.getQueueItem(id);
    EXPECT_EQ(reset->status, DownloadStatus::Queued);
    EXPECT_FALSE(reset->startedAt.has_value());
    EXPECT_FALSE(reset->completedAt.has_value());
    EXPECT_FALSE(reset->errorMessage.has_value());
    EXPECT_EQ(reset->queuedAt, 100);
}

TEST(JsonOfflineRepositoryTest, UnknownQueueIdIsNotFound) {
    JsonOfflineRepository repo;
    auto r = repo.updateQueueStatus(42, DownloadStatus::Downloading);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST(JsonOfflineRepositoryTest, MoveToHistoryRequiresTerminalItem) {
    JsonOfflineRepository repo;
    auto id = repo.enqueue(queued("m", "c1", 0, 100)).value();
    EXPECT_FALSE(repo.moveToHistory(id));

    ASSERT_TRUE(repo.updateQueueProgress(id, 4, 4));
    ASSERT_TRUE(repo.updateQueueStatus(id, DownloadStatus::Completed));
    ASSERT_TRUE(repo.moveToHistory(id));

    EXPECT_FALSE(repo.getQueueItem(id).has_value());
    auto history = repo.history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].chapterId.value_or(""), "c1");
    EXPECT_EQ(history[0].status, DownloadStatus::Completed);
    EXPECT_EQ(history[0].progressCurrent, 4);
}

TEST(JsonOfflineRepositoryTest, HistoryIsNewestFirstWithLimit) {
    JsonOfflineRepository repo;
    for (int i = 0; i < 3; ++i) {
        auto id = repo.enqueue(queued("m", "c" + std::to_string(i), 0, 100 + i)).value();
        ASSERT_TRUE(repo.updateQueueStatus(id, DownloadStatus::Completed));
        ASSERT_TRUE(repo.moveToHistory(id));
    }
    auto all = repo.history();
    ASSERT_EQ(all.size(), 3u);
    for (std::size_t i = 1; i < all.size(); ++i) {
        EXPECT_GE(all[i - 1].completedAt, all[i].completedAt);
    }
    EXPECT_EQ(repo.history(2).size(), 2u);

    ASSERT_TRUE(repo.deleteHistoryItem(all[0].id));
    EXPECT_EQ(repo.history().size(), 2u);
    ASSERT_TRUE(repo.clearHistory());
    EXPECT_TRUE(repo.history().empty());
}

TEST(JsonOfflineRepositoryTest, MangaUpsertRefreshesOnlySizeAndTimestamp) {
    JsonOfflineRepository repo;
    auto id = repo.upsertManga(mangaRow("m1", 100, 10)).value();

    auto again = mangaRow("m1", 999, 50);
    again.mangaSlug = "changed";
    again.lastUpdatedAt = 1000;
    EXPECT_EQ(repo.upsertManga(again).value(), id);

    auto row = repo.getManga("ext", "m1");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->mangaSlug, "m1");
    EXPECT_EQ(row->downloadedAt, 100);
    EXPECT_EQ(row->lastUpdatedAt, 1000);
    EXPECT_EQ(row->totalSizeBytes, 50u);
}

TEST(JsonOfflineRepositoryTest, DeletingMangaDropsItsChapters) {
    JsonOfflineRepository repo;
    auto m1 = repo.upsertManga(mangaRow("m1", 100, 10)).value();
    auto m2 = repo.upsertManga(mangaRow("m2", 200, 20)).value();

    OfflineChapterRow c;
    c.offlineMangaId = m1;
    c.chapterId = "c1";
    c.totalPages = 3;
    ASSERT_TRUE(repo.upsertChapter(c));
    c.offlineMangaId = m2;
    c.totalPages = 5;
    ASSERT_TRUE(repo.upsertChapter(c));

    EXPECT_EQ(repo.chapterCount(), 2);
    EXPECT_EQ(repo.pageCount(), 8);
    EXPECT_EQ(repo.totalStorageBytes(), 30u);
    EXPECT_EQ(repo.listManga().front().mangaId, "m2");

    ASSERT_TRUE(repo.deleteManga("ext", "m1"));
    EXPECT_FALSE(repo.getManga("ext", "m1").has_value());
    EXPECT_TRUE(repo.listChapters(m1).empty());
    EXPECT_EQ(repo.listChapters(m2).size(), 1u);
    EXPECT_EQ(repo.storageByExtension().at("ext"), 20u);
}

TEST(JsonOfflineRepositoryTest, ChapterNeedsOwningManga) {
    JsonOfflineRepository repo;
    OfflineChapterRow c;
    c.offlineMangaId = 77;
    c.chapterId = "c1";
    auto r = repo.upsertChapter(c);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST(JsonOfflineRepositoryTest, BatchProgressSkipsVanishedItems) {
    JsonOfflineRepository repo;
    auto id = repo.enqueue(queued("m", "c1", 0, 100)).value();
    ASSERT_TRUE(repo.updateQueueProgressBatch({{id, 2, 10}, {999, 1, 1}}));
    EXPECT_EQ(repo.getQueueItem(id)->progressCurrent, 2);
    EXPECT_EQ(repo.getQueueItem(id)->progressTotal, 10);
}

TEST(JsonOfflineRepositoryTest, SnapshotSurvivesReopen) {
    auto dir = TempDirScope::unique_under("tankobon-repo");
    const auto dbPath = dir.path() / "offline.json";

    QueueId queueId = 0;
    {
        auto repo = JsonOfflineRepository::open(dbPath);
        ASSERT_TRUE(repo);
        auto mangaId = repo.value()->upsertManga(mangaRow("m1", 100, 10)).value();
        OfflineChapterRow c;
        c.offlineMangaId = mangaId;
        c.chapterId = "c1";
        c.folderName = "chapter-0001";
        ASSERT_TRUE(repo.value()->upsertChapter(c));
        queueId = repo.value()->enqueue(queued("m1", "c2", 1, 100)).value();
    }

    auto reopened = JsonOfflineRepository::open(dbPath);
    ASSERT_TRUE(reopened);
    auto& repo = *reopened.value();
    ASSERT_TRUE(repo.getManga("ext", "m1").has_value());
    EXPECT_EQ(repo.chapterCount(), 1);
    auto item = repo.getQueueItem(queueId);
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->chapterId.value_or(""), "c2");

    // Ids keep increasing past the reloaded rows.
    auto next = repo.enqueue(queued("m1", "c3", 0, 200)).value();
    EXPECT_GT(next, queueId);
}

TEST(JsonOfflineRepositoryTest, CorruptSnapshotStartsEmpty) {
    auto dir = TempDirScope::unique_under("tankobon-repo");
    const auto dbPath = dir.path() / "offline.json";
    TempDirScope::write_file(dbPath, "{ not json");

    auto repo = JsonOfflineRepository::open(dbPath);
    ASSERT_TRUE(repo);
    EXPECT_TRUE(repo.value()->listManga().empty());
    EXPECT_TRUE(repo.value()->enqueue(queued("m", "c", 0, 1)));
}
