#include <gtest/gtest.h>
#include <tankobon/archive/archiver.hpp>
#include <tankobon/offline/file_system.hpp>

#include "../../support/temp_dir_scope.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cmath>
#include <set>

using namespace tankobon;
using namespace tankobon::archive;
using tankobon::offline::OfflineChapterMetadata;
using tankobon::offline::OfflineMangaMetadata;
using tankobon::offline::PathBuilder;
using tankobon::test_support::TempDirScope;

namespace {

std::set<std::string> zipEntries(const std::filesystem::path& zip) {
    std::set<std::string> names;
    struct archive* a = archive_read_new();
    archive_read_support_format_zip(a);
    if (archive_read_open_filename(a, zip.string().c_str(), 10240) != ARCHIVE_OK) {
        ADD_FAILURE() << "cannot open " << zip << ": " << archive_error_string(a);
        archive_read_free(a);
        return names;
    }
    struct archive_entry* entry = nullptr;
    while (archive_read_next_header(a, &entry) == ARCHIVE_OK) {
        names.insert(archive_entry_pathname(entry));
        archive_read_data_skip(a);
    }
    archive_read_free(a);
    return names;
}

class ArchiverTest : public ::testing::Test {
protected:
    OfflineMangaMetadata makeManga(const std::string& slug, const std::string& title,
                                   int chapters = 2) {
        OfflineMangaMetadata manga;
        manga.mangaId = slug + "-id";
        manga.slug = slug;
        manga.extensionId = "ext";
        manga.title = title;
        manga.coverPath = "cover.png";

        TempDirScope::write_file(paths_.mangaMetadataFile("ext", slug), "{}");
        TempDirScope::write_file(paths_.coverFile("ext", slug, "cover.png"),
                                 test_support::pngBytes());
        for (int i = 1; i <= chapters; ++i) {
            OfflineChapterMetadata chapter;
            chapter.chapterId = "c" + std::to_string(i);
            chapter.folderName = offline::chapterFolderName(std::to_string(i));
            chapter.totalPages = 2;
            chapter.sizeBytes = 1000;
            TempDirScope::write_file(paths_.chapterMetadataFile("ext", slug, chapter.folderName),
                                     "{\"pages\":[]}");
            for (int p = 0; p < 2; ++p) {
                TempDirScope::write_file(paths_.pagePath("ext", slug, chapter.folderName,
                                                         offline::pageFilename(p)),
                                         test_support::jpegBytes(200));
            }
            manga.chapters.push_back(chapter);
        }
        return manga;
    }

    TempDirScope tmp_ = TempDirScope::unique_under("tankobon_archiver");
    PathBuilder paths_{tmp_.path()};
    Archiver archiver_{tmp_.path()};
};

} // namespace

TEST(ArchiveNames, FiltersImageExtensionsCaseInsensitively) {
    EXPECT_TRUE(isArchivableImage("page-0001.jpg"));
    EXPECT_TRUE(isArchivableImage("page-0001.JPEG"));
    EXPECT_TRUE(isArchivableImage("page-0001.WebP"));
    EXPECT_TRUE(isArchivableImage("a.gif"));
    EXPECT_FALSE(isArchivableImage("metadata.json"));
    EXPECT_FALSE(isArchivableImage("page-0001.jpg.tmp"));
    EXPECT_FALSE(isArchivableImage("noext"));
}

TEST(ArchiveNames, ReplacesReservedCharacters) {
    EXPECT_EQ(safeArchiveName("Re:Zero / Part <1>?"), "Re_Zero _ Part _1__");
    EXPECT_EQ(safeArchiveName("a\\b|c*d\"e"), "a_b_c_d_e");
    EXPECT_EQ(safeArchiveName("Plain Title"), "Plain Title");
}

TEST_F(ArchiverTest, ChapterArchiveHoldsMetadataAndPages) {
    auto manga = makeManga("blue-period", "Blue Period", 1);
    TempDirScope::write_file(
        paths_.pagesDir("ext", "blue-period", manga.chapters[0].folderName) / "notes.txt", "x");

    std::vector<std::pair<int, int>> progress;
    ArchiveOptions options;
    options.onProgress = [&](int c, int t) { progress.emplace_back(c, t); };

    const auto out = tmp_.path() / "out" / "chapter.zip";
    auto result = archiver_.archiveChapter("ext", "blue-period", manga.chapters[0], out, options);
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_GT(result.sizeBytes, 0u);
    EXPECT_EQ(result.sizeBytes, std::filesystem::file_size(out));

    const std::set<std::string> expected{"metadata.json", "pages/page-0000.jpg",
                                         "pages/page-0001.jpg"};
    EXPECT_EQ(zipEntries(out), expected);
    ASSERT_EQ(progress.size(), 3u);
    EXPECT_EQ(progress.back(), std::make_pair(3, 3));
}

TEST_F(ArchiverTest, MangaArchiveLayout) {
    auto manga = makeManga("blue-period", "Blue Period", 2);
    const auto out = tmp_.path() / "manga.zip";

    auto result = archiver_.archiveManga("ext", manga, out);
    ASSERT_TRUE(result.success) << result.error.value_or("");

    const std::set<std::string> expected{
        "metadata.json",
        "cover.png",
        "chapters/chapter-0001/metadata.json",
        "chapters/chapter-0001/pages/page-0000.jpg",
        "chapters/chapter-0001/pages/page-0001.jpg",
        "chapters/chapter-0002/metadata.json",
        "chapters/chapter-0002/pages/page-0000.jpg",
        "chapters/chapter-0002/pages/page-0001.jpg",
    };
    EXPECT_EQ(zipEntries(out), expected);
}

TEST_F(ArchiverTest, OptionsDropMetadataAndCover) {
    auto manga = makeManga("blue-period", "Blue Period", 1);
    const auto out = tmp_.path() / "bare.zip";

    ArchiveOptions options;
    options.includeMetadata = false;
    options.includeCover = false;
    options.compressionLevel = 0;
    auto result = archiver_.archiveManga("ext", manga, out, options);
    ASSERT_TRUE(result.success);

    const std::set<std::string> expected{"chapters/chapter-0001/pages/page-0000.jpg",
                                         "chapters/chapter-0001/pages/page-0001.jpg"};
    EXPECT_EQ(zipEntries(out), expected);
}

TEST_F(ArchiverTest, MissingChapterDirectoryFails) {
    OfflineChapterMetadata ghost;
    ghost.folderName = "chapter-0099";
    const auto out = tmp_.path() / "ghost.zip";

    auto result = archiver_.archiveChapter("ext", "nowhere", ghost, out);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("not found"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(out));
}

TEST_F(ArchiverTest, BulkIsolatesFailures) {
    auto first = makeManga("first", "First: One");
    OfflineMangaMetadata missing;
    missing.slug = "missing";
    missing.title = "Missing";
    auto third = makeManga("third", "Third");

    std::vector<int> percents;
    ArchiveOptions options;
    options.onProgress = [&](int current, int total) {
        EXPECT_EQ(total, 100);
        percents.push_back(current);
    };

    const auto outDir = tmp_.path() / "bulk";
    auto results = archiver_.archiveBulk(
        {{"ext", first}, {"ext", missing}, {"ext", third}}, outDir, options);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].success);
    EXPECT_FALSE(results[1].success);
    EXPECT_TRUE(results[2].success);
    EXPECT_EQ(results[0].outputPath.filename(), "First_ One.zip");
    EXPECT_TRUE(std::filesystem::exists(outDir / "Third.zip"));
    EXPECT_FALSE(std::filesystem::exists(outDir / "Missing.zip"));

    ASSERT_FALSE(percents.empty());
    EXPECT_TRUE(std::is_sorted(percents.begin(), percents.end()));
    EXPECT_EQ(percents.back(), 100);
}

TEST_F(ArchiverTest, EstimateScalesRecordedSizes) {
    auto manga = makeManga("blue-period", "Blue Period", 2);
    // 2 x 1000 recorded bytes + 2 x 12-byte metadata files.
    const auto estimate = archiver_.estimateArchiveSize("ext", "blue-period", manga.chapters);
    EXPECT_EQ(estimate, static_cast<std::uint64_t>(std::llround(2024 * 0.97)));
}
