#include <gtest/gtest.h>
#include <tankobon/archive/archiver.hpp>
#include <tankobon/archive/importer.hpp>
#include <tankobon/offline/file_system.hpp>

#include "../../support/temp_dir_scope.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <utility>

using namespace tankobon;
using namespace tankobon::archive;
using namespace tankobon::offline;
using tankobon::test_support::TempDirScope;

namespace {

// Raw ZIP with the given (name, content) entries.
void writeRawZip(const std::filesystem::path& zip,
                 const std::vector<std::pair<std::string, std::string>>& files) {
    struct archive* a = archive_write_new();
    archive_write_set_format_zip(a);
    ASSERT_EQ(archive_write_open_filename(a, zip.string().c_str()), ARCHIVE_OK);
    for (const auto& [name, content] : files) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, name.c_str());
        archive_entry_set_size(entry, static_cast<la_int64_t>(content.size()));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        archive_write_header(a, entry);
        archive_write_data(a, content.data(), content.size());
        archive_entry_free(entry);
    }
    archive_write_close(a);
    archive_write_free(a);
}

class ImporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = std::make_shared<StorageManager>(sourceDir_.path(),
                                                   std::make_shared<JsonOfflineRepository>(),
                                                   nullptr);
        target_ = std::make_shared<StorageManager>(targetDir_.path(), targetRepo_, nullptr);
        importer_ = std::make_unique<Importer>(target_);
    }

    // Downloads two chapters of "Blue Period" into the source tree and zips it.
    std::filesystem::path makeArchive() {
        CatalogManga manga;
        manga.id = "m1";
        manga.title = "Blue Period";
        manga.authors = std::vector<std::string>{"Yamaguchi"};
        TempDirScope::write_file(source_->paths().coverFile("ext", "blue-period", "cover.png"),
                                 test_support::pngBytes());
        EXPECT_TRUE(source_->prepareManga("ext", manga, "blue-period", "cover.png"));

        for (int n = 1; n <= 2; ++n) {
            ChapterSummary chapter;
            chapter.id = "c" + std::to_string(n);
            chapter.number = std::to_string(n);
            chapter.title = n == 1 ? std::optional<std::string>("Awakening") : std::nullopt;

            OfflineChapterPages doc;
            doc.chapterId = chapter.id;
            doc.mangaId = manga.id;
            doc.folderName = chapterFolderName(*chapter.number);
            for (int p = 0; p < 2; ++p) {
                OfflinePageMetadata page;
                page.index = p;
                page.filename = pageFilename(p);
                TempDirScope::write_file(
                    source_->paths().pagePath("ext", "blue-period", doc.folderName, page.filename),
                    test_support::jpegBytes(300));
                doc.pages.push_back(page);
            }
            EXPECT_TRUE(fsutil::writeDocument(
                source_->paths().chapterMetadataFile("ext", "blue-period", doc.folderName), doc));
            EXPECT_TRUE(source_->commitChapter("ext", "blue-period", chapter, doc));
        }

        auto doc = source_->mangaMetadata("ext", "m1");
        EXPECT_TRUE(doc.has_value());
        const auto zip = sourceDir_.path() / "blue-period.zip";
        auto archived = Archiver(sourceDir_.path()).archiveManga("ext", *doc, zip);
        EXPECT_TRUE(archived.success) << archived.error.value_or("");
        return zip;
    }

    bool stagingIsEmpty() const {
        const auto temp = targetDir_.path() / ".temp";
        return !std::filesystem::exists(temp) || std::filesystem::is_empty(temp);
    }

    TempDirScope sourceDir_ = TempDirScope::unique_under("tankobon_import_src");
    TempDirScope targetDir_ = TempDirScope::unique_under("tankobon_import_dst");
    std::shared_ptr<JsonOfflineRepository> targetRepo_ = std::make_shared<JsonOfflineRepository>();
    std::shared_ptr<StorageManager> source_;
    std::shared_ptr<StorageManager> target_;
    std::unique_ptr<Importer> importer_;
};

} // namespace

TEST(ConflictResolutionNames, ParseAndPrint) {
    EXPECT_EQ(parseConflictResolution("skip"), ConflictResolution::Skip);
    EXPECT_EQ(parseConflictResolution("overwrite"), ConflictResolution::Overwrite);
    EXPECT_EQ(parseConflictResolution("rename"), ConflictResolution::Rename);
    EXPECT_FALSE(parseConflictResolution("merge").has_value());
    EXPECT_STREQ(toString(ConflictResolution::Rename), "rename");
}

TEST_F(ImporterTest, ImportsArchiveIntoEmptyStorage) {
    const auto zip = makeArchive();
    std::vector<int> steps;
    ImportOptions options;
    options.onProgress = [&](int current, int total, const std::string&) {
        EXPECT_EQ(total, 100);
        steps.push_back(current);
    };

    auto result = importer_->importMangaArchive(zip, options);
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_FALSE(result.skipped);
    EXPECT_EQ(result.mangaId, "m1");
    EXPECT_EQ(result.extensionId, "ext");
    EXPECT_EQ(result.mangaSlug, "blue-period");
    EXPECT_EQ(result.chaptersImported, 2);

    auto doc = target_->mangaMetadata("ext", "m1");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->title, "Blue Period");
    EXPECT_EQ(doc->coverPath, "cover.png");
    ASSERT_EQ(doc->chapters.size(), 2u);
    EXPECT_EQ(doc->chapters[0].displayTitle, "Chapter 1 - Awakening");
    EXPECT_TRUE(target_->isChapterDownloaded("ext", "m1", "c2"));
    EXPECT_TRUE(fsutil::fileExists(target_->paths().coverFile("ext", "blue-period", "cover.png")));
    auto pages = target_->chapterPages("ext", "m1", "c1");
    ASSERT_TRUE(pages.has_value());
    EXPECT_EQ(pages->pages.size(), 2u);

    ASSERT_FALSE(steps.empty());
    EXPECT_EQ(steps.front(), 0);
    EXPECT_EQ(steps.back(), 100);
    EXPECT_TRUE(std::is_sorted(steps.begin(), steps.end()));
    EXPECT_TRUE(stagingIsEmpty());
}

TEST_F(ImporterTest, SkipLeavesExistingMangaAlone) {
    const auto zip = makeArchive();
    ASSERT_TRUE(importer_->importMangaArchive(zip).success);
    ASSERT_TRUE(target_->deleteChapter("ext", "m1", "c2"));

    auto result = importer_->importMangaArchive(zip);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.skipped);
    EXPECT_EQ(result.chaptersImported, 0);
    EXPECT_EQ(target_->downloadedChapters("ext", "m1").size(), 1u);
}

TEST_F(ImporterTest, OverwriteReplacesExistingManga) {
    const auto zip = makeArchive();
    ASSERT_TRUE(importer_->importMangaArchive(zip).success);
    ASSERT_TRUE(target_->deleteChapter("ext", "m1", "c2"));

    ImportOptions options;
    options.conflictResolution = ConflictResolution::Overwrite;
    auto result = importer_->importMangaArchive(zip, options);
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_FALSE(result.skipped);
    EXPECT_EQ(result.chaptersImported, 2);
    EXPECT_EQ(target_->downloadedChapters("ext", "m1").size(), 2u);
    EXPECT_EQ(targetRepo_->listManga().size(), 1u);
}

TEST_F(ImporterTest, RenameKeepsBothCopies) {
    const auto zip = makeArchive();
    ASSERT_TRUE(importer_->importMangaArchive(zip).success);

    ImportOptions options;
    options.conflictResolution = ConflictResolution::Rename;
    auto result = importer_->importMangaArchive(zip, options);
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_NE(result.mangaSlug, "blue-period");
    EXPECT_EQ(result.mangaSlug.rfind("blue-period-", 0), 0u);
    EXPECT_EQ(result.mangaId.rfind("m1-", 0), 0u);

    EXPECT_EQ(targetRepo_->listManga().size(), 2u);
    EXPECT_TRUE(target_->isMangaDownloaded("ext", "m1"));
    EXPECT_TRUE(target_->isChapterDownloaded("ext", result.mangaId, "c1"));
    EXPECT_TRUE(std::filesystem::is_directory(
        target_->paths().mangaDir("ext", result.mangaSlug)));
}

TEST_F(ImporterTest, ValidationReportsStructureProblems) {
    const auto zip = targetDir_.path() / "bad.zip";
    writeRawZip(zip, {{"metadata.json",
                       R"({"mangaId":"m9","extensionId":"ext","title":"Odd","slug":"odd"})"},
                      {"chapters/chapter-0001/pages/page-0000.jpg", test_support::jpegBytes()},
                      {"chapters/chapter-0002/metadata.json", "{}"},
                      {"chapters/chapter-0002/pages/notes.txt", "hello"}});

    auto validation = importer_->validateArchive(zip);
    EXPECT_FALSE(validation.valid);
    EXPECT_EQ(validation.chapterCount, 0);
    EXPECT_EQ(validation.title.value_or(""), "Odd");
    ASSERT_EQ(validation.warnings.size(), 2u);
    EXPECT_EQ(validation.warnings[0], "Chapter chapter-0001: missing metadata.json");
    EXPECT_EQ(validation.warnings[1], "Chapter chapter-0002: no image files found");
    ASSERT_EQ(validation.errors.size(), 1u);
    EXPECT_EQ(validation.errors[0], "No valid chapters found in archive");

    auto result = importer_->importMangaArchive(zip);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.value_or("").find("Archive validation failed"), std::string::npos);
    EXPECT_TRUE(targetRepo_->listManga().empty());
    EXPECT_TRUE(stagingIsEmpty());
}

TEST_F(ImporterTest, MissingMetadataFailsValidation) {
    const auto zip = targetDir_.path() / "empty.zip";
    writeRawZip(zip, {{"readme.txt", "nothing here"}});

    auto validation = importer_->validateArchive(zip);
    EXPECT_FALSE(validation.valid);
    ASSERT_EQ(validation.errors.size(), 1u);
    EXPECT_EQ(validation.errors[0], "Missing metadata.json file");
}

TEST_F(ImporterTest, UnreadableArchiveIsReported) {
    const auto notZip = targetDir_.path() / "broken.zip";
    TempDirScope::write_file(notZip, "this is not a zip file");

    auto validation = importer_->validateArchive(notZip);
    EXPECT_FALSE(validation.valid);
    ASSERT_EQ(validation.errors.size(), 1u);
    EXPECT_EQ(validation.errors[0].rfind("Failed to extract archive", 0), 0u);
    EXPECT_FALSE(importer_->importMangaArchive(notZip).success);
}

TEST_F(ImporterTest, EntryEscapingStagingDirectoryIsRejected) {
    const auto zip = targetDir_.path() / "slip.zip";
    writeRawZip(zip, {{"metadata.json", "{}"}, {"../../escaped.txt", "gotcha"}});

    auto result = importer_->importMangaArchive(zip);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.value_or("").find("Unsafe entry path"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(targetDir_.path() / "escaped.txt"));
    EXPECT_FALSE(std::filesystem::exists(targetDir_.path().parent_path() / "escaped.txt"));
    EXPECT_TRUE(stagingIsEmpty());
}

TEST_F(ImporterTest, UnsafeIdentifiersNeverBecomePaths) {
    const auto zip = targetDir_.path() / "traversal.zip";
    writeRawZip(zip, {{"metadata.json",
                       R"({"mangaId":"m5","extensionId":"../ext","title":"T","slug":"t"})"},
                      {"chapters/chapter-0001/metadata.json", R"({"chapterId":"c1"})"},
                      {"chapters/chapter-0001/pages/page-0000.jpg", test_support::jpegBytes()}});

    ImportOptions options;
    options.validate = false;
    auto result = importer_->importMangaArchive(zip, options);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(targetRepo_->listManga().empty());
    EXPECT_FALSE(std::filesystem::exists(targetDir_.path() / "ext"));
}

TEST_F(ImporterTest, UnsafeSlugFallsBackToMangaId) {
    const auto zip = targetDir_.path() / "slug.zip";
    writeRawZip(zip, {{"metadata.json",
                       R"({"mangaId":"m5","extensionId":"ext","title":"T","slug":"../up"})"},
                      {"chapters/chapter-0001/metadata.json", R"({"chapterId":"c1"})"},
                      {"chapters/chapter-0001/pages/page-0000.jpg", test_support::jpegBytes()}});

    auto result = importer_->importMangaArchive(zip);
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.mangaSlug, "m5");
    EXPECT_EQ(result.chaptersImported, 1);
    EXPECT_TRUE(target_->isChapterDownloaded("ext", "m5", "c1"));
}
