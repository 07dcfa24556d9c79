#include <tankobon/archive/archiver.hpp>
#include <tankobon/archive/importer.hpp>
#include <tankobon/offline/file_system.hpp>

#include <spdlog/spdlog.h>

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <array>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

namespace tankobon::archive {

using offline::CatalogManga;
using offline::ChapterSummary;
using offline::OfflineChapterMetadata;
using offline::OfflineChapterPages;
using offline::OfflineMangaMetadata;
namespace fsutil = offline::fsutil;

namespace {

constexpr std::array<std::string_view, 4> kCoverExtensions{"jpg", "png", "jpeg", "webp"};

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};
struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};

using ReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using DiskHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

Error archiveError(struct archive* a, const std::string& what) {
    const char* msg = archive_error_string(a);
    return Error{ErrorCode::ArchiveError, what + ": " + (msg ? msg : "unknown libarchive error")};
}

// Relative, no "..", no root. Zip entries use '/' but some writers emit '\\'.
bool isSafeEntryPath(std::string_view name) {
    if (name.empty() || name.front() == '/' || name.front() == '\\') {
        return false;
    }
    if (name.size() > 1 && name[1] == ':') {
        return false;
    }
    std::size_t start = 0;
    while (start <= name.size()) {
        const auto end = name.find_first_of("/\\", start);
        const auto part = name.substr(start, end == std::string_view::npos ? name.npos : end - start);
        if (part == "..") {
            return false;
        }
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return true;
}

// Removes the staging directory on every exit path.
class StagingDir {
public:
    StagingDir(const fs::path& dataDir, const std::string& prefix)
        : path_(dataDir / ".temp" / (prefix + "-" + std::to_string(nowMillis()))) {}
    ~StagingDir() {
        if (auto r = fsutil::removeAll(path_); !r) {
            spdlog::warn("Importer: failed to clean up {}: {}", path_.string(), r.error().message);
        }
    }
    StagingDir(const StagingDir&) = delete;
    StagingDir& operator=(const StagingDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

Result<void> copyInto(const fs::path& source, const fs::path& dest) {
    if (auto r = fsutil::ensureDir(dest.parent_path()); !r) {
        return r.error();
    }
    std::error_code ec;
    fs::copy_file(source, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     "Failed to copy " + source.filename().string() + ": " + ec.message()};
    }
    return {};
}

std::vector<std::string> imageFiles(const fs::path& pagesDir) {
    auto files = fsutil::listFiles(pagesDir);
    files.erase(std::remove_if(files.begin(), files.end(),
                               [](const std::string& f) { return !isArchivableImage(f); }),
                files.end());
    std::sort(files.begin(), files.end());
    return files;
}

std::optional<std::string> findCover(const fs::path& dir, const OfflineMangaMetadata& manga) {
    if (offline::isPlainFilename(manga.coverPath) && fsutil::fileExists(dir / manga.coverPath)) {
        return manga.coverPath;
    }
    for (auto ext : kCoverExtensions) {
        std::string name = "cover.";
        name += ext;
        if (fsutil::fileExists(dir / name)) {
            return name;
        }
    }
    return std::nullopt;
}

CatalogManga toCatalogManga(const OfflineMangaMetadata& doc) {
    CatalogManga manga;
    manga.id = doc.mangaId;
    manga.title = doc.title;
    manga.slug = doc.slug;
    manga.description = doc.description;
    manga.coverUrl = doc.coverUrl;
    manga.authors = doc.authors;
    manga.artists = doc.artists;
    manga.genres = doc.genres;
    manga.tags = doc.tags;
    manga.rating = doc.rating;
    manga.year = doc.year;
    manga.status = doc.status;
    manga.demographic = doc.demographic;
    manga.altTitles = doc.altTitles;
    return manga;
}

ChapterSummary toChapterSummary(const OfflineChapterMetadata& entry) {
    ChapterSummary chapter;
    chapter.id = entry.chapterId;
    chapter.number = entry.number;
    chapter.title = entry.title;
    chapter.volume = entry.volume;
    chapter.publishedAt = entry.publishedAt;
    chapter.languageCode = entry.languageCode;
    chapter.scanlators = entry.scanlators;
    return chapter;
}

Result<std::string> importSlug(const OfflineMangaMetadata& doc) {
    for (const auto* candidate : {&doc.slug, &doc.mangaId}) {
        if (candidate->empty()) {
            continue;
        }
        try {
            return offline::sanitizeSlug(*candidate);
        } catch (const std::invalid_argument& e) {
            spdlog::warn("Importer: rejected slug source '{}': {}", *candidate, e.what());
        }
    }
    return Error{ErrorCode::InvalidData,
                 "Cannot derive a safe directory name for manga " + doc.mangaId};
}

ImportResult importFailed(std::string message) {
    spdlog::warn("Importer: {}", message);
    ImportResult result;
    result.error = std::move(message);
    return result;
}

std::string joined(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ", ";
        }
        out += item;
    }
    return out;
}

} // namespace

const char* toString(ConflictResolution resolution) {
    switch (resolution) {
        case ConflictResolution::Skip:
            return "skip";
        case ConflictResolution::Overwrite:
            return "overwrite";
        case ConflictResolution::Rename:
            return "rename";
    }
    return "skip";
}

std::optional<ConflictResolution> parseConflictResolution(std::string_view text) {
    if (text == "skip") {
        return ConflictResolution::Skip;
    }
    if (text == "overwrite") {
        return ConflictResolution::Overwrite;
    }
    if (text == "rename") {
        return ConflictResolution::Rename;
    }
    return std::nullopt;
}

Result<void> extractZip(const fs::path& archivePath, const fs::path& destDir) {
    ReadHandle reader(archive_read_new());
    DiskHandle disk(archive_write_disk_new());
    if (!reader || !disk) {
        return Error{ErrorCode::ArchiveError, "Failed to allocate libarchive handles"};
    }
    archive_read_support_format_zip(reader.get());
    // Entry paths are checked below before destDir is prepended, so the
    // absolute-path guard would reject every entry.
    archive_write_disk_set_options(disk.get(), ARCHIVE_EXTRACT_TIME |
                                                   ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                                   ARCHIVE_EXTRACT_SECURE_SYMLINKS);

    if (archive_read_open_filename(reader.get(), archivePath.string().c_str(), 10240) !=
        ARCHIVE_OK) {
        return archiveError(reader.get(), "Failed to open archive " + archivePath.string());
    }
    if (auto r = fsutil::ensureDir(destDir); !r) {
        return r.error();
    }

    struct archive_entry* entry = nullptr;
    int status = ARCHIVE_OK;
    while ((status = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK) {
        const char* rawName = archive_entry_pathname(entry);
        const std::string name = rawName ? rawName : "";
        if (!isSafeEntryPath(name)) {
            return Error{ErrorCode::ArchiveError, "Unsafe entry path in archive: " + name};
        }
        const auto type = archive_entry_filetype(entry);
        if (type != AE_IFREG && type != AE_IFDIR) {
            return Error{ErrorCode::ArchiveError, "Unsupported entry type in archive: " + name};
        }

        const auto target = (destDir / name).string();
        archive_entry_set_pathname(entry, target.c_str());
        if (archive_write_header(disk.get(), entry) != ARCHIVE_OK) {
            return archiveError(disk.get(), "Failed to extract " + name);
        }
        if (archive_entry_size(entry) > 0) {
            const void* buff = nullptr;
            size_t size = 0;
            la_int64_t offset = 0;
            int r = ARCHIVE_OK;
            while ((r = archive_read_data_block(reader.get(), &buff, &size, &offset)) ==
                   ARCHIVE_OK) {
                if (archive_write_data_block(disk.get(), buff, size, offset) != ARCHIVE_OK) {
                    return archiveError(disk.get(), "Failed to write " + name);
                }
            }
            if (r != ARCHIVE_EOF) {
                return archiveError(reader.get(), "Failed to read " + name);
            }
        }
        if (archive_write_finish_entry(disk.get()) != ARCHIVE_OK) {
            return archiveError(disk.get(), "Failed to finish " + name);
        }
    }
    if (status != ARCHIVE_EOF) {
        return archiveError(reader.get(), "Failed to read archive " + archivePath.string());
    }
    if (archive_write_close(disk.get()) != ARCHIVE_OK) {
        return archiveError(disk.get(), "Failed to finish extraction");
    }
    return {};
}

ArchiveValidation validateExtractedManga(const fs::path& dir) {
    ArchiveValidation v;
    const auto metadataFile = dir / "metadata.json";
    if (!fsutil::fileExists(metadataFile)) {
        v.errors.push_back("Missing metadata.json file");
        return v;
    }
    auto doc = fsutil::readDocument<OfflineMangaMetadata>(metadataFile);
    if (!doc) {
        v.errors.push_back("Failed to parse metadata.json: " + doc.error().message);
        return v;
    }
    const auto& manga = doc.value();
    if (manga.title.empty() || manga.mangaId.empty() || manga.extensionId.empty()) {
        v.errors.push_back("Invalid metadata.json: missing required fields");
    } else if (!offline::isPlainFilename(manga.extensionId)) {
        v.errors.push_back("Invalid metadata.json: unsafe extension id");
    }
    v.title = manga.title;
    v.extensionId = manga.extensionId;

    const auto chaptersDir = dir / "chapters";
    if (!fs::is_directory(chaptersDir)) {
        v.warnings.push_back("No chapters directory found");
        v.valid = v.errors.empty();
        return v;
    }

    auto folders = fsutil::listDirs(chaptersDir);
    std::sort(folders.begin(), folders.end());
    for (const auto& folder : folders) {
        const auto chapterDir = chaptersDir / folder;
        if (!fsutil::fileExists(chapterDir / "metadata.json")) {
            v.warnings.push_back("Chapter " + folder + ": missing metadata.json");
            continue;
        }
        if (!fs::is_directory(chapterDir / "pages")) {
            v.warnings.push_back("Chapter " + folder + ": missing pages directory");
            continue;
        }
        if (imageFiles(chapterDir / "pages").empty()) {
            v.warnings.push_back("Chapter " + folder + ": no image files found");
            continue;
        }
        ++v.chapterCount;
    }
    if (v.chapterCount == 0) {
        v.errors.push_back("No valid chapters found in archive");
    }
    v.valid = v.errors.empty();
    return v;
}

Importer::Importer(std::shared_ptr<offline::StorageManager> storage)
    : storage_(std::move(storage)) {
    if (!storage_) {
        throw std::invalid_argument("Importer requires a storage manager");
    }
}

ArchiveValidation Importer::validateArchive(const fs::path& archivePath) const {
    StagingDir staging(storage_->paths().dataDir(), "validate");
    if (auto r = extractZip(archivePath, staging.path()); !r) {
        ArchiveValidation v;
        v.errors.push_back("Failed to extract archive: " + r.error().message);
        return v;
    }
    return validateExtractedManga(staging.path());
}

ImportResult Importer::importMangaArchive(const fs::path& archivePath,
                                          const ImportOptions& options) const {
    auto progress = [&](int current, const std::string& message) {
        if (options.onProgress) {
            options.onProgress(current, 100, message);
        }
    };
    const auto& paths = storage_->paths();
    StagingDir staging(paths.dataDir(), "import");

    progress(0, "Extracting archive...");
    if (auto r = extractZip(archivePath, staging.path()); !r) {
        return importFailed(r.error().message);
    }

    if (options.validate) {
        progress(10, "Validating archive structure...");
        auto validation = validateExtractedManga(staging.path());
        if (!validation.valid) {
            return importFailed("Archive validation failed: " + joined(validation.errors));
        }
    }

    auto read = fsutil::readDocument<OfflineMangaMetadata>(staging.path() / "metadata.json");
    if (!read) {
        return importFailed(read.error().message);
    }
    auto doc = std::move(read).value();
    if (doc.mangaId.empty() || !offline::isPlainFilename(doc.extensionId)) {
        return importFailed("Archive metadata has no usable manga or extension id");
    }
    auto slug = importSlug(doc);
    if (!slug) {
        return importFailed(slug.error().message);
    }

    ImportResult result;
    result.extensionId = doc.extensionId;
    result.mangaId = doc.mangaId;
    result.mangaSlug = slug.value();

    const bool known = storage_->isMangaDownloaded(doc.extensionId, doc.mangaId);
    const bool occupied = fs::exists(paths.mangaDir(doc.extensionId, result.mangaSlug));
    if (known || occupied) {
        switch (options.conflictResolution) {
            case ConflictResolution::Skip:
                spdlog::info("Importer: {}/{} already present, skipping", doc.extensionId,
                             result.mangaSlug);
                result.success = true;
                result.skipped = true;
                return result;
            case ConflictResolution::Overwrite: {
                auto removed =
                    known ? storage_->deleteManga(doc.extensionId, doc.mangaId)
                          : fsutil::removeAll(paths.mangaDir(doc.extensionId, result.mangaSlug));
                if (!removed) {
                    return importFailed("Cannot replace existing manga: " +
                                        removed.error().message);
                }
                // A different manga may still own the slug directory.
                if (auto r = fsutil::removeAll(paths.mangaDir(doc.extensionId, result.mangaSlug));
                    !r) {
                    return importFailed(r.error().message);
                }
                break;
            }
            case ConflictResolution::Rename: {
                // Rows are keyed by (extension, manga id), so the copy gets its own id too.
                const auto suffix = "-" + std::to_string(nowMillis());
                result.mangaSlug += suffix;
                result.mangaId += suffix;
                break;
            }
        }
    }
    doc.mangaId = result.mangaId;
    doc.slug = result.mangaSlug;

    progress(20, "Importing manga metadata...");
    std::optional<std::string> coverFile;
    if (auto cover = findCover(staging.path(), doc)) {
        if (auto r = copyInto(staging.path() / *cover,
                              paths.coverFile(doc.extensionId, result.mangaSlug, *cover));
            r) {
            coverFile = *cover;
        } else {
            spdlog::warn("Importer: cover not imported: {}", r.error().message);
        }
    }
    auto prepared =
        storage_->prepareManga(doc.extensionId, toCatalogManga(doc), result.mangaSlug, coverFile);
    if (!prepared) {
        if (auto r = fsutil::removeAll(paths.mangaDir(doc.extensionId, result.mangaSlug)); !r) {
            spdlog::warn("Importer: {}", r.error().message);
        }
        return importFailed(prepared.error().message);
    }

    auto rollback = [&](std::string message) {
        if (auto r = storage_->deleteManga(doc.extensionId, result.mangaId); !r) {
            spdlog::warn("Importer: rollback of {} failed: {}", result.mangaSlug,
                         r.error().message);
        }
        return importFailed(std::move(message));
    };

    const auto chaptersDir = staging.path() / "chapters";
    auto folders = fsutil::listDirs(chaptersDir);
    std::sort(folders.begin(), folders.end());
    const int total = static_cast<int>(folders.size());
    for (int i = 0; i < total; ++i) {
        const auto& folder = folders[static_cast<std::size_t>(i)];
        progress(20 + i * 70 / total,
                 "Importing chapter " + std::to_string(i + 1) + "/" + std::to_string(total) +
                     "...");
        const auto source = chaptersDir / folder;
        if (!offline::isPlainFilename(folder) ||
            !fsutil::fileExists(source / "metadata.json")) {
            continue;
        }
        auto pages = fsutil::readDocument<OfflineChapterPages>(source / "metadata.json");
        if (!pages) {
            spdlog::warn("Importer: skipping chapter {}: {}", folder, pages.error().message);
            continue;
        }
        const auto images = imageFiles(source / "pages");
        if (images.empty()) {
            continue;
        }

        auto& chapterDoc = pages.value();
        ChapterSummary summary;
        summary.id = chapterDoc.chapterId.empty() ? folder : chapterDoc.chapterId;
        auto entry = std::find_if(doc.chapters.begin(), doc.chapters.end(), [&](const auto& c) {
            return c.chapterId == chapterDoc.chapterId || c.folderName == folder;
        });
        if (entry != doc.chapters.end() && !entry->chapterId.empty()) {
            summary = toChapterSummary(*entry);
        }
        chapterDoc.chapterId = summary.id;
        chapterDoc.folderName = folder;
        chapterDoc.mangaId = result.mangaId;
        const auto destPages = paths.pagesDir(doc.extensionId, result.mangaSlug, folder);
        for (const auto& image : images) {
            if (auto r = copyInto(source / "pages" / image, destPages / image); !r) {
                return rollback(r.error().message);
            }
        }
        if (auto r = fsutil::writeDocument(
                paths.chapterMetadataFile(doc.extensionId, result.mangaSlug, folder), chapterDoc);
            !r) {
            return rollback(r.error().message);
        }
        if (auto r = storage_->commitChapter(doc.extensionId, result.mangaSlug, summary,
                                             chapterDoc);
            !r) {
            return rollback(r.error().message);
        }
        ++result.chaptersImported;
    }

    progress(100, "Import complete!");
    spdlog::info("Importer: imported {}/{} with {} chapters", doc.extensionId, result.mangaSlug,
                 result.chaptersImported);
    result.success = true;
    return result;
}

} // namespace tankobon::archive
