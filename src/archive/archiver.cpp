#include <tankobon/archive/archiver.hpp>
#include <tankobon/offline/file_system.hpp>

#include <spdlog/spdlog.h>

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

namespace tankobon::archive {

namespace {

constexpr std::array<std::string_view, 5> kImageExtensions{".jpg", ".jpeg", ".png", ".webp",
                                                           ".gif"};
constexpr std::size_t kCopyBufferSize = 64 * 1024;

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};
struct EntryDeleter {
    void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};

using WriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
using EntryHandle = std::unique_ptr<struct archive_entry, EntryDeleter>;

std::string lastError(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

Error archiveError(struct archive* a, const std::string& what) {
    return Error{ErrorCode::ArchiveError, what + ": " + lastError(a)};
}

Result<void> applyCompression(struct archive* a, int level) {
    level = std::clamp(level, 0, 9);
    if (level == 0) {
        if (archive_write_set_options(a, "zip:compression=store") < ARCHIVE_WARN) {
            return archiveError(a, "Failed to select stored compression");
        }
        return {};
    }
    if (archive_write_set_options(a, "zip:compression=deflate") < ARCHIVE_WARN) {
        return archiveError(a, "Failed to select deflate compression");
    }
    // Older libarchive releases do not know the level option; deflate then
    // runs at its default level.
    const std::string levelOption = "zip:compression-level=" + std::to_string(level);
    if (archive_write_set_options(a, levelOption.c_str()) != ARCHIVE_OK) {
        spdlog::debug("Archiver: compression level {} not supported, using default", level);
    }
    return {};
}

Result<void> appendFile(struct archive* a, const fs::path& source, const std::string& name) {
    std::error_code ec;
    const auto size = fs::file_size(source, ec);
    if (ec) {
        return Error{ErrorCode::FileNotFound, source.string() + ": " + ec.message()};
    }
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Cannot open " + source.string()};
    }

    EntryHandle entry(archive_entry_new());
    archive_entry_set_pathname(entry.get(), name.c_str());
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_mtime(entry.get(), static_cast<time_t>(nowMillis() / 1000), 0);

    if (archive_write_header(a, entry.get()) != ARCHIVE_OK) {
        return archiveError(a, "Failed to write header for " + name);
    }

    std::vector<char> buffer(kCopyBufferSize);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = in.gcount();
        if (got <= 0) {
            break;
        }
        if (archive_write_data(a, buffer.data(), static_cast<std::size_t>(got)) < 0) {
            return archiveError(a, "Failed to write data for " + name);
        }
    }
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Read failed for " + source.string()};
    }
    if (archive_write_finish_entry(a) != ARCHIVE_OK) {
        return archiveError(a, "Failed to finish entry " + name);
    }
    return {};
}

std::string lowerExtension(std::string_view filename) {
    const auto dot = filename.rfind('.');
    if (dot == std::string_view::npos) {
        return {};
    }
    std::string ext(filename.substr(dot));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

ArchiveResult failed(const fs::path& outputPath, const Error& error) {
    spdlog::warn("Archiver: {} failed: {}", outputPath.string(), error.message);
    ArchiveResult result;
    result.outputPath = outputPath;
    result.error = error.message;
    return result;
}

} // namespace

bool isArchivableImage(std::string_view filename) {
    const auto ext = lowerExtension(filename);
    return std::find(kImageExtensions.begin(), kImageExtensions.end(), ext) !=
           kImageExtensions.end();
}

std::string safeArchiveName(std::string_view title) {
    std::string out(title);
    for (auto& c : out) {
        switch (c) {
            case '<':
            case '>':
            case ':':
            case '"':
            case '/':
            case '\\':
            case '|':
            case '?':
            case '*':
                c = '_';
                break;
            default:
                break;
        }
    }
    return out;
}

Archiver::Archiver(fs::path dataDir) : paths_(std::move(dataDir)) {}

Result<void> Archiver::collectPages(const fs::path& pagesDir, const std::string& prefix,
                                    std::vector<Entry>& entries) const {
    if (!fs::is_directory(pagesDir)) {
        return Error{ErrorCode::FileNotFound, "Pages directory missing: " + pagesDir.string()};
    }
    auto files = offline::fsutil::listFiles(pagesDir);
    std::sort(files.begin(), files.end());
    for (const auto& file : files) {
        if (isArchivableImage(file)) {
            entries.push_back({pagesDir / file, prefix + file});
        }
    }
    return {};
}

Result<std::uint64_t> Archiver::writeZip(const fs::path& outputPath,
                                         const std::vector<Entry>& entries,
                                         const ArchiveOptions& options) const {
    if (outputPath.has_parent_path()) {
        if (auto r = offline::fsutil::ensureDir(outputPath.parent_path()); !r) {
            return r.error();
        }
    }

    WriteHandle writer(archive_write_new());
    if (!writer) {
        return Error{ErrorCode::ArchiveError, "archive_write_new failed"};
    }
    if (archive_write_set_format_zip(writer.get()) != ARCHIVE_OK) {
        return archiveError(writer.get(), "Failed to select zip format");
    }
    if (auto r = applyCompression(writer.get(), options.compressionLevel); !r) {
        return r.error();
    }
    if (archive_write_open_filename(writer.get(), outputPath.string().c_str()) != ARCHIVE_OK) {
        return archiveError(writer.get(), "Failed to open " + outputPath.string());
    }

    const int total = static_cast<int>(entries.size());
    int current = 0;
    for (const auto& entry : entries) {
        if (auto r = appendFile(writer.get(), entry.source, entry.name); !r) {
            archive_write_close(writer.get());
            std::error_code ec;
            fs::remove(outputPath, ec);
            return r.error();
        }
        ++current;
        if (options.onProgress) {
            options.onProgress(current, total);
        }
    }

    // The central directory is only written on close; an error here means the
    // file on disk is not a usable zip.
    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        auto err = archiveError(writer.get(), "Failed to finalize " + outputPath.string());
        std::error_code ec;
        fs::remove(outputPath, ec);
        return err;
    }
    writer.reset();

    return offline::fsutil::fileSize(outputPath);
}

ArchiveResult Archiver::archiveChapter(const std::string& extensionId, const std::string& mangaSlug,
                                       const offline::OfflineChapterMetadata& chapter,
                                       const fs::path& outputPath,
                                       const ArchiveOptions& options) const {
    try {
        const auto chapterDir = paths_.chapterDir(extensionId, mangaSlug, chapter.folderName);
        if (!fs::is_directory(chapterDir)) {
            return failed(outputPath, Error{ErrorCode::FileNotFound,
                                            "Chapter directory not found: " + chapterDir.string()});
        }

        std::vector<Entry> entries;
        if (options.includeMetadata) {
            const auto meta =
                paths_.chapterMetadataFile(extensionId, mangaSlug, chapter.folderName);
            if (offline::fsutil::fileExists(meta)) {
                entries.push_back({meta, "metadata.json"});
            }
        }
        if (auto r = collectPages(paths_.pagesDir(extensionId, mangaSlug, chapter.folderName),
                                  "pages/", entries);
            !r) {
            return failed(outputPath, r.error());
        }

        auto written = writeZip(outputPath, entries, options);
        if (!written) {
            return failed(outputPath, written.error());
        }
        spdlog::info("Archiver: wrote {} ({} entries, {} bytes)", outputPath.string(),
                     entries.size(), written.value());
        return ArchiveResult{true, outputPath, written.value(), std::nullopt};
    } catch (const std::exception& e) {
        return failed(outputPath, Error{ErrorCode::IoError, e.what()});
    }
}

ArchiveResult Archiver::archiveManga(const std::string& extensionId,
                                     const offline::OfflineMangaMetadata& manga,
                                     const fs::path& outputPath,
                                     const ArchiveOptions& options) const {
    try {
        const auto mangaDir = paths_.mangaDir(extensionId, manga.slug);
        if (!fs::is_directory(mangaDir)) {
            return failed(outputPath, Error{ErrorCode::FileNotFound,
                                            "Manga directory not found: " + mangaDir.string()});
        }

        std::vector<Entry> entries;
        if (options.includeMetadata) {
            const auto meta = paths_.mangaMetadataFile(extensionId, manga.slug);
            if (offline::fsutil::fileExists(meta)) {
                entries.push_back({meta, "metadata.json"});
            }
        }
        if (options.includeCover && offline::isPlainFilename(manga.coverPath)) {
            const auto cover = paths_.coverFile(extensionId, manga.slug, manga.coverPath);
            if (offline::fsutil::fileExists(cover)) {
                entries.push_back({cover, manga.coverPath});
            }
        }

        for (const auto& chapter : manga.chapters) {
            const std::string prefix = "chapters/" + chapter.folderName + "/";
            if (options.includeMetadata) {
                const auto meta =
                    paths_.chapterMetadataFile(extensionId, manga.slug, chapter.folderName);
                if (offline::fsutil::fileExists(meta)) {
                    entries.push_back({meta, prefix + "metadata.json"});
                }
            }
            const auto pagesDir = paths_.pagesDir(extensionId, manga.slug, chapter.folderName);
            if (!fs::is_directory(pagesDir)) {
                spdlog::warn("Archiver: skipping {} of {}, pages directory missing",
                             chapter.folderName, manga.slug);
                continue;
            }
            if (auto r = collectPages(pagesDir, prefix + "pages/", entries); !r) {
                return failed(outputPath, r.error());
            }
        }

        auto written = writeZip(outputPath, entries, options);
        if (!written) {
            return failed(outputPath, written.error());
        }
        spdlog::info("Archiver: wrote {} ({} chapters, {} bytes)", outputPath.string(),
                     manga.chapters.size(), written.value());
        return ArchiveResult{true, outputPath, written.value(), std::nullopt};
    } catch (const std::exception& e) {
        return failed(outputPath, Error{ErrorCode::IoError, e.what()});
    }
}

std::vector<ArchiveResult> Archiver::archiveBulk(const std::vector<BulkArchiveItem>& items,
                                                 const fs::path& outputDir,
                                                 const ArchiveOptions& options) const {
    std::vector<ArchiveResult> results;
    results.reserve(items.size());
    const auto total = items.size();

    for (std::size_t i = 0; i < total; ++i) {
        const auto& item = items[i];
        const std::string title = item.manga.title.empty() ? item.manga.slug : item.manga.title;
        const auto outputPath = outputDir / (safeArchiveName(title) + ".zip");

        ArchiveOptions itemOptions = options;
        if (options.onProgress) {
            itemOptions.onProgress = [&options, i, total](int current, int itemTotal) {
                const double fraction =
                    itemTotal > 0 ? static_cast<double>(current) / itemTotal : 1.0;
                const int percent = static_cast<int>(
                    std::floor((static_cast<double>(i) + fraction) / static_cast<double>(total) *
                               100.0));
                options.onProgress(percent, 100);
            };
        }

        auto result = archiveManga(item.extensionId, item.manga, outputPath, itemOptions);
        if (!result.success) {
            spdlog::warn("Archiver: bulk item {}/{} ({}) failed, continuing", i + 1, total, title);
        }
        results.push_back(std::move(result));
    }
    return results;
}

std::uint64_t Archiver::estimateArchiveSize(
    const std::string& extensionId, const std::string& mangaSlug,
    const std::vector<offline::OfflineChapterMetadata>& chapters) const {
    std::uint64_t total = 0;
    for (const auto& chapter : chapters) {
        total += chapter.sizeBytes;
        total += offline::fsutil::fileSize(
            paths_.chapterMetadataFile(extensionId, mangaSlug, chapter.folderName));
    }
    return static_cast<std::uint64_t>(std::llround(static_cast<double>(total) * 0.97));
}

} // namespace tankobon::archive
