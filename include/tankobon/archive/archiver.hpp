#pragma once

#include <tankobon/core/types.h>
#include <tankobon/offline/paths.hpp>
#include <tankobon/offline/types.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tankobon::archive {

struct ArchiveOptions {
    bool includeMetadata = true;
    bool includeCover = true;
    int compressionLevel = 6; // 0 stores, 1-9 deflate
    // (current, total) once per archived entry.
    std::function<void(int, int)> onProgress;
};

struct ArchiveResult {
    bool success = false;
    std::filesystem::path outputPath;
    std::uint64_t sizeBytes = 0;
    std::optional<std::string> error;
};

struct BulkArchiveItem {
    std::string extensionId;
    offline::OfflineMangaMetadata manga;
};

// Pages archived are the .jpg/.jpeg/.png/.webp/.gif files, any case.
bool isArchivableImage(std::string_view filename);

// Title with < > : " / \ | ? * replaced by '_'.
std::string safeArchiveName(std::string_view title);

/**
 * Writes ZIP bundles straight from the offline directory tree.
 *
 * Chapter archives hold metadata.json and pages/<file>. Manga archives hold
 * metadata.json, cover.<ext> and chapters/<folder>/{metadata.json,pages/<file>}.
 *
 * Nothing here throws: every failure is reported through ArchiveResult, and a
 * result only reports success once the archive has been closed and flushed.
 */
class Archiver {
public:
    explicit Archiver(std::filesystem::path dataDir);

    ArchiveResult archiveChapter(const std::string& extensionId, const std::string& mangaSlug,
                                 const offline::OfflineChapterMetadata& chapter,
                                 const std::filesystem::path& outputPath,
                                 const ArchiveOptions& options = {}) const;

    ArchiveResult archiveManga(const std::string& extensionId,
                               const offline::OfflineMangaMetadata& manga,
                               const std::filesystem::path& outputPath,
                               const ArchiveOptions& options = {}) const;

    // One <safe title>.zip per item, written one after another. Progress is
    // reported as (percent, 100) across the whole batch.
    std::vector<ArchiveResult> archiveBulk(const std::vector<BulkArchiveItem>& items,
                                           const std::filesystem::path& outputDir,
                                           const ArchiveOptions& options = {}) const;

    // Recorded chapter sizes plus chapter metadata files, scaled by 0.97.
    std::uint64_t estimateArchiveSize(const std::string& extensionId, const std::string& mangaSlug,
                                      const std::vector<offline::OfflineChapterMetadata>& chapters) const;

private:
    struct Entry {
        std::filesystem::path source;
        std::string name;
    };

    Result<void> collectPages(const std::filesystem::path& pagesDir, const std::string& prefix,
                              std::vector<Entry>& entries) const;
    Result<std::uint64_t> writeZip(const std::filesystem::path& outputPath,
                                   const std::vector<Entry>& entries,
                                   const ArchiveOptions& options) const;

    offline::PathBuilder paths_;
};

} // namespace tankobon::archive
