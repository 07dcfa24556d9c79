#pragma once

#include <tankobon/core/types.h>
#include <tankobon/offline/storage_manager.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tankobon::archive {

// What to do when the archived manga is already in offline storage.
enum class ConflictResolution { Skip, Overwrite, Rename };

const char* toString(ConflictResolution resolution);
std::optional<ConflictResolution> parseConflictResolution(std::string_view text);

struct ImportOptions {
    ConflictResolution conflictResolution = ConflictResolution::Skip;
    bool validate = true;
    // (current, total, message); total is always 100.
    std::function<void(int, int, const std::string&)> onProgress;
};

struct ImportResult {
    bool success = false;
    bool skipped = false;
    std::string mangaId;
    std::string extensionId;
    std::string mangaSlug;
    int chaptersImported = 0;
    std::optional<std::string> error;
};

struct ArchiveValidation {
    bool valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::optional<std::string> title;
    std::optional<std::string> extensionId;
    int chapterCount = 0;
};

/**
 * Reads manga ZIP archives in the layout Archiver writes and registers their
 * contents with a StorageManager.
 *
 * Archives are extracted into <dataDir>/.temp first; that staging directory is
 * always removed afterwards. Entries with absolute paths, ".." components or a
 * type other than file or directory make the whole archive unreadable.
 * Identifiers taken from the archive go through the same slug and file name
 * checks as downloads before any path is built from them.
 */
class Importer {
public:
    explicit Importer(std::shared_ptr<offline::StorageManager> storage);

    ArchiveValidation validateArchive(const std::filesystem::path& archivePath) const;

    ImportResult importMangaArchive(const std::filesystem::path& archivePath,
                                    const ImportOptions& options = {}) const;

private:
    std::shared_ptr<offline::StorageManager> storage_;
};

// Extracts a ZIP archive into destDir, refusing unsafe entry paths.
Result<void> extractZip(const std::filesystem::path& archivePath,
                        const std::filesystem::path& destDir);

// Checks an extracted manga archive without touching offline storage.
ArchiveValidation validateExtractedManga(const std::filesystem::path& dir);

} // namespace tankobon::archive
