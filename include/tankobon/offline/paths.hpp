#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace tankobon::offline {

inline constexpr std::size_t kMaxSlugLength = 200;

/**
 * Filesystem-safe slug: lowercase, anything outside [a-z0-9-] becomes '-',
 * runs of '-' collapse, leading/trailing '-' are trimmed, capped at
 * kMaxSlugLength.
 *
 * Slugs are joined straight into paths, so input carrying traversal
 * sequences ("..", '/', '\\') is rejected instead of repaired, as is input
 * that collapses to nothing. Titles such as "Hello...World" or "Fate/Zero"
 * are therefore rejected; the download queue then falls back to slugging the
 * manga id, so callers deriving directory names should do the same.
 *
 * @throws std::invalid_argument
 */
std::string sanitizeSlug(std::string_view input);

/// "chapter-0001" from the floor of a numeric chapter number; non-numeric
/// input falls back to "chapter-" + input with non-alphanumerics as '-'.
std::string chapterFolderName(std::string_view chapterNumberOrId);

/// "page-0007.png"
std::string pageFilename(int pageIndex, std::string_view extension = "jpg");

/// Extension (no dot) from the response MIME type, then the URL path, else "jpg".
std::string imageExtension(std::string_view url, std::string_view mimeType = {});

/// True when name is a single path component (no separators, not "." or "..").
bool isPlainFilename(std::string_view name);

/**
 * Canonical on-disk layout:
 *
 *   <dataDir>/offline/<extensionId>/<mangaSlug>/
 *       metadata.json
 *       cover.<ext>
 *       chapters/<chapter-NNNN>/
 *           metadata.json
 *           pages/page-NNNN.<ext>
 */
class PathBuilder {
public:
    explicit PathBuilder(std::filesystem::path dataDir) : dataDir_(std::move(dataDir)) {}

    const std::filesystem::path& dataDir() const { return dataDir_; }
    std::filesystem::path offlineDir() const { return dataDir_ / "offline"; }

    std::filesystem::path extensionDir(const std::string& extensionId) const;
    std::filesystem::path mangaDir(const std::string& extensionId,
                                   const std::string& mangaSlug) const;
    std::filesystem::path chaptersDir(const std::string& extensionId,
                                      const std::string& mangaSlug) const;
    std::filesystem::path mangaMetadataFile(const std::string& extensionId,
                                            const std::string& mangaSlug) const;
    std::filesystem::path coverFile(const std::string& extensionId, const std::string& mangaSlug,
                                    const std::string& coverName = "cover.jpg") const;

    std::filesystem::path chapterDir(const std::string& extensionId, const std::string& mangaSlug,
                                     const std::string& folderName) const;
    std::filesystem::path chapterMetadataFile(const std::string& extensionId,
                                              const std::string& mangaSlug,
                                              const std::string& folderName) const;
    std::filesystem::path pagesDir(const std::string& extensionId, const std::string& mangaSlug,
                                   const std::string& folderName) const;
    std::filesystem::path pagePath(const std::string& extensionId, const std::string& mangaSlug,
                                   const std::string& folderName,
                                   const std::string& filename) const;

private:
    std::filesystem::path dataDir_;
};

} // namespace tankobon::offline
