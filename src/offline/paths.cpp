#include <tankobon/offline/paths.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <stdexcept>

namespace tankobon::offline {

namespace {

bool isSlugChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
}

std::string leftPad(std::string s, std::size_t width) {
    if (s.size() < width) {
        s.insert(0, width - s.size(), '0');
    }
    return s;
}

// Leading numeric prefix, as a lenient float parser would read it.
std::optional<double> parseLeadingNumber(std::string_view text) {
    std::size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    if (pos < text.size() && text[pos] == '+') {
        ++pos;
    }
    double value = 0.0;
    const char* first = text.data() + pos;
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::fixed);
    if (ec != std::errc{} || ptr == first || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string toLower(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::string sanitizeSlug(std::string_view input) {
    if (input.find("..") != std::string_view::npos ||
        input.find_first_of("/\\") != std::string_view::npos) {
        throw std::invalid_argument("slug contains path traversal: " + std::string(input));
    }

    std::string slug;
    slug.reserve(input.size());
    for (char raw : input) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
        if (!isSlugChar(c)) {
            c = '-';
        }
        if (c == '-' && (slug.empty() || slug.back() == '-')) {
            continue;
        }
        slug.push_back(c);
    }
    if (slug.size() > kMaxSlugLength) {
        slug.resize(kMaxSlugLength);
    }
    while (!slug.empty() && slug.back() == '-') {
        slug.pop_back();
    }
    if (slug.empty()) {
        throw std::invalid_argument("slug is empty after sanitizing: '" + std::string(input) +
                                    "'");
    }
    return slug;
}

std::string chapterFolderName(std::string_view chapterNumberOrId) {
    if (auto number = parseLeadingNumber(chapterNumberOrId)) {
        const auto whole = static_cast<long long>(std::floor(*number));
        return "chapter-" + leftPad(std::to_string(whole), 4);
    }
    std::string fallback(chapterNumberOrId);
    for (auto& c : fallback) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            c = '-';
        }
    }
    return "chapter-" + fallback;
}

std::string pageFilename(int pageIndex, std::string_view extension) {
    return "page-" + leftPad(std::to_string(pageIndex), 4) + "." + std::string(extension);
}

std::string imageExtension(std::string_view url, std::string_view mimeType) {
    if (!mimeType.empty()) {
        const auto mime = toLower(mimeType);
        if (mime.find("png") != std::string::npos)
            return "png";
        if (mime.find("webp") != std::string::npos)
            return "webp";
        if (mime.find("gif") != std::string::npos)
            return "gif";
        if (mime.find("jpeg") != std::string::npos || mime.find("jpg") != std::string::npos)
            return "jpg";
    }

    auto path = url.substr(0, url.find_first_of("?#"));
    auto slash = path.find_last_of('/');
    auto name = slash == std::string_view::npos ? path : path.substr(slash + 1);
    auto dot = name.find_last_of('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == name.size()) {
        return "jpg";
    }
    auto ext = toLower(name.substr(dot + 1));
    const bool alnum = std::all_of(ext.begin(), ext.end(), [](unsigned char c) {
        return std::isalnum(c) != 0;
    });
    return alnum && ext.size() <= 8 ? ext : "jpg";
}

bool isPlainFilename(std::string_view name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of("/\\") == std::string_view::npos &&
           name.find('\0') == std::string_view::npos;
}

std::filesystem::path PathBuilder::extensionDir(const std::string& extensionId) const {
    return offlineDir() / extensionId;
}

std::filesystem::path PathBuilder::mangaDir(const std::string& extensionId,
                                            const std::string& mangaSlug) const {
    return extensionDir(extensionId) / mangaSlug;
}

std::filesystem::path PathBuilder::chaptersDir(const std::string& extensionId,
                                               const std::string& mangaSlug) const {
    return mangaDir(extensionId, mangaSlug) / "chapters";
}

std::filesystem::path PathBuilder::mangaMetadataFile(const std::string& extensionId,
                                                     const std::string& mangaSlug) const {
    return mangaDir(extensionId, mangaSlug) / "metadata.json";
}

std::filesystem::path PathBuilder::coverFile(const std::string& extensionId,
                                             const std::string& mangaSlug,
                                             const std::string& coverName) const {
    return mangaDir(extensionId, mangaSlug) / coverName;
}

std::filesystem::path PathBuilder::chapterDir(const std::string& extensionId,
                                              const std::string& mangaSlug,
                                              const std::string& folderName) const {
    return chaptersDir(extensionId, mangaSlug) / folderName;
}

std::filesystem::path PathBuilder::chapterMetadataFile(const std::string& extensionId,
                                                       const std::string& mangaSlug,
                                                       const std::string& folderName) const {
    return chapterDir(extensionId, mangaSlug, folderName) / "metadata.json";
}

std::filesystem::path PathBuilder::pagesDir(const std::string& extensionId,
                                            const std::string& mangaSlug,
                                            const std::string& folderName) const {
    return chapterDir(extensionId, mangaSlug, folderName) / "pages";
}

std::filesystem::path PathBuilder::pagePath(const std::string& extensionId,
                                            const std::string& mangaSlug,
                                            const std::string& folderName,
                                            const std::string& filename) const {
    return pagesDir(extensionId, mangaSlug, folderName) / filename;
}

} // namespace tankobon::offline
