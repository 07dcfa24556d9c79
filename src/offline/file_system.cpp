#include <spdlog/spdlog.h>
#include <tankobon/offline/file_system.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace tankobon::offline::fsutil {

namespace fs = std::filesystem;

Result<void> ensureDir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Failed to create directory " + dir.string() + ": " + ec.message()};
    }
    return {};
}

bool fileExists(const fs::path& file) {
    std::error_code ec;
    return fs::is_regular_file(file, ec);
}

Result<nlohmann::json> readJson(const fs::path& file) {
    std::ifstream in(file);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open " + file.string()};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    try {
        return nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        return Error{ErrorCode::CorruptedData, file.string() + ": " + e.what()};
    }
}

Result<void> writeJson(const fs::path& file, const nlohmann::json& value) {
    if (auto r = ensureDir(file.parent_path()); !r) {
        return r;
    }

    auto tempPath = file;
    tempPath += ".tmp";
    {
        std::ofstream out(tempPath, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::WriteError, "Cannot open " + tempPath.string()};
        }
        out << value.dump(2);
        out.close();
        if (!out) {
            return Error{ErrorCode::WriteError, "Failed writing " + tempPath.string()};
        }
    }

    std::error_code ec;
    fs::rename(tempPath, file, ec);
    if (ec) {
        fs::remove(tempPath, ec);
        return Error{ErrorCode::WriteError, "Failed to replace " + file.string()};
    }
    return {};
}

Result<void> writeBytes(const fs::path& file, std::span<const std::byte> bytes) {
    if (auto r = ensureDir(file.parent_path()); !r) {
        return r;
    }
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::WriteError, "Cannot open " + file.string()};
    }
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        return Error{ErrorCode::WriteError, "Failed writing " + file.string()};
    }
    return {};
}

std::uint64_t dirSize(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return 0;
    }
    std::uint64_t total = 0;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code sizeEc;
        if (it->is_regular_file(sizeEc)) {
            auto size = it->file_size(sizeEc);
            if (!sizeEc) {
                total += size;
            }
        }
    }
    if (ec) {
        spdlog::debug("fsutil: size walk of {} stopped early: {}", dir.string(), ec.message());
    }
    return total;
}

std::uint64_t fileSize(const fs::path& file) {
    std::error_code ec;
    auto size = fs::file_size(file, ec);
    return ec ? 0 : size;
}

Result<void> removeAll(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Error{ErrorCode::IoError, "Failed to remove " + path.string() + ": " + ec.message()};
    }
    return {};
}

namespace {

template <typename Pred> std::vector<std::string> listEntries(const fs::path& dir, Pred pred) {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (pred(*it, typeEc)) {
            names.push_back(it->path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace

std::vector<std::string> listFiles(const fs::path& dir) {
    return listEntries(dir, [](const fs::directory_entry& e, std::error_code& ec) {
        return e.is_regular_file(ec);
    });
}

std::vector<std::string> listDirs(const fs::path& dir) {
    return listEntries(dir, [](const fs::directory_entry& e, std::error_code& ec) {
        return e.is_directory(ec);
    });
}

} // namespace tankobon::offline::fsutil
