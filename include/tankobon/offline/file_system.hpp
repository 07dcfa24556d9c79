#pragma once

#include <nlohmann/json.hpp>
#include <tankobon/core/types.h>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace tankobon::offline::fsutil {

Result<void> ensureDir(const std::filesystem::path& dir);

bool fileExists(const std::filesystem::path& file);

Result<nlohmann::json> readJson(const std::filesystem::path& file);

// Written to "<file>.tmp" and renamed over the target so readers never see a
// half-written document.
Result<void> writeJson(const std::filesystem::path& file, const nlohmann::json& value);

template <typename T> Result<T> readDocument(const std::filesystem::path& file) {
    auto json = readJson(file);
    if (!json) {
        return json.error();
    }
    try {
        return json.value().get<T>();
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, file.string() + ": " + e.what()};
    }
}

template <typename T>
Result<void> writeDocument(const std::filesystem::path& file, const T& document) {
    return writeJson(file, nlohmann::json(document));
}

Result<void> writeBytes(const std::filesystem::path& file, std::span<const std::byte> bytes);

// Recursive byte count; a missing directory counts as 0.
std::uint64_t dirSize(const std::filesystem::path& dir);

std::uint64_t fileSize(const std::filesystem::path& file);

// Removing something that does not exist is success.
Result<void> removeAll(const std::filesystem::path& path);

std::vector<std::string> listFiles(const std::filesystem::path& dir);
std::vector<std::string> listDirs(const std::filesystem::path& dir);

} // namespace tankobon::offline::fsutil
