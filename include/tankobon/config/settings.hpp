#pragma once

#include <tankobon/config/config_helpers.hpp>
#include <tankobon/core/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace tankobon::config {

struct WorkerSettings {
    std::string executable; // empty: look beside the host binary, then on PATH
    bool autoRestart{true};
    int maxRestarts{5};
    std::int64_t restartWindowMs{60000};
    std::int64_t restartDelayMs{1000};
    std::int64_t killGraceMs{5000};
};

struct IpcSettings {
    std::int64_t readyTimeoutMs{15000};
    std::int64_t startTimeoutMs{10000};
    std::int64_t stopTimeoutMs{5000};
    std::int64_t queryTimeoutMs{5000};
};

struct DownloadSettings {
    int concurrency{3};
    int pageConcurrency{3};
    std::int64_t pollingIntervalMs{1000};
    int maxRetries{3};
    std::int64_t retryDelayMs{1000};
    std::int64_t pageTimeoutMs{30000};
    std::int64_t frozenAfterMs{30000};
    std::int64_t progressFlushMs{1500};
};

struct CacheSettings {
    std::int64_t maxEntries{100};
    std::int64_t ttlMs{300000};
};

struct StorageSettings {
    double maxStorageGb{10.0};
    bool autoCleanup{false};
    std::string cleanupStrategy{"oldest"}; // oldest, largest or least-accessed
    double cleanupThresholdPercent{90.0};
};

struct CatalogSettings {
    std::string source; // directory or http(s):// base URL
    std::string extensionId{"local"};
};

struct Settings {
    std::filesystem::path configPath; // the file that was read, if any
    std::filesystem::path dataDir;
    std::filesystem::path dbPath; // empty: the worker's default inside dataDir
    std::string logLevel{"info"};

    WorkerSettings worker;
    IpcSettings ipc;
    DownloadSettings downloads;
    CacheSettings cache;
    StorageSettings storage;
    CatalogSettings catalog;
};

// Values given on the command line; they win over everything else.
struct SettingsOverrides {
    std::optional<std::string> configPath;
    std::optional<std::string> dataDir;
    std::optional<std::string> dbPath;
    std::optional<std::string> logLevel;
    std::optional<std::string> workerExecutable;
    std::optional<std::string> catalogSource;
    std::optional<std::string> extensionId;
};

/**
 * Resolves the effective settings: command-line flag, then environment
 * (TANKOBON_DATA_DIR, TANKOBON_WORKER, TANKOBON_LOG_LEVEL, TANKOBON_CONFIG),
 * then the config file, then the built-in default.
 *
 * A missing config file is fine unless it was named explicitly. A value
 * that does not parse is an InvalidArgument error naming section and key.
 */
Result<Settings> loadSettings(const SettingsOverrides& overrides = {},
                              const EnvLookup& env = processEnv);

// Applies one parsed file on top of settings; exposed for tests.
Result<void> applyConfigSections(const ConfigSections& sections, Settings& settings,
                                 const EnvLookup& env = processEnv);

} // namespace tankobon::config
