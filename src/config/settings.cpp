#include <tankobon/config/settings.hpp>

#include <spdlog/spdlog.h>

#include <charconv>
#include <initializer_list>
#include <limits>
#include <string_view>

namespace tankobon::config {

namespace {

class SectionReader {
public:
    SectionReader(const ConfigSections& sections, std::string section)
        : section_(std::move(section)) {
        if (auto it = sections.find(section_); it != sections.end()) {
            values_ = &it->second;
        }
    }

    const std::string* raw(const char* key) const {
        if (!values_) {
            return nullptr;
        }
        auto it = values_->find(key);
        return it == values_->end() ? nullptr : &it->second;
    }

    void string(const char* key, std::string& out) const {
        if (const auto* value = raw(key); value && !value->empty()) {
            out = *value;
        }
    }

    template <typename Int>
    Result<void> integer(const char* key, Int& out, Int min = 0,
                         Int max = std::numeric_limits<Int>::max()) const {
        const auto* value = raw(key);
        if (!value) {
            return {};
        }
        Int parsed{};
        auto [end, ec] = std::from_chars(value->data(), value->data() + value->size(), parsed);
        if (ec != std::errc{} || end != value->data() + value->size()) {
            return invalid(key, *value, "an integer");
        }
        if (parsed < min || parsed > max) {
            return invalid(key, *value, fmt::format("a value between {} and {}", min, max));
        }
        out = parsed;
        return {};
    }

    Result<void> number(const char* key, double& out, double min, double max) const {
        const auto* value = raw(key);
        if (!value) {
            return {};
        }
        double parsed{};
        auto [end, ec] = std::from_chars(value->data(), value->data() + value->size(), parsed);
        if (ec != std::errc{} || end != value->data() + value->size()) {
            return invalid(key, *value, "a number");
        }
        if (parsed < min || parsed > max) {
            return invalid(key, *value, fmt::format("a value between {} and {}", min, max));
        }
        out = parsed;
        return {};
    }

    Result<void> oneOf(const char* key, std::string& out,
                       std::initializer_list<std::string_view> allowed) const {
        const auto* value = raw(key);
        if (!value || value->empty()) {
            return {};
        }
        for (auto candidate : allowed) {
            if (*value == candidate) {
                out = *value;
                return {};
            }
        }
        std::string expected;
        for (auto candidate : allowed) {
            expected += expected.empty() ? "" : ", ";
            expected += candidate;
        }
        return invalid(key, *value, "one of " + expected);
    }

    Result<void> boolean(const char* key, bool& out) const {
        const auto* value = raw(key);
        if (!value) {
            return {};
        }
        if (*value == "true" || *value == "1" || *value == "yes" || *value == "on") {
            out = true;
        } else if (*value == "false" || *value == "0" || *value == "no" || *value == "off") {
            out = false;
        } else {
            return invalid(key, *value, "true or false");
        }
        return {};
    }

private:
    Error invalid(const char* key, const std::string& value, const std::string& expected) const {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("config [{}] {}: expected {}, got '{}'", section_, key,
                                 expected, value)};
    }

    std::string section_;
    const std::map<std::string, std::string>* values_ = nullptr;
};

// Collects the first failure of a run of reads.
class FirstError {
public:
    FirstError& operator<<(Result<void> step) {
        if (!step && ok_) {
            ok_ = false;
            error_ = step.error();
        }
        return *this;
    }
    Result<void> result() const {
        if (ok_) {
            return {};
        }
        return error_;
    }

private:
    bool ok_{true};
    Error error_;
};

bool isKnownLevel(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
           level == "error" || level == "critical" || level == "off";
}

} // namespace

Result<void> applyConfigSections(const ConfigSections& sections, Settings& settings,
                                 const EnvLookup& env) {
    FirstError errors;

    SectionReader core(sections, "core");
    if (const auto* dir = core.raw("data_dir"); dir && !dir->empty()) {
        settings.dataDir = expandTilde(*dir, env);
    }
    if (const auto* db = core.raw("db_path"); db && !db->empty()) {
        settings.dbPath = expandTilde(*db, env);
    }
    core.string("log_level", settings.logLevel);

    SectionReader worker(sections, "worker");
    if (const auto* exe = worker.raw("executable"); exe && !exe->empty()) {
        settings.worker.executable = expandTilde(*exe, env).string();
    }
    errors << worker.boolean("auto_restart", settings.worker.autoRestart)
           << worker.integer("max_restarts", settings.worker.maxRestarts)
           << worker.integer<std::int64_t>("restart_window_ms", settings.worker.restartWindowMs, 1)
           << worker.integer<std::int64_t>("restart_delay_ms", settings.worker.restartDelayMs)
           << worker.integer<std::int64_t>("kill_grace_ms", settings.worker.killGraceMs);

    SectionReader ipc(sections, "ipc");
    errors << ipc.integer<std::int64_t>("ready_timeout_ms", settings.ipc.readyTimeoutMs, 1)
           << ipc.integer<std::int64_t>("start_timeout_ms", settings.ipc.startTimeoutMs, 1)
           << ipc.integer<std::int64_t>("stop_timeout_ms", settings.ipc.stopTimeoutMs, 1)
           << ipc.integer<std::int64_t>("query_timeout_ms", settings.ipc.queryTimeoutMs, 1);

    SectionReader downloads(sections, "downloads");
    auto& dl = settings.downloads;
    errors << downloads.integer("concurrency", dl.concurrency, 1, 32)
           << downloads.integer("page_concurrency", dl.pageConcurrency, 1, 32)
           << downloads.integer<std::int64_t>("polling_interval_ms", dl.pollingIntervalMs, 1)
           << downloads.integer("max_retries", dl.maxRetries, 1, 20)
           << downloads.integer<std::int64_t>("retry_delay_ms", dl.retryDelayMs)
           << downloads.integer<std::int64_t>("page_timeout_ms", dl.pageTimeoutMs, 1)
           << downloads.integer<std::int64_t>("frozen_after_ms", dl.frozenAfterMs, 1)
           << downloads.integer<std::int64_t>("progress_flush_ms", dl.progressFlushMs, 1);

    SectionReader cache(sections, "cache");
    errors << cache.integer<std::int64_t>("max_entries", settings.cache.maxEntries, 1)
           << cache.integer<std::int64_t>("ttl_ms", settings.cache.ttlMs);

    SectionReader storage(sections, "storage");
    auto& st = settings.storage;
    errors << storage.number("max_storage_gb", st.maxStorageGb, 0.0, 1.0e6)
           << storage.boolean("auto_cleanup", st.autoCleanup)
           << storage.oneOf("cleanup_strategy", st.cleanupStrategy,
                            {"oldest", "largest", "least-accessed"})
           << storage.number("cleanup_threshold_percent", st.cleanupThresholdPercent, 0.0,
                             100.0);

    SectionReader catalog(sections, "catalog");
    catalog.string("source", settings.catalog.source);
    catalog.string("extension_id", settings.catalog.extensionId);

    return errors.result();
}

Result<Settings> loadSettings(const SettingsOverrides& overrides, const EnvLookup& env) {
    Settings settings;
    settings.dataDir = dataDir(env);

    bool explicitConfig = true;
    if (overrides.configPath) {
        settings.configPath = expandTilde(*overrides.configPath, env);
    } else if (auto fromEnv = env("TANKOBON_CONFIG")) {
        settings.configPath = expandTilde(*fromEnv, env);
    } else {
        settings.configPath = defaultConfigPath(env);
        explicitConfig = false;
    }

    auto parsed = parseConfigFile(settings.configPath);
    if (parsed) {
        if (auto applied = applyConfigSections(parsed.value(), settings, env); !applied) {
            return applied.error();
        }
        spdlog::debug("Config: loaded {}", settings.configPath.string());
    } else if (explicitConfig) {
        return parsed.error();
    } else {
        settings.configPath.clear();
    }

    if (auto v = env("TANKOBON_DATA_DIR")) {
        settings.dataDir = expandTilde(*v, env);
    }
    if (auto v = env("TANKOBON_WORKER")) {
        settings.worker.executable = *v;
    }
    if (auto v = env("TANKOBON_LOG_LEVEL")) {
        settings.logLevel = *v;
    }

    if (overrides.dataDir) {
        settings.dataDir = expandTilde(*overrides.dataDir, env);
    }
    if (overrides.dbPath) {
        settings.dbPath = expandTilde(*overrides.dbPath, env);
    }
    if (overrides.logLevel) {
        settings.logLevel = *overrides.logLevel;
    }
    if (overrides.workerExecutable) {
        settings.worker.executable = *overrides.workerExecutable;
    }
    if (overrides.catalogSource) {
        settings.catalog.source = *overrides.catalogSource;
    }
    if (overrides.extensionId) {
        settings.catalog.extensionId = *overrides.extensionId;
    }

    if (!isKnownLevel(settings.logLevel)) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Unknown log level '{}'", settings.logLevel)};
    }
    return settings;
}

} // namespace tankobon::config
