#pragma once

#include <tankobon/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace tankobon::config {

inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Environment access goes through a lookup so tests can supply their own.
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

inline std::optional<std::string> processEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

// "~/x" becomes "$HOME/x"; anything else is returned unchanged.
std::filesystem::path expandTilde(const std::string& path, const EnvLookup& env = processEnv);

// section -> key -> raw value. Keys before any [section] land under "".
using ConfigSections = std::map<std::string, std::map<std::string, std::string>>;

// Line-oriented "[section]" / "key = value" reader: '#' starts a comment,
// values may be single or double quoted.
ConfigSections parseConfigText(std::string_view text);
Result<ConfigSections> parseConfigFile(const std::filesystem::path& path);

/// $XDG_CONFIG_HOME/tankobon or ~/.config/tankobon
std::filesystem::path configDir(const EnvLookup& env = processEnv);

/// $XDG_DATA_HOME/tankobon or ~/.local/share/tankobon
std::filesystem::path dataDir(const EnvLookup& env = processEnv);

std::filesystem::path defaultConfigPath(const EnvLookup& env = processEnv);

} // namespace tankobon::config
