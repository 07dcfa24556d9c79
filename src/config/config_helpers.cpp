#include <tankobon/config/config_helpers.hpp>

#include <fstream>
#include <sstream>

namespace tankobon::config {

std::filesystem::path expandTilde(const std::string& path, const EnvLookup& env) {
    if (path == "~" || path.starts_with("~/")) {
        if (auto home = env("HOME")) {
            return path.size() <= 2 ? std::filesystem::path(*home)
                                    : std::filesystem::path(*home) / path.substr(2);
        }
    }
    return path;
}

ConfigSections parseConfigText(std::string_view text) {
    ConfigSections sections;
    std::string currentSection;
    std::istringstream in{std::string(text)};
    std::string line;

    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);

        // Inline comments, unless the value is quoted.
        if (!value.empty() && value.front() != '"' && value.front() != '\'') {
            if (size_t comment = value.find('#'); comment != std::string::npos) {
                value.erase(comment);
                trim(value);
            }
        } else if (!value.empty()) {
            size_t close = value.find(value.front(), 1);
            if (close != std::string::npos) {
                value.erase(close + 1);
            }
        }

        if (!key.empty()) {
            sections[currentSection][key] = unquote(value);
        }
    }
    return sections;
}

Result<ConfigSections> parseConfigFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open config file: " + path.string()};
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parseConfigText(contents.str());
}

std::filesystem::path configDir(const EnvLookup& env) {
    if (auto xdg = env("XDG_CONFIG_HOME")) {
        return std::filesystem::path(*xdg) / "tankobon";
    }
    if (auto home = env("HOME")) {
        return std::filesystem::path(*home) / ".config" / "tankobon";
    }
    return std::filesystem::current_path() / ".tankobon";
}

std::filesystem::path dataDir(const EnvLookup& env) {
    if (auto xdg = env("XDG_DATA_HOME")) {
        return std::filesystem::path(*xdg) / "tankobon";
    }
    if (auto home = env("HOME")) {
        return std::filesystem::path(*home) / ".local" / "share" / "tankobon";
    }
    return std::filesystem::current_path() / "tankobon_data";
}

std::filesystem::path defaultConfigPath(const EnvLookup& env) {
    return configDir(env) / "config.toml";
}

} // namespace tankobon::config
