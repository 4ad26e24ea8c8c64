#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {
    const std::array<std::string, 4> known_keys = {
        DATA_DIR_KEY, LOG_LEVEL_KEY, LOG_FILE_KEY, CHUNK_SIZE_KEY
    };

    std::string trim(const std::string& text) {
        const auto begin = text.find_first_not_of(" \t\r");
        if (begin == std::string::npos) return "";
        const auto end = text.find_last_not_of(" \t\r");
        return text.substr(begin, end - begin + 1);
    }
}

bool is_known_config_key(const std::string& key) {
    return std::find(known_keys.begin(), known_keys.end(), key) != known_keys.end();
}

fs::path default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        throw DsfetchException(get_string("error.config_path_unknown"));
    }
    return fs::path(home) / ".dsfetch" / "dsfetch.conf";
}

Config::Config() : path_(default_config_path()) {}

Config::Config(fs::path path) : path_(std::move(path)) {}

std::optional<std::string> Config::get(const std::string& key) const {
    if (const char* env = std::getenv(key.c_str())) {
        return std::string(env);
    }

    auto values = read_file();
    auto it = values.find(key);
    if (it != values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::string Config::get(const std::string& key, const std::string& fallback) const {
    return get(key).value_or(fallback);
}

std::string Config::require(const std::string& key) const {
    auto value = get(key);
    if (!value) {
        throw DsfetchException(string_format("error.config_key_missing", key, path_.string(), key, key));
    }
    return *value;
}

void Config::set(const std::string& key, const std::optional<std::string>& value) {
    if (key.empty() || key.find('=') != std::string::npos) {
        throw InvalidRequestError(string_format("error.invalid_config_key", key));
    }

    auto values = read_file();
    if (value) {
        values[key] = *value;
    } else {
        values.erase(key);
    }
    write_file(values);
}

std::map<std::string, std::string> Config::read_file() const {
    std::map<std::string, std::string> values;
    std::ifstream file(path_);
    if (!file.is_open()) {
        return values;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        size_t pos = line.find('=');
        if (pos == std::string::npos) continue;
        values[trim(line.substr(0, pos))] = trim(line.substr(pos + 1));
    }
    return values;
}

void Config::write_file(const std::map<std::string, std::string>& values) const {
    if (path_.has_parent_path()) {
        ensure_dir_exists(path_.parent_path());
    }

    fs::path tmp_path = path_.string() + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw FilesystemError(string_format("error.create_file_failed", tmp_path.string()));
        }
        for (const auto& [key, value] : values) {
            file << key << "=" << value << "\n";
        }
        if (!file.flush()) {
            throw FilesystemError(string_format("error.write_file_failed", tmp_path.string()));
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path_, ec);
    if (ec) {
        throw FilesystemError(string_format("error.rename_failed", tmp_path.string(), path_.string()) + ": " + ec.message());
    }
}
