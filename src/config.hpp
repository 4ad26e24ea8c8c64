#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

// Keys understood by dsfetch
inline const std::string DATA_DIR_KEY = "DSFETCH_DATA_DIR";
inline const std::string LOG_LEVEL_KEY = "DSFETCH_LOG_LEVEL";
inline const std::string LOG_FILE_KEY = "DSFETCH_LOG_FILE";
inline const std::string CHUNK_SIZE_KEY = "DSFETCH_CHUNK_SIZE";

bool is_known_config_key(const std::string& key);

// $HOME/.dsfetch/dsfetch.conf
std::filesystem::path default_config_path();

// Preferences from the environment first, then from a key=value file.
class Config {
public:
    Config();
    explicit Config(std::filesystem::path path);

    std::optional<std::string> get(const std::string& key) const;
    std::string get(const std::string& key, const std::string& fallback) const;
    std::string require(const std::string& key) const;

    // std::nullopt removes the key
    void set(const std::string& key, const std::optional<std::string>& value);

    const std::filesystem::path& path() const { return path_; }

private:
    std::map<std::string, std::string> read_file() const;
    void write_file(const std::map<std::string, std::string>& values) const;

    std::filesystem::path path_;
};
