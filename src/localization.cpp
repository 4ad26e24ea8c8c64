#include "localization.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unordered_map>
#include <limits.h> // For PATH_MAX
#include <unistd.h> // For readlink

namespace fs = std::filesystem;

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;

    fs::path get_executable_dir() {
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX);
        if (count != -1) {
            return fs::path(std::string(result, static_cast<size_t>(count))).parent_path();
        }
        std::cerr << "Could not determine executable path via /proc/self/exe. Falling back to current working directory." << std::endl;
        return fs::current_path();
    }

    bool load_strings(const std::string& lang, const fs::path& base_dir) {
        auto file_path = base_dir / (lang + ".txt");
        std::ifstream file(file_path);
        if (!file.is_open()) {
            if (lang != "en") { // Avoid infinite recursion
                std::cerr << "Could not open localization file for " << lang << ", falling back to English." << std::endl;
                return load_strings("en", base_dir);
            }
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty() || line[0] == '#') continue;
            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                translations[line.substr(0, pos)] = line.substr(pos + 1);
            }
        }
        return true;
    }
}

void init_localization() {
    const char* lang_env = std::getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).starts_with("zh")) {
        lang = "zh";
    }

    translations.clear();

    fs::path exec_dir = get_executable_dir();
    for (const auto& dir : {exec_dir / "l10n", exec_dir / ".." / "l10n", fs::path(DSFETCH_L10N_DIR)}) {
        if (fs::is_directory(dir) && load_strings(lang, dir)) {
            return;
        }
    }
    std::cerr << "No localization catalog found, messages will show their keys." << std::endl;
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
