#pragma once

#include "exception.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_CYAN = "\033[1;36m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Human readable byte count using 1024-based units:
// "0 bytes", "1 byte", "512 bytes", "3 kB", "1.50 MB", ...
std::string format_size(std::uint64_t num);

std::string to_lower(std::string_view text);
std::string to_upper(std::string_view text);
bool is_stdout_tty();

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
void remove_if_exists(const fs::path& path);
// fs::exists that throws FilesystemError when the path cannot be checked
bool path_exists(const fs::path& path);
