#include "utils.hpp"

#include "localization.hpp"

#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace {
    struct SizeUnit {
        std::string_view name;
        int decimals;
    };

    constexpr std::array<SizeUnit, 6> size_units = {{
        {"bytes", 0}, {"kB", 0}, {"MB", 2}, {"GB", 2}, {"TB", 2}, {"PB", 2}
    }};
}

std::string format_size(std::uint64_t num) {
    if (num == 0) return "0 bytes";
    if (num == 1) return "1 byte";

    // Largest unit whose quotient is still >= 1
    size_t exponent = 0;
    std::uint64_t divisor = 1;
    while (exponent + 1 < size_units.size() && num / divisor >= 1024) {
        divisor *= 1024;
        ++exponent;
    }

    const auto& unit = size_units[exponent];
    std::ostringstream out;
    out << std::fixed << std::setprecision(unit.decimals)
        << static_cast<double>(num) / static_cast<double>(divisor) << " " << unit.name;
    return out.str();
}

std::string to_lower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string to_upper(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool is_stdout_tty() {
    static const bool tty = isatty(STDOUT_FILENO);
    return tty;
}

void ensure_dir_exists(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (!fs::create_directories(path, ec) && ec) {
            throw FilesystemError(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path, ec)) {
        throw FilesystemError(string_format("error.path_not_dir", path.string()));
    }
}

bool path_exists(const fs::path& path) {
    std::error_code ec;
    const bool exists = fs::exists(path, ec);
    if (ec) {
        throw FilesystemError(string_format("error.status_failed", path.string()) + ": " + ec.message());
    }
    return exists;
}

void remove_if_exists(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw FilesystemError(string_format("error.remove_failed", path.string()) + ": " + ec.message());
    }
}
