#pragma once

#include <cstdio>
#include <string>
#include <vector>

void init_localization();
const std::string& get_string(const std::string& key);

namespace l10n_detail {
    inline const char* format_arg(const std::string& value) { return value.c_str(); }

    template<typename T>
    T format_arg(T value) { return value; }
}

// Variadic template for string formatting
template<typename... Args>
std::string string_format(const std::string& format_key, const Args&... args) {
    const std::string& format = get_string(format_key);
    int size = std::snprintf(nullptr, 0, format.c_str(), l10n_detail::format_arg(args)...);
    if (size <= 0) { return format; }
    std::vector<char> buf(static_cast<size_t>(size) + 1);
    std::snprintf(buf.data(), buf.size(), format.c_str(), l10n_detail::format_arg(args)...);
    return std::string(buf.data(), static_cast<size_t>(size));
}
