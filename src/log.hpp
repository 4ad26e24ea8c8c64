#pragma once

#include <filesystem>
#include <fstream>
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Accepts DEBUG, INFO, WARNING, ERROR and CRITICAL in any case.
// Throws InvalidRequestError for anything else.
LogLevel parse_log_level(std::string_view name);

class Logger {
public:
    explicit Logger(std::ostream& out = std::cout, std::ostream& err = std::cerr);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level);
    bool enabled(LogLevel level) const;

    // Sends every following line to a file instead of the console.
    void set_log_file(const std::filesystem::path& path, bool overwrite = false);
    void close_log_file();

    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warning(std::string_view msg);
    void error(std::string_view msg);

private:
    void write(LogLevel level, std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream);
    bool is_tty(const std::ostream& stream) const;

    std::ostream& out_;
    std::ostream& err_;
    std::ofstream file_;
    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mtx;
};
