#include "log.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <unistd.h>

Logger::Logger(std::ostream& out, std::ostream& err)
    : out_(out), err_(err) {}

LogLevel parse_log_level(std::string_view name) {
    const std::string upper = to_upper(name);
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::Warning;
    if (upper == "ERROR" || upper == "CRITICAL") return LogLevel::Error;
    throw InvalidRequestError(string_format("error.invalid_log_level", std::string(name)));
}

void Logger::set_level(LogLevel level) {
    level_ = level;
}

bool Logger::enabled(LogLevel level) const {
    return level >= level_;
}

void Logger::set_log_file(const std::filesystem::path& path, bool overwrite) {
    std::lock_guard<std::mutex> lock(mtx);
    if (file_.is_open()) {
        file_.close();
    }
    file_.open(path, overwrite ? std::ios::trunc : std::ios::app);
    if (!file_) {
        throw FilesystemError(string_format("error.open_log_file_failed", path.string()));
    }
}

void Logger::close_log_file() {
    std::lock_guard<std::mutex> lock(mtx);
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::debug(std::string_view msg) {
    write(LogLevel::Debug, get_string("debug.prefix") + " ", COLOR_CYAN, msg, out_);
}

void Logger::info(std::string_view msg) {
    write(LogLevel::Info, get_string("info.log_prefix"), COLOR_GREEN, msg, out_);
}

void Logger::warning(std::string_view msg) {
    write(LogLevel::Warning, get_string("warning.prefix") + " ", COLOR_YELLOW, msg, err_);
}

void Logger::error(std::string_view msg) {
    write(LogLevel::Error, get_string("error.prefix") + " ", COLOR_RED, msg, err_);
}

bool Logger::is_tty(const std::ostream& stream) const {
    if (&stream == &std::cout) {
        return isatty(STDOUT_FILENO);
    } else if (&stream == &std::cerr) {
        return isatty(STDERR_FILENO);
    }
    return false;
}

void Logger::write(LogLevel level, std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
    std::lock_guard<std::mutex> lock(mtx);
    if (level < level_) {
        return;
    }

    if (file_.is_open()) {
        file_ << prefix << msg << std::endl;
        return;
    }

    if (is_tty(stream)) {
        stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
    } else {
        stream << prefix << msg << std::endl;
    }
}
