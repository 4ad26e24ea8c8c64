#include "progress.hpp"

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {
    constexpr std::array<char, 4> spinner_symbols = {'|', '/', '-', '\\'};
}

void StreamProgressSink::write(const std::string& text) {
    stream_ << text << std::flush;
}

void StreamProgressSink::finish() {
    stream_ << "\n" << std::flush;
}

ProgressReporter::ProgressReporter(ProgressSink& sink, double initial_value, std::optional<double> max_value,
                                   std::string message, int max_chars, char progress_character, bool spinner)
    : sink_(sink),
      current_value_(initial_value),
      max_value_(max_value),
      message_(std::move(message)),
      max_chars_(std::max(0, max_chars)),
      progress_character_(progress_character),
      spinner_(spinner) {
    if (max_value_ && *max_value_ <= 0) {
        max_value_.reset();
    }
}

void ProgressReporter::update(double current_value) {
    current_value_ = current_value;
    sink_.write(render());
    if (spinner_) {
        spinner_index_ = (spinner_index_ + 1) % spinner_symbols.size();
    }
}

void ProgressReporter::update(double current_value, const std::string& message) {
    message_ = message;
    update(current_value);
}

void ProgressReporter::increment_by(double delta) {
    update(current_value_ + delta);
}

void ProgressReporter::increment_by(double delta, const std::string& message) {
    update(current_value_ + delta, message);
}

void ProgressReporter::finish() {
    sink_.finish();
}

ProgressSnapshot ProgressReporter::snapshot() const {
    return {current_value_, max_value_, message_, spinner_index_};
}

std::string ProgressReporter::render() const {
    std::ostringstream line;
    line << "\r[";
    if (!max_value_) {
        line << spinner_symbols[spinner_index_] << "] " << message_ << "   ";
        return line.str();
    }

    const double progress = current_value_ / *max_value_;
    const int num_chars = static_cast<int>(std::clamp(progress, 0.0, 1.0) * max_chars_);
    line << std::string(static_cast<size_t>(num_chars), progress_character_)
         << std::string(static_cast<size_t>(max_chars_ - num_chars), ' ')
         << "] " << std::fixed << std::setprecision(5) << progress * 100.0
         << " " << spinner_symbols[spinner_index_] << " " << message_ << "   ";
    return line.str();
}
