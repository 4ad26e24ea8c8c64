#pragma once

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>

// Destination of the single-line progress display.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void write(const std::string& text) = 0;
    virtual void finish() = 0;
};

// Writes to a stream and flushes after every update, so the line stays
// visible even when the stream is redirected and line buffered.
class StreamProgressSink : public ProgressSink {
public:
    explicit StreamProgressSink(std::ostream& stream = std::cout) : stream_(stream) {}

    void write(const std::string& text) override;
    void finish() override;

private:
    std::ostream& stream_;
};

class NullProgressSink : public ProgressSink {
public:
    void write(const std::string&) override {}
    void finish() override {}
};

struct ProgressSnapshot {
    double current_value = 0;
    std::optional<double> max_value;
    std::string message;
    size_t spinner_index = 0;
};

// Renders "[.....     ] 12.50000 | message" through a ProgressSink.
// Without a (non-zero) maximum only the spinner and message are shown.
// Not thread-safe: drive it from a single transfer.
class ProgressReporter {
public:
    ProgressReporter(ProgressSink& sink, double initial_value, std::optional<double> max_value,
                     std::string message = "", int max_chars = 40, char progress_character = '.',
                     bool spinner = false);

    void update(double current_value);
    void update(double current_value, const std::string& message);
    void increment_by(double delta);
    void increment_by(double delta, const std::string& message);

    // Ends the progress line.
    void finish();

    ProgressSnapshot snapshot() const;

private:
    std::string render() const;

    ProgressSink& sink_;
    double current_value_;
    std::optional<double> max_value_;
    std::string message_;
    int max_chars_;
    char progress_character_;
    bool spinner_;
    size_t spinner_index_ = 0;
};
