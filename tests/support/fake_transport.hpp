#pragma once

#include "../../src/exception.hpp"
#include "../../src/progress.hpp"
#include "../../src/transport.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// In-memory ReadStream. Optionally fails once fail_after bytes were served.
class MemoryReadStream : public ReadStream {
public:
    explicit MemoryReadStream(std::string data, std::optional<std::uint64_t> length = std::nullopt,
                              std::optional<size_t> fail_after = std::nullopt)
        : data_(std::move(data)), length_(length), fail_after_(fail_after) {}

    size_t read(char* buffer, size_t size) override {
        if (fail_after_ && pos_ >= *fail_after_) {
            throw TransportError("connection reset by peer");
        }
        size_t limit = data_.size();
        if (fail_after_) {
            limit = std::min(limit, *fail_after_);
        }
        const size_t count = std::min(size, limit - pos_);
        std::memcpy(buffer, data_.data() + pos_, count);
        pos_ += count;
        if (on_read) {
            on_read();
        }
        return count;
    }

    std::optional<std::uint64_t> content_length() const override { return length_; }

    std::function<void()> on_read;

private:
    std::string data_;
    std::optional<std::uint64_t> length_;
    std::optional<size_t> fail_after_;
    size_t pos_ = 0;
};

// Serves one remote file from memory and records how it was asked for it.
class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::string content, bool resumable = true)
        : content_(std::move(content)), resumable_(resumable) {}

    OpenResult open(const Url& url) override {
        ++full_opens;
        opened_urls.push_back(url.text);
        if (fail_open) {
            return OpenResult::failure(TransportError("550 no such file"));
        }
        return OpenResult::success(make_stream(content_));
    }

    bool supports_resume() const override { return resumable_; }

    OpenResult open_resumed(const Url& url, std::uint64_t offset) override {
        if (!resumable_) {
            return Transport::open_resumed(url, offset);
        }
        ++resumed_opens;
        resume_offsets.push_back(offset);
        opened_urls.push_back(url.text);
        if (reject_resume) {
            return OpenResult::failure(TransportError("350 REST not understood", true));
        }
        if (fail_resume_hard) {
            return OpenResult::failure(TransportError("530 login incorrect", false));
        }
        const size_t start = std::min<size_t>(static_cast<size_t>(offset), content_.size());
        return OpenResult::success(make_stream(content_.substr(start)));
    }

    // Fails the next full download after this many bytes.
    std::optional<size_t> fail_after;
    bool announce_length = true;
    bool reject_resume = false;
    bool fail_resume_hard = false;
    bool fail_open = false;
    // Path that must not exist while the body is being streamed.
    std::optional<std::filesystem::path> must_be_absent;
    bool final_seen_during_transfer = false;

    int full_opens = 0;
    int resumed_opens = 0;
    std::vector<std::uint64_t> resume_offsets;
    std::vector<std::string> opened_urls;

private:
    std::unique_ptr<ReadStream> make_stream(const std::string& body) {
        std::optional<std::uint64_t> length;
        if (announce_length) {
            length = body.size();
        }
        auto stream = std::make_unique<MemoryReadStream>(body, length, fail_after);
        fail_after.reset();
        if (must_be_absent) {
            stream->on_read = [this]() {
                if (std::filesystem::exists(*must_be_absent)) {
                    final_seen_during_transfer = true;
                }
            };
        }
        return stream;
    }

    std::string content_;
    bool resumable_;
};

// Captures every progress line in memory.
class RecordingProgressSink : public ProgressSink {
public:
    void write(const std::string& text) override { lines.push_back(text); }
    void finish() override { ++finished; }

    std::vector<std::string> lines;
    int finished = 0;
};
