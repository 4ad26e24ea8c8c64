#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

class DsfetchException : public std::runtime_error {
public:
    explicit DsfetchException(const std::string& message)
        : std::runtime_error(message) {}
};

// Malformed URL, unsupported scheme or an unusable request parameter.
class InvalidRequestError : public DsfetchException {
public:
    explicit InvalidRequestError(const std::string& message)
        : DsfetchException(message) {}
};

class FilesystemError : public DsfetchException {
public:
    explicit FilesystemError(const std::string& message)
        : DsfetchException(message) {}
};

// Network-level failure. retry_without_resume() is only set for failures of
// the resume exchange, where a single full download may be attempted instead.
class TransportError : public DsfetchException {
public:
    explicit TransportError(const std::string& message, bool retry_without_resume = false)
        : DsfetchException(message), retry_without_resume_(retry_without_resume) {}

    bool retry_without_resume() const { return retry_without_resume_; }

private:
    bool retry_without_resume_;
};

// A chunked copy was aborted. bytes_transferred() includes the initial offset.
class TransferError : public DsfetchException {
public:
    TransferError(const std::string& message, std::uint64_t bytes_transferred)
        : DsfetchException(message), bytes_transferred_(bytes_transferred) {}

    std::uint64_t bytes_transferred() const { return bytes_transferred_; }

private:
    std::uint64_t bytes_transferred_;
};

class ChecksumMismatchError : public DsfetchException {
public:
    ChecksumMismatchError(const std::string& message, std::string expected, std::string actual)
        : DsfetchException(message), expected_(std::move(expected)), actual_(std::move(actual)) {}

    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};
