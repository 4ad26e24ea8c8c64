#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>

// Pull-style byte source. read() returns 0 at end of stream and throws
// TransportError when the underlying connection fails.
class ReadStream {
public:
    virtual ~ReadStream() = default;
    virtual size_t read(char* buffer, size_t size) = 0;
    // Bytes the transport announced for this stream, if it announced any.
    virtual std::optional<std::uint64_t> content_length() const = 0;
};

using ProgressCallback = std::function<void(std::uint64_t bytes_so_far)>;

// Copies source into sink in chunks of at most chunk_size bytes until a
// zero-length read. The callback receives the running total, which starts
// at initial_offset, after every non-empty chunk. Returns that total.
// Throws TransferError on read or write failure; bytes already written stay
// in the sink.
std::uint64_t drain(ReadStream& source, std::ostream& sink, size_t chunk_size,
                    std::uint64_t initial_offset, const ProgressCallback& on_progress = nullptr);
