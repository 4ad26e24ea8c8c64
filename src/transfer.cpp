#include "transfer.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <string>
#include <vector>

std::uint64_t drain(ReadStream& source, std::ostream& sink, size_t chunk_size,
                    std::uint64_t initial_offset, const ProgressCallback& on_progress) {
    if (chunk_size == 0) {
        throw InvalidRequestError(get_string("error.invalid_chunk_size"));
    }

    std::vector<char> buffer(chunk_size);
    std::uint64_t bytes_so_far = initial_offset;

    while (true) {
        size_t count = 0;
        try {
            count = source.read(buffer.data(), buffer.size());
        } catch (const TransportError& e) {
            throw TransferError(string_format("error.read_failed", std::to_string(bytes_so_far)) + ": " + e.what(), bytes_so_far);
        }

        if (count == 0) {
            break;
        }

        sink.write(buffer.data(), static_cast<std::streamsize>(count));
        if (!sink) {
            throw TransferError(string_format("error.write_failed_at", std::to_string(bytes_so_far)), bytes_so_far);
        }

        bytes_so_far += count;
        if (on_progress) {
            on_progress(bytes_so_far);
        }
    }

    return bytes_so_far;
}
