#include "fetcher.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

ResumableFetcher::ResumableFetcher(Logger& logger, const TransportSet& transports, ProgressSink& progress)
    : logger_(logger), transports_(transports), progress_(progress) {}

fs::path ResumableFetcher::fetch(DownloadRequest request) {
    if (request.chunk_size == 0) {
        throw InvalidRequestError(get_string("error.invalid_chunk_size"));
    }
    if (request.expected_checksum) {
        digest_algorithm_for(*request.expected_checksum);
    }

    const Url url = parse_url(request.url);
    Transport* transport = transports_.find(url.scheme);
    if (!transport) {
        throw InvalidRequestError(string_format("error.unsupported_scheme", url.scheme, request.url));
    }

    TransferState state = resolve_destination(request, url);
    if (short_circuit_existing(request, state)) {
        return state.final_path;
    }

    state.started = std::chrono::steady_clock::now();
    logger_.info(string_format("info.downloading_from", request.url));

    bool resumed = false;
    OpenResult opened = open_transfer(request, url, *transport, state, resumed);
    transfer(request, *opened.stream, state, resumed);
    opened.stream.reset();

    if (request.expected_checksum) {
        verify(request, state);
    }
    finalize(state);

    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - state.started).count();
    logger_.info(string_format("info.download_done", std::to_string(seconds), std::to_string(seconds / 60)));
    return state.final_path;
}

TransferState ResumableFetcher::resolve_destination(const DownloadRequest& request, const Url& url) const {
    ensure_dir_exists(request.destination_dir);

    std::error_code ec;
    fs::path directory = fs::absolute(request.destination_dir, ec);
    if (ec) {
        throw FilesystemError(string_format("error.resolve_path_failed", request.destination_dir.string()) + ": " + ec.message());
    }

    directory = directory.lexically_normal();
    if (request.mirror_layout) {
        // Keep the remote folder structure below the destination
        const fs::path remote_dir = fs::path(url.directory).relative_path();
        for (const auto& part : remote_dir) {
            if (part == "..") {
                throw InvalidRequestError(string_format("error.url_unsafe_path", request.url));
            }
        }
        directory = (directory / remote_dir).lexically_normal();
        ensure_dir_exists(directory);
    }

    TransferState state;
    state.final_path = directory / url.file_name;
    state.temp_path = state.final_path;
    state.temp_path += PART_SUFFIX;
    return state;
}

bool ResumableFetcher::short_circuit_existing(const DownloadRequest& request, const TransferState& state) const {
    if (path_exists(state.final_path)) {
        if (!request.overwrite) {
            logger_.debug(string_format("debug.already_present", state.final_path.string()));
            return true;
        }
        remove_if_exists(state.final_path);
    }
    if (request.overwrite && path_exists(state.temp_path)) {
        remove_if_exists(state.temp_path);
    }
    return false;
}

OpenResult ResumableFetcher::open_transfer(const DownloadRequest& request, const Url& url, Transport& transport,
                                           TransferState& state, bool& resumed) {
    bool resume = request.resume && path_exists(state.temp_path);
    if (resume && !transport.supports_resume()) {
        logger_.info(string_format("info.resume_unsupported", url.scheme));
        resume = false;
    }

    if (resume) {
        std::error_code ec;
        const auto offset = fs::file_size(state.temp_path, ec);
        if (ec) {
            throw FilesystemError(string_format("error.stat_failed", state.temp_path.string()) + ": " + ec.message());
        }
        if (request.verbosity > 1) {
            logger_.info(string_format("info.resume_request", url.host, url.directory, url.file_name, std::to_string(offset)));
        }

        OpenResult opened = transport.open_resumed(url, offset);
        if (opened) {
            state.bytes_so_far = offset;
            resumed = true;
            return opened;
        }
        if (!opened.error->retry_without_resume()) {
            throw TransportError(string_format("error.fetch_failed", request.url, state.final_path.string()) + ": " + opened.error->what());
        }

        // One full download, never another resume attempt
        logger_.warning(string_format("warning.resume_failed", request.url));
        if (request.verbosity > 0) {
            logger_.info(opened.error->what());
        }
    } else if (request.verbosity > 1) {
        logger_.info(string_format("info.full_request", url.scheme, request.url));
    }

    state.bytes_so_far = 0;
    resumed = false;
    OpenResult opened = transport.open(url);
    if (!opened) {
        throw TransportError(string_format("error.fetch_failed", request.url, state.final_path.string()) + ": " + opened.error->what());
    }
    return opened;
}

void ResumableFetcher::transfer(const DownloadRequest& request, ReadStream& stream, TransferState& state, bool append) {
    const std::uint64_t offset = state.bytes_so_far;
    if (auto length = stream.content_length()) {
        // Trusted as announced; file:// may report the whole file again after a restart
        state.total_size = *length + offset;
        logger_.info(string_format("info.download_size", format_size(*state.total_size)));
    } else if (request.verbosity > 0) {
        logger_.info(get_string("info.size_unknown"));
    }

    std::ofstream file(state.temp_path, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
    if (!file) {
        throw FilesystemError(string_format("error.create_file_failed", state.temp_path.string()));
    }

    std::optional<double> max_value;
    if (state.total_size && *state.total_size > 0) {
        max_value = static_cast<double>(*state.total_size);
    }
    ProgressReporter progress(progress_, static_cast<double>(offset), max_value,
                              get_string("info.progress_starting"), 40, '.', true);

    try {
        state.bytes_so_far = drain(stream, file, request.chunk_size, offset, [&](std::uint64_t bytes) {
            state.bytes_so_far = bytes;
            progress.update(static_cast<double>(bytes), progress_message(state, offset));
        });
    } catch (const TransferError& e) {
        progress.finish();
        file.close();
        logger_.info(string_format("info.partial_kept", state.temp_path.string(), format_size(e.bytes_transferred())));
        throw TransferError(string_format("error.transfer_aborted", request.url, state.temp_path.string(),
                                          std::to_string(e.bytes_transferred())) + ": " + e.what(),
                            e.bytes_transferred());
    }
    progress.finish();

    file.close();
    if (file.fail()) {
        throw FilesystemError(string_format("error.write_file_failed", state.temp_path.string()));
    }
}

void ResumableFetcher::verify(const DownloadRequest& request, const TransferState& state) {
    const std::string expected = to_lower(*request.expected_checksum);
    const std::string actual = calculate_digest(state.temp_path, digest_algorithm_for(expected));
    if (actual == expected) {
        return;
    }

    remove_if_exists(state.temp_path);
    throw ChecksumMismatchError(string_format("error.checksum_mismatch", state.final_path.filename().string(), expected, actual),
                                expected, actual);
}

void ResumableFetcher::finalize(const TransferState& state) {
    std::error_code ec;
    fs::rename(state.temp_path, state.final_path, ec);
    if (ec) {
        throw FilesystemError(string_format("error.rename_failed", state.temp_path.string(), state.final_path.string()) + ": " + ec.message());
    }
}

std::string ResumableFetcher::progress_message(const TransferState& state, std::uint64_t offset) const {
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.started).count();
    const std::uint64_t rate = (elapsed > 0)
        ? static_cast<std::uint64_t>(static_cast<double>(state.bytes_so_far - offset) / elapsed)
        : 0;
    return string_format("info.progress_message", format_size(state.bytes_so_far), format_size(rate));
}
