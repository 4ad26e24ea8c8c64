#pragma once

#include "log.hpp"
#include "progress.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

inline constexpr std::string_view PART_SUFFIX = ".part";
inline constexpr size_t DEFAULT_CHUNK_SIZE = 8192;

struct DownloadRequest {
    std::string url;
    std::filesystem::path destination_dir;
    bool resume = true;
    bool overwrite = false;
    std::optional<std::string> expected_checksum;  // hex MD5 or SHA256
    size_t chunk_size = DEFAULT_CHUNK_SIZE;
    int verbosity = 0;  // > 0 logs extra detail at info level
    bool mirror_layout = false;  // place the file under destination_dir/<url directory>/
};

// Owned by a single fetch() call.
struct TransferState {
    std::filesystem::path final_path;
    std::filesystem::path temp_path;  // final_path + PART_SUFFIX
    std::uint64_t bytes_so_far = 0;
    std::optional<std::uint64_t> total_size;
    std::chrono::steady_clock::time_point started;
};

// Downloads one URL into a directory through "<name>.part", resuming an
// interrupted FTP transfer when asked to, and renames the part file to
// "<name>" only once it is complete and, if a checksum was given, verified.
//
// Two fetches must not target the same destination at the same time.
class ResumableFetcher {
public:
    ResumableFetcher(Logger& logger, const TransportSet& transports, ProgressSink& progress);

    // Returns the absolute path of the downloaded file. An existing file is
    // returned untouched unless request.overwrite is set.
    std::filesystem::path fetch(DownloadRequest request);

private:
    TransferState resolve_destination(const DownloadRequest& request, const Url& url) const;
    bool short_circuit_existing(const DownloadRequest& request, const TransferState& state) const;
    OpenResult open_transfer(const DownloadRequest& request, const Url& url, Transport& transport,
                             TransferState& state, bool& resumed);
    void transfer(const DownloadRequest& request, ReadStream& stream, TransferState& state, bool append);
    void verify(const DownloadRequest& request, const TransferState& state);
    void finalize(const TransferState& state);

    std::string progress_message(const TransferState& state, std::uint64_t offset) const;

    Logger& logger_;
    const TransportSet& transports_;
    ProgressSink& progress_;
};
