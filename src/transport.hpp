#pragma once

#include "exception.hpp"
#include "transfer.hpp"
#include "url.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

// Outcome of opening a transfer: a readable stream, or the error that
// prevented it. Opening never throws, so callers decide on fallbacks by
// inspecting the error value.
struct OpenResult {
    std::unique_ptr<ReadStream> stream;
    std::optional<TransportError> error;

    static OpenResult success(std::unique_ptr<ReadStream> stream) {
        return {std::move(stream), std::nullopt};
    }
    static OpenResult failure(TransportError error) {
        return {nullptr, std::move(error)};
    }

    explicit operator bool() const { return stream != nullptr; }
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual OpenResult open(const Url& url) = 0;

    virtual bool supports_resume() const { return false; }

    // Streams the remote content starting at offset. The default fails with
    // an error that allows falling back to a full download.
    virtual OpenResult open_resumed(const Url& url, std::uint64_t offset);
};

// Scheme -> transport lookup.
class TransportSet {
public:
    void add(const std::string& scheme, std::shared_ptr<Transport> transport);
    Transport* find(const std::string& scheme) const;

private:
    std::map<std::string, std::shared_ptr<Transport>> transports_;
};

// http, https and file through HttpTransport, ftp through FtpTransport.
TransportSet make_default_transports();
