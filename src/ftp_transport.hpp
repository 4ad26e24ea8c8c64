#pragma once

#include "transport.hpp"

#include <cstdint>

// Anonymous FTP through libcurl. Binary mode, one CWD per (decoded) directory
// component, and REST <offset> before RETR when resuming.
class FtpTransport : public Transport {
public:
    OpenResult open(const Url& url) override;
    bool supports_resume() const override { return true; }
    OpenResult open_resumed(const Url& url, std::uint64_t offset) override;

private:
    OpenResult open_at(const Url& url, std::uint64_t offset, bool resume_exchange);
};
