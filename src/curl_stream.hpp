#pragma once

#include "exception.hpp"
#include "transfer.hpp"
#include "transport.hpp"

#include <curl/curl.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer();
    ~CurlGlobalInitializer();

    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};

// Custom deleters for the CURL handles
struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

struct CurlMultiDeleter {
    void operator()(CURLM* multi) const {
        if (multi) {
            curl_multi_cleanup(multi);
        }
    }
};
using CurlMultiHandle = std::unique_ptr<CURLM, CurlMultiDeleter>;

// Turns libcurl's push-style write callback into a pull-style ReadStream by
// driving an easy handle through a multi handle only as far as the reader
// needs. The easy handle must be fully configured except for the write
// callback, which the stream installs itself.
class CurlReadStream : public ReadStream {
public:
    CurlReadStream(CurlHandle easy, std::string url, bool resume_exchange);
    ~CurlReadStream() override;

    CurlReadStream(const CurlReadStream&) = delete;
    CurlReadStream& operator=(const CurlReadStream&) = delete;

    // Drives the transfer until body bytes are buffered or it has ended.
    // Returns the error if the transfer ended unsuccessfully.
    std::optional<TransportError> prime();

    size_t read(char* buffer, size_t size) override;
    std::optional<std::uint64_t> content_length() const override;

private:
    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    void pump();
    TransportError make_error() const;

    CurlHandle easy_;
    CurlMultiHandle multi_;
    std::string url_;
    bool resume_exchange_;
    std::string buffer_;
    size_t buffer_pos_ = 0;
    bool done_ = false;
    CURLcode result_ = CURLE_OK;
    CURLMcode multi_result_ = CURLM_OK;
    bool body_started_ = false;
    char error_buffer_[CURL_ERROR_SIZE] = {};
};

// Opens easy as a primed CurlReadStream. Failures are returned, not thrown;
// resume_exchange marks them as eligible for a full-download retry.
OpenResult open_curl_stream(CurlHandle easy, const std::string& url, bool resume_exchange);
