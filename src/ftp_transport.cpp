#include "ftp_transport.hpp"
#include "curl_stream.hpp"

#include <utility>

OpenResult FtpTransport::open(const Url& url) {
    return open_at(url, 0, false);
}

OpenResult FtpTransport::open_resumed(const Url& url, std::uint64_t offset) {
    return open_at(url, offset, true);
}

OpenResult FtpTransport::open_at(const Url& url, std::uint64_t offset, bool resume_exchange) {
    CurlHandle curl(curl_easy_init());
    if (curl) {
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.text.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_TRANSFERTEXT, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_MULTICWD));
        if (offset > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset));
        }
    }
    return open_curl_stream(std::move(curl), url.text, resume_exchange);
}
