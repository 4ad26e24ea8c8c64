#include "http_transport.hpp"
#include "curl_stream.hpp"

#include <utility>

OpenResult HttpTransport::open(const Url& url) {
    CurlHandle curl(curl_easy_init());
    if (curl) {
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.text.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "dsfetch/" DSFETCH_VERSION);
    }
    return open_curl_stream(std::move(curl), url.text, false);
}
