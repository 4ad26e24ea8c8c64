#include "url.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <memory>
#include <optional>

namespace {
    struct CurlUrlDeleter {
        void operator()(CURLU* url) const {
            if (url) {
                curl_url_cleanup(url);
            }
        }
    };
    using CurlUrlHandle = std::unique_ptr<CURLU, CurlUrlDeleter>;

    std::optional<std::string> get_part(CURLU* handle, CURLUPart part, unsigned int flags = 0) {
        char* value = nullptr;
        if (curl_url_get(handle, part, &value, flags) != CURLUE_OK || !value) {
            return std::nullopt;
        }
        std::string result(value);
        curl_free(value);
        return result;
    }
}

Url parse_url(const std::string& text) {
    CurlUrlHandle handle(curl_url());
    if (!handle) {
        throw InvalidRequestError(string_format("error.invalid_url", text));
    }

    CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, text.c_str(), CURLU_NON_SUPPORT_SCHEME);
    if (rc != CURLUE_OK) {
        throw InvalidRequestError(string_format("error.invalid_url", text) + ": " + curl_url_strerror(rc));
    }

    Url url;
    url.text = text;
    url.scheme = to_lower(get_part(handle.get(), CURLUPART_SCHEME).value_or(""));
    url.host = get_part(handle.get(), CURLUPART_HOST).value_or("");
    url.path = get_part(handle.get(), CURLUPART_PATH).value_or("");

    if (url.path.empty() || url.path.front() != '/' || url.path.back() == '/') {
        throw InvalidRequestError(string_format("error.url_no_file_name", text));
    }

    url.file_name = url.path.substr(url.path.rfind('/') + 1);
    if (url.file_name == "." || url.file_name == "..") {
        throw InvalidRequestError(string_format("error.url_no_file_name", text));
    }

    // Decode only the directory part, an encoded '/' in the file name stays put
    const std::string raw_directory = url.path.substr(0, url.path.size() - url.file_name.size());
    rc = curl_url_set(handle.get(), CURLUPART_PATH, raw_directory.c_str(), 0);
    if (rc != CURLUE_OK) {
        throw InvalidRequestError(string_format("error.invalid_url", text) + ": " + curl_url_strerror(rc));
    }
    url.directory = get_part(handle.get(), CURLUPART_PATH, CURLU_URLDECODE).value_or(raw_directory);
    return url;
}
