#include "curl_stream.hpp"
#include "localization.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

CurlGlobalInitializer::CurlGlobalInitializer() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw DsfetchException(get_string("error.curl_global_init_failed"));
    }
}

CurlGlobalInitializer::~CurlGlobalInitializer() {
    curl_global_cleanup();
}

CurlReadStream::CurlReadStream(CurlHandle easy, std::string url, bool resume_exchange)
    : easy_(std::move(easy)), multi_(curl_multi_init()), url_(std::move(url)), resume_exchange_(resume_exchange) {
    if (!multi_) {
        multi_result_ = CURLM_OUT_OF_MEMORY;
        done_ = true;
        return;
    }

    curl_easy_setopt(easy_.get(), CURLOPT_WRITEFUNCTION, &CurlReadStream::write_callback);
    curl_easy_setopt(easy_.get(), CURLOPT_WRITEDATA, this);
    curl_easy_setopt(easy_.get(), CURLOPT_ERRORBUFFER, error_buffer_);

    multi_result_ = curl_multi_add_handle(multi_.get(), easy_.get());
    if (multi_result_ != CURLM_OK) {
        done_ = true;
    }
}

CurlReadStream::~CurlReadStream() {
    if (multi_ && easy_) {
        curl_multi_remove_handle(multi_.get(), easy_.get());
    }
}

std::optional<TransportError> CurlReadStream::prime() {
    pump();
    if (buffer_pos_ >= buffer_.size() && (result_ != CURLE_OK || multi_result_ != CURLM_OK)) {
        return make_error();
    }
    return std::nullopt;
}

size_t CurlReadStream::read(char* buffer, size_t size) {
    if (buffer_pos_ >= buffer_.size()) {
        buffer_.clear();
        buffer_pos_ = 0;
        pump();
    }

    if (buffer_pos_ < buffer_.size()) {
        const size_t count = std::min(size, buffer_.size() - buffer_pos_);
        std::memcpy(buffer, buffer_.data() + buffer_pos_, count);
        buffer_pos_ += count;
        return count;
    }

    if (result_ != CURLE_OK || multi_result_ != CURLM_OK) {
        throw make_error();
    }
    return 0;
}

std::optional<std::uint64_t> CurlReadStream::content_length() const {
    curl_off_t length = -1;
    if (curl_easy_getinfo(easy_.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) != CURLE_OK || length < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(length);
}

size_t CurlReadStream::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<CurlReadStream*>(userdata);
    const size_t total = size * nmemb;
    self->buffer_.append(ptr, total);
    self->body_started_ = true;
    return total;
}

void CurlReadStream::pump() {
    while (!done_ && buffer_pos_ >= buffer_.size()) {
        int running = 0;
        multi_result_ = curl_multi_perform(multi_.get(), &running);
        if (multi_result_ != CURLM_OK) {
            done_ = true;
            break;
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &queued)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_.get()) {
                result_ = msg->data.result;
                done_ = true;
            }
        }

        if (!done_ && buffer_pos_ >= buffer_.size()) {
            multi_result_ = curl_multi_poll(multi_.get(), nullptr, 0, 1000, nullptr);
            if (multi_result_ != CURLM_OK) {
                done_ = true;
            }
        }
    }
}

TransportError CurlReadStream::make_error() const {
    std::string detail;
    if (multi_result_ != CURLM_OK) {
        detail = curl_multi_strerror(multi_result_);
    } else if (error_buffer_[0] != '\0') {
        detail = error_buffer_;
    } else {
        detail = curl_easy_strerror(result_);
    }

    if (result_ == CURLE_HTTP_RETURNED_ERROR) {
        long code = 0;
        curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &code);
        detail += " " + string_format("error.http_status", static_cast<int>(code));
    }

    return TransportError(string_format("error.transport_failed", url_) + ": " + detail,
                          resume_exchange_ && !body_started_);
}

OpenResult open_curl_stream(CurlHandle easy, const std::string& url, bool resume_exchange) {
    if (!easy) {
        return OpenResult::failure(TransportError(string_format("error.curl_init_failed", url), resume_exchange));
    }

    auto stream = std::make_unique<CurlReadStream>(std::move(easy), url, resume_exchange);
    if (auto error = stream->prime()) {
        return OpenResult::failure(std::move(*error));
    }
    return OpenResult::success(std::move(stream));
}
