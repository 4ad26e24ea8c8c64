#include "transport.hpp"
#include "ftp_transport.hpp"
#include "http_transport.hpp"
#include "localization.hpp"
#include "utils.hpp"

OpenResult Transport::open_resumed(const Url& url, std::uint64_t offset) {
    return OpenResult::failure(TransportError(
        string_format("error.resume_unsupported", url.scheme, std::to_string(offset)), true));
}

void TransportSet::add(const std::string& scheme, std::shared_ptr<Transport> transport) {
    transports_[to_lower(scheme)] = std::move(transport);
}

Transport* TransportSet::find(const std::string& scheme) const {
    auto it = transports_.find(to_lower(scheme));
    return (it != transports_.end()) ? it->second.get() : nullptr;
}

TransportSet make_default_transports() {
    TransportSet transports;
    auto http = std::make_shared<HttpTransport>();
    transports.add("http", http);
    transports.add("https", http);
    transports.add("file", http);
    transports.add("ftp", std::make_shared<FtpTransport>());
    return transports;
}
