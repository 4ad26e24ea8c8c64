#pragma once

#include "transport.hpp"

// HTTP(S) through libcurl; also serves file:// URLs. No resume support.
class HttpTransport : public Transport {
public:
    OpenResult open(const Url& url) override;
};
