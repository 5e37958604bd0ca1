#pragma once

#include "http/Transport.hpp"

namespace sbs::http {

// libcurl-backed transport. Each call uses its own easy handle, so one
// instance is safe to share between threads.
class CurlTransport final : public Transport {
public:
    CurlTransport();

    Response perform(const Request& request) const override;
};

}
