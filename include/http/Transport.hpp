#pragma once

#include "http/headers.hpp"

#include <string>

namespace sbs::http {

enum class Method { GET, POST, PUT, DELETE };

std::string to_string(Method method);

struct Request {
    Method method{Method::GET};
    std::string url;
    HeaderMap headers;
    std::string body;
};

struct Response {
    long status{0};
    std::string body;

    [[nodiscard]] bool ok() const { return status / 100 == 2; }
};

/**
 * One blocking HTTP round trip. Implementations throw storage::TransportError
 * when no response could be obtained; any HTTP status is a valid Response.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual Response perform(const Request& request) const = 0;
};

}
