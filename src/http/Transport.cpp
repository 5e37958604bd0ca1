#include "http/Transport.hpp"

#include <stdexcept>

namespace sbs::http {

std::string to_string(const Method method) {
    switch (method) {
        case Method::GET: return "GET";
        case Method::POST: return "POST";
        case Method::PUT: return "PUT";
        case Method::DELETE: return "DELETE";
        default: throw std::invalid_argument("Unknown HTTP method");
    }
}

}
