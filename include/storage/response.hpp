#pragma once

#include "http/Transport.hpp"
#include "logging/LogRegistry.hpp"
#include "storage/errors.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace sbs::storage {

// Non-2xx → StorageError carrying the raw status and body.
inline void expectSuccess(const http::Response& resp, const std::string_view op) {
    if (resp.ok()) return;
    logging::LogRegistry::storage()->error("[StorageClient] {} failed: HTTP={} Response:\n{}", op, resp.status, resp.body);
    throw StorageError(resp.status, resp.body);
}

// Decodes a success body into T. A body of the wrong shape is reported as a
// StorageError carrying the raw body.
template <typename T>
T parseResponse(const http::Response& resp, const std::string_view op) {
    expectSuccess(resp, op);
    try {
        return nlohmann::json::parse(resp.body).get<T>();
    } catch (const nlohmann::json::exception& e) {
        logging::LogRegistry::storage()->error("[StorageClient] {} returned an unexpected body (HTTP {}): {}",
                                               op, resp.status, e.what());
        throw StorageError(resp.status, resp.body);
    }
}

template <typename T>
std::string toJsonBody(const T& payload) {
    try {
        return nlohmann::json(payload).dump();
    } catch (const nlohmann::json::exception& e) {
        throw SerdeError(std::string("Failed to serialize request payload: ") + e.what());
    }
}

}
