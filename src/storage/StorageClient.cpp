#include "storage/StorageClient.hpp"
#include "config/ConfigRegistry.hpp"
#include "http/CurlTransport.hpp"
#include "logging/LogRegistry.hpp"
#include "storage/errors.hpp"
#include "util/url.hpp"

#include <cstdlib>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace sbs::storage;
using namespace sbs::logging;
using namespace sbs::util;

namespace {

std::string readEnv(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) throw ConfigError(fmt::format("Environment variable unreadable: {}", name));
    return value;
}

}

StorageClient::StorageClient(std::string projectUrl, std::string apiKey,
                             std::shared_ptr<const http::Transport> transport)
    : transport_(std::move(transport)), projectUrl_(std::move(projectUrl)), apiKey_(std::move(apiKey)) {
    while (!projectUrl_.empty() && projectUrl_.back() == '/') projectUrl_.pop_back();
    if (!transport_) transport_ = defaultTransport();
}

StorageClient StorageClient::fromEnv(std::shared_ptr<const http::Transport> transport) {
    auto url = readEnv(config::ENV_URL);
    auto key = readEnv(config::ENV_API_KEY);
    LogRegistry::config()->debug("[StorageClient] Loaded project URL {} from environment", url);
    return {std::move(url), std::move(key), std::move(transport)};
}

StorageClient StorageClient::fromConfig(const config::StorageConfig& cfg,
                                        std::shared_ptr<const http::Transport> transport) {
    if (cfg.url.empty()) throw ConfigError("storage.url is not set");
    if (cfg.api_key.empty()) throw ConfigError("storage.api_key is not set");

    LogRegistry::config()->debug("[StorageClient] Building client from config {}", nlohmann::json(cfg).dump());

    StorageClient client(cfg.url, cfg.api_key, std::move(transport));
    for (const auto& [name, value] : cfg.headers) {
        http::validateHeader(name, value);
        client.headers_.insert_or_assign(name, value);
    }
    return client;
}

StorageClient StorageClient::fromConfig(std::shared_ptr<const http::Transport> transport) {
    return fromConfig(config::ConfigRegistry::get().storage, std::move(transport));
}

StorageClient StorageClient::withHeader(const std::string& name, const std::string& value) const {
    http::validateHeader(name, value);
    StorageClient copy(*this);
    copy.headers_.insert_or_assign(name, value);
    return copy;
}

std::shared_ptr<const sbs::http::Transport> StorageClient::defaultTransport() {
    static const auto transport = std::make_shared<const http::CurlTransport>();
    return transport;
}

std::string StorageClient::storageUrl(const std::string_view resource) const {
    return fmt::format("{}{}/{}", projectUrl_, STORAGE_V1, resource);
}

std::string StorageClient::absoluteUrl(const std::string_view relative) const {
    if (relative.starts_with('/')) return fmt::format("{}{}{}", projectUrl_, STORAGE_V1, relative);
    return storageUrl(relative);
}

std::string StorageClient::objectKey(const std::string_view bucketId, const std::string_view path) {
    return escape(bucketId) + "/" + escapePathPreserveSlashes(cleanObjectPath(path));
}

sbs::http::HeaderMap StorageClient::authHeaders() const {
    const std::string bearer = "Bearer " + apiKey_;
    http::validateHeader(HEADER_API_KEY, apiKey_);
    http::validateHeader("Authorization", bearer);
    return {
        {HEADER_API_KEY, apiKey_},
        {"Authorization", bearer}
    };
}

void StorageClient::applyFileOptions(http::HeaderMap& hdrs, const std::optional<model::FileOptions>& options) {
    const model::FileOptions opts = options.value_or(model::FileOptions{});

    hdrs.insert_or_assign("cache-control", fmt::format("max-age={}", opts.cache_control));
    hdrs.insert_or_assign("content-type", opts.content_type.value_or("application/octet-stream"));
    // false is the server default, so the header is only sent when set
    if (opts.upsert) hdrs.insert_or_assign("x-upsert", "true");
    if (opts.duplex) hdrs.insert_or_assign("duplex", *opts.duplex);

    for (const auto& [k, v] : hdrs) http::validateHeader(k, v);
}

sbs::http::Response StorageClient::send(const http::Method method, std::string url,
                                   const http::HeaderMap& callHeaders, std::string body) const {
    http::Request req;
    req.method = method;
    req.url = std::move(url);
    req.headers = http::mergeHeaders(callHeaders, headers_);
    req.body = std::move(body);

    LogRegistry::storage()->debug("[StorageClient] {} {}", http::to_string(method), req.url);
    return transport_->perform(req);
}
