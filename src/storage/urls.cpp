#include "storage/StorageClient.hpp"
#include "logging/LogRegistry.hpp"
#include "storage/response.hpp"
#include "util/url.hpp"

using namespace sbs::storage;
using namespace sbs::storage::model;
using namespace sbs::logging;
using namespace sbs::util;

std::string StorageClient::createSignedUrl(const std::string& bucketId, const std::string& path,
                                           const uint64_t expiresIn,
                                           const std::optional<TransformOptions>& transform) const {
    const SignedUrlPayload payload{.expires_in = expiresIn, .transform = transform};

    auto hdrs = authHeaders();
    hdrs.insert_or_assign("Content-Type", "application/json");

    const auto resp = send(http::Method::POST, storageUrl("object/sign/" + objectKey(bucketId, path)), hdrs,
                           toJsonBody(payload));
    return absoluteUrl(parseResponse<SignedUrlResponse>(resp, "createSignedUrl").signed_url);
}

std::vector<SignedUrl> StorageClient::createMultipleSignedUrls(const std::string& bucketId,
                                                               const std::vector<std::string>& paths,
                                                               const uint64_t expiresIn) const {
    const SignedUrlsPayload payload{.expires_in = expiresIn, .paths = paths};

    auto hdrs = authHeaders();
    hdrs.insert_or_assign("Content-Type", "application/json");

    const auto resp = send(http::Method::POST, storageUrl("object/sign/" + escape(bucketId)), hdrs,
                           toJsonBody(payload));

    auto urls = parseResponse<std::vector<SignedUrl>>(resp, "createMultipleSignedUrls");
    for (auto& u : urls) {
        if (u.signed_url) u.signed_url = absoluteUrl(*u.signed_url);
        else LogRegistry::storage()->warn("[StorageClient] No signed URL for {}: {}", u.path, u.error.value_or("unknown error"));
    }
    return urls;
}

SignedUploadUrl StorageClient::createSignedUploadUrl(const std::string& bucketId, const std::string& path,
                                                     const bool upsert) const {
    auto hdrs = authHeaders();
    if (upsert) hdrs.insert_or_assign("x-upsert", "true");

    const auto resp = send(http::Method::POST, storageUrl("object/upload/sign/" + objectKey(bucketId, path)), hdrs);
    const auto url = parseResponse<SignedUploadUrlResponse>(resp, "createSignedUploadUrl").url;

    const auto token = queryParam(url, "token");
    if (!token || token->empty()) {
        LogRegistry::storage()->error("[StorageClient] createSignedUploadUrl: no token in {}", url);
        throw StorageError(resp.status, resp.body);
    }

    return {url, *token};
}

ObjectResponse StorageClient::uploadToSignedUrl(const std::string& bucketId, const std::string& token,
                                                const std::vector<uint8_t>& data, const std::string& path,
                                                const std::optional<FileOptions>& options) const {
    auto hdrs = authHeaders();
    applyFileOptions(hdrs, options);

    const auto url = appendQuery(storageUrl("object/upload/sign/" + objectKey(bucketId, path)), {{"token", token}});
    const auto resp = send(http::Method::PUT, url, hdrs, std::string(data.begin(), data.end()));
    return parseResponse<ObjectResponse>(resp, "uploadToSignedUrl");
}

std::string StorageClient::getPublicUrl(const std::string& bucketId, const std::string& path,
                                        const std::optional<DownloadOptions>& options) const {
    const bool render = options && options->transform;
    const std::string segment = render ? "render/image" : "object";

    QueryParams params;
    if (render) params = to_query(*options->transform);
    if (options && options->download.value_or(false)) params.emplace_back("download", "true");

    return appendQuery(storageUrl(segment + "/public/" + objectKey(bucketId, path)), params);
}
