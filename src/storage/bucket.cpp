#include "storage/StorageClient.hpp"
#include "storage/response.hpp"
#include "util/url.hpp"

#include <stdexcept>

using namespace sbs::storage;
using namespace sbs::storage::model;
using namespace sbs::util;

namespace {

std::optional<std::vector<std::string>> mimeStrings(const std::optional<std::vector<MimeType>>& mimes) {
    if (!mimes) return std::nullopt;
    std::vector<std::string> out;
    out.reserve(mimes->size());
    for (const auto& m : *mimes) out.push_back(to_string(m));
    return out;
}

}

std::string StorageClient::createBucket(const std::string& name,
                                        const std::optional<std::string>& id,
                                        const bool isPublic,
                                        const std::optional<std::vector<MimeType>>& allowedMimeTypes,
                                        const std::optional<uint64_t> fileSizeLimit) const {
    if (name.empty()) throw std::invalid_argument("Bucket name must not be empty");

    const CreateBucketPayload payload{
        .id = id.value_or(name),
        .name = name,
        .is_public = isPublic,
        .allowed_mime_types = mimeStrings(allowedMimeTypes),
        .file_size_limit = fileSizeLimit
    };

    auto hdrs = authHeaders();
    hdrs.insert_or_assign("Content-Type", "application/json");

    const auto resp = send(http::Method::POST, storageUrl("bucket"), hdrs, toJsonBody(payload));
    return parseResponse<CreateBucketResponse>(resp, "createBucket").name;
}

void StorageClient::deleteBucket(const std::string& id) const {
    const auto resp = send(http::Method::DELETE, storageUrl("bucket/" + escape(id)), authHeaders());
    expectSuccess(resp, "deleteBucket");
}

Bucket StorageClient::getBucket(const std::string& id) const {
    const auto resp = send(http::Method::GET, storageUrl("bucket/" + escape(id)), authHeaders());
    return parseResponse<Bucket>(resp, "getBucket");
}

std::vector<Bucket> StorageClient::listBuckets() const {
    const auto resp = send(http::Method::GET, storageUrl("bucket"), authHeaders());
    return parseResponse<std::vector<Bucket>>(resp, "listBuckets");
}

std::string StorageClient::updateBucket(const std::string& id, const bool isPublic,
                                        const std::optional<std::vector<MimeType>>& allowedMimeTypes,
                                        const std::optional<uint64_t> fileSizeLimit) const {
    const UpdateBucketPayload payload{
        .id = id,
        .is_public = isPublic,
        .allowed_mime_types = mimeStrings(allowedMimeTypes),
        .file_size_limit = fileSizeLimit
    };

    auto hdrs = authHeaders();
    hdrs.insert_or_assign("Content-Type", "application/json");

    const auto resp = send(http::Method::PUT, storageUrl("bucket/" + escape(id)), hdrs, toJsonBody(payload));
    return parseResponse<MessageResponse>(resp, "updateBucket").message;
}

std::string StorageClient::emptyBucket(const std::string& id) const {
    const auto resp = send(http::Method::POST, storageUrl("bucket/" + escape(id) + "/empty"), authHeaders());
    return parseResponse<MessageResponse>(resp, "emptyBucket").message;
}
