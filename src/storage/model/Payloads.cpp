#include "storage/model/Payloads.hpp"
#include "storage/model/json.hpp"

#include <nlohmann/json.hpp>

namespace sbs::storage::model {

// Unset limits are left out so the server applies its own default.
void to_json(nlohmann::json& j, const CreateBucketPayload& p) {
    j = nlohmann::json{
        {"id", p.id},
        {"name", p.name},
        {"public", p.is_public}
    };
    if (p.allowed_mime_types) j["allowed_mime_types"] = *p.allowed_mime_types;
    if (p.file_size_limit) j["file_size_limit"] = *p.file_size_limit;
}

void to_json(nlohmann::json& j, const UpdateBucketPayload& p) {
    j = nlohmann::json{
        {"id", p.id},
        {"public", p.is_public}
    };
    if (p.allowed_mime_types) j["allowed_mime_types"] = *p.allowed_mime_types;
    if (p.file_size_limit) j["file_size_limit"] = *p.file_size_limit;
}

void to_json(nlohmann::json& j, const ListFilesPayload& p) {
    j = nlohmann::json{
        {"prefix", p.prefix},
        {"limit", p.options.limit.value_or(DEFAULT_LIST_LIMIT)},
        {"offset", p.options.offset.value_or(0)},
        {"sortBy", p.options.sort_by.value_or(SortBy{})}
    };
    if (p.options.search) j["search"] = *p.options.search;
}

void to_json(nlohmann::json& j, const CopyFilePayload& p) {
    j = nlohmann::json{
        {"bucketId", p.bucket_id},
        {"sourceKey", p.source_key},
        {"destinationBucket", p.destination_bucket},
        {"destinationKey", p.destination_key},
        {"copyMetadata", p.copy_metadata}
    };
}

void to_json(nlohmann::json& j, const MoveFilePayload& p) {
    j = nlohmann::json{
        {"bucketId", p.bucket_id},
        {"sourceKey", p.source_key},
        {"destinationBucket", p.destination_bucket},
        {"destinationKey", p.destination_key}
    };
}

void to_json(nlohmann::json& j, const SignedUrlPayload& p) {
    j = nlohmann::json{{"expiresIn", p.expires_in}};
    if (p.transform) j["transform"] = *p.transform;
}

void to_json(nlohmann::json& j, const SignedUrlsPayload& p) {
    j = nlohmann::json{
        {"expiresIn", p.expires_in},
        {"paths", p.paths}
    };
}

void to_json(nlohmann::json& j, const DeleteFilesPayload& p) {
    j = nlohmann::json{{"prefixes", p.prefixes}};
}

void from_json(const nlohmann::json& j, CreateBucketResponse& r) {
    r.name = j.at("name").get<std::string>();
}

void from_json(const nlohmann::json& j, MessageResponse& r) {
    r.message = j.at("message").get<std::string>();
}

void from_json(const nlohmann::json& j, ObjectResponse& r) {
    r.id = optionalAt<std::string>(j, "Id");
    r.key = j.at("Key").get<std::string>();
}

void from_json(const nlohmann::json& j, KeyResponse& r) {
    r.key = j.at("Key").get<std::string>();
}

void from_json(const nlohmann::json& j, SignedUrlResponse& r) {
    r.signed_url = j.at("signedURL").get<std::string>();
}

void from_json(const nlohmann::json& j, SignedUrl& r) {
    r.path = optionalAt<std::string>(j, "path").value_or("");
    r.signed_url = optionalAt<std::string>(j, "signedURL");
    r.error = optionalAt<std::string>(j, "error");
}

void from_json(const nlohmann::json& j, SignedUploadUrlResponse& r) {
    r.url = j.at("url").get<std::string>();
}

}
