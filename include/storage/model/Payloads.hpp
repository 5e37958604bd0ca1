#pragma once

#include "storage/model/Options.hpp"

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sbs::storage::model {

// #########################################################################
// ######################## REQUEST BODIES #################################
// #########################################################################

struct CreateBucketPayload {
    std::string id;
    std::string name;
    bool is_public{false};
    std::optional<std::vector<std::string>> allowed_mime_types;
    std::optional<uint64_t> file_size_limit;
};

struct UpdateBucketPayload {
    std::string id;
    bool is_public{false};
    std::optional<std::vector<std::string>> allowed_mime_types;
    std::optional<uint64_t> file_size_limit;
};

struct ListFilesPayload {
    std::string prefix;
    FileSearchOptions options;
};

struct CopyFilePayload {
    std::string bucket_id;
    std::string source_key;
    std::string destination_bucket;
    std::string destination_key;
    bool copy_metadata{false};
};

struct MoveFilePayload {
    std::string bucket_id;
    std::string source_key;
    std::string destination_bucket;
    std::string destination_key;
};

struct SignedUrlPayload {
    uint64_t expires_in{0};
    std::optional<TransformOptions> transform;
};

struct SignedUrlsPayload {
    uint64_t expires_in{0};
    std::vector<std::string> paths;
};

struct DeleteFilesPayload {
    std::vector<std::string> prefixes;
};

void to_json(nlohmann::json& j, const CreateBucketPayload& p);
void to_json(nlohmann::json& j, const UpdateBucketPayload& p);
void to_json(nlohmann::json& j, const ListFilesPayload& p);
void to_json(nlohmann::json& j, const CopyFilePayload& p);
void to_json(nlohmann::json& j, const MoveFilePayload& p);
void to_json(nlohmann::json& j, const SignedUrlPayload& p);
void to_json(nlohmann::json& j, const SignedUrlsPayload& p);
void to_json(nlohmann::json& j, const DeleteFilesPayload& p);

// #########################################################################
// ######################## RESPONSE BODIES ################################
// #########################################################################

struct CreateBucketResponse {
    std::string name;
};

struct MessageResponse {
    std::string message;
};

// Upload responses. Signed uploads only return the key.
struct ObjectResponse {
    std::optional<std::string> id;
    std::string key;
};

struct KeyResponse {
    std::string key;
};

struct SignedUrlResponse {
    std::string signed_url;
};

struct SignedUrl {
    std::string path;
    std::optional<std::string> signed_url;
    std::optional<std::string> error;
};

struct SignedUploadUrlResponse {
    std::string url;
};

// url is relative to the storage root (no host); token authorizes the upload.
struct SignedUploadUrl {
    std::string url;
    std::string token;
};

void from_json(const nlohmann::json& j, CreateBucketResponse& r);
void from_json(const nlohmann::json& j, MessageResponse& r);
void from_json(const nlohmann::json& j, ObjectResponse& r);
void from_json(const nlohmann::json& j, KeyResponse& r);
void from_json(const nlohmann::json& j, SignedUrlResponse& r);
void from_json(const nlohmann::json& j, SignedUrl& r);
void from_json(const nlohmann::json& j, SignedUploadUrlResponse& r);

}
