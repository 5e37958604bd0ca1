#include "storage/model/File.hpp"
#include "storage/model/json.hpp"

#include <nlohmann/json.hpp>

namespace sbs::storage::model {

void from_json(const nlohmann::json& j, FileMetadata& m) {
    m.e_tag = optionalAt<std::string>(j, "eTag");
    m.size = optionalAt<uint64_t>(j, "size");
    m.mimetype = optionalAt<std::string>(j, "mimetype");
    m.cache_control = optionalAt<std::string>(j, "cacheControl");
    m.last_modified = optionalAt<std::string>(j, "lastModified");
    m.content_length = optionalAt<uint64_t>(j, "contentLength");
    m.http_status_code = optionalAt<int>(j, "httpStatusCode");
}

void from_json(const nlohmann::json& j, FileObject& f) {
    f.name = j.at("name").get<std::string>();
    f.id = optionalAt<std::string>(j, "id");
    f.updated_at = optionalAt<std::string>(j, "updated_at");
    f.created_at = optionalAt<std::string>(j, "created_at");
    f.last_accessed_at = optionalAt<std::string>(j, "last_accessed_at");
    f.metadata = optionalAt<FileMetadata>(j, "metadata");
    f.bucket_id = optionalAt<std::string>(j, "bucket_id");
    f.owner = optionalAt<std::string>(j, "owner");
}

}
