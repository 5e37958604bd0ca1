#include "storage/model/Bucket.hpp"
#include "storage/model/json.hpp"

#include <nlohmann/json.hpp>

namespace sbs::storage::model {

void from_json(const nlohmann::json& j, Bucket& b) {
    b.id = j.at("id").get<std::string>();
    b.name = j.at("name").get<std::string>();
    b.owner = optionalAt<std::string>(j, "owner").value_or("");
    b.is_public = j.at("public").get<bool>();
    b.file_size_limit = optionalAt<uint64_t>(j, "file_size_limit");
    b.allowed_mime_types = optionalAt<std::vector<std::string>>(j, "allowed_mime_types");
    b.created_at = optionalAt<std::string>(j, "created_at").value_or("");
    b.updated_at = optionalAt<std::string>(j, "updated_at").value_or("");
}

}
