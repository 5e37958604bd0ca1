#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace sbs::storage::model {

struct FileMetadata {
    std::optional<std::string> e_tag;
    std::optional<uint64_t> size;
    std::optional<std::string> mimetype;
    std::optional<std::string> cache_control;
    std::optional<std::string> last_modified;
    std::optional<uint64_t> content_length;
    std::optional<int> http_status_code;
};

/**
 * A listing entry. Folders come back with only `name` populated; files carry
 * an id, timestamps and metadata.
 */
struct FileObject {
    std::string name;
    std::optional<std::string> id;
    std::optional<std::string> updated_at;
    std::optional<std::string> created_at;
    std::optional<std::string> last_accessed_at;
    std::optional<FileMetadata> metadata;
    std::optional<std::string> bucket_id;
    std::optional<std::string> owner;

    [[nodiscard]] bool isFolder() const { return !id.has_value(); }
};

void from_json(const nlohmann::json& j, FileMetadata& m);
void from_json(const nlohmann::json& j, FileObject& f);

}
