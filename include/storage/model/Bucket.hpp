#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sbs::storage::model {

struct Bucket {
    std::string id;
    std::string name;
    std::string owner;
    bool is_public{false};
    std::optional<uint64_t> file_size_limit;
    std::optional<std::vector<std::string>> allowed_mime_types;
    std::string created_at;
    std::string updated_at;
};

void from_json(const nlohmann::json& j, Bucket& b);

}
