#pragma once

#include <nlohmann/json.hpp>
#include <optional>

namespace sbs::storage::model {

// Missing and explicit null both read as nullopt.
template <typename T>
std::optional<T> optionalAt(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->template get<T>();
}

}
