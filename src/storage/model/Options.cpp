#include "storage/model/Options.hpp"

#include <algorithm>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace sbs::storage::model {

bool isAllowedResize(const std::string_view mode) {
    return std::ranges::find(ALLOWED_RESIZE_MODES, mode) != ALLOWED_RESIZE_MODES.end();
}

util::QueryParams to_query(const TransformOptions& t) {
    util::QueryParams params;
    if (t.width) params.emplace_back("width", std::to_string(*t.width));
    if (t.height) params.emplace_back("height", std::to_string(*t.height));
    if (t.resize && isAllowedResize(*t.resize)) params.emplace_back("resize", *t.resize);
    if (t.format) params.emplace_back("format", *t.format);
    if (t.quality) params.emplace_back("quality", std::to_string(*t.quality));
    return params;
}

void to_json(nlohmann::json& j, const TransformOptions& t) {
    j = nlohmann::json::object();
    if (t.width) j["width"] = *t.width;
    if (t.height) j["height"] = *t.height;
    if (t.resize && isAllowedResize(*t.resize)) j["resize"] = *t.resize;
    if (t.format) j["format"] = *t.format;
    if (t.quality) j["quality"] = *t.quality;
}

std::string_view to_string(const Column column) {
    switch (column) {
        case Column::Name: return "name";
        case Column::UpdatedAt: return "updated_at";
        case Column::CreatedAt: return "created_at";
        case Column::LastAccessedAt: return "last_accessed_at";
        default: throw std::invalid_argument("Unknown Column enum value");
    }
}

std::string_view to_string(const Order order) {
    switch (order) {
        case Order::Asc: return "asc";
        case Order::Desc: return "desc";
        default: throw std::invalid_argument("Unknown Order enum value");
    }
}

void to_json(nlohmann::json& j, const SortBy& s) {
    j = nlohmann::json{
        {"column", std::string(to_string(s.column))},
        {"order", std::string(to_string(s.order))}
    };
}

}
