#pragma once

#include "util/url.hpp"

#include <nlohmann/json_fwd.hpp>
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace sbs::storage::model {

// ############################################################################
// ############################### UPLOADS ####################################
// ############################################################################

struct FileOptions {
    unsigned int cache_control = 3600;          // seconds, sent as max-age
    std::optional<std::string> content_type;    // application/octet-stream when unset
    bool upsert = false;                        // x-upsert is only sent when true
    std::optional<std::string> duplex;
};

// ############################################################################
// ########################## DOWNLOADS & RENDER ##############################
// ############################################################################

inline constexpr std::array<std::string_view, 3> ALLOWED_RESIZE_MODES = {"cover", "contain", "fill"};

[[nodiscard]] bool isAllowedResize(std::string_view mode);

struct TransformOptions {
    std::optional<unsigned int> width;
    std::optional<unsigned int> height;
    std::optional<std::string> resize;
    std::optional<std::string> format;
    std::optional<unsigned int> quality;
};

struct DownloadOptions {
    std::optional<TransformOptions> transform;
    std::optional<bool> download;
};

// width, height, resize, format, quality; a resize outside the allow-list is dropped.
util::QueryParams to_query(const TransformOptions& t);

void to_json(nlohmann::json& j, const TransformOptions& t);

// ############################################################################
// ############################### LISTING ####################################
// ############################################################################

inline constexpr unsigned int DEFAULT_LIST_LIMIT = 100;

enum class Column { Name, UpdatedAt, CreatedAt, LastAccessedAt };
enum class Order { Asc, Desc };

std::string_view to_string(Column column);
std::string_view to_string(Order order);

struct SortBy {
    Column column = Column::Name;
    Order order = Order::Asc;
};

struct FileSearchOptions {
    std::optional<unsigned int> limit;
    std::optional<unsigned int> offset;
    std::optional<SortBy> sort_by;
    std::optional<std::string> search;
};

void to_json(nlohmann::json& j, const SortBy& s);

}
