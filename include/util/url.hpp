#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sbs::util {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

std::string escape(std::string_view s);
std::string unescape(std::string_view s);

// Percent-encodes each path segment, keeping the '/' separators intact.
std::string escapePathPreserveSlashes(std::string_view path);

// Strips leading/trailing slashes and collapses runs of '/' into one.
std::string cleanObjectPath(std::string_view path);

// key=value pairs joined with '&', both sides escaped. Empty input yields "".
std::string buildQuery(const QueryParams& params);

std::string appendQuery(std::string url, const QueryParams& params);

[[nodiscard]] std::optional<std::string> queryParam(std::string_view url, std::string_view key);

}
