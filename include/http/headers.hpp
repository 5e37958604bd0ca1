#pragma once

#include <map>
#include <string>
#include <string_view>

namespace sbs::http {

struct CaseInsensitiveLess {
    using is_transparent = void;
    bool operator()(std::string_view a, std::string_view b) const noexcept;
};

// Header names compare case-insensitively, as on the wire.
using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

[[nodiscard]] bool isValidHeaderName(std::string_view name) noexcept;
[[nodiscard]] bool isValidHeaderValue(std::string_view value) noexcept;

// Throws storage::HeaderError if the pair cannot be sent.
void validateHeader(std::string_view name, std::string_view value);

/**
 * Returns callHeaders plus every entry of defaults whose name the call did not
 * already set. Call-specific values always win.
 */
[[nodiscard]] HeaderMap mergeHeaders(const HeaderMap& callHeaders, const HeaderMap& defaults);

}
