#include "http/headers.hpp"
#include "storage/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace sbs::http {

bool CaseInsensitiveLess::operator()(const std::string_view a, const std::string_view b) const noexcept {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](const char x, const char y) {
        return std::tolower(static_cast<unsigned char>(x)) < std::tolower(static_cast<unsigned char>(y));
    });
}

bool isValidHeaderName(const std::string_view name) noexcept {
    if (name.empty()) return false;
    static constexpr std::string_view tokenSpecials = "!#$%&'*+-.^_`|~";
    return std::ranges::all_of(name, [](const char c) {
        const auto u = static_cast<unsigned char>(c);
        return std::isalnum(u) || tokenSpecials.find(c) != std::string_view::npos;
    });
}

bool isValidHeaderValue(const std::string_view value) noexcept {
    // visible ASCII, SP, HTAB and obs-text; no CR, LF, NUL or DEL
    return std::ranges::all_of(value, [](const char c) {
        const auto u = static_cast<unsigned char>(c);
        return u == '\t' || (u >= 0x20 && u != 0x7F);
    });
}

void validateHeader(const std::string_view name, const std::string_view value) {
    if (!isValidHeaderName(name))
        throw storage::HeaderError(fmt::format("Header name is invalid: '{}'", name));
    if (!isValidHeaderValue(value))
        throw storage::HeaderError(fmt::format("Header value is invalid for '{}'", name));
}

HeaderMap mergeHeaders(const HeaderMap& callHeaders, const HeaderMap& defaults) {
    HeaderMap merged = callHeaders;
    for (const auto& [name, value] : defaults) merged.try_emplace(name, value);
    return merged;
}

}
