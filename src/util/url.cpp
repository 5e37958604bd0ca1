#include "util/url.hpp"
#include "util/curlWrappers.hpp"

#include <curl/curl.h>
#include <sstream>

namespace sbs::util {

std::string escape(const std::string_view s) {
    if (s.empty()) return {};

    CurlEasy tmpHandle;
    char* esc = curl_easy_escape(tmpHandle, s.data(), static_cast<int>(s.size()));
    if (!esc) throw std::runtime_error("curl_easy_escape failed");
    std::string out(esc);
    curl_free(esc);
    return out;
}

std::string unescape(const std::string_view s) {
    if (s.empty()) return {};

    CurlEasy tmpHandle;
    int outLen = 0;
    char* raw = curl_easy_unescape(tmpHandle, s.data(), static_cast<int>(s.size()), &outLen);
    if (!raw) throw std::runtime_error("curl_easy_unescape failed");
    std::string out(raw, static_cast<size_t>(outLen));
    curl_free(raw);
    return out;
}

std::string escapePathPreserveSlashes(const std::string_view path) {
    std::ostringstream out;
    size_t start = 0;
    while (true) {
        const auto slash = path.find('/', start);
        const auto seg = path.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start);
        out << escape(seg);
        if (slash == std::string_view::npos) break;
        out << '/';
        start = slash + 1;
    }
    return out.str();
}

std::string cleanObjectPath(const std::string_view path) {
    std::string out;
    out.reserve(path.size());
    for (const char c : path) {
        if (c == '/' && (out.empty() || out.back() == '/')) continue;
        out.push_back(c);
    }
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

std::string buildQuery(const QueryParams& params) {
    std::string query;
    for (const auto& [k, v] : params) {
        if (!query.empty()) query += '&';
        query += escape(k) + "=" + escape(v);
    }
    return query;
}

std::string appendQuery(std::string url, const QueryParams& params) {
    const auto query = buildQuery(params);
    if (query.empty()) return url;
    url += (url.find('?') == std::string::npos) ? '?' : '&';
    url += query;
    return url;
}

std::optional<std::string> queryParam(const std::string_view url, const std::string_view key) {
    const auto qpos = url.find('?');
    if (qpos == std::string_view::npos) return std::nullopt;

    auto rest = url.substr(qpos + 1);
    if (const auto hash = rest.find('#'); hash != std::string_view::npos) rest = rest.substr(0, hash);

    while (!rest.empty()) {
        const auto amp = rest.find('&');
        const auto pair = rest.substr(0, amp);
        const auto eq = pair.find('=');
        if (pair.substr(0, eq) == key)
            return eq == std::string_view::npos ? std::string{} : unescape(pair.substr(eq + 1));
        if (amp == std::string_view::npos) break;
        rest = rest.substr(amp + 1);
    }
    return std::nullopt;
}

}
