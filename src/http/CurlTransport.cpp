#include "http/CurlTransport.hpp"
#include "logging/LogRegistry.hpp"
#include "storage/errors.hpp"
#include "util/curlWrappers.hpp"

#include <fmt/format.h>

using namespace sbs::logging;
using namespace sbs::util;

namespace sbs::http {

CurlTransport::CurlTransport() { ensureCurlGlobalInit(); }

Response CurlTransport::perform(const Request& request) const {
    const std::string method = to_string(request.method);

    SList hdrs;
    for (const auto& [k, v] : request.headers) hdrs.add(fmt::format("{}: {}", k, v));
    // avoid Expect: 100-continue stalls on uploads
    hdrs.add("Expect:");

    const bool hasBody = request.method != Method::GET &&
                         (request.method != Method::DELETE || !request.body.empty());
    // POSTFIELDS otherwise adds Content-Type: application/x-www-form-urlencoded
    if (hasBody && !request.headers.contains("Content-Type")) hdrs.add("Content-Type:");

    LogRegistry::http()->debug("[CurlTransport] {} {} ({} byte body)", method, request.url, request.body.size());

    const CurlResult res = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());

        switch (request.method) {
            case Method::GET:
                curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
                break;
            case Method::POST:
                curl_easy_setopt(h, CURLOPT_POST, 1L);
                break;
            case Method::PUT:
            case Method::DELETE:
                curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
                break;
        }

        if (hasBody) {
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        }
    });

    if (res.curl != CURLE_OK) {
        LogRegistry::http()->error("[CurlTransport] {} {} failed: CURL={} ({})",
                                   method, request.url, static_cast<int>(res.curl), res.error);
        throw storage::TransportError(fmt::format("Failed to send request: {}", res.error));
    }

    LogRegistry::http()->debug("[CurlTransport] {} {} -> HTTP {}", method, request.url, res.http);

    return {res.http, res.body};
}

}
