// Chainswap - Network Transports Implementation

#include <chainswap/transport.hpp>
#include <chainswap/errors.hpp>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace chainswap {

// =============================================================================
// CprJsonRpcTransport
// =============================================================================

CprJsonRpcTransport::CprJsonRpcTransport(std::string url, int timeout_ms)
    : url_(std::move(url)), timeout_ms_(timeout_ms) {}

json CprJsonRpcTransport::call(const std::string& method, const json& params) {
    json request = {
        {"jsonrpc", "2.0"},
        {"id", next_id_.fetch_add(1)},
        {"method", method},
        {"params", params},
    };

    spdlog::trace("rpc -> {} {}", method, params.dump());
    auto response = cpr::Post(
        cpr::Url{url_},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{request.dump()},
        cpr::Timeout{timeout_ms_});

    if (response.error) {
        throw RpcError(method + ": " + response.error.message);
    }
    if (response.status_code != 200) {
        throw RpcError(method + ": HTTP " + std::to_string(response.status_code) + ": " +
                       response.text);
    }

    json body;
    try {
        body = json::parse(response.text);
    } catch (const json::parse_error& e) {
        throw RpcError(method + ": malformed response: " + e.what());
    }

    if (body.contains("error") && !body["error"].is_null()) {
        const auto& err = body["error"];
        std::optional<std::string> data;
        if (err.contains("data")) {
            data = err["data"].is_string() ? err["data"].get<std::string>() : err["data"].dump();
        }
        throw RpcError(method + ": " + err.value("message", std::string("unknown error")),
                       err.value("code", 0), std::move(data));
    }
    if (!body.contains("result")) {
        throw RpcError(method + ": response has no result");
    }
    return body["result"];
}

// =============================================================================
// CprHttpTransport
// =============================================================================

HttpResponse CprHttpTransport::get(const std::string& url, const QueryParams& params) {
    cpr::Parameters parameters;
    for (const auto& [key, value] : params) {
        parameters.Add(cpr::Parameter{key, value});
    }

    auto response = cpr::Get(cpr::Url{url}, parameters, cpr::Timeout{timeout_ms_});
    if (response.error) {
        throw RpcError("GET " + url + ": " + response.error.message);
    }
    return HttpResponse{response.status_code, response.text};
}

// =============================================================================
// TransportFactory
// =============================================================================

std::unique_ptr<JsonRpcTransport> TransportFactory::rpc(const std::string& url, int timeout_ms) {
    return std::make_unique<CprJsonRpcTransport>(url, timeout_ms);
}

std::unique_ptr<HttpTransport> TransportFactory::http(int timeout_ms) {
    return std::make_unique<CprHttpTransport>(timeout_ms);
}

}  // namespace chainswap
