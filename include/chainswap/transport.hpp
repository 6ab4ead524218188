// Chainswap - Network Transports
// JSON-RPC and HTTP boundaries; cpr-backed by default, replaceable in tests

#pragma once

#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace chainswap {

using json = nlohmann::json;

// Issues one JSON-RPC request and returns its `result` member.
// Throws RpcError for transport failures and JSON-RPC error objects.
class JsonRpcTransport {
public:
    virtual ~JsonRpcTransport() = default;

    virtual json call(const std::string& method, const json& params) = 0;
};

struct HttpResponse {
    long status_code = 0;
    std::string text;
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Throws RpcError when no response was received at all
    virtual HttpResponse get(const std::string& url, const QueryParams& params) = 0;
};

class CprJsonRpcTransport : public JsonRpcTransport {
public:
    explicit CprJsonRpcTransport(std::string url, int timeout_ms = 30000);

    json call(const std::string& method, const json& params) override;

    [[nodiscard]] const std::string& url() const noexcept { return url_; }

private:
    std::string url_;
    int timeout_ms_;
    std::atomic<uint64_t> next_id_{1};
};

class CprHttpTransport : public HttpTransport {
public:
    explicit CprHttpTransport(int timeout_ms = 30000) : timeout_ms_(timeout_ms) {}

    HttpResponse get(const std::string& url, const QueryParams& params) override;

private:
    int timeout_ms_;
};

// Creates transports for the Client facade
class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    virtual std::unique_ptr<JsonRpcTransport> rpc(const std::string& url, int timeout_ms);
    virtual std::unique_ptr<HttpTransport> http(int timeout_ms);
};

}  // namespace chainswap
