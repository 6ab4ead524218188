// Chainswap - Jupiter Venue Implementation

#include <chainswap/venues/jupiter.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace chainswap {

namespace {

constexpr long HTTP_OK = 200;
constexpr long HTTP_BAD_REQUEST = 400;

HttpTransport& require_http(const VenueContext& context) {
    if (context.http == nullptr) {
        throw EngineError("Jupiter requires an HTTP transport");
    }
    return *context.http;
}

const std::string& require_solana(const std::string& chain) {
    if (chain != "solana") {
        throw UnsupportedChain(chain, "JupiterClient only supports Solana chain");
    }
    return chain;
}

bool is_no_route(const HttpResponse& response) {
    json body = json::parse(response.text, nullptr, false);
    if (body.is_discarded() || !body.is_object()) return false;
    std::string code = body.value("errorCode", std::string());
    return code == "COULD_NOT_FIND_ANY_ROUTE" || code == "TOKEN_NOT_TRADABLE";
}

}  // namespace

// =============================================================================
// JupiterQuoteResponse
// =============================================================================

JupiterQuoteResponse JupiterQuoteResponse::from_json(const json& j) {
    try {
        JupiterQuoteResponse quote;
        std::string out_amount = j.at("outAmount").get<std::string>();
        if (out_amount.empty() || !std::all_of(out_amount.begin(), out_amount.end(),
                                                      [](char c) { return c >= '0' && c <= '9'; })) {
            throw ApiError(HTTP_OK, "Invalid outAmount: " + out_amount);
        }
        out_amount.erase(0, std::min(out_amount.find_first_not_of('0'), out_amount.size() - 1));
        quote.out_amount = BigInt(out_amount);

        for (const auto& step : j.at("routePlan")) {
            const json& info = step.at("swapInfo");
            JupiterRouteStep route;
            route.swap_info.amm_key = info.at("ammKey").get<std::string>();
            route.swap_info.label = info.value("label", std::string());
            route.swap_info.input_mint = info.value("inputMint", std::string());
            route.swap_info.output_mint = info.value("outputMint", std::string());
            route.swap_info.in_amount = info.value("inAmount", std::string());
            route.swap_info.out_amount = info.value("outAmount", std::string());
            route.swap_info.fee_amount = info.value("feeAmount", std::string());
            route.swap_info.fee_mint = info.value("feeMint", std::string());
            route.percent = step.value("percent", 0);
            quote.route_plan.push_back(std::move(route));
        }
        return quote;
    } catch (const json::exception& e) {
        throw ApiError(HTTP_OK, std::string("Malformed Jupiter quote: ") + e.what());
    }
}

std::string JupiterQuoteResponse::route_to_string() const {
    std::string out;
    for (const auto& step : route_plan) {
        if (!out.empty()) out += "/";
        out += step.swap_info.amm_key;
    }
    return out;
}

// =============================================================================
// JupiterVenue
// =============================================================================

JupiterVenue::JupiterVenue(const VenueContext& context)
    : chain_(require_solana(context.chain)),
      http_(require_http(context)),
      settings_(context.config.jupiter) {
    spdlog::info("Initialized Jupiter on {}", chain_);
}

Quote JupiterVenue::quote(const TokenInfo& token_out, const TokenInfo& token_in,
                          const Decimal& amount_in) {
    require_chain(token_out);
    require_chain(token_in);
    BigInt raw_in = token_in.to_base_units(amount_in);
    if (raw_in <= 0) {
        throw EngineError("Quote amount must be positive, got " + amount_in.to_string());
    }

    QueryParams params = {
        {"inputMint", token_in.address},
        {"outputMint", token_out.address},
        {"swapMode", "ExactIn"},
        {"amount", raw_in.str()},
        {"slippageBps", std::to_string(settings_.slippage_bps)},
    };
    spdlog::debug("Jupiter quote {} {} -> {}", amount_in.to_string(), token_in.symbol,
                  token_out.symbol);

    HttpResponse response = http_.get(settings_.quote_api_url, params);
    if (response.status_code == HTTP_BAD_REQUEST && is_no_route(response)) {
        throw NoMarket("Jupiter has no route for " + token_in.symbol + " -> " + token_out.symbol);
    }
    if (response.status_code != HTTP_OK) {
        throw ApiError(response.status_code, response.text);
    }

    json body = json::parse(response.text, nullptr, false);
    if (body.is_discarded()) {
        throw ApiError(response.status_code, "Jupiter returned invalid JSON: " + response.text);
    }
    JupiterQuoteResponse parsed = JupiterQuoteResponse::from_json(body);

    Quote result;
    result.token_out = token_out;
    result.token_in = token_in;
    result.amount_in = amount_in;
    result.amount_out = token_out.from_base_units(parsed.out_amount);
    result.price = result.amount_out / amount_in;
    for (const auto& step : parsed.route_plan) {
        result.route.push_back(step.swap_info.label.empty() ? step.swap_info.amm_key
                                                            : step.swap_info.label);
    }
    spdlog::debug("Jupiter quote: {} {} for {} {} via {}", result.amount_out.to_string(),
                  token_out.symbol, amount_in.to_string(), token_in.symbol,
                  parsed.route_to_string());
    return result;
}

Decimal JupiterVenue::get_token_price(const TokenInfo& token_out, const TokenInfo& token_in) {
    return quote(token_out, token_in, Decimal::one()).price;
}

SwapResult JupiterVenue::swap(const TokenInfo& base_token, const TokenInfo& quote_token,
                              const Decimal& quote_amount, long long slippage_bps) {
    (void)base_token; (void)quote_token; (void)quote_amount; (void)slippage_bps;
    throw NotImplemented("Jupiter swap is not implemented");
}

std::vector<Market> JupiterVenue::get_markets_for_tokens(const std::vector<TokenInfo>& tokens) {
    std::vector<Market> markets;
    for (size_t i = 0; i < tokens.size(); ++i) {
        for (size_t j = i + 1; j < tokens.size(); ++j) {
            const TokenInfo& a = tokens[i];
            const TokenInfo& b = tokens[j];
            if (a == b) continue;
            require_chain(a);
            require_chain(b);
            Market pair = canonical_order(a, b);
            if (std::find(markets.begin(), markets.end(), pair) != markets.end()) continue;
            try {
                get_token_price(pair.second, pair.first);
                markets.push_back(std::move(pair));
            } catch (const NoMarket& e) {
                spdlog::debug("Jupiter has no market for {}/{}: {}", a.symbol, b.symbol, e.what());
            } catch (const EngineError& e) {
                spdlog::warn("Skipping {}/{} on jupiter: {}", a.symbol, b.symbol, e.what());
            }
        }
    }
    return markets;
}

}  // namespace chainswap
