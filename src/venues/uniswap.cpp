// Chainswap - Uniswap Venue Base Implementation

#include <chainswap/venues/uniswap.hpp>
#include <chainswap/swap_execution.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace chainswap {

namespace {

EvmClient& require_evm(const VenueContext& context) {
    if (context.evm == nullptr) {
        throw UnsupportedChain(context.chain, "Uniswap requires an EVM chain, got " + context.chain);
    }
    return *context.evm;
}

}  // namespace

UniswapVenue::UniswapVenue(const VenueContext& context, std::string router)
    : evm_(require_evm(context)), chain_(context.chain), router_(std::move(router)) {
    if (evm_.chain() != chain_) {
        throw UnsupportedChain(chain_, "EVM client is bound to " + evm_.chain() +
                                           ", not " + chain_);
    }
}

Decimal UniswapVenue::get_token_price(const TokenInfo& token_out, const TokenInfo& token_in) {
    require_chain(token_out);
    require_chain(token_in);
    clear_markets();
    Decimal price = read_price(token_out, token_in);
    spdlog::debug("{} price on {}: {} {} per {}", name(), chain_, price.to_string(),
                  token_out.symbol, token_in.symbol);
    return price;
}

SwapResult UniswapVenue::swap(const TokenInfo& base_token, const TokenInfo& quote_token,
                              const Decimal& quote_amount, long long slippage_bps) {
    // =========================================================================
    // Pre-flight: nothing is broadcast until all of these pass
    // =========================================================================

    Slippage slippage(slippage_bps);
    require_chain(base_token);
    require_chain(quote_token);
    if (base_token.is_native || quote_token.is_native) {
        throw NotImplemented(std::string(name()) + " swaps ERC-20 tokens only; use the wrapped token");
    }
    if (!quote_amount.is_positive()) {
        throw EngineError("Swap amount must be positive, got " + quote_amount.to_string());
    }

    clear_markets();
    if (base_token == quote_token || !has_market(base_token, quote_token)) {
        throw NoMarket("No " + std::string(name()) + " market for " + base_token.to_string() +
                       "/" + quote_token.to_string());
    }

    const EvmSigner& signer = evm_.signer();
    const std::string& wallet = signer.address();
    spdlog::info("Swapping {} {} for {} on {} ({})", quote_amount.to_string(), quote_token.symbol,
                 base_token.symbol, name(), chain_);

    BigInt raw_in = quote_token.to_base_units(quote_amount);
    BigInt quote_balance = evm_.get_token_balance_raw(quote_token.address, wallet);
    BigInt base_balance = evm_.get_token_balance_raw(base_token.address, wallet);
    Decimal gas_balance = evm_.get_native_balance(wallet);
    spdlog::info("Balance of {}: {}", base_token.symbol,
                 base_token.from_base_units(base_balance).to_string());
    spdlog::info("Balance of {}: {}", quote_token.symbol,
                 quote_token.from_base_units(quote_balance).to_string());
    spdlog::info("Native balance for gas: {}", gas_balance.to_string());

    if (quote_balance.is_zero() || quote_balance < raw_in) {
        throw InsufficientBalance("Need " + quote_amount.to_string() + " " + quote_token.symbol +
                                  ", have " + quote_token.from_base_units(quote_balance).to_string());
    }

    SwapExecution execution(quote_token.symbol + "->" + base_token.symbol);

    // =========================================================================
    // Approval
    // =========================================================================

    try {
        TransactionReceipt approval = evm_.approve(quote_token.address, router_, raw_in, signer);
        execution.approved(approval.tx_hash);
    } catch (const TransactionReverted& e) {
        throw ApprovalFailed(e.tx_hash(), e.reason());
    }

    // =========================================================================
    // Swap
    // =========================================================================

    // From here on the approval is on chain; failures keep its hash observable
    try {
        Decimal price = read_price(base_token, quote_token);
        Decimal expected = quote_amount * price;
        BigInt min_out = slippage.minimum_amount(base_token.to_base_units(expected));
        spdlog::info("Expected {} {} at {}, minimum {} raw with {} bps slippage",
                     expected.to_string(), base_token.symbol, price.to_string(), min_out.str(),
                     slippage.bps());

        before_swap(base_token, quote_token, raw_in, slippage);

        uint64_t deadline = evm_.get_latest_block().timestamp + SWAP_DEADLINE_SECONDS;
        EvmCall call = build_swap_call(base_token, quote_token, raw_in, min_out, wallet, deadline);
        std::string tx_hash = evm_.send_transaction(call, signer);
        execution.submitted(tx_hash);

        TransactionReceipt receipt;
        try {
            receipt = evm_.confirm(tx_hash, evm_.policy().confirmation_blocks);
        } catch (const TransactionReverted& e) {
            execution.reverted();
            return execution.finish(SwapResult::build_error(quote_amount, e.reason(), tx_hash));
        }

        Decimal received =
            base_token.from_base_units(sum_transfers_to(receipt, base_token.address, wallet));
        execution.confirmed();
        spdlog::info("Swap {} received {} {}", tx_hash, received.to_string(), base_token.symbol);
        return execution.finish(SwapResult::build_success(quote_amount, received, tx_hash));
    } catch (TransactionTimeout& e) {
        execution.timed_out();
        e.set_approval_tx_hash(*execution.approval_tx_hash());
        throw;
    } catch (const EngineError& e) {
        spdlog::error("Swap {} failed after approval {}: {}", quote_token.symbol + "->" +
                      base_token.symbol, *execution.approval_tx_hash(), e.what());
        return execution.finish(SwapResult::build_error(quote_amount, e.what()));
    }
}

std::vector<Market> UniswapVenue::get_markets_for_tokens(const std::vector<TokenInfo>& tokens) {
    clear_markets();
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
                if (has_market(a, b)) {
                    markets.push_back(std::move(pair));
                }
            } catch (const EngineError& e) {
                spdlog::warn("Skipping {}/{} on {}: {}", a.symbol, b.symbol, name(), e.what());
            }
        }
    }
    return markets;
}

}  // namespace chainswap
