// Chainswap - Portfolio PnL
// FIFO lot matching of swaps against a base accounting token

#pragma once

#include <chainswap/types.hpp>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace chainswap {

// One executed swap as seen from the wallet
struct PortfolioSwap {
    TokenAmount sold;
    TokenAmount bought;
    uint64_t block_number = 0;
    std::string tx_hash;
};

// A token movement into or out of the wallet
struct Transfer {
    std::string tx_hash;
    uint64_t block_number = 0;
    TokenAmount amount;
};

// Pairs each incoming transfer with the outgoing transfer of the same transaction.
// Transactions without both legs are not swaps and are dropped. When a transaction
// has several outgoing transfers the last one is the sold leg.
std::vector<PortfolioSwap> match_swaps(const std::vector<Transfer>& incoming,
                                       const std::vector<Transfer>& outgoing);

struct PnlDetail {
    Decimal sold_amount;
    Decimal buying_price;   // base paid per unit
    Decimal selling_price;  // base received per unit
    Decimal pnl;
    std::string tx_hash;
};

struct OpenLot {
    Decimal amount;
    Decimal cost;  // base paid for the remaining amount
    Decimal buying_price;
    std::string tx_hash;
};

enum class PnlMode : uint8_t {
    Realized,
    Unrealized,
    Total
};

// Asset keys are normalized token addresses
class PortfolioPnl {
public:
    using PriceMap = std::map<std::string, Decimal>;

    void add_detail(const std::string& asset, PnlDetail detail);
    void set_open_lots(const std::string& asset, std::vector<OpenLot> lots);

    [[nodiscard]] const std::vector<PnlDetail>& details(const std::string& asset) const;
    [[nodiscard]] const std::map<std::string, std::vector<PnlDetail>>& details_per_asset() const {
        return details_;
    }
    [[nodiscard]] const std::vector<OpenLot>& open_lots(const std::string& asset) const;

    // Value of the asset's open lots at current_price minus their cost
    [[nodiscard]] Decimal unrealized(const std::string& asset, const Decimal& current_price) const;

    // Unrealized and Total need a current price for every asset with open lots
    [[nodiscard]] PriceMap pnl_per_asset(PnlMode mode = PnlMode::Realized,
                                         const PriceMap& current_prices = {}) const;
    [[nodiscard]] Decimal pnl(PnlMode mode = PnlMode::Realized,
                              const PriceMap& current_prices = {}) const;

private:
    [[nodiscard]] Decimal realized(const std::string& asset) const;

    std::map<std::string, std::vector<PnlDetail>> details_;
    std::map<std::string, std::vector<OpenLot>> open_lots_;
};

// Applies swaps in the order given; compute_pnl_fifo sorts them first
class FifoReconciler {
public:
    explicit FifoReconciler(TokenInfo base_token) : base_(std::move(base_token)) {}

    // Throws ReconciliationError when selling more than the open lots hold; a
    // rejected swap leaves the reconciler unchanged
    void apply(const PortfolioSwap& swap);

    [[nodiscard]] PortfolioPnl result() const;

private:
    TokenInfo base_;
    PortfolioPnl pnl_;
    std::map<std::string, std::deque<OpenLot>> lots_;
};

// Stable-sorts by block number and reconciles against `base_token`
PortfolioPnl compute_pnl_fifo(std::vector<PortfolioSwap> swaps, const TokenInfo& base_token);

}  // namespace chainswap
