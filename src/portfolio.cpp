// Chainswap - Portfolio PnL Implementation

#include <chainswap/portfolio.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_map>

namespace chainswap {

std::vector<PortfolioSwap> match_swaps(const std::vector<Transfer>& incoming,
                                       const std::vector<Transfer>& outgoing) {
    std::unordered_map<std::string, const Transfer*> out_by_hash;
    for (const auto& transfer : outgoing) {
        out_by_hash[transfer.tx_hash] = &transfer;
    }

    std::vector<PortfolioSwap> swaps;
    for (const auto& transfer : incoming) {
        auto it = out_by_hash.find(transfer.tx_hash);
        if (it == out_by_hash.end()) continue;
        swaps.push_back(PortfolioSwap{it->second->amount, transfer.amount, transfer.block_number,
                                      transfer.tx_hash});
    }
    return swaps;
}

// =============================================================================
// PortfolioPnl
// =============================================================================

void PortfolioPnl::add_detail(const std::string& asset, PnlDetail detail) {
    details_[asset].push_back(std::move(detail));
}

void PortfolioPnl::set_open_lots(const std::string& asset, std::vector<OpenLot> lots) {
    if (lots.empty()) {
        open_lots_.erase(asset);
    } else {
        open_lots_[asset] = std::move(lots);
    }
}

const std::vector<PnlDetail>& PortfolioPnl::details(const std::string& asset) const {
    static const std::vector<PnlDetail> empty;
    auto it = details_.find(normalize_address(asset));
    return it == details_.end() ? empty : it->second;
}

const std::vector<OpenLot>& PortfolioPnl::open_lots(const std::string& asset) const {
    static const std::vector<OpenLot> empty;
    auto it = open_lots_.find(normalize_address(asset));
    return it == open_lots_.end() ? empty : it->second;
}

Decimal PortfolioPnl::realized(const std::string& asset) const {
    Decimal total;
    for (const auto& detail : details(asset)) {
        total += detail.pnl;
    }
    return total;
}

Decimal PortfolioPnl::unrealized(const std::string& asset, const Decimal& current_price) const {
    Decimal total;
    for (const auto& lot : open_lots(asset)) {
        total += lot.amount * current_price - lot.cost;
    }
    return total;
}

PortfolioPnl::PriceMap PortfolioPnl::pnl_per_asset(PnlMode mode,
                                                   const PriceMap& current_prices) const {
    PriceMap result;
    if (mode != PnlMode::Unrealized) {
        for (const auto& [asset, entries] : details_) {
            result[asset] = realized(asset);
        }
    }
    if (mode != PnlMode::Realized) {
        for (const auto& [asset, lots] : open_lots_) {
            auto price = current_prices.find(asset);
            if (price == current_prices.end()) {
                throw ReconciliationError("No current price for open position in " + asset);
            }
            result[asset] += unrealized(asset, price->second);
        }
    }
    return result;
}

Decimal PortfolioPnl::pnl(PnlMode mode, const PriceMap& current_prices) const {
    Decimal total;
    for (const auto& [asset, value] : pnl_per_asset(mode, current_prices)) {
        total += value;
    }
    return total;
}

// =============================================================================
// FifoReconciler
// =============================================================================

void FifoReconciler::apply(const PortfolioSwap& swap) {
    const TokenInfo& sold = swap.sold.token;
    const TokenInfo& bought = swap.bought.token;

    if (sold == base_ && bought != base_) {
        if (!swap.bought.value.is_positive() || !swap.sold.value.is_positive()) {
            throw ReconciliationError("Swap " + swap.tx_hash + " has a non-positive leg");
        }
        OpenLot lot{swap.bought.value, swap.sold.value, swap.sold.value / swap.bought.value,
                    swap.tx_hash};
        spdlog::debug("Open lot {} {} at {} {}", lot.amount.to_string(), bought.symbol,
                      lot.buying_price.to_string(), base_.symbol);
        lots_[bought.address_key()].push_back(std::move(lot));
        return;
    }

    if (bought == base_ && sold != base_) {
        if (!swap.sold.value.is_positive()) {
            throw ReconciliationError("Swap " + swap.tx_hash + " has a non-positive leg");
        }
        std::string asset = sold.address_key();
        std::deque<OpenLot>& queue = lots_[asset];

        Decimal held;
        for (const auto& lot : queue) {
            held += lot.amount;
        }
        if (held < swap.sold.value) {
            throw ReconciliationError("Swap " + swap.tx_hash + " sells " +
                                      (swap.sold.value - held).to_string() + " " + sold.symbol +
                                      " more than held in open lots");
        }

        // Proceeds and cost are split pro rata; the final share of each takes the
        // exact remainder so realized PnL sums to proceeds minus cost
        Decimal selling_price = swap.bought.value / swap.sold.value;
        Decimal remaining = swap.sold.value;
        Decimal proceeds_left = swap.bought.value;

        while (remaining.is_positive()) {
            OpenLot& lot = queue.front();
            Decimal take = std::min(remaining, lot.amount);
            Decimal cost = take == lot.amount ? lot.cost : take * lot.cost / lot.amount;
            Decimal proceeds =
                take == remaining ? proceeds_left : take * swap.bought.value / swap.sold.value;

            pnl_.add_detail(asset, PnlDetail{take, lot.buying_price, selling_price,
                                             proceeds - cost, swap.tx_hash});
            lot.amount -= take;
            lot.cost -= cost;
            remaining -= take;
            proceeds_left -= proceeds;
            if (lot.amount.is_zero()) {
                queue.pop_front();
            }
        }
        return;
    }

    spdlog::debug("Ignoring swap {}: {} -> {} does not involve {}", swap.tx_hash, sold.symbol,
                  bought.symbol, base_.symbol);
}

PortfolioPnl FifoReconciler::result() const {
    PortfolioPnl out = pnl_;
    for (const auto& [asset, queue] : lots_) {
        out.set_open_lots(asset, std::vector<OpenLot>(queue.begin(), queue.end()));
    }
    return out;
}

PortfolioPnl compute_pnl_fifo(std::vector<PortfolioSwap> swaps, const TokenInfo& base_token) {
    std::stable_sort(swaps.begin(), swaps.end(),
                     [](const PortfolioSwap& a, const PortfolioSwap& b) {
                         return a.block_number < b.block_number;
                     });
    FifoReconciler reconciler(base_token);
    for (const auto& swap : swaps) {
        reconciler.apply(swap);
    }
    return reconciler.result();
}

}  // namespace chainswap
