// Chainswap - Portfolio PnL Tests

#include <catch2/catch_test_macros.hpp>
#include <chainswap/portfolio.hpp>
#include "support/evm_fixtures.hpp"

using namespace chainswap;
using namespace chainswap::testing;

namespace {

const TokenInfo USDC = test_token("USDC", MAINNET_USDC, 6);
const TokenInfo WETH = test_token("WETH", MAINNET_WETH, 18);
const TokenInfo LINK = test_token("LINK", "0x514910771AF9Ca656af840dff83E8264EcF986CA", 18);

Decimal dec(const char* text) {
    return Decimal::from_string(text);
}

PortfolioSwap trade(const TokenInfo& sold, const char* sold_amount, const TokenInfo& bought,
                   const char* bought_amount, uint64_t block, const std::string& tx_hash) {
    return PortfolioSwap{TokenAmount{sold, dec(sold_amount)}, TokenAmount{bought, dec(bought_amount)},
                         block, tx_hash};
}

std::string key(const TokenInfo& token) {
    return token.address_key();
}

}  // namespace

TEST_CASE("FIFO realized PnL", "[portfolio]") {
    std::vector<PortfolioSwap> swaps = {
        trade(USDC, "2000", WETH, "1", 10, "0x01"),
        trade(USDC, "3000", WETH, "1", 20, "0x02"),
        trade(WETH, "1.5", USDC, "3750", 30, "0x03"),
    };
    PortfolioPnl pnl = compute_pnl_fifo(swaps, USDC);

    SECTION("Oldest lots are consumed first") {
        const auto& details = pnl.details(WETH.address);
        REQUIRE(details.size() == 2);
        REQUIRE(details[0].sold_amount == dec("1"));
        REQUIRE(details[0].buying_price == dec("2000"));
        REQUIRE(details[0].selling_price == dec("2500"));
        REQUIRE(details[0].pnl == dec("500"));
        REQUIRE(details[0].tx_hash == "0x03");
        REQUIRE(details[1].sold_amount == dec("0.5"));
        REQUIRE(details[1].buying_price == dec("3000"));
        REQUIRE(details[1].pnl == dec("-250"));
        REQUIRE(pnl.pnl() == dec("250"));
    }

    SECTION("Remainder of a partially sold lot stays open") {
        const auto& lots = pnl.open_lots(WETH.address);
        REQUIRE(lots.size() == 1);
        REQUIRE(lots[0].amount == dec("0.5"));
        REQUIRE(lots[0].buying_price == dec("3000"));
        REQUIRE(lots[0].tx_hash == "0x02");
    }

    SECTION("Unrealized and total need current prices") {
        PortfolioPnl::PriceMap prices = {{key(WETH), dec("3200")}};
        REQUIRE(pnl.unrealized(WETH.address, dec("3200")) == dec("100"));
        REQUIRE(pnl.pnl(PnlMode::Unrealized, prices) == dec("100"));
        REQUIRE(pnl.pnl(PnlMode::Total, prices) == dec("350"));
        REQUIRE(pnl.pnl_per_asset(PnlMode::Total, prices).at(key(WETH)) == dec("350"));

        REQUIRE_THROWS_AS(pnl.pnl(PnlMode::Unrealized), ReconciliationError);
        REQUIRE_THROWS_AS(pnl.pnl(PnlMode::Total, {{key(LINK), dec("10")}}), ReconciliationError);
    }
}

TEST_CASE("Closed round trips", "[portfolio]") {
    std::vector<PortfolioSwap> swaps = {
        trade(USDC, "100", LINK, "10", 5, "0x0a"),
        trade(LINK, "10", USDC, "150", 6, "0x0b"),
        trade(USDC, "1000", WETH, "0.5", 7, "0x0c"),
        trade(WETH, "0.5", USDC, "900", 8, "0x0d"),
    };
    PortfolioPnl pnl = compute_pnl_fifo(swaps, USDC);

    REQUIRE(pnl.open_lots(LINK.address).empty());
    REQUIRE(pnl.open_lots(WETH.address).empty());

    PortfolioPnl::PriceMap per_asset = pnl.pnl_per_asset();
    REQUIRE(per_asset.size() == 2);
    REQUIRE(per_asset.at(key(LINK)) == dec("50"));
    REQUIRE(per_asset.at(key(WETH)) == dec("-100"));
    REQUIRE(pnl.pnl() == dec("-50"));

    // Nothing open, so no prices are needed
    REQUIRE(pnl.pnl(PnlMode::Unrealized).is_zero());
    REQUIRE(pnl.pnl(PnlMode::Total) == dec("-50"));
}

TEST_CASE("Realized PnL is exact for non-terminating prices", "[portfolio]") {
    SECTION("Closed round trip at thirds") {
        PortfolioPnl pnl = compute_pnl_fifo({trade(USDC, "1", LINK, "3", 1, "0x01"),
                                             trade(LINK, "3", USDC, "2", 2, "0x02")},
                                            USDC);
        REQUIRE(pnl.pnl() == dec("1"));
        REQUIRE(pnl.open_lots(LINK.address).empty());
    }

    SECTION("Sells split across lots sum to proceeds minus cost") {
        PortfolioPnl pnl = compute_pnl_fifo({trade(USDC, "1", LINK, "3", 1, "0x01"),
                                             trade(USDC, "2", LINK, "7", 2, "0x02"),
                                             trade(LINK, "4", USDC, "5", 3, "0x03"),
                                             trade(LINK, "6", USDC, "1", 4, "0x04")},
                                            USDC);
        REQUIRE(pnl.details(LINK.address).size() == 3);
        REQUIRE(pnl.pnl() == dec("3"));
        REQUIRE(pnl.open_lots(LINK.address).empty());
    }

    SECTION("Unrealized uses the remaining cost") {
        PortfolioPnl pnl = compute_pnl_fifo({trade(USDC, "1", LINK, "3", 1, "0x01"),
                                             trade(LINK, "1", USDC, "1", 2, "0x02")},
                                            USDC);
        // Two thirds of the cost stays open; realized plus unrealized is value minus cost
        REQUIRE(pnl.pnl(PnlMode::Total, {{key(LINK), dec("1")}}) == dec("2"));
    }
}

TEST_CASE("Reconciliation ordering and errors", "[portfolio]") {
    SECTION("Swaps are sorted by block before matching") {
        std::vector<PortfolioSwap> swaps = {
            trade(LINK, "4", USDC, "60", 12, "0x03"),
            trade(USDC, "40", LINK, "4", 11, "0x01"),
        };
        PortfolioPnl pnl = compute_pnl_fifo(swaps, USDC);
        REQUIRE(pnl.pnl() == dec("20"));
    }

    SECTION("Same-block swaps keep their given order") {
        std::vector<PortfolioSwap> swaps = {
            trade(USDC, "40", LINK, "4", 11, "0x01"),
            trade(LINK, "4", USDC, "48", 11, "0x02"),
        };
        REQUIRE(compute_pnl_fifo(swaps, USDC).pnl() == dec("8"));
    }

    SECTION("Selling more than was bought") {
        std::vector<PortfolioSwap> swaps = {
            trade(USDC, "40", LINK, "4", 11, "0x01"),
            trade(LINK, "5", USDC, "75", 12, "0x02"),
        };
        REQUIRE_THROWS_AS(compute_pnl_fifo(swaps, USDC), ReconciliationError);
    }

    SECTION("A rejected sell leaves earlier lots untouched") {
        FifoReconciler reconciler(USDC);
        reconciler.apply(trade(USDC, "10", LINK, "1", 1, "0x01"));
        REQUIRE_THROWS_AS(reconciler.apply(trade(LINK, "2", USDC, "30", 2, "0x02")),
                          ReconciliationError);

        PortfolioPnl pnl = reconciler.result();
        REQUIRE(pnl.details_per_asset().empty());
        REQUIRE(pnl.pnl().is_zero());
        const auto& lots = pnl.open_lots(LINK.address);
        REQUIRE(lots.size() == 1);
        REQUIRE(lots[0].amount == dec("1"));
        REQUIRE(lots[0].cost == dec("10"));

        reconciler.apply(trade(LINK, "1", USDC, "15", 3, "0x03"));
        REQUIRE(reconciler.result().pnl() == dec("5"));
    }

    SECTION("Selling with no position at all") {
        REQUIRE_THROWS_AS(compute_pnl_fifo({trade(WETH, "1", USDC, "2000", 1, "0x01")}, USDC),
                          ReconciliationError);
    }

    SECTION("Zero legs are rejected") {
        FifoReconciler reconciler(USDC);
        REQUIRE_THROWS_AS(reconciler.apply(trade(USDC, "100", LINK, "0", 1, "0x01")),
                          ReconciliationError);
    }

    SECTION("Swaps not involving the base token are ignored") {
        FifoReconciler reconciler(USDC);
        reconciler.apply(trade(WETH, "1", LINK, "150", 1, "0x01"));
        PortfolioPnl pnl = reconciler.result();
        REQUIRE(pnl.details_per_asset().empty());
        REQUIRE(pnl.open_lots(LINK.address).empty());
    }
}

TEST_CASE("Matching transfers into swaps", "[portfolio]") {
    std::vector<Transfer> incoming = {
        {"0xaa", 101, TokenAmount{WETH, dec("1")}},
        {"0xbb", 102, TokenAmount{LINK, dec("20")}},  // airdrop, no outgoing leg
        {"0xcc", 103, TokenAmount{USDC, dec("150")}},
    };
    std::vector<Transfer> outgoing = {
        {"0xcc", 103, TokenAmount{LINK, dec("10")}},
        {"0xaa", 101, TokenAmount{USDC, dec("2000")}},
        {"0xdd", 104, TokenAmount{USDC, dec("5")}},  // plain send
    };

    std::vector<PortfolioSwap> swaps = match_swaps(incoming, outgoing);
    REQUIRE(swaps.size() == 2);
    REQUIRE(swaps[0].tx_hash == "0xaa");
    REQUIRE(swaps[0].sold.token == USDC);
    REQUIRE(swaps[0].sold.value == dec("2000"));
    REQUIRE(swaps[0].bought.token == WETH);
    REQUIRE(swaps[0].block_number == 101);
    REQUIRE(swaps[1].tx_hash == "0xcc");
    REQUIRE(swaps[1].sold.token == LINK);
    REQUIRE(swaps[1].bought.token == USDC);

    REQUIRE(match_swaps({}, outgoing).empty());
}

TEST_CASE("The last outgoing transfer of a transaction is the sold leg", "[portfolio]") {
    std::vector<Transfer> incoming = {{"0xaa", 101, TokenAmount{WETH, dec("1")}}};
    std::vector<Transfer> outgoing = {
        {"0xaa", 101, TokenAmount{LINK, dec("3")}},
        {"0xaa", 101, TokenAmount{USDC, dec("2000")}},
    };

    std::vector<PortfolioSwap> swaps = match_swaps(incoming, outgoing);
    REQUIRE(swaps.size() == 1);
    REQUIRE(swaps[0].sold.token == USDC);
    REQUIRE(swaps[0].sold.value == dec("2000"));
}

TEST_CASE("FIFO against a WETH base", "[portfolio]") {
    SECTION("Two sells from the first lot") {
        std::vector<PortfolioSwap> swaps = {
            trade(WETH, "1", USDC, "10", 1, "0x01"),
            trade(USDC, "5", WETH, "2", 2, "0x02"),
            trade(WETH, "1", USDC, "8", 3, "0x03"),
            trade(USDC, "2", WETH, "2", 4, "0x04"),
        };
        PortfolioPnl pnl = compute_pnl_fifo(swaps, WETH);

        const auto& details = pnl.details(USDC.address);
        REQUIRE(details.size() == 2);
        REQUIRE(details[0].sold_amount == dec("5"));
        REQUIRE(details[0].buying_price == dec("0.1"));
        REQUIRE(details[0].selling_price == dec("0.4"));
        REQUIRE(details[0].pnl == dec("1.5"));
        REQUIRE(details[1].sold_amount == dec("2"));
        REQUIRE(details[1].buying_price == dec("0.1"));
        REQUIRE(details[1].selling_price == dec("1"));
        REQUIRE(details[1].pnl == dec("1.8"));
        REQUIRE(pnl.pnl() == dec("3.3"));
    }

    SECTION("A sell spanning two lots") {
        std::vector<PortfolioSwap> swaps = {
            trade(WETH, "1", USDC, "10", 1, "0x01"),
            trade(WETH, "1", USDC, "5", 2, "0x02"),
            trade(USDC, "5", WETH, "0.75", 3, "0x03"),
            trade(USDC, "7", WETH, "7", 4, "0x04"),
            trade(USDC, "3", WETH, "0.03", 5, "0x05"),
        };
        PortfolioPnl pnl = compute_pnl_fifo(swaps, WETH);

        const auto& details = pnl.details(USDC.address);
        REQUIRE(details.size() == 4);
        REQUIRE(details[0].pnl == dec("0.25"));
        REQUIRE(details[1].pnl == dec("4.5"));
        REQUIRE(details[2].pnl == dec("1.6"));
        REQUIRE(details[3].pnl == dec("-0.57"));
        REQUIRE(pnl.pnl() == dec("5.78"));
        REQUIRE(pnl.open_lots(USDC.address).empty());
    }
}
