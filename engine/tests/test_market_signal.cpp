#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/market_signal.hpp"
#include "../src/errors.hpp"

using Catch::Approx;

static OrderBookSnapshot make_book(std::vector<PriceLevel> bids, std::vector<PriceLevel> asks) {
    OrderBookSnapshot s;
    s.symbol = "BTCUSDT";
    s.ts_ms = 1700000000000;
    s.bids = bids;
    s.asks = asks;
    s.best_bid = bids.empty() ? 0.0 : bids.front().price;
    s.best_ask = asks.empty() ? 0.0 : asks.front().price;
    return s;
}

TEST_CASE("Order book imbalance signal", "[market_signal]") {
    MarketSignalGenerator gen;

    SECTION("Bid-heavy book is long with magnitude equal to imbalance") {
        // 95 vs 5 -> imbalance 0.9
        auto book = make_book({{100.0, 50.0}, {99.9, 45.0}}, {{100.1, 3.0}, {100.2, 2.0}});
        auto sig = gen.generate(book);

        REQUIRE(sig.direction == Direction::Long);
        REQUIRE(sig.imbalance == Approx(0.9));
        REQUIRE(sig.magnitude == Approx(0.9));
        REQUIRE(sig.reference_price(Direction::Long) == 100.1);
        REQUIRE(sig.reference_price(Direction::Short) == 100.0);
    }

    SECTION("Ask-heavy book is short") {
        auto book = make_book({{100.0, 1.0}}, {{100.1, 9.0}});
        auto sig = gen.generate(book);

        REQUIRE(sig.direction == Direction::Short);
        REQUIRE(sig.imbalance == Approx(-0.8));
        REQUIRE(sig.magnitude == Approx(0.8));
    }

    SECTION("Balanced book is flat") {
        auto book = make_book({{100.0, 10.0}}, {{100.1, 11.0}});
        auto sig = gen.generate(book);

        REQUIRE(sig.direction == Direction::Flat);
        REQUIRE(sig.magnitude < 0.2);
    }

    SECTION("Only the top K levels count") {
        MarketSignalGenerator shallow(MarketSignalConfig{1, 0.2, -0.2, 1.0});
        // Deep bid liquidity beyond level 1 is ignored
        auto book = make_book({{100.0, 1.0}, {99.0, 1000.0}}, {{100.1, 1.0}, {101.0, 1.0}});

        REQUIRE(shallow.generate(book).direction == Direction::Flat);
        REQUIRE(gen.generate(book).direction == Direction::Long);
    }

    SECTION("Normalization scales and clips magnitude") {
        MarketSignalGenerator scaled(MarketSignalConfig{5, 0.2, -0.2, 0.5});
        auto book = make_book({{100.0, 3.0}}, {{100.1, 1.0}});    // imbalance 0.5
        REQUIRE(scaled.generate(book).magnitude == Approx(1.0));

        auto mild = make_book({{100.0, 1.5}}, {{100.1, 1.0}});    // imbalance 0.2
        REQUIRE(scaled.generate(mild).magnitude == Approx(0.4));
    }
}

TEST_CASE("Malformed snapshots are rejected", "[market_signal]") {
    MarketSignalGenerator gen;

    SECTION("Empty side") {
        auto book = make_book({}, {{100.1, 1.0}});
        REQUIRE_THROWS_AS(gen.generate(book), InvalidSnapshot);
    }

    SECTION("Crossed book") {
        auto book = make_book({{100.2, 1.0}}, {{100.1, 1.0}});
        REQUIRE_THROWS_AS(gen.generate(book), InvalidSnapshot);
    }

    SECTION("Unsorted levels") {
        auto book = make_book({{99.0, 1.0}, {100.0, 1.0}}, {{100.1, 1.0}});
        REQUIRE_THROWS_AS(gen.generate(book), InvalidSnapshot);
    }

    SECTION("Negative size") {
        auto book = make_book({{100.0, -1.0}}, {{100.1, 1.0}});
        REQUIRE_THROWS_AS(gen.generate(book), InvalidSnapshot);
    }

    SECTION("Best prices disagree with levels") {
        auto book = make_book({{100.0, 1.0}}, {{100.1, 1.0}});
        book.best_bid = 99.5;
        REQUIRE_THROWS_AS(gen.generate(book), InvalidSnapshot);
    }

    SECTION("No liquidity") {
        auto book = make_book({{100.0, 0.0}}, {{100.1, 0.0}});
        REQUIRE_THROWS_AS(gen.generate(book), InvalidSnapshot);
    }

    SECTION("Missing symbol") {
        auto book = make_book({{100.0, 1.0}}, {{100.1, 1.0}});
        book.symbol.clear();
        REQUIRE_THROWS_AS(gen.generate(book), InputError);
    }
}
