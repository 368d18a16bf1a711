#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/text_scorer.hpp"
#include <cmath>

using Catch::Approx;

TEST_CASE("Lexicon scoring", "[text_scorer]") {
    LexiconScorer scorer;

    SECTION("Bullish chatter scores positive") {
        auto s = scorer.score("SOL is going to the moon, super bullish");
        REQUIRE(s.score > 0.5);
        REQUIRE(s.confidence == Approx(s.score));
        REQUIRE(s.matched_terms == 2);
    }

    SECTION("Bearish chatter scores negative") {
        auto s = scorer.score("Looks like a rug pull, total scam");
        REQUIRE(s.score < -0.5);
        REQUIRE(s.confidence == Approx(-s.score));
    }

    SECTION("Phrases win over their words") {
        // "to the moon" counts once at 3.5, not plus "moon" at 3.0
        auto s = scorer.score("to the moon");
        REQUIRE(s.matched_terms == 1);
        REQUIRE(s.score == Approx(3.5 / std::sqrt(3.5 * 3.5 + 15.0)));
    }

    SECTION("Negation flips a term") {
        auto plain = scorer.score("bullish");
        auto negated = scorer.score("not bullish");
        REQUIRE(plain.score > 0.0);
        REQUIRE(negated.score < 0.0);
        REQUIRE(std::fabs(negated.score) < plain.score);
    }

    SECTION("Contractions are folded") {
        REQUIRE(scorer.score("don't sell").score > 0.0);
    }

    SECTION("No known terms is zero confidence") {
        auto s = scorer.score("the weather is nice today");
        REQUIRE(s.matched_terms == 0);
        REQUIRE(s.score == 0.0);
        REQUIRE(s.confidence == 0.0);
    }

    SECTION("Extra terms extend the lexicon") {
        LexiconScorer custom({{"airdrop", 2.0}});
        REQUIRE(custom.score("big airdrop").score > 0.0);
        REQUIRE(scorer.score("big airdrop").matched_terms == 0);
    }

    SECTION("Scores stay bounded") {
        auto s = scorer.score("moon moon moon moon moon moon moon moon moon moon");
        REQUIRE(s.score <= 1.0);
        REQUIRE(s.score > 0.9);
    }
}

TEST_CASE("Symbol mapping", "[text_scorer]") {
    SymbolMapper mapper;

    SECTION("Cashtags map first") {
        REQUIRE(mapper.map_text("Loading up on $ETH while bitcoin stalls") == std::optional<std::string>("ETHUSDT"));
    }

    SECTION("Keywords are whole words, case-insensitive") {
        REQUIRE(mapper.map_text("Solana breakout incoming") == std::optional<std::string>("SOLUSDT"));
        REQUIRE_FALSE(mapper.map_text("console output").has_value());
    }

    SECTION("Longest keyword wins") {
        REQUIRE(mapper.map_text("btc and ethereum") == std::optional<std::string>("ETHUSDT"));
    }

    SECTION("Unknown text has no symbol") {
        REQUIRE_FALSE(mapper.map_text("nothing to see here").has_value());
    }

    SECTION("Custom keywords") {
        mapper.add_keyword("PEPE", "PEPEUSDT");
        REQUIRE(mapper.map_text("pepe season") == std::optional<std::string>("PEPEUSDT"));
    }
}
