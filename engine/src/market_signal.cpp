#include "market_signal.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

MarketSignalGenerator::MarketSignalGenerator(MarketSignalConfig cfg) : config_(cfg) {
    if (config_.depth < 1) {
        throw ConfigError("market signal depth must be >= 1");
    }
    if (config_.long_threshold < 0.0 || config_.short_threshold > 0.0) {
        throw ConfigError("market signal thresholds must straddle zero");
    }
    if (config_.normalization <= 0.0 || config_.normalization > 1.0) {
        throw ConfigError("market signal normalization must be in (0,1]");
    }
}

void MarketSignalGenerator::validate(const OrderBookSnapshot& s) {
    if (s.symbol.empty()) {
        throw InvalidSnapshot("missing symbol");
    }
    if (s.bids.empty() || s.asks.empty()) {
        throw InvalidSnapshot(s.symbol + ": empty book side");
    }

    auto check_levels = [&s](const std::vector<PriceLevel>& levels, bool descending) {
        for (size_t i = 0; i < levels.size(); ++i) {
            const auto& lvl = levels[i];
            if (!std::isfinite(lvl.price) || !std::isfinite(lvl.size) ||
                lvl.price <= 0.0 || lvl.size < 0.0) {
                throw InvalidSnapshot(s.symbol + ": bad level");
            }
            if (i > 0) {
                double prev = levels[i - 1].price;
                bool ordered = descending ? lvl.price < prev : lvl.price > prev;
                if (!ordered) {
                    throw InvalidSnapshot(s.symbol + ": levels out of order");
                }
            }
        }
    };
    check_levels(s.bids, true);
    check_levels(s.asks, false);

    if (s.best_bid != s.bids.front().price || s.best_ask != s.asks.front().price) {
        throw InvalidSnapshot(s.symbol + ": best bid/ask disagree with levels");
    }
    if (s.best_bid >= s.best_ask) {
        throw InvalidSnapshot(s.symbol + ": crossed book");
    }
}

double MarketSignalGenerator::imbalance(const OrderBookSnapshot& s, int depth) {
    size_t k = static_cast<size_t>(depth);
    double bid_vol = 0.0;
    double ask_vol = 0.0;

    for (size_t i = 0; i < std::min(k, s.bids.size()); ++i) bid_vol += s.bids[i].size;
    for (size_t i = 0; i < std::min(k, s.asks.size()); ++i) ask_vol += s.asks[i].size;

    double total = bid_vol + ask_vol;
    if (total <= 0.0) {
        throw InvalidSnapshot(s.symbol + ": no liquidity in top levels");
    }
    return (bid_vol - ask_vol) / total;
}

MarketSignal MarketSignalGenerator::generate(const OrderBookSnapshot& snapshot) const {
    validate(snapshot);

    MarketSignal sig;
    sig.symbol = snapshot.symbol;
    sig.ts_ms = snapshot.ts_ms;
    sig.best_bid = snapshot.best_bid;
    sig.best_ask = snapshot.best_ask;
    sig.imbalance = imbalance(snapshot, config_.depth);

    if (sig.imbalance > config_.long_threshold) {
        sig.direction = Direction::Long;
    } else if (sig.imbalance < config_.short_threshold) {
        sig.direction = Direction::Short;
    } else {
        sig.direction = Direction::Flat;
    }

    sig.magnitude = std::clamp(std::fabs(sig.imbalance) / config_.normalization, 0.0, 1.0);
    return sig;
}
