#include "strategy_router.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

void RouterConfig::validate() const {
    auto in_unit = [](double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; };

    if (!in_unit(dominance_threshold) || !in_unit(trend_threshold)) {
        throw ConfigError("router thresholds must be in [0,1]");
    }
    if (!in_unit(market_weight) || !in_unit(trend_weight) ||
        std::fabs(market_weight + trend_weight - 1.0) > 1e-9) {
        throw ConfigError("router weights must be in [0,1] and sum to 1");
    }
    if (!in_unit(disagreement_penalty)) {
        throw ConfigError("disagreement penalty must be in [0,1]");
    }
    if (!std::isfinite(base_risk_units) || base_risk_units <= 0.0) {
        throw ConfigError("base risk units must be > 0");
    }
}

StrategyRouter::StrategyRouter(RouterConfig cfg) : config_(cfg) {
    config_.validate();
}

std::optional<TradeIntent> StrategyRouter::fuse(const MarketSignal& market,
                                                const std::optional<TrendScore>& trend,
                                                const RouterConfig& cfg) {
    double trend_value = trend ? trend->score : 0.0;
    Direction trend_dir = trend_value > 0.0 ? Direction::Long
                        : trend_value < 0.0 ? Direction::Short
                        : Direction::Flat;

    bool market_clears = market.direction != Direction::Flat &&
                         market.magnitude >= cfg.dominance_threshold;
    bool trend_clears = std::fabs(trend_value) > cfg.trend_threshold;

    Direction dir = Direction::Flat;
    if (market_clears) {
        dir = market.direction;
    } else if (trend_clears) {
        dir = trend_dir;
    }
    if (dir == Direction::Flat) {
        return std::nullopt;
    }

    double ref = market.reference_price(dir);
    if (ref <= 0.0) {
        return std::nullopt;
    }

    TradeIntent intent;
    intent.symbol = market.symbol;
    intent.direction = dir;
    intent.confidence = cfg.market_weight * market.magnitude +
                        cfg.trend_weight * std::fabs(trend_value);
    if (market_clears && trend_clears && trend_dir != market.direction) {
        intent.disagreement = true;
        intent.confidence *= cfg.disagreement_penalty;
    }
    intent.confidence = std::clamp(intent.confidence, 0.0, 1.0);
    intent.suggested_size = cfg.base_risk_units * intent.confidence;
    intent.reference_price = ref;

    intent.market_ts_ms = market.ts_ms;
    intent.market_direction = market.direction;
    intent.market_magnitude = market.magnitude;
    if (trend) {
        intent.trend_ts_ms = trend->ts_ms;
        intent.trend_score = trend->score;
        intent.trend_source = trend->source_tag;
    } else {
        intent.trend_source = "none";
    }
    intent.ts_ms = std::max(intent.market_ts_ms, intent.trend_ts_ms);
    return intent;
}

std::optional<TradeIntent> StrategyRouter::evaluate(const Inputs& in) {
    // No reference price without a book
    if (!in.market) {
        return std::nullopt;
    }
    auto intent = fuse(*in.market, in.trend, config_);
    if (intent) {
        intent->id = next_id_++;
        spdlog::debug("Intent #{} {} {} conf={:.3f} size={:.2f}{}",
                      intent->id, intent->symbol, direction_name(intent->direction),
                      intent->confidence, intent->suggested_size,
                      intent->disagreement ? " (disagreement)" : "");
    }
    return intent;
}

std::optional<TradeIntent> StrategyRouter::on_market_signal(const MarketSignal& signal) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& in = inputs_[signal.symbol];
    in.market = signal;
    return evaluate(in);
}

std::optional<TradeIntent> StrategyRouter::on_trend_score(const TrendScore& score) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& in = inputs_[score.symbol];
    in.trend = score;
    return evaluate(in);
}

std::optional<TrendScore> StrategyRouter::latest_trend(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = inputs_.find(symbol);
    if (it == inputs_.end()) return std::nullopt;
    return it->second.trend;
}
