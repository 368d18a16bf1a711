#pragma once

#include "types.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <optional>

struct RouterConfig {
    double dominance_threshold = 0.6;   // market magnitude that decides direction alone
    double trend_threshold = 0.3;       // |trend score| needed when the market does not dominate
    double market_weight = 0.6;
    double trend_weight = 0.4;
    double disagreement_penalty = 0.5;  // confidence multiplier when both clear and disagree
    double base_risk_units = 20.0;      // suggested size at confidence 1.0

    void validate() const;
};

// Fuses the latest MarketSignal and TrendScore per symbol into a TradeIntent.
// Re-evaluates on either update; never blocks on downstream stages.
class StrategyRouter {
public:
    explicit StrategyRouter(RouterConfig cfg);

    std::optional<TradeIntent> on_market_signal(const MarketSignal& signal);
    std::optional<TradeIntent> on_trend_score(const TrendScore& score);

    // Pure fusion rule; the id is left at 0
    static std::optional<TradeIntent> fuse(const MarketSignal& market,
                                           const std::optional<TrendScore>& trend,
                                           const RouterConfig& cfg);

    std::optional<TrendScore> latest_trend(const std::string& symbol) const;

private:
    struct Inputs {
        std::optional<MarketSignal> market;
        std::optional<TrendScore> trend;
    };

    RouterConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, Inputs> inputs_;
    std::atomic<uint64_t> next_id_{1};

    std::optional<TradeIntent> evaluate(const Inputs& in);
};
