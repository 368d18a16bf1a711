#include "types.hpp"
#include "errors.hpp"
#include <fmt/format.h>
#include <cmath>

const char* direction_name(Direction d) {
    switch (d) {
        case Direction::Long: return "long";
        case Direction::Short: return "short";
        default: return "flat";
    }
}

Direction opposite(Direction d) {
    if (d == Direction::Long) return Direction::Short;
    if (d == Direction::Short) return Direction::Long;
    return Direction::Flat;
}

double MarketSignal::reference_price(Direction d) const {
    if (d == Direction::Long) return best_ask;
    if (d == Direction::Short) return best_bid;
    return (best_bid + best_ask) / 2.0;
}

std::string TradeIntent::idempotency_key() const {
    return fmt::format("{}-{}-{}", symbol, ts_ms, id);
}

double Position::pnl_at(double price) const {
    double diff = price - entry_price;
    return side == Direction::Short ? -diff * qty : diff * qty;
}

void validate_risk_config(const RiskConfig& cfg) {
    auto bad = [](double v) { return !std::isfinite(v); };

    if (bad(cfg.daily_loss_limit) || cfg.daily_loss_limit <= 0.0) {
        throw ConfigError("daily_loss_limit must be > 0");
    }
    if (bad(cfg.max_risk_per_trade) || cfg.max_risk_per_trade <= 0.0) {
        throw ConfigError("max_risk_per_trade must be > 0");
    }
    if (cfg.max_concurrent_positions < 1) {
        throw ConfigError("max_concurrent_positions must be >= 1");
    }
    if (bad(cfg.max_slippage_bps) || cfg.max_slippage_bps < 0.0) {
        throw ConfigError("max_slippage_bps must be >= 0");
    }
    if (bad(cfg.daily_profit_target) || cfg.daily_profit_target < 0.0) {
        throw ConfigError("daily_profit_target must be >= 0");
    }
    if (bad(cfg.default_sl_bps) || cfg.default_sl_bps <= 0.0) {
        throw ConfigError("default_sl_bps must be > 0");
    }
    if (bad(cfg.default_tp_bps) || cfg.default_tp_bps <= 0.0) {
        throw ConfigError("default_tp_bps must be > 0");
    }
    if (cfg.max_holding_ms < 0) {
        throw ConfigError("max_holding_ms must be >= 0");
    }
    if (cfg.cooldown_ms < 0) {
        throw ConfigError("cooldown_ms must be >= 0");
    }
}
