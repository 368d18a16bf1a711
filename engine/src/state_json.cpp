#include "state_json.hpp"
#include "util.hpp"

nlohmann::json StateSerializer::position(const Position& p) {
    return {
        {"symbol", p.symbol},
        {"side", direction_name(p.side)},
        {"entry_price", p.entry_price},
        {"qty", p.qty},
        {"opened_ms", p.opened_ms},
        {"mark_price", p.mark_price},
        {"unrealized_pnl", p.unrealized_pnl},
        {"stop_price", p.stop_price},
        {"target_price", p.target_price},
        {"risk_units", p.risk_units}
    };
}

nlohmann::json StateSerializer::risk_config(const RiskConfig& c) {
    return {
        {"daily_loss_limit", c.daily_loss_limit},
        {"max_risk_per_trade", c.max_risk_per_trade},
        {"max_concurrent_positions", c.max_concurrent_positions},
        {"max_slippage_bps", c.max_slippage_bps},
        {"daily_profit_target", c.daily_profit_target},
        {"default_sl_bps", c.default_sl_bps},
        {"default_tp_bps", c.default_tp_bps},
        {"max_holding_ms", c.max_holding_ms},
        {"cooldown_ms", c.cooldown_ms},
        {"allow_pyramiding", c.allow_pyramiding},
        {"liquidate_on_halt", c.liquidate_on_halt}
    };
}

nlohmann::json StateSerializer::intent(const TradeIntent& i) {
    return {
        {"id", i.id},
        {"symbol", i.symbol},
        {"direction", direction_name(i.direction)},
        {"suggested_size", i.suggested_size},
        {"confidence", i.confidence},
        {"reference_price", i.reference_price},
        {"ts", i.ts_ms},
        {"provenance", {
            {"market_ts", i.market_ts_ms},
            {"market_direction", direction_name(i.market_direction)},
            {"market_magnitude", i.market_magnitude},
            {"trend_ts", i.trend_ts_ms},
            {"trend_score", i.trend_score},
            {"trend_source", i.trend_source},
            {"disagreement", i.disagreement}
        }}
    };
}

nlohmann::json StateSerializer::verdict(const RiskVerdict& v) {
    nlohmann::json j = {
        {"intent_id", v.intent_id},
        {"symbol", v.symbol},
        {"outcome", v.approved() ? "approved" : "rejected"},
        {"adjusted_size", v.adjusted_size},
        {"ts", v.ts_ms}
    };
    if (!v.approved()) {
        j["reason"] = v.reason;
        j["detail"] = v.detail;
    }
    return j;
}

nlohmann::json StateSerializer::trend(const TrendScore& t) {
    return {
        {"symbol", t.symbol},
        {"score", t.score},
        {"source", t.source_tag},
        {"samples", t.samples},
        {"ts", t.ts_ms}
    };
}

nlohmann::json StateSerializer::order_request(const OrderRequest& r) {
    return {
        {"type", "order"},
        {"key", r.idempotency_key},
        {"symbol", r.symbol},
        {"side", r.side == Direction::Long ? "buy" : "sell"},
        {"qty", r.qty},
        {"order_type", r.order_type},
        {"reference_price", r.reference_price},
        {"max_slippage_bps", r.max_slippage_bps},
        {"reduce_only", r.reduce_only},
        {"ts", r.ts_ms}
    };
}

nlohmann::json StateSerializer::system_state(const SystemState& s) {
    const auto& snap = s.snapshot;

    nlohmann::json positions = nlohmann::json::array();
    for (const auto& [symbol, p] : snap.positions) positions.push_back(position(p));

    nlohmann::json pending = nlohmann::json::array();
    for (const auto& [key, o] : snap.pending) {
        pending.push_back({
            {"key", key},
            {"symbol", o.symbol},
            {"side", direction_name(o.side)},
            {"qty", o.qty},
            {"filled_qty", o.filled_qty},
            {"reduce_only", o.reduce_only}
        });
    }

    nlohmann::json decisions = nlohmann::json::array();
    for (const auto& d : s.recent_decisions) {
        decisions.push_back({{"intent", intent(d.intent)}, {"verdict", verdict(d.verdict)}});
    }

    nlohmann::json errors = nlohmann::json::array();
    for (const auto& e : s.recent_errors) {
        errors.push_back({{"ts", util::iso8601_from_ms(e.ts_ms)}, {"message", e.message}});
    }

    nlohmann::json trends = nlohmann::json::array();
    for (const auto& [symbol, t] : s.trends) trends.push_back(trend(t));

    return {
        {"running", snap.running},
        {"halted", snap.halted},
        {"halt_reason", snap.halt_reason},
        {"trading_day", snap.trading_day},
        {"daily_pnl", snap.daily_pnl()},
        {"realized_pnl", snap.realized_pnl},
        {"unrealized_pnl", snap.unrealized_pnl},
        {"positions", positions},
        {"pending_orders", pending},
        {"recent_decisions", decisions},
        {"last_rejection", s.last_rejection},
        {"recent_errors", errors},
        {"trends", trends},
        {"risk_config", snap.config ? risk_config(*snap.config) : nlohmann::json(nullptr)},
        {"ts", util::iso8601_from_ms(s.ts_ms)}
    };
}
