#include "normalize.hpp"
#include "errors.hpp"
#include "util.hpp"

namespace {

std::vector<PriceLevel> parse_levels(const nlohmann::json& j, const char* side) {
    if (!j.contains(side) || !j[side].is_array()) {
        throw InvalidSnapshot(std::string("missing ") + side);
    }
    std::vector<PriceLevel> levels;
    for (const auto& lvl : j[side]) {
        if (!lvl.is_array() || lvl.size() < 2 || !lvl[0].is_number() || !lvl[1].is_number()) {
            throw InvalidSnapshot(std::string("bad level in ") + side);
        }
        levels.push_back(PriceLevel{lvl[0].get<double>(), lvl[1].get<double>()});
    }
    return levels;
}

int64_t parse_ts(const nlohmann::json& j) {
    if (j.contains("ts") && j["ts"].is_number_integer()) {
        return j["ts"].get<int64_t>();
    }
    return util::current_timestamp_ms();
}

} // namespace

Direction Normalizer::parse_direction(const std::string& s) {
    std::string lower = util::to_lower(s);
    if (lower == "long" || lower == "buy") return Direction::Long;
    if (lower == "short" || lower == "sell") return Direction::Short;
    if (lower == "flat") return Direction::Flat;
    throw InputError("unknown direction '" + s + "'");
}

OrderBookSnapshot Normalizer::parse_order_book(const nlohmann::json& j) {
    try {
        OrderBookSnapshot snap;
        snap.symbol = j.value("symbol", "");
        if (snap.symbol.empty()) throw InvalidSnapshot("missing symbol");
        snap.ts_ms = parse_ts(j);
        snap.bids = parse_levels(j, "bids");
        snap.asks = parse_levels(j, "asks");
        snap.best_bid = j.value("best_bid", snap.bids.empty() ? 0.0 : snap.bids.front().price);
        snap.best_ask = j.value("best_ask", snap.asks.empty() ? 0.0 : snap.asks.front().price);
        return snap;
    } catch (const nlohmann::json::exception& e) {
        throw InvalidSnapshot(e.what());
    }
}

SentimentSignal Normalizer::parse_sentiment(const nlohmann::json& j) {
    try {
        SentimentSignal sig;
        sig.symbol = j.value("symbol", "");
        sig.ts_ms = parse_ts(j);
        sig.source = j.value("source", "unknown");
        if (!j.contains("score") || !j["score"].is_number()) {
            throw InvalidSignal("missing score");
        }
        sig.score = j["score"].get<double>();
        sig.confidence = j.value("confidence", 1.0);
        return sig;
    } catch (const nlohmann::json::exception& e) {
        throw InvalidSignal(e.what());
    }
}

std::optional<SentimentSignal> Normalizer::parse_text_event(const nlohmann::json& j,
                                                            const SymbolMapper& mapper,
                                                            const SentimentScorer& scorer) {
    std::string text;
    std::string symbol;
    std::string source;
    try {
        text = j.value("text", "");
        symbol = j.value("symbol", "");
        source = j.value("source", "text");
    } catch (const nlohmann::json::exception& e) {
        throw InvalidSignal(e.what());
    }
    if (text.empty()) throw InvalidSignal("missing text");

    if (symbol.empty()) {
        auto mapped = mapper.map_text(text);
        if (!mapped) return std::nullopt;
        symbol = *mapped;
    }

    TextScore ts = scorer.score(text);
    if (ts.matched_terms == 0) return std::nullopt;

    SentimentSignal sig;
    sig.symbol = symbol;
    sig.ts_ms = parse_ts(j);
    sig.source = source;
    sig.score = ts.score;
    sig.confidence = ts.confidence;
    return sig;
}

ExecutionEvent Normalizer::parse_execution_event(const nlohmann::json& j) {
    try {
        ExecutionEvent ev;
        std::string type = j.value("type", "");
        ev.fill.idempotency_key = j.value("key", "");
        if (ev.fill.idempotency_key.empty()) throw InputError("execution event without key");

        if (type == "fill") {
            ev.type = ExecutionEventType::Fill;
            ev.fill.symbol = j.value("symbol", "");
            ev.fill.side = parse_direction(j.value("side", ""));
            ev.fill.qty = j.at("qty").get<double>();
            ev.fill.price = j.at("price").get<double>();
            ev.fill.ts_ms = parse_ts(j);
            if (ev.fill.qty <= 0.0 || ev.fill.price <= 0.0) {
                throw InputError("fill with non-positive qty or price");
            }
        } else if (type == "rejected") {
            ev.type = ExecutionEventType::Rejected;
            ev.reason = j.value("reason", "rejected by exchange");
        } else if (type == "cancelled") {
            ev.type = ExecutionEventType::Cancelled;
        } else {
            throw InputError("unknown execution event type '" + type + "'");
        }
        return ev;
    } catch (const nlohmann::json::exception& e) {
        throw InputError(std::string("bad execution event: ") + e.what());
    }
}

RiskConfig Normalizer::parse_risk_config(const nlohmann::json& j, const RiskConfig& base) {
    if (!j.is_object()) throw ConfigError("risk config must be an object");

    RiskConfig cfg = base;
    try {
        cfg.daily_loss_limit = j.value("daily_loss_limit", cfg.daily_loss_limit);
        cfg.max_risk_per_trade = j.value("max_risk_per_trade", cfg.max_risk_per_trade);
        cfg.max_concurrent_positions = j.value("max_concurrent_positions", cfg.max_concurrent_positions);
        cfg.max_slippage_bps = j.value("max_slippage_bps", cfg.max_slippage_bps);
        cfg.daily_profit_target = j.value("daily_profit_target", cfg.daily_profit_target);
        cfg.default_sl_bps = j.value("default_sl_bps", cfg.default_sl_bps);
        cfg.default_tp_bps = j.value("default_tp_bps", cfg.default_tp_bps);
        cfg.max_holding_ms = j.value("max_holding_ms", cfg.max_holding_ms);
        cfg.cooldown_ms = j.value("cooldown_ms", cfg.cooldown_ms);
        cfg.allow_pyramiding = j.value("allow_pyramiding", cfg.allow_pyramiding);
        cfg.liquidate_on_halt = j.value("liquidate_on_halt", cfg.liquidate_on_halt);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("bad risk config field: ") + e.what());
    }
    return cfg;
}
