#pragma once

#include <string>
#include <vector>
#include <cstdint>

enum class Direction {
    Long,
    Short,
    Flat
};

const char* direction_name(Direction d);
Direction opposite(Direction d);

// One side of the book, best level first
struct PriceLevel {
    double price;
    double size;
};

// Normalized order-book snapshot from the market-data client
struct OrderBookSnapshot {
    std::string symbol;
    int64_t ts_ms = 0;
    std::vector<PriceLevel> bids;   // descending price
    std::vector<PriceLevel> asks;   // ascending price
    double best_bid = 0.0;
    double best_ask = 0.0;

    double mid() const { return (best_bid + best_ask) / 2.0; }
};

struct MarketSignal {
    std::string symbol;
    int64_t ts_ms = 0;
    Direction direction = Direction::Flat;
    double magnitude = 0.0;         // [0,1]
    double imbalance = 0.0;         // [-1,1], positive = bid heavy
    double best_bid = 0.0;
    double best_ask = 0.0;

    // Price an order in direction d would expect to pay
    double reference_price(Direction d) const;
};

struct SentimentSignal {
    std::string symbol;
    int64_t ts_ms = 0;
    std::string source;
    double score = 0.0;             // [-1,1]
    double confidence = 0.0;        // [0,1]
};

struct TrendScore {
    std::string symbol;
    int64_t ts_ms = 0;
    double score = 0.0;             // [-1,1]
    std::string source_tag;         // "live", "simulated" or "stale"
    int samples = 0;

    bool is_stale() const { return source_tag == "stale"; }
};

struct TradeIntent {
    uint64_t id = 0;
    std::string symbol;
    Direction direction = Direction::Flat;
    double suggested_size = 0.0;    // quote-currency risk units
    double confidence = 0.0;
    int64_t ts_ms = 0;
    double reference_price = 0.0;

    // Provenance
    int64_t market_ts_ms = 0;
    Direction market_direction = Direction::Flat;
    double market_magnitude = 0.0;
    int64_t trend_ts_ms = 0;
    double trend_score = 0.0;
    std::string trend_source;
    bool disagreement = false;

    std::string idempotency_key() const;
};

enum class VerdictOutcome {
    Approved,
    Rejected
};

struct RiskVerdict {
    uint64_t intent_id = 0;
    std::string symbol;
    VerdictOutcome outcome = VerdictOutcome::Rejected;
    std::string reason;             // machine-readable code, empty when approved
    std::string detail;             // human-readable explanation
    double adjusted_size = 0.0;
    int64_t ts_ms = 0;

    bool approved() const { return outcome == VerdictOutcome::Approved; }
};

struct Position {
    std::string symbol;
    Direction side = Direction::Flat;
    double entry_price = 0.0;
    double qty = 0.0;
    int64_t opened_ms = 0;
    double mark_price = 0.0;
    double unrealized_pnl = 0.0;
    double stop_price = 0.0;
    double target_price = 0.0;
    double risk_units = 0.0;

    double pnl_at(double price) const;
};

// Exit order proposed by the risk engine for an open position
struct ExitIntent {
    std::string symbol;
    Direction side = Direction::Flat;   // order side, opposite of the position
    double qty = 0.0;
    std::string reason;                 // stop-loss, take-profit, max-holding-time, halt-liquidation
    int64_t ts_ms = 0;
};

// Fill confirmation from the exchange-execution client
struct Fill {
    std::string idempotency_key;
    std::string symbol;
    Direction side = Direction::Flat;
    double qty = 0.0;
    double price = 0.0;
    int64_t ts_ms = 0;
};

struct RiskConfig {
    double daily_loss_limit = 200.0;
    double max_risk_per_trade = 20.0;
    int max_concurrent_positions = 5;
    double max_slippage_bps = 100.0;

    double daily_profit_target = 0.0;   // 0 disables
    double default_sl_bps = 25.0;
    double default_tp_bps = 50.0;
    int64_t max_holding_ms = 0;         // 0 disables
    int64_t cooldown_ms = 60000;
    bool allow_pyramiding = false;
    bool liquidate_on_halt = true;
};

// Throws ConfigError describing the first invalid field
void validate_risk_config(const RiskConfig& cfg);
