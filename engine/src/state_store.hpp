#pragma once

#include "types.hpp"
#include "state_repository.hpp"
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct Quote {
    double bid = 0.0;
    double ask = 0.0;
    int64_t ts_ms = 0;
};

// Order registered by the gateway and not yet fully resolved
struct PendingOrder {
    std::string idempotency_key;
    std::string symbol;
    Direction side = Direction::Flat;
    double qty = 0.0;
    double filled_qty = 0.0;
    double risk_units = 0.0;
    bool reduce_only = false;
    int64_t submitted_ms = 0;
};

struct DecisionRecord {
    TradeIntent intent;
    RiskVerdict verdict;
};

struct ErrorRecord {
    int64_t ts_ms = 0;
    std::string message;
};

// Immutable copy handed to readers
struct StateSnapshot {
    bool running = false;
    bool halted = false;
    std::string halt_reason;
    std::string trading_day;
    double realized_pnl = 0.0;
    double unrealized_pnl = 0.0;
    std::map<std::string, Position> positions;
    std::map<std::string, PendingOrder> pending;        // by idempotency key
    std::map<std::string, Quote> quotes;
    std::map<std::string, int64_t> last_entry_ms;
    std::shared_ptr<const RiskConfig> config;

    double daily_pnl() const { return realized_pnl + unrealized_pnl; }
    double daily_loss() const { return daily_pnl() < 0.0 ? -daily_pnl() : 0.0; }
    bool has_pending_entry(const std::string& symbol) const;
    bool has_pending_exit(const std::string& symbol) const;
    size_t occupied_slots() const;
};

// What the broadcaster serializes
struct SystemState {
    StateSnapshot snapshot;
    std::vector<DecisionRecord> recent_decisions;
    std::vector<ErrorRecord> recent_errors;
    std::string last_rejection;
    std::map<std::string, TrendScore> trends;
    int64_t ts_ms = 0;
};

// Single source of truth for positions, PnL, control flags and RiskConfig.
// Every mutation is atomic under one lock; readers get copies.
class StateStore {
public:
    StateStore(RiskConfig initial, std::shared_ptr<StateRepository> repo = nullptr,
               size_t history_size = 50);

    StateSnapshot snapshot() const;
    SystemState system_state(int64_t now_ms) const;
    std::shared_ptr<const RiskConfig> risk_config() const;

    // Position mutations (gateway only)
    void apply_fill(const Fill& fill, double risk_units, bool reduce_only);
    void open_position(const Position& position);
    std::optional<double> close_position(const std::string& symbol, double exit_price);
    void update_mark_price(const std::string& symbol, double price);
    void update_quote(const std::string& symbol, double bid, double ask, int64_t ts_ms);

    // Control (explicit control operations and halt conditions only)
    void set_running(bool running);
    void halt(const std::string& reason);
    void update_risk_config(const RiskConfig& cfg);     // throws ConfigError

    // Claims the entry slot for `order` when the position and slot limits still
    // allow it. Returns the refusal otherwise; nothing is registered then.
    std::optional<std::string> reserve_entry(const PendingOrder& order, const RiskConfig& cfg);

    void register_pending(const PendingOrder& order);
    void update_pending_fill(const std::string& key, double filled_qty);
    void clear_pending(const std::string& key);

    void record_decision(const TradeIntent& intent, const RiskVerdict& verdict);
    void record_error(const std::string& message, int64_t ts_ms);
    void record_trend(const TrendScore& score);

    // Resets realized PnL when the UTC day changes; the halt flag stays.
    bool roll_day(int64_t now_ms);

    // Read-through from the repository; call once before traffic starts
    void restore();

    bool running() const;
    bool halted() const;

    // Why a new entry on `symbol` would not fit, nullopt when it would
    static std::optional<std::string> entry_refusal(
        const std::map<std::string, Position>& positions,
        const std::map<std::string, PendingOrder>& pending,
        const std::string& symbol, Direction side, const RiskConfig& cfg);

private:
    mutable std::mutex mutex_;

    bool running_ = false;
    bool halted_ = false;
    std::string halt_reason_;
    std::string trading_day_;
    double realized_pnl_ = 0.0;
    std::map<std::string, Position> positions_;
    std::map<std::string, PendingOrder> pending_;
    std::map<std::string, Quote> quotes_;
    std::map<std::string, int64_t> last_entry_ms_;
    std::shared_ptr<const RiskConfig> config_;

    size_t history_size_;
    std::deque<DecisionRecord> decisions_;
    std::deque<ErrorRecord> errors_;
    std::string last_rejection_;
    std::map<std::string, TrendScore> trends_;

    std::shared_ptr<StateRepository> repo_;

    StateSnapshot snapshot_locked() const;
    void open_locked(const Position& position);
    double reduce_locked(Position& position, double qty, double price);
    void set_levels_locked(Position& position);
    double unrealized_locked() const;
    void push_error_locked(const std::string& message, int64_t ts_ms);

    template <typename Fn>
    void persist_locked(const char* what, Fn&& fn);
};
