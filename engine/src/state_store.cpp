#include "state_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <set>

namespace {

constexpr double kQtyEpsilon = 1e-9;

size_t count_slots(const std::map<std::string, Position>& positions,
                   const std::map<std::string, PendingOrder>& pending) {
    std::set<std::string> symbols;
    for (const auto& [symbol, pos] : positions) symbols.insert(symbol);
    for (const auto& [key, order] : pending) {
        if (!order.reduce_only) symbols.insert(order.symbol);
    }
    return symbols.size();
}

} // namespace

bool StateSnapshot::has_pending_entry(const std::string& symbol) const {
    for (const auto& [key, order] : pending) {
        if (order.symbol == symbol && !order.reduce_only) return true;
    }
    return false;
}

bool StateSnapshot::has_pending_exit(const std::string& symbol) const {
    for (const auto& [key, order] : pending) {
        if (order.symbol == symbol && order.reduce_only) return true;
    }
    return false;
}

size_t StateSnapshot::occupied_slots() const {
    return count_slots(positions, pending);
}

std::optional<std::string> StateStore::entry_refusal(
    const std::map<std::string, Position>& positions,
    const std::map<std::string, PendingOrder>& pending,
    const std::string& symbol, Direction side, const RiskConfig& cfg) {
    for (const auto& [key, order] : pending) {
        if (order.symbol == symbol && !order.reduce_only) {
            return "entry order already pending for " + symbol;
        }
    }

    auto it = positions.find(symbol);
    if (it != positions.end()) {
        if (!cfg.allow_pyramiding || it->second.side != side) {
            return "position already open for " + symbol;
        }
        return std::nullopt;    // adding does not take a new slot
    }

    size_t open = count_slots(positions, pending);
    if (open >= static_cast<size_t>(cfg.max_concurrent_positions)) {
        return fmt::format("{} open positions >= max {}", open, cfg.max_concurrent_positions);
    }
    return std::nullopt;
}

StateStore::StateStore(RiskConfig initial, std::shared_ptr<StateRepository> repo,
                       size_t history_size)
    : history_size_(history_size), repo_(std::move(repo)) {
    validate_risk_config(initial);
    config_ = std::make_shared<const RiskConfig>(initial);
    trading_day_ = util::utc_day(util::current_timestamp_ms());
}

template <typename Fn>
void StateStore::persist_locked(const char* what, Fn&& fn) {
    if (!repo_) return;
    try {
        fn(*repo_);
    } catch (const std::exception& e) {
        // In-memory state stays authoritative
        spdlog::error("Failed to persist {}: {}", what, e.what());
        push_error_locked(std::string("persist ") + what + ": " + e.what(),
                          util::current_timestamp_ms());
    }
}

StateSnapshot StateStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_locked();
}

StateSnapshot StateStore::snapshot_locked() const {
    StateSnapshot snap;
    snap.running = running_;
    snap.halted = halted_;
    snap.halt_reason = halt_reason_;
    snap.trading_day = trading_day_;
    snap.realized_pnl = realized_pnl_;
    snap.unrealized_pnl = unrealized_locked();
    snap.positions = positions_;
    snap.pending = pending_;
    snap.quotes = quotes_;
    snap.last_entry_ms = last_entry_ms_;
    snap.config = config_;
    return snap;
}

SystemState StateStore::system_state(int64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    SystemState st;
    st.snapshot = snapshot_locked();
    st.recent_decisions.assign(decisions_.begin(), decisions_.end());
    st.recent_errors.assign(errors_.begin(), errors_.end());
    st.last_rejection = last_rejection_;
    st.trends = trends_;
    st.ts_ms = now_ms;
    return st;
}

std::shared_ptr<const RiskConfig> StateStore::risk_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

double StateStore::unrealized_locked() const {
    double total = 0.0;
    for (const auto& [symbol, pos] : positions_) total += pos.unrealized_pnl;
    return total;
}

void StateStore::set_levels_locked(Position& pos) {
    double sl = config_->default_sl_bps / 10000.0;
    double tp = config_->default_tp_bps / 10000.0;
    if (pos.side == Direction::Long) {
        pos.stop_price = pos.entry_price * (1.0 - sl);
        pos.target_price = pos.entry_price * (1.0 + tp);
    } else {
        pos.stop_price = pos.entry_price * (1.0 + sl);
        pos.target_price = pos.entry_price * (1.0 - tp);
    }
}

void StateStore::open_locked(const Position& position) {
    Position pos = position;
    if (pos.mark_price <= 0.0) pos.mark_price = pos.entry_price;
    if (pos.stop_price <= 0.0 || pos.target_price <= 0.0) set_levels_locked(pos);
    pos.unrealized_pnl = pos.pnl_at(pos.mark_price);
    positions_[pos.symbol] = pos;

    spdlog::info("Opened {} {} qty={} @ {}", direction_name(pos.side), pos.symbol,
                 pos.qty, pos.entry_price);
    persist_locked("position", [&pos](StateRepository& r) { r.save_position(pos); });
}

// Books realized PnL for `qty` closed at `price`; returns the amount booked
double StateStore::reduce_locked(Position& pos, double qty, double price) {
    double closed = std::min(qty, pos.qty);
    double pnl = (pos.side == Direction::Short ? pos.entry_price - price
                                               : price - pos.entry_price) * closed;
    realized_pnl_ += pnl;
    pos.risk_units *= (pos.qty - closed) / pos.qty;
    pos.qty -= closed;
    persist_locked("daily pnl", [this](StateRepository& r) {
        r.save_daily_pnl(trading_day_, realized_pnl_);
    });
    return pnl;
}

void StateStore::apply_fill(const Fill& fill, double risk_units, bool reduce_only) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (fill.qty <= 0.0 || fill.price <= 0.0) {
        spdlog::warn("Ignoring empty fill for {}", fill.symbol);
        return;
    }

    auto it = positions_.find(fill.symbol);
    if (it == positions_.end()) {
        if (reduce_only) {
            spdlog::warn("Reduce-only fill for {} with no open position", fill.symbol);
            return;
        }
        Position pos;
        pos.symbol = fill.symbol;
        pos.side = fill.side;
        pos.entry_price = fill.price;
        pos.qty = fill.qty;
        pos.opened_ms = fill.ts_ms;
        pos.risk_units = risk_units;
        open_locked(pos);
        last_entry_ms_[fill.symbol] = fill.ts_ms;
        return;
    }

    Position& pos = it->second;
    if (pos.side == fill.side) {
        if (reduce_only) {
            spdlog::warn("Reduce-only fill for {} on the position side, ignored", fill.symbol);
            return;
        }
        double new_qty = pos.qty + fill.qty;
        pos.entry_price = (pos.entry_price * pos.qty + fill.price * fill.qty) / new_qty;
        pos.qty = new_qty;
        pos.risk_units += risk_units;
        set_levels_locked(pos);
        if (pos.mark_price <= 0.0) pos.mark_price = fill.price;
        pos.unrealized_pnl = pos.pnl_at(pos.mark_price);
        last_entry_ms_[fill.symbol] = fill.ts_ms;
        persist_locked("position", [&pos](StateRepository& r) { r.save_position(pos); });
        return;
    }

    // Opposite side: reduce, close, or flip
    double remainder = fill.qty - std::min(fill.qty, pos.qty);
    double pnl = reduce_locked(pos, fill.qty, fill.price);

    if (pos.qty <= kQtyEpsilon) {
        spdlog::info("Closed {} realized={:.4f}", fill.symbol, pnl);
        positions_.erase(it);
        persist_locked("position", [&fill](StateRepository& r) { r.delete_position(fill.symbol); });
    } else {
        pos.unrealized_pnl = pos.pnl_at(pos.mark_price > 0.0 ? pos.mark_price : fill.price);
        persist_locked("position", [&pos](StateRepository& r) { r.save_position(pos); });
    }

    if (remainder > kQtyEpsilon && !reduce_only) {
        Position flipped;
        flipped.symbol = fill.symbol;
        flipped.side = fill.side;
        flipped.entry_price = fill.price;
        flipped.qty = remainder;
        flipped.opened_ms = fill.ts_ms;
        flipped.risk_units = risk_units * remainder / fill.qty;
        open_locked(flipped);
        last_entry_ms_[fill.symbol] = fill.ts_ms;
    }
}

void StateStore::open_position(const Position& position) {
    if (position.symbol.empty() || position.qty <= 0.0 || position.entry_price <= 0.0 ||
        position.side == Direction::Flat) {
        throw InputError("cannot open malformed position");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (positions_.count(position.symbol)) {
        throw InputError("position already open for " + position.symbol);
    }
    open_locked(position);
}

std::optional<double> StateStore::close_position(const std::string& symbol, double exit_price) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) return std::nullopt;

    double pnl = reduce_locked(it->second, it->second.qty, exit_price);
    positions_.erase(it);
    persist_locked("position", [&symbol](StateRepository& r) { r.delete_position(symbol); });
    spdlog::info("Closed {} @ {} realized={:.4f}", symbol, exit_price, pnl);
    return pnl;
}

void StateStore::update_mark_price(const std::string& symbol, double price) {
    if (price <= 0.0) return;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) return;
    it->second.mark_price = price;
    it->second.unrealized_pnl = it->second.pnl_at(price);
}

void StateStore::update_quote(const std::string& symbol, double bid, double ask, int64_t ts_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    quotes_[symbol] = Quote{bid, ask, ts_ms};
}

void StateStore::set_running(bool running) {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = running;
    if (running && halted_) {
        spdlog::warn("Operator restart clears halt ({})", halt_reason_);
        halted_ = false;
        halt_reason_.clear();
    }
    spdlog::info("Strategy {}", running ? "started" : "stopped");
    persist_locked("control", [this](StateRepository& r) {
        r.save_control(running_, halted_, halt_reason_);
    });
}

void StateStore::halt(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (halted_) {
        // A loss breach replaces any other halt reason so liquidation still applies
        if (reason != "daily-loss" || halt_reason_ == "daily-loss") return;
        spdlog::critical("HALT escalated: {} -> {}", halt_reason_, reason);
    } else {
        spdlog::critical("HALT: {}", reason);
    }
    running_ = false;
    halted_ = true;
    halt_reason_ = reason;
    push_error_locked("halt: " + reason, util::current_timestamp_ms());
    persist_locked("control", [this](StateRepository& r) {
        r.save_control(running_, halted_, halt_reason_);
    });
}

void StateStore::update_risk_config(const RiskConfig& cfg) {
    validate_risk_config(cfg);
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = std::make_shared<const RiskConfig>(cfg);
    spdlog::info("Risk config updated: loss_limit={} max_risk={} max_positions={} slippage_bps={}",
                 cfg.daily_loss_limit, cfg.max_risk_per_trade,
                 cfg.max_concurrent_positions, cfg.max_slippage_bps);
    persist_locked("risk config", [&cfg](StateRepository& r) { r.save_risk_config(cfg); });
}

std::optional<std::string> StateStore::reserve_entry(const PendingOrder& order,
                                                     const RiskConfig& cfg) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto refusal = entry_refusal(positions_, pending_, order.symbol, order.side, cfg);
    if (refusal) return refusal;
    pending_[order.idempotency_key] = order;
    return std::nullopt;
}

void StateStore::register_pending(const PendingOrder& order) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_[order.idempotency_key] = order;
}

void StateStore::update_pending_fill(const std::string& key, double filled_qty) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(key);
    if (it != pending_.end()) it->second.filled_qty = filled_qty;
}

void StateStore::clear_pending(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(key);
}

void StateStore::record_decision(const TradeIntent& intent, const RiskVerdict& verdict) {
    std::lock_guard<std::mutex> lock(mutex_);
    decisions_.push_back(DecisionRecord{intent, verdict});
    while (decisions_.size() > history_size_) decisions_.pop_front();
    if (!verdict.approved()) {
        last_rejection_ = verdict.symbol + " " + verdict.reason + ": " + verdict.detail;
    }
}

void StateStore::push_error_locked(const std::string& message, int64_t ts_ms) {
    errors_.push_back(ErrorRecord{ts_ms, message});
    while (errors_.size() > history_size_) errors_.pop_front();
}

void StateStore::record_error(const std::string& message, int64_t ts_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    push_error_locked(message, ts_ms);
}

void StateStore::record_trend(const TrendScore& score) {
    std::lock_guard<std::mutex> lock(mutex_);
    trends_[score.symbol] = score;
}

bool StateStore::roll_day(int64_t now_ms) {
    std::string day = util::utc_day(now_ms);
    std::lock_guard<std::mutex> lock(mutex_);
    if (day == trading_day_) return false;

    spdlog::info("Trading day {} -> {}, realized PnL {:.4f} reset", trading_day_, day, realized_pnl_);
    trading_day_ = day;
    realized_pnl_ = 0.0;
    persist_locked("daily pnl", [this](StateRepository& r) {
        r.save_daily_pnl(trading_day_, realized_pnl_);
    });
    return true;
}

void StateStore::restore() {
    if (!repo_) return;
    PersistedState saved = repo_->load();

    std::lock_guard<std::mutex> lock(mutex_);
    positions_.clear();
    for (const auto& pos : saved.positions) {
        positions_[pos.symbol] = pos;
    }
    if (saved.trading_day == trading_day_) {
        realized_pnl_ = saved.realized_pnl;
    }
    if (saved.halted) {
        halted_ = true;
        running_ = false;
        halt_reason_ = saved.halt_reason;
    }
    if (saved.risk_config) {
        try {
            validate_risk_config(*saved.risk_config);
            config_ = std::make_shared<const RiskConfig>(*saved.risk_config);
        } catch (const ConfigError& e) {
            spdlog::warn("Ignoring stored risk config: {}", e.what());
        }
    }
    spdlog::info("Restored {} positions, realized PnL {:.4f}{}", positions_.size(), realized_pnl_,
                 halted_ ? " (halted)" : "");
}

bool StateStore::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

bool StateStore::halted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return halted_;
}
