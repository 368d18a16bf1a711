#include "execution_gateway.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <vector>

namespace {

constexpr double kQtyEpsilon = 1e-9;

bool is_open(OrderState s) {
    return s == OrderState::Submitting || s == OrderState::Live ||
           s == OrderState::PartiallyFilled;
}

} // namespace

const char* order_state_name(OrderState s) {
    switch (s) {
        case OrderState::Submitting: return "submitting";
        case OrderState::Live: return "live";
        case OrderState::PartiallyFilled: return "partially_filled";
        case OrderState::Filled: return "filled";
        case OrderState::Cancelling: return "cancelling";
        case OrderState::Cancelled: return "cancelled";
        case OrderState::Rejected: return "rejected";
        case OrderState::Failed: return "failed";
    }
    return "unknown";
}

const char* execution_status_name(ExecutionStatus s) {
    switch (s) {
        case ExecutionStatus::Submitted: return "submitted";
        case ExecutionStatus::Duplicate: return "duplicate";
        case ExecutionStatus::Rejected: return "rejected";
        case ExecutionStatus::Failed: return "failed";
        case ExecutionStatus::Aborted: return "aborted";
        case ExecutionStatus::NotApproved: return "not_approved";
        case ExecutionStatus::Retrying: return "retrying";
    }
    return "unknown";
}

ExecutionGateway::ExecutionGateway(StateStore& state, std::shared_ptr<ExchangeClient> exchange,
                                   ExecutionConfig cfg, RetryScheduler scheduler)
    : state_(state), exchange_(std::move(exchange)), config_(std::move(cfg)),
      scheduler_(std::move(scheduler)) {
    if (config_.max_attempts < 1) config_.max_attempts = 1;
}

double ExecutionGateway::order_quantity(double risk_units, double reference_price, double sl_bps) {
    double stop_distance = reference_price * sl_bps / 10000.0;
    if (!std::isfinite(stop_distance) || stop_distance <= 0.0) return 0.0;
    return risk_units / stop_distance;
}

void ExecutionGateway::finish_locked(OrderRecord& rec, OrderState state) {
    rec.state = state;
    rec.finished_ms = util::current_timestamp_ms();
    state_.clear_pending(rec.request.idempotency_key);
}

ExecutionResult ExecutionGateway::execute(const TradeIntent& intent, const RiskVerdict& verdict) {
    ExecutionResult result;
    result.idempotency_key = intent.idempotency_key();

    if (!verdict.approved() || verdict.intent_id != intent.id) {
        result.status = ExecutionStatus::NotApproved;
        result.message = "verdict does not approve this intent";
        std::lock_guard<std::mutex> lock(mutex_);
        if (!orders_.count(result.idempotency_key)) {
            state_.clear_pending(result.idempotency_key);
        }
        return result;
    }

    auto cfg = state_.risk_config();
    int64_t now = util::current_timestamp_ms();
    const std::string& key = result.idempotency_key;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(key);
        if (it != orders_.end()) {
            if (it->second.state != OrderState::Failed) {
                // A finished order no longer holds the slot reserved for this key
                if (!is_open(it->second.state)) state_.clear_pending(key);
                result.status = ExecutionStatus::Duplicate;
                result.attempts = it->second.attempts;
                result.message = std::string("order already ") + order_state_name(it->second.state);
                spdlog::warn("Duplicate submission for {} ignored", key);
                return result;
            }
            // Same key again: the exchange dedupes on it, so at most one order lives
            spdlog::info("Retrying failed order {} with the same key", key);
            it->second.state = OrderState::Submitting;
            it->second.attempts = 0;
        } else {
            OrderRecord rec;
            rec.request.idempotency_key = key;
            rec.request.symbol = intent.symbol;
            rec.request.side = intent.direction;
            rec.request.qty = order_quantity(verdict.adjusted_size, intent.reference_price,
                                             cfg->default_sl_bps);
            rec.request.order_type = config_.order_type;
            rec.request.reference_price = intent.reference_price;
            rec.request.max_slippage_bps = cfg->max_slippage_bps;
            rec.request.ts_ms = now;
            rec.risk_units = verdict.adjusted_size;
            rec.submitted_ms = now;

            if (!std::isfinite(rec.request.qty) || rec.request.qty <= 0.0) {
                rec.state = OrderState::Rejected;
                rec.last_error = "non-positive order quantity";
                rec.finished_ms = now;
                orders_[key] = rec;
                state_.clear_pending(key);
                result.status = ExecutionStatus::Rejected;
                result.message = rec.last_error;
                state_.record_error(key + ": " + rec.last_error, now);
                return result;
            }
            it = orders_.emplace(key, rec).first;
        }

        const auto& rec = it->second;
        state_.register_pending(PendingOrder{key, rec.request.symbol, rec.request.side,
                                             rec.request.qty, rec.filled_qty, rec.risk_units,
                                             false, now});
    }

    return submit_with_retry(key);
}

ExecutionResult ExecutionGateway::execute_exit(const ExitIntent& exit) {
    ExecutionResult result;
    result.idempotency_key = fmt::format("exit-{}-{}-{}", exit.symbol, exit.ts_ms, exit.reason);
    const std::string& key = result.idempotency_key;

    if (exit.qty <= 0.0 || exit.side == Direction::Flat) {
        result.status = ExecutionStatus::Rejected;
        result.message = "malformed exit";
        return result;
    }

    int64_t now = util::current_timestamp_ms();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(key);
        if (it != orders_.end() && it->second.state != OrderState::Failed) {
            result.status = ExecutionStatus::Duplicate;
            result.message = std::string("exit already ") + order_state_name(it->second.state);
            return result;
        }

        OrderRecord rec;
        rec.request.idempotency_key = key;
        rec.request.symbol = exit.symbol;
        rec.request.side = exit.side;
        rec.request.qty = exit.qty;
        rec.request.order_type = "market";
        rec.request.reduce_only = true;
        rec.request.ts_ms = now;
        rec.submitted_ms = now;
        orders_[key] = rec;

        state_.register_pending(PendingOrder{key, exit.symbol, exit.side, exit.qty, 0.0, 0.0,
                                             true, now});
    }

    spdlog::info("Submitting {} exit for {} qty={}", exit.reason, exit.symbol, exit.qty);
    return submit_with_retry(key);
}

ExecutionResult ExecutionGateway::submit_with_retry(const std::string& key) {
    uint64_t epoch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        epoch = stop_epoch_;
    }
    return run_attempts(key, 1, epoch);
}

ExecutionResult ExecutionGateway::run_attempts(const std::string& key, int first_attempt,
                                               uint64_t epoch) {
    ExecutionResult result;
    result.idempotency_key = key;

    for (int attempt = first_attempt; attempt <= config_.max_attempts; ++attempt) {
        OrderRequest req;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& rec = orders_.at(key);
            if (rec.state != OrderState::Submitting) {
                result.status = ExecutionStatus::Aborted;
                result.message = std::string("order became ") + order_state_name(rec.state);
                return result;
            }
            if (!rec.request.reduce_only && (stop_epoch_ != epoch || !state_.running())) {
                finish_locked(rec, OrderState::Cancelled);
                result.status = ExecutionStatus::Aborted;
                result.message = "strategy stopped before submission";
                spdlog::info("Entry {} aborted: strategy stopped", key);
                return result;
            }
            rec.attempts = attempt;
            req = rec.request;
        }
        result.attempts = attempt;

        SubmitAck ack;
        try {
            ack = exchange_->submit(req);
        } catch (const std::exception& e) {
            ack.outcome = SubmitOutcome::TransientError;
            ack.message = e.what();
        }

        std::unique_lock<std::mutex> lock(mutex_);
        auto& rec = orders_.at(key);

        if (ack.outcome == SubmitOutcome::Accepted) {
            if (rec.state == OrderState::Submitting) rec.state = OrderState::Live;
            rec.submitted_ms = util::current_timestamp_ms();
            result.status = ExecutionStatus::Submitted;
            spdlog::info("Order {} accepted: {} {} qty={:.6f} (attempt {})", key,
                         direction_name(req.side), req.symbol, req.qty, attempt);

            // Stop raced the submission: pull it back
            bool stopped = stop_epoch_ != epoch;
            lock.unlock();
            if (stopped && !req.reduce_only) {
                request_cancel(key, "stopped during submission");
            }
            return result;
        }

        rec.last_error = ack.message;
        result.message = ack.message;

        if (ack.outcome == SubmitOutcome::TerminalError) {
            finish_locked(rec, OrderState::Rejected);
            result.status = ExecutionStatus::Rejected;
            spdlog::error("Order {} rejected: {}", key, ack.message);
            state_.record_error(key + " rejected: " + ack.message, util::current_timestamp_ms());
            return result;
        }

        if (attempt == config_.max_attempts) {
            finish_locked(rec, OrderState::Failed);
            result.status = ExecutionStatus::Failed;
            spdlog::error("Order {} failed after {} attempts: {}", key, attempt, ack.message);
            state_.record_error(fmt::format("{} failed after {} attempts: {}", key, attempt,
                                            ack.message), util::current_timestamp_ms());
            return result;
        }

        int64_t delay = std::min(config_.backoff_cap_ms,
                                 config_.backoff_base_ms * (int64_t{1} << (attempt - 1)));
        spdlog::warn("Order {} transient failure (attempt {}/{}): {}, retrying in {}ms",
                     key, attempt, config_.max_attempts, ack.message, delay);

        if (scheduler_) {
            int next = attempt + 1;
            lock.unlock();
            bool scheduled = scheduler_(delay, [this, key, next, epoch] {
                run_attempts(key, next, epoch);
            });
            if (scheduled) {
                result.status = ExecutionStatus::Retrying;
                return result;
            }

            lock.lock();
            auto& failed = orders_.at(key);
            if (failed.state == OrderState::Submitting) finish_locked(failed, OrderState::Failed);
            result.status = ExecutionStatus::Failed;
            result.message = "retry could not be scheduled";
            spdlog::error("Order {} failed: retry could not be scheduled", key);
            return result;
        }

        bool reduce_only = req.reduce_only;
        wake_.wait_for(lock, std::chrono::milliseconds(delay), [&] {
            return !reduce_only && stop_epoch_ != epoch;
        });
    }

    // Unreachable with max_attempts >= 1
    result.status = ExecutionStatus::Failed;
    return result;
}

bool ExecutionGateway::request_cancel(const std::string& key, const char* why) {
    std::string symbol;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(key);
        if (it == orders_.end() || !is_open(it->second.state)) return false;
        symbol = it->second.request.symbol;
    }

    SubmitAck ack;
    try {
        ack = exchange_->cancel(key, symbol);
    } catch (const std::exception& e) {
        ack.outcome = SubmitOutcome::TransientError;
        ack.message = e.what();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& rec = orders_.at(key);
    if (ack.outcome != SubmitOutcome::Accepted) {
        spdlog::warn("Cancel of {} ({}) failed: {}", key, why, ack.message);
        return false;
    }
    if (!is_open(rec.state)) return false;

    // The remainder stops occupying a slot; the filled portion stays booked
    spdlog::info("Cancelling {} ({}), filled {:.6f} of {:.6f}", key, why,
                 rec.filled_qty, rec.request.qty);
    finish_locked(rec, OrderState::Cancelling);
    return true;
}

void ExecutionGateway::on_fill(const Fill& fill) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(fill.idempotency_key);
    if (it == orders_.end()) {
        spdlog::warn("Fill for unknown order {}", fill.idempotency_key);
        return;
    }

    auto& rec = it->second;
    if (rec.state == OrderState::Cancelled || rec.state == OrderState::Rejected) {
        // The remainder is gone; only fills reported before the cancel or rejection count
        spdlog::warn("Fill of {} for {} order {} ignored", fill.qty,
                     order_state_name(rec.state), fill.idempotency_key);
        state_.record_error(fmt::format("{}: fill of {} after order {}", fill.idempotency_key,
                                        fill.qty, order_state_name(rec.state)),
                            util::current_timestamp_ms());
        return;
    }

    double remaining = rec.request.qty - rec.filled_qty;
    if (remaining <= kQtyEpsilon || fill.qty <= 0.0) {
        spdlog::warn("Ignoring fill of {} for {}: nothing outstanding", fill.qty, fill.idempotency_key);
        return;
    }

    Fill applied = fill;
    applied.symbol = rec.request.symbol;
    applied.side = rec.request.side;
    applied.qty = std::min(fill.qty, remaining);
    if (applied.ts_ms <= 0) applied.ts_ms = util::current_timestamp_ms();

    double risk = rec.risk_units * applied.qty / rec.request.qty;
    state_.apply_fill(applied, risk, rec.request.reduce_only);
    rec.filled_qty += applied.qty;

    if (rec.request.qty - rec.filled_qty <= kQtyEpsilon) {
        finish_locked(rec, OrderState::Filled);
        spdlog::info("Order {} filled @ {}", fill.idempotency_key, applied.price);
    } else {
        if (rec.state == OrderState::Submitting || rec.state == OrderState::Live) {
            rec.state = OrderState::PartiallyFilled;
        }
        state_.update_pending_fill(fill.idempotency_key, rec.filled_qty);
        spdlog::info("Order {} partial fill {:.6f}/{:.6f} @ {}", fill.idempotency_key,
                     rec.filled_qty, rec.request.qty, applied.price);
    }
}

void ExecutionGateway::on_order_rejected(const std::string& key, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(key);
    if (it == orders_.end()) {
        spdlog::warn("Rejection for unknown order {}", key);
        return;
    }
    if (it->second.state == OrderState::Filled) return;

    it->second.last_error = reason;
    finish_locked(it->second, OrderState::Rejected);
    spdlog::error("Exchange rejected {}: {}", key, reason);
    state_.record_error(key + " rejected: " + reason, util::current_timestamp_ms());
}

void ExecutionGateway::on_cancel_confirmed(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(key);
    if (it == orders_.end() || it->second.state == OrderState::Filled) return;

    finish_locked(it->second, OrderState::Cancelled);
    spdlog::info("Order {} cancelled, {:.6f} filled", key, it->second.filled_qty);
}

size_t ExecutionGateway::check_timeouts(int64_t now_ms) {
    std::vector<std::string> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, rec] : orders_) {
            bool waiting = rec.state == OrderState::Live || rec.state == OrderState::PartiallyFilled;
            if (waiting && now_ms - rec.submitted_ms >= config_.fill_timeout_ms) {
                expired.push_back(key);
            }
        }
    }

    size_t cancelled = 0;
    for (const auto& key : expired) {
        if (request_cancel(key, "fill timeout")) ++cancelled;
    }
    return cancelled;
}

size_t ExecutionGateway::cancel_unfilled() {
    std::vector<std::string> open_entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stop_epoch_;
        for (const auto& [key, rec] : orders_) {
            bool waiting = rec.state == OrderState::Live || rec.state == OrderState::PartiallyFilled;
            if (waiting && !rec.request.reduce_only) {
                open_entries.push_back(key);
            }
        }
    }
    wake_.notify_all();

    size_t cancelled = 0;
    for (const auto& key : open_entries) {
        if (request_cancel(key, "stop command")) ++cancelled;
    }
    return cancelled;
}

size_t ExecutionGateway::prune(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = orders_.begin(); it != orders_.end();) {
        const auto& rec = it->second;
        if (!is_open(rec.state) && rec.finished_ms > 0 &&
            now_ms - rec.finished_ms >= config_.retention_ms) {
            it = orders_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::debug("Pruned {} finished orders, {} kept", removed, orders_.size());
    }
    return removed;
}

std::optional<OrderRecord> ExecutionGateway::order(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(key);
    if (it == orders_.end()) return std::nullopt;
    return it->second;
}
