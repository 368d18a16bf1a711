#pragma once

#include "types.hpp"
#include "state_store.hpp"
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct OrderRequest {
    std::string idempotency_key;
    std::string symbol;
    Direction side = Direction::Flat;
    double qty = 0.0;
    std::string order_type = "market";
    double reference_price = 0.0;
    double max_slippage_bps = 0.0;
    bool reduce_only = false;
    int64_t ts_ms = 0;
};

enum class SubmitOutcome {
    Accepted,
    TransientError,     // network, timeout, rate limit
    TerminalError       // rejected order, invalid parameters
};

struct SubmitAck {
    SubmitOutcome outcome = SubmitOutcome::Accepted;
    std::string message;
};

// Boundary to the exchange-execution client. Acknowledges submission only;
// fills and cancels come back through ExecutionGateway callbacks.
class ExchangeClient {
public:
    virtual ~ExchangeClient() = default;
    virtual SubmitAck submit(const OrderRequest& request) = 0;
    virtual SubmitAck cancel(const std::string& idempotency_key, const std::string& symbol) = 0;
};

enum class OrderState {
    Submitting,
    Live,
    PartiallyFilled,
    Filled,
    Cancelling,
    Cancelled,
    Rejected,   // terminal exchange rejection
    Failed      // transient errors exhausted
};

const char* order_state_name(OrderState s);

enum class ExecutionStatus {
    Submitted,
    Duplicate,
    Rejected,
    Failed,
    Aborted,
    NotApproved,
    Retrying        // transient failure, next attempt scheduled
};

const char* execution_status_name(ExecutionStatus s);

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::NotApproved;
    std::string idempotency_key;
    int attempts = 0;
    std::string message;
};

struct ExecutionConfig {
    int max_attempts = 4;
    int64_t backoff_base_ms = 100;
    int64_t backoff_cap_ms = 2000;
    int64_t fill_timeout_ms = 5000;
    std::string order_type = "market";
    int64_t retention_ms = 3600000;     // finished records kept for duplicate detection
};

// Runs `task` once `delay_ms` has elapsed, off the calling thread.
// Returns false when the task can no longer be scheduled.
using RetryScheduler = std::function<bool(int64_t delay_ms, std::function<void()> task)>;

struct OrderRecord {
    OrderRequest request;
    OrderState state = OrderState::Submitting;
    double filled_qty = 0.0;
    double risk_units = 0.0;
    int attempts = 0;
    int64_t submitted_ms = 0;
    int64_t finished_ms = 0;
    std::string last_error;
};

// Sole writer of orders. One live order per idempotency key.
// Without a scheduler the backoff between attempts blocks the caller;
// with one, each retry runs later on the scheduler's thread.
class ExecutionGateway {
public:
    ExecutionGateway(StateStore& state, std::shared_ptr<ExchangeClient> exchange,
                     ExecutionConfig cfg = {}, RetryScheduler scheduler = nullptr);

    ExecutionResult execute(const TradeIntent& intent, const RiskVerdict& verdict);
    ExecutionResult execute_exit(const ExitIntent& exit);

    void on_fill(const Fill& fill);
    void on_order_rejected(const std::string& key, const std::string& reason);
    void on_cancel_confirmed(const std::string& key);

    // Cancels the unfilled remainder of orders older than the fill timeout
    size_t check_timeouts(int64_t now_ms);

    // Stop command: cancel every entry order without a confirmed fill,
    // abort entry submissions still retrying. Exits are left alone.
    size_t cancel_unfilled();

    // Forgets finished orders older than the retention window
    size_t prune(int64_t now_ms);

    std::optional<OrderRecord> order(const std::string& key) const;

    static double order_quantity(double risk_units, double reference_price, double sl_bps);

private:
    StateStore& state_;
    std::shared_ptr<ExchangeClient> exchange_;
    ExecutionConfig config_;
    RetryScheduler scheduler_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    uint64_t stop_epoch_ = 0;
    std::map<std::string, OrderRecord> orders_;

    ExecutionResult submit_with_retry(const std::string& key);
    ExecutionResult run_attempts(const std::string& key, int first_attempt, uint64_t epoch);
    bool request_cancel(const std::string& key, const char* why);
    void finish_locked(OrderRecord& rec, OrderState state);
};
