#pragma once

#include "types.hpp"
#include "state_store.hpp"
#include <functional>
#include <string>
#include <vector>

// Everything a check may look at, captured once per intent
struct RiskContext {
    const TradeIntent& intent;
    const StateSnapshot& state;
    const RiskConfig& config;
    int64_t now_ms;
};

struct CheckOutcome {
    bool pass = true;
    double size = 0.0;          // size carried to the next check
    std::string reason;
    std::string detail;
    bool halt = false;          // rejection is also a halt condition

    static CheckOutcome ok(double size);
    static CheckOutcome reject(std::string reason, std::string detail, bool halt = false);
};

using RiskCheck = std::function<CheckOutcome(const RiskContext&, double size)>;

// Sole approver of TradeIntents. Runs an ordered, short-circuiting chain of
// pure checks over one immutable snapshot of state and config.
class RiskEngine {
public:
    explicit RiskEngine(StateStore& state);
    RiskEngine(StateStore& state, std::vector<RiskCheck> chain);

    // An approval also reserves the symbol's entry slot under the intent's
    // idempotency key; the gateway takes the reservation over on submission.
    RiskVerdict evaluate(const TradeIntent& intent, int64_t now_ms);

    // Exits due for open positions (stop, target, holding time, halt liquidation).
    // Also raises the daily-loss halt when marks alone breach the limit.
    std::vector<ExitIntent> review_positions(int64_t now_ms);

    static std::vector<RiskCheck> default_chain();

    static CheckOutcome check_running(const RiskContext& ctx, double size);
    static CheckOutcome check_daily_loss(const RiskContext& ctx, double size);
    static CheckOutcome check_profit_target(const RiskContext& ctx, double size);
    static CheckOutcome check_position_count(const RiskContext& ctx, double size);
    static CheckOutcome check_cooldown(const RiskContext& ctx, double size);
    static CheckOutcome check_size(const RiskContext& ctx, double size);
    static CheckOutcome check_slippage(const RiskContext& ctx, double size);

private:
    StateStore& state_;
    std::vector<RiskCheck> chain_;
};
