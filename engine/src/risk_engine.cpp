#include "risk_engine.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

CheckOutcome CheckOutcome::ok(double size) {
    CheckOutcome out;
    out.size = size;
    return out;
}

CheckOutcome CheckOutcome::reject(std::string reason, std::string detail, bool halt) {
    CheckOutcome out;
    out.pass = false;
    out.reason = std::move(reason);
    out.detail = std::move(detail);
    out.halt = halt;
    return out;
}

RiskEngine::RiskEngine(StateStore& state) : RiskEngine(state, default_chain()) {}

RiskEngine::RiskEngine(StateStore& state, std::vector<RiskCheck> chain)
    : state_(state), chain_(std::move(chain)) {}

std::vector<RiskCheck> RiskEngine::default_chain() {
    return {
        &RiskEngine::check_running,
        &RiskEngine::check_daily_loss,
        &RiskEngine::check_profit_target,
        &RiskEngine::check_position_count,
        &RiskEngine::check_cooldown,
        &RiskEngine::check_size,
        &RiskEngine::check_slippage,
    };
}

CheckOutcome RiskEngine::check_running(const RiskContext& ctx, double size) {
    if (!ctx.state.running) {
        // A halt keeps reporting its own reason until the operator restarts
        if (ctx.state.halted) {
            return CheckOutcome::reject(ctx.state.halt_reason, "halted: " + ctx.state.halt_reason);
        }
        return CheckOutcome::reject("stopped", "strategy is stopped");
    }
    return CheckOutcome::ok(size);
}

CheckOutcome RiskEngine::check_daily_loss(const RiskContext& ctx, double size) {
    double loss = ctx.state.daily_loss();
    if (loss >= ctx.config.daily_loss_limit) {
        return CheckOutcome::reject("daily-loss",
            fmt::format("daily loss {:.2f} >= limit {:.2f}", loss, ctx.config.daily_loss_limit),
            true);
    }
    return CheckOutcome::ok(size);
}

CheckOutcome RiskEngine::check_profit_target(const RiskContext& ctx, double size) {
    double target = ctx.config.daily_profit_target;
    if (target > 0.0 && ctx.state.daily_pnl() >= target) {
        return CheckOutcome::reject("daily-profit-target",
            fmt::format("daily pnl {:.2f} reached target {:.2f}", ctx.state.daily_pnl(), target),
            true);
    }
    return CheckOutcome::ok(size);
}

CheckOutcome RiskEngine::check_position_count(const RiskContext& ctx, double size) {
    auto refusal = StateStore::entry_refusal(ctx.state.positions, ctx.state.pending,
                                             ctx.intent.symbol, ctx.intent.direction, ctx.config);
    if (refusal) {
        return CheckOutcome::reject("position-count", *refusal);
    }
    return CheckOutcome::ok(size);
}

CheckOutcome RiskEngine::check_cooldown(const RiskContext& ctx, double size) {
    if (ctx.config.cooldown_ms <= 0) return CheckOutcome::ok(size);

    auto it = ctx.state.last_entry_ms.find(ctx.intent.symbol);
    if (it != ctx.state.last_entry_ms.end()) {
        int64_t elapsed = ctx.now_ms - it->second;
        if (elapsed < ctx.config.cooldown_ms) {
            return CheckOutcome::reject("cooldown",
                fmt::format("last entry {}ms ago, cooldown {}ms", elapsed, ctx.config.cooldown_ms));
        }
    }
    return CheckOutcome::ok(size);
}

CheckOutcome RiskEngine::check_size(const RiskContext& ctx, double size) {
    if (!std::isfinite(size) || size <= 0.0) {
        return CheckOutcome::reject("invalid-size", fmt::format("suggested size {} is not positive", size));
    }

    double cap = ctx.config.max_risk_per_trade;
    auto it = ctx.state.positions.find(ctx.intent.symbol);
    if (it != ctx.state.positions.end()) {
        // Pyramiding: the whole position stays within one trade's risk
        cap -= it->second.risk_units;
        if (cap <= 0.0) {
            return CheckOutcome::reject("position-risk",
                fmt::format("{} already carries {:.2f} risk units", ctx.intent.symbol,
                            it->second.risk_units));
        }
    }
    return CheckOutcome::ok(std::min(size, cap));
}

CheckOutcome RiskEngine::check_slippage(const RiskContext& ctx, double size) {
    auto it = ctx.state.quotes.find(ctx.intent.symbol);
    if (it == ctx.state.quotes.end()) {
        return CheckOutcome::reject("slippage", "no quote for " + ctx.intent.symbol);
    }

    double best = ctx.intent.direction == Direction::Long ? it->second.ask : it->second.bid;
    double ref = ctx.intent.reference_price;
    if (best <= 0.0 || ref <= 0.0) {
        return CheckOutcome::reject("slippage", "no usable price for " + ctx.intent.symbol);
    }

    double deviation_bps = std::fabs(best - ref) / ref * 10000.0;
    if (deviation_bps > ctx.config.max_slippage_bps) {
        return CheckOutcome::reject("slippage",
            fmt::format("best {} deviates {:.1f}bps from reference {} (max {:.1f})",
                        best, deviation_bps, ref, ctx.config.max_slippage_bps));
    }
    return CheckOutcome::ok(size);
}

RiskVerdict RiskEngine::evaluate(const TradeIntent& intent, int64_t now_ms) {
    // One snapshot for the whole chain; later config updates do not leak in
    StateSnapshot snap = state_.snapshot();
    RiskContext ctx{intent, snap, *snap.config, now_ms};

    RiskVerdict verdict;
    verdict.intent_id = intent.id;
    verdict.symbol = intent.symbol;
    verdict.ts_ms = now_ms;

    double size = intent.suggested_size;
    for (const auto& check : chain_) {
        CheckOutcome out = check(ctx, size);
        if (!out.pass) {
            verdict.outcome = VerdictOutcome::Rejected;
            verdict.reason = out.reason;
            verdict.detail = out.detail;
            verdict.adjusted_size = 0.0;
            if (out.halt) {
                state_.halt(out.reason);
            }
            spdlog::info("Rejected intent #{} {}: {} ({})", intent.id, intent.symbol,
                         out.reason, out.detail);
            state_.record_decision(intent, verdict);
            return verdict;
        }
        size = out.size;
    }

    // Other symbols are evaluated concurrently: the slot is claimed under the
    // store lock, re-checked against what has been claimed since the snapshot
    PendingOrder reservation{intent.idempotency_key(), intent.symbol, intent.direction,
                             0.0, 0.0, size, false, now_ms};
    if (auto refusal = state_.reserve_entry(reservation, ctx.config)) {
        verdict.outcome = VerdictOutcome::Rejected;
        verdict.reason = "position-count";
        verdict.detail = *refusal;
        verdict.adjusted_size = 0.0;
        spdlog::info("Rejected intent #{} {}: position-count ({})", intent.id, intent.symbol,
                     *refusal);
        state_.record_decision(intent, verdict);
        return verdict;
    }

    verdict.outcome = VerdictOutcome::Approved;
    verdict.adjusted_size = size;
    spdlog::info("Approved intent #{} {} {} size={:.2f}", intent.id, intent.symbol,
                 direction_name(intent.direction), size);
    state_.record_decision(intent, verdict);
    return verdict;
}

std::vector<ExitIntent> RiskEngine::review_positions(int64_t now_ms) {
    StateSnapshot snap = state_.snapshot();
    const RiskConfig& cfg = *snap.config;
    std::vector<ExitIntent> exits;

    if (snap.halt_reason != "daily-loss" && snap.daily_loss() >= cfg.daily_loss_limit) {
        state_.halt("daily-loss");
        snap.halted = true;
        snap.halt_reason = "daily-loss";
    }
    bool liquidate = snap.halted && snap.halt_reason == "daily-loss" && cfg.liquidate_on_halt;

    for (const auto& [symbol, pos] : snap.positions) {
        if (snap.has_pending_exit(symbol)) continue;

        std::string reason;
        bool is_long = pos.side == Direction::Long;
        double mark = pos.mark_price;

        if (liquidate) {
            reason = "halt-liquidation";
        } else if (mark > 0.0 && (is_long ? mark <= pos.stop_price : mark >= pos.stop_price)) {
            reason = "stop-loss";
        } else if (mark > 0.0 && (is_long ? mark >= pos.target_price : mark <= pos.target_price)) {
            reason = "take-profit";
        } else if (cfg.max_holding_ms > 0 && now_ms - pos.opened_ms >= cfg.max_holding_ms) {
            reason = "max-holding-time";
        }
        if (reason.empty()) continue;

        ExitIntent exit;
        exit.symbol = symbol;
        exit.side = opposite(pos.side);
        exit.qty = pos.qty;
        exit.reason = reason;
        exit.ts_ms = now_ms;
        spdlog::info("Exit {} {}: {} (mark={} stop={} target={})", symbol,
                     direction_name(pos.side), reason, mark, pos.stop_price, pos.target_price);
        exits.push_back(exit);
    }
    return exits;
}
