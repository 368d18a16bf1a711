#include "decision_pipeline.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

DecisionPipeline::DecisionPipeline(StateStore& state, MarketSignalGenerator& generator,
                                   StrategyRouter& router, RiskEngine& risk,
                                   ExecutionGateway& gateway, Dispatcher dispatch, Clock clock)
    : state_(state), generator_(generator), router_(router), risk_(risk), gateway_(gateway),
      dispatch_(std::move(dispatch)), clock_(std::move(clock)) {}

bool DecisionPipeline::on_order_book(const OrderBookSnapshot& snapshot) {
    MarketSignal signal;
    try {
        signal = generator_.generate(snapshot);
    } catch (const InputError& e) {
        spdlog::warn("Dropped order book: {}", e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.invalid_snapshots;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.snapshots;
    }

    state_.update_quote(snapshot.symbol, snapshot.best_bid, snapshot.best_ask, snapshot.ts_ms);
    state_.update_mark_price(snapshot.symbol, snapshot.mid());

    if (auto intent = router_.on_market_signal(signal)) {
        submit(*intent);
    }
    return true;
}

void DecisionPipeline::on_trend_scores(const std::vector<TrendScore>& scores) {
    for (const auto& score : scores) {
        state_.record_trend(score);
        if (auto intent = router_.on_trend_score(score)) {
            submit(*intent);
        }
    }
}

void DecisionPipeline::submit(const TradeIntent& intent) {
    std::unique_lock<std::mutex> lock(mutex_);
    ++stats_.intents;
    auto& lane = lanes_[intent.symbol];
    if (lane.pending) {
        ++stats_.replaced_intents;
        spdlog::debug("Intent #{} replaces waiting #{} for {}", intent.id, lane.pending->id,
                      intent.symbol);
    }
    lane.pending = intent;
    schedule_locked(intent.symbol, lock);
}

void DecisionPipeline::submit_exit(const ExitIntent& exit) {
    std::unique_lock<std::mutex> lock(mutex_);
    lanes_[exit.symbol].exits.push_back(exit);
    schedule_locked(exit.symbol, lock);
}

void DecisionPipeline::schedule_locked(const std::string& symbol,
                                       std::unique_lock<std::mutex>& lock) {
    auto& lane = lanes_[symbol];
    if (lane.in_flight) return;
    lane.in_flight = true;
    lock.unlock();

    dispatch_([this, symbol] { drain(symbol); });
}

void DecisionPipeline::drain(const std::string& symbol) {
    while (true) {
        std::optional<TradeIntent> intent;
        std::optional<ExitIntent> exit;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& lane = lanes_[symbol];
            if (!lane.exits.empty()) {
                exit = lane.exits.front();
                lane.exits.pop_front();
            } else if (lane.pending) {
                intent = std::move(lane.pending);
                lane.pending.reset();
            } else {
                lane.in_flight = false;
                return;
            }
        }

        // One failing symbol never takes the lane down
        try {
            if (exit) {
                process_exit(*exit);
            } else {
                process_intent(*intent);
            }
        } catch (const std::exception& e) {
            spdlog::error("Pipeline error on {}: {}", symbol, e.what());
            state_.record_error(symbol + ": " + e.what(), clock_());
        }
    }
}

void DecisionPipeline::process_intent(const TradeIntent& intent) {
    RiskVerdict verdict = risk_.evaluate(intent, clock_());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (verdict.approved()) {
            ++stats_.approved;
        } else {
            ++stats_.rejected;
        }
    }
    if (!verdict.approved()) return;

    ExecutionResult result = gateway_.execute(intent, verdict);
    if (result.status == ExecutionStatus::Retrying) {
        spdlog::info("Intent #{} {} waiting on retry after attempt {}", intent.id, intent.symbol,
                     result.attempts);
    } else if (result.status != ExecutionStatus::Submitted) {
        spdlog::warn("Intent #{} {} not executed: {} {}", intent.id, intent.symbol,
                     execution_status_name(result.status), result.message);
    }
}

void DecisionPipeline::process_exit(const ExitIntent& exit) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.exits;
    }
    ExecutionResult result = gateway_.execute_exit(exit);
    if (result.status != ExecutionStatus::Submitted && result.status != ExecutionStatus::Duplicate &&
        result.status != ExecutionStatus::Retrying) {
        spdlog::error("Exit for {} ({}) not executed: {} {}", exit.symbol, exit.reason,
                      execution_status_name(result.status), result.message);
    }
}

size_t DecisionPipeline::review(int64_t now_ms) {
    auto exits = risk_.review_positions(now_ms);
    for (const auto& exit : exits) {
        submit_exit(exit);
    }
    return exits.size();
}

void DecisionPipeline::start() {
    state_.set_running(true);
}

void DecisionPipeline::stop() {
    state_.set_running(false);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [symbol, lane] : lanes_) {
            lane.pending.reset();
        }
    }
    size_t cancelled = gateway_.cancel_unfilled();
    spdlog::info("Stop: dropped waiting intents, cancelled {} open orders", cancelled);
}

void DecisionPipeline::update_risk_config(const RiskConfig& cfg) {
    state_.update_risk_config(cfg);
}

PipelineStats DecisionPipeline::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

bool DecisionPipeline::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [symbol, lane] : lanes_) {
        if (lane.in_flight || lane.pending || !lane.exits.empty()) return false;
    }
    return true;
}
