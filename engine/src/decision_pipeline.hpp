#pragma once

#include "types.hpp"
#include "market_signal.hpp"
#include "strategy_router.hpp"
#include "risk_engine.hpp"
#include "execution_gateway.hpp"
#include "state_store.hpp"
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

// Runs a unit of work somewhere: a WorkerPool in the service, inline in tests
using Dispatcher = std::function<void(std::function<void()>)>;
using Clock = std::function<int64_t()>;

struct PipelineStats {
    uint64_t snapshots = 0;
    uint64_t invalid_snapshots = 0;
    uint64_t intents = 0;
    uint64_t replaced_intents = 0;
    uint64_t approved = 0;
    uint64_t rejected = 0;
    uint64_t exits = 0;
};

// Wires signal generation, fusion, risk and execution together.
// Each symbol has an admission lane of depth 1: while one intent is being
// validated or submitted, a newer intent replaces the waiting one.
class DecisionPipeline {
public:
    DecisionPipeline(StateStore& state, MarketSignalGenerator& generator,
                     StrategyRouter& router, RiskEngine& risk, ExecutionGateway& gateway,
                     Dispatcher dispatch, Clock clock);

    // false when the snapshot was malformed and dropped
    bool on_order_book(const OrderBookSnapshot& snapshot);
    void on_trend_scores(const std::vector<TrendScore>& scores);

    void submit(const TradeIntent& intent);
    void submit_exit(const ExitIntent& exit);

    // Position review (stops, targets, holding time, halt liquidation)
    size_t review(int64_t now_ms);

    // Control operations, safe from any thread
    void start();
    void stop();
    void update_risk_config(const RiskConfig& cfg);     // throws ConfigError

    PipelineStats stats() const;
    bool idle() const;

private:
    struct Lane {
        std::optional<TradeIntent> pending;
        std::deque<ExitIntent> exits;
        bool in_flight = false;
    };

    StateStore& state_;
    MarketSignalGenerator& generator_;
    StrategyRouter& router_;
    RiskEngine& risk_;
    ExecutionGateway& gateway_;
    Dispatcher dispatch_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::map<std::string, Lane> lanes_;
    PipelineStats stats_;

    void schedule_locked(const std::string& symbol, std::unique_lock<std::mutex>& lock);
    void drain(const std::string& symbol);
    void process_intent(const TradeIntent& intent);
    void process_exit(const ExitIntent& exit);
};
