#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/decision_pipeline.hpp"
#include "../src/errors.hpp"
#include "../src/timer_queue.hpp"
#include "../src/worker_pool.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using Catch::Approx;

namespace {

class RecordingExchange : public ExchangeClient {
public:
    std::vector<OrderRequest> submitted;
    std::vector<std::string> cancelled;

    SubmitAck submit(const OrderRequest& request) override {
        submitted.push_back(request);
        return SubmitAck{};
    }
    SubmitAck cancel(const std::string& key, const std::string&) override {
        cancelled.push_back(key);
        return SubmitAck{};
    }
};

// Everything the pipeline needs, wired with a controllable dispatcher
struct Harness {
    const int64_t now = 1700000000000;
    StateStore state;
    MarketSignalGenerator generator;
    StrategyRouter router{RouterConfig{}};
    RiskEngine risk{state};
    std::shared_ptr<RecordingExchange> exchange = std::make_shared<RecordingExchange>();
    ExecutionGateway gateway{state, exchange};
    std::vector<std::function<void()>> deferred;
    bool defer = false;
    DecisionPipeline pipeline{state, generator, router, risk, gateway,
                              [this](std::function<void()> task) {
                                  if (defer) {
                                      deferred.push_back(std::move(task));
                                  } else {
                                      task();
                                  }
                              },
                              [this] { return now; }};

    static RiskConfig no_cooldown() {
        RiskConfig cfg;
        cfg.cooldown_ms = 0;
        return cfg;
    }

    Harness() : state(no_cooldown()) {}

    void run_deferred() {
        auto tasks = std::move(deferred);
        deferred.clear();
        for (auto& t : tasks) t();
    }
};

OrderBookSnapshot bid_heavy(const std::string& symbol, int64_t ts) {
    OrderBookSnapshot s;
    s.symbol = symbol;
    s.ts_ms = ts;
    s.bids = {{100.0, 50.0}, {99.9, 45.0}};
    s.asks = {{100.1, 3.0}, {100.2, 2.0}};
    s.best_bid = 100.0;
    s.best_ask = 100.1;
    return s;
}

OrderBookSnapshot balanced(const std::string& symbol, int64_t ts) {
    OrderBookSnapshot s = bid_heavy(symbol, ts);
    s.bids = {{100.0, 10.0}};
    s.asks = {{100.1, 10.0}};
    return s;
}

// Safe to call from pool workers; submits for failing symbols time out
class ConcurrentExchange : public ExchangeClient {
public:
    SubmitAck submit(const OrderRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        submitted_.push_back(request);
        SubmitAck ack;
        if (failing_.count(request.symbol)) {
            ack.outcome = SubmitOutcome::TransientError;
            ack.message = "timeout";
        }
        return ack;
    }
    SubmitAck cancel(const std::string& key, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.push_back(key);
        return SubmitAck{};
    }

    void fail_symbol(const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_.insert(symbol);
    }
    std::vector<OrderRequest> submitted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return submitted_;
    }
    std::vector<std::string> cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

private:
    mutable std::mutex mutex_;
    std::set<std::string> failing_;
    std::vector<OrderRequest> submitted_;
    std::vector<std::string> cancelled_;
};

// Default chain plus a pause, so lanes on different workers overlap
std::vector<RiskCheck> slow_chain(int pause_ms) {
    auto chain = RiskEngine::default_chain();
    chain.push_back([pause_ms](const RiskContext&, double size) {
        std::this_thread::sleep_for(std::chrono::milliseconds(pause_ms));
        return CheckOutcome::ok(size);
    });
    return chain;
}

const std::vector<std::string> kSymbols = {"BTCUSDT", "ETHUSDT", "SOLUSDT", "XRPUSDT"};

} // namespace

TEST_CASE("Order book to order", "[decision_pipeline]") {
    Harness h;
    h.pipeline.start();

    SECTION("Dominant imbalance is approved and submitted") {
        REQUIRE(h.pipeline.on_order_book(bid_heavy("BTCUSDT", h.now)));

        auto stats = h.pipeline.stats();
        REQUIRE(stats.snapshots == 1);
        REQUIRE(stats.intents == 1);
        REQUIRE(stats.approved == 1);
        REQUIRE(h.exchange->submitted.size() == 1);

        const auto& req = h.exchange->submitted[0];
        REQUIRE(req.side == Direction::Long);
        REQUIRE(req.reference_price == Approx(100.1));
        // size 20 * 0.54 risk units over a 25bps stop
        REQUIRE(req.qty == Approx(20.0 * 0.54 / (100.1 * 0.0025)));
        REQUIRE(h.pipeline.idle());
    }

    SECTION("Balanced book without trend produces nothing") {
        REQUIRE(h.pipeline.on_order_book(balanced("BTCUSDT", h.now)));
        REQUIRE(h.pipeline.stats().intents == 0);
        REQUIRE(h.exchange->submitted.empty());
    }

    SECTION("Malformed book is dropped and counted") {
        auto book = bid_heavy("BTCUSDT", h.now);
        book.best_bid = 101.0;
        REQUIRE_FALSE(h.pipeline.on_order_book(book));
        REQUIRE(h.pipeline.stats().invalid_snapshots == 1);
        REQUIRE(h.state.snapshot().quotes.empty());
    }

    SECTION("Second signal on the same symbol is held back by the open order") {
        h.pipeline.on_order_book(bid_heavy("BTCUSDT", h.now));
        h.pipeline.on_order_book(bid_heavy("BTCUSDT", h.now + 100));

        auto stats = h.pipeline.stats();
        REQUIRE(stats.approved == 1);
        REQUIRE(stats.rejected == 1);
        REQUIRE(h.exchange->submitted.size() == 1);
        REQUIRE(h.state.system_state(h.now).last_rejection.find("position-count") != std::string::npos);
    }

    SECTION("Strong trend turns a quiet book into an intent") {
        TrendScore bearish;
        bearish.symbol = "ETHUSDT";
        bearish.ts_ms = h.now;
        bearish.score = -0.8;
        bearish.source_tag = "simulated";
        h.pipeline.on_trend_scores({bearish});
        REQUIRE(h.exchange->submitted.empty());

        h.pipeline.on_order_book(balanced("ETHUSDT", h.now));
        REQUIRE(h.exchange->submitted.size() == 1);
        REQUIRE(h.exchange->submitted[0].side == Direction::Short);
        REQUIRE(h.state.system_state(h.now).trends.at("ETHUSDT").source_tag == "simulated");
    }
}

TEST_CASE("Latest intent wins while a symbol is busy", "[decision_pipeline]") {
    Harness h;
    h.pipeline.start();
    h.defer = true;

    h.pipeline.on_order_book(bid_heavy("BTCUSDT", h.now));
    h.pipeline.on_order_book(bid_heavy("BTCUSDT", h.now + 1));
    h.pipeline.on_order_book(bid_heavy("BTCUSDT", h.now + 2));

    REQUIRE(h.deferred.size() == 1);
    REQUIRE_FALSE(h.pipeline.idle());

    h.run_deferred();

    auto stats = h.pipeline.stats();
    REQUIRE(stats.intents == 3);
    REQUIRE(stats.replaced_intents == 2);
    REQUIRE(stats.approved == 1);
    REQUIRE(stats.rejected == 0);
    REQUIRE(h.exchange->submitted.size() == 1);
    REQUIRE(h.exchange->submitted[0].idempotency_key.find(std::to_string(h.now + 2)) !=
            std::string::npos);
    REQUIRE(h.pipeline.idle());
}

TEST_CASE("Control operations", "[decision_pipeline]") {
    Harness h;

    SECTION("Nothing trades before start") {
        h.pipeline.on_order_book(bid_heavy("BTCUSDT", h.now));
        REQUIRE(h.pipeline.stats().rejected == 1);
        REQUIRE(h.exchange->submitted.empty());
        REQUIRE(h.state.system_state(h.now).last_rejection.find("stopped") != std::string::npos);
    }

    SECTION("Stop drops waiting intents and cancels open entries") {
        h.pipeline.start();
        h.pipeline.on_order_book(bid_heavy("BTCUSDT", h.now));
        REQUIRE(h.exchange->submitted.size() == 1);

        h.defer = true;
        h.pipeline.on_order_book(bid_heavy("ETHUSDT", h.now));
        h.pipeline.stop();
        h.run_deferred();

        REQUIRE(h.exchange->cancelled.size() == 1);
        REQUIRE(h.exchange->submitted.size() == 1);
        REQUIRE_FALSE(h.state.running());
        REQUIRE(h.pipeline.idle());
    }

    SECTION("Config updates apply to the next intent") {
        h.pipeline.start();
        RiskConfig tight = Harness::no_cooldown();
        tight.max_risk_per_trade = 5.0;
        h.pipeline.update_risk_config(tight);

        h.pipeline.on_order_book(bid_heavy("BTCUSDT", h.now));
        REQUIRE(h.exchange->submitted[0].qty == Approx(5.0 / (100.1 * 0.0025)));
    }

    SECTION("Invalid config is refused") {
        RiskConfig bad;
        bad.max_slippage_bps = -1.0;
        REQUIRE_THROWS_AS(h.pipeline.update_risk_config(bad), ConfigError);
    }
}

TEST_CASE("Position review submits exits", "[decision_pipeline]") {
    Harness h;
    h.pipeline.start();
    h.state.apply_fill(Fill{"entry", "BTCUSDT", Direction::Long, 1.0, 100.0, h.now}, 10.0, false);

    // Long stop sits 25bps below entry
    h.pipeline.on_order_book(balanced("BTCUSDT", h.now));
    REQUIRE(h.pipeline.review(h.now) == 0);

    auto falling = balanced("BTCUSDT", h.now + 1000);
    falling.bids = {{99.5, 10.0}};
    falling.asks = {{99.6, 10.0}};
    falling.best_bid = 99.5;
    falling.best_ask = 99.6;
    h.pipeline.on_order_book(falling);

    REQUIRE(h.pipeline.review(h.now + 1000) == 1);
    REQUIRE(h.pipeline.stats().exits == 1);
    REQUIRE(h.exchange->submitted.back().reduce_only);
    REQUIRE(h.exchange->submitted.back().side == Direction::Short);

    // Already exiting: no second exit
    REQUIRE(h.pipeline.review(h.now + 2000) == 0);
}

TEST_CASE("Symbols on parallel workers share the position limit", "[decision_pipeline]") {
    const int64_t now = 1700000000000;
    RiskConfig cfg;
    cfg.cooldown_ms = 0;
    cfg.max_concurrent_positions = 1;
    StateStore state(cfg);
    MarketSignalGenerator generator;
    StrategyRouter router{RouterConfig{}};
    RiskEngine risk(state, slow_chain(10));
    auto exchange = std::make_shared<ConcurrentExchange>();
    ExecutionGateway gateway(state, exchange);
    WorkerPool pool(4);
    DecisionPipeline pipeline(state, generator, router, risk, gateway,
                              [&pool](std::function<void()> task) { pool.post(std::move(task)); },
                              [now] { return now; });
    pipeline.start();

    for (const auto& symbol : kSymbols) {
        pipeline.on_order_book(bid_heavy(symbol, now));
    }
    pool.shutdown();

    auto stats = pipeline.stats();
    REQUIRE(stats.approved == 1);
    REQUIRE(stats.rejected == 3);
    REQUIRE(exchange->submitted().size() == 1);
    REQUIRE(state.snapshot().occupied_slots() == 1);
    REQUIRE(pipeline.idle());
}

TEST_CASE("Retry backoff does not hold up other symbols", "[decision_pipeline]") {
    const int64_t now = 1700000000000;
    RiskConfig cfg;
    cfg.cooldown_ms = 0;
    StateStore state(cfg);
    MarketSignalGenerator generator;
    StrategyRouter router{RouterConfig{}};
    RiskEngine risk(state);
    auto exchange = std::make_shared<ConcurrentExchange>();
    exchange->fail_symbol("BTCUSDT");

    ExecutionConfig exec;
    exec.backoff_base_ms = 60000;
    exec.backoff_cap_ms = 60000;
    TimerQueue retry_timer;
    ExecutionGateway gateway(state, exchange, exec,
        [&retry_timer](int64_t delay_ms, std::function<void()> task) {
            return retry_timer.schedule(delay_ms, std::move(task));
        });

    // A single worker: a blocking backoff would starve ETHUSDT for a minute
    WorkerPool pool(1);
    DecisionPipeline pipeline(state, generator, router, risk, gateway,
                              [&pool](std::function<void()> task) { pool.post(std::move(task)); },
                              [now] { return now; });
    pipeline.start();

    auto started = std::chrono::steady_clock::now();
    pipeline.on_order_book(bid_heavy("BTCUSDT", now));
    pipeline.on_order_book(bid_heavy("ETHUSDT", now));
    pool.shutdown();
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed < std::chrono::seconds(10));
    auto submitted = exchange->submitted();
    REQUIRE(submitted.size() == 2);
    REQUIRE(submitted[0].symbol == "BTCUSDT");
    REQUIRE(submitted[1].symbol == "ETHUSDT");
    REQUIRE(gateway.order(submitted[0].idempotency_key)->state == OrderState::Submitting);
    REQUIRE(gateway.order(submitted[1].idempotency_key)->state == OrderState::Live);
    REQUIRE(retry_timer.pending() == 1);

    // The waiting retry keeps its slot
    REQUIRE(state.snapshot().has_pending_entry("BTCUSDT"));
    retry_timer.shutdown();
}

TEST_CASE("Stop racing submissions leaves no open entry", "[decision_pipeline]") {
    const int64_t now = 1700000000000;
    RiskConfig cfg;
    cfg.cooldown_ms = 0;
    StateStore state(cfg);
    MarketSignalGenerator generator;
    StrategyRouter router{RouterConfig{}};
    RiskEngine risk(state, slow_chain(5));
    auto exchange = std::make_shared<ConcurrentExchange>();
    ExecutionGateway gateway(state, exchange);
    WorkerPool pool(4);
    DecisionPipeline pipeline(state, generator, router, risk, gateway,
                              [&pool](std::function<void()> task) { pool.post(std::move(task)); },
                              [now] { return now; });
    pipeline.start();

    for (const auto& symbol : kSymbols) {
        pipeline.on_order_book(bid_heavy(symbol, now));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    pipeline.stop();
    pool.shutdown();

    REQUIRE_FALSE(state.running());
    for (const auto& symbol : kSymbols) {
        REQUIRE_FALSE(state.snapshot().has_pending_entry(symbol));
    }
    // Whatever reached the exchange was pulled back
    auto submitted = exchange->submitted();
    REQUIRE(exchange->cancelled().size() == submitted.size());
    for (const auto& req : submitted) {
        REQUIRE(gateway.order(req.idempotency_key)->state == OrderState::Cancelling);
    }
}
