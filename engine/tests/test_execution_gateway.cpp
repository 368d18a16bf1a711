#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/execution_gateway.hpp"
#include "../src/util.hpp"
#include <deque>
#include <functional>
#include <utility>
#include <stdexcept>

using Catch::Approx;

namespace {

// Scripted exchange: pops one outcome per submit, accepts once the script runs out
class FakeExchange : public ExchangeClient {
public:
    std::deque<SubmitOutcome> script;
    bool throw_next = false;
    std::vector<OrderRequest> submitted;
    std::vector<std::string> cancelled;

    SubmitAck submit(const OrderRequest& request) override {
        submitted.push_back(request);
        if (throw_next) {
            throw_next = false;
            throw std::runtime_error("connection reset");
        }
        SubmitAck ack;
        if (!script.empty()) {
            ack.outcome = script.front();
            script.pop_front();
            if (ack.outcome != SubmitOutcome::Accepted) ack.message = "scripted failure";
        }
        return ack;
    }

    SubmitAck cancel(const std::string& key, const std::string&) override {
        cancelled.push_back(key);
        return SubmitAck{};
    }
};

} // namespace

static TradeIntent make_intent(uint64_t id, const std::string& symbol = "BTCUSDT") {
    TradeIntent intent;
    intent.id = id;
    intent.symbol = symbol;
    intent.direction = Direction::Long;
    intent.suggested_size = 10.0;
    intent.confidence = 0.7;
    intent.ts_ms = 1000;
    intent.reference_price = 100.0;
    return intent;
}

static RiskVerdict approve(const TradeIntent& intent, double size = 10.0) {
    RiskVerdict v;
    v.intent_id = intent.id;
    v.symbol = intent.symbol;
    v.outcome = VerdictOutcome::Approved;
    v.adjusted_size = size;
    return v;
}

static ExecutionConfig fast_config() {
    ExecutionConfig cfg;
    cfg.max_attempts = 3;
    cfg.backoff_base_ms = 1;
    cfg.backoff_cap_ms = 2;
    cfg.fill_timeout_ms = 5000;
    return cfg;
}

TEST_CASE("Order submission", "[execution_gateway]") {
    StateStore state(RiskConfig{});
    state.set_running(true);
    auto exchange = std::make_shared<FakeExchange>();
    ExecutionGateway gateway(state, exchange, fast_config());
    auto intent = make_intent(1);

    SECTION("Quantity follows risk units and stop distance") {
        // 10 risk units / (100 * 25bps) = 40
        REQUIRE(ExecutionGateway::order_quantity(10.0, 100.0, 25.0) == Approx(40.0));
        REQUIRE(ExecutionGateway::order_quantity(10.0, 0.0, 25.0) == 0.0);
    }

    SECTION("Approved intent becomes a live order") {
        auto result = gateway.execute(intent, approve(intent));

        REQUIRE(result.status == ExecutionStatus::Submitted);
        REQUIRE(result.attempts == 1);
        REQUIRE(exchange->submitted.size() == 1);
        REQUIRE(exchange->submitted[0].idempotency_key == intent.idempotency_key());
        REQUIRE(exchange->submitted[0].qty == Approx(40.0));
        REQUIRE(gateway.order(result.idempotency_key)->state == OrderState::Live);
        REQUIRE(state.snapshot().has_pending_entry("BTCUSDT"));
    }

    SECTION("Same intent twice submits once") {
        gateway.execute(intent, approve(intent));
        auto second = gateway.execute(intent, approve(intent));

        REQUIRE(second.status == ExecutionStatus::Duplicate);
        REQUIRE(exchange->submitted.size() == 1);
    }

    SECTION("Rejected or mismatched verdicts are not executed") {
        RiskVerdict rejected = approve(intent);
        rejected.outcome = VerdictOutcome::Rejected;
        REQUIRE(gateway.execute(intent, rejected).status == ExecutionStatus::NotApproved);

        RiskVerdict other = approve(make_intent(2));
        REQUIRE(gateway.execute(intent, other).status == ExecutionStatus::NotApproved);
        REQUIRE(exchange->submitted.empty());
    }

    SECTION("Zero size is rejected before the exchange") {
        auto result = gateway.execute(intent, approve(intent, 0.0));
        REQUIRE(result.status == ExecutionStatus::Rejected);
        REQUIRE(exchange->submitted.empty());
    }

    SECTION("Stopped strategy aborts entries") {
        state.set_running(false);
        auto result = gateway.execute(intent, approve(intent));

        REQUIRE(result.status == ExecutionStatus::Aborted);
        REQUIRE(exchange->submitted.empty());
        REQUIRE_FALSE(state.snapshot().has_pending_entry("BTCUSDT"));
    }
}

TEST_CASE("Retry with backoff", "[execution_gateway]") {
    StateStore state(RiskConfig{});
    state.set_running(true);
    auto exchange = std::make_shared<FakeExchange>();
    ExecutionGateway gateway(state, exchange, fast_config());
    auto intent = make_intent(1);

    SECTION("Transient errors retry with the same key") {
        exchange->script = {SubmitOutcome::TransientError, SubmitOutcome::TransientError};
        auto result = gateway.execute(intent, approve(intent));

        REQUIRE(result.status == ExecutionStatus::Submitted);
        REQUIRE(result.attempts == 3);
        REQUIRE(exchange->submitted.size() == 3);
        for (const auto& req : exchange->submitted) {
            REQUIRE(req.idempotency_key == intent.idempotency_key());
        }
        REQUIRE(gateway.order(intent.idempotency_key())->state == OrderState::Live);
    }

    SECTION("Exceptions count as transient") {
        exchange->throw_next = true;
        auto result = gateway.execute(intent, approve(intent));
        REQUIRE(result.status == ExecutionStatus::Submitted);
        REQUIRE(result.attempts == 2);
    }

    SECTION("Terminal error stops immediately") {
        exchange->script = {SubmitOutcome::TerminalError};
        auto result = gateway.execute(intent, approve(intent));

        REQUIRE(result.status == ExecutionStatus::Rejected);
        REQUIRE(result.attempts == 1);
        REQUIRE(gateway.order(intent.idempotency_key())->state == OrderState::Rejected);
        REQUIRE_FALSE(state.snapshot().has_pending_entry("BTCUSDT"));
        REQUIRE_FALSE(state.system_state(0).recent_errors.empty());

        // A terminal rejection is final for that key
        REQUIRE(gateway.execute(intent, approve(intent)).status == ExecutionStatus::Duplicate);
    }

    SECTION("Exhausted retries fail, and a later attempt reuses the key") {
        exchange->script = {SubmitOutcome::TransientError, SubmitOutcome::TransientError,
                            SubmitOutcome::TransientError};
        auto result = gateway.execute(intent, approve(intent));

        REQUIRE(result.status == ExecutionStatus::Failed);
        REQUIRE(result.attempts == 3);
        REQUIRE_FALSE(state.snapshot().has_pending_entry("BTCUSDT"));

        auto retry = gateway.execute(intent, approve(intent));
        REQUIRE(retry.status == ExecutionStatus::Submitted);
        REQUIRE(exchange->submitted.back().idempotency_key == intent.idempotency_key());
    }
}

TEST_CASE("Fills and cancels", "[execution_gateway]") {
    StateStore state(RiskConfig{});
    state.set_running(true);
    auto exchange = std::make_shared<FakeExchange>();
    ExecutionGateway gateway(state, exchange, fast_config());
    auto intent = make_intent(1);
    auto key = gateway.execute(intent, approve(intent)).idempotency_key;

    SECTION("Full fill opens the position and frees the slot") {
        gateway.on_fill(Fill{key, "", Direction::Flat, 40.0, 100.0, 5000});
        auto snap = state.snapshot();

        REQUIRE(gateway.order(key)->state == OrderState::Filled);
        REQUIRE(snap.positions.at("BTCUSDT").qty == Approx(40.0));
        REQUIRE(snap.positions.at("BTCUSDT").side == Direction::Long);
        REQUIRE(snap.positions.at("BTCUSDT").risk_units == Approx(10.0));
        REQUIRE(snap.pending.empty());
    }

    SECTION("Overfill is capped at the order quantity") {
        gateway.on_fill(Fill{key, "BTCUSDT", Direction::Long, 30.0, 100.0, 5000});
        gateway.on_fill(Fill{key, "BTCUSDT", Direction::Long, 30.0, 100.0, 5001});

        REQUIRE(state.snapshot().positions.at("BTCUSDT").qty == Approx(40.0));
        REQUIRE(gateway.order(key)->filled_qty == Approx(40.0));
    }

    SECTION("Partial fill times out and the remainder is cancelled") {
        gateway.on_fill(Fill{key, "BTCUSDT", Direction::Long, 10.0, 100.0, 5000});
        REQUIRE(gateway.order(key)->state == OrderState::PartiallyFilled);
        REQUIRE(state.snapshot().pending.at(key).filled_qty == Approx(10.0));

        REQUIRE(gateway.check_timeouts(util::current_timestamp_ms()) == 0);
        REQUIRE(gateway.check_timeouts(util::current_timestamp_ms() + 10000) == 1);
        REQUIRE(exchange->cancelled == std::vector<std::string>{key});
        REQUIRE(gateway.order(key)->state == OrderState::Cancelling);
        REQUIRE(state.snapshot().pending.empty());

        gateway.on_cancel_confirmed(key);
        REQUIRE(gateway.order(key)->state == OrderState::Cancelled);
        // The filled portion stays booked
        REQUIRE(state.snapshot().positions.at("BTCUSDT").qty == Approx(10.0));
        REQUIRE(state.snapshot().positions.at("BTCUSDT").risk_units == Approx(2.5));
    }

    SECTION("Fills after the cancel is confirmed are not booked") {
        gateway.on_fill(Fill{key, "BTCUSDT", Direction::Long, 10.0, 100.0, 5000});
        gateway.check_timeouts(util::current_timestamp_ms() + 10000);
        gateway.on_cancel_confirmed(key);

        gateway.on_fill(Fill{key, "BTCUSDT", Direction::Long, 30.0, 100.0, 5001});

        REQUIRE(gateway.order(key)->state == OrderState::Cancelled);
        REQUIRE(gateway.order(key)->filled_qty == Approx(10.0));
        REQUIRE(state.snapshot().positions.at("BTCUSDT").qty == Approx(10.0));
        REQUIRE(state.system_state(0).recent_errors.back().message.find("after order cancelled") !=
                std::string::npos);
    }

    SECTION("Fills reported while the cancel is in flight still count") {
        gateway.on_fill(Fill{key, "BTCUSDT", Direction::Long, 10.0, 100.0, 5000});
        gateway.check_timeouts(util::current_timestamp_ms() + 10000);

        gateway.on_fill(Fill{key, "BTCUSDT", Direction::Long, 5.0, 100.0, 5001});
        REQUIRE(gateway.order(key)->state == OrderState::Cancelling);
        REQUIRE(state.snapshot().positions.at("BTCUSDT").qty == Approx(15.0));
        REQUIRE(state.snapshot().pending.empty());

        gateway.on_cancel_confirmed(key);
        REQUIRE(gateway.order(key)->filled_qty == Approx(15.0));
    }

    SECTION("Fills after a rejection are not booked") {
        gateway.on_order_rejected(key, "insufficient margin");
        gateway.on_fill(Fill{key, "BTCUSDT", Direction::Long, 40.0, 100.0, 5000});

        REQUIRE(gateway.order(key)->state == OrderState::Rejected);
        REQUIRE(state.snapshot().positions.empty());
    }

    SECTION("Stop cancels unfilled entries") {
        state.set_running(false);
        REQUIRE(gateway.cancel_unfilled() == 1);
        REQUIRE(gateway.order(key)->state == OrderState::Cancelling);

        auto next = make_intent(2, "ETHUSDT");
        REQUIRE(gateway.execute(next, approve(next)).status == ExecutionStatus::Aborted);
    }

    SECTION("Exchange rejection after acceptance clears the order") {
        gateway.on_order_rejected(key, "insufficient margin");
        REQUIRE(gateway.order(key)->state == OrderState::Rejected);
        REQUIRE(gateway.order(key)->last_error == "insufficient margin");
        REQUIRE(state.snapshot().pending.empty());
    }

    SECTION("Unknown fills are ignored") {
        gateway.on_fill(Fill{"nope", "BTCUSDT", Direction::Long, 1.0, 100.0, 5000});
        REQUIRE(state.snapshot().positions.empty());
    }
}

TEST_CASE("Exit orders", "[execution_gateway]") {
    StateStore state(RiskConfig{});
    state.set_running(true);
    auto exchange = std::make_shared<FakeExchange>();
    ExecutionGateway gateway(state, exchange, fast_config());
    state.apply_fill(Fill{"entry", "BTCUSDT", Direction::Long, 2.0, 100.0, 0}, 10.0, false);

    ExitIntent exit_intent;
    exit_intent.symbol = "BTCUSDT";
    exit_intent.side = Direction::Short;
    exit_intent.qty = 2.0;
    exit_intent.reason = "stop-loss";
    exit_intent.ts_ms = 7000;

    SECTION("Exit is reduce-only and closes the position") {
        auto result = gateway.execute_exit(exit_intent);
        REQUIRE(result.status == ExecutionStatus::Submitted);
        REQUIRE(result.idempotency_key == "exit-BTCUSDT-7000-stop-loss");
        REQUIRE(exchange->submitted.back().reduce_only);
        REQUIRE(state.snapshot().has_pending_exit("BTCUSDT"));

        gateway.on_fill(Fill{result.idempotency_key, "BTCUSDT", Direction::Short, 2.0, 99.0, 8000});
        auto snap = state.snapshot();
        REQUIRE(snap.positions.empty());
        REQUIRE(snap.realized_pnl == Approx(-2.0));
    }

    SECTION("Exits proceed while stopped") {
        state.set_running(false);
        gateway.cancel_unfilled();
        REQUIRE(gateway.execute_exit(exit_intent).status == ExecutionStatus::Submitted);
    }

    SECTION("Same exit twice submits once") {
        gateway.execute_exit(exit_intent);
        REQUIRE(gateway.execute_exit(exit_intent).status == ExecutionStatus::Duplicate);
        REQUIRE(exchange->submitted.size() == 1);
    }
}

TEST_CASE("Reserved slots", "[execution_gateway]") {
    StateStore state(RiskConfig{});
    state.set_running(true);
    auto exchange = std::make_shared<FakeExchange>();
    ExecutionGateway gateway(state, exchange, fast_config());
    auto intent = make_intent(1);

    PendingOrder reservation;
    reservation.idempotency_key = intent.idempotency_key();
    reservation.symbol = intent.symbol;
    reservation.side = intent.direction;
    reservation.risk_units = 10.0;
    REQUIRE_FALSE(state.reserve_entry(reservation, RiskConfig{}).has_value());

    SECTION("Submission takes the reservation over") {
        gateway.execute(intent, approve(intent));
        auto pending = state.snapshot().pending;
        REQUIRE(pending.size() == 1);
        REQUIRE(pending.at(intent.idempotency_key()).qty == Approx(40.0));
    }

    SECTION("Orders never sent release it") {
        REQUIRE(gateway.execute(intent, approve(intent, 0.0)).status == ExecutionStatus::Rejected);
        REQUIRE(state.snapshot().pending.empty());
    }

    SECTION("Duplicates of a finished order release it") {
        gateway.execute(intent, approve(intent));
        gateway.on_fill(Fill{intent.idempotency_key(), "", Direction::Flat, 40.0, 100.0, 5000});

        // Re-approved under the same key while the position is open
        RiskConfig pyramid;
        pyramid.allow_pyramiding = true;
        REQUIRE_FALSE(state.reserve_entry(reservation, pyramid).has_value());
        REQUIRE(state.snapshot().pending.size() == 1);

        REQUIRE(gateway.execute(intent, approve(intent)).status == ExecutionStatus::Duplicate);
        REQUIRE(state.snapshot().pending.empty());
    }
}

TEST_CASE("Finished orders are pruned", "[execution_gateway]") {
    StateStore state(RiskConfig{});
    state.set_running(true);
    auto exchange = std::make_shared<FakeExchange>();
    auto cfg = fast_config();
    cfg.retention_ms = 60000;
    ExecutionGateway gateway(state, exchange, cfg);

    auto filled = make_intent(1);
    auto live = make_intent(2, "ETHUSDT");
    gateway.execute(filled, approve(filled));
    gateway.on_fill(Fill{filled.idempotency_key(), "", Direction::Flat, 40.0, 100.0, 5000});
    gateway.execute(live, approve(live));

    REQUIRE(gateway.prune(util::current_timestamp_ms()) == 0);
    REQUIRE(gateway.prune(util::current_timestamp_ms() + 60000) == 1);

    REQUIRE_FALSE(gateway.order(filled.idempotency_key()).has_value());
    REQUIRE(gateway.order(live.idempotency_key())->state == OrderState::Live);
}

TEST_CASE("Scheduled retries", "[execution_gateway]") {
    StateStore state(RiskConfig{});
    state.set_running(true);
    auto exchange = std::make_shared<FakeExchange>();

    std::vector<std::pair<int64_t, std::function<void()>>> scheduled;
    bool accept = true;
    ExecutionGateway gateway(state, exchange, fast_config(),
        [&](int64_t delay_ms, std::function<void()> task) {
            if (!accept) return false;
            scheduled.emplace_back(delay_ms, std::move(task));
            return true;
        });
    auto intent = make_intent(1);
    auto key = intent.idempotency_key();

    // A retry may schedule the next one, so run a copy
    auto run_scheduled = [&scheduled](size_t i) {
        auto task = scheduled.at(i).second;
        task();
    };

    SECTION("Transient failure returns at once and the retry runs later") {
        exchange->script = {SubmitOutcome::TransientError};
        auto result = gateway.execute(intent, approve(intent));

        REQUIRE(result.status == ExecutionStatus::Retrying);
        REQUIRE(result.attempts == 1);
        REQUIRE(scheduled.size() == 1);
        REQUIRE(scheduled[0].first == 1);
        REQUIRE(gateway.order(key)->state == OrderState::Submitting);
        REQUIRE(state.snapshot().has_pending_entry("BTCUSDT"));

        run_scheduled(0);
        REQUIRE(exchange->submitted.size() == 2);
        REQUIRE(gateway.order(key)->state == OrderState::Live);
        REQUIRE(gateway.order(key)->attempts == 2);
    }

    SECTION("Retry is abandoned after a stop") {
        exchange->script = {SubmitOutcome::TransientError};
        gateway.execute(intent, approve(intent));
        state.set_running(false);
        gateway.cancel_unfilled();

        run_scheduled(0);
        REQUIRE(exchange->submitted.size() == 1);
        REQUIRE(gateway.order(key)->state == OrderState::Cancelled);
        REQUIRE_FALSE(state.snapshot().has_pending_entry("BTCUSDT"));
    }

    SECTION("Last attempt fails through the scheduler too") {
        exchange->script = {SubmitOutcome::TransientError, SubmitOutcome::TransientError,
                            SubmitOutcome::TransientError};
        gateway.execute(intent, approve(intent));
        run_scheduled(0);
        run_scheduled(1);

        REQUIRE(scheduled.size() == 2);
        REQUIRE(scheduled[1].first == 2);
        REQUIRE(gateway.order(key)->state == OrderState::Failed);
        REQUIRE(gateway.order(key)->attempts == 3);
    }

    SECTION("Closed scheduler fails the order") {
        accept = false;
        exchange->script = {SubmitOutcome::TransientError};
        auto result = gateway.execute(intent, approve(intent));

        REQUIRE(result.status == ExecutionStatus::Failed);
        REQUIRE(gateway.order(key)->state == OrderState::Failed);
        REQUIRE_FALSE(state.snapshot().has_pending_entry("BTCUSDT"));
    }
}
