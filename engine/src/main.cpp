#include "config.hpp"
#include "errors.hpp"
#include "redis_bus.hpp"
#include "order_channel.hpp"
#include "pg_store.hpp"
#include "health.hpp"
#include "market_signal.hpp"
#include "trend.hpp"
#include "text_scorer.hpp"
#include "strategy_router.hpp"
#include "risk_engine.hpp"
#include "execution_gateway.hpp"
#include "state_store.hpp"
#include "decision_pipeline.hpp"
#include "worker_pool.hpp"
#include "timer_queue.hpp"
#include "normalize.hpp"
#include "state_json.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <functional>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("trendscalp", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void send_reply(RedisBus& redis, const Config& config, const std::string& corr_id,
                bool ok, const std::string& message,
                const nlohmann::json& data = nlohmann::json()) {
    nlohmann::json reply = {
        {"corr_id", corr_id},
        {"ok", ok},
        {"message", message},
        {"ts", util::current_iso8601()}
    };
    if (!data.is_null()) reply["data"] = data;
    redis.publish_best_effort(config.stream_rep, reply);
}

void handle_command(const nlohmann::json& cmd, DecisionPipeline& pipeline, StateStore& state,
                    RedisBus& redis, const Config& config) {
    std::string corr_id = cmd.value("corr_id", "");
    std::string name = cmd.value("cmd", "");

    try {
        if (name == "start") {
            pipeline.start();
            send_reply(redis, config, corr_id, true, "Strategy started");
        } else if (name == "stop") {
            pipeline.stop();
            send_reply(redis, config, corr_id, true, "Strategy stopped, unfilled orders cancelled");
        } else if (name == "update_risk_config") {
            auto current = state.risk_config();
            RiskConfig next = Normalizer::parse_risk_config(cmd.value("config", nlohmann::json::object()),
                                                            *current);
            pipeline.update_risk_config(next);
            send_reply(redis, config, corr_id, true, "Risk config updated",
                       StateSerializer::risk_config(next));
        } else if (name == "status") {
            send_reply(redis, config, corr_id, true, "ok",
                       StateSerializer::system_state(state.system_state(util::current_timestamp_ms())));
        } else {
            send_reply(redis, config, corr_id, false, "Unknown command: " + name);
        }
        spdlog::info("Processed command '{}' ({})", name, corr_id);

    } catch (const ConfigError& e) {
        spdlog::warn("Rejected risk config update: {}", e.what());
        send_reply(redis, config, corr_id, false, std::string("Invalid risk config: ") + e.what());
    }
}

void command_consumer_loop(std::shared_ptr<Config> config,
                           std::shared_ptr<RedisBus> redis,
                           DecisionPipeline& pipeline,
                           StateStore& state,
                           std::atomic<bool>& running) {
    spdlog::info("Starting command consumer");
    redis->create_consumer_group(config->stream_req, config->consumer_group);

    while (running) {
        try {
            auto commands = redis->read_group(config->stream_req, config->consumer_group,
                                              config->consumer_name, 10, 1000);

            for (const auto& [msg_id, cmd_json] : commands) {
                try {
                    handle_command(cmd_json, pipeline, state, *redis, *config);
                } catch (const std::exception& e) {
                    spdlog::error("Failed to process command: {}", e.what());
                }
                redis->ack_message(config->stream_req, config->consumer_group, msg_id);
            }

        } catch (const std::exception& e) {
            spdlog::error("Command consumer error: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    spdlog::info("Command consumer stopped");
}

// Drains one inbound stream; handler failures are logged per message
void stream_consumer_loop(const std::string& name,
                          const std::string& stream,
                          std::shared_ptr<Config> config,
                          std::shared_ptr<RedisBus> redis,
                          std::function<void(const nlohmann::json&)> handler,
                          std::atomic<bool>& running) {
    spdlog::info("Starting {} consumer on {}", name, stream);
    redis->create_consumer_group(stream, config->consumer_group);

    while (running) {
        try {
            auto messages = redis->read_group(stream, config->consumer_group,
                                              config->consumer_name, 100, 200);
            for (const auto& [msg_id, data] : messages) {
                try {
                    handler(data);
                } catch (const InputError& e) {
                    spdlog::warn("Dropped {} message {}: {}", name, msg_id, e.what());
                } catch (const std::exception& e) {
                    spdlog::error("Failed to handle {} message {}: {}", name, msg_id, e.what());
                }
                redis->ack_message(stream, config->consumer_group, msg_id);
            }
        } catch (const std::exception& e) {
            spdlog::error("{} consumer error: {}", name, e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    spdlog::info("{} consumer stopped", name);
}

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->log_level);

        spdlog::info("==============================================");
        spdlog::info("TrendScalp Decision Engine v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // Infrastructure
        auto redis = std::make_shared<RedisBus>(config->redis_url);
        std::shared_ptr<PostgresStore> pg;
        if (!config->pg_dsn.empty()) {
            pg = std::make_shared<PostgresStore>(config->pg_dsn);
            pg->init_schema();
        }

        // State
        StateStore state(config->risk, pg, static_cast<size_t>(config->history_size));
        state.restore();
        if (config->auto_start && !state.halted()) {
            state.set_running(true);
        }

        // Signal sources
        MarketSignalGenerator generator(config->market);

        LiveFeed* live_feed = nullptr;
        std::unique_ptr<SentimentFeed> feed;
        if (config->sentiment_feed == "live") {
            auto live = std::make_unique<LiveFeed>();
            live_feed = live.get();
            feed = std::move(live);
        } else {
            spdlog::warn("No live sentiment feed configured, using simulated sentiment (seed {})",
                         config->simulation_seed);
            feed = std::make_unique<SimulatedFeed>(config->simulation_seed);
        }
        TrendAggregator trends(config->trend, std::move(feed));
        SymbolMapper mapper;
        LexiconScorer scorer;

        // Decision chain
        StrategyRouter router(config->router);
        RiskEngine risk(state);
        auto exchange = std::make_shared<RedisOrderChannel>(redis, config->stream_exec_orders);
        // Backoff between attempts runs here, never on a pool worker
        TimerQueue retry_timer;
        ExecutionGateway gateway(state, exchange, config->execution,
            [&retry_timer](int64_t delay_ms, std::function<void()> task) {
                return retry_timer.schedule(delay_ms, std::move(task));
            });

        WorkerPool pool(static_cast<size_t>(config->worker_threads));
        DecisionPipeline pipeline(state, generator, router, risk, gateway,
            [&pool](std::function<void()> task) {
                if (!pool.post(std::move(task))) {
                    spdlog::warn("Worker pool closed, task dropped");
                }
            },
            util::current_timestamp_ms);

        auto health = std::make_shared<HealthCheck>(redis, pg, state);

        // Consumers
        std::atomic<bool> consumers_running{true};

        std::thread command_thread(command_consumer_loop, config, redis,
                                   std::ref(pipeline), std::ref(state),
                                   std::ref(consumers_running));

        std::thread exec_thread(stream_consumer_loop, "execution", config->stream_exec_events,
            config, redis,
            [&gateway](const nlohmann::json& j) {
                ExecutionEvent ev = Normalizer::parse_execution_event(j);
                switch (ev.type) {
                    case ExecutionEventType::Fill:
                        gateway.on_fill(ev.fill);
                        break;
                    case ExecutionEventType::Rejected:
                        gateway.on_order_rejected(ev.fill.idempotency_key, ev.reason);
                        break;
                    case ExecutionEventType::Cancelled:
                        gateway.on_cancel_confirmed(ev.fill.idempotency_key);
                        break;
                }
            },
            std::ref(consumers_running));

        std::vector<std::thread> feed_threads;
        if (live_feed) {
            feed_threads.emplace_back(stream_consumer_loop, "sentiment", config->stream_sentiment,
                config, redis,
                [live_feed](const nlohmann::json& j) {
                    live_feed->push(Normalizer::parse_sentiment(j));
                },
                std::ref(consumers_running));

            feed_threads.emplace_back(stream_consumer_loop, "text", config->stream_text,
                config, redis,
                [live_feed, &mapper, &scorer](const nlohmann::json& j) {
                    auto sig = Normalizer::parse_text_event(j, mapper, scorer);
                    if (sig) live_feed->push(*sig);
                },
                std::ref(consumers_running));
        }

        // Timers: trend refresh, position review, fill timeouts, broadcast, day rollover
        std::thread timer_thread([&]() {
            int64_t next_trend = 0;
            int64_t next_review = 0;
            int64_t next_broadcast = 0;

            while (consumers_running) {
                int64_t now = util::current_timestamp_ms();
                try {
                    state.roll_day(now);

                    if (now >= next_trend) {
                        pipeline.on_trend_scores(trends.refresh(config->symbols, now));
                        next_trend = now + config->trend_refresh_ms;
                    }
                    if (now >= next_review) {
                        gateway.check_timeouts(now);
                        gateway.prune(now);
                        pipeline.review(now);
                        next_review = now + config->review_interval_ms;
                    }
                    if (now >= next_broadcast) {
                        auto st = StateSerializer::system_state(state.system_state(now));
                        redis->publish_best_effort(config->stream_state, st, 1000);
                        next_broadcast = now + config->broadcast_interval_ms;
                    }
                } catch (const std::exception& e) {
                    spdlog::error("Timer error: {}", e.what());
                    state.record_error(std::string("timer: ") + e.what(), now);
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });

        // HTTP health and state
        httplib::Server server;

        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            auto status = health->get_status();
            res.set_content(status.dump(), "application/json");
            res.status = health->is_healthy() ? 200 : 503;
        });

        server.Get("/state", [&state](const httplib::Request&, httplib::Response& res) {
            auto st = StateSerializer::system_state(state.system_state(util::current_timestamp_ms()));
            res.set_content(st.dump(), "application/json");
        });

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });

        spdlog::info("Decision engine started for {} symbols ({})", config->symbols.size(),
                     state.running() ? "running" : "stopped, awaiting start");

        // Main loop: order books are the hot path
        redis->create_consumer_group(config->stream_orderbook, config->consumer_group);
        while (!shutdown_requested) {
            try {
                auto books = redis->read_group(config->stream_orderbook, config->consumer_group,
                                               config->consumer_name, 100, 200);
                for (const auto& [msg_id, data] : books) {
                    try {
                        pipeline.on_order_book(Normalizer::parse_order_book(data));
                    } catch (const InputError& e) {
                        spdlog::warn("Dropped order book {}: {}", msg_id, e.what());
                    } catch (const std::exception& e) {
                        spdlog::error("Order book {} failed: {}", msg_id, e.what());
                        state.record_error(e.what(), util::current_timestamp_ms());
                    }
                    redis->ack_message(config->stream_orderbook, config->consumer_group, msg_id);
                }
            } catch (const std::exception& e) {
                spdlog::error("Main loop error: {}", e.what());
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
        }

        // Shutdown
        spdlog::info("Stopping services...");
        consumers_running = false;
        server.stop();

        if (command_thread.joinable()) command_thread.join();
        if (exec_thread.joinable()) exec_thread.join();
        for (auto& t : feed_threads) {
            if (t.joinable()) t.join();
        }
        if (timer_thread.joinable()) timer_thread.join();
        if (http_thread.joinable()) http_thread.join();
        retry_timer.shutdown();
        pool.shutdown();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
