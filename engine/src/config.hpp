#pragma once

#include "types.hpp"
#include "market_signal.hpp"
#include "trend.hpp"
#include "strategy_router.hpp"
#include "execution_gateway.hpp"
#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_orderbook;
    std::string stream_sentiment;
    std::string stream_text;
    std::string stream_exec_orders;
    std::string stream_exec_events;
    std::string stream_req;
    std::string stream_rep;
    std::string stream_state;
    std::string consumer_group;
    std::string consumer_name;

    // Postgres (optional; empty disables durability)
    std::string pg_dsn;

    std::vector<std::string> symbols;

    MarketSignalConfig market;
    TrendConfig trend;
    std::string sentiment_feed;         // "live" or "simulated"
    uint32_t simulation_seed;
    int trend_refresh_ms;

    RouterConfig router;
    RiskConfig risk;
    ExecutionConfig execution;

    int broadcast_interval_ms;
    int review_interval_ms;
    int worker_threads;
    int history_size;
    bool auto_start;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

    static std::vector<std::string> split_symbols(const std::string& csv);

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static int64_t get_env_int64(const char* name, int64_t default_val);
    static double get_env_double(const char* name, double default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
