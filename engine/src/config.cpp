#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/ranges.h>
#include <sstream>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

int64_t Config::get_env_int64(const char* name, int64_t default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoll(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string v = util::to_lower(val);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

std::vector<std::string> Config::split_symbols(const std::string& csv) {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string token;
    while (std::getline(ss, token, ',')) {
        auto start = token.find_first_not_of(" \t");
        auto end = token.find_last_not_of(" \t");
        if (start == std::string::npos) continue;
        out.push_back(token.substr(start, end - start + 1));
    }
    return out;
}

Config Config::from_env() {
    Config cfg;

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_orderbook = get_env("STREAM_ORDERBOOK", "trendscalp.market.orderbook");
    cfg.stream_sentiment = get_env("STREAM_SENTIMENT", "trendscalp.sentiment");
    cfg.stream_text = get_env("STREAM_TEXT", "trendscalp.sentiment.text");
    cfg.stream_exec_orders = get_env("STREAM_EXEC_ORDERS", "trendscalp.exec.orders");
    cfg.stream_exec_events = get_env("STREAM_EXEC_EVENTS", "trendscalp.exec.events");
    cfg.stream_req = get_env("STREAM_REQ", "trendscalp.cmd.requests");
    cfg.stream_rep = get_env("STREAM_REP", "trendscalp.cmd.replies");
    cfg.stream_state = get_env("STREAM_STATE", "trendscalp.state");
    cfg.consumer_group = get_env("CONSUMER_GROUP", "engine");
    cfg.consumer_name = get_env("CONSUMER_NAME", "engine-1");

    cfg.pg_dsn = get_env("PG_DSN");

    cfg.symbols = split_symbols(get_env("SYMBOLS", "BTCUSDT,ETHUSDT,SOLUSDT"));

    // Order-book signal
    cfg.market.depth = get_env_int("OB_DEPTH", 5);
    cfg.market.long_threshold = get_env_double("OB_LONG_THRESHOLD", 0.2);
    cfg.market.short_threshold = get_env_double("OB_SHORT_THRESHOLD", -0.2);
    cfg.market.normalization = get_env_double("OB_NORMALIZATION", 1.0);

    // Trend
    cfg.trend.staleness_ms = get_env_int64("TREND_STALENESS_MS", 300000);
    cfg.trend.half_life_ms = get_env_int64("TREND_HALF_LIFE_MS", 60000);
    cfg.trend.capacity = static_cast<size_t>(get_env_int("TREND_CAPACITY", 256));
    cfg.sentiment_feed = get_env("SENTIMENT_FEED", "simulated");
    cfg.simulation_seed = static_cast<uint32_t>(get_env_int64("SIMULATION_SEED", 42));
    cfg.trend_refresh_ms = get_env_int("TREND_REFRESH_MS", 5000);

    // Fusion
    cfg.router.dominance_threshold = get_env_double("DOMINANCE_THRESHOLD", 0.6);
    cfg.router.trend_threshold = get_env_double("TREND_THRESHOLD", 0.3);
    cfg.router.market_weight = get_env_double("MARKET_WEIGHT", 0.6);
    cfg.router.trend_weight = get_env_double("TREND_WEIGHT", 0.4);
    cfg.router.disagreement_penalty = get_env_double("DISAGREEMENT_PENALTY", 0.5);
    cfg.router.base_risk_units = get_env_double("BASE_RISK_UNITS", 20.0);

    // Risk
    cfg.risk.daily_loss_limit = get_env_double("DAY_LOSS_LIMIT_USD", 200.0);
    cfg.risk.max_risk_per_trade = get_env_double("MAX_RISK_PER_TRADE", 20.0);
    cfg.risk.max_concurrent_positions = get_env_int("MAX_ACTIVE_SYMBOLS", 5);
    cfg.risk.max_slippage_bps = get_env_double("MAX_SLIPPAGE_BPS", 100.0);
    cfg.risk.daily_profit_target = get_env_double("DAY_PROFIT_TARGET_USD", 0.0);
    cfg.risk.default_sl_bps = get_env_double("DEFAULT_SL_BPS", 25.0);
    cfg.risk.default_tp_bps = get_env_double("DEFAULT_TP_BPS", 50.0);
    cfg.risk.max_holding_ms = get_env_int64("MAX_HOLDING_MS", 0);
    cfg.risk.cooldown_ms = get_env_int64("TRADE_COOLDOWN_MS", 60000);
    cfg.risk.allow_pyramiding = get_env_bool("ALLOW_PYRAMIDING", false);
    cfg.risk.liquidate_on_halt = get_env_bool("LIQUIDATE_ON_HALT", true);

    // Execution
    cfg.execution.max_attempts = get_env_int("ORDER_MAX_ATTEMPTS", 4);
    cfg.execution.backoff_base_ms = get_env_int64("ORDER_BACKOFF_BASE_MS", 100);
    cfg.execution.backoff_cap_ms = get_env_int64("ORDER_BACKOFF_CAP_MS", 2000);
    cfg.execution.fill_timeout_ms = get_env_int64("FILL_TIMEOUT_MS", 5000);
    cfg.execution.order_type = get_env("ORDER_TYPE", "market");
    cfg.execution.retention_ms = get_env_int64("ORDER_RETENTION_MS", 3600000);

    cfg.broadcast_interval_ms = get_env_int("BROADCAST_INTERVAL_MS", 1000);
    cfg.review_interval_ms = get_env_int("REVIEW_INTERVAL_MS", 1000);
    cfg.worker_threads = get_env_int("WORKER_THREADS", 4);
    cfg.history_size = get_env_int("DECISION_HISTORY", 50);
    cfg.auto_start = get_env_bool("AUTO_START", false);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8090);

    cfg.service_name = get_env("SERVICE_NAME", "trendscalp-engine");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (symbols.empty()) {
        throw std::runtime_error("SYMBOLS must name at least one symbol");
    }
    if (sentiment_feed != "live" && sentiment_feed != "simulated") {
        throw std::runtime_error("SENTIMENT_FEED must be 'live' or 'simulated'");
    }
    if (trend_refresh_ms <= 0 || broadcast_interval_ms <= 0 || review_interval_ms <= 0) {
        throw std::runtime_error("timer intervals must be positive");
    }
    if (worker_threads < 1 || history_size < 1) {
        throw std::runtime_error("WORKER_THREADS and DECISION_HISTORY must be >= 1");
    }
    if (execution.max_attempts < 1 || execution.backoff_base_ms < 0 ||
        execution.fill_timeout_ms <= 0 || execution.retention_ms <= 0) {
        throw std::runtime_error("invalid order retry/timeout settings");
    }

    try {
        router.validate();
        validate_risk_config(risk);
        MarketSignalGenerator generator(market);
    } catch (const ConfigError& e) {
        throw std::runtime_error(std::string("invalid configuration: ") + e.what());
    }

    if (pg_dsn.empty()) {
        spdlog::warn("PG_DSN not set, positions and PnL will not survive a restart");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Symbols: {}", fmt::join(symbols, ","));
    spdlog::info("  Sentiment feed: {} (seed {})", sentiment_feed, simulation_seed);
    spdlog::info("  Fusion: dominance={} trend={} weights={}/{}",
                 router.dominance_threshold, router.trend_threshold,
                 router.market_weight, router.trend_weight);
    spdlog::info("  Risk: loss_limit={} max_risk={} max_positions={} slippage={}bps",
                 risk.daily_loss_limit, risk.max_risk_per_trade,
                 risk.max_concurrent_positions, risk.max_slippage_bps);
}
