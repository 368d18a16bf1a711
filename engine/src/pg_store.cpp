#include "pg_store.hpp"
#include "normalize.hpp"
#include "state_json.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS positions (
                symbol TEXT PRIMARY KEY,
                side TEXT NOT NULL CHECK (side IN ('long','short')),
                entry_price NUMERIC NOT NULL,
                qty NUMERIC NOT NULL,
                opened_ms BIGINT NOT NULL,
                stop_price NUMERIC,
                target_price NUMERIC,
                risk_units NUMERIC,
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS daily_pnl (
                day DATE PRIMARY KEY,
                realized_pnl NUMERIC NOT NULL,
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        // Single-row tables
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS engine_control (
                id INT PRIMARY KEY CHECK (id = 1),
                running BOOLEAN NOT NULL,
                halted BOOLEAN NOT NULL,
                halt_reason TEXT,
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS risk_config (
                id INT PRIMARY KEY CHECK (id = 1),
                config JSONB NOT NULL,
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

void PostgresStore::save_position(const Position& p) {
    auto conn = make_connection();
    pqxx::work txn(conn);

    txn.exec_params(
        "INSERT INTO positions (symbol, side, entry_price, qty, opened_ms, stop_price, "
        "target_price, risk_units, updated_at) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, NOW()) "
        "ON CONFLICT (symbol) DO UPDATE SET side = $2, entry_price = $3, qty = $4, "
        "opened_ms = $5, stop_price = $6, target_price = $7, risk_units = $8, updated_at = NOW()",
        p.symbol, std::string(direction_name(p.side)), p.entry_price, p.qty, p.opened_ms,
        p.stop_price, p.target_price, p.risk_units
    );

    txn.commit();
}

void PostgresStore::delete_position(const std::string& symbol) {
    auto conn = make_connection();
    pqxx::work txn(conn);
    txn.exec_params("DELETE FROM positions WHERE symbol = $1", symbol);
    txn.commit();
}

void PostgresStore::save_daily_pnl(const std::string& day, double realized_pnl) {
    auto conn = make_connection();
    pqxx::work txn(conn);

    txn.exec_params(
        "INSERT INTO daily_pnl (day, realized_pnl, updated_at) VALUES ($1::date, $2, NOW()) "
        "ON CONFLICT (day) DO UPDATE SET realized_pnl = $2, updated_at = NOW()",
        day, realized_pnl
    );

    txn.commit();
}

void PostgresStore::save_control(bool running, bool halted, const std::string& halt_reason) {
    auto conn = make_connection();
    pqxx::work txn(conn);

    txn.exec_params(
        "INSERT INTO engine_control (id, running, halted, halt_reason, updated_at) "
        "VALUES (1, $1, $2, $3, NOW()) "
        "ON CONFLICT (id) DO UPDATE SET running = $1, halted = $2, halt_reason = $3, "
        "updated_at = NOW()",
        running, halted, halt_reason
    );

    txn.commit();
}

void PostgresStore::save_risk_config(const RiskConfig& config) {
    auto conn = make_connection();
    pqxx::work txn(conn);

    txn.exec_params(
        "INSERT INTO risk_config (id, config, updated_at) VALUES (1, $1::jsonb, NOW()) "
        "ON CONFLICT (id) DO UPDATE SET config = $1::jsonb, updated_at = NOW()",
        StateSerializer::risk_config(config).dump()
    );

    txn.commit();
}

PersistedState PostgresStore::load() {
    PersistedState state;

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto rows = txn.exec(
            "SELECT symbol, side, entry_price, qty, opened_ms, stop_price, target_price, "
            "risk_units FROM positions"
        );
        for (const auto& row : rows) {
            Position p;
            p.symbol = row[0].as<std::string>();
            p.side = Normalizer::parse_direction(row[1].as<std::string>());
            p.entry_price = row[2].as<double>();
            p.qty = row[3].as<double>();
            p.opened_ms = row[4].as<int64_t>();
            p.stop_price = row[5].is_null() ? 0.0 : row[5].as<double>();
            p.target_price = row[6].is_null() ? 0.0 : row[6].as<double>();
            p.risk_units = row[7].is_null() ? 0.0 : row[7].as<double>();
            p.mark_price = p.entry_price;
            state.positions.push_back(p);
        }

        auto pnl = txn.exec(
            "SELECT to_char(day, 'YYYY-MM-DD'), realized_pnl FROM daily_pnl "
            "ORDER BY day DESC LIMIT 1"
        );
        if (!pnl.empty()) {
            state.trading_day = pnl[0][0].as<std::string>();
            state.realized_pnl = pnl[0][1].as<double>();
        }

        auto control = txn.exec("SELECT halted, halt_reason FROM engine_control WHERE id = 1");
        if (!control.empty()) {
            state.halted = control[0][0].as<bool>();
            state.halt_reason = control[0][1].is_null() ? "" : control[0][1].as<std::string>();
        }

        auto cfg = txn.exec("SELECT config::text FROM risk_config WHERE id = 1");
        if (!cfg.empty()) {
            auto j = nlohmann::json::parse(cfg[0][0].as<std::string>());
            state.risk_config = Normalizer::parse_risk_config(j, RiskConfig{});
        }

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to load persisted state: {}", e.what());
        throw;
    }

    return state;
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Postgres ping failed: {}", e.what());
        return false;
    }
}
