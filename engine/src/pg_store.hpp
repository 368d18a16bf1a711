#pragma once

#include "state_repository.hpp"
#include <string>
#include <pqxx/pqxx>

class PostgresStore : public StateRepository {
public:
    explicit PostgresStore(const std::string& dsn);

    void init_schema();
    bool ping();

    void save_position(const Position& position) override;
    void delete_position(const std::string& symbol) override;
    void save_daily_pnl(const std::string& day, double realized_pnl) override;
    void save_control(bool running, bool halted, const std::string& halt_reason) override;
    void save_risk_config(const RiskConfig& config) override;

    PersistedState load() override;

private:
    std::string dsn_;
    pqxx::connection make_connection();
};
