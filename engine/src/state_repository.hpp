#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

struct PersistedState {
    std::vector<Position> positions;
    std::string trading_day;
    double realized_pnl = 0.0;
    bool halted = false;
    std::string halt_reason;
    std::optional<RiskConfig> risk_config;
};

// Durability collaborator: written through on every StateStore mutation,
// read through once on startup. Implementations throw on I/O failure.
class StateRepository {
public:
    virtual ~StateRepository() = default;

    virtual void save_position(const Position& position) = 0;
    virtual void delete_position(const std::string& symbol) = 0;
    virtual void save_daily_pnl(const std::string& day, double realized_pnl) = 0;
    virtual void save_control(bool running, bool halted, const std::string& halt_reason) = 0;
    virtual void save_risk_config(const RiskConfig& config) = 0;

    virtual PersistedState load() = 0;
};
