#pragma once

#include "types.hpp"
#include "state_store.hpp"
#include "execution_gateway.hpp"
#include <nlohmann/json.hpp>

class StateSerializer {
public:
    static nlohmann::json position(const Position& p);
    static nlohmann::json risk_config(const RiskConfig& c);
    static nlohmann::json intent(const TradeIntent& i);
    static nlohmann::json verdict(const RiskVerdict& v);
    static nlohmann::json trend(const TrendScore& t);
    static nlohmann::json order_request(const OrderRequest& r);
    static nlohmann::json system_state(const SystemState& s);
};
