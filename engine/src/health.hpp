#pragma once

#include "redis_bus.hpp"
#include "pg_store.hpp"
#include "state_store.hpp"
#include <nlohmann/json.hpp>
#include <memory>

class HealthCheck {
public:
    // pg may be null when durability is disabled
    HealthCheck(std::shared_ptr<RedisBus> redis,
                std::shared_ptr<PostgresStore> pg,
                const StateStore& state);

    nlohmann::json get_status() const;
    bool is_healthy() const;

private:
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<PostgresStore> pg_;
    const StateStore& state_;
};
