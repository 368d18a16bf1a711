#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<PostgresStore> pg,
                         const StateStore& state)
    : redis_(redis), pg_(pg), state_(state) {}

nlohmann::json HealthCheck::get_status() const {
    bool redis_ok = redis_->ping();
    bool pg_ok = pg_ ? pg_->ping() : true;
    auto snap = state_.snapshot();

    nlohmann::json status = {
        {"ok", redis_ok && pg_ok},
        {"redis", redis_ok},
        {"postgres", pg_ ? (pg_ok ? "up" : "down") : "disabled"},
        {"running", snap.running},
        {"halted", snap.halted},
        {"open_positions", snap.positions.size()},
        {"ts", util::current_iso8601()}
    };

    return status;
}

bool HealthCheck::is_healthy() const {
    return redis_->ping() && (!pg_ || pg_->ping());
}
