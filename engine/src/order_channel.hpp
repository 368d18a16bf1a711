#pragma once

#include "execution_gateway.hpp"
#include "redis_bus.hpp"
#include <memory>
#include <string>

// ExchangeClient that hands orders to the exchange-execution client over a
// Redis stream. Fills, rejections and cancels come back on the events stream.
class RedisOrderChannel : public ExchangeClient {
public:
    RedisOrderChannel(std::shared_ptr<RedisBus> bus, std::string stream);

    SubmitAck submit(const OrderRequest& request) override;
    SubmitAck cancel(const std::string& idempotency_key, const std::string& symbol) override;

private:
    std::shared_ptr<RedisBus> bus_;
    std::string stream_;

    SubmitAck send(const nlohmann::json& msg);
};
