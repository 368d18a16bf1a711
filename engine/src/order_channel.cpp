#include "order_channel.hpp"
#include "state_json.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

RedisOrderChannel::RedisOrderChannel(std::shared_ptr<RedisBus> bus, std::string stream)
    : bus_(std::move(bus)), stream_(std::move(stream)) {}

SubmitAck RedisOrderChannel::send(const nlohmann::json& msg) {
    SubmitAck ack;
    try {
        bus_->publish(stream_, msg);
        ack.outcome = SubmitOutcome::Accepted;
    } catch (const sw::redis::IoError& e) {
        // Includes TimeoutError
        ack.outcome = SubmitOutcome::TransientError;
        ack.message = e.what();
    } catch (const sw::redis::ClosedError& e) {
        ack.outcome = SubmitOutcome::TransientError;
        ack.message = e.what();
    } catch (const sw::redis::Error& e) {
        ack.outcome = SubmitOutcome::TerminalError;
        ack.message = e.what();
    }
    return ack;
}

SubmitAck RedisOrderChannel::submit(const OrderRequest& request) {
    auto ack = send(StateSerializer::order_request(request));
    if (ack.outcome != SubmitOutcome::Accepted) {
        spdlog::warn("Order publish for {} failed: {}", request.idempotency_key, ack.message);
    }
    return ack;
}

SubmitAck RedisOrderChannel::cancel(const std::string& idempotency_key, const std::string& symbol) {
    nlohmann::json msg = {
        {"type", "cancel"},
        {"key", idempotency_key},
        {"symbol", symbol},
        {"ts", util::current_timestamp_ms()}
    };
    return send(msg);
}
