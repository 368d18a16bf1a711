#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <iterator>
#include <unordered_map>

namespace {
using Attrs = std::unordered_map<std::string, std::string>;
using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;
using ItemStream = std::vector<Item>;
}

RedisBus::RedisBus(const std::string& redis_url) {
    try {
        redis_ = std::make_shared<sw::redis::Redis>(redis_url);
        spdlog::info("Connected to Redis: {}", redis_url);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

void RedisBus::create_consumer_group(const std::string& stream, const std::string& group) {
    try {
        redis_->xgroup_create(stream, group, "$", true);
        spdlog::info("Created consumer group {} on stream {}", group, stream);
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Consumer group may already exist: {}", e.what());
    }
}

std::vector<std::pair<std::string, nlohmann::json>>
RedisBus::read_group(const std::string& stream, const std::string& group,
                     const std::string& consumer, int count, int block_ms) {
    std::vector<std::pair<std::string, nlohmann::json>> results;

    try {
        std::unordered_map<std::string, ItemStream> items;

        redis_->xreadgroup(group, consumer,
            stream, ">",
            std::chrono::milliseconds(block_ms),
            count,
            std::inserter(items, items.end()));

        for (const auto& [stream_name, item_stream] : items) {
            for (const auto& item : item_stream) {
                if (!item.second) continue;
                auto it = item.second->find("data");
                if (it == item.second->end()) {
                    ack_message(stream, group, item.first);
                    continue;
                }
                try {
                    results.emplace_back(item.first, nlohmann::json::parse(it->second));
                } catch (const nlohmann::json::exception& e) {
                    spdlog::error("Failed to parse message {} on {}: {}", item.first, stream, e.what());
                    ack_message(stream, group, item.first);
                }
            }
        }
    } catch (const sw::redis::TimeoutError&) {
        // Nothing arrived within block_ms
    } catch (const std::exception& e) {
        spdlog::error("Failed to read {}: {}", stream, e.what());
    }

    return results;
}

void RedisBus::publish(const std::string& stream, const nlohmann::json& data) {
    std::unordered_map<std::string, std::string> fields;
    fields["data"] = data.dump();

    redis_->xadd(stream, "*", fields.begin(), fields.end());
    spdlog::debug("Published to {}", stream);
}

void RedisBus::publish_best_effort(const std::string& stream, const nlohmann::json& data,
                                   long long maxlen) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["data"] = data.dump();

        if (maxlen > 0) {
            redis_->xadd(stream, "*", fields.begin(), fields.end(), maxlen, true);
        } else {
            redis_->xadd(stream, "*", fields.begin(), fields.end());
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish to {}: {}", stream, e.what());
    }
}

void RedisBus::ack_message(const std::string& stream, const std::string& group,
                           const std::string& msg_id) {
    try {
        redis_->xack(stream, group, msg_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to ack message: {}", e.what());
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
