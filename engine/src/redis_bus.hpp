#pragma once

#include <string>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

// Redis streams carrying one JSON document per entry in field "data"
class RedisBus {
public:
    explicit RedisBus(const std::string& redis_url);

    void create_consumer_group(const std::string& stream, const std::string& group);

    // Entries whose payload fails to parse are acked and skipped
    std::vector<std::pair<std::string, nlohmann::json>>
        read_group(const std::string& stream, const std::string& group,
                   const std::string& consumer, int count = 100, int block_ms = 200);

    // Throws sw::redis::Error on failure
    void publish(const std::string& stream, const nlohmann::json& data);

    // Logs and drops on failure
    void publish_best_effort(const std::string& stream, const nlohmann::json& data,
                             long long maxlen = 0);

    void ack_message(const std::string& stream, const std::string& group,
                     const std::string& msg_id);

    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
};
