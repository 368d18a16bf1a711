#pragma once

#include "types.hpp"
#include "text_scorer.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

enum class ExecutionEventType {
    Fill,
    Rejected,
    Cancelled
};

struct ExecutionEvent {
    ExecutionEventType type = ExecutionEventType::Fill;
    Fill fill;                  // idempotency_key is set for every event type
    std::string reason;
};

// Parses the normalized JSON the external clients put on the bus.
// Every parser throws an InputError subclass on malformed input.
class Normalizer {
public:
    // {"symbol","ts","bids":[[px,sz],..],"asks":[[px,sz],..],"best_bid"?,"best_ask"?}
    static OrderBookSnapshot parse_order_book(const nlohmann::json& j);

    // {"symbol","ts","source","score","confidence"}
    static SentimentSignal parse_sentiment(const nlohmann::json& j);

    // {"ts","source","text","symbol"?}; nullopt when no symbol or no scored terms
    static std::optional<SentimentSignal> parse_text_event(const nlohmann::json& j,
                                                           const SymbolMapper& mapper,
                                                           const SentimentScorer& scorer);

    // {"type":"fill"|"rejected"|"cancelled","key",...}
    static ExecutionEvent parse_execution_event(const nlohmann::json& j);

    // Partial update over `base`; throws ConfigError on bad field types
    static RiskConfig parse_risk_config(const nlohmann::json& j, const RiskConfig& base);

    static Direction parse_direction(const std::string& s);
};
