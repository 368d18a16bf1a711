#pragma once

#include "types.hpp"
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <vector>

// Source of SentimentSignals for the aggregator.
// Exactly one feed is selected at configuration time.
class SentimentFeed {
public:
    virtual ~SentimentFeed() = default;

    // Tag stamped on every TrendScore built from this feed
    virtual std::string source_tag() const = 0;
    virtual std::vector<SentimentSignal> poll(const std::vector<std::string>& symbols,
                                              int64_t now_ms) = 0;
};

// Normalized signals pushed by the external feed clients, drained on poll
class LiveFeed : public SentimentFeed {
public:
    std::string source_tag() const override { return "live"; }
    std::vector<SentimentSignal> poll(const std::vector<std::string>& symbols,
                                      int64_t now_ms) override;

    void push(const SentimentSignal& signal);

private:
    std::mutex mutex_;
    std::vector<SentimentSignal> inbox_;
};

// Deterministic stand-in when no live feed is configured.
// A bounded random walk per symbol, reproducible from the seed.
class SimulatedFeed : public SentimentFeed {
public:
    explicit SimulatedFeed(uint32_t seed, double step = 0.15);

    std::string source_tag() const override { return "simulated"; }
    std::vector<SentimentSignal> poll(const std::vector<std::string>& symbols,
                                      int64_t now_ms) override;

private:
    std::mt19937 rng_;
    double step_;
    std::map<std::string, double> level_;
};

struct TrendConfig {
    int64_t staleness_ms = 300000;
    int64_t half_life_ms = 60000;
    size_t capacity = 256;          // per symbol
};

class TrendAggregator {
public:
    TrendAggregator(TrendConfig cfg, std::unique_ptr<SentimentFeed> feed);

    // Throws InvalidSignal; the signal is not buffered.
    void add(const SentimentSignal& signal);

    // Never throws for unknown or empty symbols: neutral "stale" score instead.
    TrendScore aggregate(const std::string& symbol, int64_t now_ms);

    // Poll the feed, buffer what it returns, aggregate every symbol
    std::vector<TrendScore> refresh(const std::vector<std::string>& symbols, int64_t now_ms);

    size_t buffered(const std::string& symbol) const;
    std::string source_tag() const { return feed_->source_tag(); }
    SentimentFeed& feed() { return *feed_; }

    static void validate(const SentimentSignal& signal);

private:
    TrendConfig config_;
    std::unique_ptr<SentimentFeed> feed_;

    mutable std::mutex mutex_;
    std::map<std::string, std::deque<SentimentSignal>> buffers_;

    void evict(std::deque<SentimentSignal>& buf, int64_t now_ms);
};
