#include "trend.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

std::vector<SentimentSignal> LiveFeed::poll(const std::vector<std::string>&, int64_t) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SentimentSignal> out;
    out.swap(inbox_);
    return out;
}

void LiveFeed::push(const SentimentSignal& signal) {
    std::lock_guard<std::mutex> lock(mutex_);
    inbox_.push_back(signal);
}

SimulatedFeed::SimulatedFeed(uint32_t seed, double step) : rng_(seed), step_(step) {}

std::vector<SentimentSignal> SimulatedFeed::poll(const std::vector<std::string>& symbols,
                                                 int64_t now_ms) {
    std::uniform_real_distribution<double> move(-step_, step_);
    std::uniform_real_distribution<double> conf(0.3, 1.0);

    std::vector<SentimentSignal> out;
    out.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        double& level = level_[symbol];
        level = std::clamp(level + move(rng_), -1.0, 1.0);

        SentimentSignal sig;
        sig.symbol = symbol;
        sig.ts_ms = now_ms;
        sig.source = "simulated";
        sig.score = level;
        sig.confidence = conf(rng_);
        out.push_back(sig);
    }
    return out;
}

TrendAggregator::TrendAggregator(TrendConfig cfg, std::unique_ptr<SentimentFeed> feed)
    : config_(cfg), feed_(std::move(feed)) {
    if (!feed_) {
        throw ConfigError("trend aggregator requires a feed");
    }
    if (config_.staleness_ms <= 0 || config_.half_life_ms <= 0 || config_.capacity == 0) {
        throw ConfigError("trend staleness, half-life and capacity must be positive");
    }
}

void TrendAggregator::validate(const SentimentSignal& s) {
    if (s.symbol.empty()) {
        throw InvalidSignal("missing symbol");
    }
    if (!std::isfinite(s.score) || s.score < -1.0 || s.score > 1.0) {
        throw InvalidSignal(s.symbol + ": score out of [-1,1]");
    }
    if (!std::isfinite(s.confidence) || s.confidence < 0.0 || s.confidence > 1.0) {
        throw InvalidSignal(s.symbol + ": confidence out of [0,1]");
    }
    if (s.ts_ms <= 0) {
        throw InvalidSignal(s.symbol + ": missing timestamp");
    }
}

void TrendAggregator::evict(std::deque<SentimentSignal>& buf, int64_t now_ms) {
    int64_t cutoff = now_ms - config_.staleness_ms;
    while (!buf.empty() && buf.front().ts_ms < cutoff) {
        buf.pop_front();
    }
    while (buf.size() > config_.capacity) {
        buf.pop_front();
    }
}

void TrendAggregator::add(const SentimentSignal& signal) {
    validate(signal);

    std::lock_guard<std::mutex> lock(mutex_);
    auto& buf = buffers_[signal.symbol];

    // Late arrivals are slotted in timestamp order
    auto pos = std::upper_bound(buf.begin(), buf.end(), signal.ts_ms,
        [](int64_t ts, const SentimentSignal& s) { return ts < s.ts_ms; });
    buf.insert(pos, signal);

    evict(buf, buf.back().ts_ms);
}

TrendScore TrendAggregator::aggregate(const std::string& symbol, int64_t now_ms) {
    TrendScore out;
    out.symbol = symbol;
    out.ts_ms = now_ms;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buffers_.find(symbol);
    if (it != buffers_.end()) {
        evict(it->second, now_ms);

        double weighted = 0.0;
        double total_weight = 0.0;
        for (const auto& s : it->second) {
            double age = static_cast<double>(std::max<int64_t>(0, now_ms - s.ts_ms));
            double w = s.confidence * std::pow(0.5, age / static_cast<double>(config_.half_life_ms));
            weighted += w * s.score;
            total_weight += w;
            ++out.samples;
        }

        if (total_weight > 0.0) {
            out.score = std::clamp(weighted / total_weight, -1.0, 1.0);
            out.source_tag = feed_->source_tag();
            return out;
        }
    }

    out.score = 0.0;
    out.samples = 0;
    out.source_tag = "stale";
    return out;
}

std::vector<TrendScore> TrendAggregator::refresh(const std::vector<std::string>& symbols,
                                                 int64_t now_ms) {
    for (const auto& sig : feed_->poll(symbols, now_ms)) {
        try {
            add(sig);
        } catch (const InputError& e) {
            spdlog::warn("Dropped sentiment signal from {}: {}", sig.source, e.what());
        }
    }

    std::vector<TrendScore> scores;
    scores.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        scores.push_back(aggregate(symbol, now_ms));
    }
    return scores;
}

size_t TrendAggregator::buffered(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buffers_.find(symbol);
    return it == buffers_.end() ? 0 : it->second.size();
}
