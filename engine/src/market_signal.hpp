#pragma once

#include "types.hpp"

struct MarketSignalConfig {
    int depth = 5;                  // top-K levels per side
    double long_threshold = 0.2;    // imbalance above this -> long
    double short_threshold = -0.2;  // imbalance below this -> short
    double normalization = 1.0;     // |imbalance| mapped to magnitude 1.0
};

// Order-book imbalance scalping signal. Stateless.
class MarketSignalGenerator {
public:
    explicit MarketSignalGenerator(MarketSignalConfig cfg = {});

    // Throws InvalidSnapshot on malformed input.
    MarketSignal generate(const OrderBookSnapshot& snapshot) const;

    // (B - A) / (B + A) over the top `depth` levels
    static double imbalance(const OrderBookSnapshot& snapshot, int depth);
    static void validate(const OrderBookSnapshot& snapshot);

    const MarketSignalConfig& config() const { return config_; }

private:
    MarketSignalConfig config_;
};
