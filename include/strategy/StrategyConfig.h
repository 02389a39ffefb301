#pragma once

#include <string>
#include <vector>

#include "strategy/IStrategy.h"

namespace kestrel {
namespace strategy {

struct StrategyConfig {
    std::string name;
    std::string type;                       // edge_scan / signal_follow
    StrategyMode mode = StrategyMode::CYCLIC;
    int interval_seconds = 300;
    double allocation = 0.5;
    bool enabled = true;

    // edge_scan
    std::vector<std::string> series;        // series tickers to scan
    std::string fair_values_path;           // JSON: ticker / series -> YES probability
    double min_edge = 0.10;
    int max_contracts = 3;
    int market_limit = 100;

    // signal_follow
    std::string signal_inbox_path;          // JSONL, one signal per line
    int poll_interval_ms = 1000;
    int max_follow_contracts = 5;
    std::vector<std::string> sources;       // empty = follow everyone
};

} // namespace strategy
} // namespace kestrel
