#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine/EngineConfig.h"
#include "execution/RetryQueue.h"
#include "strategy/StrategyConfig.h"

namespace kestrel {

struct AppConfig {
    engine::TradingConfig trading;
    engine::SchedulerConfig scheduler;
    execution::RetryQueueConfig retry_queue;
    engine::MonitorConfig monitor;
    engine::ExchangeConfig exchange;
    std::vector<strategy::StrategyConfig> strategies;
};

class Config {
public:
    // Missing or malformed file: defaults plus a warning. Secrets always come
    // from KALSHI_API_KEY_ID / KALSHI_PRIVATE_KEY_PATH.
    static AppConfig load(const std::string& config_path);

    // Missing keys keep their defaults; invalid values throw
    static AppConfig fromJson(const nlohmann::json& j);

    static strategy::StrategyConfig parseStrategy(const nlohmann::json& s, int default_interval_seconds);
};

} // namespace kestrel
