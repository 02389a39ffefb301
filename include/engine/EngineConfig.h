#pragma once

#include <string>

namespace kestrel {
namespace engine {

struct TradingConfig {
    bool dry_run = true;                    // true: simulated universe only, no orders
    double initial_bankroll = 100.0;        // dollars
    double daily_loss_limit = 0.20;         // fraction of initial bankroll
    double max_exposure_pct = 0.50;         // open notional / bankroll
    double min_trade_dollars = 1.0;
    std::string data_dir = "data";
    std::string log_dir = "logs";
    std::string log_level = "info";
};

struct SchedulerConfig {
    int default_interval_seconds = 300;
    int housekeeping_interval_seconds = 60;
    int optimize_every_cycles = 12;
    int weekly_reset_day = 0;               // tm_wday of the simulated reset, -1 disables
};

struct MonitorConfig {
    double edge_threshold = 0.05;
    double take_profit_pct = 0.50;
    double stop_loss_pct = -0.30;
    int hedge_base_size = 5;
};

struct ExchangeConfig {
    bool demo = false;
    std::string base_url;                   // empty: production or demo default
    std::string api_key_id;                 // env KALSHI_API_KEY_ID
    std::string private_key_path;           // env KALSHI_PRIVATE_KEY_PATH
};

} // namespace engine
} // namespace kestrel
