#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace kestrel {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeType(std::string type) {
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    type = trimCopy(type);
    std::replace(type.begin(), type.end(), '-', '_');

    // Short aliases
    if (type == "scan" || type == "value") {
        return "edge_scan";
    }
    if (type == "follow" || type == "copy") {
        return "signal_follow";
    }
    return type;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

void requireRange(double value, double lo, double hi, const char* key) {
    if (value < lo || value > hi) {
        throw std::invalid_argument(std::string(key) + " out of range");
    }
}
}

strategy::StrategyConfig Config::parseStrategy(const nlohmann::json& s, int default_interval_seconds) {
    strategy::StrategyConfig cfg;
    cfg.name = s.value("name", std::string());
    cfg.type = normalizeType(s.value("type", std::string("edge_scan")));
    if (cfg.name.empty()) {
        cfg.name = cfg.type;
    }

    const std::string default_mode = cfg.type == "signal_follow" ? "continuous" : "cyclic";
    cfg.mode = strategy::strategyModeFromString(s.value("mode", default_mode));
    cfg.interval_seconds = s.value("interval_seconds", default_interval_seconds);
    cfg.allocation = s.value("allocation", cfg.allocation);
    cfg.enabled = s.value("enabled", cfg.enabled);
    requireRange(cfg.allocation, 0.0, 1.0, "allocation");

    if (s.contains("series")) {
        cfg.series = s["series"].get<std::vector<std::string>>();
    }
    cfg.fair_values_path = s.value("fair_values_path", cfg.fair_values_path);
    cfg.min_edge = s.value("min_edge", cfg.min_edge);
    cfg.max_contracts = s.value("max_contracts", cfg.max_contracts);
    cfg.market_limit = s.value("market_limit", cfg.market_limit);

    cfg.signal_inbox_path = s.value("signal_inbox_path", cfg.signal_inbox_path);
    cfg.poll_interval_ms = s.value("poll_interval_ms", cfg.poll_interval_ms);
    cfg.max_follow_contracts = s.value("max_follow_contracts", cfg.max_follow_contracts);
    if (s.contains("sources")) {
        cfg.sources = s["sources"].get<std::vector<std::string>>();
    }
    return cfg;
}

AppConfig Config::fromJson(const nlohmann::json& j) {
    AppConfig config;

    if (j.contains("trading")) {
        const auto& t = j["trading"];
        auto& trading = config.trading;

        const std::string mode = t.value("mode", std::string(trading.dry_run ? "PAPER" : "LIVE"));
        trading.dry_run = t.value("dry_run", mode != "LIVE");
        trading.initial_bankroll = t.value("initial_bankroll", trading.initial_bankroll);
        trading.daily_loss_limit = t.value("daily_loss_limit", trading.daily_loss_limit);
        trading.max_exposure_pct = t.value("max_exposure_pct", trading.max_exposure_pct);
        trading.min_trade_dollars = t.value("min_trade_dollars", trading.min_trade_dollars);
        trading.data_dir = t.value("data_dir", trading.data_dir);
        trading.log_dir = t.value("log_dir", trading.log_dir);
        trading.log_level = t.value("log_level", trading.log_level);

        if (trading.initial_bankroll <= 0.0) {
            throw std::invalid_argument("initial_bankroll must be positive");
        }
        requireRange(trading.daily_loss_limit, 0.0, 1.0, "daily_loss_limit");
        requireRange(trading.max_exposure_pct, 0.0, 1.0, "max_exposure_pct");
    }

    if (j.contains("scheduler")) {
        const auto& s = j["scheduler"];
        auto& scheduler = config.scheduler;
        scheduler.default_interval_seconds = s.value("default_interval_seconds", scheduler.default_interval_seconds);
        scheduler.housekeeping_interval_seconds = s.value("housekeeping_interval_seconds",
                                                          scheduler.housekeeping_interval_seconds);
        scheduler.optimize_every_cycles = s.value("optimize_every_cycles", scheduler.optimize_every_cycles);
        scheduler.weekly_reset_day = s.value("weekly_reset_day", scheduler.weekly_reset_day);
    }

    if (j.contains("retry_queue")) {
        const auto& r = j["retry_queue"];
        config.retry_queue.max_retries = r.value("max_retries", config.retry_queue.max_retries);
        config.retry_queue.max_queue_age = std::chrono::seconds(
            r.value("max_queue_age_seconds", static_cast<int>(config.retry_queue.max_queue_age.count())));
    }

    if (j.contains("monitor")) {
        const auto& m = j["monitor"];
        auto& monitor = config.monitor;
        monitor.edge_threshold = m.value("edge_threshold", monitor.edge_threshold);
        monitor.take_profit_pct = m.value("take_profit_pct", monitor.take_profit_pct);
        monitor.stop_loss_pct = m.value("stop_loss_pct", monitor.stop_loss_pct);
        monitor.hedge_base_size = m.value("hedge_base_size", monitor.hedge_base_size);
    }

    if (j.contains("exchange")) {
        const auto& e = j["exchange"];
        config.exchange.demo = e.value("demo", config.exchange.demo);
        config.exchange.base_url = e.value("base_url", config.exchange.base_url);
    }

    if (j.contains("strategies")) {
        for (const auto& s : j["strategies"]) {
            config.strategies.push_back(parseStrategy(s, config.scheduler.default_interval_seconds));
        }
    }
    return config;
}

AppConfig Config::load(const std::string& path) {
    AppConfig config;
    try {
        const auto config_path = utils::PathUtils::resolveRelativePath(path);

        std::cout << "Config file: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Warning: config file not found, using defaults" << std::endl;
        } else {
            std::ifstream file(config_path);
            if (!file.is_open()) {
                std::cout << "Warning: cannot open config file, using defaults" << std::endl;
            } else {
                nlohmann::json j;
                file >> j;
                config = fromJson(j);

                if (j.contains("exchange") && (j["exchange"].contains("api_key_id")
                                               || j["exchange"].contains("private_key"))) {
                    std::cout << "Warning: credentials in the config file are ignored. "
                              << "Use KALSHI_API_KEY_ID / KALSHI_PRIVATE_KEY_PATH." << std::endl;
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Config load error, using defaults: " << e.what() << std::endl;
        config = AppConfig{};
    }

    config.exchange.api_key_id = readEnvVar("KALSHI_API_KEY_ID");
    config.exchange.private_key_path = readEnvVar("KALSHI_PRIVATE_KEY_PATH");
    if (!config.trading.dry_run
        && (config.exchange.api_key_id.empty() || config.exchange.private_key_path.empty())) {
        std::cout << "Warning: KALSHI_API_KEY_ID or KALSHI_PRIVATE_KEY_PATH is not set" << std::endl;
    }

    std::cout << "Config loaded: " << (config.trading.dry_run ? "dry-run" : "LIVE")
              << ", bankroll=" << config.trading.initial_bankroll
              << ", strategies=" << config.strategies.size() << std::endl;
    return config;
}

} // namespace kestrel
