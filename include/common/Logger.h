#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace kestrel {

// Owns the process loggers. Components get the spdlog handles injected at
// construction instead of reaching for a global.
class Logger {
public:
    Logger() = default;

    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    bool isInitialized() const { return initialized_; }

    std::shared_ptr<spdlog::logger> main() const { return main_logger_; }
    std::shared_ptr<spdlog::logger> trades() const { return trade_logger_; }

    // Logger that drops everything; used when a component is built without one
    static std::shared_ptr<spdlog::logger> silent();
    static std::shared_ptr<spdlog::logger> orSilent(std::shared_ptr<spdlog::logger> logger);

    // CSV trade line: ticker,side,action,contracts,price_cents,pnl,strategy,universe
    static void logTrade(const std::shared_ptr<spdlog::logger>& trade_logger,
                         const std::string& ticker, const std::string& side,
                         const std::string& action, int contracts, double price_cents,
                         double pnl, const std::string& strategy, const std::string& universe);

private:
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

} // namespace kestrel
