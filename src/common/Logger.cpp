#include "common/Logger.h"
#include "common/PathUtils.h"
#include <spdlog/sinks/null_sink.h>
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace kestrel {

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    const auto logs_path = utils::PathUtils::resolveRelativePath(log_dir);

    std::filesystem::create_directories(logs_path);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] [%t] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "kestrel.log").string(), 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);

        trade_logger_ = std::make_shared<spdlog::logger>(
            "trade",
            std::make_shared<spdlog::sinks::daily_file_sink_mt>((logs_path / "trades.log").string(), 0, 0)
        );
        trade_logger_->set_pattern("%Y-%m-%dT%H:%M:%S,%v");
        trade_logger_->flush_on(spdlog::level::info);

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

std::shared_ptr<spdlog::logger> Logger::silent() {
    static std::shared_ptr<spdlog::logger> instance = std::make_shared<spdlog::logger>(
        "silent", std::make_shared<spdlog::sinks::null_sink_mt>()
    );
    return instance;
}

std::shared_ptr<spdlog::logger> Logger::orSilent(std::shared_ptr<spdlog::logger> logger) {
    return logger ? logger : silent();
}

void Logger::logTrade(const std::shared_ptr<spdlog::logger>& trade_logger,
                      const std::string& ticker, const std::string& side,
                      const std::string& action, int contracts, double price_cents,
                      double pnl, const std::string& strategy, const std::string& universe) {
    if (trade_logger) {
        std::ostringstream oss;
        oss << ticker << "," << side << "," << action << "," << contracts << ","
            << std::fixed << std::setprecision(0) << price_cents << ","
            << std::fixed << std::setprecision(2) << pnl << ","
            << strategy << "," << universe;
        trade_logger->info(oss.str());
    }
}

} // namespace kestrel
