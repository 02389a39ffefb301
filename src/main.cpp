#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "core/state/EventJournalJsonl.h"
#include "core/state/PositionLedger.h"
#include "engine/AllocationOptimizer.h"
#include "engine/ReconciliationMonitor.h"
#include "engine/StrategyScheduler.h"
#include "execution/RateLimiter.h"
#include "execution/RetryQueue.h"
#include "execution/TradeExecutor.h"
#include "network/CurlHttpClient.h"
#include "network/KalshiExchangeClient.h"
#include "network/RsaPssSigner.h"
#include "risk/ExposureTracker.h"
#include "risk/RiskSizer.h"
#include "strategy/EdgeScanStrategy.h"
#include "strategy/SignalFileWatcher.h"
#include "strategy/SignalFollowStrategy.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace kestrel;

namespace {

std::atomic<bool> g_shutdown{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

struct CommandLine {
    std::string config_path = "config/config.json";
    bool force_live = false;
    bool force_dry_run = false;
    bool report_only = false;
    bool clear_simulated = false;
};

void printUsage() {
    std::cout << "Usage: kestrel [--config <path>] [--live | --dry-run] [--report] [--clear-simulated]\n";
}

bool parseArgs(int argc, char* argv[], CommandLine& cli) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            cli.config_path = argv[++i];
        } else if (arg == "--live") {
            cli.force_live = true;
        } else if (arg == "--dry-run") {
            cli.force_dry_run = true;
        } else if (arg == "--report") {
            cli.report_only = true;
        } else if (arg == "--clear-simulated") {
            cli.clear_simulated = true;
        } else {
            return false;
        }
    }
    return !(cli.force_live && cli.force_dry_run);
}

std::filesystem::path resolveDir(const std::string& dir) {
    return utils::PathUtils::resolveRelativePath(dir);
}

// Signal-follow strategies each get their own inbox watcher feeding their channel
struct InboxFeed {
    std::shared_ptr<strategy::SignalChannel> channel;
    std::unique_ptr<strategy::SignalFileWatcher> watcher;
    std::chrono::milliseconds poll_interval{1000};
};

std::shared_ptr<strategy::IStrategy> buildStrategy(const strategy::StrategyConfig& cfg,
                                                   const strategy::StrategyContext& ctx,
                                                   std::vector<InboxFeed>& feeds) {
    if (cfg.type == "edge_scan") {
        std::shared_ptr<strategy::IProbabilityModel> model;
        if (cfg.fair_values_path.empty()) {
            model = std::make_shared<strategy::FairValueModel>();
        } else {
            model = strategy::FairValueModel::fromFile(resolveDir(cfg.fair_values_path).string());
        }
        return std::make_shared<strategy::EdgeScanStrategy>(cfg, ctx, model);
    }
    if (cfg.type == "signal_follow") {
        InboxFeed feed;
        feed.channel = std::make_shared<strategy::SignalChannel>();
        feed.poll_interval = std::chrono::milliseconds(std::max(100, cfg.poll_interval_ms));
        if (!cfg.signal_inbox_path.empty()) {
            feed.watcher = std::make_unique<strategy::SignalFileWatcher>(
                resolveDir(cfg.signal_inbox_path), feed.channel, ctx.logger);
        }
        auto strategy = std::make_shared<strategy::SignalFollowStrategy>(cfg, ctx, feed.channel);
        feeds.push_back(std::move(feed));
        return strategy;
    }
    throw std::invalid_argument("unknown strategy type: " + cfg.type);
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cli;
    if (!parseArgs(argc, argv, cli)) {
        printUsage();
        return 2;
    }

    try {
        std::cout << "\n";
        std::cout << "=============================================\n";
        std::cout << "       Kestrel strategy orchestrator\n";
        std::cout << "=============================================\n\n";

        AppConfig config = Config::load(cli.config_path);
        if (cli.force_live) config.trading.dry_run = false;
        if (cli.force_dry_run) config.trading.dry_run = true;

        Logger logging;
        logging.initialize(config.trading.log_dir, config.trading.log_level);
        auto log = logging.main();

        const auto universe = universeFor(config.trading.dry_run);
        const auto data_dir = resolveDir(config.trading.data_dir);
        std::filesystem::create_directories(data_dir);

        auto journal = std::make_shared<core::EventJournalJsonl>(data_dir / "journal.jsonl");
        std::shared_ptr<core::PositionLedger> ledger = core::PositionLedger::openJson(data_dir, log, journal);
        ledger->setTradeLogger(logging.trades());

        if (cli.report_only) {
            ledger->logWeeklyReport();
            ledger->logDailySummary(Universe::REAL);
            ledger->logDailySummary(Universe::SIMULATED);
            return 0;
        }
        if (cli.clear_simulated) {
            return ledger->clearSimulated(true) ? 0 : 1;
        }

        auto risk = std::make_shared<risk::RiskSizer>(config.trading.initial_bankroll, log);
        risk->setDailyLossLimitPct(config.trading.daily_loss_limit);
        risk->setMinTradeDollars(config.trading.min_trade_dollars);

        auto exposure = std::make_shared<risk::ExposureTracker>(config.trading.max_exposure_pct, log);
        exposure->rebuild(ledger->getOpenPositions(std::nullopt, universe));

        // Exchange: signed when credentials exist, public market data otherwise
        std::shared_ptr<network::IRequestSigner> signer;
        if (!config.exchange.private_key_path.empty()) {
            signer = network::RsaPssSigner::fromFile(resolveDir(config.exchange.private_key_path).string());
        }
        if (!config.trading.dry_run && (!signer || config.exchange.api_key_id.empty())) {
            log->error("Live mode needs KALSHI_API_KEY_ID and KALSHI_PRIVATE_KEY_PATH");
            return 1;
        }
        std::string base_url = config.exchange.base_url;
        if (base_url.empty()) {
            base_url = config.exchange.demo ? network::KalshiExchangeClient::kDemoUrl
                                            : network::KalshiExchangeClient::kProductionUrl;
        }
        auto exchange = std::make_shared<network::KalshiExchangeClient>(
            std::make_shared<network::CurlHttpClient>(), signer, config.exchange.api_key_id, base_url, log,
            std::make_shared<execution::RateLimiter>(log));

        auto retry_queue = std::make_shared<execution::RetryQueue>(
            ledger, Universe::REAL, config.retry_queue, log, journal);
        auto executor = std::make_shared<execution::TradeExecutor>(
            exchange, ledger, retry_queue, exposure, config.trading.dry_run, log, journal);

        auto optimizer = std::make_shared<engine::AllocationOptimizer>(log, journal);
        auto monitor = std::make_shared<engine::ReconciliationMonitor>(
            exchange, ledger, config.monitor, log, journal, risk, exposure);
        engine::StrategyScheduler scheduler(config.scheduler, optimizer, monitor, ledger, universe, log);

        strategy::StrategyContext ctx{exchange, ledger, risk, exposure, executor, log};
        std::vector<InboxFeed> feeds;
        for (const auto& cfg : config.strategies) {
            if (!cfg.enabled) {
                log->info("Strategy {} disabled", cfg.name);
                continue;
            }
            scheduler.registerStrategy(buildStrategy(cfg, ctx, feeds), cfg.allocation);
        }
        if (scheduler.strategyCount() == 0) {
            log->error("No strategies enabled; check {}", cli.config_path);
            return 1;
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        log->info("Mode: {} | bankroll ${:.2f} | exposure cap {:.0f}%",
                  config.trading.dry_run ? "DRY-RUN" : "LIVE", config.trading.initial_bankroll,
                  config.trading.max_exposure_pct * 100.0);

        scheduler.start();

        std::vector<std::thread> watcher_threads;
        const auto stop_token = scheduler.stopToken();
        for (auto& feed : feeds) {
            if (feed.watcher) {
                auto* watcher = feed.watcher.get();
                const auto interval = feed.poll_interval;
                watcher_threads.emplace_back([watcher, stop_token, interval]() {
                    watcher->run(stop_token, interval);
                });
            }
        }

        while (!g_shutdown.load() && scheduler.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        log->info("Shutdown signal received");
        scheduler.stop();
        for (auto& feed : feeds) {
            feed.channel->close();
        }
        for (auto& thread : watcher_threads) {
            thread.join();
        }

        log->info("Allocation summary: {}", optimizer->exportResults()["allocations"].dump());
        ledger->logWeeklyReport();
        spdlog::shutdown();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
