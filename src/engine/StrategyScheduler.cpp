#include "engine/StrategyScheduler.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <stdexcept>

#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace kestrel {
namespace engine {

StrategyScheduler::StrategyScheduler(SchedulerConfig config,
                                     std::shared_ptr<AllocationOptimizer> optimizer,
                                     std::shared_ptr<ReconciliationMonitor> monitor,
                                     std::shared_ptr<core::PositionLedger> ledger,
                                     Universe universe,
                                     std::shared_ptr<spdlog::logger> logger)
    : config_(config)
    , optimizer_(std::move(optimizer))
    , monitor_(std::move(monitor))
    , ledger_(std::move(ledger))
    , universe_(universe)
    , logger_(Logger::orSilent(std::move(logger)))
    , stop_source_(std::make_shared<StopSource>()) {
    if (!optimizer_) {
        throw std::invalid_argument("scheduler needs an allocation optimizer");
    }
}

StrategyScheduler::~StrategyScheduler() {
    stop();
}

void StrategyScheduler::registerStrategy(std::shared_ptr<strategy::IStrategy> strategy,
                                         double initial_allocation) {
    if (!strategy) {
        throw std::invalid_argument("cannot register a null strategy");
    }
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) {
        throw std::logic_error("strategies must be registered before start");
    }
    strategy->setAllocation(initial_allocation);
    optimizer_->registerStrategy(strategy->name(), initial_allocation);
    strategies_.push_back(std::move(strategy));
}

bool StrategyScheduler::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) {
        logger_->warn("Scheduler already running");
        return false;
    }
    if (stop_source_->stopRequested()) {
        logger_->warn("Scheduler was stopped; create a new one to restart");
        return false;
    }

    logger_->info("========================================");
    logger_->info("Starting {} strategies ({})", strategies_.size(), kestrel::toString(universe_));
    logger_->info("========================================");

    running_ = true;
    for (const auto& strategy : strategies_) {
        logger_->info("  {} [{}] every {}s", strategy->name(), strategy::toString(strategy->mode()),
                      strategy->interval().count());
        if (strategy->mode() == strategy::StrategyMode::CONTINUOUS) {
            workers_.emplace_back(&StrategyScheduler::continuousLoop, this, strategy);
        } else {
            workers_.emplace_back(&StrategyScheduler::cyclicLoop, this, strategy);
        }
    }
    workers_.emplace_back(&StrategyScheduler::housekeepingLoop, this);
    return true;
}

void StrategyScheduler::run() {
    if (!start()) {
        return;
    }
    while (!stop_source_->waitFor(std::chrono::milliseconds(200))) {
    }
    stop();
}

void StrategyScheduler::requestStop() {
    if (stop_source_->stopRequested()) {
        return;
    }
    logger_->info("Stop requested; cancelling continuous strategies");
    stop_source_->requestStop();
    for (const auto& strategy : strategies_) {
        if (strategy->mode() == strategy::StrategyMode::CONTINUOUS) {
            strategy->cancel();
        }
    }
}

void StrategyScheduler::stop() {
    requestStop();

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_) {
        return;
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    running_ = false;

    logger_->info("========================================");
    logger_->info("Scheduler stopped");
    logger_->info("========================================");
    if (ledger_) {
        ledger_->logDailySummary(universe_);
    }
}

StrategyResult StrategyScheduler::runCycle(strategy::IStrategy& strategy) {
    StrategyResult result;
    result.strategy_name = strategy.name();
    const auto started = std::chrono::steady_clock::now();

    try {
        const auto opportunities = strategy.scan();
        result.opportunities_found = static_cast<int>(opportunities.size());
        result.trades_executed = strategy.execute(opportunities);

        const auto performance = strategy.getPerformance();
        result.profit_loss = performance.total_pnl;
        result.win_rate = performance.win_rate;
        result.errors = strategy.recentErrors();
    } catch (const std::exception& e) {
        logger_->error("[{}] Cycle failed: {}", strategy.name(), e.what());
        result.errors = {e.what()};
    } catch (...) {
        logger_->error("[{}] Cycle failed: unknown exception", strategy.name());
        result.errors = {"unknown exception"};
    }

    result.runtime_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    result.timestamp = utils::TimeUtils::nowIso();
    optimizer_->recordResult(result);

    logger_->info("[{}] Cycle: {} opportunities, {} trades, pnl ${:+.2f}, win rate {:.1f}% ({:.1f}s)",
                  result.strategy_name, result.opportunities_found, result.trades_executed,
                  result.profit_loss, result.win_rate * 100.0, result.runtime_seconds);
    return result;
}

void StrategyScheduler::cyclicLoop(std::shared_ptr<strategy::IStrategy> strategy) {
    const auto token = stopToken();
    logger_->info("[{}] Worker started", strategy->name());
    while (!token.stopRequested()) {
        runCycle(*strategy);
        if (token.waitFor(strategy->interval())) {
            break;
        }
    }
    logger_->info("[{}] Worker stopped", strategy->name());
}

void StrategyScheduler::continuousLoop(std::shared_ptr<strategy::IStrategy> strategy) {
    const auto token = stopToken();
    logger_->info("[{}] Continuous worker started", strategy->name());
    while (!token.stopRequested()) {
        try {
            strategy->runContinuous(token);
        } catch (const std::exception& e) {
            logger_->error("[{}] Continuous loop failed, restarting in {}s: {}",
                           strategy->name(), strategy->interval().count(), e.what());
            StrategyResult result;
            result.strategy_name = strategy->name();
            result.errors = {e.what()};
            result.timestamp = utils::TimeUtils::nowIso();
            optimizer_->recordResult(result);
        } catch (...) {
            logger_->error("[{}] Continuous loop failed, restarting in {}s: unknown exception",
                           strategy->name(), strategy->interval().count());
            StrategyResult result;
            result.strategy_name = strategy->name();
            result.errors = {"unknown exception"};
            result.timestamp = utils::TimeUtils::nowIso();
            optimizer_->recordResult(result);
        }
        if (token.waitFor(strategy->interval())) {
            break;
        }
    }
    logger_->info("[{}] Continuous worker stopped", strategy->name());
}

void StrategyScheduler::reconcileStrategy(strategy::IStrategy& strategy) {
    if (!monitor_) {
        return;
    }
    monitor_->syncWithExchange(strategy.name(), universe_);

    auto market_data = [&strategy](const core::Position& position) {
        return strategy.marketSnapshot(position);
    };
    const auto assessments = monitor_->checkAllPositions(strategy.name(), universe_, market_data);
    for (const auto& hedge : monitor_->generateHedgeRecommendations(assessments)) {
        logger_->warn("[{}] Hedge {}: buy {} x{} ({})", strategy.name(), hedge.ticker,
                      kestrel::toString(hedge.hedge_side), hedge.hedge_size, hedge.reason);
    }
}

void StrategyScheduler::recordContinuousSnapshot(strategy::IStrategy& strategy) {
    StrategyResult result;
    result.strategy_name = strategy.name();
    const auto performance = strategy.getPerformance();
    result.trades_executed = performance.trades + performance.open_count;
    result.profit_loss = performance.total_pnl;
    result.win_rate = performance.win_rate;
    result.errors = strategy.recentErrors();
    result.timestamp = utils::TimeUtils::nowIso();
    optimizer_->recordResult(result);
}

void StrategyScheduler::pushAllocations() {
    const auto allocations = optimizer_->allocations();
    for (const auto& strategy : strategies_) {
        auto it = allocations.find(strategy->name());
        if (it != allocations.end()) {
            strategy->setAllocation(it->second);
        }
    }
}

void StrategyScheduler::weeklyResetIfDue() {
    if (!ledger_ || config_.weekly_reset_day < 0) {
        return;
    }
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);

    const std::string today = utils::TimeUtils::format(now, "%Y-%m-%d");
    if (local.tm_wday != config_.weekly_reset_day || last_weekly_reset_ == today) {
        return;
    }

    ledger_->logWeeklyReport();
    if (ledger_->clearSimulated(true)) {
        last_weekly_reset_ = today;
        logger_->info("Weekly simulated reset done");
    } else {
        logger_->error("Weekly simulated reset failed; will retry next housekeeping pass");
    }
}

void StrategyScheduler::runHousekeeping() {
    for (const auto& strategy : strategies_) {
        try {
            reconcileStrategy(*strategy);
            if (strategy->mode() == strategy::StrategyMode::CONTINUOUS) {
                recordContinuousSnapshot(*strategy);
            }
        } catch (const std::exception& e) {
            logger_->error("[{}] Housekeeping failed: {}", strategy->name(), e.what());
        } catch (...) {
            logger_->error("[{}] Housekeeping failed: unknown exception", strategy->name());
        }
    }

    const int cycles = ++housekeeping_cycles_;
    if (config_.optimize_every_cycles > 0 && cycles % config_.optimize_every_cycles == 0) {
        optimizer_->optimize();
        pushAllocations();
        if (const auto best = optimizer_->bestStrategy()) {
            logger_->info("Best strategy so far: {}", *best);
        }
    }

    weeklyResetIfDue();
}

void StrategyScheduler::housekeepingLoop() {
    const auto token = stopToken();
    const auto interval = std::chrono::seconds(std::max(1, config_.housekeeping_interval_seconds));
    while (!token.stopRequested()) {
        try {
            runHousekeeping();
        } catch (const std::exception& e) {
            logger_->error("Housekeeping pass failed: {}", e.what());
        } catch (...) {
            logger_->error("Housekeeping pass failed: unknown exception");
        }
        if (token.waitFor(interval)) {
            break;
        }
    }
}

} // namespace engine
} // namespace kestrel
