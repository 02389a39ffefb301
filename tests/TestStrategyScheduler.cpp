#include "engine/StrategyScheduler.h"
#include "support/FakeExchangeClient.h"
#include "support/TestSupport.h"

#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace kestrel;

namespace {

// Scripted strategy: fixed scan size, fixed performance, optional failures
class FakeStrategy : public strategy::IStrategy {
public:
    FakeStrategy(std::string name, strategy::StrategyMode mode)
        : name_(std::move(name)), mode_(mode) {}

    std::string name() const override { return name_; }
    strategy::StrategyMode mode() const override { return mode_; }
    std::chrono::seconds interval() const override { return std::chrono::seconds(1); }

    std::vector<strategy::Opportunity> scan() override {
        scans++;
        if (throw_on_scan) {
            throw std::runtime_error("feed down");
        }
        if (throw_int) {
            throw 42;
        }
        return std::vector<strategy::Opportunity>(static_cast<size_t>(opportunities), strategy::Opportunity{});
    }

    int execute(const std::vector<strategy::Opportunity>& found) override {
        return static_cast<int>(found.size()) / 2;
    }

    core::PerformanceSummary getPerformance() const override {
        if (throw_int) {
            throw 42;
        }
        return performance;
    }

    void runContinuous(const StopToken& stop) override {
        continuous_runs++;
        if (throw_int_continuous.load()) {
            throw 42;
        }
        while (!stop.stopRequested() && !cancelled.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    void cancel() override { cancelled.store(true); }

    void setAllocation(double value) override { allocation.store(value); }

    std::vector<std::string> recentErrors() const override { return errors; }

    std::atomic<int> scans{0};
    std::atomic<int> continuous_runs{0};
    std::atomic<bool> cancelled{false};
    std::atomic<double> allocation{0.0};
    int opportunities = 4;
    bool throw_on_scan = false;
    bool throw_int = false;
    std::atomic<bool> throw_int_continuous{false};
    core::PerformanceSummary performance;
    std::vector<std::string> errors;

private:
    std::string name_;
    strategy::StrategyMode mode_;
};

struct Fixture {
    std::shared_ptr<testing::FakeExchangeClient> exchange = std::make_shared<testing::FakeExchangeClient>();
    std::shared_ptr<core::PositionLedger> ledger = std::make_shared<core::PositionLedger>(
        std::make_shared<testing::MemoryLedgerStore>(), std::make_shared<testing::MemoryLedgerStore>(), nullptr);
    std::shared_ptr<engine::AllocationOptimizer> optimizer = std::make_shared<engine::AllocationOptimizer>();
    std::shared_ptr<engine::ReconciliationMonitor> monitor =
        std::make_shared<engine::ReconciliationMonitor>(exchange, ledger);
    std::unique_ptr<engine::StrategyScheduler> scheduler;

    explicit Fixture(int optimize_every = 1) {
        engine::SchedulerConfig config;
        config.housekeeping_interval_seconds = 1;
        config.optimize_every_cycles = optimize_every;
        config.weekly_reset_day = -1;
        scheduler = std::make_unique<engine::StrategyScheduler>(
            config, optimizer, monitor, ledger, Universe::SIMULATED);
    }
};

void testRunCycleRecordsResult() {
    Fixture f;
    auto edge = std::make_shared<FakeStrategy>("EdgeScan", strategy::StrategyMode::CYCLIC);
    edge->performance.total_pnl = 2.5;
    edge->performance.win_rate = 0.6;
    edge->errors = {"KXHIGHNY: timeout"};
    f.scheduler->registerStrategy(edge, 0.5);
    assert(edge->allocation.load() == 0.5);

    const auto result = f.scheduler->runCycle(*edge);
    assert(result.strategy_name == "EdgeScan");
    assert(result.opportunities_found == 4);
    assert(result.trades_executed == 2);
    assert(result.profit_loss == 2.5);
    assert(result.win_rate == 0.6);
    assert(result.errors.size() == 1);
    assert(!result.timestamp.empty());
    assert(f.optimizer->history("EdgeScan").size() == 1);
}

void testFailingStrategyIsContained() {
    Fixture f;
    auto broken = std::make_shared<FakeStrategy>("Broken", strategy::StrategyMode::CYCLIC);
    broken->throw_on_scan = true;
    f.scheduler->registerStrategy(broken, 0.5);

    const auto result = f.scheduler->runCycle(*broken);
    assert(result.opportunities_found == 0);
    assert(result.trades_executed == 0);
    assert(result.errors.size() == 1);
    assert(result.errors[0] == "feed down");

    // Next cycle still runs
    broken->throw_on_scan = false;
    assert(f.scheduler->runCycle(*broken).opportunities_found == 4);
    assert(f.optimizer->history("Broken").size() == 2);
}

void testNonStandardThrowIsContained() {
    Fixture f;
    auto odd = std::make_shared<FakeStrategy>("Odd", strategy::StrategyMode::CYCLIC);
    odd->throw_int = true;
    f.scheduler->registerStrategy(odd, 0.5);

    const auto result = f.scheduler->runCycle(*odd);
    assert(result.opportunities_found == 0);
    assert(result.errors.size() == 1);
    assert(result.errors[0] == "unknown exception");
    assert(f.optimizer->history("Odd").size() == 1);

    // Housekeeping survives it too
    auto continuous = std::make_shared<FakeStrategy>("OddFollow", strategy::StrategyMode::CONTINUOUS);
    continuous->throw_int = true;
    f.scheduler->registerStrategy(continuous, 0.5);
    f.scheduler->runHousekeeping();
    assert(f.optimizer->history("OddFollow").empty());

    odd->throw_int = false;
    assert(f.scheduler->runCycle(*odd).opportunities_found == 4);
}

void testContinuousWorkerSurvivesNonStandardThrow() {
    Fixture f(0);
    auto follow = std::make_shared<FakeStrategy>("CopyFollow", strategy::StrategyMode::CONTINUOUS);
    follow->throw_int_continuous.store(true);
    f.scheduler->registerStrategy(follow, 1.0);
    assert(f.scheduler->start());

    bool recorded = false;
    for (int i = 0; i < 200 && !recorded; ++i) {
        for (const auto& result : f.optimizer->history("CopyFollow")) {
            if (result.errors.size() == 1 && result.errors[0] == "unknown exception") {
                recorded = true;
            }
        }
        if (!recorded) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    assert(recorded);
    assert(f.scheduler->isRunning());

    f.scheduler->stop();
    assert(!f.scheduler->isRunning());
}

void testHousekeepingRebalances() {
    Fixture f(2);
    auto winner = std::make_shared<FakeStrategy>("Winner", strategy::StrategyMode::CYCLIC);
    auto loser = std::make_shared<FakeStrategy>("Loser", strategy::StrategyMode::CYCLIC);
    winner->performance.total_pnl = 3.0;
    winner->performance.win_rate = 0.6;
    loser->performance.total_pnl = -1.0;
    loser->performance.win_rate = 0.2;
    f.scheduler->registerStrategy(winner, 0.5);
    f.scheduler->registerStrategy(loser, 0.5);

    for (int i = 0; i < 3; ++i) {
        f.scheduler->runCycle(*winner);
        f.scheduler->runCycle(*loser);
    }

    // Optimizes on every second pass only
    f.scheduler->runHousekeeping();
    assert(f.scheduler->housekeepingCycles() == 1);
    assert(winner->allocation.load() == 0.5);

    f.scheduler->runHousekeeping();
    assert(f.scheduler->housekeepingCycles() == 2);
    assert(winner->allocation.load() > 0.5);
    assert(loser->allocation.load() < 0.5);
    assert(std::abs(winner->allocation.load() + loser->allocation.load() - 1.0) < 1e-9);
    assert(winner->allocation.load() == f.optimizer->allocation("Winner"));
}

void testHousekeepingReconciles() {
    Fixture f(0);
    auto edge = std::make_shared<FakeStrategy>("EdgeScan", strategy::StrategyMode::CYCLIC);
    f.scheduler->registerStrategy(edge, 1.0);

    core::OpenPositionRequest request;
    request.ticker = "KXHIGHNY-26JAN01-B45";
    request.side = Side::YES;
    request.contracts = 5;
    request.entry_price = 30;
    request.strategy = "EdgeScan";
    assert(f.ledger->openPosition(request, Universe::SIMULATED).has_value());

    network::SettlementInfo info;
    info.status = network::SettlementStatus::SETTLED;
    info.settlement_price = 100;
    f.exchange->settlements[request.ticker] = info;

    f.scheduler->runHousekeeping();
    auto closed = f.ledger->getPosition(request.ticker, Universe::SIMULATED);
    assert(closed.has_value());
    assert(closed->status == PositionStatus::CLOSED);
    assert(closed->pnl.has_value());
    assert(std::abs(*closed->pnl - 3.5) < 1e-9);
}

void testContinuousSnapshotRecorded() {
    Fixture f(0);
    auto follow = std::make_shared<FakeStrategy>("CopyFollow", strategy::StrategyMode::CONTINUOUS);
    follow->performance.trades = 3;
    follow->performance.open_count = 2;
    follow->performance.total_pnl = 1.5;
    f.scheduler->registerStrategy(follow, 1.0);

    f.scheduler->runHousekeeping();
    const auto history = f.optimizer->history("CopyFollow");
    assert(history.size() == 1);
    assert(history[0].trades_executed == 5);
    assert(history[0].profit_loss == 1.5);
}

void testStartStopLifecycle() {
    Fixture f(0);
    auto cyclic = std::make_shared<FakeStrategy>("EdgeScan", strategy::StrategyMode::CYCLIC);
    auto continuous = std::make_shared<FakeStrategy>("CopyFollow", strategy::StrategyMode::CONTINUOUS);
    f.scheduler->registerStrategy(cyclic, 0.5);
    f.scheduler->registerStrategy(continuous, 0.5);
    assert(f.scheduler->strategyCount() == 2);

    assert(f.scheduler->start());
    assert(f.scheduler->isRunning());
    assert(!f.scheduler->start());

    bool threw = false;
    try {
        f.scheduler->registerStrategy(std::make_shared<FakeStrategy>("Late", strategy::StrategyMode::CYCLIC), 0.1);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    for (int i = 0; i < 200 && (cyclic->scans.load() == 0 || continuous->continuous_runs.load() == 0); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(cyclic->scans.load() >= 1);
    assert(continuous->continuous_runs.load() == 1);

    f.scheduler->stop();
    assert(!f.scheduler->isRunning());
    assert(continuous->cancelled.load());
    assert(!cyclic->cancelled.load());
    assert(f.scheduler->stopToken().stopRequested());

    // A stopped scheduler does not restart
    assert(!f.scheduler->start());
    f.scheduler->stop();
}

void testNullStrategyRejected() {
    Fixture f;
    bool threw = false;
    try {
        f.scheduler->registerStrategy(nullptr, 0.5);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(f.scheduler->strategyCount() == 0);
}

} // namespace

int main() {
    std::cout << "[TEST] Starting StrategyScheduler Test..." << std::endl;

    testRunCycleRecordsResult();
    testFailingStrategyIsContained();
    testNonStandardThrowIsContained();
    testContinuousWorkerSurvivesNonStandardThrow();
    testHousekeepingRebalances();
    testHousekeepingReconciles();
    testContinuousSnapshotRecorded();
    testStartStopLifecycle();
    testNullStrategyRejected();

    std::cout << "[TEST] StrategyScheduler PASSED" << std::endl;
    return 0;
}
