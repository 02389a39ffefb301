#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/StopToken.h"
#include "core/state/PositionLedger.h"
#include "engine/AllocationOptimizer.h"
#include "engine/EngineConfig.h"
#include "engine/ReconciliationMonitor.h"
#include "strategy/IStrategy.h"

namespace kestrel {
namespace engine {

// Runs every registered strategy on its own thread plus one housekeeping
// thread (reconciliation, exit assessment, allocation). A strategy failure is
// contained in its worker; the loop resumes after one interval.
class StrategyScheduler {
public:
    StrategyScheduler(SchedulerConfig config,
                      std::shared_ptr<AllocationOptimizer> optimizer,
                      std::shared_ptr<ReconciliationMonitor> monitor,
                      std::shared_ptr<core::PositionLedger> ledger,
                      Universe universe,
                      std::shared_ptr<spdlog::logger> logger = nullptr);
    ~StrategyScheduler();

    StrategyScheduler(const StrategyScheduler&) = delete;
    StrategyScheduler& operator=(const StrategyScheduler&) = delete;

    // Must be called before start()
    void registerStrategy(std::shared_ptr<strategy::IStrategy> strategy, double initial_allocation);

    bool start();
    // start(), then block until stop is requested, then join
    void run();
    // Non-blocking: raise the stop flag and cancel continuous strategies
    void requestStop();
    // requestStop() and join every worker
    void stop();

    bool isRunning() const { return running_.load(); }
    StopToken stopToken() const { return StopToken(stop_source_); }

    // One cyclic iteration with failure isolation; records the result
    StrategyResult runCycle(strategy::IStrategy& strategy);
    // One housekeeping pass
    void runHousekeeping();

    int housekeepingCycles() const { return housekeeping_cycles_.load(); }
    size_t strategyCount() const { return strategies_.size(); }

private:
    void cyclicLoop(std::shared_ptr<strategy::IStrategy> strategy);
    void continuousLoop(std::shared_ptr<strategy::IStrategy> strategy);
    void housekeepingLoop();

    void reconcileStrategy(strategy::IStrategy& strategy);
    void recordContinuousSnapshot(strategy::IStrategy& strategy);
    void pushAllocations();
    void weeklyResetIfDue();

    SchedulerConfig config_;
    std::shared_ptr<AllocationOptimizer> optimizer_;
    std::shared_ptr<ReconciliationMonitor> monitor_;
    std::shared_ptr<core::PositionLedger> ledger_;
    Universe universe_;
    std::shared_ptr<spdlog::logger> logger_;

    std::vector<std::shared_ptr<strategy::IStrategy>> strategies_;
    std::vector<std::thread> workers_;
    std::shared_ptr<StopSource> stop_source_;
    std::atomic<bool> running_{false};
    std::atomic<int> housekeeping_cycles_{0};
    std::mutex lifecycle_mutex_;
    std::string last_weekly_reset_;
};

} // namespace engine
} // namespace kestrel
