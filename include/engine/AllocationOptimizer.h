#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/Types.h"
#include "core/contracts/IEventJournal.h"

namespace kestrel {
namespace engine {

// One strategy cycle as seen by the scheduler
struct StrategyResult {
    std::string strategy_name;
    int opportunities_found = 0;
    int trades_executed = 0;
    double profit_loss = 0.0;       // strategy total pnl at the end of the cycle
    double win_rate = 0.0;
    double runtime_seconds = 0.0;
    std::vector<std::string> errors;    // last 5
    std::string timestamp;
};

// Trailing per-strategy results and the smoothed capital split derived from them.
// Allocations always sum to 1.0; with two or more strategies each stays in
// [kMinAllocation, kMaxAllocation].
class AllocationOptimizer {
public:
    static constexpr double kMinAllocation = 0.1;
    static constexpr double kMaxAllocation = 0.9;
    static constexpr size_t kMinResults = 3;
    static constexpr size_t kWindow = 10;
    static constexpr double kSmoothing = 0.7;       // weight kept on the old allocation

    explicit AllocationOptimizer(std::shared_ptr<spdlog::logger> logger = nullptr,
                                 std::shared_ptr<core::IEventJournal> journal = nullptr,
                                 size_t max_history = 500);

    void registerStrategy(const std::string& name, double initial_allocation);
    void recordResult(const StrategyResult& result);

    // Rebalances from recent history; returns the new allocations
    std::map<std::string, double> optimize();

    std::map<std::string, double> allocations() const;
    double allocation(const std::string& name) const;
    std::vector<StrategyResult> history(const std::string& name) const;

    // Highest cumulative profit_loss across recorded cycles
    std::optional<std::string> bestStrategy() const;
    nlohmann::json exportResults() const;

    // Bounded renormalization; exposed for tests
    static void normalizeBounded(std::map<std::string, double>& allocations,
                                 double lo = kMinAllocation, double hi = kMaxAllocation);

private:
    std::optional<std::string> bestStrategyLocked() const;

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<core::IEventJournal> journal_;
    size_t max_history_;

    mutable std::mutex mutex_;
    std::map<std::string, double> allocations_;
    std::map<std::string, std::vector<StrategyResult>> history_;
};

} // namespace engine
} // namespace kestrel
