#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/StopToken.h"
#include "common/Types.h"
#include "core/model/LedgerTypes.h"

namespace kestrel {
namespace strategy {

enum class StrategyMode {
    CYCLIC,         // scheduler drives scan -> execute every interval
    CONTINUOUS      // strategy owns its loop via runContinuous()
};

std::string toString(StrategyMode mode);
StrategyMode strategyModeFromString(const std::string& value);

// A tradeable candidate produced by scan()
struct Opportunity {
    std::string ticker;
    std::string market_title;
    Side side = Side::YES;
    Cents price_cents = 0;
    double win_probability = 0.0;
    double edge = 0.0;              // win_probability - price
    double expected_value = 0.0;    // per dollar staked
    double odds = 0.0;              // decimal, 100 / price
    std::string source;
    int max_contracts = 0;          // 0 = sizer decides
    std::optional<std::string> expected_settlement;
    nlohmann::json details;
};

// Strategy capability surface used by the scheduler
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual std::string name() const = 0;
    virtual StrategyMode mode() const = 0;
    virtual std::chrono::seconds interval() const = 0;

    virtual std::vector<Opportunity> scan() = 0;
    // Returns the number of trades recorded or placed
    virtual int execute(const std::vector<Opportunity>& opportunities) = 0;

    virtual core::PerformanceSummary getPerformance() const = 0;

    // Continuous strategies only; returns when stop is requested or cancel() is called
    virtual void runContinuous(const StopToken& stop) { (void)stop; }
    virtual void cancel() {}

    // Capital share assigned by the allocation optimizer
    virtual void setAllocation(double allocation) { (void)allocation; }

    // Quote for exit assessment; nullopt when the strategy has no view
    virtual std::optional<core::MarketSnapshot> marketSnapshot(const core::Position& position) {
        (void)position;
        return std::nullopt;
    }

    // Most recent errors, newest last (at most 5)
    virtual std::vector<std::string> recentErrors() const { return {}; }
};

} // namespace strategy
} // namespace kestrel
