#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/state/PositionLedger.h"
#include "execution/TradeExecutor.h"
#include "network/IExchangeClient.h"
#include "risk/ExposureTracker.h"
#include "risk/RiskSizer.h"
#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"

namespace kestrel {
namespace strategy {

// Shared collaborators handed to every strategy at construction
struct StrategyContext {
    std::shared_ptr<network::IExchangeClient> exchange;
    std::shared_ptr<core::PositionLedger> ledger;
    std::shared_ptr<risk::RiskSizer> risk;
    std::shared_ptr<risk::ExposureTracker> exposure;
    std::shared_ptr<execution::TradeExecutor> executor;
    std::shared_ptr<spdlog::logger> logger;
};

// Sizing, gating and submission common to all strategies.
// Subclasses provide scan() and choose how to execute opportunities.
class StrategyBase : public IStrategy {
public:
    StrategyBase(StrategyConfig config, StrategyContext context);

    std::string name() const override { return config_.name; }
    StrategyMode mode() const override { return config_.mode; }
    std::chrono::seconds interval() const override;

    core::PerformanceSummary getPerformance() const override;
    void setAllocation(double allocation) override;
    std::vector<std::string> recentErrors() const override;

    double allocation() const { return allocation_.load(); }
    const StrategyConfig& config() const { return config_; }

protected:
    // Bankroll the sizer works from: exchange balance live, initial plus
    // simulated pnl in dry-run
    double currentBankroll() const;

    // can_trade -> size -> exposure reserve -> submit. Returns the executor
    // outcome, or nullopt when the trade was skipped before submission.
    std::optional<execution::SubmitOutcome> tradeOpportunity(const Opportunity& opportunity);

    // Bypasses Kelly sizing for copied trades; still gated by can_trade and exposure
    std::optional<execution::SubmitOutcome> tradeFixedSize(const Opportunity& opportunity,
                                                           const std::string& ticker_selector,
                                                           int contracts);

    void recordError(const std::string& error);
    Universe universe() const;

    // Best bid on the held side, from the orderbook
    std::optional<Cents> bestBid(const std::string& ticker, Side side) const;

    StrategyConfig config_;
    StrategyContext ctx_;
    std::shared_ptr<spdlog::logger> logger_;

private:
    std::optional<execution::SubmitOutcome> submitWithReservation(const Opportunity& opportunity,
                                                                  const std::string& ticker_selector,
                                                                  double bankroll,
                                                                  double notional);

    std::atomic<double> allocation_;
    mutable std::mutex errors_mutex_;
    std::deque<std::string> errors_;
};

} // namespace strategy
} // namespace kestrel
