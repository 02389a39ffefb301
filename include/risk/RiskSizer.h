#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>

#include "common/Types.h"

namespace kestrel {
namespace risk {

struct RiskProfile {
    std::string level;          // tight / conservative / moderate / moderate-aggressive / aggressive
    double max_position_pct = 0.0;
    double min_ev_threshold = 0.0;
    double kelly_multiplier = 0.0;
};

// Bankroll-tier fractional Kelly sizing plus the daily loss / drawdown
// circuit breaker. Tighten when losing, loosen when winning.
class RiskSizer {
public:
    explicit RiskSizer(double initial_bankroll,
                       std::shared_ptr<spdlog::logger> logger = nullptr);

    RiskProfile getRiskProfile(double bankroll, double win_rate) const;

    // Dollars to stake; 0 when too small to trade
    double calculatePositionSize(double bankroll, double win_rate, double ev, double odds) const;

    // EV per dollar staked at decimal odds
    static double calculateEv(double win_probability, double odds);

    bool canTrade(double bankroll);
    void recordResult(double pnl);
    void resetDailyStats();

    void setDailyLossLimitPct(double pct);
    void setMinTradeDollars(double dollars);

    // Calendar day key; replaced in tests to simulate a day rollover
    void setDayProvider(std::function<std::string()> provider);

    double getInitialBankroll() const { return initial_bankroll_; }
    double getDailyLoss() const;
    int getConsecutiveWins() const;
    int getConsecutiveLosses() const;

private:
    void resetDailyIfNeeded();

    const double initial_bankroll_;
    double daily_loss_limit_pct_ = 0.20;
    double min_trade_dollars_ = 1.0;

    mutable std::mutex mutex_;
    double daily_loss_ = 0.0;
    int consecutive_wins_ = 0;
    int consecutive_losses_ = 0;
    std::string current_day_;
    std::function<std::string()> day_provider_;

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace risk
} // namespace kestrel
