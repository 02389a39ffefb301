#include "risk/RiskSizer.h"

#include <algorithm>
#include <cmath>

#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace kestrel {
namespace risk {

namespace {
constexpr double kCapEpsilon = 1e-9;
}

RiskSizer::RiskSizer(double initial_bankroll, std::shared_ptr<spdlog::logger> logger)
    : initial_bankroll_(initial_bankroll)
    , day_provider_([]() {
        return utils::TimeUtils::format(std::chrono::system_clock::now(), "%Y-%m-%d");
    })
    , logger_(Logger::orSilent(std::move(logger))) {
    current_day_ = day_provider_();
}

RiskProfile RiskSizer::getRiskProfile(double bankroll, double win_rate) const {
    const double initial = initial_bankroll_;

    // Downswing
    if (bankroll < initial * 0.8) {
        return {"tight", 0.01, 0.10, 0.10};
    }
    if (bankroll < initial) {
        return {"conservative", 0.02, 0.07, 0.15};
    }
    if (bankroll < initial * 1.5) {
        if (win_rate > 0.55) {
            return {"moderate-aggressive", 0.04, 0.05, 0.25};
        }
        return {"moderate", 0.03, 0.05, 0.20};
    }
    // Hot streak
    if (win_rate > 0.60) {
        return {"aggressive", 0.05, 0.04, 0.30};
    }
    return {"moderate-aggressive", 0.04, 0.05, 0.25};
}

double RiskSizer::calculatePositionSize(double bankroll, double win_rate, double ev, double odds) const {
    if (bankroll <= 0.0 || odds <= 0.0) {
        return 0.0;
    }

    const auto profile = getRiskProfile(bankroll, win_rate);
    double min_trade = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        min_trade = min_trade_dollars_;
    }

    const double win_prob = (ev + 1.0) / odds;
    const double loss_prob = 1.0 - win_prob;
    const double kelly_pct = (win_prob * odds - loss_prob) / odds;

    const double position_pct = std::min(kelly_pct * profile.kelly_multiplier, profile.max_position_pct);
    if (position_pct <= 0.0) {
        return 0.0;
    }

    const double cap = bankroll * profile.max_position_pct;
    const double size = bankroll * position_pct;
    if (size < min_trade) {
        return 0.0;
    }

    double rounded = 0.0;
    if (size < 5.0) {
        rounded = std::round(size * 10.0) / 10.0;
        if (rounded > cap + kCapEpsilon) {
            rounded = std::floor(size * 10.0) / 10.0;
        }
    } else {
        rounded = std::round(size);
        if (rounded > cap + kCapEpsilon) {
            rounded = std::floor(size);
        }
    }

    if (rounded < min_trade) {
        return 0.0;
    }
    return rounded;
}

double RiskSizer::calculateEv(double win_probability, double odds) {
    const double profit = odds - 1.0;
    return win_probability * profit - (1.0 - win_probability);
}

bool RiskSizer::canTrade(double bankroll) {
    std::lock_guard<std::mutex> lock(mutex_);
    resetDailyIfNeeded();

    if (daily_loss_ >= initial_bankroll_ * daily_loss_limit_pct_) {
        logger_->warn("Daily loss limit reached (${:.2f} >= ${:.2f})",
                      daily_loss_, initial_bankroll_ * daily_loss_limit_pct_);
        return false;
    }
    if (bankroll < initial_bankroll_ * 0.5) {
        logger_->warn("Bankroll ${:.2f} below 50% of initial ${:.2f}, trading halted",
                      bankroll, initial_bankroll_);
        return false;
    }
    return true;
}

void RiskSizer::recordResult(double pnl) {
    std::lock_guard<std::mutex> lock(mutex_);
    resetDailyIfNeeded();

    if (pnl > 0.0) {
        consecutive_wins_++;
        consecutive_losses_ = 0;
    } else {
        consecutive_losses_++;
        consecutive_wins_ = 0;
        daily_loss_ += std::abs(pnl);
    }
}

void RiskSizer::resetDailyStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    daily_loss_ = 0.0;
    current_day_ = day_provider_();
}

void RiskSizer::resetDailyIfNeeded() {
    const auto today = day_provider_();
    if (today != current_day_) {
        logger_->info("Day changed ({} -> {}), daily loss reset", current_day_, today);
        current_day_ = today;
        daily_loss_ = 0.0;
    }
}

void RiskSizer::setDailyLossLimitPct(double pct) {
    std::lock_guard<std::mutex> lock(mutex_);
    daily_loss_limit_pct_ = pct;
    logger_->info("Daily loss limit set: {:.2f}%", pct * 100.0);
}

void RiskSizer::setMinTradeDollars(double dollars) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_trade_dollars_ = dollars;
}

void RiskSizer::setDayProvider(std::function<std::string()> provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    day_provider_ = std::move(provider);
    current_day_ = day_provider_();
}

double RiskSizer::getDailyLoss() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return daily_loss_;
}

int RiskSizer::getConsecutiveWins() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_wins_;
}

int RiskSizer::getConsecutiveLosses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_losses_;
}

} // namespace risk
} // namespace kestrel
