#include "strategy/StrategyBase.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "common/Logger.h"
#include "execution/TickerResolver.h"

namespace kestrel {
namespace strategy {

namespace {
constexpr size_t kMaxRecentErrors = 5;
}

std::string toString(StrategyMode mode) {
    return mode == StrategyMode::CONTINUOUS ? "continuous" : "cyclic";
}

StrategyMode strategyModeFromString(const std::string& value) {
    if (value == "continuous" || value == "CONTINUOUS") {
        return StrategyMode::CONTINUOUS;
    }
    if (value == "cyclic" || value == "CYCLIC") {
        return StrategyMode::CYCLIC;
    }
    throw std::invalid_argument("unknown strategy mode: " + value);
}

StrategyBase::StrategyBase(StrategyConfig config, StrategyContext context)
    : config_(std::move(config))
    , ctx_(std::move(context))
    , logger_(Logger::orSilent(ctx_.logger))
    , allocation_(config_.allocation) {
    if (!ctx_.ledger || !ctx_.risk || !ctx_.executor) {
        throw std::invalid_argument("strategy " + config_.name + " needs ledger, risk sizer and executor");
    }
}

std::chrono::seconds StrategyBase::interval() const {
    return std::chrono::seconds(std::max(1, config_.interval_seconds));
}

Universe StrategyBase::universe() const {
    return ctx_.executor->universe();
}

core::PerformanceSummary StrategyBase::getPerformance() const {
    return ctx_.ledger->getPerformance(config_.name, universe());
}

void StrategyBase::setAllocation(double allocation) {
    allocation_.store(allocation);
}

void StrategyBase::recordError(const std::string& error) {
    std::lock_guard<std::mutex> lock(errors_mutex_);
    errors_.push_back(error);
    while (errors_.size() > kMaxRecentErrors) {
        errors_.pop_front();
    }
}

std::vector<std::string> StrategyBase::recentErrors() const {
    std::lock_guard<std::mutex> lock(errors_mutex_);
    return std::vector<std::string>(errors_.begin(), errors_.end());
}

double StrategyBase::currentBankroll() const {
    if (ctx_.executor->isDryRun() || !ctx_.exchange) {
        const auto sim = ctx_.ledger->getPerformance(std::nullopt, Universe::SIMULATED);
        return ctx_.risk->getInitialBankroll() + sim.total_pnl;
    }
    return ctx_.exchange->getBalance().dollars();
}

std::optional<Cents> StrategyBase::bestBid(const std::string& ticker, Side side) const {
    if (!ctx_.exchange) {
        return std::nullopt;
    }
    const auto book = ctx_.exchange->getOrderbook(ticker);
    const auto& levels = side == Side::YES ? book.yes : book.no;

    std::optional<Cents> best;
    for (const auto& level : levels) {
        if (level.size > 0 && (!best || level.price > *best)) {
            best = level.price;
        }
    }
    return best;
}

std::optional<execution::SubmitOutcome> StrategyBase::tradeOpportunity(const Opportunity& opportunity) {
    if (opportunity.price_cents < 1 || opportunity.price_cents > 99) {
        return std::nullopt;
    }

    const double bankroll = currentBankroll();
    if (!ctx_.risk->canTrade(bankroll)) {
        logger_->info("[{}] Circuit breaker active, skipping {}", config_.name, opportunity.ticker);
        return std::nullopt;
    }

    const auto performance = getPerformance();
    const auto profile = ctx_.risk->getRiskProfile(bankroll, performance.win_rate);
    if (opportunity.expected_value < profile.min_ev_threshold) {
        logger_->debug("[{}] {} EV {:.3f} below {} threshold {:.2f}", config_.name, opportunity.ticker,
                       opportunity.expected_value, profile.level, profile.min_ev_threshold);
        return std::nullopt;
    }

    const double stake = ctx_.risk->calculatePositionSize(
        bankroll, performance.win_rate, opportunity.expected_value, opportunity.odds);
    if (stake <= 0.0) {
        logger_->debug("[{}] {} sized to zero", config_.name, opportunity.ticker);
        return std::nullopt;
    }

    return submitWithReservation(opportunity, opportunity.ticker, bankroll, stake);
}

std::optional<execution::SubmitOutcome> StrategyBase::tradeFixedSize(const Opportunity& opportunity,
                                                                     const std::string& ticker_selector,
                                                                     int contracts) {
    if (contracts <= 0 || opportunity.price_cents < 1 || opportunity.price_cents > 99) {
        return std::nullopt;
    }

    const double bankroll = currentBankroll();
    if (!ctx_.risk->canTrade(bankroll)) {
        logger_->info("[{}] Circuit breaker active, skipping {}", config_.name, ticker_selector);
        return std::nullopt;
    }

    return submitWithReservation(opportunity, ticker_selector, bankroll,
                                 contracts * opportunity.price_cents / 100.0);
}

std::optional<execution::SubmitOutcome> StrategyBase::submitWithReservation(const Opportunity& opportunity,
                                                                            const std::string& ticker_selector,
                                                                            double bankroll,
                                                                            double notional) {
    const Cents price = opportunity.price_cents;

    // Allocation caps this strategy's share of the exposure budget
    double strategy_open = 0.0;
    for (const auto& position : ctx_.ledger->getOpenPositions(config_.name, universe())) {
        strategy_open += position.notional();
    }
    const double max_exposure_pct = ctx_.exposure ? ctx_.exposure->maxExposurePct() : 1.0;
    const double budget = allocation() * max_exposure_pct * bankroll - strategy_open;
    notional = std::min(notional, std::max(0.0, budget));

    int max_contracts = opportunity.max_contracts > 0 ? opportunity.max_contracts : config_.max_contracts;
    int contracts = static_cast<int>(std::floor(notional * 100.0 / price + 1e-9));
    if (max_contracts > 0) {
        contracts = std::min(contracts, max_contracts);
    }
    if (contracts < 1) {
        logger_->debug("[{}] {} below one contract after allocation cap", config_.name, ticker_selector);
        return std::nullopt;
    }

    double reserved = contracts * price / 100.0;
    if (ctx_.exposure) {
        const double granted = ctx_.exposure->reserve(reserved, bankroll);
        const int granted_contracts = static_cast<int>(std::floor(granted * 100.0 / price + 1e-9));
        if (granted_contracts < 1) {
            if (granted > 0.0) {
                ctx_.exposure->release(granted);
            }
            logger_->info("[{}] Exposure limit reached, skipping {}", config_.name, ticker_selector);
            return std::nullopt;
        }
        contracts = granted_contracts;
        reserved = contracts * price / 100.0;
        if (granted - reserved > 1e-9) {
            ctx_.exposure->release(granted - reserved);
        }
    }

    execution::TradeRequest request;
    request.source = opportunity.source.empty() ? config_.name : opportunity.source;
    request.ticker_selector = ticker_selector;
    if (execution::TickerResolver::isConcreteTicker(ticker_selector)) {
        request.ticker = ticker_selector;
    }
    request.side = opportunity.side;
    request.price = price;
    request.size = contracts;
    request.strategy = config_.name;
    request.market_title = opportunity.market_title;
    request.expected_settlement = opportunity.expected_settlement;
    request.reserved_notional = ctx_.exposure ? reserved : 0.0;

    const auto result = ctx_.executor->submit(request);
    logger_->info("[{}] {} {} x{} @ {}c -> {}{}", config_.name, ticker_selector,
                  kestrel::toString(opportunity.side), contracts, price,
                  execution::toString(result.outcome),
                  result.error.empty() ? std::string() : " (" + result.error + ")");
    if (result.outcome == execution::SubmitOutcome::REJECTED
        || result.outcome == execution::SubmitOutcome::FAILED) {
        recordError(ticker_selector + ": " + (result.error.empty() ? execution::toString(result.outcome) : result.error));
    }
    return result.outcome;
}

} // namespace strategy
} // namespace kestrel
