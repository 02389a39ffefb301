#include "strategy/SignalFollowStrategy.h"

#include <algorithm>
#include <stdexcept>

namespace kestrel {
namespace strategy {

SignalFollowStrategy::SignalFollowStrategy(StrategyConfig config,
                                           StrategyContext context,
                                           std::shared_ptr<SignalChannel> channel)
    : StrategyBase(std::move(config), std::move(context))
    , channel_(std::move(channel)) {
    if (!channel_) {
        throw std::invalid_argument("signal follow strategy " + config_.name + " needs a channel");
    }
}

bool SignalFollowStrategy::isFollowing(const std::string& source) const {
    if (config_.sources.empty()) {
        return true;
    }
    return std::find(config_.sources.begin(), config_.sources.end(), source) != config_.sources.end();
}

Opportunity SignalFollowStrategy::toOpportunity(const TradeSignal& signal) const {
    Opportunity opp;
    opp.ticker = signal.ticker_selector;
    opp.market_title = signal.market_title;
    opp.side = signal.side;
    opp.price_cents = signal.price;
    opp.win_probability = signal.price / 100.0;
    opp.odds = 100.0 / signal.price;
    opp.source = signal.source;
    opp.max_contracts = std::min(signal.size, config_.max_follow_contracts);
    opp.details = {{"observed_size", signal.size}};
    return opp;
}

std::vector<Opportunity> SignalFollowStrategy::scan() {
    std::vector<Opportunity> opportunities;
    while (auto signal = channel_->tryPop()) {
        if (!isFollowing(signal->source)) {
            continue;
        }
        opportunities.push_back(toOpportunity(*signal));
    }
    return opportunities;
}

int SignalFollowStrategy::execute(const std::vector<Opportunity>& opportunities) {
    int executed = 0;
    for (const auto& opp : opportunities) {
        logger_->info("[{}] Following {}: {} {} x{} @ {}c", config_.name, opp.source, opp.ticker,
                      kestrel::toString(opp.side), opp.max_contracts, opp.price_cents);
        const auto outcome = tradeFixedSize(opp, opp.ticker, opp.max_contracts);
        if (outcome == execution::SubmitOutcome::FILLED_SIM
            || outcome == execution::SubmitOutcome::PLACED) {
            executed++;
        }
    }
    return executed;
}

int SignalFollowStrategy::pollOnce() {
    const auto retry = ctx_.executor->drainRetryQueue();
    if (retry.attempted > 0 || !retry.dropped.empty()) {
        logger_->info("[{}] Retry backlog: {} filled, {} kept, {} dropped", config_.name,
                      retry.succeeded, retry.kept, retry.dropped.size());
    }

    std::vector<Opportunity> opportunities;
    auto first = channel_->popFor(std::chrono::milliseconds(std::max(1, config_.poll_interval_ms)));
    if (first && isFollowing(first->source)) {
        opportunities.push_back(toOpportunity(*first));
    }
    auto rest = scan();
    opportunities.insert(opportunities.end(), rest.begin(), rest.end());

    return execute(opportunities);
}

void SignalFollowStrategy::runContinuous(const StopToken& stop) {
    logger_->info("[{}] Continuous loop started", config_.name);
    while (!stop.stopRequested() && !cancelled_.load()) {
        pollOnce();
        if (channel_->isClosed() && channel_->size() == 0) {
            break;
        }
    }
    logger_->info("[{}] Continuous loop stopped", config_.name);
}

void SignalFollowStrategy::cancel() {
    cancelled_.store(true);
    channel_->close();
}

} // namespace strategy
} // namespace kestrel
