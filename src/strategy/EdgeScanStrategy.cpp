#include "strategy/EdgeScanStrategy.h"

#include <algorithm>
#include <stdexcept>

namespace kestrel {
namespace strategy {

EdgeScanStrategy::EdgeScanStrategy(StrategyConfig config,
                                   StrategyContext context,
                                   std::shared_ptr<IProbabilityModel> model)
    : StrategyBase(std::move(config), std::move(context))
    , model_(std::move(model)) {
    if (!ctx_.exchange || !model_) {
        throw std::invalid_argument("edge scan strategy " + config_.name + " needs exchange and model");
    }
}

std::optional<Opportunity> EdgeScanStrategy::evaluateMarket(const network::Market& market,
                                                            double yes_probability,
                                                            double min_edge) {
    Cents yes_ask = market.yes_ask;
    Cents no_ask = market.no_ask;
    // Asks are often omitted; each side's ask mirrors the other's bid
    if (yes_ask <= 0 && market.no_bid > 0) yes_ask = 100 - market.no_bid;
    if (no_ask <= 0 && market.yes_bid > 0) no_ask = 100 - market.yes_bid;

    std::optional<Opportunity> best;
    auto consider = [&](Side side, Cents ask, double win_probability) {
        if (ask < 1 || ask > 99) {
            return;
        }
        const double edge = win_probability - ask / 100.0;
        if (edge < min_edge || (best && edge <= best->edge)) {
            return;
        }
        Opportunity opp;
        opp.ticker = market.ticker;
        opp.market_title = market.title;
        opp.side = side;
        opp.price_cents = ask;
        opp.win_probability = win_probability;
        opp.edge = edge;
        opp.odds = 100.0 / ask;
        opp.expected_value = risk::RiskSizer::calculateEv(win_probability, opp.odds);
        if (!market.close_time.empty()) {
            opp.expected_settlement = market.close_time;
        }
        opp.details = {
            {"yes_probability", yes_probability},
            {"yes_ask", yes_ask},
            {"no_ask", no_ask},
            {"volume", market.volume}
        };
        best = opp;
    };

    consider(Side::YES, yes_ask, yes_probability);
    consider(Side::NO, no_ask, 1.0 - yes_probability);
    return best;
}

std::vector<Opportunity> EdgeScanStrategy::scan() {
    std::vector<Opportunity> opportunities;
    const auto target_universe = universe();

    for (const auto& series : config_.series) {
        network::MarketFilter filter;
        filter.series_ticker = series;
        filter.status = "open";
        filter.limit = config_.market_limit;

        std::vector<network::Market> markets;
        try {
            markets = ctx_.exchange->getMarkets(filter);
        } catch (const network::ExchangeError& e) {
            logger_->warn("[{}] Market listing for {} failed: {}", config_.name, series, e.what());
            recordError(series + ": " + e.what());
            continue;
        }

        for (const auto& market : markets) {
            if (ctx_.ledger->hasOpenPosition(market.ticker, target_universe)) {
                continue;
            }
            const auto p = model_->yesProbability(market);
            if (!p) {
                continue;
            }
            if (auto opp = evaluateMarket(market, *p, config_.min_edge)) {
                opp->source = config_.name;
                opportunities.push_back(std::move(*opp));
            }
        }
    }

    std::sort(opportunities.begin(), opportunities.end(),
              [](const Opportunity& a, const Opportunity& b) { return a.edge > b.edge; });

    logger_->info("[{}] Scan found {} opportunities across {} series",
                  config_.name, opportunities.size(), config_.series.size());
    return opportunities;
}

int EdgeScanStrategy::execute(const std::vector<Opportunity>& opportunities) {
    int executed = 0;
    for (const auto& opp : opportunities) {
        const auto outcome = tradeOpportunity(opp);
        if (outcome == execution::SubmitOutcome::FILLED_SIM
            || outcome == execution::SubmitOutcome::PLACED) {
            executed++;
        }
    }
    return executed;
}

std::optional<core::MarketSnapshot> EdgeScanStrategy::marketSnapshot(const core::Position& position) {
    network::Market market;
    market.ticker = position.ticker;
    const auto p = model_->yesProbability(market);
    if (!p) {
        return std::nullopt;
    }

    core::MarketSnapshot snapshot;
    snapshot.price = bestBid(position.ticker, Side::YES);
    const auto held_bid = bestBid(position.ticker, position.side);
    const double win_probability = position.side == Side::YES ? *p : 1.0 - *p;
    snapshot.edge = win_probability - held_bid.value_or(position.entry_price) / 100.0;
    return snapshot;
}

} // namespace strategy
} // namespace kestrel
