#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "strategy/ProbabilityModel.h"
#include "strategy/StrategyBase.h"

namespace kestrel {
namespace strategy {

// Cyclic value strategy: lists open markets for each configured series,
// compares the ask on both sides against the model's probability and buys
// the side whose edge clears min_edge.
class EdgeScanStrategy : public StrategyBase {
public:
    EdgeScanStrategy(StrategyConfig config,
                     StrategyContext context,
                     std::shared_ptr<IProbabilityModel> model);

    std::vector<Opportunity> scan() override;
    int execute(const std::vector<Opportunity>& opportunities) override;
    std::optional<core::MarketSnapshot> marketSnapshot(const core::Position& position) override;

    // Better side of one market, if its edge reaches min_edge
    static std::optional<Opportunity> evaluateMarket(const network::Market& market,
                                                     double yes_probability,
                                                     double min_edge);

private:
    std::shared_ptr<IProbabilityModel> model_;
};

} // namespace strategy
} // namespace kestrel
