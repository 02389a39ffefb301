#include "strategy/EdgeScanStrategy.h"
#include "support/FakeExchangeClient.h"
#include "support/TestSupport.h"

#include <cassert>
#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace kestrel;

namespace {

struct Fixture {
    std::shared_ptr<testing::FakeExchangeClient> exchange = std::make_shared<testing::FakeExchangeClient>();
    std::shared_ptr<core::PositionLedger> ledger = std::make_shared<core::PositionLedger>(
        std::make_shared<testing::MemoryLedgerStore>(), std::make_shared<testing::MemoryLedgerStore>(), nullptr);
    std::shared_ptr<risk::RiskSizer> risk = std::make_shared<risk::RiskSizer>(100.0);
    std::shared_ptr<risk::ExposureTracker> exposure = std::make_shared<risk::ExposureTracker>(0.5);
    std::shared_ptr<execution::TradeExecutor> executor = std::make_shared<execution::TradeExecutor>(
        exchange, ledger, std::make_shared<execution::RetryQueue>(ledger, Universe::REAL), exposure, true);
    std::shared_ptr<strategy::FairValueModel> model = std::make_shared<strategy::FairValueModel>();
    std::unique_ptr<strategy::EdgeScanStrategy> strategy;

    Fixture() {
        strategy::StrategyConfig config;
        config.name = "WeatherEdge";
        config.series = {"KXHIGHNY"};
        config.min_edge = 0.10;
        config.max_contracts = 3;

        model->set("KXHIGHNY", 0.5);

        network::Market derived = testing::makeMarket("KXHIGHNY-26JAN01-B47", 0, 0);
        derived.no_bid = 75;    // YES ask derived as 25
        exchange->markets["KXHIGHNY"] = {
            testing::makeMarket("KXHIGHNY-26JAN01-B45", 30, 72),
            testing::makeMarket("KXHIGHNY-26JAN01-B46", 60, 42),
            derived
        };

        strategy = std::make_unique<strategy::EdgeScanStrategy>(
            config, strategy::StrategyContext{exchange, ledger, risk, exposure, executor, nullptr}, model);
    }
};

void testEvaluateMarket() {
    auto yes = strategy::EdgeScanStrategy::evaluateMarket(testing::makeMarket("M-1", 30, 72), 0.5, 0.10);
    assert(yes.has_value());
    assert(yes->side == Side::YES);
    assert(yes->price_cents == 30);
    assert(std::abs(yes->edge - 0.2) < 1e-9);
    assert(std::abs(yes->odds - 100.0 / 30.0) < 1e-9);
    assert(std::abs(yes->expected_value - risk::RiskSizer::calculateEv(0.5, 100.0 / 30.0)) < 1e-12);
    assert(yes->expected_settlement.has_value());

    // NO side wins when the YES probability is low
    auto no = strategy::EdgeScanStrategy::evaluateMarket(testing::makeMarket("M-2", 20, 70), 0.1, 0.10);
    assert(no.has_value());
    assert(no->side == Side::NO);
    assert(std::abs(no->win_probability - 0.9) < 1e-9);

    // Edge of 0.08 misses a 0.10 threshold
    assert(!strategy::EdgeScanStrategy::evaluateMarket(testing::makeMarket("M-3", 60, 42), 0.5, 0.10));
    assert(strategy::EdgeScanStrategy::evaluateMarket(testing::makeMarket("M-3", 60, 42), 0.5, 0.05));

    // No quotes at all
    assert(!strategy::EdgeScanStrategy::evaluateMarket(testing::makeMarket("M-4", 0, 0), 0.9, 0.0));
}

void testScanSortsByEdge() {
    Fixture f;
    const auto opportunities = f.strategy->scan();
    assert(opportunities.size() == 2);
    assert(opportunities[0].ticker == "KXHIGHNY-26JAN01-B47");
    assert(opportunities[0].price_cents == 25);
    assert(opportunities[1].ticker == "KXHIGHNY-26JAN01-B45");
    assert(opportunities[0].source == "WeatherEdge");
}

void testExecuteRecordsSimulatedTrades() {
    Fixture f;
    const int executed = f.strategy->execute(f.strategy->scan());
    assert(executed == 2);

    auto position = f.ledger->getPosition("KXHIGHNY-26JAN01-B45", Universe::SIMULATED);
    assert(position.has_value());
    assert(position->contracts == 3);
    assert(position->entry_price == 30);
    assert(position->strategy == "WeatherEdge");
    assert(f.exchange->orderCount() == 0);
    assert(std::abs(f.exposure->current() - (0.9 + 0.75)) < 1e-9);

    // Held tickers drop out of the next scan
    assert(f.strategy->scan().empty());

    const auto perf = f.strategy->getPerformance();
    assert(perf.open_count == 2);
}

void testCircuitBreakerBlocks() {
    Fixture f;
    f.risk->recordResult(-25.0);
    assert(f.strategy->execute(f.strategy->scan()) == 0);
    assert(f.ledger->getOpenPositions(std::nullopt, Universe::SIMULATED).empty());
}

void testAllocationCapsBudget() {
    Fixture f;
    // 0.02 x 0.5 x $100 = $1 budget covers only the first trade
    f.strategy->setAllocation(0.02);
    assert(f.strategy->execute(f.strategy->scan()) == 1);
    auto first = f.ledger->getPosition("KXHIGHNY-26JAN01-B47", Universe::SIMULATED);
    assert(first.has_value());
    assert(first->contracts == 3);
    assert(!f.ledger->getPosition("KXHIGHNY-26JAN01-B45", Universe::SIMULATED).has_value());
}

void testScanErrorsRecorded() {
    Fixture f;
    f.exchange->fail_markets = true;
    assert(f.strategy->scan().empty());
    const auto errors = f.strategy->recentErrors();
    assert(errors.size() == 1);
    assert(errors[0].find("KXHIGHNY") == 0);
}

void testMarketSnapshot() {
    Fixture f;
    f.exchange->orderbooks["KXHIGHNY-26JAN01-B45"] = network::Orderbook{{{31, 0}, {33, 5}}, {{65, 2}}};

    core::Position yes;
    yes.ticker = "KXHIGHNY-26JAN01-B45";
    yes.side = Side::YES;
    yes.entry_price = 30;
    auto snapshot = f.strategy->marketSnapshot(yes);
    assert(snapshot.has_value());
    assert(snapshot->price == 33);
    assert(std::abs(snapshot->edge - 0.17) < 1e-9);

    core::Position no = yes;
    no.side = Side::NO;
    no.entry_price = 70;
    auto no_snapshot = f.strategy->marketSnapshot(no);
    assert(no_snapshot->price == 33);
    assert(std::abs(no_snapshot->edge - (0.5 - 0.65)) < 1e-9);

    core::Position unknown = yes;
    unknown.ticker = "OTHER-1";
    assert(!f.strategy->marketSnapshot(unknown).has_value());
}

void testFairValueModel() {
    strategy::FairValueModel model;
    model.set("KXHIGHNY", 0.4);
    model.set("KXHIGHNY-26JAN01", 0.6);
    model.set("KXHIGHNY-26JAN01-B45", 0.8);

    network::Market exact = testing::makeMarket("KXHIGHNY-26JAN01-B45", 1, 1);
    network::Market by_event = testing::makeMarket("KXHIGHNY-26JAN01-B46", 1, 1);
    network::Market by_series = testing::makeMarket("KXHIGHNY-26JAN02-B46", 1, 1);
    network::Market unknown = testing::makeMarket("KXBTC-26JAN02-B46", 1, 1);
    assert(model.yesProbability(exact) == 0.8);
    assert(model.yesProbability(by_event) == 0.6);
    assert(model.yesProbability(by_series) == 0.4);
    assert(!model.yesProbability(unknown).has_value());

    bool threw = false;
    try {
        model.set("BAD", 1.5);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    auto loaded = strategy::FairValueModel::fromJson(nlohmann::json{{"KXBTC", 0.55}});
    assert(loaded->size() == 1);

    threw = false;
    try {
        strategy::FairValueModel::fromJson(nlohmann::json{{"KXBTC", "high"}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    const auto dir = testing::makeTempDir("fair_values");
    {
        std::ofstream out(dir / "fair_values.json");
        out << R"({"KXHIGHNY": 0.5, "KXHIGHCHI": 0.45})";
    }
    assert(strategy::FairValueModel::fromFile((dir / "fair_values.json").string())->size() == 2);
    std::filesystem::remove_all(dir);
}

} // namespace

int main() {
    std::cout << "[TEST] Starting EdgeScanStrategy Test..." << std::endl;

    testEvaluateMarket();
    testScanSortsByEdge();
    testExecuteRecordsSimulatedTrades();
    testCircuitBreakerBlocks();
    testAllocationCapsBudget();
    testScanErrorsRecorded();
    testMarketSnapshot();
    testFairValueModel();

    std::cout << "[TEST] EdgeScanStrategy PASSED" << std::endl;
    return 0;
}
