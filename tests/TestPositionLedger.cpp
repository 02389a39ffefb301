#include "core/state/PositionLedger.h"
#include "support/TestSupport.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <thread>
#include <vector>

using namespace kestrel;
using kestrel::testing::MemoryLedgerStore;

namespace {

core::OpenPositionRequest request(const std::string& ticker, Side side, int contracts, Cents price,
                                  const std::string& strategy = "EdgeScan") {
    core::OpenPositionRequest r;
    r.ticker = ticker;
    r.side = side;
    r.contracts = contracts;
    r.entry_price = price;
    r.strategy = strategy;
    r.market_title = "Test market " + ticker;
    return r;
}

struct Fixture {
    std::shared_ptr<MemoryLedgerStore> real = std::make_shared<MemoryLedgerStore>();
    std::shared_ptr<MemoryLedgerStore> sim = std::make_shared<MemoryLedgerStore>();
    core::PositionLedger ledger{real, sim, nullptr};
};

void testDedupe() {
    Fixture f;
    auto first = f.ledger.openPosition(request("BTC-TICK", Side::YES, 5, 30), Universe::REAL);
    assert(first.has_value());
    assert(first->isOpen());
    assert(!first->simulated);
    assert(!first->entry_time.empty());

    // Same ticker, different strategy: still one open position per universe
    auto dup = f.ledger.openPosition(request("BTC-TICK", Side::NO, 2, 60, "Follow"), Universe::REAL);
    assert(!dup.has_value());
    assert(f.ledger.getOpenPositions(std::nullopt, Universe::REAL).size() == 1);

    // Universes are independent
    auto sim = f.ledger.openPosition(request("BTC-TICK", Side::YES, 5, 30), Universe::SIMULATED);
    assert(sim.has_value());
    assert(sim->simulated);
    assert(f.ledger.hasOpenPosition("BTC-TICK", Universe::SIMULATED));

    // Explicit replace without dedupe
    auto replaced = f.ledger.openPosition(request("BTC-TICK", Side::NO, 1, 40), Universe::REAL, false);
    assert(replaced.has_value());
    assert(f.ledger.getPosition("BTC-TICK", Universe::REAL)->side == Side::NO);
}

void testRejectsInvalid() {
    Fixture f;
    assert(!f.ledger.openPosition(request("", Side::YES, 1, 30), Universe::REAL));
    assert(!f.ledger.openPosition(request("X-1", Side::YES, 0, 30), Universe::REAL));
    assert(!f.ledger.openPosition(request("X-1", Side::YES, 1, 0), Universe::REAL));
    assert(!f.ledger.openPosition(request("X-1", Side::YES, 1, 100), Universe::REAL));
    assert(f.real->save_calls == 0);
}

void testCloseOnce() {
    Fixture f;
    assert(f.ledger.openPosition(request("KXHIGH-A", Side::YES, 5, 30), Universe::REAL));

    auto closed = f.ledger.closePosition("KXHIGH-A", 100, 3.5, Universe::REAL);
    assert(closed.has_value());
    assert(closed->status == PositionStatus::CLOSED);
    assert(closed->exit_price == 100);
    assert(closed->exit_time.has_value());
    assert(std::abs(*closed->pnl - 3.5) < 1e-9);

    // Second close is refused and leaves the first result alone
    assert(!f.ledger.closePosition("KXHIGH-A", 0, -1.5, Universe::REAL));
    assert(std::abs(*f.ledger.getPosition("KXHIGH-A", Universe::REAL)->pnl - 3.5) < 1e-9);

    assert(!f.ledger.closePosition("UNKNOWN-1", 50, 0.0, Universe::REAL));

    // Reopening a closed ticker is allowed
    assert(f.ledger.openPosition(request("KXHIGH-A", Side::NO, 2, 45), Universe::REAL));
}

void testCancel() {
    Fixture f;
    assert(f.ledger.openPosition(request("KXHIGH-B", Side::NO, 3, 40), Universe::SIMULATED));
    auto cancelled = f.ledger.cancelPosition("KXHIGH-B", Universe::SIMULATED);
    assert(cancelled.has_value());
    assert(cancelled->status == PositionStatus::CANCELLED);
    assert(!cancelled->pnl.has_value());
    assert(!f.ledger.cancelPosition("KXHIGH-B", Universe::SIMULATED));
    assert(!f.ledger.closePosition("KXHIGH-B", 100, 1.0, Universe::SIMULATED));

    // Cancelled trades are not counted as trades
    auto perf = f.ledger.getPerformance(std::nullopt, Universe::SIMULATED);
    assert(perf.trades == 0);
    assert(perf.open_count == 0);
}

void testPerformance() {
    Fixture f;
    assert(f.ledger.openPosition(request("A-1", Side::YES, 5, 30), Universe::REAL));
    assert(f.ledger.openPosition(request("A-2", Side::YES, 5, 50), Universe::REAL));
    assert(f.ledger.openPosition(request("A-3", Side::NO, 2, 40), Universe::REAL));
    assert(f.ledger.openPosition(request("B-1", Side::YES, 1, 20, "Follow"), Universe::REAL));

    assert(f.ledger.closePosition("A-1", 100, 3.5, Universe::REAL));
    assert(f.ledger.closePosition("A-2", 0, -2.5, Universe::REAL));

    auto perf = f.ledger.getPerformance(std::string("EdgeScan"), Universe::REAL);
    assert(perf.trades == 2);
    assert(perf.winning_trades == 1);
    assert(std::abs(perf.win_rate - 0.5) < 1e-9);
    assert(std::abs(perf.total_pnl - 1.0) < 1e-9);
    assert(std::abs(perf.avg_pnl_per_trade - 0.5) < 1e-9);
    assert(perf.open_count == 1);

    auto all = f.ledger.getPerformance(std::nullopt, Universe::REAL);
    assert(all.open_count == 2);

    auto empty = f.ledger.getPerformance(std::string("Nobody"), Universe::REAL);
    assert(empty.trades == 0);
    assert(empty.win_rate == 0.0);

    auto by_strategy = f.ledger.getAllPerformance();
    assert(by_strategy.size() == 2);
    assert(by_strategy["EdgeScan"].combined_trades == 2);
    assert(by_strategy["Follow"].real.open_count == 1);

    auto open_follow = f.ledger.getOpenPositions(std::string("Follow"), Universe::REAL);
    assert(open_follow.size() == 1);
    assert(open_follow.front().ticker == "B-1");
}

void testDaily() {
    Fixture f;
    assert(f.ledger.openPosition(request("D-1", Side::YES, 1, 30), Universe::SIMULATED));
    assert(f.ledger.openPosition(request("D-2", Side::YES, 1, 30), Universe::SIMULATED));
    assert(f.ledger.closePosition("D-1", 100, 0.7, Universe::SIMULATED));

    auto today = f.ledger.getDailyPerformance(std::nullopt, Universe::SIMULATED);
    assert(today.strategy == "all");
    assert(today.total_trades == 2);
    assert(today.unique_markets == 2);
    assert(today.closed_trades == 1);
    assert(std::abs(today.total_pnl - 0.7) < 1e-9);
    assert(today.tickers.size() == 2);

    auto other_day = f.ledger.getDailyPerformance(std::nullopt, Universe::SIMULATED, "1999-01-01");
    assert(other_day.total_trades == 0);
}

void testClearSimulated() {
    Fixture f;
    assert(f.ledger.openPosition(request("S-1", Side::YES, 1, 30), Universe::SIMULATED));
    assert(f.ledger.openPosition(request("R-1", Side::YES, 1, 30), Universe::REAL));

    assert(f.ledger.clearSimulated(true));
    assert(f.sim->backups.size() == 1);
    assert(f.sim->backups.begin()->second.count("S-1") == 1);
    assert(f.ledger.getAllPositions(Universe::SIMULATED).empty());
    assert(f.sim->saved.empty());
    // Real ledger untouched
    assert(f.ledger.hasOpenPosition("R-1", Universe::REAL));

    // Failed backup keeps the positions
    assert(f.ledger.openPosition(request("S-2", Side::YES, 1, 30), Universe::SIMULATED));
    f.sim->fail_saves = true;
    assert(!f.ledger.clearSimulated(true));
    assert(f.ledger.hasOpenPosition("S-2", Universe::SIMULATED));
}

void testConcurrentOpenSameTicker() {
    Fixture f;
    const int kThreads = 8;
    std::vector<std::optional<core::Position>> results(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&f, &results, i]() {
            results[i] = f.ledger.openPosition(
                request("BTC-TICK", Side::YES, 1 + i, 30, "Strategy" + std::to_string(i)), Universe::REAL);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    int opened = 0;
    std::string winner;
    for (const auto& result : results) {
        if (result) {
            opened++;
            winner = result->strategy;
        }
    }
    assert(opened == 1);
    assert(f.ledger.getOpenPositions(std::nullopt, Universe::REAL).size() == 1);
    assert(f.ledger.getPosition("BTC-TICK", Universe::REAL)->strategy == winner);
    assert(f.real->saved.size() == 1);
}

void testClaims() {
    Fixture f;
    assert(f.ledger.claimTicker("BTC-TICK", Universe::REAL));
    assert(!f.ledger.claimTicker("BTC-TICK", Universe::REAL));
    // Claims are per universe
    assert(f.ledger.claimTicker("BTC-TICK", Universe::SIMULATED));

    // The claimer still records its own fill
    assert(f.ledger.openPosition(request("BTC-TICK", Side::YES, 2, 40), Universe::REAL));
    f.ledger.releaseClaim("BTC-TICK", Universe::REAL);
    assert(!f.ledger.isClaimed("BTC-TICK", Universe::REAL));

    // Open positions cannot be claimed again
    assert(!f.ledger.claimTicker("BTC-TICK", Universe::REAL));
    f.ledger.releaseClaim("BTC-TICK", Universe::SIMULATED);
    f.ledger.releaseClaim("NEVER-CLAIMED", Universe::SIMULATED);
    assert(!f.ledger.isClaimed("BTC-TICK", Universe::SIMULATED));

    const int kThreads = 8;
    std::vector<int> won(kThreads, 0);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&f, &won, i]() {
            won[i] = f.ledger.claimTicker("ETH-TICK", Universe::REAL) ? 1 : 0;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    int total = 0;
    for (int w : won) {
        total += w;
    }
    assert(total == 1);
}

} // namespace

int main() {
    std::cout << "[TEST] Starting PositionLedger Test..." << std::endl;

    testDedupe();
    testRejectsInvalid();
    testCloseOnce();
    testCancel();
    testPerformance();
    testDaily();
    testClearSimulated();
    testConcurrentOpenSameTicker();
    testClaims();

    std::cout << "[TEST] PositionLedger PASSED" << std::endl;
    return 0;
}
