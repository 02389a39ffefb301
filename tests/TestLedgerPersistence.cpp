#include "core/state/EventJournalJsonl.h"
#include "core/state/LedgerStoreJson.h"
#include "core/state/PositionLedger.h"
#include "support/TestSupport.h"

#include <cassert>
#include <cmath>
#include <fstream>
#include <iostream>

using namespace kestrel;

namespace {

core::OpenPositionRequest request(const std::string& ticker, Side side, int contracts, Cents price) {
    core::OpenPositionRequest r;
    r.ticker = ticker;
    r.side = side;
    r.contracts = contracts;
    r.entry_price = price;
    r.strategy = "EdgeScan";
    r.expected_settlement = std::string("2026-01-01T12:00:00Z");
    return r;
}

void testReloadFromDisk() {
    const auto dir = testing::makeTempDir("ledger_reload");
    {
        auto ledger = core::PositionLedger::openJson(dir, nullptr);
        assert(ledger->openPosition(request("KXHIGHNY-1", Side::YES, 5, 30), Universe::REAL));
        assert(ledger->openPosition(request("KXHIGHNY-2", Side::NO, 2, 65), Universe::REAL));
        assert(ledger->closePosition("KXHIGHNY-1", 100, 3.5, Universe::REAL));
        assert(ledger->openPosition(request("KXBTC-1", Side::YES, 1, 10), Universe::SIMULATED));
    }
    assert(std::filesystem::exists(dir / "positions.json"));
    assert(std::filesystem::exists(dir / "simulated_positions.json"));
    assert(!std::filesystem::exists(dir / "positions.json.tmp"));

    auto reloaded = core::PositionLedger::openJson(dir, nullptr);
    auto closed = reloaded->getPosition("KXHIGHNY-1", Universe::REAL);
    assert(closed.has_value());
    assert(closed->status == PositionStatus::CLOSED);
    assert(closed->exit_price == 100);
    assert(std::abs(*closed->pnl - 3.5) < 1e-9);
    assert(closed->expected_settlement == std::string("2026-01-01T12:00:00Z"));

    auto open = reloaded->getPosition("KXHIGHNY-2", Universe::REAL);
    assert(open.has_value() && open->isOpen());
    assert(open->side == Side::NO);
    assert(open->entry_price == 65);
    assert(!open->pnl.has_value());

    assert(reloaded->hasOpenPosition("KXBTC-1", Universe::SIMULATED));
    assert(!reloaded->hasOpenPosition("KXBTC-1", Universe::REAL));

    std::filesystem::remove_all(dir);
}

void testFailedSaveRollsBack() {
    auto real = std::make_shared<testing::MemoryLedgerStore>();
    auto sim = std::make_shared<testing::MemoryLedgerStore>();
    core::PositionLedger ledger(real, sim, nullptr);

    assert(ledger.openPosition(request("ROLL-1", Side::YES, 2, 40), Universe::REAL));

    real->fail_saves = true;
    assert(!ledger.openPosition(request("ROLL-2", Side::YES, 1, 40), Universe::REAL));
    assert(!ledger.getPosition("ROLL-2", Universe::REAL).has_value());

    assert(!ledger.closePosition("ROLL-1", 100, 1.2, Universe::REAL));
    auto still_open = ledger.getPosition("ROLL-1", Universe::REAL);
    assert(still_open.has_value() && still_open->isOpen());
    assert(!still_open->pnl.has_value());

    assert(!ledger.cancelPosition("ROLL-1", Universe::REAL));
    assert(ledger.hasOpenPosition("ROLL-1", Universe::REAL));

    // Durable copy still holds only the first position
    assert(real->saved.size() == 1);
    assert(real->saved.at("ROLL-1").isOpen());
}

void testCorruptFileQuarantined() {
    const auto dir = testing::makeTempDir("ledger_corrupt");
    {
        std::ofstream out(dir / "positions.json");
        out << "{ \"BROKEN-1\": { \"side\": ";
    }

    auto ledger = core::PositionLedger::openJson(dir, nullptr);
    assert(ledger->getAllPositions(Universe::REAL).empty());
    assert(!std::filesystem::exists(dir / "positions.json"));

    bool quarantined = false;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().filename().string().rfind("positions.json.corrupted.", 0) == 0) {
            quarantined = true;
        }
    }
    assert(quarantined);

    // Ledger keeps working after quarantine
    assert(ledger->openPosition(request("FRESH-1", Side::YES, 1, 50), Universe::REAL));
    std::filesystem::remove_all(dir);
}

void testJournalTracksLifecycle() {
    const auto dir = testing::makeTempDir("ledger_journal");
    auto journal = std::make_shared<core::EventJournalJsonl>(dir / "journal.jsonl");
    auto ledger = core::PositionLedger::openJson(dir, nullptr, journal);

    assert(ledger->openPosition(request("J-1", Side::YES, 1, 50), Universe::REAL));
    assert(ledger->closePosition("J-1", 0, -0.5, Universe::REAL));

    const auto events = journal->readFrom(1);
    assert(events.size() == 2);
    assert(events[0].type == core::JournalEventType::POSITION_OPENED);
    assert(events[1].type == core::JournalEventType::POSITION_CLOSED);
    assert(events[1].ticker == "J-1");
    std::filesystem::remove_all(dir);
}

} // namespace

int main() {
    std::cout << "[TEST] Starting LedgerPersistence Test..." << std::endl;

    testReloadFromDisk();
    testFailedSaveRollsBack();
    testCorruptFileQuarantined();
    testJournalTracksLifecycle();

    std::cout << "[TEST] LedgerPersistence PASSED" << std::endl;
    return 0;
}
