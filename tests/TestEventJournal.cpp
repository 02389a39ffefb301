#include "core/state/EventJournalJsonl.h"
#include "support/TestSupport.h"

#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    const auto dir = kestrel::testing::makeTempDir("event_journal");
    const auto path = dir / "journal.jsonl";

    {
        kestrel::core::EventJournalJsonl journal(path);

        kestrel::core::JournalEvent first;
        first.ts_ms = 1000;
        first.type = kestrel::core::JournalEventType::ORDER_SUBMITTED;
        first.ticker = "KXHIGHNY-25JAN01-B45";
        first.entity_id = "order-1";
        first.payload["price"] = 30;

        kestrel::core::JournalEvent second;
        second.ts_ms = 2000;
        second.type = kestrel::core::JournalEventType::POSITION_OPENED;
        second.ticker = "KXHIGHNY-25JAN01-B45";
        second.entity_id = "EdgeScan";
        second.payload["contracts"] = 5;

        if (!journal.append(first)) {
            std::cerr << "[TEST] append(first) failed\n";
            return 1;
        }
        if (!journal.append(second)) {
            std::cerr << "[TEST] append(second) failed\n";
            return 1;
        }
        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }

        const auto rows = journal.readFrom(2);
        if (rows.size() != 1 || rows.front().type != kestrel::core::JournalEventType::POSITION_OPENED) {
            std::cerr << "[TEST] readFrom(2) should return only the second event\n";
            return 1;
        }
        if (rows.front().payload.value("contracts", 0) != 5) {
            std::cerr << "[TEST] payload lost\n";
            return 1;
        }
    }

    // Torn tail from a crash: ignored, seq continues from the last good line
    {
        std::ofstream out(path, std::ios::app);
        out << "{\"seq\": 3, \"type\": \"ORDER_QU";
    }
    {
        kestrel::core::EventJournalJsonl reopened(path);
        if (reopened.lastSeq() != 2) {
            std::cerr << "[TEST] reopened lastSeq should be 2, got " << reopened.lastSeq() << "\n";
            return 1;
        }
        if (reopened.readFrom(1).size() != 2) {
            std::cerr << "[TEST] torn line should be skipped\n";
            return 1;
        }
    }

    if (kestrel::core::EventJournalJsonl::fromString("RECONCILE_UNKNOWN")
        != kestrel::core::JournalEventType::RECONCILE_UNKNOWN) {
        std::cerr << "[TEST] fromString round trip failed\n";
        return 1;
    }
    if (kestrel::core::EventJournalJsonl::fromString("NOPE").has_value()) {
        std::cerr << "[TEST] unknown type should not parse\n";
        return 1;
    }

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] EventJournal PASSED\n";
    return 0;
}
