#pragma once

#include <string>

#include "core/model/LedgerTypes.h"

namespace kestrel {
namespace core {

enum class StoreStatus {
    OK,
    MISSING,        // nothing persisted yet
    CORRUPT,        // unreadable; quarantined
    WRITE_FAILED
};

struct LedgerLoadResult {
    StoreStatus status = StoreStatus::MISSING;
    PositionMap positions;
    std::string quarantined_path;
};

// Durable storage for one ledger universe. save() replaces the whole map.
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    virtual LedgerLoadResult load() = 0;
    virtual StoreStatus save(const PositionMap& positions) = 0;

    // Dated side copy (weekly reset backup); returns the written location
    virtual StoreStatus backup(const PositionMap& positions, const std::string& tag,
                               std::string* written_path) = 0;

    virtual std::string location() const = 0;
};

} // namespace core
} // namespace kestrel
