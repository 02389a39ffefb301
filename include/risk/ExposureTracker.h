#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/model/LedgerTypes.h"

namespace kestrel {
namespace risk {

// Shared open-notional counter. Check and reservation happen under one lock
// so concurrent strategies cannot both pass the same headroom.
class ExposureTracker {
public:
    explicit ExposureTracker(double max_exposure_pct,
                             std::shared_ptr<spdlog::logger> logger = nullptr);

    // Returns the granted notional: the candidate, the remaining headroom, or 0
    double reserve(double candidate_notional, double bankroll);
    void release(double notional);

    // Startup: recompute from the ledger's open positions
    void rebuild(const std::vector<core::Position>& open_positions);

    double current() const;
    double headroom(double bankroll) const;
    double maxExposurePct() const { return max_exposure_pct_; }

private:
    const double max_exposure_pct_;
    mutable std::mutex mutex_;
    double current_ = 0.0;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace risk
} // namespace kestrel
