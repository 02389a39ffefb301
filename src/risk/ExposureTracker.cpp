#include "risk/ExposureTracker.h"

#include <algorithm>

#include "common/Logger.h"

namespace kestrel {
namespace risk {

ExposureTracker::ExposureTracker(double max_exposure_pct, std::shared_ptr<spdlog::logger> logger)
    : max_exposure_pct_(max_exposure_pct)
    , logger_(Logger::orSilent(std::move(logger))) {}

double ExposureTracker::reserve(double candidate_notional, double bankroll) {
    if (candidate_notional <= 0.0) {
        return 0.0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const double limit = max_exposure_pct_ * bankroll;
    const double room = std::max(0.0, limit - current_);

    const double granted = std::min(candidate_notional, room);
    if (granted < candidate_notional) {
        logger_->info("Exposure gate: requested ${:.2f}, headroom ${:.2f} (open ${:.2f} / limit ${:.2f})",
                      candidate_notional, room, current_, limit);
    }
    current_ += granted;
    return granted;
}

void ExposureTracker::release(double notional) {
    if (notional <= 0.0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::max(0.0, current_ - notional);
}

void ExposureTracker::rebuild(const std::vector<core::Position>& open_positions) {
    double total = 0.0;
    for (const auto& position : open_positions) {
        if (position.isOpen()) {
            total += position.notional();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    current_ = total;
    logger_->info("Exposure rebuilt: ${:.2f} across {} open positions", total, open_positions.size());
}

double ExposureTracker::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

double ExposureTracker::headroom(double bankroll) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::max(0.0, max_exposure_pct_ * bankroll - current_);
}

} // namespace risk
} // namespace kestrel
