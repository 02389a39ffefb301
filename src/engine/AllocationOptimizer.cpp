#include "engine/AllocationOptimizer.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>

#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace kestrel {
namespace engine {

AllocationOptimizer::AllocationOptimizer(std::shared_ptr<spdlog::logger> logger,
                                         std::shared_ptr<core::IEventJournal> journal,
                                         size_t max_history)
    : logger_(Logger::orSilent(std::move(logger)))
    , journal_(std::move(journal))
    , max_history_(std::max<size_t>(max_history, kWindow)) {}

void AllocationOptimizer::registerStrategy(const std::string& name, double initial_allocation) {
    std::lock_guard<std::mutex> lock(mutex_);
    allocations_[name] = initial_allocation;
    history_[name];
    logger_->info("Registered strategy {} (allocation {:.0f}%)", name, initial_allocation * 100.0);
}

void AllocationOptimizer::recordResult(const StrategyResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entries = history_[result.strategy_name];
    entries.push_back(result);
    if (entries.back().timestamp.empty()) {
        entries.back().timestamp = utils::TimeUtils::nowIso();
    }
    if (entries.size() > max_history_) {
        entries.erase(entries.begin(), entries.begin() + (entries.size() - max_history_));
    }
}

void AllocationOptimizer::normalizeBounded(std::map<std::string, double>& allocations, double lo, double hi) {
    const size_t n = allocations.size();
    if (n == 0) {
        return;
    }
    if (n == 1) {
        allocations.begin()->second = 1.0;
        return;
    }
    // Bounds cannot all hold; fall back to a plain normalization
    if (lo * n > 1.0 + 1e-12 || hi * n < 1.0 - 1e-12) {
        const double total = std::accumulate(allocations.begin(), allocations.end(), 0.0,
            [](double acc, const auto& kv) { return acc + std::max(0.0, kv.second); });
        for (auto& kv : allocations) {
            kv.second = total > 0.0 ? std::max(0.0, kv.second) / total : 1.0 / n;
        }
        return;
    }

    for (auto& kv : allocations) {
        kv.second = std::clamp(kv.second, lo, hi);
    }

    // Clamp-and-redistribute: pin values that leave the bounds, rescale the rest
    std::set<std::string> pinned;
    for (size_t iteration = 0; iteration <= n; ++iteration) {
        double pinned_sum = 0.0;
        double free_sum = 0.0;
        size_t free_count = 0;
        for (const auto& kv : allocations) {
            if (pinned.count(kv.first)) {
                pinned_sum += kv.second;
            } else {
                free_sum += kv.second;
                free_count++;
            }
        }
        if (free_count == 0) {
            break;
        }

        const double remaining = 1.0 - pinned_sum;
        bool violated = false;
        for (auto& kv : allocations) {
            if (pinned.count(kv.first)) {
                continue;
            }
            kv.second = free_sum > 0.0 ? kv.second * remaining / free_sum : remaining / free_count;
            if (kv.second < lo) {
                kv.second = lo;
                pinned.insert(kv.first);
                violated = true;
            } else if (kv.second > hi) {
                kv.second = hi;
                pinned.insert(kv.first);
                violated = true;
            }
        }
        if (!violated) {
            break;
        }
    }
}

std::map<std::string, double> AllocationOptimizer::optimize() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, double> scores;
    for (const auto& kv : history_) {
        const auto& entries = kv.second;
        if (entries.size() < kMinResults || !allocations_.count(kv.first)) {
            continue;
        }
        const size_t window = std::min(kWindow, entries.size());
        double pnl = 0.0;
        double win_rate = 0.0;
        for (auto it = entries.end() - static_cast<std::ptrdiff_t>(window); it != entries.end(); ++it) {
            pnl += it->profit_loss;
            win_rate += it->win_rate;
        }
        pnl /= window;
        win_rate /= window;
        scores[kv.first] = pnl * 0.7 + win_rate * 100.0 * 0.3;
    }

    if (scores.empty()) {
        return allocations_;
    }

    double min_score = scores.begin()->second;
    for (const auto& kv : scores) {
        min_score = std::min(min_score, kv.second);
    }
    const double shift = std::abs(min_score);

    double shifted_total = 0.0;
    for (const auto& kv : scores) {
        shifted_total += kv.second + shift;
    }

    const auto previous = allocations_;
    std::map<std::string, double> blended = allocations_;
    for (const auto& kv : scores) {
        const double weight = shifted_total > 0.0
            ? (kv.second + shift) / shifted_total
            : 1.0 / scores.size();
        blended[kv.first] = previous.at(kv.first) * kSmoothing + weight * (1.0 - kSmoothing);
    }

    normalizeBounded(blended);
    allocations_ = blended;

    for (const auto& kv : allocations_) {
        logger_->info("Allocation {}: {:.1f}% (was {:.1f}%)", kv.first, kv.second * 100.0,
                      previous.at(kv.first) * 100.0);
    }

    if (journal_) {
        core::JournalEvent event;
        event.type = core::JournalEventType::ALLOCATION_CHANGED;
        event.entity_id = "allocations";
        event.payload = allocations_;
        if (!journal_->append(event)) {
            logger_->warn("Journal append failed for allocation change");
        }
    }
    return allocations_;
}

std::map<std::string, double> AllocationOptimizer::allocations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocations_;
}

double AllocationOptimizer::allocation(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allocations_.find(name);
    return it == allocations_.end() ? 0.0 : it->second;
}

std::vector<StrategyResult> AllocationOptimizer::history(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(name);
    return it == history_.end() ? std::vector<StrategyResult>{} : it->second;
}

std::optional<std::string> AllocationOptimizer::bestStrategyLocked() const {
    std::optional<std::string> best;
    double best_pnl = 0.0;
    for (const auto& kv : history_) {
        if (kv.second.empty()) {
            continue;
        }
        double total = 0.0;
        for (const auto& result : kv.second) {
            total += result.profit_loss;
        }
        if (!best || total > best_pnl) {
            best = kv.first;
            best_pnl = total;
        }
    }
    return best;
}

std::optional<std::string> AllocationOptimizer::bestStrategy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bestStrategyLocked();
}

nlohmann::json AllocationOptimizer::exportResults() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json out;
    out["allocations"] = allocations_;

    nlohmann::json history = nlohmann::json::object();
    for (const auto& kv : history_) {
        nlohmann::json rows = nlohmann::json::array();
        for (const auto& r : kv.second) {
            rows.push_back({
                {"timestamp", r.timestamp},
                {"opportunities", r.opportunities_found},
                {"trades", r.trades_executed},
                {"pnl", r.profit_loss},
                {"win_rate", r.win_rate},
                {"runtime_seconds", r.runtime_seconds},
                {"errors", r.errors}
            });
        }
        history[kv.first] = rows;
    }
    out["performance_history"] = history;

    const auto best = bestStrategyLocked();
    out["best_strategy"] = best ? nlohmann::json(*best) : nlohmann::json(nullptr);
    return out;
}

} // namespace engine
} // namespace kestrel
