#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/contracts/IEventJournal.h"
#include "core/state/PositionLedger.h"
#include "engine/EngineConfig.h"
#include "network/IExchangeClient.h"
#include "risk/ExposureTracker.h"
#include "risk/RiskSizer.h"

namespace kestrel {
namespace engine {

enum class Recommendation { HOLD, WATCH, HEDGE, EXIT, SETTLED };

std::string toString(Recommendation recommendation);

struct SyncReport {
    int checked = 0;        // open tickers absent from the exchange
    int settled = 0;
    int finalized = 0;
    int unknown = 0;
    int still_open = 0;     // present on the exchange or still active
    bool aborted = false;   // exchange positions could not be fetched
    Dollars realized_pnl = 0.0;
};

struct PositionAssessment {
    std::string ticker;
    Side side = Side::YES;
    Cents entry_price = 0;
    std::optional<Cents> current_price;
    double current_edge = 0.0;
    double pnl_pct = 0.0;
    Recommendation recommendation = Recommendation::WATCH;
};

struct HedgeRecommendation {
    std::string ticker;
    Side original_side = Side::YES;
    Side hedge_side = Side::NO;
    int hedge_size = 1;
    std::string reason;
};

struct PositionSummary {
    int count = 0;
    Dollars total_pnl = 0.0;
    double avg_entry_price = 0.0;
    std::vector<std::string> tickers;
};

// Diffs the ledger against exchange truth and closes positions only on an
// explicit settlement payload. Also produces exit / hedge recommendations.
class ReconciliationMonitor {
public:
    using MarketDataFn = std::function<std::optional<core::MarketSnapshot>(const core::Position&)>;

    ReconciliationMonitor(std::shared_ptr<network::IExchangeClient> exchange,
                          std::shared_ptr<core::PositionLedger> ledger,
                          MonitorConfig config = {},
                          std::shared_ptr<spdlog::logger> logger = nullptr,
                          std::shared_ptr<core::IEventJournal> journal = nullptr,
                          std::shared_ptr<risk::RiskSizer> risk = nullptr,
                          std::shared_ptr<risk::ExposureTracker> exposure = nullptr);

    // The simulated universe has no exchange-side holdings, so every open
    // position there is checked for settlement.
    SyncReport syncWithExchange(const std::string& strategy, Universe universe);

    std::optional<PositionAssessment> analyzePosition(const core::Position& position,
                                                      const MarketDataFn& market_data) const;
    std::vector<PositionAssessment> checkAllPositions(const std::string& strategy,
                                                      Universe universe,
                                                      const MarketDataFn& market_data) const;
    std::vector<HedgeRecommendation> generateHedgeRecommendations(
        const std::vector<PositionAssessment>& assessments) const;
    PositionSummary positionSummary(const std::string& strategy, Universe universe) const;

    // Held-side pnl in dollars for a YES-side settlement value
    static Dollars settlementPnl(const core::Position& position, Cents yes_settlement);

    const MonitorConfig& config() const { return config_; }

private:
    Recommendation recommend(double edge, double pnl_pct) const;
    int hedgeSize(const PositionAssessment& assessment) const;
    void journalUnknown(const core::Position& position, const network::SettlementInfo& info) const;

    std::shared_ptr<network::IExchangeClient> exchange_;
    std::shared_ptr<core::PositionLedger> ledger_;
    MonitorConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<core::IEventJournal> journal_;
    std::shared_ptr<risk::RiskSizer> risk_;
    std::shared_ptr<risk::ExposureTracker> exposure_;
};

} // namespace engine
} // namespace kestrel
