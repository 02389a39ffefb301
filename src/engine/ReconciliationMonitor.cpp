#include "engine/ReconciliationMonitor.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

#include <fmt/format.h>

#include "common/Logger.h"

namespace kestrel {
namespace engine {

std::string toString(Recommendation recommendation) {
    switch (recommendation) {
        case Recommendation::HOLD: return "HOLD";
        case Recommendation::WATCH: return "WATCH";
        case Recommendation::HEDGE: return "HEDGE";
        case Recommendation::EXIT: return "EXIT";
        case Recommendation::SETTLED: return "SETTLED";
    }
    return "WATCH";
}

ReconciliationMonitor::ReconciliationMonitor(std::shared_ptr<network::IExchangeClient> exchange,
                                             std::shared_ptr<core::PositionLedger> ledger,
                                             MonitorConfig config,
                                             std::shared_ptr<spdlog::logger> logger,
                                             std::shared_ptr<core::IEventJournal> journal,
                                             std::shared_ptr<risk::RiskSizer> risk,
                                             std::shared_ptr<risk::ExposureTracker> exposure)
    : exchange_(std::move(exchange))
    , ledger_(std::move(ledger))
    , config_(config)
    , logger_(Logger::orSilent(std::move(logger)))
    , journal_(std::move(journal))
    , risk_(std::move(risk))
    , exposure_(std::move(exposure)) {
    if (!exchange_ || !ledger_) {
        throw std::invalid_argument("reconciliation monitor needs exchange and ledger");
    }
}

Dollars ReconciliationMonitor::settlementPnl(const core::Position& position, Cents yes_settlement) {
    const Cents held = position.side == Side::YES ? yes_settlement : 100 - yes_settlement;
    return (held - position.entry_price) * position.contracts / 100.0;
}

SyncReport ReconciliationMonitor::syncWithExchange(const std::string& strategy, Universe universe) {
    SyncReport report;

    std::set<std::string> on_exchange;
    if (universe == Universe::REAL) {
        try {
            for (const auto& ref : exchange_->getPositions()) {
                if (ref.position != 0) {
                    on_exchange.insert(ref.ticker);
                }
            }
        } catch (const network::ExchangeError& e) {
            logger_->error("[{}] Position fetch failed, skipping reconciliation: {}", strategy, e.what());
            report.aborted = true;
            return report;
        }
    }

    for (const auto& position : ledger_->getOpenPositions(strategy, universe)) {
        if (on_exchange.count(position.ticker)) {
            report.still_open++;
            continue;
        }
        report.checked++;

        network::SettlementInfo info;
        try {
            info = exchange_->getSettlement(position.ticker);
        } catch (const network::ExchangeError& e) {
            logger_->warn("[{}] Settlement lookup for {} failed: {}", strategy, position.ticker, e.what());
            info.status = network::SettlementStatus::UNKNOWN;
        }

        switch (info.status) {
            case network::SettlementStatus::SETTLED: {
                if (!info.settlement_price) {
                    // SETTLED without a payload is not actionable
                    report.unknown++;
                    journalUnknown(position, info);
                    break;
                }
                const Cents yes_value = *info.settlement_price;
                const Cents exit_price = position.side == Side::YES ? yes_value : 100 - yes_value;
                const Dollars pnl = settlementPnl(position, yes_value);
                if (ledger_->closePosition(position.ticker, exit_price, pnl, universe)) {
                    report.settled++;
                    report.realized_pnl += pnl;
                    logger_->info("[{}] {} settled at {}c ({} {}): pnl ${:+.2f}", strategy, position.ticker,
                                  yes_value, kestrel::toString(position.side), position.contracts, pnl);
                    if (exposure_) {
                        exposure_->release(position.notional());
                    }
                    if (risk_) {
                        risk_->recordResult(pnl);
                    }
                } else {
                    logger_->error("[{}] {} settled but ledger close failed", strategy, position.ticker);
                }
                break;
            }
            case network::SettlementStatus::FINALIZED:
                report.finalized++;
                logger_->info("[{}] {} finalized, settlement not yet published", strategy, position.ticker);
                break;
            case network::SettlementStatus::ACTIVE:
                if (universe == Universe::REAL) {
                    // Live market but no exchange position: unfilled, cancelled or closed elsewhere
                    report.unknown++;
                    journalUnknown(position, info);
                    break;
                }
                report.still_open++;
                break;
            case network::SettlementStatus::UNKNOWN:
                report.unknown++;
                journalUnknown(position, info);
                break;
        }
    }

    if (report.checked > 0) {
        logger_->info("[{}] Reconciled {}: checked={} settled={} finalized={} unknown={} open={}",
                      strategy, kestrel::toString(universe), report.checked, report.settled,
                      report.finalized, report.unknown, report.still_open);
    }
    return report;
}

void ReconciliationMonitor::journalUnknown(const core::Position& position,
                                           const network::SettlementInfo& info) const {
    logger_->warn("{} ({}) missing from exchange with no settlement; needs manual review",
                  position.ticker, position.strategy);
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.type = core::JournalEventType::RECONCILE_UNKNOWN;
    event.ticker = position.ticker;
    event.entity_id = position.strategy;
    event.payload = {
        {"status", network::toString(info.status)},
        {"side", kestrel::toString(position.side)},
        {"contracts", position.contracts},
        {"simulated", position.simulated}
    };
    if (!journal_->append(event)) {
        logger_->warn("Journal append failed for {}", position.ticker);
    }
}

Recommendation ReconciliationMonitor::recommend(double edge, double pnl_pct) const {
    if (pnl_pct < config_.stop_loss_pct || pnl_pct > config_.take_profit_pct) {
        return Recommendation::EXIT;
    }
    if (edge < config_.edge_threshold && std::abs(pnl_pct) > 0.10) {
        return Recommendation::HEDGE;
    }
    if (edge > 0.15) {
        return Recommendation::HOLD;
    }
    return Recommendation::WATCH;
}

std::optional<PositionAssessment> ReconciliationMonitor::analyzePosition(const core::Position& position,
                                                                         const MarketDataFn& market_data) const {
    PositionAssessment assessment;
    assessment.ticker = position.ticker;
    assessment.side = position.side;
    assessment.entry_price = position.entry_price;

    if (!position.isOpen()) {
        assessment.current_price = position.exit_price;
        assessment.recommendation = Recommendation::SETTLED;
        return assessment;
    }
    if (!market_data || position.entry_price <= 0) {
        return std::nullopt;
    }

    std::optional<core::MarketSnapshot> snapshot;
    try {
        snapshot = market_data(position);
    } catch (const std::exception& e) {
        logger_->error("Market data for {} failed: {}", position.ticker, e.what());
        return std::nullopt;
    }
    if (!snapshot) {
        return std::nullopt;
    }

    const double entry = position.entry_price;
    const double price = snapshot->price.value_or(position.entry_price);
    assessment.current_price = static_cast<Cents>(price);
    assessment.current_edge = snapshot->edge;
    assessment.pnl_pct = position.side == Side::YES ? (price - entry) / entry : (entry - price) / entry;
    assessment.recommendation = recommend(assessment.current_edge, assessment.pnl_pct);

    const auto message = fmt::format("{}: {} | P&L {:+.1f}% | edge {:.1f}% | {}",
                                     position.ticker, kestrel::toString(position.side),
                                     assessment.pnl_pct * 100.0, assessment.current_edge * 100.0,
                                     toString(assessment.recommendation));
    switch (assessment.recommendation) {
        case Recommendation::EXIT: logger_->error("EXIT signal {}", message); break;
        case Recommendation::HEDGE: logger_->warn("Hedge opportunity {}", message); break;
        default: logger_->info("Position {}", message); break;
    }
    return assessment;
}

std::vector<PositionAssessment> ReconciliationMonitor::checkAllPositions(const std::string& strategy,
                                                                         Universe universe,
                                                                         const MarketDataFn& market_data) const {
    std::vector<PositionAssessment> assessments;
    for (const auto& position : ledger_->getOpenPositions(strategy, universe)) {
        if (auto assessment = analyzePosition(position, market_data)) {
            assessments.push_back(*assessment);
        }
    }
    return assessments;
}

int ReconciliationMonitor::hedgeSize(const PositionAssessment& assessment) const {
    const int base = config_.hedge_base_size;
    if (assessment.pnl_pct > 0.30) {
        return base;
    }
    if (assessment.pnl_pct > 0.10) {
        return std::max(1, base / 2);
    }
    return 1;
}

std::vector<HedgeRecommendation> ReconciliationMonitor::generateHedgeRecommendations(
    const std::vector<PositionAssessment>& assessments) const {
    std::vector<HedgeRecommendation> hedges;
    for (const auto& assessment : assessments) {
        if (assessment.recommendation != Recommendation::HEDGE) {
            continue;
        }
        HedgeRecommendation hedge;
        hedge.ticker = assessment.ticker;
        hedge.original_side = assessment.side;
        hedge.hedge_side = oppositeSide(assessment.side);
        hedge.hedge_size = hedgeSize(assessment);
        hedge.reason = fmt::format("Edge dropped to {:.1f}%, P&L at {:+.1f}%",
                                   assessment.current_edge * 100.0, assessment.pnl_pct * 100.0);
        hedges.push_back(hedge);
    }
    return hedges;
}

PositionSummary ReconciliationMonitor::positionSummary(const std::string& strategy, Universe universe) const {
    PositionSummary summary;
    const auto positions = ledger_->getOpenPositions(strategy, universe);
    if (positions.empty()) {
        return summary;
    }
    double entry_total = 0.0;
    for (const auto& position : positions) {
        summary.total_pnl += position.pnl.value_or(0.0);
        entry_total += position.entry_price;
        summary.tickers.push_back(position.ticker);
    }
    summary.count = static_cast<int>(positions.size());
    summary.avg_entry_price = entry_total / positions.size();
    return summary;
}

} // namespace engine
} // namespace kestrel
