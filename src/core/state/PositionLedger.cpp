#include "core/state/PositionLedger.h"

#include <algorithm>
#include <set>

#include "common/Logger.h"
#include "common/TimeUtils.h"
#include "core/state/LedgerStoreJson.h"

namespace kestrel {
namespace core {

namespace {
const char* tag(Universe universe) {
    return universe == Universe::SIMULATED ? "[SIMULATED]" : "[REAL]";
}
}

PositionLedger::PositionLedger(std::shared_ptr<ILedgerStore> real_store,
                               std::shared_ptr<ILedgerStore> simulated_store,
                               std::shared_ptr<spdlog::logger> logger,
                               std::shared_ptr<IEventJournal> journal)
    : logger_(Logger::orSilent(std::move(logger)))
    , journal_(std::move(journal)) {
    real_.store = std::move(real_store);
    simulated_.store = std::move(simulated_store);

    loadUniverse(real_, Universe::REAL);
    loadUniverse(simulated_, Universe::SIMULATED);
}

std::unique_ptr<PositionLedger> PositionLedger::openJson(const std::filesystem::path& data_dir,
                                                         std::shared_ptr<spdlog::logger> logger,
                                                         std::shared_ptr<IEventJournal> journal) {
    return std::make_unique<PositionLedger>(
        std::make_shared<LedgerStoreJson>(data_dir / "positions.json"),
        std::make_shared<LedgerStoreJson>(data_dir / "simulated_positions.json"),
        std::move(logger),
        std::move(journal)
    );
}

void PositionLedger::setTradeLogger(std::shared_ptr<spdlog::logger> trade_logger) {
    trade_logger_ = std::move(trade_logger);
}

PositionLedger::UniverseState& PositionLedger::stateFor(Universe universe) {
    return universe == Universe::SIMULATED ? simulated_ : real_;
}

const PositionLedger::UniverseState& PositionLedger::stateFor(Universe universe) const {
    return universe == Universe::SIMULATED ? simulated_ : real_;
}

void PositionLedger::loadUniverse(UniverseState& state, Universe universe) {
    std::lock_guard<std::mutex> lock(state.mutex);

    auto result = state.store->load();
    switch (result.status) {
        case StoreStatus::OK:
            state.positions = std::move(result.positions);
            logger_->info("Loaded {} {} positions from {}",
                          state.positions.size(), kestrel::toString(universe), state.store->location());
            break;
        case StoreStatus::MISSING:
            logger_->info("No {} ledger at {}, starting empty",
                          kestrel::toString(universe), state.store->location());
            break;
        case StoreStatus::CORRUPT:
            logger_->error("Corrupt {} ledger {} quarantined to '{}', starting empty",
                           kestrel::toString(universe), state.store->location(), result.quarantined_path);
            break;
        case StoreStatus::WRITE_FAILED:
            logger_->error("Unexpected store status while loading {}", state.store->location());
            break;
    }
}

bool PositionLedger::persistLocked(UniverseState& state, Universe universe) {
    const auto status = state.store->save(state.positions);
    if (status == StoreStatus::OK) {
        return true;
    }
    logger_->error("{} Failed to persist ledger {}", tag(universe), state.store->location());
    return false;
}

void PositionLedger::journal(JournalEventType type, const Position& position) const {
    if (!journal_) {
        return;
    }

    JournalEvent event;
    event.type = type;
    event.ticker = position.ticker;
    event.entity_id = position.strategy;
    event.payload = LedgerStoreJson::toJson(position);
    if (!journal_->append(event)) {
        logger_->warn("Journal append failed for {}", position.ticker);
    }
}

bool PositionLedger::hasOpenPosition(const std::string& ticker, Universe universe) const {
    const auto& state = stateFor(universe);
    std::lock_guard<std::mutex> lock(state.mutex);

    auto it = state.positions.find(ticker);
    return it != state.positions.end() && it->second.isOpen();
}

std::optional<Position> PositionLedger::openPosition(const OpenPositionRequest& request,
                                                     Universe universe, bool dedupe) {
    if (request.ticker.empty() || request.contracts <= 0 ||
        request.entry_price < 1 || request.entry_price > 99) {
        logger_->error("{} Rejected open for '{}': contracts={} entry_price={}c",
                       tag(universe), request.ticker, request.contracts, request.entry_price);
        return std::nullopt;
    }

    auto& state = stateFor(universe);
    Position opened;
    {
        std::lock_guard<std::mutex> lock(state.mutex);

        auto existing = state.positions.find(request.ticker);
        const bool already_open = existing != state.positions.end() && existing->second.isOpen();
        if (dedupe && already_open) {
            logger_->debug("{} Skipping {}: already have open position", tag(universe), request.ticker);
            return std::nullopt;
        }
        if (already_open) {
            logger_->warn("{} Replacing open position on {} without dedupe", tag(universe), request.ticker);
        }

        std::optional<Position> previous;
        if (existing != state.positions.end()) {
            previous = existing->second;
        }

        opened.ticker = request.ticker;
        opened.side = request.side;
        opened.contracts = request.contracts;
        opened.entry_price = request.entry_price;
        opened.entry_time = utils::TimeUtils::nowIso();
        opened.strategy = request.strategy;
        opened.simulated = universe == Universe::SIMULATED;
        opened.market_title = request.market_title;
        opened.expected_settlement = request.expected_settlement;

        state.positions[request.ticker] = opened;
        if (!persistLocked(state, universe)) {
            if (previous) {
                state.positions[request.ticker] = *previous;
            } else {
                state.positions.erase(request.ticker);
            }
            return std::nullopt;
        }
    }

    logger_->info("{} Opened {} {} x{} @ {}c ({})", tag(universe), opened.ticker,
                  kestrel::toString(opened.side), opened.contracts, opened.entry_price, opened.strategy);
    Logger::logTrade(trade_logger_, opened.ticker, kestrel::toString(opened.side), "OPEN",
                     opened.contracts, opened.entry_price, 0.0, opened.strategy, kestrel::toString(universe));
    journal(JournalEventType::POSITION_OPENED, opened);
    return opened;
}

std::optional<Position> PositionLedger::closePosition(const std::string& ticker, Cents exit_price,
                                                      Dollars pnl, Universe universe) {
    auto& state = stateFor(universe);
    Position closed;
    {
        std::lock_guard<std::mutex> lock(state.mutex);

        auto it = state.positions.find(ticker);
        if (it == state.positions.end()) {
            logger_->warn("{} Cannot close {}: position not found", tag(universe), ticker);
            return std::nullopt;
        }
        if (!it->second.isOpen()) {
            logger_->warn("{} Cannot close {}: position is {}", tag(universe), ticker,
                          kestrel::toString(it->second.status));
            return std::nullopt;
        }

        const Position previous = it->second;
        it->second.status = PositionStatus::CLOSED;
        it->second.exit_price = exit_price;
        it->second.exit_time = utils::TimeUtils::nowIso();
        it->second.pnl = pnl;
        closed = it->second;

        if (!persistLocked(state, universe)) {
            it->second = previous;
            return std::nullopt;
        }
    }

    logger_->info("{} Closed {} @ {}c, P&L: ${:+.2f}", tag(universe), ticker, exit_price, pnl);
    Logger::logTrade(trade_logger_, closed.ticker, kestrel::toString(closed.side), "CLOSE",
                     closed.contracts, exit_price, pnl, closed.strategy, kestrel::toString(universe));
    journal(JournalEventType::POSITION_CLOSED, closed);
    return closed;
}

std::optional<Position> PositionLedger::cancelPosition(const std::string& ticker, Universe universe) {
    auto& state = stateFor(universe);
    Position cancelled;
    {
        std::lock_guard<std::mutex> lock(state.mutex);

        auto it = state.positions.find(ticker);
        if (it == state.positions.end() || !it->second.isOpen()) {
            logger_->warn("{} Cannot cancel {}: no open position", tag(universe), ticker);
            return std::nullopt;
        }

        const Position previous = it->second;
        it->second.status = PositionStatus::CANCELLED;
        it->second.exit_time = utils::TimeUtils::nowIso();
        cancelled = it->second;

        if (!persistLocked(state, universe)) {
            it->second = previous;
            return std::nullopt;
        }
    }

    logger_->info("{} Cancelled {}", tag(universe), ticker);
    journal(JournalEventType::POSITION_CANCELLED, cancelled);
    return cancelled;
}

bool PositionLedger::claimTicker(const std::string& ticker, Universe universe) {
    auto& state = stateFor(universe);
    std::lock_guard<std::mutex> lock(state.mutex);

    auto it = state.positions.find(ticker);
    if (it != state.positions.end() && it->second.isOpen()) {
        return false;
    }
    if (!state.claims.insert(ticker).second) {
        logger_->debug("{} {} already has an order in flight", tag(universe), ticker);
        return false;
    }
    return true;
}

void PositionLedger::releaseClaim(const std::string& ticker, Universe universe) {
    auto& state = stateFor(universe);
    std::lock_guard<std::mutex> lock(state.mutex);
    state.claims.erase(ticker);
}

bool PositionLedger::isClaimed(const std::string& ticker, Universe universe) const {
    const auto& state = stateFor(universe);
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.claims.count(ticker) > 0;
}

std::optional<Position> PositionLedger::getPosition(const std::string& ticker, Universe universe) const {
    const auto& state = stateFor(universe);
    std::lock_guard<std::mutex> lock(state.mutex);

    auto it = state.positions.find(ticker);
    if (it == state.positions.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Position> PositionLedger::getOpenPositions(const std::optional<std::string>& strategy,
                                                       Universe universe) const {
    const auto& state = stateFor(universe);
    std::lock_guard<std::mutex> lock(state.mutex);

    std::vector<Position> out;
    for (const auto& [ticker, position] : state.positions) {
        if (!position.isOpen()) {
            continue;
        }
        if (strategy && position.strategy != *strategy) {
            continue;
        }
        out.push_back(position);
    }
    return out;
}

std::vector<Position> PositionLedger::getAllPositions(Universe universe) const {
    const auto& state = stateFor(universe);
    std::lock_guard<std::mutex> lock(state.mutex);

    std::vector<Position> out;
    out.reserve(state.positions.size());
    for (const auto& [ticker, position] : state.positions) {
        out.push_back(position);
    }
    return out;
}

PerformanceSummary PositionLedger::summarize(const PositionMap& positions,
                                             const std::optional<std::string>& strategy) {
    PerformanceSummary summary;
    for (const auto& [ticker, position] : positions) {
        if (strategy && position.strategy != *strategy) {
            continue;
        }
        if (position.isOpen()) {
            summary.open_count++;
            continue;
        }
        if (position.status == PositionStatus::CLOSED && position.pnl.has_value()) {
            summary.trades++;
            summary.total_pnl += *position.pnl;
            if (*position.pnl > 0.0) {
                summary.winning_trades++;
            }
        }
    }

    if (summary.trades > 0) {
        summary.win_rate = static_cast<double>(summary.winning_trades) / summary.trades;
        summary.avg_pnl_per_trade = summary.total_pnl / summary.trades;
    }
    return summary;
}

PerformanceSummary PositionLedger::getPerformance(const std::optional<std::string>& strategy,
                                                  Universe universe) const {
    const auto& state = stateFor(universe);
    std::lock_guard<std::mutex> lock(state.mutex);
    return summarize(state.positions, strategy);
}

DailyPerformance PositionLedger::getDailyPerformance(const std::optional<std::string>& strategy,
                                                     Universe universe,
                                                     const std::string& date) const {
    DailyPerformance daily;
    daily.date = date.empty()
        ? utils::TimeUtils::format(std::chrono::system_clock::now(), "%Y-%m-%d")
        : date;
    daily.strategy = strategy.value_or("all");

    const auto& state = stateFor(universe);
    std::lock_guard<std::mutex> lock(state.mutex);

    std::set<std::string> unique_tickers;
    for (const auto& [ticker, position] : state.positions) {
        if (position.entry_time.compare(0, daily.date.size(), daily.date) != 0) {
            continue;
        }
        if (strategy && position.strategy != *strategy) {
            continue;
        }

        daily.total_trades++;
        unique_tickers.insert(position.ticker);
        if (position.status == PositionStatus::CLOSED && position.pnl.has_value()) {
            daily.closed_trades++;
            daily.total_pnl += *position.pnl;
        }
    }

    daily.unique_markets = static_cast<int>(unique_tickers.size());
    for (const auto& ticker : unique_tickers) {
        if (daily.tickers.size() >= 10) {
            break;
        }
        daily.tickers.push_back(ticker);
    }
    return daily;
}

std::map<std::string, StrategyPerformance> PositionLedger::getAllPerformance() const {
    std::set<std::string> strategies;
    for (const auto& position : getAllPositions(Universe::REAL)) {
        strategies.insert(position.strategy);
    }
    for (const auto& position : getAllPositions(Universe::SIMULATED)) {
        strategies.insert(position.strategy);
    }

    std::map<std::string, StrategyPerformance> out;
    for (const auto& strategy : strategies) {
        StrategyPerformance perf;
        perf.real = getPerformance(strategy, Universe::REAL);
        perf.simulated = getPerformance(strategy, Universe::SIMULATED);
        perf.combined_trades = perf.real.trades + perf.simulated.trades;
        perf.combined_pnl = perf.real.total_pnl + perf.simulated.total_pnl;
        out[strategy] = perf;
    }
    return out;
}

bool PositionLedger::clearSimulated(bool backup) {
    auto& state = simulated_;
    std::lock_guard<std::mutex> lock(state.mutex);

    if (backup && !state.positions.empty()) {
        std::string written;
        const auto stamp = utils::TimeUtils::format(std::chrono::system_clock::now(), "%Y%m%d");
        if (state.store->backup(state.positions, stamp, &written) == StoreStatus::OK) {
            logger_->info("Backed up {} simulated positions to {}", state.positions.size(), written);
        } else {
            logger_->error("Failed to back up simulated positions, keeping them");
            return false;
        }
    }

    PositionMap previous;
    previous.swap(state.positions);
    if (!persistLocked(state, Universe::SIMULATED)) {
        state.positions.swap(previous);
        return false;
    }

    logger_->info("Cleared {} simulated positions", previous.size());
    return true;
}

void PositionLedger::logWeeklyReport() const {
    const auto all_perf = getAllPerformance();

    std::vector<std::pair<std::string, StrategyPerformance>> ranked(all_perf.begin(), all_perf.end());
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        return a.second.combined_pnl > b.second.combined_pnl;
    });

    logger_->info("{}", std::string(70, '='));
    logger_->info("WEEKLY STRATEGY RESULTS");
    logger_->info("{}", std::string(70, '='));
    logger_->info("{:<20} {:<10} {:<8} {:<8} {:<12}", "Strategy", "Type", "Trades", "Win%", "P&L");
    logger_->info("{}", std::string(70, '-'));

    for (const auto& [strategy, perf] : ranked) {
        if (perf.real.trades > 0) {
            logger_->info("{:<20} {:<10} {:<8} {:>6.1f}%  ${:>+8.2f}", strategy, "REAL",
                          perf.real.trades, perf.real.win_rate * 100.0, perf.real.total_pnl);
        }
        if (perf.simulated.trades > 0) {
            logger_->info("{:<20} {:<10} {:<8} {:>6.1f}%  ${:>+8.2f}", "", "SIM",
                          perf.simulated.trades, perf.simulated.win_rate * 100.0, perf.simulated.total_pnl);
        }
        logger_->info("{}", std::string(70, '-'));
    }

    // Only real money decides the winner
    const std::pair<std::string, StrategyPerformance>* winner = nullptr;
    const std::pair<std::string, StrategyPerformance>* best_sim = nullptr;
    for (const auto& entry : ranked) {
        if (entry.second.real.trades > 0 &&
            (!winner || entry.second.real.total_pnl > winner->second.real.total_pnl)) {
            winner = &entry;
        }
        if (entry.second.simulated.trades > 0 &&
            (!best_sim || entry.second.simulated.total_pnl > best_sim->second.simulated.total_pnl)) {
            best_sim = &entry;
        }
    }

    if (winner) {
        logger_->info("WINNER (real money): {} with ${:+.2f}", winner->first, winner->second.real.total_pnl);
    }
    if (best_sim) {
        logger_->info("BEST SIMULATED: {} with ${:+.2f}", best_sim->first, best_sim->second.simulated.total_pnl);
    }
    logger_->info("{}", std::string(70, '='));
}

void PositionLedger::logDailySummary(Universe universe) const {
    const auto perf = getDailyPerformance(std::nullopt, universe);

    logger_->info("{}", std::string(60, '='));
    logger_->info("DAILY SUMMARY - {} ({})", perf.date, kestrel::toString(universe));
    logger_->info("Total trades: {} | unique markets: {} | closed: {} | P&L: ${:+.2f}",
                  perf.total_trades, perf.unique_markets, perf.closed_trades, perf.total_pnl);
    if (!perf.tickers.empty()) {
        std::string joined;
        for (size_t i = 0; i < perf.tickers.size() && i < 5; ++i) {
            if (!joined.empty()) joined += ", ";
            joined += perf.tickers[i];
        }
        logger_->info("Markets: {}{}", joined,
                      perf.tickers.size() > 5 ? fmt::format(" ... and {} more", perf.tickers.size() - 5) : "");
    }
    logger_->info("{}", std::string(60, '='));
}

} // namespace core
} // namespace kestrel
