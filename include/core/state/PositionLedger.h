#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/contracts/IEventJournal.h"
#include "core/contracts/ILedgerStore.h"
#include "core/model/LedgerTypes.h"

namespace kestrel {
namespace core {

struct OpenPositionRequest {
    std::string ticker;
    Side side = Side::YES;
    int contracts = 0;
    Cents entry_price = 0;
    std::string strategy;
    std::string market_title;
    std::optional<std::string> expected_settlement;
};

// Durable positions for the real and simulated universes. Each universe has
// its own lock covering check-and-mutate plus the save, so at most one open
// position per ticker exists per universe and memory always matches the
// last durable state.
class PositionLedger {
public:
    PositionLedger(std::shared_ptr<ILedgerStore> real_store,
                   std::shared_ptr<ILedgerStore> simulated_store,
                   std::shared_ptr<spdlog::logger> logger,
                   std::shared_ptr<IEventJournal> journal = nullptr);

    // positions.json / simulated_positions.json under data_dir
    static std::unique_ptr<PositionLedger> openJson(const std::filesystem::path& data_dir,
                                                    std::shared_ptr<spdlog::logger> logger,
                                                    std::shared_ptr<IEventJournal> journal = nullptr);

    void setTradeLogger(std::shared_ptr<spdlog::logger> trade_logger);

    bool hasOpenPosition(const std::string& ticker, Universe universe) const;

    // nullopt on duplicate (dedupe), invalid input or failed save
    std::optional<Position> openPosition(const OpenPositionRequest& request,
                                         Universe universe, bool dedupe = true);

    // nullopt if the ticker is unknown or the position is not open
    std::optional<Position> closePosition(const std::string& ticker, Cents exit_price,
                                          Dollars pnl, Universe universe);
    std::optional<Position> cancelPosition(const std::string& ticker, Universe universe);

    // Reserves a ticker while an exchange order for it is in flight. Fails if
    // the ticker is open or already claimed in that universe. Does not block
    // openPosition; the claimer records the fill before releasing.
    bool claimTicker(const std::string& ticker, Universe universe);
    void releaseClaim(const std::string& ticker, Universe universe);
    bool isClaimed(const std::string& ticker, Universe universe) const;

    std::optional<Position> getPosition(const std::string& ticker, Universe universe) const;
    std::vector<Position> getOpenPositions(const std::optional<std::string>& strategy,
                                           Universe universe) const;
    std::vector<Position> getAllPositions(Universe universe) const;

    PerformanceSummary getPerformance(const std::optional<std::string>& strategy,
                                      Universe universe) const;
    // date as YYYY-MM-DD; empty means today
    DailyPerformance getDailyPerformance(const std::optional<std::string>& strategy,
                                         Universe universe,
                                         const std::string& date = std::string()) const;
    std::map<std::string, StrategyPerformance> getAllPerformance() const;

    // Weekly reset of the simulated universe
    bool clearSimulated(bool backup = true);

    void logWeeklyReport() const;
    void logDailySummary(Universe universe) const;

private:
    struct UniverseState {
        std::shared_ptr<ILedgerStore> store;
        PositionMap positions;
        std::set<std::string> claims;
        mutable std::mutex mutex;
    };

    UniverseState& stateFor(Universe universe);
    const UniverseState& stateFor(Universe universe) const;

    void loadUniverse(UniverseState& state, Universe universe);
    bool persistLocked(UniverseState& state, Universe universe);
    void journal(JournalEventType type, const Position& position) const;

    static PerformanceSummary summarize(const PositionMap& positions,
                                        const std::optional<std::string>& strategy);

    UniverseState real_;
    UniverseState simulated_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    std::shared_ptr<IEventJournal> journal_;
};

} // namespace core
} // namespace kestrel
