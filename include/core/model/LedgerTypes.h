#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace kestrel {
namespace core {

struct Position {
    std::string ticker;
    Side side = Side::YES;
    int contracts = 0;
    Cents entry_price = 0;          // 1..99
    std::string entry_time;         // ISO-8601 local time
    std::string strategy;
    bool simulated = false;
    std::string market_title;
    PositionStatus status = PositionStatus::OPEN;
    std::optional<std::string> expected_settlement;

    // Set exactly once, by close
    std::optional<Cents> exit_price;
    std::optional<std::string> exit_time;
    std::optional<Dollars> pnl;

    bool isOpen() const { return status == PositionStatus::OPEN; }
    Dollars notional() const { return contracts * entry_price / 100.0; }
};

// ticker -> position, one map per universe
using PositionMap = std::map<std::string, Position>;

struct PerformanceSummary {
    int trades = 0;                 // closed with a recorded pnl
    int winning_trades = 0;
    double win_rate = 0.0;
    Dollars total_pnl = 0.0;
    int open_count = 0;
    Dollars avg_pnl_per_trade = 0.0;
};

struct DailyPerformance {
    std::string date;               // YYYY-MM-DD
    std::string strategy;           // "all" when unfiltered
    int total_trades = 0;
    int unique_markets = 0;
    int closed_trades = 0;
    Dollars total_pnl = 0.0;
    std::vector<std::string> tickers;   // first 10
};

struct StrategyPerformance {
    PerformanceSummary real;
    PerformanceSummary simulated;
    int combined_trades = 0;
    Dollars combined_pnl = 0.0;
};

// Current quote for a held position as seen by its strategy
struct MarketSnapshot {
    std::optional<Cents> price;     // YES price; entry price assumed when absent
    double edge = 0.0;              // held side
};

enum class JournalEventType {
    POSITION_OPENED,
    POSITION_CLOSED,
    POSITION_CANCELLED,
    ORDER_SUBMITTED,
    ORDER_QUEUED,
    ORDER_DROPPED,
    RECONCILE_UNKNOWN,
    ALLOCATION_CHANGED
};

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::ORDER_SUBMITTED;
    std::string ticker;
    std::string entity_id;
    nlohmann::json payload;
};

} // namespace core
} // namespace kestrel
