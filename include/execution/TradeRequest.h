#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace kestrel {
namespace execution {

struct TradeRequest {
    std::string source;                 // followed trader or signal feed
    std::string ticker_selector;        // concrete ticker or series to resolve
    std::optional<std::string> ticker;  // filled once resolved
    Side side = Side::YES;
    Cents price = 0;
    int size = 0;                       // contracts
    std::string strategy;
    std::string market_title;
    std::optional<std::string> expected_settlement;

    // Exposure granted by the tracker for this request; released on failure
    double reserved_notional = 0.0;

    double notional() const { return size * price / 100.0; }
};

struct QueuedTrade {
    TradeRequest request;
    Timestamp queued_at;
    int retry_count = 0;
};

} // namespace execution
} // namespace kestrel
