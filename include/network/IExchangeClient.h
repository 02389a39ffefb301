#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Types.h"

namespace kestrel {
namespace network {

struct Market {
    std::string ticker;
    std::string event_ticker;
    std::string title;
    std::string status;
    Cents yes_bid = 0;
    Cents yes_ask = 0;
    Cents no_bid = 0;
    Cents no_ask = 0;
    Cents last_price = 0;
    long long volume = 0;
    std::string close_time;
};

struct MarketFilter {
    std::optional<std::string> series_ticker;
    std::string status = "open";
    int limit = 100;
};

struct OrderbookLevel {
    Cents price = 0;
    int size = 0;
};

struct Orderbook {
    std::vector<OrderbookLevel> yes;
    std::vector<OrderbookLevel> no;
};

struct OrderAck {
    bool success = false;
    std::optional<std::string> order_id;
    std::optional<std::string> error;
    int status_code = 0;
};

// Exchange-side holding; position > 0 is YES contracts, < 0 is NO
struct PositionRef {
    std::string ticker;
    int position = 0;
    double market_exposure = 0.0;
};

struct Balance {
    long long balance_cents = 0;

    double dollars() const { return balance_cents / 100.0; }
};

enum class SettlementStatus { ACTIVE, FINALIZED, SETTLED, UNKNOWN };

struct SettlementInfo {
    SettlementStatus status = SettlementStatus::UNKNOWN;
    // YES-side payout in cents; required for SETTLED
    std::optional<Cents> settlement_price;
};

inline std::string toString(SettlementStatus status) {
    switch (status) {
        case SettlementStatus::ACTIVE: return "ACTIVE";
        case SettlementStatus::FINALIZED: return "FINALIZED";
        case SettlementStatus::SETTLED: return "SETTLED";
        case SettlementStatus::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

// Transport, HTTP or parse failure from the exchange
class ExchangeError : public std::runtime_error {
public:
    explicit ExchangeError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    int statusCode() const { return status_code_; }

private:
    int status_code_;
};

// Synchronous exchange capability shared by every strategy thread.
// Implementations must be thread-safe and rate-limit themselves.
class IExchangeClient {
public:
    virtual ~IExchangeClient() = default;

    virtual std::vector<Market> getMarkets(const MarketFilter& filter) = 0;
    virtual Orderbook getOrderbook(const std::string& ticker) = 0;

    // Never throws; failures are reported in the ack
    virtual OrderAck placeOrder(const std::string& ticker, Side side, Cents price_cents, int count) = 0;

    virtual std::vector<PositionRef> getPositions() = 0;
    virtual Balance getBalance() = 0;
    virtual SettlementInfo getSettlement(const std::string& ticker) = 0;
};

} // namespace network
} // namespace kestrel
