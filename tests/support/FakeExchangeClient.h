#pragma once

#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "network/IExchangeClient.h"

namespace kestrel {
namespace testing {

struct PlacedOrder {
    std::string ticker;
    Side side = Side::YES;
    Cents price = 0;
    int count = 0;
};

// Scripted exchange: markets per series, orderbooks, queued order acks,
// holdings and settlement payloads. Every call is counted.
class FakeExchangeClient : public network::IExchangeClient {
public:
    std::vector<network::Market> getMarkets(const network::MarketFilter& filter) override {
        std::lock_guard<std::mutex> lock(mutex);
        market_calls++;
        if (fail_markets) {
            throw network::ExchangeError("markets unavailable", 503);
        }
        auto it = markets.find(filter.series_ticker.value_or(std::string()));
        return it == markets.end() ? std::vector<network::Market>{} : it->second;
    }

    network::Orderbook getOrderbook(const std::string& ticker) override {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = orderbooks.find(ticker);
        return it == orderbooks.end() ? network::Orderbook{} : it->second;
    }

    network::OrderAck placeOrder(const std::string& ticker, Side side, Cents price_cents, int count) override {
        if (place_delay.count() > 0) {
            std::this_thread::sleep_for(place_delay);
        }
        std::lock_guard<std::mutex> lock(mutex);
        orders.push_back({ticker, side, price_cents, count});
        if (acks.empty()) {
            network::OrderAck ack;
            ack.success = true;
            ack.status_code = 201;
            ack.order_id = "order-" + std::to_string(orders.size());
            return ack;
        }
        auto ack = acks.front();
        acks.pop_front();
        return ack;
    }

    std::vector<network::PositionRef> getPositions() override {
        std::lock_guard<std::mutex> lock(mutex);
        position_calls++;
        if (fail_positions) {
            throw network::ExchangeError("positions unavailable", 500);
        }
        return positions;
    }

    network::Balance getBalance() override {
        std::lock_guard<std::mutex> lock(mutex);
        return balance;
    }

    network::SettlementInfo getSettlement(const std::string& ticker) override {
        std::lock_guard<std::mutex> lock(mutex);
        settlement_calls++;
        auto it = settlements.find(ticker);
        if (it == settlements.end()) {
            return network::SettlementInfo{};
        }
        return it->second;
    }

    void queueFailure(const std::string& error, int status_code) {
        network::OrderAck ack;
        ack.success = false;
        ack.error = error;
        ack.status_code = status_code;
        std::lock_guard<std::mutex> lock(mutex);
        acks.push_back(ack);
    }

    size_t orderCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return orders.size();
    }

    std::mutex mutex;
    std::map<std::string, std::vector<network::Market>> markets;   // by series
    std::map<std::string, network::Orderbook> orderbooks;
    std::deque<network::OrderAck> acks;
    std::vector<PlacedOrder> orders;
    std::vector<network::PositionRef> positions;
    std::map<std::string, network::SettlementInfo> settlements;
    network::Balance balance{10000};
    bool fail_markets = false;
    bool fail_positions = false;
    std::chrono::milliseconds place_delay{0};    // simulated round trip, set before use
    int market_calls = 0;
    int position_calls = 0;
    int settlement_calls = 0;
};

inline network::Market makeMarket(const std::string& ticker, Cents yes_ask, Cents no_ask,
                                  const std::string& close_time = "2026-01-01T12:00:00Z") {
    network::Market market;
    market.ticker = ticker;
    market.event_ticker = ticker.substr(0, ticker.rfind('-'));
    market.title = ticker;
    market.status = "open";
    market.yes_ask = yes_ask;
    market.no_ask = no_ask;
    market.close_time = close_time;
    return market;
}

} // namespace testing
} // namespace kestrel
