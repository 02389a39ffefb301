#include "execution/RetryQueue.h"
#include "support/TestSupport.h"

#include <cassert>
#include <iostream>

using namespace kestrel;

namespace {

struct ManualClock {
    Timestamp now = std::chrono::system_clock::now();
};

struct Fixture {
    std::shared_ptr<testing::MemoryLedgerStore> real = std::make_shared<testing::MemoryLedgerStore>();
    std::shared_ptr<core::PositionLedger> ledger = std::make_shared<core::PositionLedger>(
        real, std::make_shared<testing::MemoryLedgerStore>(), nullptr);
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    execution::RetryQueue queue;

    explicit Fixture(execution::RetryQueueConfig config = {})
        : queue(ledger, Universe::REAL, config, nullptr, nullptr,
                [c = clock]() { return c->now; }) {}
};

execution::TradeRequest trade(const std::string& selector, Side side = Side::YES) {
    execution::TradeRequest request;
    request.source = "whale";
    request.ticker_selector = selector;
    request.side = side;
    request.price = 42;
    request.size = 3;
    request.strategy = "Follow";
    return request;
}

network::OrderAck failure(const std::string& error, int status_code) {
    network::OrderAck ack;
    ack.error = error;
    ack.status_code = status_code;
    return ack;
}

network::OrderAck success() {
    network::OrderAck ack;
    ack.success = true;
    ack.order_id = "order-9";
    ack.status_code = 201;
    return ack;
}

void testExpiredDroppedWithoutAttempt() {
    Fixture f;
    execution::QueuedTrade stale;
    stale.request = trade("KXBTC15M-26JAN011200");
    stale.queued_at = f.clock->now - std::chrono::seconds(700);
    f.queue.enqueue(stale);

    int attempts = 0;
    auto result = f.queue.processQueue([&attempts](const execution::TradeRequest&) {
        attempts++;
        return success();
    });
    assert(attempts == 0);
    assert(result.attempted == 0);
    assert(result.dropped.size() == 1);
    assert(f.queue.size() == 0);
    assert(!f.ledger->hasOpenPosition("KXBTC15M-26JAN011200", Universe::REAL));
}

void testRetriesExhausted() {
    execution::RetryQueueConfig config;
    config.max_retries = 2;
    Fixture f(config);
    f.queue.enqueue(trade("KXBTC15M-26JAN011200"));

    auto transient = [](const execution::TradeRequest&) { return failure("market closed", 400); };
    auto first = f.queue.processQueue(transient);
    assert(first.attempted == 1 && first.kept == 1);
    auto second = f.queue.processQueue(transient);
    assert(second.attempted == 1 && second.kept == 1);
    assert(f.queue.snapshot().front().retry_count == 2);

    int attempts = 0;
    auto third = f.queue.processQueue([&attempts](const execution::TradeRequest&) {
        attempts++;
        return success();
    });
    assert(attempts == 0);
    assert(third.dropped.size() == 1);
    assert(f.queue.size() == 0);
}

void testPermanentDropped() {
    Fixture f;
    f.queue.enqueue(trade("KXBTC15M-26JAN011200"));
    auto result = f.queue.processQueue([](const execution::TradeRequest&) {
        return failure("insufficient_balance", 400);
    });
    assert(result.attempted == 1);
    assert(result.dropped.size() == 1);
    assert(f.queue.size() == 0);
}

void testSuccessRecordedInLedger() {
    Fixture f;
    f.queue.enqueue(trade("KXBTC15M", Side::NO));

    // Series with no listed market yet stays queued
    auto pending = f.queue.processQueue(
        [](const execution::TradeRequest&) { return success(); },
        [](const std::string&) { return std::optional<std::string>(); });
    assert(pending.kept == 1);
    assert(pending.succeeded == 0);

    std::string attempted_ticker;
    auto done = f.queue.processQueue(
        [&attempted_ticker](const execution::TradeRequest& request) {
            attempted_ticker = *request.ticker;
            return success();
        },
        [](const std::string& series) { return std::optional<std::string>(series + "-26JAN011215"); });
    assert(done.succeeded == 1);
    assert(attempted_ticker == "KXBTC15M-26JAN011215");
    assert(f.queue.size() == 0);

    auto position = f.ledger->getPosition("KXBTC15M-26JAN011215", Universe::REAL);
    assert(position.has_value() && position->isOpen());
    assert(position->side == Side::NO);
    assert(position->contracts == 3);
    assert(position->entry_price == 42);
    assert(position->strategy == "Follow");
}

void testTransientKeepsAndReResolves() {
    Fixture f;
    f.queue.enqueue(trade("KXBTC15M"));

    int resolves = 0;
    auto resolve = [&resolves](const std::string& series) {
        resolves++;
        return std::optional<std::string>(series + "-W" + std::to_string(resolves));
    };
    auto transient = [](const execution::TradeRequest&) { return failure("", 404); };

    assert(f.queue.processQueue(transient, resolve).kept == 1);
    assert(f.queue.processQueue(transient, resolve).kept == 1);
    // Rolled market: the series is resolved again on every pass
    assert(resolves == 2);

    // Resolver errors keep the entry
    auto throwing = [](const std::string&) -> std::optional<std::string> {
        throw network::ExchangeError("timeout");
    };
    assert(f.queue.processQueue(transient, throwing).kept == 1);

    // Attempt throwing is treated as a failed ack
    auto attempt_throws = [](const execution::TradeRequest&) -> network::OrderAck {
        throw std::runtime_error("socket closed");
    };
    assert(f.queue.processQueue(attempt_throws, resolve).kept == 1);
}

} // namespace

int main() {
    std::cout << "[TEST] Starting RetryQueue Test..." << std::endl;

    testExpiredDroppedWithoutAttempt();
    testRetriesExhausted();
    testPermanentDropped();
    testSuccessRecordedInLedger();
    testTransientKeepsAndReResolves();

    std::cout << "[TEST] RetryQueue PASSED" << std::endl;
    return 0;
}
