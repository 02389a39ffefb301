#include "execution/TradeExecutor.h"

#include <set>

#include "common/Logger.h"
#include "execution/OrderErrorClassifier.h"

namespace kestrel {
namespace execution {

namespace {

// Holds a ledger claim on a ticker until the order outcome is recorded
class TickerClaim {
public:
    TickerClaim(core::PositionLedger& ledger, std::string ticker, Universe universe)
        : ledger_(ledger), ticker_(std::move(ticker)), universe_(universe) {
        held_ = ledger_.claimTicker(ticker_, universe_);
    }
    ~TickerClaim() {
        if (held_) {
            ledger_.releaseClaim(ticker_, universe_);
        }
    }
    TickerClaim(const TickerClaim&) = delete;
    TickerClaim& operator=(const TickerClaim&) = delete;

    bool held() const { return held_; }

private:
    core::PositionLedger& ledger_;
    std::string ticker_;
    Universe universe_;
    bool held_ = false;
};

// Claims taken during a retry pass, released once the pass has recorded fills
class ClaimSet {
public:
    ClaimSet(core::PositionLedger& ledger, Universe universe) : ledger_(ledger), universe_(universe) {}
    ~ClaimSet() {
        for (const auto& ticker : tickers_) {
            ledger_.releaseClaim(ticker, universe_);
        }
    }
    ClaimSet(const ClaimSet&) = delete;
    ClaimSet& operator=(const ClaimSet&) = delete;

    bool claim(const std::string& ticker) {
        if (!ledger_.claimTicker(ticker, universe_)) {
            return false;
        }
        tickers_.insert(ticker);
        return true;
    }

private:
    core::PositionLedger& ledger_;
    Universe universe_;
    std::set<std::string> tickers_;
};

} // namespace

std::string toString(SubmitOutcome outcome) {
    switch (outcome) {
        case SubmitOutcome::FILLED_SIM: return "FILLED_SIM";
        case SubmitOutcome::PLACED: return "PLACED";
        case SubmitOutcome::QUEUED: return "QUEUED";
        case SubmitOutcome::REJECTED: return "REJECTED";
        case SubmitOutcome::DUPLICATE: return "DUPLICATE";
        case SubmitOutcome::FAILED: return "FAILED";
    }
    return "FAILED";
}

TradeExecutor::TradeExecutor(std::shared_ptr<network::IExchangeClient> exchange,
                             std::shared_ptr<core::PositionLedger> ledger,
                             std::shared_ptr<RetryQueue> retry_queue,
                             std::shared_ptr<risk::ExposureTracker> exposure,
                             bool dry_run,
                             std::shared_ptr<spdlog::logger> logger,
                             std::shared_ptr<core::IEventJournal> journal)
    : exchange_(std::move(exchange))
    , ledger_(std::move(ledger))
    , retry_queue_(std::move(retry_queue))
    , exposure_(std::move(exposure))
    , dry_run_(dry_run)
    , logger_(Logger::orSilent(std::move(logger)))
    , journal_(std::move(journal)) {
    if (exchange_) {
        resolver_ = std::make_unique<TickerResolver>(exchange_, logger_);
    }
}

core::OpenPositionRequest TradeExecutor::toOpenRequest(const TradeRequest& request,
                                                       const std::string& ticker) const {
    core::OpenPositionRequest open;
    open.ticker = ticker;
    open.side = request.side;
    open.contracts = request.size;
    open.entry_price = request.price;
    open.strategy = request.strategy;
    open.market_title = request.market_title;
    open.expected_settlement = request.expected_settlement;
    return open;
}

std::optional<std::string> TradeExecutor::resolveTicker(const std::string& selector) const {
    if (TickerResolver::isConcreteTicker(selector) || !resolver_) {
        return selector.empty() ? std::nullopt : std::optional<std::string>(selector);
    }
    return resolver_->resolve(selector);
}

void TradeExecutor::releaseReservation(const TradeRequest& request) {
    if (exposure_ && request.reserved_notional > 0.0) {
        exposure_->release(request.reserved_notional);
    }
}

SubmitResult TradeExecutor::submit(const TradeRequest& request, Universe universe) {
    SubmitResult result;

    if (request.size <= 0 || request.price < 1 || request.price > 99) {
        result.outcome = SubmitOutcome::REJECTED;
        result.error = "invalid size or price";
        logger_->warn("[{}] Rejected {}: size={} price={}c", request.strategy,
                      request.ticker_selector, request.size, request.price);
        releaseReservation(request);
        return result;
    }

    std::optional<std::string> ticker = request.ticker;
    if (!ticker) {
        try {
            ticker = resolveTicker(request.ticker_selector);
        } catch (const std::exception& e) {
            logger_->warn("[{}] Resolving {} failed: {}", request.strategy, request.ticker_selector, e.what());
        }
    }

    if (!ticker) {
        if (universe == Universe::REAL && retry_queue_) {
            // Market for this window not listed yet; treat as transient
            retry_queue_->enqueue(request);
            result.outcome = SubmitOutcome::QUEUED;
            result.error = "ticker unresolved";
            return result;
        }
        result.outcome = SubmitOutcome::REJECTED;
        result.error = "ticker unresolved";
        releaseReservation(request);
        return result;
    }

    if (ledger_->hasOpenPosition(*ticker, universe)) {
        logger_->debug("[{}] Skipping {}: already open in {}", request.strategy, *ticker,
                       kestrel::toString(universe));
        result.outcome = SubmitOutcome::DUPLICATE;
        releaseReservation(request);
        return result;
    }

    if (universe == Universe::SIMULATED) {
        return submitSimulated(request, *ticker);
    }
    return submitLive(request, *ticker);
}

SubmitResult TradeExecutor::submitSimulated(const TradeRequest& request, const std::string& ticker) {
    SubmitResult result;

    auto position = ledger_->openPosition(toOpenRequest(request, ticker), Universe::SIMULATED);
    if (!position) {
        // Lost a race with another strategy, or the save failed
        result.outcome = ledger_->hasOpenPosition(ticker, Universe::SIMULATED)
            ? SubmitOutcome::DUPLICATE : SubmitOutcome::FAILED;
        releaseReservation(request);
        return result;
    }

    result.outcome = SubmitOutcome::FILLED_SIM;
    result.position = position;
    return result;
}

SubmitResult TradeExecutor::submitLive(const TradeRequest& request, const std::string& ticker) {
    SubmitResult result;

    if (!exchange_) {
        result.outcome = SubmitOutcome::FAILED;
        result.error = "no exchange client";
        releaseReservation(request);
        return result;
    }

    // Another strategy may be between its duplicate check and its own order
    TickerClaim claim(*ledger_, ticker, Universe::REAL);
    if (!claim.held()) {
        logger_->info("[{}] Skipping {}: order already in flight or open", request.strategy, ticker);
        result.outcome = SubmitOutcome::DUPLICATE;
        releaseReservation(request);
        return result;
    }

    const auto ack = exchange_->placeOrder(ticker, request.side, request.price, request.size);
    const auto kind = OrderErrorClassifier::classify(ack);

    if (journal_) {
        core::JournalEvent event;
        event.type = core::JournalEventType::ORDER_SUBMITTED;
        event.ticker = ticker;
        event.entity_id = ack.order_id.value_or(std::string());
        event.payload = {
            {"strategy", request.strategy},
            {"side", kestrel::toString(request.side)},
            {"price", request.price},
            {"size", request.size},
            {"success", ack.success},
            {"status_code", ack.status_code},
            {"error_kind", toString(kind)}
        };
        if (!journal_->append(event)) {
            logger_->warn("Journal append failed for {}", ticker);
        }
    }

    if (kind == OrderErrorKind::NONE) {
        result.order_id = ack.order_id;
        auto position = ledger_->openPosition(toOpenRequest(request, ticker), Universe::REAL);
        if (!position) {
            logger_->error("[{}] Order {} on {} placed but not recorded in ledger",
                           request.strategy, ack.order_id.value_or("?"), ticker);
            result.outcome = SubmitOutcome::FAILED;
            result.error = "ledger write failed";
            releaseReservation(request);
            return result;
        }
        result.outcome = SubmitOutcome::PLACED;
        result.position = position;
        return result;
    }

    result.error = ack.error.value_or("unknown error");
    if (kind == OrderErrorKind::TRANSIENT && retry_queue_) {
        TradeRequest queued = request;
        // Keep the concrete ticker only if it was asked for explicitly
        if (!request.ticker && request.ticker_selector != ticker) {
            queued.ticker.reset();
        } else {
            queued.ticker = ticker;
        }
        retry_queue_->enqueue(queued);
        result.outcome = SubmitOutcome::QUEUED;
        return result;
    }

    logger_->error("[{}] Order on {} rejected permanently: {}", request.strategy, ticker, result.error);
    result.outcome = SubmitOutcome::REJECTED;
    releaseReservation(request);
    return result;
}

RetryPassResult TradeExecutor::drainRetryQueue() {
    if (!retry_queue_ || retry_queue_->size() == 0) {
        return RetryPassResult{};
    }

    ClaimSet claims(*ledger_, Universe::REAL);
    auto attempt = [this, &claims](const TradeRequest& request) {
        if (!claims.claim(*request.ticker)) {
            network::OrderAck duplicate;
            duplicate.error = "duplicate open position";
            return duplicate;
        }
        return exchange_->placeOrder(*request.ticker, request.side, request.price, request.size);
    };
    auto resolve = [this](const std::string& selector) {
        return resolveTicker(selector);
    };

    auto result = retry_queue_->processQueue(attempt, resolve);
    for (const auto& dropped : result.dropped) {
        releaseReservation(dropped.request);
    }
    for (const auto& unrecorded : result.unrecorded) {
        releaseReservation(unrecorded.request);
    }
    return result;
}

} // namespace execution
} // namespace kestrel
