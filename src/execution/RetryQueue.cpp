#include "execution/RetryQueue.h"

#include "common/Logger.h"

namespace kestrel {
namespace execution {

RetryQueue::RetryQueue(std::shared_ptr<core::PositionLedger> ledger,
                       Universe universe,
                       RetryQueueConfig config,
                       std::shared_ptr<spdlog::logger> logger,
                       std::shared_ptr<core::IEventJournal> journal,
                       Clock clock)
    : ledger_(std::move(ledger))
    , universe_(universe)
    , config_(config)
    , logger_(Logger::orSilent(std::move(logger)))
    , journal_(std::move(journal))
    , clock_(clock ? std::move(clock) : Clock([]() { return std::chrono::system_clock::now(); })) {}

void RetryQueue::enqueue(const TradeRequest& request) {
    QueuedTrade trade;
    trade.request = request;
    trade.queued_at = clock_();
    trade.retry_count = 0;
    enqueue(std::move(trade));
}

void RetryQueue::enqueue(QueuedTrade trade) {
    logger_->info("Queued {} {} x{} @ {}c from {} for retry (selector={})",
                  trade.request.ticker.value_or(trade.request.ticker_selector),
                  kestrel::toString(trade.request.side), trade.request.size, trade.request.price,
                  trade.request.source, trade.request.ticker_selector);

    if (journal_) {
        core::JournalEvent event;
        event.type = core::JournalEventType::ORDER_QUEUED;
        event.ticker = trade.request.ticker.value_or(trade.request.ticker_selector);
        event.entity_id = trade.request.strategy;
        event.payload = {
            {"source", trade.request.source},
            {"selector", trade.request.ticker_selector},
            {"side", kestrel::toString(trade.request.side)},
            {"price", trade.request.price},
            {"size", trade.request.size},
            {"retry_count", trade.retry_count}
        };
        if (!journal_->append(event)) {
            logger_->warn("Journal append failed for {}", event.ticker);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(trade));
}

RetryPassResult RetryQueue::processQueue(const AttemptFn& attempt, const ResolveFn& resolve) {
    std::lock_guard<std::mutex> pass_lock(pass_mutex_);

    std::deque<QueuedTrade> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(entries_);
    }

    RetryPassResult result;
    if (pending.empty()) {
        return result;
    }

    const auto now = clock_();
    std::deque<QueuedTrade> keep;

    for (auto& trade : pending) {
        const auto age = std::chrono::duration_cast<std::chrono::seconds>(now - trade.queued_at);
        if (age > config_.max_queue_age) {
            logger_->warn("Dropping queued {} from {}: expired after {}s",
                          trade.request.ticker_selector, trade.request.source, age.count());
            journalDrop(trade, "expired");
            result.dropped.push_back(std::move(trade));
            continue;
        }
        if (trade.retry_count >= config_.max_retries) {
            logger_->warn("Dropping queued {} from {}: {} retries exhausted",
                          trade.request.ticker_selector, trade.request.source, trade.retry_count);
            journalDrop(trade, "retries_exhausted");
            result.dropped.push_back(std::move(trade));
            continue;
        }

        trade.retry_count++;
        result.attempted++;

        switch (attemptOnce(trade, attempt, resolve)) {
            case Verdict::SUCCEEDED:
                result.succeeded++;
                break;
            case Verdict::UNRECORDED:
                journalDrop(trade, "ledger_write_failed");
                result.unrecorded.push_back(std::move(trade));
                break;
            case Verdict::KEEP:
                keep.push_back(std::move(trade));
                break;
            case Verdict::DROP:
                journalDrop(trade, "permanent");
                result.dropped.push_back(std::move(trade));
                break;
        }
    }

    result.kept = static_cast<int>(keep.size());
    {
        // Survivors go ahead of anything enqueued during the pass
        std::lock_guard<std::mutex> lock(mutex_);
        keep.insert(keep.end(), std::make_move_iterator(entries_.begin()),
                    std::make_move_iterator(entries_.end()));
        entries_.swap(keep);
    }

    logger_->info("Retry pass: attempted={} succeeded={} kept={} dropped={} unrecorded={}",
                  result.attempted, result.succeeded, result.kept, result.dropped.size(),
                  result.unrecorded.size());
    return result;
}

RetryQueue::Verdict RetryQueue::attemptOnce(QueuedTrade& trade, const AttemptFn& attempt,
                                            const ResolveFn& resolve) {
    auto& request = trade.request;

    if (!request.ticker) {
        std::optional<std::string> resolved;
        try {
            resolved = resolve ? resolve(request.ticker_selector)
                               : std::optional<std::string>(request.ticker_selector);
        } catch (const std::exception& e) {
            logger_->warn("Resolving {} failed (attempt {}): {}",
                          request.ticker_selector, trade.retry_count, e.what());
            return Verdict::KEEP;
        }
        if (!resolved || resolved->empty()) {
            logger_->info("No market for {} yet (attempt {}/{})",
                          request.ticker_selector, trade.retry_count, config_.max_retries);
            return Verdict::KEEP;
        }
        request.ticker = *resolved;
    }

    network::OrderAck ack;
    try {
        ack = attempt(request);
    } catch (const std::exception& e) {
        ack.success = false;
        ack.error = e.what();
    }

    switch (OrderErrorClassifier::classify(ack)) {
        case OrderErrorKind::NONE:
            return recordSuccess(trade, ack) ? Verdict::SUCCEEDED : Verdict::UNRECORDED;
        case OrderErrorKind::TRANSIENT:
            logger_->info("Retry {}/{} for {} still transient: {}", trade.retry_count, config_.max_retries,
                          *request.ticker, ack.error.value_or("unknown"));
            // Market may have rolled again; re-resolve next pass
            if (request.ticker_selector != *request.ticker) {
                request.ticker.reset();
            }
            return Verdict::KEEP;
        case OrderErrorKind::PERMANENT:
            logger_->error("Dropping queued {}: permanent error {}",
                           *request.ticker, ack.error.value_or("unknown"));
            return Verdict::DROP;
    }
    return Verdict::DROP;
}

bool RetryQueue::recordSuccess(const QueuedTrade& trade, const network::OrderAck& ack) {
    const auto& request = trade.request;

    core::OpenPositionRequest open;
    open.ticker = *request.ticker;
    open.side = request.side;
    open.contracts = request.size;
    open.entry_price = request.price;
    open.strategy = request.strategy;
    open.market_title = request.market_title;
    open.expected_settlement = request.expected_settlement;

    logger_->info("Queued trade {} filled on retry {} (order {})",
                  open.ticker, trade.retry_count, ack.order_id.value_or("?"));

    if (journal_) {
        core::JournalEvent event;
        event.type = core::JournalEventType::ORDER_SUBMITTED;
        event.ticker = open.ticker;
        event.entity_id = ack.order_id.value_or(std::string());
        event.payload = {{"strategy", request.strategy}, {"retry_count", trade.retry_count}};
        if (!journal_->append(event)) {
            logger_->warn("Journal append failed for {}", event.ticker);
        }
    }

    if (!ledger_->openPosition(open, universe_)) {
        logger_->error("Order {} on {} placed but ledger did not record it; reconcile manually",
                       ack.order_id.value_or("?"), open.ticker);
        return false;
    }
    return true;
}

void RetryQueue::journalDrop(const QueuedTrade& trade, const std::string& reason) const {
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.type = core::JournalEventType::ORDER_DROPPED;
    event.ticker = trade.request.ticker.value_or(trade.request.ticker_selector);
    event.entity_id = trade.request.strategy;
    event.payload = {{"reason", reason}, {"retry_count", trade.retry_count}, {"source", trade.request.source}};
    if (!journal_->append(event)) {
        logger_->warn("Journal append failed for {}", event.ticker);
    }
}

size_t RetryQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<QueuedTrade> RetryQueue::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<QueuedTrade>(entries_.begin(), entries_.end());
}

void RetryQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace execution
} // namespace kestrel
