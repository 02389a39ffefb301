#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/contracts/IEventJournal.h"
#include "core/state/PositionLedger.h"
#include "execution/OrderErrorClassifier.h"
#include "execution/TradeRequest.h"

namespace kestrel {
namespace execution {

struct RetryQueueConfig {
    int max_retries = 10;
    std::chrono::seconds max_queue_age{600};
};

struct RetryPassResult {
    int attempted = 0;
    int succeeded = 0;
    int kept = 0;
    std::vector<QueuedTrade> dropped;   // expired, exhausted or permanently rejected
    std::vector<QueuedTrade> unrecorded;    // exchange accepted, ledger write failed
};

// Holds order submissions that failed transiently (market window rolled or
// closed between detection and execution). Each pass attempts every live
// entry once; successes go straight into the ledger.
class RetryQueue {
public:
    using AttemptFn = std::function<network::OrderAck(const TradeRequest&)>;
    using ResolveFn = std::function<std::optional<std::string>(const std::string&)>;
    using Clock = std::function<Timestamp()>;

    RetryQueue(std::shared_ptr<core::PositionLedger> ledger,
               Universe universe,
               RetryQueueConfig config = {},
               std::shared_ptr<spdlog::logger> logger = nullptr,
               std::shared_ptr<core::IEventJournal> journal = nullptr,
               Clock clock = nullptr);

    void enqueue(const TradeRequest& request);
    // Keeps queued_at / retry_count as given
    void enqueue(QueuedTrade trade);

    // resolve may be empty when every request carries a concrete ticker
    RetryPassResult processQueue(const AttemptFn& attempt, const ResolveFn& resolve = nullptr);

    size_t size() const;
    std::vector<QueuedTrade> snapshot() const;
    void clear();

    const RetryQueueConfig& config() const { return config_; }

private:
    enum class Verdict { SUCCEEDED, UNRECORDED, KEEP, DROP };

    Verdict attemptOnce(QueuedTrade& trade, const AttemptFn& attempt, const ResolveFn& resolve);
    bool recordSuccess(const QueuedTrade& trade, const network::OrderAck& ack);
    void journalDrop(const QueuedTrade& trade, const std::string& reason) const;

    std::shared_ptr<core::PositionLedger> ledger_;
    Universe universe_;
    RetryQueueConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<core::IEventJournal> journal_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::deque<QueuedTrade> entries_;
    std::mutex pass_mutex_;     // one pass at a time
};

} // namespace execution
} // namespace kestrel
