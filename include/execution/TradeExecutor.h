#pragma once

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "core/contracts/IEventJournal.h"
#include "core/state/PositionLedger.h"
#include "execution/RetryQueue.h"
#include "execution/TickerResolver.h"
#include "execution/TradeRequest.h"
#include "network/IExchangeClient.h"
#include "risk/ExposureTracker.h"

namespace kestrel {
namespace execution {

enum class SubmitOutcome {
    FILLED_SIM,     // recorded in the simulated ledger
    PLACED,         // exchange accepted, recorded in the real ledger
    QUEUED,         // transient failure, handed to the retry queue
    REJECTED,       // permanent failure or unusable request
    DUPLICATE,      // ticker already open in the target universe
    FAILED          // ledger could not record the position
};

std::string toString(SubmitOutcome outcome);

struct SubmitResult {
    SubmitOutcome outcome = SubmitOutcome::REJECTED;
    std::optional<core::Position> position;
    std::optional<std::string> order_id;
    std::string error;
};

// Routes sized trades to the simulated ledger (dry-run) or the exchange.
// Live failures are classified once here; transient ones go to the queue.
class TradeExecutor {
public:
    TradeExecutor(std::shared_ptr<network::IExchangeClient> exchange,
                  std::shared_ptr<core::PositionLedger> ledger,
                  std::shared_ptr<RetryQueue> retry_queue,
                  std::shared_ptr<risk::ExposureTracker> exposure,
                  bool dry_run,
                  std::shared_ptr<spdlog::logger> logger = nullptr,
                  std::shared_ptr<core::IEventJournal> journal = nullptr);

    SubmitResult submit(const TradeRequest& request, Universe universe);
    SubmitResult submit(const TradeRequest& request) { return submit(request, universe()); }

    // Retry backlog pass; dropped entries give back their exposure
    RetryPassResult drainRetryQueue();

    bool isDryRun() const { return dry_run_; }
    Universe universe() const { return universeFor(dry_run_); }

    std::shared_ptr<RetryQueue> retryQueue() const { return retry_queue_; }
    std::shared_ptr<core::PositionLedger> ledger() const { return ledger_; }

private:
    SubmitResult submitSimulated(const TradeRequest& request, const std::string& ticker);
    SubmitResult submitLive(const TradeRequest& request, const std::string& ticker);
    std::optional<std::string> resolveTicker(const std::string& selector) const;
    void releaseReservation(const TradeRequest& request);
    core::OpenPositionRequest toOpenRequest(const TradeRequest& request, const std::string& ticker) const;

    std::shared_ptr<network::IExchangeClient> exchange_;
    std::shared_ptr<core::PositionLedger> ledger_;
    std::shared_ptr<RetryQueue> retry_queue_;
    std::shared_ptr<risk::ExposureTracker> exposure_;
    bool dry_run_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<core::IEventJournal> journal_;
    std::unique_ptr<TickerResolver> resolver_;
};

} // namespace execution
} // namespace kestrel
