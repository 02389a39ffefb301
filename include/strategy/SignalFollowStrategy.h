#pragma once

#include <atomic>
#include <memory>
#include <vector>

#include "strategy/SignalFileWatcher.h"
#include "strategy/StrategyBase.h"

namespace kestrel {
namespace strategy {

// Continuous copy strategy: mirrors trades observed from followed sources.
// Each poll drains the retry backlog first, then ingests new signals.
class SignalFollowStrategy : public StrategyBase {
public:
    SignalFollowStrategy(StrategyConfig config,
                         StrategyContext context,
                         std::shared_ptr<SignalChannel> channel);

    // Drains whatever signals are already waiting in the channel
    std::vector<Opportunity> scan() override;
    int execute(const std::vector<Opportunity>& opportunities) override;

    void runContinuous(const StopToken& stop) override;
    void cancel() override;

    // One poll: retry backlog, then up to poll_interval waiting for signals.
    // Returns the number of trades recorded or placed.
    int pollOnce();

    bool isFollowing(const std::string& source) const;

private:
    Opportunity toOpportunity(const TradeSignal& signal) const;

    std::shared_ptr<SignalChannel> channel_;
    std::atomic<bool> cancelled_{false};
};

} // namespace strategy
} // namespace kestrel
