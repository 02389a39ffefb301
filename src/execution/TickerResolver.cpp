#include "execution/TickerResolver.h"

#include <algorithm>

#include "common/Logger.h"

namespace kestrel {
namespace execution {

TickerResolver::TickerResolver(std::shared_ptr<network::IExchangeClient> exchange,
                               std::shared_ptr<spdlog::logger> logger)
    : exchange_(std::move(exchange))
    , logger_(Logger::orSilent(std::move(logger))) {}

bool TickerResolver::isConcreteTicker(const std::string& selector) {
    return selector.find('-') != std::string::npos;
}

std::optional<std::string> TickerResolver::resolve(const std::string& selector) const {
    if (selector.empty()) {
        return std::nullopt;
    }
    if (isConcreteTicker(selector)) {
        return selector;
    }

    network::MarketFilter filter;
    filter.series_ticker = selector;
    filter.status = "open";
    auto markets = exchange_->getMarkets(filter);
    if (markets.empty()) {
        logger_->debug("No open market for series {}", selector);
        return std::nullopt;
    }

    // ISO close times sort lexicographically
    auto soonest = std::min_element(markets.begin(), markets.end(),
        [](const network::Market& a, const network::Market& b) {
            if (a.close_time.empty()) return false;
            if (b.close_time.empty()) return true;
            return a.close_time < b.close_time;
        });
    return soonest->ticker;
}

} // namespace execution
} // namespace kestrel
