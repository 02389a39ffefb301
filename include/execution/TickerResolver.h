#pragma once

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "network/IExchangeClient.h"

namespace kestrel {
namespace execution {

// Maps a ticker selector to a tradable ticker. A selector containing '-' is
// already a market ticker; anything else is treated as a series and resolves
// to its open market closing soonest.
class TickerResolver {
public:
    TickerResolver(std::shared_ptr<network::IExchangeClient> exchange,
                   std::shared_ptr<spdlog::logger> logger = nullptr);

    // nullopt when nothing is open; ExchangeError propagates
    std::optional<std::string> resolve(const std::string& selector) const;

    static bool isConcreteTicker(const std::string& selector);

private:
    std::shared_ptr<network::IExchangeClient> exchange_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace execution
} // namespace kestrel
