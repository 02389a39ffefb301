#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "execution/RateLimiter.h"
#include "network/IExchangeClient.h"
#include "network/IHttpClient.h"
#include "network/RsaPssSigner.h"

namespace kestrel {
namespace network {

// REST adapter for the Kalshi trade API v2
class KalshiExchangeClient : public IExchangeClient {
public:
    static constexpr const char* kProductionUrl = "https://api.elections.kalshi.com";
    static constexpr const char* kDemoUrl = "https://demo-api.kalshi.co";
    static constexpr const char* kApiPrefix = "/trade-api/v2";

    KalshiExchangeClient(std::shared_ptr<IHttpClient> http,
                         std::shared_ptr<IRequestSigner> signer,
                         std::string api_key_id,
                         std::string base_url,
                         std::shared_ptr<spdlog::logger> logger = nullptr,
                         std::shared_ptr<execution::RateLimiter> rate_limiter = nullptr);

    std::vector<Market> getMarkets(const MarketFilter& filter) override;
    Orderbook getOrderbook(const std::string& ticker) override;
    OrderAck placeOrder(const std::string& ticker, Side side, Cents price_cents, int count) override;
    std::vector<PositionRef> getPositions() override;
    Balance getBalance() override;
    SettlementInfo getSettlement(const std::string& ticker) override;

    // Response parsing, exposed for tests
    static std::vector<Market> parseMarkets(const nlohmann::json& raw);
    static Orderbook parseOrderbook(const nlohmann::json& raw);
    static std::vector<PositionRef> parsePositions(const nlohmann::json& raw);
    static SettlementInfo parseSettlement(const nlohmann::json& market);

    static std::string generateClientOrderId();

private:
    HttpResponse send(const std::string& method, const std::string& endpoint,
                      const std::string& body, const std::string& group);
    nlohmann::json getJson(const std::string& endpoint, const std::string& group);

    std::shared_ptr<IHttpClient> http_;
    std::shared_ptr<IRequestSigner> signer_;
    std::string api_key_id_;
    std::string base_url_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<execution::RateLimiter> rate_limiter_;
};

} // namespace network
} // namespace kestrel
