#include "network/KalshiExchangeClient.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <random>
#include <set>
#include <sstream>

#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace kestrel {
namespace network {

namespace {
bool isSensitiveKey(const std::string& key) {
    static const std::set<std::string> kKeys = {
        "kalshi-access-key", "kalshi-access-signature", "private_key",
        "authorization", "token", "api_key", "signature"
    };
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return kKeys.find(lower) != kKeys.end();
}

void maskSensitiveJson(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (isSensitiveKey(it.key())) {
                it.value() = "***";
            } else {
                maskSensitiveJson(it.value());
            }
        }
        return;
    }
    if (node.is_array()) {
        for (auto& item : node) {
            maskSensitiveJson(item);
        }
    }
}

std::string sanitizeForLog(const std::string& text) {
    const std::string clipped = text.substr(0, 200);
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return clipped;
    }
    maskSensitiveJson(j);
    return j.dump().substr(0, 200);
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::vector<OrderbookLevel> parseLevels(const nlohmann::json& raw) {
    std::vector<OrderbookLevel> levels;
    if (!raw.is_array()) {
        return levels;
    }
    for (const auto& level : raw) {
        if (level.is_array() && level.size() >= 2 &&
            level[0].is_number() && level[1].is_number()) {
            levels.push_back({level[0].get<int>(), level[1].get<int>()});
        }
    }
    return levels;
}

// Retry-After in whole seconds; 0 when absent or not numeric
std::chrono::milliseconds retryAfter(const HttpResponse& response) {
    for (const auto& kv : response.headers) {
        if (toLowerCopy(kv.first) != "retry-after") {
            continue;
        }
        const auto& value = kv.second;
        if (value.empty() || !std::all_of(value.begin(), value.end(),
                                          [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::chrono::milliseconds(0);
        }
        return std::chrono::seconds(std::stoi(value.substr(0, 6)));
    }
    return std::chrono::milliseconds(0);
}

int intField(const nlohmann::json& raw, const char* key) {
    auto it = raw.find(key);
    if (it == raw.end() || !it->is_number()) {
        return 0;
    }
    return it->get<int>();
}
}

KalshiExchangeClient::KalshiExchangeClient(std::shared_ptr<IHttpClient> http,
                                           std::shared_ptr<IRequestSigner> signer,
                                           std::string api_key_id,
                                           std::string base_url,
                                           std::shared_ptr<spdlog::logger> logger,
                                           std::shared_ptr<execution::RateLimiter> rate_limiter)
    : http_(std::move(http))
    , signer_(std::move(signer))
    , api_key_id_(std::move(api_key_id))
    , base_url_(std::move(base_url))
    , logger_(Logger::orSilent(std::move(logger)))
    , rate_limiter_(rate_limiter ? std::move(rate_limiter)
                                 : std::make_shared<execution::RateLimiter>(logger_)) {}

HttpResponse KalshiExchangeClient::send(const std::string& method, const std::string& endpoint,
                                        const std::string& body, const std::string& group) {
    rate_limiter_->acquire(group);

    const std::string full_path = std::string(kApiPrefix) + endpoint;
    const std::string url = base_url_ + full_path;
    const std::string timestamp = std::to_string(utils::TimeUtils::nowMs());

    HeaderMap headers;
    headers["Content-Type"] = "application/json";
    // Unsigned requests only reach public market data
    if (signer_) {
        headers["KALSHI-ACCESS-KEY"] = api_key_id_;
        headers["KALSHI-ACCESS-SIGNATURE"] = signer_->sign(timestamp, method, full_path);
        headers["KALSHI-ACCESS-TIMESTAMP"] = timestamp;
    }

    HttpResponse response;
    try {
        if (method == "POST") {
            response = http_->post(url, body, headers);
        } else if (method == "DELETE") {
            response = http_->del(url, headers);
        } else {
            response = http_->get(url, headers);
        }
    } catch (const std::exception& e) {
        throw ExchangeError(method + " " + endpoint + " failed: " + e.what());
    }

    if (response.isRateLimited()) {
        rate_limiter_->onResponse(response.status_code, retryAfter(response));
    }
    return response;
}

nlohmann::json KalshiExchangeClient::getJson(const std::string& endpoint, const std::string& group) {
    auto response = send("GET", endpoint, "", group);
    if (!response.isSuccess()) {
        throw ExchangeError("GET " + endpoint + " returned HTTP " +
                            std::to_string(response.status_code) + ": " + sanitizeForLog(response.body),
                            response.status_code);
    }

    auto raw = nlohmann::json::parse(response.body, nullptr, false);
    if (raw.is_discarded()) {
        throw ExchangeError("GET " + endpoint + " returned malformed JSON", response.status_code);
    }
    return raw;
}

std::vector<Market> KalshiExchangeClient::getMarkets(const MarketFilter& filter) {
    std::string endpoint = "/markets?status=" + filter.status + "&limit=" + std::to_string(filter.limit);
    if (filter.series_ticker) {
        endpoint += "&series_ticker=" + *filter.series_ticker;
    }
    return parseMarkets(getJson(endpoint, "market"));
}

Orderbook KalshiExchangeClient::getOrderbook(const std::string& ticker) {
    return parseOrderbook(getJson("/markets/" + ticker + "/orderbook", "market"));
}

OrderAck KalshiExchangeClient::placeOrder(const std::string& ticker, Side side, Cents price_cents, int count) {
    OrderAck ack;

    nlohmann::json body;
    body["ticker"] = ticker;
    body["action"] = "buy";
    body["side"] = side == Side::YES ? "yes" : "no";
    body["count"] = count;
    body["type"] = "limit";
    body["client_order_id"] = generateClientOrderId();
    if (side == Side::YES) {
        body["yes_price"] = price_cents;
    } else {
        body["no_price"] = price_cents;
    }

    try {
        auto response = send("POST", "/portfolio/orders", body.dump(), "order");
        ack.status_code = response.status_code;

        if (response.isSuccess()) {
            auto raw = nlohmann::json::parse(response.body, nullptr, false);
            ack.success = true;
            if (!raw.is_discarded() && raw.contains("order") && raw["order"].is_object()) {
                const auto& order = raw["order"];
                if (order.contains("order_id") && order["order_id"].is_string()) {
                    ack.order_id = order["order_id"].get<std::string>();
                }
            }
            logger_->info("Order placed: {} {} x{} @ {}c (id={})", ticker, kestrel::toString(side),
                          count, price_cents, ack.order_id.value_or("?"));
            return ack;
        }

        ack.error = response.body.empty()
            ? "HTTP " + std::to_string(response.status_code)
            : sanitizeForLog(response.body);
        logger_->error("Order failed: {} {} x{} @ {}c -> HTTP {} {}", ticker, kestrel::toString(side),
                       count, price_cents, response.status_code, *ack.error);
    } catch (const std::exception& e) {
        ack.success = false;
        ack.error = e.what();
        logger_->error("Order failed: {} -> {}", ticker, e.what());
    }
    return ack;
}

std::vector<PositionRef> KalshiExchangeClient::getPositions() {
    return parsePositions(getJson("/portfolio/positions", "portfolio"));
}

Balance KalshiExchangeClient::getBalance() {
    const auto raw = getJson("/portfolio/balance", "portfolio");
    Balance balance;
    if (raw.contains("balance") && raw["balance"].is_number()) {
        balance.balance_cents = raw["balance"].get<long long>();
    }
    return balance;
}

SettlementInfo KalshiExchangeClient::getSettlement(const std::string& ticker) {
    auto response = send("GET", "/markets/" + ticker, "", "market");
    if (response.status_code == 404) {
        return SettlementInfo{};
    }
    if (!response.isSuccess()) {
        throw ExchangeError("GET /markets/" + ticker + " returned HTTP " +
                            std::to_string(response.status_code), response.status_code);
    }

    auto raw = nlohmann::json::parse(response.body, nullptr, false);
    if (raw.is_discarded() || !raw.is_object()) {
        return SettlementInfo{};
    }
    return parseSettlement(raw.contains("market") ? raw["market"] : raw);
}

std::vector<Market> KalshiExchangeClient::parseMarkets(const nlohmann::json& raw) {
    std::vector<Market> markets;
    if (!raw.is_object() || !raw.contains("markets") || !raw["markets"].is_array()) {
        return markets;
    }

    for (const auto& m : raw["markets"]) {
        if (!m.is_object() || !m.contains("ticker")) {
            continue;
        }
        Market market;
        market.ticker = m.value("ticker", std::string());
        market.event_ticker = m.value("event_ticker", std::string());
        market.title = m.value("title", std::string());
        market.status = m.value("status", std::string());
        market.yes_bid = intField(m, "yes_bid");
        market.yes_ask = intField(m, "yes_ask");
        market.no_bid = intField(m, "no_bid");
        market.no_ask = intField(m, "no_ask");
        market.last_price = intField(m, "last_price");
        market.volume = m.contains("volume") && m["volume"].is_number() ? m["volume"].get<long long>() : 0;
        market.close_time = m.value("close_time", std::string());
        markets.push_back(std::move(market));
    }
    return markets;
}

Orderbook KalshiExchangeClient::parseOrderbook(const nlohmann::json& raw) {
    Orderbook book;
    const nlohmann::json& node = raw.is_object() && raw.contains("orderbook") ? raw["orderbook"] : raw;
    if (!node.is_object()) {
        return book;
    }
    if (node.contains("yes")) book.yes = parseLevels(node["yes"]);
    if (node.contains("no")) book.no = parseLevels(node["no"]);
    return book;
}

std::vector<PositionRef> KalshiExchangeClient::parsePositions(const nlohmann::json& raw) {
    std::vector<PositionRef> out;
    if (!raw.is_object()) {
        return out;
    }

    const char* key = raw.contains("market_positions") ? "market_positions" : "positions";
    if (!raw.contains(key) || !raw[key].is_array()) {
        return out;
    }

    for (const auto& p : raw[key]) {
        if (!p.is_object() || !p.contains("ticker")) {
            continue;
        }
        PositionRef ref;
        ref.ticker = p.value("ticker", std::string());
        ref.position = intField(p, "position");
        if (p.contains("market_exposure") && p["market_exposure"].is_number()) {
            ref.market_exposure = p["market_exposure"].get<double>() / 100.0;
        }
        if (ref.position != 0) {
            out.push_back(std::move(ref));
        }
    }
    return out;
}

SettlementInfo KalshiExchangeClient::parseSettlement(const nlohmann::json& market) {
    SettlementInfo info;
    if (!market.is_object()) {
        return info;
    }

    const std::string status = toLowerCopy(market.value("status", std::string()));

    std::optional<Cents> price;
    if (market.contains("settlement_value") && market["settlement_value"].is_number()) {
        price = market["settlement_value"].get<int>();
    } else {
        const std::string result = toLowerCopy(market.value("result", std::string()));
        if (result == "yes") price = 100;
        else if (result == "no") price = 0;
    }

    if ((status == "settled" || status == "finalized" || status == "determined") && price) {
        info.status = SettlementStatus::SETTLED;
        info.settlement_price = price;
    } else if (status == "finalized" || status == "determined" || status == "closed") {
        info.status = SettlementStatus::FINALIZED;
    } else if (status == "active" || status == "open" || status == "initialized" || status == "unopened") {
        info.status = SettlementStatus::ACTIVE;
    }
    return info;
}

std::string KalshiExchangeClient::generateClientOrderId() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    uint64_t part1 = dis(gen);
    uint64_t part2 = dis(gen);

    oss << std::setw(8) << (part1 >> 32)
        << "-" << std::setw(4) << ((part1 >> 16) & 0xFFFF)
        << "-4" << std::setw(3) << (part1 & 0xFFF)
        << "-" << std::setw(4) << (((part2 >> 48) & 0x3FFF) | 0x8000)
        << "-" << std::setw(12) << (part2 & 0xFFFFFFFFFFFF);

    return oss.str();
}

} // namespace network
} // namespace kestrel
