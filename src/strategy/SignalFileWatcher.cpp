#include "strategy/SignalFileWatcher.h"

#include <fstream>
#include <iterator>

#include "common/Logger.h"

namespace kestrel {
namespace strategy {

SignalFileWatcher::SignalFileWatcher(std::filesystem::path inbox,
                                     std::shared_ptr<SignalChannel> channel,
                                     std::shared_ptr<spdlog::logger> logger)
    : inbox_(std::move(inbox))
    , channel_(std::move(channel))
    , logger_(Logger::orSilent(std::move(logger))) {}

std::optional<TradeSignal> SignalFileWatcher::parseLine(const std::string& line) {
    const auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    try {
        return parseObject(j);
    } catch (const nlohmann::json::exception&) {
        // Wrong field types
        return std::nullopt;
    }
}

std::optional<TradeSignal> SignalFileWatcher::parseObject(const nlohmann::json& j) {
    TradeSignal signal;
    if (j.contains("source") && !j["source"].is_string()) {
        return std::nullopt;
    }
    signal.source = j.value("source", std::string("unknown"));

    const char* ticker_key = j.contains("ticker_selector") ? "ticker_selector" : "ticker";
    if (!j.contains(ticker_key) || !j[ticker_key].is_string()) {
        return std::nullopt;
    }
    signal.ticker_selector = j[ticker_key].get<std::string>();
    if (signal.ticker_selector.empty()) {
        return std::nullopt;
    }

    if (!j.contains("side") || !j["side"].is_string()) {
        return std::nullopt;
    }
    const auto side = sideFromString(j["side"].get<std::string>());
    if (!side) {
        return std::nullopt;
    }
    signal.side = *side;

    if (!j.contains("price") || !j["price"].is_number() || !j.contains("size") || !j["size"].is_number()) {
        return std::nullopt;
    }
    signal.price = j["price"].get<int>();
    signal.size = j["size"].get<int>();
    if (signal.price < 1 || signal.price > 99 || signal.size <= 0) {
        return std::nullopt;
    }

    if (j.contains("market_title") && j["market_title"].is_string()) {
        signal.market_title = j["market_title"].get<std::string>();
    }
    signal.received_at = std::chrono::system_clock::now();
    return signal;
}

int SignalFileWatcher::pollOnce() {
    std::error_code ec;
    if (!std::filesystem::exists(inbox_, ec)) {
        return 0;
    }
    const auto file_size = std::filesystem::file_size(inbox_, ec);
    if (ec) {
        logger_->warn("Signal inbox {} unreadable: {}", inbox_.string(), ec.message());
        return 0;
    }
    if (file_size < offset_) {
        logger_->info("Signal inbox {} rotated, reading from start", inbox_.string());
        offset_ = 0;
        partial_.clear();
    }
    if (file_size == offset_) {
        return 0;
    }

    std::ifstream in(inbox_, std::ios::binary);
    if (!in.is_open()) {
        return 0;
    }
    in.seekg(static_cast<std::streamoff>(offset_));
    std::string chunk((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    offset_ += chunk.size();

    std::string buffer = partial_ + chunk;
    partial_.clear();

    int pushed = 0;
    size_t start = 0;
    while (true) {
        const auto newline = buffer.find('\n', start);
        if (newline == std::string::npos) {
            partial_ = buffer.substr(start);
            break;
        }
        std::string line = buffer.substr(start, newline - start);
        start = newline + 1;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        auto signal = parseLine(line);
        if (!signal) {
            logger_->warn("Ignoring malformed signal line: {}", line);
            continue;
        }
        if (!channel_->push(std::move(*signal))) {
            return pushed;
        }
        pushed++;
    }
    return pushed;
}

void SignalFileWatcher::run(const StopToken& stop, std::chrono::milliseconds poll_interval) {
    logger_->info("Watching signal inbox {}", inbox_.string());
    while (!stop.stopRequested() && !channel_->isClosed()) {
        try {
            const int pushed = pollOnce();
            if (pushed > 0) {
                logger_->debug("Ingested {} signals from {}", pushed, inbox_.string());
            }
        } catch (const std::exception& e) {
            logger_->error("Signal inbox poll failed: {}", e.what());
        }
        if (stop.waitFor(poll_interval)) {
            break;
        }
    }
}

} // namespace strategy
} // namespace kestrel
