#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/EventChannel.h"
#include "common/StopToken.h"
#include "common/Types.h"

namespace kestrel {
namespace strategy {

// A trade observed from a followed source
struct TradeSignal {
    std::string source;
    std::string ticker_selector;    // concrete ticker or series
    Side side = Side::YES;
    Cents price = 0;
    int size = 0;
    std::string market_title;
    Timestamp received_at;
};

using SignalChannel = EventChannel<TradeSignal>;

// Tails a JSONL inbox and pushes each complete, valid line into the channel.
// A file that shrinks is treated as rotated and read from the start.
class SignalFileWatcher {
public:
    SignalFileWatcher(std::filesystem::path inbox,
                      std::shared_ptr<SignalChannel> channel,
                      std::shared_ptr<spdlog::logger> logger = nullptr);

    // Returns the number of signals pushed
    int pollOnce();

    // Polls until stop is requested or the channel is closed
    void run(const StopToken& stop, std::chrono::milliseconds poll_interval);

    static std::optional<TradeSignal> parseLine(const std::string& line);

private:
    static std::optional<TradeSignal> parseObject(const nlohmann::json& j);

    std::filesystem::path inbox_;
    std::shared_ptr<SignalChannel> channel_;
    std::shared_ptr<spdlog::logger> logger_;
    std::uintmax_t offset_ = 0;
    std::string partial_;
};

} // namespace strategy
} // namespace kestrel
