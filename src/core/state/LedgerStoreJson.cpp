#include "core/state/LedgerStoreJson.h"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include "common/TimeUtils.h"

namespace kestrel {
namespace core {

namespace {
template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    if (!value.has_value()) {
        return nullptr;
    }
    return *value;
}

template <typename T>
std::optional<T> optionalFromJson(const nlohmann::json& raw, const char* key) {
    auto it = raw.find(key);
    if (it == raw.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}
}

LedgerStoreJson::LedgerStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

nlohmann::json LedgerStoreJson::toJson(const Position& position) {
    nlohmann::json raw;
    raw["ticker"] = position.ticker;
    raw["side"] = kestrel::toString(position.side);
    raw["contracts"] = position.contracts;
    raw["entry_price"] = position.entry_price;
    raw["entry_time"] = position.entry_time;
    raw["strategy"] = position.strategy;
    raw["simulated"] = position.simulated;
    raw["market_title"] = position.market_title;
    raw["status"] = kestrel::toString(position.status);
    raw["expected_settlement"] = optionalToJson(position.expected_settlement);
    raw["exit_price"] = optionalToJson(position.exit_price);
    raw["exit_time"] = optionalToJson(position.exit_time);
    raw["pnl"] = optionalToJson(position.pnl);
    return raw;
}

nlohmann::json LedgerStoreJson::toJson(const PositionMap& positions) {
    nlohmann::json raw = nlohmann::json::object();
    for (const auto& [ticker, position] : positions) {
        raw[ticker] = toJson(position);
    }
    return raw;
}

Position LedgerStoreJson::fromJson(const std::string& ticker, const nlohmann::json& raw) {
    if (!raw.is_object()) {
        throw std::runtime_error("position entry is not an object: " + ticker);
    }

    Position position;
    position.ticker = raw.value("ticker", ticker);

    const auto side = sideFromString(raw.at("side").get<std::string>());
    if (!side) {
        throw std::runtime_error("invalid side for " + ticker);
    }
    position.side = *side;

    position.contracts = raw.at("contracts").get<int>();
    position.entry_price = raw.at("entry_price").get<int>();
    position.entry_time = raw.value("entry_time", std::string());
    position.strategy = raw.value("strategy", std::string());
    position.simulated = raw.value("simulated", false);
    position.market_title = raw.value("market_title", std::string());

    const auto status = positionStatusFromString(raw.value("status", std::string("open")));
    if (!status) {
        throw std::runtime_error("invalid status for " + ticker);
    }
    position.status = *status;

    position.expected_settlement = optionalFromJson<std::string>(raw, "expected_settlement");
    position.exit_price = optionalFromJson<int>(raw, "exit_price");
    position.exit_time = optionalFromJson<std::string>(raw, "exit_time");
    position.pnl = optionalFromJson<double>(raw, "pnl");
    return position;
}

LedgerLoadResult LedgerStoreJson::load() {
    LedgerLoadResult result;
    if (!std::filesystem::exists(file_path_)) {
        result.status = StoreStatus::MISSING;
        return result;
    }

    try {
        std::ifstream in(file_path_, std::ios::binary);
        if (!in.is_open()) {
            throw std::runtime_error("cannot open " + file_path_.string());
        }

        nlohmann::json raw;
        in >> raw;
        if (!raw.is_object()) {
            throw std::runtime_error("ledger root is not an object");
        }

        for (auto it = raw.begin(); it != raw.end(); ++it) {
            result.positions[it.key()] = fromJson(it.key(), it.value());
        }
        result.status = StoreStatus::OK;
        return result;
    } catch (const std::exception&) {
        result.positions.clear();
    }

    // Quarantine and start empty
    result.status = StoreStatus::CORRUPT;
    auto quarantine = file_path_;
    quarantine += ".corrupted." + utils::TimeUtils::format(std::chrono::system_clock::now(), "%Y%m%d%H%M%S");

    std::error_code ec;
    std::filesystem::rename(file_path_, quarantine, ec);
    if (!ec) {
        result.quarantined_path = quarantine.string();
    }
    return result;
}

StoreStatus LedgerStoreJson::save(const PositionMap& positions) {
    return writeAtomically(file_path_, toJson(positions)) ? StoreStatus::OK : StoreStatus::WRITE_FAILED;
}

StoreStatus LedgerStoreJson::backup(const PositionMap& positions, const std::string& tag,
                                    std::string* written_path) {
    auto target = file_path_.parent_path() /
        (file_path_.stem().string() + ".backup." + tag + file_path_.extension().string());

    if (!writeAtomically(target, toJson(positions))) {
        return StoreStatus::WRITE_FAILED;
    }
    if (written_path) {
        *written_path = target.string();
    }
    return StoreStatus::OK;
}

bool LedgerStoreJson::writeAtomically(const std::filesystem::path& target, const nlohmann::json& raw) {
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    auto tmp_path = target;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << raw.dump(2);
        out.flush();
        if (!out.good()) {
            out.close();
            std::filesystem::remove(tmp_path, ec);
            return false;
        }
    }

    std::filesystem::rename(tmp_path, target, ec);
    if (!ec) {
        return true;
    }

    // Previous durable file stays untouched; only the temp file goes away.
    std::error_code cleanup_ec;
    std::filesystem::remove(tmp_path, cleanup_ec);
    return false;
}

} // namespace core
} // namespace kestrel
