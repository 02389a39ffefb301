#include "core/state/EventJournalJsonl.h"

#include <algorithm>
#include <fstream>

#include "common/TimeUtils.h"

namespace kestrel {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}

std::optional<nlohmann::json> parseLine(const std::string& row) {
    if (row.empty()) {
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(row);
    } catch (const nlohmann::json::parse_error&) {
        // Torn tail from a crash mid-append
        return std::nullopt;
    }
}
}

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        const auto line = parseLine(row);
        if (line && line->is_object()) {
            last_seq_ = (std::max)(last_seq_, parseSeq(*line));
        }
    }
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = event.ts_ms > 0 ? event.ts_ms : utils::TimeUtils::nowMs();
    line["type"] = toString(event.type);
    line["ticker"] = event.ticker;
    line["entity_id"] = event.entity_id;
    line["payload"] = event.payload.is_null() ? nlohmann::json::object() : event.payload;

    out << line.dump() << "\n";
    out.flush();
    if (!out.good()) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        const auto line = parseLine(row);
        if (!line || !line->is_object()) {
            continue;
        }

        const auto seq = parseSeq(*line);
        if (seq < seq_inclusive) {
            continue;
        }

        const auto type = fromString(line->value("type", std::string()));
        if (!type) {
            continue;
        }

        JournalEvent event;
        event.seq = seq;
        event.ts_ms = line->value("ts_ms", 0LL);
        event.type = *type;
        event.ticker = line->value("ticker", std::string());
        event.entity_id = line->value("entity_id", std::string());
        event.payload = line->value("payload", nlohmann::json::object());
        out.push_back(std::move(event));
    }

    return out;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::string EventJournalJsonl::toString(JournalEventType type) {
    switch (type) {
        case JournalEventType::POSITION_OPENED: return "POSITION_OPENED";
        case JournalEventType::POSITION_CLOSED: return "POSITION_CLOSED";
        case JournalEventType::POSITION_CANCELLED: return "POSITION_CANCELLED";
        case JournalEventType::ORDER_SUBMITTED: return "ORDER_SUBMITTED";
        case JournalEventType::ORDER_QUEUED: return "ORDER_QUEUED";
        case JournalEventType::ORDER_DROPPED: return "ORDER_DROPPED";
        case JournalEventType::RECONCILE_UNKNOWN: return "RECONCILE_UNKNOWN";
        case JournalEventType::ALLOCATION_CHANGED: return "ALLOCATION_CHANGED";
    }
    return "ORDER_SUBMITTED";
}

std::optional<JournalEventType> EventJournalJsonl::fromString(const std::string& value) {
    if (value == "POSITION_OPENED") return JournalEventType::POSITION_OPENED;
    if (value == "POSITION_CLOSED") return JournalEventType::POSITION_CLOSED;
    if (value == "POSITION_CANCELLED") return JournalEventType::POSITION_CANCELLED;
    if (value == "ORDER_SUBMITTED") return JournalEventType::ORDER_SUBMITTED;
    if (value == "ORDER_QUEUED") return JournalEventType::ORDER_QUEUED;
    if (value == "ORDER_DROPPED") return JournalEventType::ORDER_DROPPED;
    if (value == "RECONCILE_UNKNOWN") return JournalEventType::RECONCILE_UNKNOWN;
    if (value == "ALLOCATION_CHANGED") return JournalEventType::ALLOCATION_CHANGED;
    return std::nullopt;
}

} // namespace core
} // namespace kestrel
