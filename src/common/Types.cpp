#include "common/Types.h"

#include <algorithm>
#include <cctype>

namespace kestrel {

namespace {
std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}
}

std::string toString(Side side) {
    return side == Side::YES ? "YES" : "NO";
}

std::optional<Side> sideFromString(const std::string& value) {
    const std::string upper = toUpperCopy(value);
    if (upper == "YES" || upper == "BUY") return Side::YES;
    if (upper == "NO" || upper == "SELL") return Side::NO;
    return std::nullopt;
}

Side oppositeSide(Side side) {
    return side == Side::YES ? Side::NO : Side::YES;
}

std::string toString(PositionStatus status) {
    switch (status) {
        case PositionStatus::OPEN: return "open";
        case PositionStatus::CLOSED: return "closed";
        case PositionStatus::CANCELLED: return "cancelled";
    }
    return "open";
}

std::optional<PositionStatus> positionStatusFromString(const std::string& value) {
    const std::string upper = toUpperCopy(value);
    if (upper == "OPEN") return PositionStatus::OPEN;
    if (upper == "CLOSED") return PositionStatus::CLOSED;
    if (upper == "CANCELLED" || upper == "CANCELED") return PositionStatus::CANCELLED;
    return std::nullopt;
}

std::string toString(Universe universe) {
    return universe == Universe::SIMULATED ? "SIMULATED" : "REAL";
}

} // namespace kestrel
