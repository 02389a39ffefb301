#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace kestrel {

using Timestamp = std::chrono::system_clock::time_point;
using Cents = int;
using Dollars = double;

// Contract side on a binary market
enum class Side { YES, NO };

enum class PositionStatus { OPEN, CLOSED, CANCELLED };

// Two parallel, independently persisted ledgers
enum class Universe { REAL, SIMULATED };

std::string toString(Side side);
std::optional<Side> sideFromString(const std::string& value);
Side oppositeSide(Side side);

std::string toString(PositionStatus status);
std::optional<PositionStatus> positionStatusFromString(const std::string& value);

std::string toString(Universe universe);

inline Universe universeFor(bool simulated) {
    return simulated ? Universe::SIMULATED : Universe::REAL;
}

} // namespace kestrel
