#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace kestrel {
namespace utils {

class TimeUtils {
public:
    // ISO-8601 local time, second precision (2026-02-03T15:04:05)
    static std::string toIso(Timestamp ts);
    static std::string nowIso();
    static std::optional<Timestamp> parseIso(const std::string& text);

    // strftime-formatted local time, used for backup / quarantine suffixes
    static std::string format(Timestamp ts, const char* pattern);

    static long long toEpochMs(Timestamp ts);
    static long long nowMs();
};

} // namespace utils
} // namespace kestrel
