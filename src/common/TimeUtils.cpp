#include "common/TimeUtils.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace kestrel {
namespace utils {

std::string TimeUtils::format(Timestamp ts, const char* pattern) {
    const std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, pattern);
    return oss.str();
}

std::string TimeUtils::toIso(Timestamp ts) {
    return format(ts, "%Y-%m-%dT%H:%M:%S");
}

std::string TimeUtils::nowIso() {
    return toIso(std::chrono::system_clock::now());
}

std::optional<Timestamp> TimeUtils::parseIso(const std::string& text) {
    if (text.size() < 19) {
        return std::nullopt;
    }

    std::tm local{};
    std::istringstream iss(text.substr(0, 19));
    iss >> std::get_time(&local, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    local.tm_isdst = -1;

    const std::time_t t = std::mktime(&local);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

long long TimeUtils::toEpochMs(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()
    ).count();
}

long long TimeUtils::nowMs() {
    return toEpochMs(std::chrono::system_clock::now());
}

} // namespace utils
} // namespace kestrel
