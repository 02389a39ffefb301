#include "execution/OrderErrorClassifier.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace kestrel {
namespace execution {

std::string toString(OrderErrorKind kind) {
    switch (kind) {
        case OrderErrorKind::NONE: return "NONE";
        case OrderErrorKind::TRANSIENT: return "TRANSIENT";
        case OrderErrorKind::PERMANENT: return "PERMANENT";
    }
    return "PERMANENT";
}

OrderErrorKind OrderErrorClassifier::classify(const network::OrderAck& ack) {
    if (ack.success) {
        return OrderErrorKind::NONE;
    }
    return classifyMessage(ack.error.value_or(std::string()), ack.status_code);
}

OrderErrorKind OrderErrorClassifier::classifyMessage(const std::string& error, int status_code) {
    if (status_code == 404) {
        return OrderErrorKind::TRANSIENT;
    }

    std::string lower = error;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(lower.begin(), lower.end(), '_', ' ');

    static const std::array<const char*, 5> kTransientMarkers = {
        "not found", "closed", "not open", "expired", "rolled"
    };
    for (const char* marker : kTransientMarkers) {
        if (lower.find(marker) != std::string::npos) {
            return OrderErrorKind::TRANSIENT;
        }
    }
    return OrderErrorKind::PERMANENT;
}

} // namespace execution
} // namespace kestrel
