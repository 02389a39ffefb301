#pragma once

#include <string>

#include "network/IExchangeClient.h"

namespace kestrel {
namespace execution {

enum class OrderErrorKind {
    NONE,
    TRANSIENT,      // target market rolled over / closed / not found: retry later
    PERMANENT       // any other rejection: drop
};

std::string toString(OrderErrorKind kind);

class OrderErrorClassifier {
public:
    static OrderErrorKind classify(const network::OrderAck& ack);
    static OrderErrorKind classifyMessage(const std::string& error, int status_code = 0);
};

} // namespace execution
} // namespace kestrel
