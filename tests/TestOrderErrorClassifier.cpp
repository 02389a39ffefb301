#include "execution/OrderErrorClassifier.h"

#include <cassert>
#include <iostream>

using namespace kestrel;
using execution::OrderErrorClassifier;
using execution::OrderErrorKind;

namespace {

network::OrderAck failure(const std::string& error, int status_code) {
    network::OrderAck ack;
    ack.success = false;
    ack.error = error;
    ack.status_code = status_code;
    return ack;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting OrderErrorClassifier Test..." << std::endl;

    network::OrderAck ok;
    ok.success = true;
    assert(OrderErrorClassifier::classify(ok) == OrderErrorKind::NONE);

    // Market rolled or closed between detection and execution
    assert(OrderErrorClassifier::classify(failure("", 404)) == OrderErrorKind::TRANSIENT);
    assert(OrderErrorClassifier::classify(failure("{\"code\":\"market_not_found\"}", 400))
           == OrderErrorKind::TRANSIENT);
    assert(OrderErrorClassifier::classify(failure("Market CLOSED", 400)) == OrderErrorKind::TRANSIENT);
    assert(OrderErrorClassifier::classify(failure("market is not open", 409)) == OrderErrorKind::TRANSIENT);
    assert(OrderErrorClassifier::classify(failure("event expired", 400)) == OrderErrorKind::TRANSIENT);
    assert(OrderErrorClassifier::classify(failure("window rolled over", 400)) == OrderErrorKind::TRANSIENT);

    // Everything else is final
    assert(OrderErrorClassifier::classify(failure("insufficient_balance", 400)) == OrderErrorKind::PERMANENT);
    assert(OrderErrorClassifier::classify(failure("invalid price", 400)) == OrderErrorKind::PERMANENT);
    assert(OrderErrorClassifier::classify(failure("", 500)) == OrderErrorKind::PERMANENT);

    network::OrderAck no_message;
    assert(OrderErrorClassifier::classify(no_message) == OrderErrorKind::PERMANENT);

    assert(execution::toString(OrderErrorKind::TRANSIENT) == "TRANSIENT");

    std::cout << "[TEST] OrderErrorClassifier PASSED" << std::endl;
    return 0;
}
