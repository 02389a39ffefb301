#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>

namespace kestrel {
namespace execution {

// Token bucket per endpoint group ("market", "portfolio", "order").
// Buckets refill continuously at rate_per_second up to burst. A 429 from the
// exchange pauses every group until the server's Retry-After has elapsed.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    struct Stats {
        int granted = 0;
        int rejected = 0;
        int waits = 0;
        int throttled_responses = 0;
        std::chrono::milliseconds waited{0};
    };

    explicit RateLimiter(std::shared_ptr<spdlog::logger> logger = nullptr);

    // Adds or replaces a group; burst defaults to one second of tokens
    void setLimit(const std::string& group, double rate_per_second, int burst = 0);

    // Non-blocking; false while the bucket is empty or a pause is active
    bool tryAcquire(const std::string& group);
    // Blocks until a token is available
    void acquire(const std::string& group);

    // Whole tokens left in the group's bucket
    int available(const std::string& group);

    // Feed every response status here; only 429 has an effect
    void onResponse(int status_code, std::chrono::milliseconds retry_after = std::chrono::milliseconds(0));

    Stats stats() const;

private:
    struct Bucket {
        double rate = 1.0;
        double capacity = 1.0;
        double tokens = 1.0;
        Clock::time_point refilled_at;
    };

    Bucket& bucketFor(const std::string& group);
    void refill(Bucket& bucket, Clock::time_point now) const;
    // Time until the bucket holds one token
    Clock::duration untilNextToken(const Bucket& bucket) const;

    static constexpr std::chrono::milliseconds kDefaultPause{1000};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Bucket> buckets_;
    Clock::time_point paused_until_{};
    Stats stats_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace execution
} // namespace kestrel
