#include "execution/RateLimiter.h"

#include <algorithm>
#include <cmath>

#include "common/Logger.h"

namespace kestrel {
namespace execution {

constexpr std::chrono::milliseconds RateLimiter::kDefaultPause;

RateLimiter::RateLimiter(std::shared_ptr<spdlog::logger> logger)
    : logger_(Logger::orSilent(std::move(logger))) {
    // Exchange basic tier: 20 reads/s, 10 writes/s
    setLimit("market", 20.0);
    setLimit("portfolio", 20.0);
    setLimit("order", 10.0);
    setLimit("default", 10.0);
}

void RateLimiter::setLimit(const std::string& group, double rate_per_second, int burst) {
    Bucket bucket;
    bucket.rate = std::max(0.1, rate_per_second);
    bucket.capacity = burst > 0 ? burst : std::max(1.0, std::floor(bucket.rate));
    bucket.tokens = bucket.capacity;
    bucket.refilled_at = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    buckets_[group] = bucket;
}

RateLimiter::Bucket& RateLimiter::bucketFor(const std::string& group) {
    auto it = buckets_.find(group);
    if (it == buckets_.end()) {
        it = buckets_.find("default");
    }
    return it->second;
}

void RateLimiter::refill(Bucket& bucket, Clock::time_point now) const {
    const double elapsed = std::chrono::duration<double>(now - bucket.refilled_at).count();
    if (elapsed <= 0.0) {
        return;
    }
    bucket.tokens = std::min(bucket.capacity, bucket.tokens + elapsed * bucket.rate);
    bucket.refilled_at = now;
}

RateLimiter::Clock::duration RateLimiter::untilNextToken(const Bucket& bucket) const {
    const double missing = std::max(0.0, 1.0 - bucket.tokens);
    return std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(missing / bucket.rate));
}

bool RateLimiter::tryAcquire(const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    if (now < paused_until_) {
        stats_.rejected++;
        return false;
    }

    auto& bucket = bucketFor(group);
    refill(bucket, now);
    if (bucket.tokens < 1.0) {
        stats_.rejected++;
        return false;
    }
    bucket.tokens -= 1.0;
    stats_.granted++;
    return true;
}

void RateLimiter::acquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto& bucket = bucketFor(group);
    bool waited = false;
    const auto started = Clock::now();

    while (true) {
        const auto now = Clock::now();
        if (now < paused_until_) {
            waited = true;
            cv_.wait_until(lock, paused_until_);
            continue;
        }

        refill(bucket, now);
        if (bucket.tokens >= 1.0) {
            bucket.tokens -= 1.0;
            stats_.granted++;
            break;
        }
        waited = true;
        cv_.wait_for(lock, untilNextToken(bucket));
    }

    if (waited) {
        stats_.waits++;
        stats_.waited += std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    }
}

int RateLimiter::available(const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = bucketFor(group);
    refill(bucket, Clock::now());
    return static_cast<int>(std::floor(bucket.tokens));
}

void RateLimiter::onResponse(int status_code, std::chrono::milliseconds retry_after) {
    if (status_code != 429) {
        return;
    }
    const auto pause = retry_after.count() > 0 ? retry_after : kDefaultPause;

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.throttled_responses++;
    paused_until_ = std::max(paused_until_, Clock::now() + pause);
    logger_->warn("HTTP 429 from exchange, pausing all request groups for {}ms", pause.count());
}

RateLimiter::Stats RateLimiter::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace execution
} // namespace kestrel
