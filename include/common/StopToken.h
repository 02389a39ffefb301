#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace kestrel {

// Shared cancellation flag. waitFor() doubles as an interruptible sleep so
// worker loops stop promptly instead of finishing their interval.
class StopSource {
public:
    void requestStop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_.store(true);
        }
        cv_.notify_all();
    }

    bool stopRequested() const { return stopped_.load(); }

    // Returns true if stop was requested before the timeout elapsed
    template <typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return stopped_.load(); });
    }

private:
    std::atomic<bool> stopped_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

class StopToken {
public:
    StopToken() = default;
    explicit StopToken(std::shared_ptr<StopSource> source) : source_(std::move(source)) {}

    bool stopRequested() const { return source_ && source_->stopRequested(); }

    template <typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        if (!source_) {
            return false;
        }
        return source_->waitFor(timeout);
    }

private:
    std::shared_ptr<StopSource> source_;
};

} // namespace kestrel
