#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace mfsync::sync {

// Bounds how often uploads trigger an explicit flush. The first upload after construction
// flushes; later ones flush only once `interval` has passed since the previous flush.
class FlushScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;
    using FlushFn = std::function<void()>;

    FlushScheduler(std::optional<std::chrono::milliseconds> interval, FlushFn flush, NowFn now = &Clock::now);

    // Called after every upload. Throws whatever the flush throws.
    void tick();

    [[nodiscard]] bool enabled() const { return interval_ && interval_->count() > 0; }
    [[nodiscard]] uint64_t flushes() const { return flushes_; }
    [[nodiscard]] Clock::time_point nextFlushDeadline() const { return nextFlushDeadline_; }

private:
    std::optional<std::chrono::milliseconds> interval_;
    FlushFn flush_;
    NowFn now_;
    Clock::time_point nextFlushDeadline_;
    uint64_t flushes_{};
};

}
