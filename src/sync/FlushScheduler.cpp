#include "sync/FlushScheduler.hpp"

using namespace mfsync::sync;

FlushScheduler::FlushScheduler(std::optional<std::chrono::milliseconds> interval, FlushFn flush, NowFn now)
    : interval_(interval),
      flush_(std::move(flush)),
      now_(std::move(now)),
      nextFlushDeadline_(now_()) {}

void FlushScheduler::tick() {
    if (!enabled()) return;

    const auto now = now_();
    if (now <= nextFlushDeadline_) return;

    flush_();
    ++flushes_;
    nextFlushDeadline_ = now + *interval_;
}
