#include "clock.hpp"
#include "util.hpp"

uint64_t SystemClock::now_seconds() const {
    return static_cast<uint64_t>(util::current_timestamp_ms() / 1000);
}

ManualClock::ManualClock(uint64_t start_seconds) : now_(start_seconds) {}

uint64_t ManualClock::now_seconds() const {
    return now_;
}

// Never moves backwards
void ManualClock::set(uint64_t seconds) {
    if (seconds > now_) now_ = seconds;
}

void ManualClock::advance(uint64_t seconds) {
    now_ += seconds;
}
