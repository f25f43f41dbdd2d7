#pragma once

#include <cstdint>

// Source of wall-clock seconds for cooldown checks. Must never go backwards.
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint64_t now_seconds() const = 0;
};

class SystemClock : public Clock {
public:
    uint64_t now_seconds() const override;
};

// Advanced explicitly; used for replays and tests
class ManualClock : public Clock {
public:
    explicit ManualClock(uint64_t start_seconds = 0);

    uint64_t now_seconds() const override;
    void set(uint64_t seconds);
    void advance(uint64_t seconds);

private:
    uint64_t now_;
};
