#pragma once
#include <atomic>
#include <chrono>
#include "Types.hpp"

// Wall clock shared by the cache, the matcher and the animator.
// Pinning it makes TTL and animation arithmetic deterministic.
class VirtualClock
{
public:
    void set(Timestamp t)
    {
        value.store(t.time_since_epoch().count(), std::memory_order_relaxed);
        enabled.store(true, std::memory_order_relaxed);
    }

    void advance(std::chrono::milliseconds delta)
    {
        set(now() + delta);
    }

    void disable()
    {
        enabled.store(false, std::memory_order_relaxed);
    }

    Timestamp now() const
    {
        if (enabled.load(std::memory_order_relaxed))
            return Timestamp(Timestamp::duration(value.load(std::memory_order_relaxed)));
        return std::chrono::system_clock::now();
    }

private:
    std::atomic<bool> enabled{false};
    std::atomic<Timestamp::rep> value{0};
};
