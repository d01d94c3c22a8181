#pragma once
#include <atomic>
#include <ctime>

// Process clock that replay mode pins to the recorded feed time.
class VirtualClock
{
public:
    static void set(std::time_t t)
    {
        value.store(t, std::memory_order_relaxed);
        enabled.store(true, std::memory_order_relaxed);
    }

    static void disable()
    {
        enabled.store(false, std::memory_order_relaxed);
    }

    static bool isVirtual()
    {
        return enabled.load(std::memory_order_relaxed);
    }

    static std::time_t now()
    {
        if (enabled.load(std::memory_order_relaxed))
            return value.load(std::memory_order_relaxed);
        return std::time(nullptr);
    }

private:
    static inline std::atomic<bool> enabled{false};
    static inline std::atomic<std::time_t> value{0};
};
