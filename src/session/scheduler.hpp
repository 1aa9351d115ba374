#pragma once

#include <atomic>
#include <cstdint>
#include <functional>

#include "session/ports.hpp"

namespace scrollkeep {

// Wall clock; sleeps block the calling thread.
class SystemScheduler : public Scheduler {
public:
    int64_t now() override;
    void sleep(int64_t ms) override;
};

// Time only moves when the loop sleeps. Used by tests and by replay, where
// an optional hook runs on each sleep to feed recorded events.
class VirtualScheduler : public Scheduler {
public:
    explicit VirtualScheduler(int64_t startMs = 0);

    int64_t now() override;
    void sleep(int64_t ms) override;

    void advance(int64_t ms);
    int64_t totalSlept() const;
    int sleepCount() const;

    void setSleepHook(std::function<void(int64_t nowMs)> hook);

private:
    std::atomic<int64_t> m_now;
    std::atomic<int64_t> m_totalSlept{0};
    std::atomic<int> m_sleepCount{0};
    std::function<void(int64_t)> m_sleepHook;
};

} // namespace scrollkeep
