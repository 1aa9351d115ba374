#include "session/scheduler.hpp"

#include <QThread>

#include "common/time_utils.hpp"

namespace scrollkeep {

int64_t SystemScheduler::now()
{
    return nowEpochMillis();
}

void SystemScheduler::sleep(int64_t ms)
{
    if (ms > 0) {
        QThread::msleep(static_cast<unsigned long>(ms));
    }
}

VirtualScheduler::VirtualScheduler(int64_t startMs)
    : m_now(startMs)
{
}

int64_t VirtualScheduler::now()
{
    return m_now.load();
}

void VirtualScheduler::sleep(int64_t ms)
{
    if (ms > 0) {
        m_now += ms;
        m_totalSlept += ms;
    }
    ++m_sleepCount;
    if (m_sleepHook) {
        m_sleepHook(m_now.load());
    }
}

void VirtualScheduler::advance(int64_t ms)
{
    m_now += ms;
}

int64_t VirtualScheduler::totalSlept() const
{
    return m_totalSlept.load();
}

int VirtualScheduler::sleepCount() const
{
    return m_sleepCount.load();
}

void VirtualScheduler::setSleepHook(std::function<void(int64_t nowMs)> hook)
{
    m_sleepHook = std::move(hook);
}

} // namespace scrollkeep
