#include "session/capture_buffer.hpp"

namespace scrollkeep {

size_t CaptureBuffer::append(CaptureEvent event)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.push_back(std::move(event));
    return m_events.size();
}

size_t CaptureBuffer::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

std::vector<CaptureEvent> CaptureBuffer::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events;
}

std::vector<CaptureEvent> CaptureBuffer::drain()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<CaptureEvent> events;
    events.swap(m_events);
    return events;
}

void CaptureBuffer::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.clear();
}

} // namespace scrollkeep
