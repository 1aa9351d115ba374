#pragma once

#include <mutex>
#include <vector>

#include "session/ports.hpp"

namespace scrollkeep {

// Mutex-guarded store of intercepted responses for one export run.
class CaptureBuffer : public CaptureSink {
public:
    size_t append(CaptureEvent event) override;
    size_t size() const override;
    std::vector<CaptureEvent> snapshot() const override;
    std::vector<CaptureEvent> drain() override;

    void clear();

private:
    mutable std::mutex m_mutex;
    std::vector<CaptureEvent> m_events;
};

} // namespace scrollkeep
