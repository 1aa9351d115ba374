#pragma once

#include <cstdint>

#include "common/config.hpp"
#include "session/ports.hpp"
#include "session/session_context.hpp"

namespace scrollkeep {

enum class StepOutcome {
    Continue,
    Finished
};

// Drives the page one scroll step at a time. Every wait goes through the
// session scheduler, so a virtual clock runs the loop without real delays.
class ScrollOrchestrator {
public:
    ScrollOrchestrator(SessionContext &context,
                       PageDriver &driver,
                       PresentationHooks &presentation,
                       const ExportConfig &config);

    // One loop iteration. Finished once cancelled, past maxScrolls or
    // the extent has not moved for maxNoChangeSteps steps.
    StepOutcome step();

    // Steps until finished and returns the number of captured responses.
    int run();

    int scrollCount() const;
    int noChangeCount() const;

private:
    void runCooldownCycle();
    StepOutcome captureStep();
    bool limitReached() const;
    int responsesCaptured() const;

    SessionContext &m_context;
    PageDriver &m_driver;
    PresentationHooks &m_presentation;
    ExportConfig m_config;

    int m_scrollCount = 0;
    int m_noChangeCount = 0;
    int64_t m_lastExtent = 0;
};

} // namespace scrollkeep
