#pragma once

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "session/ports.hpp"
#include "session/session_context.hpp"

namespace scrollkeep {

// Routes capture-layer signals into the rate limit controller and the
// lifecycle. Safe to call from the capture thread.
class RateLimitHandlers {
public:
    RateLimitHandlers(SessionContext &context, PresentationHooks &presentation);

    // Folds quota info into the state; either trigger switches the session
    // into cooldown.
    void applyRateLimitUpdate(const nlohmann::json &info);

    void handleInterceptedResponse(CaptureEvent event);

    // Provider 429. Ignored unless exporting and not already limited.
    void handleRateLimitHit(const nlohmann::json &info);

    void handleAuthError();

    // Manual resume out of the hard-limit pause.
    void resumeManual();

private:
    void notifyRateLimited();

    SessionContext &m_context;
    PresentationHooks &m_presentation;
};

} // namespace scrollkeep
