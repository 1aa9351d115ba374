#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace scrollkeep {

// Receives intercepted API responses, possibly from another thread.
class CaptureSink {
public:
    virtual ~CaptureSink() = default;

    // Returns the number of captured responses after the append.
    virtual size_t append(CaptureEvent event) = 0;
    virtual size_t size() const = 0;
    virtual std::vector<CaptureEvent> snapshot() const = 0;
    virtual std::vector<CaptureEvent> drain() = 0;
};

// The page being scrolled. All calls come from the driving loop.
class PageDriver {
public:
    virtual ~PageDriver() = default;

    virtual void triggerScrollStep() = 0;
    // Scrollable height of the timeline; unchanged extent means no new rows.
    virtual int64_t currentExtent() = 0;
    virtual bool detectErrorState() = 0;
    virtual void retry() = 0;
    // True once per navigation away from the exported timeline.
    virtual bool detectRouteChange() = 0;
    virtual std::string currentRoute() = 0;
};

// Outbound notifications to whatever renders the session. Every hook has
// an empty default so a frontend overrides only what it shows.
class PresentationHooks {
public:
    virtual ~PresentationHooks() = default;

    virtual void showCooldown(int64_t /*durationMs*/, const std::string & /*reason*/) {}
    virtual void updateCooldown(int64_t /*remainingMs*/) {}
    virtual void hideCooldown() {}
    virtual void updateStatus(const std::string & /*text*/) {}
    virtual void updateProgress(int /*scrollCount*/, int /*responsesCaptured*/) {}
    virtual void looksDone(int /*responsesCaptured*/) {}
    virtual void routeChanged(const std::string & /*route*/, int /*responsesCaptured*/) {}
    virtual void rateLimited(const RateLimitState & /*state*/, int /*responsesCaptured*/) {}
    virtual void resumeLinkReady(const std::string & /*url*/) {}
    virtual void exportComplete(const std::string & /*filename*/, int /*itemCount*/) {}
};

// Where finished exports go. Throws std::runtime_error when delivery fails.
class ExportSink {
public:
    virtual ~ExportSink() = default;

    virtual void deliver(const std::string &filename,
                         const std::string &content,
                         const std::string &mimeType) = 0;
};

// Clock and suspension for the driving loop.
class Scheduler {
public:
    virtual ~Scheduler() = default;

    virtual int64_t now() = 0;
    virtual void sleep(int64_t ms) = 0;
};

} // namespace scrollkeep
