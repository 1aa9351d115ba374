#pragma once

#include <functional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "session/ports.hpp"

namespace scrollkeep::testing {

// Scripted page: the extent grows by growthPerStep until growthSteps scrolls
// have happened, then stays put.
class FakePageDriver : public PageDriver {
public:
    int growthSteps = 1000000;
    int64_t growthPerStep = 500;
    std::set<int> errorAfterScroll;
    int routeChangeAfterScroll = -1;
    std::string route = "/alice";
    std::function<void(int scroll)> onScroll;

    int scrolls = 0;
    int retries = 0;

    void triggerScrollStep() override
    {
        ++scrolls;
        if (scrolls <= growthSteps) {
            m_extent += growthPerStep;
        }
        if (onScroll) {
            onScroll(scrolls);
        }
    }

    int64_t currentExtent() override
    {
        return m_extent;
    }

    bool detectErrorState() override
    {
        return errorAfterScroll.erase(scrolls) > 0;
    }

    void retry() override
    {
        ++retries;
    }

    bool detectRouteChange() override
    {
        if (routeChangeAfterScroll >= 0 && scrolls >= routeChangeAfterScroll) {
            routeChangeAfterScroll = -1;
            route = "/home";
            return true;
        }
        return false;
    }

    std::string currentRoute() override
    {
        return route;
    }

private:
    int64_t m_extent = 0;
};

// Records every presentation call; callbacks let a test answer prompts.
class RecordingPresentation : public PresentationHooks {
public:
    std::vector<std::pair<int64_t, std::string>> cooldownsShown;
    int cooldownUpdates = 0;
    int cooldownsHidden = 0;
    std::vector<std::string> statuses;
    int progressUpdates = 0;
    int looksDoneCalls = 0;
    std::vector<std::string> routes;
    int rateLimitedCalls = 0;
    std::vector<std::string> resumeLinks;
    std::vector<std::pair<std::string, int>> completed;

    std::function<void()> onLooksDone;
    std::function<void()> onRouteChanged;
    std::function<void()> onRateLimited;
    std::function<void()> onCooldownUpdate;

    void showCooldown(int64_t durationMs, const std::string &reason) override
    {
        cooldownsShown.emplace_back(durationMs, reason);
    }

    void updateCooldown(int64_t) override
    {
        ++cooldownUpdates;
        if (onCooldownUpdate) {
            onCooldownUpdate();
        }
    }

    void hideCooldown() override
    {
        ++cooldownsHidden;
    }

    void updateStatus(const std::string &text) override
    {
        statuses.push_back(text);
    }

    void updateProgress(int, int) override
    {
        ++progressUpdates;
    }

    void looksDone(int) override
    {
        ++looksDoneCalls;
        if (onLooksDone) {
            onLooksDone();
        }
    }

    void routeChanged(const std::string &newRoute, int) override
    {
        routes.push_back(newRoute);
        if (onRouteChanged) {
            onRouteChanged();
        }
    }

    void rateLimited(const RateLimitState &, int) override
    {
        ++rateLimitedCalls;
        if (onRateLimited) {
            onRateLimited();
        }
    }

    void resumeLinkReady(const std::string &url) override
    {
        resumeLinks.push_back(url);
    }

    void exportComplete(const std::string &filename, int itemCount) override
    {
        completed.emplace_back(filename, itemCount);
    }
};

struct DeliveredFile {
    std::string filename;
    std::string content;
    std::string mimeType;
};

class MemoryExportSink : public ExportSink {
public:
    bool fail = false;
    std::vector<DeliveredFile> files;

    void deliver(const std::string &filename,
                 const std::string &content,
                 const std::string &mimeType) override
    {
        if (fail) {
            throw std::runtime_error("download blocked");
        }
        files.push_back(DeliveredFile{filename, content, mimeType});
    }
};

} // namespace scrollkeep::testing
