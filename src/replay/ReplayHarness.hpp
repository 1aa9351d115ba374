#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/models.hpp"
#include "session/ports.hpp"

namespace scrollkeep {

class ExportSession;
class RateLimitHandlers;

// One recorded API response. status 429 replays a rate limit hit, 401/403
// an auth failure, 5xx a page error state.
struct RecordedResponse {
    CaptureEvent event;
    int status = 200;
};

// Accepts a bare array or {"responses": [...]}. Entries that are not
// objects are skipped.
std::vector<RecordedResponse> loadRecordedResponses(const nlohmann::json &document);

// Feeds one recorded response per scroll step. The extent grows with every
// delivered page, so an exhausted recording reads as a stable timeline.
class ReplayPageDriver : public PageDriver {
public:
    explicit ReplayPageDriver(std::vector<RecordedResponse> responses,
                              std::string route = "/");

    void attach(RateLimitHandlers *handlers);

    void triggerScrollStep() override;
    int64_t currentExtent() override;
    bool detectErrorState() override;
    void retry() override;
    bool detectRouteChange() override;
    std::string currentRoute() override;

    size_t delivered() const;

private:
    std::vector<RecordedResponse> m_responses;
    std::string m_route;
    RateLimitHandlers *m_handlers = nullptr;
    size_t m_next = 0;
    int64_t m_extent = 0;
    bool m_errorPending = false;
};

// Answers every prompt the way an unattended run should: download when the
// timeline looks done, resume after limits, go back after navigation.
class ReplayPresentation : public PresentationHooks {
public:
    void attach(ExportSession *session);

    void looksDone(int responsesCaptured) override;
    void routeChanged(const std::string &route, int responsesCaptured) override;
    void rateLimited(const RateLimitState &state, int responsesCaptured) override;

private:
    ExportSession *m_session = nullptr;
};

// Writes deliveries into a directory, atomically per file.
class DirectoryExportSink : public ExportSink {
public:
    explicit DirectoryExportSink(QString directory);

    void deliver(const std::string &filename,
                 const std::string &content,
                 const std::string &mimeType) override;

    const std::vector<std::string> &writtenFiles() const;

private:
    QString m_directory;
    std::vector<std::string> m_written;
};

struct ReplayOptions {
    QString responsesPath;
    std::string username;
    std::string userId = "unknown";
    bool resume = false;
    QString outDir;
};

class ReplayHarness {
public:
    explicit ReplayHarness(ExportConfig config);

    // returns exit code
    int run(const ReplayOptions &options);

private:
    ExportConfig m_config;
};

} // namespace scrollkeep
