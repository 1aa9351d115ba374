#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/models.hpp"
#include "session/ports.hpp"
#include "session/rate_limit_handlers.hpp"
#include "session/resume_session.hpp"
#include "session/session_context.hpp"

namespace scrollkeep {

struct ExportRequest {
    std::string username;
    std::string userId = "unknown";
    std::string displayName;
    // Provider-reported total for the account, when the lookup had one.
    std::optional<int64_t> reportedCount;
    // Load the durable resume snapshot for this user before scrolling.
    bool resume = false;
    // Search query the page runs, used for resume links.
    std::string currentQuery;
};

enum class ExportStatus {
    Delivered,
    Cancelled,
    DeliveryFailed
};

struct ExportOutcome {
    ExportStatus status = ExportStatus::Cancelled;
    std::string filename;
    int itemCount = 0;
    int responsesCaptured = 0;
    std::optional<MergeInfo> mergeInfo;
    nlohmann::json meta;
};

// One export run from first scroll to delivered file. The inbound command
// handlers may be called from another thread while runExportSession runs.
class ExportSession {
public:
    ExportSession(SessionContext &context,
                  PageDriver &driver,
                  PresentationHooks &presentation,
                  ExportSink &sink,
                  ResumeSession &resume,
                  const ExportConfig &config);

    ExportOutcome runExportSession(const ExportRequest &request);

    RateLimitHandlers &rateLimitHandlers();

    // Consolidated rows so far (current captures merged with resume rows),
    // newest first.
    MergeResult collectConsolidated() const;

    // Writes a partial export and checkpoints the rows as a resume snapshot.
    bool saveProgress();

    // Checkpoints the rows and returns a search URL continuing below the
    // oldest collected row.
    std::optional<std::string> resumeLink();

    void onSkip();
    void onStop();
    void onDownload();
    void onContinue();
    void onResumeLink();
    void onCancel();
    void onTryNow();
    void onGoBack();
    void onSaveProgress();

private:
    void cancelExport();
    void resumeFromConfirmation(const char *reason);
    std::string resolveUserId(const TweetList &rows);

    SessionContext &m_context;
    PageDriver &m_driver;
    PresentationHooks &m_presentation;
    ExportSink &m_sink;
    ResumeSession &m_resume;
    ExportConfig m_config;
    RateLimitHandlers m_handlers;

    std::string m_displayName;
    std::string m_currentQuery;
};

} // namespace scrollkeep
