#include "session/export_session.hpp"

#include <QUuid>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"
#include "engine/export_meta.hpp"
#include "engine/merge_engine.hpp"
#include "engine/resume_link.hpp"
#include "engine/tweet_row_builder.hpp"
#include "session/scroll_orchestrator.hpp"

namespace scrollkeep {

namespace {

const QString kComponent = QStringLiteral("ExportSession");
const std::string kJsonMime = "application/json";

std::string partialFilename(const std::string &username, int64_t nowMs)
{
    std::string stamp = toIso8601Utc(nowMs);
    for (char &c : stamp) {
        if (c == ':' || c == '.') {
            c = '-';
        }
    }
    return username + "_tweets_PARTIAL_" + stamp + ".json";
}

std::string dumpPayload(const nlohmann::json &payload)
{
    return payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

ExportSession::ExportSession(SessionContext &context,
                             PageDriver &driver,
                             PresentationHooks &presentation,
                             ExportSink &sink,
                             ResumeSession &resume,
                             const ExportConfig &config)
    : m_context(context)
    , m_driver(driver)
    , m_presentation(presentation)
    , m_sink(sink)
    , m_resume(resume)
    , m_config(config)
    , m_handlers(context, presentation)
{
}

RateLimitHandlers &ExportSession::rateLimitHandlers()
{
    return m_handlers;
}

ExportOutcome ExportSession::runExportSession(const ExportRequest &request)
{
    ExportOutcome outcome;
    SessionFlags &flags = m_context.flags();

    if (flags.abortRequested.exchange(false)) {
        SKLOG_INFO(kComponent,
                   "runExportSession",
                   "export_skipped",
                   "cancelled_before_start",
                   "abort_flag",
                   QString::fromStdString(request.username),
                   "",
                   nlohmann::json::object());
        return outcome;
    }

    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope scope(corrId);
    m_context.setCorrelationId(corrId);

    const std::string username = normalizeUsername(request.username).value_or("unknown");
    m_context.resetForRun();
    m_context.setTarget(username, request.userId);
    m_displayName = request.displayName;
    m_currentQuery = request.currentQuery;

    if (request.resume) {
        m_resume.restoreFromStorage(username);
    }

    const std::string startedAt = toIso8601Utc(m_context.scheduler().now());
    flags.exporting = true;
    m_context.dispatch(LifecycleActionType::Start);

    SKLOG_INFO(kComponent,
               "runExportSession",
               "export_started",
               request.resume ? "resume_requested" : "export_requested",
               "scroll_capture",
               QString::fromStdString(username),
               corrId,
               (nlohmann::json{{"userId", m_context.userId()},
                               {"resumeMode", m_resume.isResumeMode()},
                               {"previousTweets", m_resume.previousTweets().size()}}));

    ScrollOrchestrator orchestrator(m_context, m_driver, m_presentation, m_config);
    outcome.responsesCaptured = orchestrator.run();

    if (!flags.exporting) {
        SKLOG_INFO(kComponent,
                   "runExportSession",
                   "export_cancelled",
                   "user_request",
                   "discard_captures",
                   QString::fromStdString(username),
                   corrId,
                   (nlohmann::json{{"responses", outcome.responsesCaptured}}));
        m_context.captures().clear();
        flags.abortRequested = false;
        return outcome;
    }

    const TweetList live = extractTweetsFromResponses(m_context.captures().snapshot(),
                                                      m_context.userId());
    const std::string userId = resolveUserId(live);
    MergeResult merged = m_resume.mergeWithPrevious(live);
    TweetList finalTweets = sortTweetsByDateDesc(std::move(merged.tweets));
    const bool resumed = m_resume.isResumeMode();

    if (merged.mergeInfo) {
        SKLOG_INFO(kComponent,
                   "runExportSession",
                   "merge_completed",
                   "resume_mode",
                   "mergeTweets",
                   QString::fromStdString(username),
                   corrId,
                   nlohmann::json(*merged.mergeInfo));
    }

    BuildMetaInput metaInput;
    metaInput.username = username;
    metaInput.userId = userId;
    metaInput.name = m_displayName.empty() ? username : m_displayName;
    metaInput.startedAt = startedAt;
    metaInput.completedAt = toIso8601Utc(m_context.scheduler().now());
    metaInput.newCollectedCount = static_cast<int>(live.size());
    metaInput.previousCollectedCount = merged.mergeInfo ? merged.mergeInfo->previousCount : 0;
    if (request.reportedCount && *request.reportedCount > 0) {
        metaInput.reportedCountCurrent = request.reportedCount;
    }
    metaInput.previousMeta = m_resume.previousMeta();
    metaInput.collectionMethod = resumed ? "scroll-interception-resumed" : "scroll-interception";
    metaInput.scrollResponsesCapturedCurrent = outcome.responsesCaptured;
    metaInput.mergeInfo = merged.mergeInfo;

    outcome.meta = buildConsolidatedMeta(metaInput);
    outcome.mergeInfo = merged.mergeInfo;
    outcome.itemCount = static_cast<int>(finalTweets.size());
    outcome.filename = exportFilename(username, resumed, m_context.scheduler().now());

    try {
        m_sink.deliver(outcome.filename,
                       dumpPayload(createExportPayload(outcome.meta, finalTweets)),
                       kJsonMime);
        outcome.status = ExportStatus::Delivered;
    } catch (const std::exception &ex) {
        SKLOG_ERROR(kComponent,
                    "runExportSession",
                    "export_delivery_failed",
                    "sink_error",
                    "ExportSink::deliver",
                    QString::fromStdString(username),
                    corrId,
                    (nlohmann::json{{"filename", outcome.filename}, {"error", ex.what()}}));
        outcome.status = ExportStatus::DeliveryFailed;
    }

    if (outcome.status == ExportStatus::Delivered) {
        if (resumed) {
            m_resume.clearPersisted();
            m_resume.clearInMemory();
        }
        m_context.dispatch(LifecycleActionType::Complete);
        m_presentation.exportComplete(outcome.filename, outcome.itemCount);
        SKLOG_INFO(kComponent,
                   "runExportSession",
                   "export_completed",
                   "delivered",
                   "ExportSink::deliver",
                   QString::fromStdString(username),
                   corrId,
                   (nlohmann::json{{"filename", outcome.filename},
                                   {"items", outcome.itemCount},
                                   {"responses", outcome.responsesCaptured}}));
    }

    m_context.captures().clear();
    flags.exporting = false;
    flags.pendingConfirmation = false;
    flags.abortRequested = false;
    return outcome;
}

std::string ExportSession::resolveUserId(const TweetList &rows)
{
    const std::string userId = m_context.userId();
    const std::string username = m_context.username();
    if (userId != "unknown" || rows.empty() || username.empty()) {
        return userId;
    }

    for (const TweetItem &row : rows) {
        const auto author = row.find("author");
        if (author == row.end() || !author->is_object()) {
            continue;
        }
        const auto authorName = normalizeUsername(author->value("username", nlohmann::json()));
        const auto authorId = author->find("id");
        if (!authorName || *authorName != username || authorId == author->end()
            || !authorId->is_string()) {
            continue;
        }

        const std::string resolved = authorId->get<std::string>();
        m_context.setTarget(username, resolved);
        if (m_displayName.empty() && author->contains("name") && author->at("name").is_string()) {
            m_displayName = author->at("name").get<std::string>();
        }
        SKLOG_INFO(kComponent,
                   "resolveUserId",
                   "user_id_resolved",
                   "captured_rows",
                   "author_match",
                   QString::fromStdString(username),
                   m_context.correlationId(),
                   (nlohmann::json{{"userId", resolved}}));
        return resolved;
    }
    return userId;
}

MergeResult ExportSession::collectConsolidated() const
{
    const TweetList live = extractTweetsFromResponses(m_context.captures().snapshot(),
                                                      m_context.userId());
    MergeResult merged = m_resume.mergeWithPrevious(live);
    merged.tweets = sortTweetsByDateDesc(std::move(merged.tweets));
    return merged;
}

bool ExportSession::saveProgress()
{
    const MergeResult merged = collectConsolidated();
    const std::string username = m_context.username();

    nlohmann::json meta{
        {"username", username},
        {"note", "PARTIAL EXPORT"},
        {"collected_count", merged.tweets.size()}
    };
    if (m_resume.isResumeMode()) {
        meta["resume_mode"] = true;
    }
    if (merged.mergeInfo) {
        meta["merge_info"] = *merged.mergeInfo;
    }

    bool delivered = false;
    const std::string filename = partialFilename(username, m_context.scheduler().now());
    try {
        m_sink.deliver(filename, dumpPayload(createExportPayload(meta, merged.tweets)), kJsonMime);
        delivered = true;
    } catch (const std::exception &ex) {
        SKLOG_ERROR(kComponent,
                    "saveProgress",
                    "partial_export_failed",
                    "sink_error",
                    "ExportSink::deliver",
                    QString::fromStdString(username),
                    m_context.correlationId(),
                    (nlohmann::json{{"filename", filename}, {"error", ex.what()}}));
    }

    bool persisted = false;
    if (!merged.tweets.empty()) {
        nlohmann::json resumeMeta = m_resume.previousMeta().is_object()
            ? m_resume.previousMeta()
            : nlohmann::json::object();
        resumeMeta["username"] = username;
        resumeMeta["collected_count"] = merged.tweets.size();
        persisted = m_resume.persistResumeState(username, merged.tweets, resumeMeta,
                                                 m_context.scheduler().now());
    }

    SKLOG_INFO(kComponent,
               "saveProgress",
               "progress_saved",
               "user_request",
               "partial_export",
               QString::fromStdString(username),
               m_context.correlationId(),
               (nlohmann::json{{"tweets", merged.tweets.size()},
                               {"delivered", delivered},
                               {"persisted", persisted}}));
    return delivered || persisted;
}

std::optional<std::string> ExportSession::resumeLink()
{
    const MergeResult merged = collectConsolidated();
    const std::string username = m_context.username();
    if (merged.tweets.empty()) {
        SKLOG_WARN(kComponent,
                   "resumeLink",
                   "resume_link_unavailable",
                   "no_rows",
                   "collectConsolidated",
                   QString::fromStdString(username),
                   m_context.correlationId(),
                   nlohmann::json::object());
        return std::nullopt;
    }

    const auto until = resumeUntilDate(merged.tweets);
    if (!until) {
        SKLOG_WARN(kComponent,
                   "resumeLink",
                   "resume_link_unavailable",
                   "unparsable_oldest_date",
                   "resumeUntilDate",
                   QString::fromStdString(username),
                   m_context.correlationId(),
                   nlohmann::json::object());
        return std::nullopt;
    }

    nlohmann::json meta = m_resume.previousMeta().is_object()
        ? m_resume.previousMeta()
        : nlohmann::json::object();
    meta["username"] = username;
    meta["collected_count"] = merged.tweets.size();
    if (!m_resume.persistResumeState(username, merged.tweets, meta, m_context.scheduler().now())) {
        return std::nullopt;
    }

    const std::string url = buildResumeUrl(buildResumeQuery(m_currentQuery, username, *until));
    m_presentation.resumeLinkReady(url);
    return url;
}

void ExportSession::onSkip()
{
    m_context.flags().skipCooldown = true;
}

void ExportSession::onStop()
{
    m_context.flags().skipCooldown = true;
    cancelExport();
}

void ExportSession::onDownload()
{
    m_context.flags().pendingConfirmation = false;
    m_context.flags().abortRequested = true;
    SKLOG_INFO(kComponent,
               "onDownload",
               "download_confirmed",
               "user_request",
               "abort_loop",
               QString::fromStdString(m_context.username()),
               m_context.correlationId(),
               nlohmann::json::object());
}

void ExportSession::onContinue()
{
    resumeFromConfirmation("continue_scrolling");
}

void ExportSession::onGoBack()
{
    resumeFromConfirmation("returned_to_timeline");
}

void ExportSession::onResumeLink()
{
    resumeLink();
}

void ExportSession::onCancel()
{
    cancelExport();
}

void ExportSession::onTryNow()
{
    m_handlers.resumeManual();
    m_context.markActivity();
    m_presentation.updateStatus("Resuming...");
}

void ExportSession::onSaveProgress()
{
    saveProgress();
}

void ExportSession::resumeFromConfirmation(const char *reason)
{
    m_context.flags().pendingConfirmation = false;
    m_context.dispatch(LifecycleActionType::ResumeManual);
    m_context.markActivity();
    m_presentation.updateStatus("Continuing...");
    SKLOG_INFO(kComponent,
               "resumeFromConfirmation",
               "scroll_resumed",
               reason,
               "resume_manual",
               QString::fromStdString(m_context.username()),
               m_context.correlationId(),
               nlohmann::json::object());
}

void ExportSession::cancelExport()
{
    SessionFlags &flags = m_context.flags();
    flags.pendingConfirmation = false;
    m_context.dispatch(LifecycleActionType::Cancel);
    flags.abortRequested = true;
    flags.exporting = false;
    flags.rateLimited = false;
    SKLOG_INFO(kComponent,
               "cancelExport",
               "export_cancel_requested",
               "user_request",
               "abort_loop",
               QString::fromStdString(m_context.username()),
               m_context.correlationId(),
               nlohmann::json::object());
}

} // namespace scrollkeep
