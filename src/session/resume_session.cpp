#include "session/resume_session.hpp"

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/merge_engine.hpp"

namespace scrollkeep {

namespace {

const QString kComponent = QStringLiteral("ResumeSession");

} // namespace

ResumeSession::ResumeSession(ResumeStore *store)
    : m_store(store)
{
}

void ResumeSession::setResumeState(TweetList tweets, nlohmann::json meta)
{
    m_previousTweets = std::move(tweets);
    m_previousMeta = std::move(meta);
    m_resumeMode = true;
}

void ResumeSession::clearInMemory()
{
    m_previousTweets.clear();
    m_previousMeta = nlohmann::json();
    m_resumeMode = false;
}

bool ResumeSession::isResumeMode() const
{
    return m_resumeMode;
}

const TweetList &ResumeSession::previousTweets() const
{
    return m_previousTweets;
}

const nlohmann::json &ResumeSession::previousMeta() const
{
    return m_previousMeta;
}

MergeResult ResumeSession::mergeWithPrevious(TweetList freshTweets) const
{
    if (!m_resumeMode || m_previousTweets.empty()) {
        MergeResult result;
        result.tweets = std::move(freshTweets);
        return result;
    }
    return mergeTweets(freshTweets, m_previousTweets);
}

bool ResumeSession::persistResumeState(const std::string &username,
                                       const TweetList &tweets,
                                       const nlohmann::json &meta,
                                       int64_t savedAt)
{
    ResumeSnapshot snapshot;
    snapshot.username = normalizeUsername(username).value_or(std::string());
    snapshot.savedAt = savedAt;
    snapshot.meta = meta;
    snapshot.tweets = tweets;

    const bool persisted = m_store && m_store->persist(snapshot);
    if (persisted) {
        SKLOG_INFO(kComponent,
                   "persistResumeState",
                   "resume_persisted",
                   "checkpoint",
                   "ResumeStore::persist",
                   QString::fromStdString(snapshot.username),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"tweets", tweets.size()}}));
    } else {
        SKLOG_ERROR(kComponent,
                    "persistResumeState",
                    "resume_persist_failed",
                    m_store ? "store_rejected_payload" : "no_store",
                    "ResumeStore::persist",
                    QString::fromStdString(snapshot.username),
                    logging::currentCorrelationId(),
                    (nlohmann::json{{"tweets", tweets.size()}}));
    }
    return persisted;
}

bool ResumeSession::restoreFromStorage(const std::optional<std::string> &targetUsername)
{
    if (m_resumeMode && !m_previousTweets.empty()) {
        return true;
    }
    if (!m_store) {
        return false;
    }

    auto snapshot = m_store->restore(targetUsername);
    if (!snapshot) {
        return false;
    }

    setResumeState(std::move(snapshot->tweets), std::move(snapshot->meta));
    SKLOG_INFO(kComponent,
               "restoreFromStorage",
               "resume_restored",
               "durable_snapshot",
               "ResumeStore::restore",
               QString::fromStdString(snapshot->username),
               logging::currentCorrelationId(),
               (nlohmann::json{{"tweets", m_previousTweets.size()}}));
    return true;
}

void ResumeSession::clearPersisted()
{
    if (m_store) {
        m_store->clear();
    }
}

} // namespace scrollkeep
