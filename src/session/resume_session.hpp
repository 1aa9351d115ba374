#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "store/resume_store.hpp"

namespace scrollkeep {

// Previously exported rows that the current run merges into, plus the
// durable copy behind them. The store may be null (no persistence).
class ResumeSession {
public:
    explicit ResumeSession(ResumeStore *store = nullptr);

    void setResumeState(TweetList tweets, nlohmann::json meta);
    void clearInMemory();

    bool isResumeMode() const;
    const TweetList &previousTweets() const;
    const nlohmann::json &previousMeta() const;

    // Unchanged rows and no merge info unless resume mode holds rows.
    MergeResult mergeWithPrevious(TweetList freshTweets) const;

    // savedAt comes from the session's scheduler, not the wall clock.
    bool persistResumeState(const std::string &username,
                            const TweetList &tweets,
                            const nlohmann::json &meta,
                            int64_t savedAt);

    // Loads the durable snapshot into memory unless rows are already held.
    bool restoreFromStorage(const std::optional<std::string> &targetUsername);

    void clearPersisted();

private:
    ResumeStore *m_store = nullptr;
    TweetList m_previousTweets;
    nlohmann::json m_previousMeta;
    bool m_resumeMode = false;
};

} // namespace scrollkeep
