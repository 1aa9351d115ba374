#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace scrollkeep {

inline std::string toStatusString(LifecycleStatus status)
{
    switch (status) {
    case LifecycleStatus::Idle:
        return "idle";
    case LifecycleStatus::Running:
        return "running";
    case LifecycleStatus::Cooldown:
        return "cooldown";
    case LifecycleStatus::PausedRateLimit:
        return "paused_rate_limit";
    case LifecycleStatus::PendingDone:
        return "pending_done";
    case LifecycleStatus::Cancelled:
        return "cancelled";
    case LifecycleStatus::Completed:
        return "completed";
    }
    return "idle";
}

inline LifecycleStatus parseStatusString(const std::string &value)
{
    if (value == "running") {
        return LifecycleStatus::Running;
    }
    if (value == "cooldown") {
        return LifecycleStatus::Cooldown;
    }
    if (value == "paused_rate_limit") {
        return LifecycleStatus::PausedRateLimit;
    }
    if (value == "pending_done") {
        return LifecycleStatus::PendingDone;
    }
    if (value == "cancelled") {
        return LifecycleStatus::Cancelled;
    }
    if (value == "completed") {
        return LifecycleStatus::Completed;
    }
    return LifecycleStatus::Idle;
}

inline std::string toActionString(LifecycleActionType type)
{
    switch (type) {
    case LifecycleActionType::Start:
        return "start";
    case LifecycleActionType::Activity:
        return "activity";
    case LifecycleActionType::EnterCooldown:
        return "enter_cooldown";
    case LifecycleActionType::ExitCooldown:
        return "exit_cooldown";
    case LifecycleActionType::PauseRateLimit:
        return "pause_rate_limit";
    case LifecycleActionType::ResumeManual:
        return "resume_manual";
    case LifecycleActionType::MarkPendingDone:
        return "mark_pending_done";
    case LifecycleActionType::Cancel:
        return "cancel";
    case LifecycleActionType::Complete:
        return "complete";
    }
    return "activity";
}

inline std::string toModeString(RateLimitMode mode)
{
    switch (mode) {
    case RateLimitMode::Normal:
        return "normal";
    case RateLimitMode::Cooldown:
        return "cooldown";
    case RateLimitMode::Paused:
        return "paused";
    }
    return "normal";
}

inline std::string toItemTypeString(TweetItemType type)
{
    return type == TweetItemType::Retweet ? "Retweet" : "Tweet";
}

// Trims, drops one leading '@' and lowercases. Empty result means unresolvable.
inline std::optional<std::string> normalizeUsername(const std::string &value)
{
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    std::string trimmed = value.substr(first, last - first + 1);
    if (!trimmed.empty() && trimmed.front() == '@') {
        trimmed.erase(0, 1);
    }
    std::transform(trimmed.begin(), trimmed.end(), trimmed.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

inline std::optional<std::string> normalizeUsername(const nlohmann::json &value)
{
    if (!value.is_string()) {
        return std::nullopt;
    }
    return normalizeUsername(value.get<std::string>());
}

inline void to_json(nlohmann::json &j, const LifecycleStatus &status)
{
    j = toStatusString(status);
}

inline void from_json(const nlohmann::json &j, LifecycleStatus &status)
{
    status = j.is_string() ? parseStatusString(j.get<std::string>())
                           : LifecycleStatus::Idle;
}

inline void to_json(nlohmann::json &j, const LifecycleSnapshot &snapshot)
{
    j = nlohmann::json{
        {"status", snapshot.status},
        {"lastActivityAt", snapshot.lastActivityAt}
    };
}

inline void to_json(nlohmann::json &j, const RateLimitState &state)
{
    j = nlohmann::json{
        {"mode", toModeString(state.mode)},
        {"requestCount", state.requestCount},
        {"limit", state.limit},
        {"remaining", state.remaining},
        {"resetTime", state.resetTime},
        {"lastRequestTime", state.lastRequestTime},
        {"retryCount", state.retryCount},
        {"dynamicDelay", state.dynamicDelay}
    };
}

inline void to_json(nlohmann::json &j, const MergeInfo &info)
{
    j = nlohmann::json{
        {"previous_count", info.previousCount},
        {"new_count", info.newCount},
        {"duplicates_removed", info.duplicatesRemoved},
        {"final_count", info.finalCount}
    };
}

inline void from_json(const nlohmann::json &j, MergeInfo &info)
{
    info.previousCount = j.value("previous_count", 0);
    info.newCount = j.value("new_count", 0);
    info.duplicatesRemoved = j.value("duplicates_removed", 0);
    info.finalCount = j.value("final_count", 0);
}

inline void to_json(nlohmann::json &j, const ResumeSnapshot &snapshot)
{
    j = nlohmann::json{
        {"username", snapshot.username},
        {"saved_at", snapshot.savedAt},
        {"meta", snapshot.meta.is_object() ? snapshot.meta : nlohmann::json()},
        {"tweets", snapshot.tweets}
    };
}

inline void to_json(nlohmann::json &j, const ChunkManifest &manifest)
{
    j = nlohmann::json{{"version", manifest.version}, {"chunkCount", manifest.chunkCount}};
}

inline void to_json(nlohmann::json &j, const CaptureEvent &event)
{
    j = nlohmann::json{
        {"url", event.url},
        {"data", event.body},
        {"rateLimitInfo", event.rateLimitInfo}
    };
}

inline void from_json(const nlohmann::json &j, CaptureEvent &event)
{
    event.url = j.contains("url") && j.at("url").is_string()
        ? j.at("url").get<std::string>()
        : std::string();
    if (j.contains("data")) {
        event.body = j.at("data");
    } else if (j.contains("body")) {
        event.body = j.at("body");
    } else {
        event.body = nlohmann::json();
    }
    if (j.contains("rateLimitInfo")) {
        event.rateLimitInfo = j.at("rateLimitInfo");
    } else {
        event.rateLimitInfo = nlohmann::json();
    }
}

} // namespace scrollkeep
