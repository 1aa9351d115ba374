#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace scrollkeep {

struct ResumeInput {
    TweetList tweets;
    nlohmann::json meta;
    std::optional<std::string> username;
};

// Rows of a previous export: a bare array, or "items", then "tweets".
TweetList extractTweetsFromExportData(const nlohmann::json &data);

// Rows plus "meta" (or "metadata") and the normalized meta.username.
ResumeInput parseResumeInput(const nlohmann::json &data);

// The day after the oldest row's date as YYYY-MM-DD. Search "until:" is
// exclusive, so this keeps the oldest day in range.
std::optional<std::string> resumeUntilDate(const TweetList &tweets);

// Replaces an existing "until:YYYY-MM-DD" in currentQuery or appends one.
// An empty currentQuery starts from "from:<username>".
std::string buildResumeQuery(const std::string &currentQuery,
                             const std::string &username,
                             const std::string &untilDate);

std::string buildResumeUrl(const std::string &query);

// Username from a timeline route: "/<name>/..." or "/search?q=from:<name>".
// Reserved top-level segments yield nothing.
std::optional<std::string> usernameFromRoute(const std::string &route);

} // namespace scrollkeep
