#include "engine/resume_link.hpp"

#include <algorithm>
#include <array>
#include <regex>

#include <QDate>
#include <QDateTime>
#include <QUrl>
#include <QUrlQuery>

#include "common/json_utils.hpp"
#include "common/time_utils.hpp"
#include "engine/merge_engine.hpp"

namespace scrollkeep {

namespace {

constexpr std::array<const char *, 20> kReservedSegments = {
    "home", "explore", "search", "notifications", "messages",
    "bookmarks", "lists", "settings", "compose", "i",
    "intent", "login", "logout", "signup", "tos",
    "privacy", "about", "help", "jobs", "download"
};

bool isReservedSegment(const std::string &segment)
{
    return std::find(kReservedSegments.begin(), kReservedSegments.end(), segment)
        != kReservedSegments.end();
}

std::optional<QDate> leadingDate(const std::string &text)
{
    static const std::regex pattern(R"((\d{4})\s*-\s*(\d{2})\s*-\s*(\d{2}))");
    std::smatch match;
    if (std::regex_search(text, match, pattern)) {
        const QDate date(std::stoi(match[1].str()), std::stoi(match[2].str()),
                         std::stoi(match[3].str()));
        if (date.isValid()) {
            return date;
        }
    }
    if (const auto parsed = parseTweetDate(text)) {
        return QDateTime::fromMSecsSinceEpoch(*parsed, Qt::UTC).date();
    }
    return std::nullopt;
}

} // namespace

TweetList extractTweetsFromExportData(const nlohmann::json &data)
{
    if (data.is_array()) {
        return data.get<TweetList>();
    }
    if (!data.is_object()) {
        return {};
    }
    for (const char *key : {"items", "tweets"}) {
        auto it = data.find(key);
        if (it != data.end() && it->is_array()) {
            return it->get<TweetList>();
        }
    }
    return {};
}

ResumeInput parseResumeInput(const nlohmann::json &data)
{
    ResumeInput input;
    input.tweets = extractTweetsFromExportData(data);
    if (!data.is_object()) {
        return input;
    }

    if (data.contains("meta") && !data.at("meta").is_null()) {
        input.meta = data.at("meta");
    } else if (data.contains("metadata")) {
        input.meta = data.at("metadata");
    }
    if (input.meta.is_object() && input.meta.contains("username")) {
        input.username = normalizeUsername(input.meta.at("username"));
    }
    return input;
}

std::optional<std::string> resumeUntilDate(const TweetList &tweets)
{
    if (tweets.empty()) {
        return std::nullopt;
    }
    const TweetList sorted = sortTweetsByDateDesc(tweets);
    const TweetItem &oldest = sorted.back();
    const auto createdAt = oldest.find("created_at");
    if (createdAt == oldest.end() || !createdAt->is_string()) {
        return std::nullopt;
    }
    const auto date = leadingDate(createdAt->get<std::string>());
    if (!date) {
        return std::nullopt;
    }
    return date->addDays(1).toString(QStringLiteral("yyyy-MM-dd")).toStdString();
}

std::string buildResumeQuery(const std::string &currentQuery,
                             const std::string &username,
                             const std::string &untilDate)
{
    std::string query = currentQuery.empty() ? "from:" + username : currentQuery;
    static const std::regex untilPattern(R"(until:\d{4}-\d{2}-\d{2})");
    if (query.find("until:") != std::string::npos) {
        return std::regex_replace(query, untilPattern, "until:" + untilDate,
                                  std::regex_constants::format_first_only);
    }
    return query + " until:" + untilDate;
}

std::string buildResumeUrl(const std::string &query)
{
    const QByteArray encoded = QUrl::toPercentEncoding(QString::fromStdString(query));
    return "https://x.com/search?q=" + encoded.toStdString()
        + "&src=typed_query&f=live&scrollkeep_resume=1";
}

std::optional<std::string> usernameFromRoute(const std::string &route)
{
    const QUrl url(QString::fromStdString(route));
    const QString path = url.path();

    if (path == QStringLiteral("/search")) {
        const QString query = QUrlQuery(url).queryItemValue(QStringLiteral("q"),
                                                            QUrl::FullyDecoded);
        static const std::regex fromPattern(R"(from:([A-Za-z0-9_]+))", std::regex::icase);
        const std::string text = query.toStdString();
        std::smatch match;
        if (!std::regex_search(text, match, fromPattern)) {
            return std::nullopt;
        }
        return normalizeUsername(match[1].str());
    }

    static const std::regex pathPattern(R"(^/([A-Za-z0-9_]{1,15})(?:/|$))");
    const std::string text = path.toStdString();
    std::smatch match;
    if (!std::regex_search(text, match, pathPattern)) {
        return std::nullopt;
    }
    const auto username = normalizeUsername(match[1].str());
    if (!username || isReservedSegment(*username)) {
        return std::nullopt;
    }
    return username;
}

} // namespace scrollkeep
