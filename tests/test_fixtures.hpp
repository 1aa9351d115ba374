#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace scrollkeep::testing {

// Provider tweet result as the timeline API returns it.
inline nlohmann::json makeProviderTweet(const std::string &id,
                                        const std::string &userId,
                                        const std::string &screenName,
                                        const std::string &createdAt = "Wed Oct 10 20:19:24 +0000 2018",
                                        const std::string &text = "hello")
{
    nlohmann::json user;
    user["rest_id"] = userId;
    user["core"] = {{"screen_name", screenName}, {"name", screenName + " name"}};
    user["legacy"] = {{"followers_count", 10}, {"friends_count", 5}, {"verified", false}};

    nlohmann::json tweet;
    tweet["__typename"] = "Tweet";
    tweet["rest_id"] = id;
    tweet["core"]["user_results"]["result"] = user;
    tweet["legacy"] = {
        {"created_at", createdAt},
        {"full_text", text},
        {"favorite_count", 1},
        {"retweet_count", 2},
        {"reply_count", 3},
        {"quote_count", 0},
        {"lang", "en"}
    };
    tweet["legacy"]["entities"]["hashtags"] = nlohmann::json::array();
    return tweet;
}

inline nlohmann::json tweetEntry(const std::string &entryId, const nlohmann::json &result)
{
    nlohmann::json entry;
    entry["entryId"] = entryId;
    entry["content"]["itemContent"]["tweet_results"]["result"] = result;
    return entry;
}

inline nlohmann::json bottomCursorEntry(const std::string &value)
{
    nlohmann::json entry;
    entry["entryId"] = "cursor-bottom-" + value;
    entry["content"]["cursorType"] = "Bottom";
    entry["content"]["value"] = value;
    return entry;
}

inline nlohmann::json addEntries(const nlohmann::json &entries)
{
    return nlohmann::json{{"type", "TimelineAddEntries"}, {"entries", entries}};
}

// User timeline payload with one TimelineAddEntries instruction.
inline nlohmann::json userTimelinePayload(const nlohmann::json &entries)
{
    nlohmann::json instructions = nlohmann::json::array();
    instructions.push_back(nlohmann::json{{"type", "TimelineClearCache"}});
    instructions.push_back(addEntries(entries));

    nlohmann::json payload;
    payload["data"]["user"]["result"]["timeline_v2"]["timeline"]["instructions"] = instructions;
    return payload;
}

inline CaptureEvent captureOf(const nlohmann::json &body,
                              const nlohmann::json &rateLimitInfo = nlohmann::json())
{
    CaptureEvent event;
    event.url = "https://x.com/i/api/graphql/abc/UserTweets";
    event.body = body;
    event.rateLimitInfo = rateLimitInfo;
    return event;
}

// Export row as the row builder emits it.
inline TweetItem makeRow(const std::string &id, const std::string &createdAt,
                         const std::string &text = "row")
{
    return TweetItem{
        {"id", id},
        {"author", {{"id", "42"}, {"username", "alice"}}},
        {"text", text},
        {"created_at", createdAt}
    };
}

} // namespace scrollkeep::testing
