#include "engine/tweet_row_builder.hpp"

#include <algorithm>
#include <exception>
#include <regex>
#include <unordered_set>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"

namespace scrollkeep {

namespace {

constexpr int kMaxNestedDepth = 2;

const nlohmann::json kEmptyObject = nlohmann::json::object();

const nlohmann::json &objectOrEmpty(const nlohmann::json &parent, const char *key)
{
    if (!parent.is_object()) {
        return kEmptyObject;
    }
    auto it = parent.find(key);
    if (it == parent.end() || !it->is_object()) {
        return kEmptyObject;
    }
    return *it;
}

nlohmann::json valueOrNull(const nlohmann::json &parent, const char *key)
{
    if (!parent.is_object()) {
        return nullptr;
    }
    auto it = parent.find(key);
    return it == parent.end() ? nlohmann::json() : *it;
}

bool isTruthy(const nlohmann::json &value)
{
    if (value.is_null()) {
        return false;
    }
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        return !value.get_ref<const std::string &>().empty();
    }
    if (value.is_number()) {
        return value.get<double>() != 0.0;
    }
    return true;
}

// First truthy candidate, else null (the `a || b || null` idiom).
nlohmann::json firstTruthy(std::initializer_list<nlohmann::json> candidates)
{
    for (const auto &candidate : candidates) {
        if (isTruthy(candidate)) {
            return candidate;
        }
    }
    return nullptr;
}

const nlohmann::json &unwrapUserResult(const nlohmann::json &userResult)
{
    const nlohmann::json *result = &userResult;
    if (result->contains("result") && result->at("result").is_object()) {
        result = &result->at("result");
    }
    const nlohmann::json *nested = timeline::findPath(*result, {"user_results", "result"});
    if (nested && nested->is_object()) {
        result = nested;
    }
    if (result->contains("user") && result->at("user").is_object()) {
        result = &result->at("user");
    }
    return *result;
}

nlohmann::json extractUserInfo(const nlohmann::json *userResult)
{
    if (!userResult || !userResult->is_object()) {
        return nullptr;
    }
    const nlohmann::json &result = unwrapUserResult(*userResult);
    const nlohmann::json &legacy = objectOrEmpty(result, "legacy");
    const nlohmann::json &core = objectOrEmpty(result, "core");

    const nlohmann::json id = firstTruthy({valueOrNull(result, "rest_id"),
                                           valueOrNull(result, "id_str")});
    if (id.is_null()) {
        return nullptr;
    }

    nlohmann::json verified = valueOrNull(legacy, "verified");
    if (verified.is_null()) {
        const nlohmann::json *fromVerification =
            timeline::findPath(result, {"verification", "verified"});
        verified = fromVerification && !fromVerification->is_null() ? *fromVerification
                                                                      : nlohmann::json(false);
    }

    nlohmann::json info = {
        {"id", id},
        {"username", firstTruthy({valueOrNull(core, "screen_name"),
                                  valueOrNull(legacy, "screen_name")})},
        {"name", firstTruthy({valueOrNull(core, "name"), valueOrNull(legacy, "name")})},
        {"verified", verified},
        {"followers_count", valueOrNull(legacy, "followers_count")},
        {"following_count", valueOrNull(legacy, "friends_count")}
    };
    return info;
}

nlohmann::json fullText(const nlohmann::json &tweet)
{
    const nlohmann::json *note =
        timeline::findPath(tweet, {"note_tweet", "note_tweet_results", "result", "text"});
    if (note && isTruthy(*note)) {
        return *note;
    }
    const nlohmann::json *legacyText = timeline::findPath(tweet, {"legacy", "full_text"});
    if (legacyText && !legacyText->is_null()) {
        return *legacyText;
    }
    return "";
}

nlohmann::json collectMedia(const nlohmann::json &legacy)
{
    const nlohmann::json *source = timeline::findPath(legacy, {"extended_entities", "media"});
    if (!source || !source->is_array()) {
        source = timeline::findPath(legacy, {"entities", "media"});
    }
    if (!source || !source->is_array() || source->empty()) {
        return nullptr;
    }

    nlohmann::json media = nlohmann::json::array();
    for (const auto &entry : *source) {
        nlohmann::json item = {
            {"type", valueOrNull(entry, "type")},
            {"url", valueOrNull(entry, "media_url_https")}
        };

        const nlohmann::json type = valueOrNull(entry, "type");
        if (type == "video" || type == "animated_gif") {
            const nlohmann::json *variants = timeline::findPath(entry, {"video_info", "variants"});
            std::vector<nlohmann::json> videos;
            if (variants && variants->is_array()) {
                for (const auto &variant : *variants) {
                    const nlohmann::json contentType = valueOrNull(variant, "content_type");
                    if (contentType.is_string()
                        && contentType.get<std::string>().find("video") != std::string::npos) {
                        videos.push_back(variant);
                    }
                }
            }
            std::stable_sort(videos.begin(), videos.end(),
                             [](const nlohmann::json &a, const nlohmann::json &b) {
                                 return a.value("bitrate", 0.0) > b.value("bitrate", 0.0);
                             });
            if (!videos.empty()) {
                item["video_url"] = valueOrNull(videos.front(), "url");
            }
        }
        media.push_back(std::move(item));
    }
    return media;
}

nlohmann::json mapEntities(const nlohmann::json &entities, const char *key,
                           const std::function<nlohmann::json(const nlohmann::json &)> &mapper)
{
    nlohmann::json mapped = nlohmann::json::array();
    auto it = entities.find(key);
    if (it == entities.end() || !it->is_array()) {
        return nullptr;
    }
    for (const auto &entry : *it) {
        nlohmann::json value = mapper(entry);
        if (!value.is_null()) {
            mapped.push_back(std::move(value));
        }
    }
    return mapped.empty() ? nlohmann::json() : mapped;
}

void ensureAuthorFromPermalink(nlohmann::json &data)
{
    if (!data.contains("permalink") || !data["permalink"].is_string()) {
        return;
    }
    if (data.contains("author") && data["author"].is_object()
        && isTruthy(data["author"].value("username", nlohmann::json()))) {
        return;
    }

    static const std::regex kStatusPattern(R"(twitter\.com/([^/]+)/status)");
    std::smatch match;
    const std::string permalink = data["permalink"].get<std::string>();
    if (!std::regex_search(permalink, match, kStatusPattern)) {
        return;
    }
    if (!data.contains("author") || !data["author"].is_object()) {
        data["author"] = nlohmann::json::object();
    }
    data["author"]["username"] = match[1].str();
}

void removeNullFields(nlohmann::json &data)
{
    for (auto it = data.begin(); it != data.end();) {
        if (it->is_null()) {
            it = data.erase(it);
        } else {
            ++it;
        }
    }
}

std::optional<TweetItem> extractFullTweetData(const nlohmann::json &tweet, int depth);

nlohmann::json extractNestedTweet(const nlohmann::json *container, int depth)
{
    const nlohmann::json *normalized = timeline::normalizeTweetResult(container);
    if (!normalized) {
        return nullptr;
    }
    auto extracted = extractFullTweetData(*normalized, depth + 1);
    return extracted ? *extracted : nlohmann::json();
}

std::optional<TweetItem> extractFullTweetData(const nlohmann::json &tweet, int depth)
{
    if (!tweet.is_object() || depth > kMaxNestedDepth) {
        return std::nullopt;
    }

    const nlohmann::json &legacy = objectOrEmpty(tweet, "legacy");
    const nlohmann::json &entities = objectOrEmpty(legacy, "entities");

    const nlohmann::json createdAt = valueOrNull(legacy, "created_at");
    const nlohmann::json *views = timeline::findPath(tweet, {"views", "count"});
    const nlohmann::json *permalink =
        timeline::findPath(legacy, {"quoted_status_permalink", "expanded"});

    nlohmann::json data = {
        {"id", valueOrNull(tweet, "rest_id")},
        {"author", extractUserInfo(timeline::findPath(tweet, {"core", "user_results", "result"}))},
        {"text", fullText(tweet)},
        {"created_at", createdAt.is_string() ? formatTweetDate(createdAt.get<std::string>())
                                             : std::string()},
        {"favorite_count", valueOrNull(legacy, "favorite_count")},
        {"retweet_count", valueOrNull(legacy, "retweet_count")},
        {"reply_count", valueOrNull(legacy, "reply_count")},
        {"quote_count", valueOrNull(legacy, "quote_count")},
        {"bookmark_count", valueOrNull(legacy, "bookmark_count")},
        {"view_count", views ? *views : nlohmann::json()},
        {"in_reply_to_status_id", firstTruthy({valueOrNull(legacy, "in_reply_to_status_id_str")})},
        {"in_reply_to_user_id", firstTruthy({valueOrNull(legacy, "in_reply_to_user_id_str")})},
        {"in_reply_to_username", firstTruthy({valueOrNull(legacy, "in_reply_to_screen_name")})},
        {"conversation_id", firstTruthy({valueOrNull(legacy, "conversation_id_str")})},
        {"language", valueOrNull(legacy, "lang")},
        {"source", valueOrNull(tweet, "source")},
        {"hashtags", mapEntities(entities, "hashtags", [](const nlohmann::json &entry) {
             const nlohmann::json text = valueOrNull(entry, "text");
             return isTruthy(text) ? text : nlohmann::json();
         })},
        {"urls", mapEntities(entities, "urls", [](const nlohmann::json &entry) {
             return nlohmann::json{{"url", valueOrNull(entry, "url")},
                                   {"expanded_url", valueOrNull(entry, "expanded_url")},
                                   {"display_url", valueOrNull(entry, "display_url")}};
         })},
        {"media", collectMedia(legacy)},
        {"mentions", mapEntities(entities, "user_mentions", [](const nlohmann::json &entry) {
             return nlohmann::json{{"id", valueOrNull(entry, "id_str")},
                                   {"username", valueOrNull(entry, "screen_name")},
                                   {"name", valueOrNull(entry, "name")}};
         })},
        {"is_quote_status", isTruthy(valueOrNull(legacy, "is_quote_status"))},
        {"possibly_sensitive", isTruthy(valueOrNull(legacy, "possibly_sensitive"))},
        {"permalink", permalink && isTruthy(*permalink) ? *permalink : nlohmann::json()}
    };

    ensureAuthorFromPermalink(data);

    const nlohmann::json *noteText =
        timeline::findPath(tweet, {"note_tweet", "note_tweet_results", "result", "text"});
    if (noteText && isTruthy(*noteText) && *noteText != data["text"]) {
        data["note_tweet_text"] = *noteText;
    }

    nlohmann::json quoted =
        extractNestedTweet(timeline::findPath(tweet, {"quoted_status_result", "result"}), depth);
    if (!quoted.is_null()) {
        data["quoted_tweet"] = std::move(quoted);
    }
    nlohmann::json retweeted = extractNestedTweet(
        timeline::findPath(legacy, {"retweeted_status_result", "result"}), depth);
    if (!retweeted.is_null()) {
        data["retweeted_tweet"] = std::move(retweeted);
    }

    removeNullFields(data);
    return data;
}

bool shouldIncludeItem(const TweetItem &item, const std::string &targetUserId)
{
    auto id = item.find("id");
    if (id == item.end() || !isTruthy(*id)) {
        return false;
    }
    if (targetUserId == "unknown") {
        return true;
    }
    const nlohmann::json *authorId = timeline::findPath(item, {"author", "id"});
    if (authorId && authorId->is_string() && authorId->get<std::string>() == targetUserId) {
        return true;
    }
    return item.value("type", std::string()) == "Retweet";
}

std::string idKey(const nlohmann::json &id)
{
    return id.is_string() ? id.get<std::string>() : id.dump();
}

} // namespace

std::optional<TweetItem> buildTweetRow(const nlohmann::json &tweet, TweetItemType type)
{
    auto data = extractFullTweetData(tweet, 0);
    if (!data) {
        return std::nullopt;
    }
    if (type != TweetItemType::Tweet) {
        (*data)["type"] = toItemTypeString(type);
    }
    return data;
}

TimelineRowBuilder<TweetItem> defaultTweetRowBuilder()
{
    return [](const nlohmann::json &tweet, TweetItemType type) {
        return buildTweetRow(tweet, type);
    };
}

TweetList extractTweetsFromResponses(const std::vector<CaptureEvent> &responses,
                                     const std::string &targetUserId)
{
    TweetList tweets;
    std::unordered_set<std::string> seenIds;
    const auto builder = defaultTweetRowBuilder();

    for (const auto &response : responses) {
        try {
            auto page = extractTimeline<TweetItem>(response.body, builder);
            for (auto &item : page.items) {
                if (!shouldIncludeItem(item, targetUserId)) {
                    continue;
                }
                if (!seenIds.insert(idKey(item["id"])).second) {
                    continue;
                }
                tweets.push_back(std::move(item));
            }
        } catch (const std::exception &ex) {
            SKLOG_DEBUG(QStringLiteral("TweetRowBuilder"),
                        QStringLiteral("extractTweetsFromResponses"),
                        QStringLiteral("response_decode_failed"),
                        QStringLiteral("malformed_response"),
                        QStringLiteral("skip_response"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"url", response.url}, {"error", ex.what()}}));
        }
    }

    SKLOG_INFO(QStringLiteral("TweetRowBuilder"),
               QStringLiteral("extractTweetsFromResponses"),
               QStringLiteral("responses_decoded"),
               QStringLiteral("export_processing"),
               QStringLiteral("timeline_decoder"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"responses", responses.size()},
                               {"uniqueTweets", tweets.size()}}));
    return tweets;
}

} // namespace scrollkeep
