#include "engine/merge_engine.hpp"

#include <algorithm>
#include <unordered_map>

#include "common/time_utils.hpp"

namespace scrollkeep {

namespace {

std::string fieldText(const TweetItem &tweet, const char *key)
{
    if (!tweet.is_object()) {
        return {};
    }
    auto it = tweet.find(key);
    if (it == tweet.end() || it->is_null()) {
        return {};
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

bool hasId(const TweetItem &tweet)
{
    if (!tweet.is_object()) {
        return false;
    }
    auto it = tweet.find("id");
    if (it == tweet.end()) {
        return false;
    }
    if (it->is_string()) {
        return !it->get_ref<const std::string &>().empty();
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>() != 0;
    }
    return it->is_number() || it->is_object() || it->is_array();
}

int64_t sortTimestamp(const TweetItem &tweet)
{
    auto it = tweet.is_object() ? tweet.find("created_at") : tweet.end();
    if (it == tweet.end() || !it->is_string()) {
        return 0;
    }
    return parseTweetDate(it->get<std::string>()).value_or(0);
}

} // namespace

TweetList sortTweetsByDateDesc(TweetList tweets)
{
    std::vector<std::pair<int64_t, TweetItem>> keyed;
    keyed.reserve(tweets.size());
    for (auto &tweet : tweets) {
        const int64_t timestamp = sortTimestamp(tweet);
        keyed.emplace_back(timestamp, std::move(tweet));
    }
    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const auto &a, const auto &b) { return a.first > b.first; });

    TweetList sorted;
    sorted.reserve(keyed.size());
    for (auto &entry : keyed) {
        sorted.push_back(std::move(entry.second));
    }
    return sorted;
}

std::string tweetMergeKey(const TweetItem &tweet, const char *source, size_t index)
{
    if (hasId(tweet)) {
        return "id:" + fieldText(tweet, "id");
    }
    return std::string(source) + ":" + std::to_string(index) + ":"
        + fieldText(tweet, "created_at") + ":" + fieldText(tweet, "text");
}

const TweetItem &pickRicherTweet(const TweetItem &existing, const TweetItem &candidate)
{
    return candidate.size() > existing.size() ? candidate : existing;
}

MergeResult mergeTweets(const TweetList &newTweets, const TweetList &previousTweets)
{
    MergeResult result;
    if (previousTweets.empty()) {
        result.tweets = sortTweetsByDateDesc(newTweets);
        return result;
    }

    // Insertion order is kept so equal dates stay in first-seen order.
    std::unordered_map<std::string, size_t> indexByKey;
    TweetList merged;
    merged.reserve(newTweets.size() + previousTweets.size());
    int duplicates = 0;

    for (size_t i = 0; i < newTweets.size(); ++i) {
        const std::string key = tweetMergeKey(newTweets[i], "new", i);
        auto it = indexByKey.find(key);
        if (it == indexByKey.end()) {
            indexByKey.emplace(key, merged.size());
            merged.push_back(newTweets[i]);
        } else {
            merged[it->second] = newTweets[i];
        }
    }

    for (size_t i = 0; i < previousTweets.size(); ++i) {
        const std::string key = tweetMergeKey(previousTweets[i], "previous", i);
        auto it = indexByKey.find(key);
        if (it == indexByKey.end()) {
            indexByKey.emplace(key, merged.size());
            merged.push_back(previousTweets[i]);
            continue;
        }

        ++duplicates;
        TweetItem &existing = merged[it->second];
        if (&pickRicherTweet(existing, previousTweets[i]) != &existing) {
            existing = previousTweets[i];
        }
    }

    result.tweets = sortTweetsByDateDesc(std::move(merged));
    MergeInfo info;
    info.previousCount = static_cast<int>(previousTweets.size());
    info.newCount = static_cast<int>(newTweets.size());
    info.duplicatesRemoved = duplicates;
    info.finalCount = static_cast<int>(result.tweets.size());
    result.mergeInfo = info;
    return result;
}

} // namespace scrollkeep
