#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "engine/timeline_decoder.hpp"

namespace scrollkeep {

// Flattens a normalized provider tweet into an export row. Nested quoted and
// retweeted tweets are followed up to two levels deep. Null fields are
// dropped and "type" is only set for non-plain tweets.
std::optional<TweetItem> buildTweetRow(const nlohmann::json &tweet, TweetItemType type);

TimelineRowBuilder<TweetItem> defaultTweetRowBuilder();

// Decodes every captured response and keeps rows with an id that belong to
// the target user (any row for "unknown", and retweets). The first copy of
// an id wins across responses. A response that fails to decode is skipped.
TweetList extractTweetsFromResponses(const std::vector<CaptureEvent> &responses,
                                     const std::string &targetUserId);

} // namespace scrollkeep
