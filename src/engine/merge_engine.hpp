#pragma once

#include <string>

#include "common/models.hpp"

namespace scrollkeep {

// Stable, newest first. Rows without a parsable created_at sort as epoch 0.
TweetList sortTweetsByDateDesc(TweetList tweets);

// "id:<id>" when the row has an id, else a key built from the source tag,
// position, created_at and text so id-less rows never collide by accident.
std::string tweetMergeKey(const TweetItem &tweet, const char *source, size_t index);

// Of two copies of the same row, the one with strictly more top-level fields
// wins; a tie keeps the existing copy.
const TweetItem &pickRicherTweet(const TweetItem &existing, const TweetItem &candidate);

// New rows are inserted first, previous rows after. An empty previous list
// means no merge happened and mergeInfo stays empty.
MergeResult mergeTweets(const TweetList &newTweets, const TweetList &previousTweets);

} // namespace scrollkeep
