#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace scrollkeep {

// Tweet rows keep every field the row builder produced, so they stay JSON.
using TweetItem = nlohmann::json;
using TweetList = std::vector<TweetItem>;

struct LifecycleSnapshot {
    LifecycleStatus status = LifecycleStatus::Idle;
    int64_t lastActivityAt = 0;
};

struct LifecycleAction {
    LifecycleActionType type = LifecycleActionType::Activity;
    // Injected timestamp (epoch ms). The reducer uses the clock when empty.
    std::optional<int64_t> at;
};

struct RateLimitState {
    RateLimitMode mode = RateLimitMode::Normal;
    int requestCount = 0;
    int64_t limit = 150;
    int64_t remaining = 150;
    // Epoch seconds, as reported by the provider.
    int64_t resetTime = 0;
    int64_t lastRequestTime = 0;
    int retryCount = 0;
    int64_t dynamicDelay = 2500;
};

struct MergeInfo {
    int previousCount = 0;
    int newCount = 0;
    int duplicatesRemoved = 0;
    int finalCount = 0;
};

struct MergeResult {
    TweetList tweets;
    // Empty when there was nothing to merge with.
    std::optional<MergeInfo> mergeInfo;
};

struct ResumeSnapshot {
    std::string username;
    int64_t savedAt = 0;
    nlohmann::json meta;
    TweetList tweets;
};

struct ChunkManifest {
    int version = 2;
    int chunkCount = 0;
};

// One intercepted API response. Quota values stay raw JSON because the
// capture layer forwards header strings as-is.
struct CaptureEvent {
    std::string url;
    nlohmann::json body;
    nlohmann::json rateLimitInfo;
};

} // namespace scrollkeep
