#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace scrollkeep {

struct RateLimitUpdateResult {
    bool triggeredBatchCooldown = false;
    bool triggeredLowRemainingCooldown = false;
};

struct CooldownDetails {
    int64_t durationMs = 0;
    std::string reason;
};

namespace ratelimit {

constexpr int kBatchSize = 20;
constexpr int64_t kLowRemaining = 10;
constexpr int64_t kWarnRemaining = 20;
constexpr int64_t kDefaultCooldownMs = 180000;
constexpr int64_t kResetBufferMs = 10000;

// Leading base-10 integer of a number or string ("42", 42, "42abc" -> 42).
// Null, objects, booleans and strings without digits yield nothing.
std::optional<int64_t> parseQuotaValue(const nlohmann::json &value);

int64_t dynamicDelayFor(int64_t remaining);

} // namespace ratelimit

RateLimitState createRateLimitState();

// Folds one response's quota info into the state. A null info changes
// nothing; anything else counts as a request even when every field is junk.
RateLimitUpdateResult applyRateLimitInfo(RateLimitState &state,
                                         const nlohmann::json &info,
                                         int64_t nowMs);

CooldownDetails getCooldownDetails(const RateLimitState &state, int64_t nowMs);

// Fresh counters for a new run. limit, resetTime and lastRequestTime carry
// over so the provider-reported ceiling survives between runs.
void resetRateLimitStateForRun(RateLimitState &state);

} // namespace scrollkeep
