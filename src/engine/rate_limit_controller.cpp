#include "engine/rate_limit_controller.hpp"

#include <cctype>
#include <cmath>
#include <limits>

#include "common/time_utils.hpp"

namespace scrollkeep {

namespace ratelimit {

std::optional<int64_t> parseQuotaValue(const nlohmann::json &value)
{
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        const double number = value.get<double>();
        if (!std::isfinite(number)
            || std::fabs(number) >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(std::trunc(number));
    }
    if (!value.is_string()) {
        return std::nullopt;
    }

    const std::string &text = value.get_ref<const std::string &>();
    size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    int64_t result = 0;
    bool sawDigit = false;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        if (result > (std::numeric_limits<int64_t>::max() - 9) / 10) {
            return std::nullopt;
        }
        result = result * 10 + (text[pos] - '0');
        sawDigit = true;
        ++pos;
    }
    if (!sawDigit) {
        return std::nullopt;
    }
    return negative ? -result : result;
}

int64_t dynamicDelayFor(int64_t remaining)
{
    if (remaining < kLowRemaining) {
        return 8000;
    }
    if (remaining < kWarnRemaining) {
        return 5000;
    }
    return 3000;
}

} // namespace ratelimit

RateLimitState createRateLimitState()
{
    return RateLimitState{};
}

RateLimitUpdateResult applyRateLimitInfo(RateLimitState &state,
                                         const nlohmann::json &info,
                                         int64_t nowMs)
{
    if (info.is_null()) {
        return {};
    }

    if (info.is_object()) {
        if (const auto limit = ratelimit::parseQuotaValue(info.value("limit", nlohmann::json()))) {
            state.limit = *limit;
        }
        if (const auto remaining =
                ratelimit::parseQuotaValue(info.value("remaining", nlohmann::json()))) {
            state.remaining = *remaining;
        }
        if (const auto reset = ratelimit::parseQuotaValue(info.value("reset", nlohmann::json()))) {
            state.resetTime = *reset;
        }
    }

    state.requestCount += 1;
    state.lastRequestTime = nowMs;
    state.dynamicDelay = ratelimit::dynamicDelayFor(state.remaining);

    RateLimitUpdateResult result;
    result.triggeredBatchCooldown =
        state.requestCount > 0 && state.requestCount % ratelimit::kBatchSize == 0;
    result.triggeredLowRemainingCooldown = state.remaining < ratelimit::kLowRemaining;
    return result;
}

CooldownDetails getCooldownDetails(const RateLimitState &state, int64_t nowMs)
{
    CooldownDetails details;
    details.durationMs = ratelimit::kDefaultCooldownMs;
    details.reason = "batch pacing (" + std::to_string(state.requestCount) + " requests)";

    if (state.remaining < ratelimit::kLowRemaining && state.resetTime > 0) {
        const double waitSeconds =
            static_cast<double>(state.resetTime) - static_cast<double>(nowMs) / 1000.0;
        if (waitSeconds > 0) {
            details.durationMs =
                static_cast<int64_t>(std::ceil(waitSeconds * 1000.0)) + ratelimit::kResetBufferMs;
            details.reason = "API limit low (" + std::to_string(state.remaining)
                + " left), reset at " + formatLocalClock(state.resetTime);
        }
    }

    return details;
}

void resetRateLimitStateForRun(RateLimitState &state)
{
    state.mode = RateLimitMode::Normal;
    state.requestCount = 0;
    state.retryCount = 0;
    state.remaining = 150;
    state.dynamicDelay = 3000;
}

} // namespace scrollkeep
