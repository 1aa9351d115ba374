#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace scrollkeep {

int64_t epochMillis(std::chrono::system_clock::time_point time);
int64_t nowEpochMillis();

std::string toIso8601Utc(int64_t epochMs);

// Accepts "YYYY-MM-DD HH:MM:SS" (spaces tolerated around '-'), ISO-8601 and
// the provider's "Wed Oct 10 20:19:24 +0000 2018" form. All are read as UTC
// unless an explicit offset is present.
std::optional<int64_t> parseTweetDate(const std::string &value);

// Formats a provider timestamp as "YYYY-MM-DD HH:MM:SS" (UTC). Unparsable
// input is returned unchanged.
std::string formatTweetDate(const std::string &value);

std::string formatLocalClock(int64_t epochSeconds);
std::string formatDateStamp(int64_t epochMs);

} // namespace scrollkeep
