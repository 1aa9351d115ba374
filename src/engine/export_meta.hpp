#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace scrollkeep {

struct BuildMetaInput {
    std::string username;
    std::string userId;
    std::string name;
    std::string startedAt;
    std::string completedAt;
    int newCollectedCount = 0;
    int previousCollectedCount = 0;
    std::optional<int64_t> reportedCountCurrent;
    nlohmann::json previousMeta;
    std::string collectionMethod;
    int scrollResponsesCapturedCurrent = 0;
    std::optional<MergeInfo> mergeInfo;
};

// Folds the previous run's meta into this run's: earliest start, largest
// positive reported count, merge counts and carried-over capture totals.
nlohmann::json buildConsolidatedMeta(const BuildMetaInput &input);

// {"meta": ..., "items": [...]}
nlohmann::json createExportPayload(const nlohmann::json &meta, const TweetList &tweets);

std::string exportFilename(const std::string &username, bool resumed, int64_t nowMs);

} // namespace scrollkeep
