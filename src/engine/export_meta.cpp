#include "engine/export_meta.hpp"

#include <algorithm>
#include <vector>

#include <QDateTime>
#include <QString>

#include "common/json_utils.hpp"
#include "common/time_utils.hpp"

namespace scrollkeep {

namespace {

std::optional<int64_t> parseIsoDate(const std::string &value)
{
    if (value.empty()) {
        return std::nullopt;
    }
    const QDateTime parsed = QDateTime::fromString(QString::fromStdString(value), Qt::ISODate);
    if (!parsed.isValid()) {
        return std::nullopt;
    }
    return parsed.toMSecsSinceEpoch();
}

std::string stringField(const nlohmann::json &meta, const char *primary, const char *legacy)
{
    if (!meta.is_object()) {
        return {};
    }
    for (const char *key : {primary, legacy}) {
        auto it = meta.find(key);
        if (it != meta.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return {};
}

std::optional<double> previousReportedCount(const nlohmann::json &meta)
{
    if (!meta.is_object()) {
        return std::nullopt;
    }
    for (const char *key : {"reported_count", "total_tweets_reported"}) {
        auto it = meta.find(key);
        if (it != meta.end() && it->is_number()) {
            return it->get<double>();
        }
    }
    return std::nullopt;
}

} // namespace

nlohmann::json buildConsolidatedMeta(const BuildMetaInput &input)
{
    const nlohmann::json &previous = input.previousMeta;

    std::vector<int64_t> reported;
    if (input.reportedCountCurrent && *input.reportedCountCurrent > 0) {
        reported.push_back(*input.reportedCountCurrent);
    }
    if (const auto prior = previousReportedCount(previous); prior && *prior > 0) {
        reported.push_back(static_cast<int64_t>(*prior));
    }

    int64_t priorCaptured = 0;
    if (previous.is_object()) {
        auto it = previous.find("scroll_responses_captured");
        if (it != previous.end() && it->is_number() && it->get<double>() > 0) {
            priorCaptured = static_cast<int64_t>(it->get<double>());
        }
    }

    const std::string previousStartedAt =
        stringField(previous, "export_started_at", "started_at");
    const std::string previousCompletedAt =
        stringField(previous, "export_completed_at", "finished_at");

    std::string effectiveStart = input.startedAt;
    const auto previousStart = parseIsoDate(previousStartedAt);
    const auto currentStart = parseIsoDate(input.startedAt);
    if (previousStart && (!currentStart || *previousStart < *currentStart)) {
        effectiveStart = toIso8601Utc(*previousStart);
    } else if (currentStart) {
        effectiveStart = toIso8601Utc(*currentStart);
    }

    const int consolidatedCount = input.mergeInfo
        ? input.mergeInfo->finalCount
        : input.newCollectedCount + input.previousCollectedCount;

    nlohmann::json meta = {
        {"username", input.username},
        {"export_started_at", effectiveStart},
        {"export_completed_at", input.completedAt},
        {"collected_count", consolidatedCount},
        {"new_collected_count", input.newCollectedCount},
        {"previous_collected_count", input.previousCollectedCount},
        {"reported_count", reported.empty()
             ? nlohmann::json()
             : nlohmann::json(*std::max_element(reported.begin(), reported.end()))},
        {"collection_method", input.collectionMethod},
        {"scroll_responses_captured",
         input.scrollResponsesCapturedCurrent + (input.mergeInfo ? priorCaptured : 0)}
    };

    if (!input.userId.empty()) {
        meta["user_id"] = input.userId;
    }
    if (!input.name.empty()) {
        meta["name"] = input.name;
    }
    if (!previousStartedAt.empty()) {
        meta["previous_export_started_at"] = previousStartedAt;
    }
    if (!previousCompletedAt.empty()) {
        meta["previous_export_completed_at"] = previousCompletedAt;
    }
    if (input.mergeInfo) {
        meta["merge_info"] = *input.mergeInfo;
    }
    return meta;
}

nlohmann::json createExportPayload(const nlohmann::json &meta, const TweetList &tweets)
{
    return nlohmann::json{{"meta", meta}, {"items", tweets}};
}

std::string exportFilename(const std::string &username, bool resumed, int64_t nowMs)
{
    return username + "_tweets_scroll" + (resumed ? "_merged" : "") + "_"
        + formatDateStamp(nowMs) + ".json";
}

} // namespace scrollkeep
