#pragma once

#include <exception>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace scrollkeep {

// Builds one output row from a normalized tweet. Returning nullopt drops it.
template <typename T>
using TimelineRowBuilder =
    std::function<std::optional<T>(const nlohmann::json &tweet, TweetItemType type)>;

template <typename T>
struct ExtractedTimeline {
    std::vector<T> items;
    std::optional<std::string> nextCursor;
};

namespace timeline {

enum class EntryKind {
    Promoted,
    Tweet,
    Conversation,
    BottomCursor,
    Other
};

// Walks an object path. Returns nullptr as soon as a step is missing or not an object.
const nlohmann::json *findPath(const nlohmann::json &root,
                               std::initializer_list<const char *> path);

// Tries the user timeline, the replies timeline and the search timeline in
// that order; the first one carrying an instructions array wins.
const nlohmann::json *resolveInstructions(const nlohmann::json &payload);

// Collapses the visibility wrapper onto the tweet it wraps.
const nlohmann::json *normalizeTweetResult(const nlohmann::json *result);

TweetItemType classifyTweet(const nlohmann::json &tweet);
EntryKind classifyEntryId(const std::string &entryId);

bool isEntryInstruction(const nlohmann::json &instruction);
std::vector<const nlohmann::json *> instructionEntries(const nlohmann::json &instruction);

std::optional<std::string> bottomCursorValue(const nlohmann::json &entry);

void logSkippedEntry(const std::string &entryId, const char *reason);
void logExtracted(size_t instructionCount, size_t itemCount, bool hasCursor);

} // namespace timeline

template <typename T>
ExtractedTimeline<T> extractTimeline(const nlohmann::json &payload,
                                     const TimelineRowBuilder<T> &buildRow)
{
    ExtractedTimeline<T> result;
    const nlohmann::json *instructions = timeline::resolveInstructions(payload);
    if (!instructions) {
        timeline::logExtracted(0, 0, false);
        return result;
    }

    auto appendRow = [&](const nlohmann::json *raw, TweetItemType forcedType, bool useForced) {
        const nlohmann::json *tweet = timeline::normalizeTweetResult(raw);
        if (!tweet) {
            return;
        }
        const TweetItemType type = useForced ? forcedType : timeline::classifyTweet(*tweet);
        if (auto row = buildRow(*tweet, type)) {
            result.items.push_back(std::move(*row));
        }
    };

    for (const auto &instruction : *instructions) {
        if (!timeline::isEntryInstruction(instruction)) {
            continue;
        }

        for (const nlohmann::json *entry : timeline::instructionEntries(instruction)) {
            const std::string entryId = entry->is_object() && entry->contains("entryId")
                    && entry->at("entryId").is_string()
                ? entry->at("entryId").get<std::string>()
                : std::string();

            try {
                switch (timeline::classifyEntryId(entryId)) {
                case timeline::EntryKind::Promoted:
                case timeline::EntryKind::Other:
                    break;
                case timeline::EntryKind::Tweet:
                    appendRow(timeline::findPath(*entry,
                                                 {"content", "itemContent", "tweet_results", "result"}),
                              TweetItemType::Tweet, false);
                    break;
                case timeline::EntryKind::Conversation: {
                    const nlohmann::json *items = timeline::findPath(*entry, {"content", "items"});
                    if (!items || !items->is_array()) {
                        break;
                    }
                    for (const auto &convoItem : *items) {
                        appendRow(timeline::findPath(convoItem,
                                                     {"item", "itemContent", "tweet_results", "result"}),
                                  TweetItemType::Tweet, true);
                    }
                    break;
                }
                case timeline::EntryKind::BottomCursor:
                    if (auto cursor = timeline::bottomCursorValue(*entry)) {
                        result.nextCursor = std::move(cursor);
                    }
                    break;
                }
            } catch (const std::exception &ex) {
                timeline::logSkippedEntry(entryId, ex.what());
            }
        }
    }

    timeline::logExtracted(instructions->size(), result.items.size(),
                           result.nextCursor.has_value());
    return result;
}

} // namespace scrollkeep
