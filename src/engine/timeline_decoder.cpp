#include "engine/timeline_decoder.hpp"

#include "common/logging.hpp"

namespace scrollkeep::timeline {

namespace {

bool startsWith(const std::string &value, const char *prefix)
{
    return value.rfind(prefix, 0) == 0;
}

} // namespace

const nlohmann::json *findPath(const nlohmann::json &root,
                               std::initializer_list<const char *> path)
{
    const nlohmann::json *current = &root;
    for (const char *key : path) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(key);
        if (it == current->end()) {
            return nullptr;
        }
        current = &*it;
    }
    return current;
}

const nlohmann::json *resolveInstructions(const nlohmann::json &payload)
{
    // First match wins; a payload carrying several shapes is not merged.
    const nlohmann::json *candidates[] = {
        findPath(payload, {"data", "user", "result", "timeline_v2", "timeline", "instructions"}),
        findPath(payload, {"data", "user", "result", "timeline", "timeline", "instructions"}),
        findPath(payload, {"data", "search_by_raw_query", "search_timeline", "timeline",
                           "instructions"}),
    };
    for (const nlohmann::json *candidate : candidates) {
        if (candidate && candidate->is_array()) {
            return candidate;
        }
    }
    return nullptr;
}

const nlohmann::json *normalizeTweetResult(const nlohmann::json *result)
{
    if (!result || !result->is_object()) {
        return nullptr;
    }
    auto typeName = result->find("__typename");
    if (typeName != result->end() && typeName->is_string()
        && typeName->get_ref<const std::string &>() == "TweetWithVisibilityResults") {
        auto inner = result->find("tweet");
        if (inner == result->end() || !inner->is_object()) {
            return nullptr;
        }
        return &*inner;
    }
    return result;
}

TweetItemType classifyTweet(const nlohmann::json &tweet)
{
    const nlohmann::json *retweet =
        findPath(tweet, {"legacy", "retweeted_status_result", "result"});
    if (retweet && !retweet->is_null()) {
        return TweetItemType::Retweet;
    }
    return TweetItemType::Tweet;
}

EntryKind classifyEntryId(const std::string &entryId)
{
    if (startsWith(entryId, "promoted-")) {
        return EntryKind::Promoted;
    }
    if (startsWith(entryId, "tweet-")) {
        return EntryKind::Tweet;
    }
    if (startsWith(entryId, "profile-conversation-") || startsWith(entryId, "conversation-")) {
        return EntryKind::Conversation;
    }
    if (startsWith(entryId, "cursor-bottom-")) {
        return EntryKind::BottomCursor;
    }
    return EntryKind::Other;
}

bool isEntryInstruction(const nlohmann::json &instruction)
{
    if (!instruction.is_object()) {
        return false;
    }
    auto type = instruction.find("type");
    if (type == instruction.end() || !type->is_string()) {
        return false;
    }
    const std::string &value = type->get_ref<const std::string &>();
    return value == "TimelineAddEntries" || value == "TimelineReplaceEntry"
        || value == "AddEntries" || value == "ReplaceEntry";
}

std::vector<const nlohmann::json *> instructionEntries(const nlohmann::json &instruction)
{
    std::vector<const nlohmann::json *> entries;
    auto list = instruction.find("entries");
    if (list != instruction.end() && list->is_array()) {
        for (const auto &entry : *list) {
            entries.push_back(&entry);
        }
        return entries;
    }
    auto single = instruction.find("entry");
    if (single != instruction.end() && single->is_object()) {
        entries.push_back(&*single);
    }
    return entries;
}

std::optional<std::string> bottomCursorValue(const nlohmann::json &entry)
{
    const nlohmann::json *cursorType = findPath(entry, {"content", "cursorType"});
    if (!cursorType || !cursorType->is_string() || cursorType->get<std::string>() != "Bottom") {
        return std::nullopt;
    }
    const nlohmann::json *value = findPath(entry, {"content", "value"});
    if (!value || !value->is_string()) {
        return std::nullopt;
    }
    return value->get<std::string>();
}

void logSkippedEntry(const std::string &entryId, const char *reason)
{
    SKLOG_DEBUG(QStringLiteral("TimelineDecoder"),
                QStringLiteral("extractTimeline"),
                QStringLiteral("entry_skipped"),
                QStringLiteral("malformed_entry"),
                QStringLiteral("continue_with_next_entry"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"entryId", entryId}, {"error", reason}}));
}

void logExtracted(size_t instructionCount, size_t itemCount, bool hasCursor)
{
    SKLOG_DEBUG(QStringLiteral("TimelineDecoder"),
                QStringLiteral("extractTimeline"),
                QStringLiteral("timeline_page_decoded"),
                QStringLiteral("captured_response"),
                QStringLiteral("instruction_walk"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"instructions", instructionCount},
                                {"items", itemCount},
                                {"hasCursor", hasCursor}}));
}

} // namespace scrollkeep::timeline
