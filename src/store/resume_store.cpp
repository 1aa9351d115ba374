#include "store/resume_store.hpp"

#include <cmath>
#include <stdexcept>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"
#include "store/json_file_store.hpp"
#include "store/sqlite_block_store.hpp"

namespace scrollkeep {

namespace {

const QString kComponent = QStringLiteral("ResumeStore");

int64_t savedAtValue(const nlohmann::json &value)
{
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        const double raw = value.get<double>();
        return std::isfinite(raw) ? static_cast<int64_t>(raw) : 0;
    }
    if (value.is_string()) {
        try {
            size_t consumed = 0;
            const std::string text = value.get<std::string>();
            const double raw = std::stod(text, &consumed);
            if (consumed == text.size() && std::isfinite(raw)) {
                return static_cast<int64_t>(raw);
            }
        } catch (const std::exception &) {
            return 0;
        }
    }
    return 0;
}

std::optional<nlohmann::json> parseDocument(const std::string &serialized)
{
    try {
        return nlohmann::json::parse(serialized);
    } catch (const nlohmann::json::parse_error &) {
        return std::nullopt;
    }
}

void logBackendFailure(const char *where, const char *what, const std::exception &ex)
{
    SKLOG_WARN(kComponent,
               where,
               what,
               "backend_error",
               "exception",
               "",
               logging::currentCorrelationId(),
               (nlohmann::json{{"error", ex.what()}}));
}

} // namespace

std::optional<ResumeSnapshot> normalizeResumePayload(const nlohmann::json &candidate,
                                                     int64_t nowMs)
{
    if (!candidate.is_object()) {
        return std::nullopt;
    }
    auto tweets = candidate.find("tweets");
    if (tweets == candidate.end() || !tweets->is_array() || tweets->empty()) {
        return std::nullopt;
    }
    auto username = candidate.find("username");
    if (username == candidate.end()) {
        return std::nullopt;
    }
    const auto normalized = normalizeUsername(*username);
    if (!normalized) {
        return std::nullopt;
    }

    ResumeSnapshot snapshot;
    snapshot.username = *normalized;
    auto savedAt = candidate.find("saved_at");
    snapshot.savedAt = savedAt != candidate.end() ? savedAtValue(*savedAt) : 0;
    if (snapshot.savedAt == 0) {
        snapshot.savedAt = nowMs;
    }
    auto meta = candidate.find("meta");
    snapshot.meta = meta != candidate.end() ? *meta : nlohmann::json();
    snapshot.tweets = tweets->get<TweetList>();
    return snapshot;
}

struct ResumeStore::Impl {
    std::unique_ptr<BlockStore> primary;
    std::unique_ptr<KeyValueStore> fallback;
    ResumeStoreOptions options;

    int64_t now() const
    {
        return options.clock ? options.clock() : nowEpochMillis();
    }

    // Each tier normalizes its own record; an invalid one counts as a miss.
    std::optional<ResumeSnapshot> readPrimary()
    {
        auto tx = primary->openTransaction(TransactionMode::ReadOnly);
        const auto read = chunking::readChunked(*tx, primaryLayout());
        if (read.status == chunking::ReadStatus::Ok) {
            const auto document = parseDocument(read.serialized);
            return document ? normalizeResumePayload(*document, now()) : std::nullopt;
        }
        if (read.status == chunking::ReadStatus::Corrupt) {
            return std::nullopt;
        }
        const auto legacy = tx->get(primaryLayout().legacyKey);
        return legacy ? normalizeResumePayload(*legacy, now()) : std::nullopt;
    }

    std::optional<ResumeSnapshot> readFallback()
    {
        const auto raw = fallback->get(fallbackLayout().manifestKey);
        if (!raw) {
            return std::nullopt;
        }
        if (auto legacy = normalizeResumePayload(*raw, now())) {
            return legacy;
        }
        const auto read = chunking::readChunked(*fallback, fallbackLayout());
        if (read.status != chunking::ReadStatus::Ok) {
            return std::nullopt;
        }
        const auto document = parseDocument(read.serialized);
        return document ? normalizeResumePayload(*document, now()) : std::nullopt;
    }

    bool writePrimary(const std::string &serialized)
    {
        auto tx = primary->openTransaction(TransactionMode::ReadWrite);
        tx->clear();
        chunking::writeChunked(*tx, primaryLayout(), serialized, options.chunkSize, 0);
        tx->commit();
        return true;
    }

    bool writeFallback(const std::string &serialized)
    {
        int previousCount = 0;
        if (const auto raw = fallback->get(fallbackLayout().manifestKey)) {
            if (const auto manifest = chunking::parseManifest(*raw)) {
                previousCount = manifest->chunkCount;
            }
        }
        chunking::writeChunked(*fallback, fallbackLayout(), serialized,
                               options.chunkSize, previousCount);
        return true;
    }
};

ResumeStore::ResumeStore(std::unique_ptr<BlockStore> primary,
                         std::unique_ptr<KeyValueStore> fallback,
                         ResumeStoreOptions options)
    : impl(std::make_unique<Impl>())
{
    impl->primary = std::move(primary);
    impl->fallback = std::move(fallback);
    impl->options = std::move(options);
}

ResumeStore::~ResumeStore() = default;

const chunking::ChunkLayout &ResumeStore::primaryLayout()
{
    static const chunking::ChunkLayout layout{
        "resume:active:manifest",
        "resume:active:chunk:",
        "resume:active"
    };
    return layout;
}

const chunking::ChunkLayout &ResumeStore::fallbackLayout()
{
    static const chunking::ChunkLayout layout{
        "resume_payload_fallback",
        "resume_payload_fallback:chunk:",
        "resume_payload_fallback"
    };
    return layout;
}

bool ResumeStore::persist(const ResumeSnapshot &snapshot)
{
    const auto normalized = normalizeResumePayload(nlohmann::json(snapshot), impl->now());
    if (!normalized) {
        SKLOG_WARN(kComponent,
                   "persist",
                   "resume_persist_rejected",
                   "invalid_snapshot",
                   "normalizeResumePayload",
                   "",
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"username", snapshot.username},
                                   {"tweets", snapshot.tweets.size()}}));
        return false;
    }

    const std::string serialized = nlohmann::json(*normalized).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);

    if (impl->primary) {
        try {
            impl->writePrimary(serialized);
            SKLOG_DEBUG(kComponent,
                        "persist",
                        "resume_persisted",
                        "checkpoint",
                        "primary",
                        "",
                        logging::currentCorrelationId(),
                        (nlohmann::json{{"tweets", normalized->tweets.size()},
                                        {"bytes", serialized.size()}}));
            return true;
        } catch (const std::exception &ex) {
            logBackendFailure("persist", "resume_primary_write_failed", ex);
        }
    }

    if (impl->fallback) {
        try {
            impl->writeFallback(serialized);
            SKLOG_DEBUG(kComponent,
                        "persist",
                        "resume_persisted",
                        "checkpoint",
                        "fallback",
                        "",
                        logging::currentCorrelationId(),
                        (nlohmann::json{{"tweets", normalized->tweets.size()},
                                        {"bytes", serialized.size()}}));
            return true;
        } catch (const std::exception &ex) {
            logBackendFailure("persist", "resume_fallback_write_failed", ex);
        }
    }
    return false;
}

std::optional<ResumeSnapshot> ResumeStore::restore(
    const std::optional<std::string> &targetUsername)
{
    std::optional<ResumeSnapshot> snapshot;
    if (impl->primary) {
        try {
            snapshot = impl->readPrimary();
        } catch (const std::exception &ex) {
            logBackendFailure("restore", "resume_primary_read_failed", ex);
        }
    }
    if (!snapshot && impl->fallback) {
        try {
            snapshot = impl->readFallback();
        } catch (const std::exception &ex) {
            logBackendFailure("restore", "resume_fallback_read_failed", ex);
        }
    }
    if (!snapshot) {
        return std::nullopt;
    }

    const int64_t now = impl->now();
    if (now - snapshot->savedAt > impl->options.maxAgeMs) {
        SKLOG_INFO(kComponent,
                   "restore",
                   "resume_expired",
                   "max_age_exceeded",
                   "clear",
                   "",
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"saved_at", snapshot->savedAt},
                                   {"age_ms", now - snapshot->savedAt}}));
        clear();
        return std::nullopt;
    }

    if (targetUsername) {
        const auto expected = normalizeUsername(*targetUsername);
        if (expected && *expected != snapshot->username) {
            return std::nullopt;
        }
    }
    return snapshot;
}

void ResumeStore::clear()
{
    if (impl->primary) {
        try {
            auto tx = impl->primary->openTransaction(TransactionMode::ReadWrite);
            tx->clear();
            tx->commit();
        } catch (const std::exception &ex) {
            logBackendFailure("clear", "resume_primary_clear_failed", ex);
        }
    }
    if (impl->fallback) {
        try {
            chunking::clearChunked(*impl->fallback, fallbackLayout());
        } catch (const std::exception &ex) {
            logBackendFailure("clear", "resume_fallback_clear_failed", ex);
        }
    }
}

std::unique_ptr<ResumeStore> openDefaultResumeStore(const std::string &dataDir,
                                                    ResumeStoreOptions options)
{
    const std::filesystem::path base(dataDir);
    return std::make_unique<ResumeStore>(
        std::make_unique<SqliteBlockStore>(base / "resume.db"),
        std::make_unique<JsonFileStore>((base / "resume-fallback.json").string()),
        std::move(options));
}

} // namespace scrollkeep
