#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "store/chunk_codec.hpp"
#include "store/kv_backend.hpp"

namespace scrollkeep {

struct ResumeStoreOptions {
    int64_t maxAgeMs = 6LL * 60 * 60 * 1000;
    size_t chunkSize = chunking::kDefaultChunkSize;
    // Defaults to the wall clock.
    std::function<int64_t()> clock;
};

// Validates a decoded payload: object with a resolvable username and a
// non-empty tweets array. saved_at falls back to nowMs when absent or zero.
std::optional<ResumeSnapshot> normalizeResumePayload(const nlohmann::json &candidate,
                                                     int64_t nowMs);

// ResumeStore keeps at most one resume snapshot across two tiers. Either
// tier may be null. None of the public operations throw; backend failures
// are logged and reported through return values.
class ResumeStore {
public:
    ResumeStore(std::unique_ptr<BlockStore> primary,
                std::unique_ptr<KeyValueStore> fallback,
                ResumeStoreOptions options = {});
    ~ResumeStore();

    ResumeStore(const ResumeStore &) = delete;
    ResumeStore &operator=(const ResumeStore &) = delete;

    // False when the snapshot is invalid or neither tier accepted it.
    bool persist(const ResumeSnapshot &snapshot);

    // Returns nothing when absent, corrupt, expired (which also clears
    // both tiers) or saved for a different user than targetUsername.
    std::optional<ResumeSnapshot> restore(
        const std::optional<std::string> &targetUsername = std::nullopt);

    void clear();

    static const chunking::ChunkLayout &primaryLayout();
    static const chunking::ChunkLayout &fallbackLayout();

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

// SQLite at <dataDir>/resume.db, JSON file at <dataDir>/resume-fallback.json.
std::unique_ptr<ResumeStore> openDefaultResumeStore(const std::string &dataDir,
                                                    ResumeStoreOptions options = {});

} // namespace scrollkeep
