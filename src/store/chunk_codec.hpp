#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/models.hpp"
#include "store/kv_backend.hpp"

namespace scrollkeep::chunking {

constexpr int kManifestVersion = 2;
constexpr size_t kDefaultChunkSize = 512 * 1024;

struct ChunkLayout {
    std::string manifestKey;
    std::string chunkPrefix;
    // Pre-chunking single-document record; may equal manifestKey.
    std::string legacyKey;

    std::string chunkKey(int index) const;
};

enum class ReadStatus {
    NoManifest,
    Corrupt,
    Ok
};

struct ReadResult {
    ReadStatus status = ReadStatus::NoManifest;
    std::string serialized;
};

// Splits on UTF-8 sequence boundaries, so a chunk may run a few bytes short.
// An empty input still yields one empty chunk.
std::vector<std::string> splitIntoChunks(const std::string &value, size_t chunkSize);

// Version must be 2 and chunkCount an integer above zero.
std::optional<ChunkManifest> parseManifest(const nlohmann::json &value);

// Writes chunks then the manifest, then drops chunk keys in
// [chunks, previousChunkCount) left over from a larger earlier write.
// Returns the number of chunks written.
template<typename Store>
int writeChunked(Store &store, const ChunkLayout &layout,
                 const std::string &serialized, size_t chunkSize,
                 int previousChunkCount)
{
    using Traits = KeyValueTraits<Store>;
    const std::vector<std::string> chunks = splitIntoChunks(serialized, chunkSize);
    const int chunkCount = static_cast<int>(chunks.size());

    for (int index = 0; index < chunkCount; ++index) {
        Traits::write(store, layout.chunkKey(index), chunks[static_cast<size_t>(index)]);
    }

    ChunkManifest manifest;
    manifest.chunkCount = chunkCount;
    Traits::write(store, layout.manifestKey, nlohmann::json(manifest));

    for (int index = chunkCount; index < previousChunkCount; ++index) {
        Traits::remove(store, layout.chunkKey(index));
    }
    return chunkCount;
}

// All chunks or nothing: a missing or non-string chunk is Corrupt.
template<typename Store>
ReadResult readChunked(Store &store, const ChunkLayout &layout)
{
    using Traits = KeyValueTraits<Store>;
    ReadResult result;
    const auto raw = Traits::get(store, layout.manifestKey);
    const auto manifest = raw ? parseManifest(*raw) : std::nullopt;
    if (!manifest) {
        return result;
    }

    std::string serialized;
    for (int index = 0; index < manifest->chunkCount; ++index) {
        const auto chunk = Traits::get(store, layout.chunkKey(index));
        if (!chunk || !chunk->is_string()) {
            result.status = ReadStatus::Corrupt;
            return result;
        }
        serialized += chunk->template get_ref<const std::string &>();
    }

    result.status = ReadStatus::Ok;
    result.serialized = std::move(serialized);
    return result;
}

template<typename Store>
void clearChunked(Store &store, const ChunkLayout &layout)
{
    using Traits = KeyValueTraits<Store>;
    const auto raw = Traits::get(store, layout.manifestKey);
    if (const auto manifest = raw ? parseManifest(*raw) : std::nullopt) {
        for (int index = 0; index < manifest->chunkCount; ++index) {
            Traits::remove(store, layout.chunkKey(index));
        }
    }
    Traits::remove(store, layout.manifestKey);
}

} // namespace scrollkeep::chunking
