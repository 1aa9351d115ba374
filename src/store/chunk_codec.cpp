#include "store/chunk_codec.hpp"

#include <algorithm>
#include <cmath>

namespace scrollkeep::chunking {

namespace {

bool isContinuationByte(char byte)
{
    return (static_cast<unsigned char>(byte) & 0xC0) == 0x80;
}

} // namespace

std::string ChunkLayout::chunkKey(int index) const
{
    return chunkPrefix + std::to_string(index);
}

std::vector<std::string> splitIntoChunks(const std::string &value, size_t chunkSize)
{
    if (value.empty() || chunkSize == 0) {
        return {value};
    }

    std::vector<std::string> chunks;
    size_t pos = 0;
    while (pos < value.size()) {
        size_t end = std::min(pos + chunkSize, value.size());
        while (end < value.size() && end > pos + 1 && isContinuationByte(value[end])) {
            --end;
        }
        chunks.push_back(value.substr(pos, end - pos));
        pos = end;
    }
    return chunks;
}

std::optional<ChunkManifest> parseManifest(const nlohmann::json &value)
{
    if (!value.is_object()) {
        return std::nullopt;
    }
    auto version = value.find("version");
    if (version == value.end() || !version->is_number()
        || version->get<double>() != kManifestVersion) {
        return std::nullopt;
    }

    auto count = value.find("chunkCount");
    if (count == value.end() || !count->is_number()) {
        return std::nullopt;
    }
    const double raw = count->get<double>();
    if (std::floor(raw) != raw || raw <= 0 || raw > 1e6) {
        return std::nullopt;
    }

    ChunkManifest manifest;
    manifest.version = kManifestVersion;
    manifest.chunkCount = static_cast<int>(raw);
    return manifest;
}

} // namespace scrollkeep::chunking
