#pragma once

#include <memory>
#include <optional>
#include <string>

#include "store/kv_backend.hpp"

namespace scrollkeep {

// Fallback tier: one JSON object on disk, rewritten atomically on every
// set/remove. A file that does not parse reads as empty; a failed write
// leaves both the file and the in-memory view unchanged.
class JsonFileStore : public KeyValueStore {
public:
    explicit JsonFileStore(std::string filePath);
    ~JsonFileStore() override;

    std::optional<nlohmann::json> get(const std::string &key) override;
    void set(const std::string &key, const nlohmann::json &value) override;
    void remove(const std::string &key) override;

    const std::string &path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace scrollkeep
