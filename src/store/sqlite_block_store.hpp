#pragma once

#include <filesystem>
#include <memory>

#include "store/kv_backend.hpp"

namespace scrollkeep {

// SqliteBlockStore keeps resume blocks in a single key/value table. The
// database is opened on first use so that an unusable path surfaces as a
// failed transaction, not a failed construction.
class SqliteBlockStore : public BlockStore {
public:
    explicit SqliteBlockStore(std::filesystem::path dbPath);
    ~SqliteBlockStore() override;

    std::unique_ptr<BlockTransaction> openTransaction(TransactionMode mode) override;

    const std::filesystem::path &path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace scrollkeep
