#pragma once

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace scrollkeep {

// Backends report failures by throwing std::runtime_error; ResumeStore turns
// those into tier fallthrough.

enum class TransactionMode {
    ReadOnly,
    ReadWrite
};

// Writes become visible on commit(). Destroying an uncommitted transaction
// rolls it back.
class BlockTransaction {
public:
    virtual ~BlockTransaction() = default;

    virtual std::optional<nlohmann::json> get(const std::string &key) = 0;
    virtual void put(const std::string &key, const nlohmann::json &value) = 0;
    virtual void remove(const std::string &key) = 0;
    virtual void clear() = 0;
    virtual void commit() = 0;
};

// Primary tier: a block store with atomic multi-key transactions.
class BlockStore {
public:
    virtual ~BlockStore() = default;

    virtual std::unique_ptr<BlockTransaction> openTransaction(TransactionMode mode) = 0;
};

// Fallback tier: plain single-key operations, no atomicity across keys.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<nlohmann::json> get(const std::string &key) = 0;
    virtual void set(const std::string &key, const nlohmann::json &value) = 0;
    virtual void remove(const std::string &key) = 0;
};

// The three operations the chunk codec needs, mapped onto each tier.
template<typename Store>
struct KeyValueTraits;

template<>
struct KeyValueTraits<BlockTransaction> {
    static std::optional<nlohmann::json> get(BlockTransaction &tx, const std::string &key)
    {
        return tx.get(key);
    }
    static void write(BlockTransaction &tx, const std::string &key, const nlohmann::json &value)
    {
        tx.put(key, value);
    }
    static void remove(BlockTransaction &tx, const std::string &key)
    {
        tx.remove(key);
    }
};

template<>
struct KeyValueTraits<KeyValueStore> {
    static std::optional<nlohmann::json> get(KeyValueStore &store, const std::string &key)
    {
        return store.get(key);
    }
    static void write(KeyValueStore &store, const std::string &key, const nlohmann::json &value)
    {
        store.set(key, value);
    }
    static void remove(KeyValueStore &store, const std::string &key)
    {
        store.remove(key);
    }
};

} // namespace scrollkeep
