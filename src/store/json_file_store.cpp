#include "store/json_file_store.hpp"

#include <stdexcept>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "common/logging.hpp"

namespace scrollkeep {

struct JsonFileStore::Impl {
    std::string filePath;
    QString path;
    nlohmann::json document;
    bool loaded = false;

    void load()
    {
        if (loaded) {
            return;
        }

        QFile file(path);
        if (!file.exists()) {
            document = nlohmann::json::object();
            loaded = true;
            return;
        }
        // A read failure stays unloaded so the next call retries.
        if (!file.open(QIODevice::ReadOnly)) {
            throw std::runtime_error("cannot read " + path.toStdString());
        }
        const QByteArray bytes = file.readAll();
        document = nlohmann::json::object();
        loaded = true;
        try {
            nlohmann::json parsed = nlohmann::json::parse(bytes.constData(),
                                                          bytes.constData() + bytes.size());
            if (parsed.is_object()) {
                document = std::move(parsed);
            }
        } catch (const nlohmann::json::parse_error &ex) {
            SKLOG_WARN("JsonFileStore",
                       "load",
                       "store_file_corrupt",
                       "parse_error",
                       "nlohmann::json::parse",
                       "",
                       "",
                       (nlohmann::json{{"path", path.toStdString()}, {"error", ex.what()}}));
        }
    }

    // The in-memory document only changes once the file is committed.
    void commit(nlohmann::json next)
    {
        QDir().mkpath(QFileInfo(path).absolutePath());
        QSaveFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            throw std::runtime_error("cannot write " + path.toStdString());
        }
        const std::string text = next.dump(-1, ' ', false,
                                           nlohmann::json::error_handler_t::replace);
        if (file.write(text.data(), static_cast<qint64>(text.size()))
                != static_cast<qint64>(text.size())
            || !file.commit()) {
            throw std::runtime_error("failed to commit " + path.toStdString());
        }
        document = std::move(next);
    }
};

JsonFileStore::JsonFileStore(std::string filePath)
    : impl(std::make_unique<Impl>())
{
    impl->path = QString::fromStdString(filePath);
    impl->filePath = std::move(filePath);
}

JsonFileStore::~JsonFileStore() = default;

std::optional<nlohmann::json> JsonFileStore::get(const std::string &key)
{
    impl->load();
    auto it = impl->document.find(key);
    if (it == impl->document.end()) {
        return std::nullopt;
    }
    return *it;
}

void JsonFileStore::set(const std::string &key, const nlohmann::json &value)
{
    impl->load();
    nlohmann::json next = impl->document;
    next[key] = value;
    impl->commit(std::move(next));
}

void JsonFileStore::remove(const std::string &key)
{
    impl->load();
    if (!impl->document.contains(key)) {
        return;
    }
    nlohmann::json next = impl->document;
    next.erase(key);
    impl->commit(std::move(next));
}

const std::string &JsonFileStore::path() const
{
    return impl->filePath;
}

} // namespace scrollkeep
