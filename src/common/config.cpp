#include "common/config.hpp"

#include <QDir>
#include <QFile>
#include <QString>

#include "common/logging.hpp"

namespace scrollkeep {

namespace {

template <typename T>
void readInteger(const nlohmann::json &json, const char *key, T &target)
{
    auto it = json.find(key);
    if (it == json.end() || !it->is_number_integer()) {
        return;
    }
    const auto value = it->get<int64_t>();
    if (value > 0) {
        target = static_cast<T>(value);
    }
}

void readEnvInteger(const char *name, int64_t &target)
{
    bool ok = false;
    const qlonglong value = qEnvironmentVariable(name).toLongLong(&ok);
    if (ok && value > 0) {
        target = value;
    }
}

} // namespace

std::string defaultDataDir()
{
    const QString overrideDir = qEnvironmentVariable("SCROLLKEEP_DATA_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir.toStdString();
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return ".local/share/scrollkeep";
    }
    return (home + QStringLiteral("/.local/share/scrollkeep")).toStdString();
}

void applyConfigJson(ExportConfig &config, const nlohmann::json &json)
{
    if (!json.is_object()) {
        return;
    }
    readInteger(json, "maxScrolls", config.maxScrolls);
    readInteger(json, "idleThresholdMs", config.idleThresholdMs);
    readInteger(json, "minStepDelayMs", config.minStepDelayMs);
    readInteger(json, "pollIntervalMs", config.pollIntervalMs);
    readInteger(json, "errorRecoveryWaitMs", config.errorRecoveryWaitMs);
    readInteger(json, "maxNoChangeSteps", config.maxNoChangeSteps);
    readInteger(json, "resumeMaxAgeMs", config.resumeMaxAgeMs);
    readInteger(json, "chunkSize", config.chunkSize);
}

ExportConfig loadExportConfig()
{
    ExportConfig config;
    config.dataDir = defaultDataDir();

    const QString path = QString::fromStdString(config.dataDir)
        + QDir::separator() + QStringLiteral("config.json");
    QFile file(path);
    if (file.exists() && file.open(QIODevice::ReadOnly)) {
        try {
            applyConfigJson(config, nlohmann::json::parse(file.readAll().toStdString()));
        } catch (const nlohmann::json::parse_error &ex) {
            SKLOG_WARN(QStringLiteral("Config"),
                       QStringLiteral("loadExportConfig"),
                       QStringLiteral("config_parse_failed"),
                       QStringLiteral("invalid_json"),
                       QStringLiteral("keep_defaults"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"path", path.toStdString()},
                                       {"error", ex.what()}}));
        }
    }

    int64_t maxScrolls = config.maxScrolls;
    readEnvInteger("SCROLLKEEP_MAX_SCROLLS", maxScrolls);
    config.maxScrolls = static_cast<int>(maxScrolls);
    readEnvInteger("SCROLLKEEP_RESUME_MAX_AGE_MS", config.resumeMaxAgeMs);

    return config;
}

nlohmann::json configToJson(const ExportConfig &config)
{
    return nlohmann::json{
        {"maxScrolls", config.maxScrolls},
        {"idleThresholdMs", config.idleThresholdMs},
        {"minStepDelayMs", config.minStepDelayMs},
        {"pollIntervalMs", config.pollIntervalMs},
        {"errorRecoveryWaitMs", config.errorRecoveryWaitMs},
        {"maxNoChangeSteps", config.maxNoChangeSteps},
        {"resumeMaxAgeMs", config.resumeMaxAgeMs},
        {"chunkSize", config.chunkSize},
        {"dataDir", config.dataDir}
    };
}

} // namespace scrollkeep
