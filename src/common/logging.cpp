#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <array>
#include <atomic>
#include <cstdio>
#include <mutex>

namespace scrollkeep::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
constexpr int kRotatedGenerations = 3;

struct LogState {
    std::mutex mutex;
    QString processName;
    bool traceEnabled = false;
    LogLevel minimum = LogLevel::Info;
};

LogState &state()
{
    static LogState s;
    return s;
}

std::atomic<quint64> g_sequence{0};
thread_local QString t_corrId;

constexpr std::array<const char *, 4> kLevelNames = {"DEBUG", "INFO", "WARN", "ERROR"};

const char *levelName(LogLevel level)
{
    return kLevelNames[static_cast<size_t>(level)];
}

// foo.log -> foo.log.1 -> foo.log.2 ..., oldest dropped.
void rotate(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }
    QFile::remove(path + QStringLiteral(".%1").arg(kRotatedGenerations));
    for (int gen = kRotatedGenerations - 1; gen >= 1; --gen) {
        QFile::rename(path + QStringLiteral(".%1").arg(gen),
                      path + QStringLiteral(".%1").arg(gen + 1));
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

void appendLine(const QString &path, const QByteArray &line)
{
    rotate(path);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

nlohmann::json clampValue(const nlohmann::json &value, int depth)
{
    if (value.is_string()) {
        const auto &text = value.get_ref<const std::string &>();
        if (text.size() <= kMaxContextString) {
            return value;
        }
        return text.substr(0, kMaxContextString) + "...(" + std::to_string(text.size()) + " chars)";
    }
    if (depth >= 4 && (value.is_object() || value.is_array())) {
        return "<nested>";
    }
    if (value.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (size_t i = 0; i < value.size() && i < kMaxContextItems; ++i) {
            out.push_back(clampValue(value[i], depth + 1));
        }
        if (value.size() > kMaxContextItems) {
            out.push_back("...(" + std::to_string(value.size()) + " items)");
        }
        return out;
    }
    if (value.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = clampValue(it.value(), depth + 1);
        }
        return out;
    }
    return value;
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    const QString levelEnv = qEnvironmentVariable("SCROLLKEEP_LOG_LEVEL");
    LogState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.processName = processName;
    s.traceEnabled = traceEnabled;
    s.minimum = levelEnv.isEmpty() ? LogLevel::Info : parseLogLevel(levelEnv);
}

bool isTraceEnabled()
{
    LogState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.traceEnabled;
}

LogLevel minimumLevel()
{
    LogState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.traceEnabled ? LogLevel::Debug : s.minimum;
}

LogLevel parseLogLevel(const QString &name)
{
    const QString lowered = name.trimmed().toLower();
    if (lowered == QStringLiteral("debug")) {
        return LogLevel::Debug;
    }
    if (lowered == QStringLiteral("warn") || lowered == QStringLiteral("warning")) {
        return LogLevel::Warn;
    }
    if (lowered == QStringLiteral("error")) {
        return LogLevel::Error;
    }
    return LogLevel::Info;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

nlohmann::json clampContext(const nlohmann::json &context)
{
    return clampValue(context, 0);
}

QString logsDirPath()
{
    const QString overrideDir = qEnvironmentVariable("SCROLLKEEP_LOG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    const QString suffix = QStringLiteral(".local/share/scrollkeep/logs");
    return home.isEmpty() ? suffix : home + QLatin1Char('/') + suffix;
}

QString defaultProcessName()
{
    {
        LogState &s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (!s.processName.isEmpty()) {
            return s.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("scrollkeep");
}

QString defaultWho()
{
    return QStringLiteral("uid:%1,pid:%2")
        .arg(static_cast<int>(getuid()))
        .arg(static_cast<qint64>(getpid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const LogLevel threshold = minimumLevel();
    const bool trace = isTraceEnabled();
    if (level < threshold && !trace) {
        return;
    }

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"seq", ++g_sequence},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"thread", QStringLiteral("0x%1")
                       .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16)
                       .toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? currentCorrelationId() : correlationId).toStdString()},
        {"context", clampContext(context)}
    };

    // Tweet text may carry invalid UTF-8; replace rather than throw.
    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const QString dir = logsDirPath();
    const QString base = dir + QDir::separator() + process;

    LogState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    QDir().mkpath(dir);
    if (level >= threshold) {
        appendLine(base + QStringLiteral(".log"), line);
    }
    if (trace) {
        appendLine(base + QStringLiteral("-trace.log"), line);
    }
}

} // namespace scrollkeep::logging
