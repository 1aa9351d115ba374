#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace scrollkeep::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Call early in main(). Tracing writes debug lines and a -trace.log copy.
// SCROLLKEEP_LOG_LEVEL (debug, info, warn, error) raises the threshold of
// the main log; tracing always lets debug through.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();
LogLevel minimumLevel();

// Unrecognised names map to Info.
LogLevel parseLogLevel(const QString &name);

// An export run tags its lines with one id; the id is thread-local.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Context as written: strings over kMaxContextString characters are cut
// and arrays keep their first kMaxContextItems elements, so captured
// payloads never land in the log whole.
constexpr size_t kMaxContextString = 512;
constexpr size_t kMaxContextItems = 20;
nlohmann::json clampContext(const nlohmann::json &context);

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

// $SCROLLKEEP_LOG_DIR, else $HOME/.local/share/scrollkeep/logs.
QString logsDirPath();

} // namespace scrollkeep::logging

#define SKLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::scrollkeep::logging::logEvent(::scrollkeep::logging::LogLevel::Debug, \
                                    ::scrollkeep::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SKLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::scrollkeep::logging::logEvent(::scrollkeep::logging::LogLevel::Info, \
                                    ::scrollkeep::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SKLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::scrollkeep::logging::logEvent(::scrollkeep::logging::LogLevel::Warn, \
                                    ::scrollkeep::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SKLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::scrollkeep::logging::logEvent(::scrollkeep::logging::LogLevel::Error, \
                                    ::scrollkeep::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
