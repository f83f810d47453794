#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace hourglass::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// Trace mode also admits DEBUG lines and mirrors every line to
// <process>-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

// True when --trace is in argv or HOURGLASS_TRACE=1.
bool traceRequested(int argc, char *argv[]);

// Thread-local correlation id. Events logged with an empty correlation id
// inside a scope carry the scope's id.
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

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

} // namespace hourglass::logging

#define HGLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::hourglass::logging::logEvent(::hourglass::logging::LogLevel::Debug, \
                                   ::hourglass::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HGLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::hourglass::logging::logEvent(::hourglass::logging::LogLevel::Info, \
                                   ::hourglass::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HGLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::hourglass::logging::logEvent(::hourglass::logging::LogLevel::Warn, \
                                   ::hourglass::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HGLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::hourglass::logging::logEvent(::hourglass::logging::LogLevel::Error, \
                                   ::hourglass::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
