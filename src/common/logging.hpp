#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace skyshield::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// Reads SKYSHIELD_LOG_LEVEL (debug, info, warn, error; ignored when tracing)
// and SKYSHIELD_LOG_MAX_BYTES (rotation size, default 5 MiB, three
// generations kept).
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support for linking the log lines of one cycle.
void setCorrelationId(const QString &corrId);
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
QString logsDirPath();

} // namespace skyshield::logging

#define SLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::skyshield::logging::logEvent(::skyshield::logging::LogLevel::Debug, \
                                   ::skyshield::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::skyshield::logging::logEvent(::skyshield::logging::LogLevel::Info, \
                                   ::skyshield::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::skyshield::logging::logEvent(::skyshield::logging::LogLevel::Warn, \
                                   ::skyshield::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::skyshield::logging::logEvent(::skyshield::logging::LogLevel::Error, \
                                   ::skyshield::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
