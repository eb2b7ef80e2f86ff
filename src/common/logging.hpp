#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace tfscope::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Events go to <logsDirPath()>/<process>.log; with tracing on, debug events
// are kept as well and everything is mirrored to <process>-trace.log.
// Calling it again switches process name or trace mode and reopens the files.
void initLogging(const QString &processName, bool traceEnabled);
// Closes the cached append handles.
void shutdownLogging();

bool isTraceEnabled();

// Thread-local correlation support for linking the lines of one poll cycle.
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
// $TFSCOPE_LOG_DIR, else $HOME/.local/share/tfscope/logs.
QString logsDirPath();

} // namespace tfscope::logging

#define TFS_LOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::tfscope::logging::logEvent(::tfscope::logging::LogLevel::Debug, \
                                 ::tfscope::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TFS_LOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::tfscope::logging::logEvent(::tfscope::logging::LogLevel::Info, \
                                 ::tfscope::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TFS_LOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::tfscope::logging::logEvent(::tfscope::logging::LogLevel::Warn, \
                                 ::tfscope::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TFS_LOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::tfscope::logging::logEvent(::tfscope::logging::LogLevel::Error, \
                                 ::tfscope::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
