#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <map>
#include <memory>
#include <mutex>

namespace tfscope::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
constexpr int kKeptRotations = 3;

// Append handles stay open between events; the poll loop logs per cycle and
// reopening the file every line shows up in traces.
class LogFiles {
public:
    void write(const QString &path, const QByteArray &line)
    {
        QFile *file = handleFor(path);
        if (!file) {
            std::fprintf(stderr, "%s\n", line.constData());
            return;
        }
        file->write(line);
        file->write("\n", 1);
        file->flush();
    }

    void closeAll() { m_files.clear(); }

private:
    QFile *handleFor(const QString &path)
    {
        auto it = m_files.find(path);
        // Dropped when the file was rotated or removed underneath us.
        if (it != m_files.end() && !QFileInfo::exists(path)) {
            m_files.erase(it);
            it = m_files.end();
        }
        if (it != m_files.end() && it->second->size() >= kMaxLogSizeBytes) {
            m_files.erase(it);
            rotate(path);
            it = m_files.end();
        }
        if (it != m_files.end()) {
            return it->second.get();
        }

        QDir().mkpath(QFileInfo(path).absolutePath());
        if (QFileInfo(path).size() >= kMaxLogSizeBytes) {
            rotate(path);
        }
        auto file = std::make_unique<QFile>(path);
        if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            return nullptr;
        }
        return m_files.emplace(path, std::move(file)).first->second.get();
    }

    static void rotate(const QString &path)
    {
        QFile::remove(path + QStringLiteral(".%1").arg(kKeptRotations));
        for (int generation = kKeptRotations - 1; generation >= 1; --generation) {
            QFile::rename(path + QStringLiteral(".%1").arg(generation),
                          path + QStringLiteral(".%1").arg(generation + 1));
        }
        QFile::rename(path, path + QStringLiteral(".1"));
    }

    std::map<QString, std::unique_ptr<QFile>> m_files;
};

struct LogState {
    std::mutex mutex;
    QString processName;
    bool traceEnabled = false;
    LogFiles files;
};

LogState &state()
{
    static LogState instance;
    return instance;
}

thread_local QString t_corrId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString logFilePath(const QString &processName, const QString &suffix)
{
    const QString base = processName.isEmpty() ? QStringLiteral("tfscope") : processName;
    return logsDirPath() + QDir::separator() + base + suffix;
}

// Named threads ("tfscope-poll", pool workers) are easier to follow than ids.
std::string threadLabel()
{
    QThread *thread = QThread::currentThread();
    if (thread && !thread->objectName().isEmpty()) {
        return thread->objectName().toStdString();
    }
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16)
        .toStdString();
}

} // namespace

QString logsDirPath()
{
    const QString overrideDir = qEnvironmentVariable("TFSCOPE_LOG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/tfscope/logs");
    }
    return home + QStringLiteral("/.local/share/tfscope/logs");
}

void initLogging(const QString &processName, bool traceEnabled)
{
    LogState &log = state();
    std::lock_guard<std::mutex> lock(log.mutex);
    log.processName = processName;
    log.traceEnabled = traceEnabled;
    log.files.closeAll();
}

void shutdownLogging()
{
    LogState &log = state();
    std::lock_guard<std::mutex> lock(log.mutex);
    log.files.closeAll();
}

bool isTraceEnabled()
{
    LogState &log = state();
    std::lock_guard<std::mutex> lock(log.mutex);
    return log.traceEnabled;
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

QString defaultProcessName()
{
    {
        LogState &log = state();
        std::lock_guard<std::mutex> lock(log.mutex);
        if (!log.processName.isEmpty()) {
            return log.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("tfscope");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,pid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getpid()));
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
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;

    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"thread", threadLabel()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    // Payload strings may carry raw tag bytes from a record file.
    const std::string dumped = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    const QByteArray line(dumped.data(), static_cast<qsizetype>(dumped.size()));

    LogState &log = state();
    std::lock_guard<std::mutex> lock(log.mutex);
    if (level != LogLevel::Debug || log.traceEnabled) {
        log.files.write(logFilePath(process, QStringLiteral(".log")), line);
    }
    if (log.traceEnabled) {
        log.files.write(logFilePath(process, QStringLiteral("-trace.log")), line);
    }
}

} // namespace tfscope::logging
