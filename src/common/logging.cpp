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
#include <utility>

namespace skyshield::logging {

namespace {

constexpr qint64 kDefaultMaxLogBytes = 5 * 1024 * 1024;
constexpr int kRotatedGenerations = 3;

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

LogLevel levelFromEnvironment()
{
    const QString value = qEnvironmentVariable("SKYSHIELD_LOG_LEVEL").trimmed().toLower();
    if (value == QLatin1String("warn")) {
        return LogLevel::Warn;
    }
    if (value == QLatin1String("error")) {
        return LogLevel::Error;
    }
    if (value == QLatin1String("debug")) {
        return LogLevel::Debug;
    }
    return LogLevel::Info;
}

qint64 maxBytesFromEnvironment()
{
    bool ok = false;
    const qint64 value = qEnvironmentVariable("SKYSHIELD_LOG_MAX_BYTES").toLongLong(&ok);
    return ok && value > 0 ? value : kDefaultMaxLogBytes;
}

// Append-only JSON-lines file. The handle stays open between events and is
// reopened after rotation; <file>.1 is the newest rotated generation.
class LogSink
{
public:
    LogSink(QString path, qint64 maxBytes)
        : m_path(std::move(path))
        , m_maxBytes(maxBytes)
    {
    }

    bool append(const QByteArray &line)
    {
        if (m_file.isOpen() && m_file.size() >= m_maxBytes) {
            rotate();
        }
        if (!m_file.isOpen() && !open()) {
            return false;
        }
        m_file.write(line);
        m_file.write("\n");
        m_file.flush();
        return true;
    }

private:
    bool open()
    {
        QDir().mkpath(QFileInfo(m_path).absolutePath());
        m_file.setFileName(m_path);
        if (!m_file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            return false;
        }
        if (m_file.size() >= m_maxBytes) {
            rotate();
            return open();
        }
        return true;
    }

    void rotate()
    {
        m_file.close();
        QFile::remove(generation(kRotatedGenerations));
        for (int i = kRotatedGenerations - 1; i >= 1; --i) {
            QFile::rename(generation(i), generation(i + 1));
        }
        QFile::rename(m_path, generation(1));
    }

    QString generation(int index) const
    {
        return m_path + QLatin1Char('.') + QString::number(index);
    }

    QString m_path;
    qint64 m_maxBytes;
    QFile m_file;
};

struct LoggerState {
    std::mutex mutex;
    QString processName;
    bool traceEnabled = false;
    LogLevel threshold = LogLevel::Info;
    qint64 maxBytes = kDefaultMaxLogBytes;
    std::map<QString, std::unique_ptr<LogSink>> sinks;

    // Callers hold the mutex.
    void write(const QString &path, const QByteArray &line)
    {
        auto it = sinks.find(path);
        if (it == sinks.end()) {
            it = sinks.emplace(path, std::make_unique<LogSink>(path, maxBytes)).first;
        }
        if (!it->second->append(line)) {
            std::fprintf(stderr, "%s\n", line.constData());
        }
    }
};

LoggerState &state()
{
    static LoggerState instance;
    return instance;
}

QString logFilePath(const QString &processName, const char *suffix)
{
    const QString base = processName.isEmpty() ? QStringLiteral("skyshield") : processName;
    return logsDirPath() + QDir::separator() + base + QLatin1String(suffix);
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

QString hostName()
{
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return QString();
    }
    return QString::fromUtf8(buffer);
}

} // namespace

QString logsDirPath()
{
    const QString overrideDir = qEnvironmentVariable("SKYSHIELD_LOG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/skyshield/logs");
    }
    return home + QStringLiteral("/.local/share/skyshield/logs");
}

void initLogging(const QString &processName, bool traceEnabled)
{
    LoggerState &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    logger.processName = processName;
    logger.traceEnabled = traceEnabled;
    logger.threshold = traceEnabled ? LogLevel::Debug : levelFromEnvironment();
    logger.maxBytes = maxBytesFromEnvironment();
    logger.sinks.clear();
}

bool isTraceEnabled()
{
    LoggerState &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    return logger.traceEnabled;
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
        LoggerState &logger = state();
        std::lock_guard<std::mutex> lock(logger.mutex);
        if (!logger.processName.isEmpty()) {
            return logger.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("skyshield");
}

QString defaultWho()
{
    static const QString who = QStringLiteral("host:%1,pid:%2")
                                   .arg(hostName())
                                   .arg(static_cast<qint64>(getpid()));
    return who;
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

    nlohmann::json payload;
    payload["ts"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString();
    payload["level"] = levelName(level);
    payload["process"] = process.toStdString();
    payload["thread"] = threadIdString().toStdString();
    payload["component"] = component.toStdString();
    payload["where"] = where.toStdString();
    payload["what"] = what.toStdString();
    payload["why"] = why.toStdString();
    payload["how"] = how.toStdString();
    payload["who"] = who.toStdString();
    payload["corr"] = (correlationId.isEmpty() ? t_corrId : correlationId).toStdString();
    payload["context"] = context;
    const QByteArray line = QByteArray::fromStdString(payload.dump());

    LoggerState &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    if (static_cast<int>(level) >= static_cast<int>(logger.threshold)) {
        logger.write(logFilePath(process, ".log"), line);
    }
    // The trace file sees every event, whatever the threshold.
    if (logger.traceEnabled) {
        logger.write(logFilePath(process, "-trace.log"), line);
    }
}

} // namespace skyshield::logging
