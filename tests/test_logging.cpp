#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugSuppressedWithoutTrace();
    void testTraceWrites();
    void testCorrelationScope();
    void testLevelThreshold();
    void testRotationKeepsGenerations();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const;
    QByteArray lastLine(const QString &path) const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("SKYSHIELD_LOG_DIR");
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.path() + "/.local/share/skyshield/logs/skyshield-test" + suffix;
}

QByteArray LoggingTests::lastLine(const QString &path) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    QByteArray last;
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            last = line;
        }
    }
    return last;
}

void LoggingTests::testLogEventWrites()
{
    skyshield::logging::initLogging(QStringLiteral("skyshield-test"), false);

    skyshield::logging::logEvent(skyshield::logging::LogLevel::Info,
                                 QStringLiteral("skyshield-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testLogEventWrites"),
                                 QStringLiteral("test_log"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 skyshield::logging::defaultWho(),
                                 QStringLiteral("corr-1"),
                                 nlohmann::json{{"key", "value"}});

    const QByteArray line = lastLine(logPath(QStringLiteral(".log")));
    QVERIFY(!line.isEmpty());

    const auto parsed = nlohmann::json::parse(line.toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed["context"].value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testDebugSuppressedWithoutTrace()
{
    skyshield::logging::initLogging(QStringLiteral("skyshield-test"), false);
    QVERIFY(!skyshield::logging::isTraceEnabled());

    SLOG_DEBUG(QStringLiteral("Test"),
               QStringLiteral("testDebugSuppressedWithoutTrace"),
               QStringLiteral("debug_hidden"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               skyshield::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    const QByteArray line = lastLine(logPath(QStringLiteral(".log")));
    QVERIFY(!line.contains("debug_hidden"));
    QVERIFY(!QFile::exists(logPath(QStringLiteral("-trace.log"))));
}

void LoggingTests::testTraceWrites()
{
    skyshield::logging::initLogging(QStringLiteral("skyshield-test"), true);

    SLOG_DEBUG(QStringLiteral("Test"),
               QStringLiteral("testTraceWrites"),
               QStringLiteral("debug_visible"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               skyshield::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    QVERIFY(lastLine(logPath(QStringLiteral("-trace.log"))).contains("debug_visible"));
    QVERIFY(lastLine(logPath(QStringLiteral(".log"))).contains("debug_visible"));
}

void LoggingTests::testCorrelationScope()
{
    skyshield::logging::initLogging(QStringLiteral("skyshield-test"), false);
    skyshield::logging::setCorrelationId(QString());

    {
        skyshield::logging::CorrelationScope scope(QStringLiteral("cycle-42"));
        QCOMPARE(skyshield::logging::currentCorrelationId(), QStringLiteral("cycle-42"));

        SLOG_INFO(QStringLiteral("Test"),
                  QStringLiteral("testCorrelationScope"),
                  QStringLiteral("scoped_line"),
                  QStringLiteral("unit_test"),
                  QStringLiteral("macro"),
                  skyshield::logging::defaultWho(),
                  QString(),
                  nlohmann::json::object());
    }

    QVERIFY(skyshield::logging::currentCorrelationId().isEmpty());
    const auto parsed = nlohmann::json::parse(
        lastLine(logPath(QStringLiteral(".log"))).toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("cycle-42"));
}

void LoggingTests::testLevelThreshold()
{
    qputenv("SKYSHIELD_LOG_LEVEL", "warn");
    skyshield::logging::initLogging(QStringLiteral("skyshield-test"), false);

    SLOG_INFO(QStringLiteral("Test"),
              QStringLiteral("testLevelThreshold"),
              QStringLiteral("info_below_threshold"),
              QStringLiteral("unit_test"),
              QStringLiteral("macro"),
              skyshield::logging::defaultWho(),
              QString(),
              nlohmann::json::object());
    QVERIFY(!lastLine(logPath(QStringLiteral(".log"))).contains("info_below_threshold"));

    SLOG_WARN(QStringLiteral("Test"),
              QStringLiteral("testLevelThreshold"),
              QStringLiteral("warn_at_threshold"),
              QStringLiteral("unit_test"),
              QStringLiteral("macro"),
              skyshield::logging::defaultWho(),
              QString(),
              nlohmann::json::object());
    QVERIFY(lastLine(logPath(QStringLiteral(".log"))).contains("warn_at_threshold"));

    qunsetenv("SKYSHIELD_LOG_LEVEL");
    skyshield::logging::initLogging(QStringLiteral("skyshield-test"), false);
}

void LoggingTests::testRotationKeepsGenerations()
{
    qputenv("SKYSHIELD_LOG_MAX_BYTES", "200");
    skyshield::logging::initLogging(QStringLiteral("skyshield-rotate"), false);

    const QString base = m_tempDir.path() + "/.local/share/skyshield/logs/skyshield-rotate.log";
    for (int i = 0; i < 10; ++i) {
        skyshield::logging::logEvent(skyshield::logging::LogLevel::Info,
                                     QStringLiteral("skyshield-rotate"),
                                     QStringLiteral("Test"),
                                     QStringLiteral("testRotationKeepsGenerations"),
                                     QStringLiteral("rotation_line_%1").arg(i),
                                     QStringLiteral("unit_test"),
                                     QStringLiteral("direct_call"),
                                     skyshield::logging::defaultWho(),
                                     QString(),
                                     nlohmann::json::object());
    }

    // Every line exceeds the limit, so each write rotates the previous one.
    QVERIFY(lastLine(base).contains("rotation_line_9"));
    QVERIFY(lastLine(base + ".1").contains("rotation_line_8"));
    QVERIFY(lastLine(base + ".3").contains("rotation_line_6"));
    QVERIFY(!QFile::exists(base + ".4"));

    qunsetenv("SKYSHIELD_LOG_MAX_BYTES");
    skyshield::logging::initLogging(QStringLiteral("skyshield-test"), false);
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
