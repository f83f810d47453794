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
    void testTraceRequested();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("HOURGLASS_LOG_DIR");
    qunsetenv("HOURGLASS_TRACE");
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
    return m_tempDir.path() + "/.local/share/hourglass/logs/hourglass-test" + suffix;
}

void LoggingTests::testLogEventWrites()
{
    hourglass::logging::initLogging(QStringLiteral("hourglass-test"), false);

    hourglass::logging::logEvent(hourglass::logging::LogLevel::Info,
                                 QStringLiteral("hourglass-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testLogEventWrites"),
                                 QStringLiteral("test_log"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 hourglass::logging::defaultWho(),
                                 QStringLiteral("corr-1"),
                                 nlohmann::json{{"key", "value"}});

    QFile file(logPath(".log"));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());

    const auto parsed = nlohmann::json::parse(line.toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed["context"].value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testDebugSuppressedWithoutTrace()
{
    hourglass::logging::initLogging(QStringLiteral("hourglass-test"), false);
    QFile::remove(logPath(".log"));

    hourglass::logging::logEvent(hourglass::logging::LogLevel::Debug,
                                 QStringLiteral("hourglass-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testDebugSuppressedWithoutTrace"),
                                 QStringLiteral("debug_line"),
                                 QString(),
                                 QString(),
                                 hourglass::logging::defaultWho(),
                                 QString(),
                                 nlohmann::json::object());

    QVERIFY(!QFile::exists(logPath(".log")));
}

void LoggingTests::testTraceWrites()
{
    hourglass::logging::initLogging(QStringLiteral("hourglass-test"), true);

    hourglass::logging::logEvent(hourglass::logging::LogLevel::Debug,
                                 QStringLiteral("hourglass-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testTraceWrites"),
                                 QStringLiteral("test_trace"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 hourglass::logging::defaultWho(),
                                 QStringLiteral("corr-2"),
                                 nlohmann::json::object());

    QFile file(logPath("-trace.log"));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());
    QVERIFY(QFile::exists(logPath(".log")));

    hourglass::logging::initLogging(QStringLiteral("hourglass-test"), false);
}

void LoggingTests::testCorrelationScope()
{
    hourglass::logging::initLogging(QStringLiteral("hourglass-test"), false);
    QFile::remove(logPath(".log"));

    QVERIFY(hourglass::logging::currentCorrelationId().isEmpty());
    {
        hourglass::logging::CorrelationScope outer(QStringLiteral("day:2024-01-15"));
        {
            hourglass::logging::CorrelationScope inner(QStringLiteral("tick:7"));
            QCOMPARE(hourglass::logging::currentCorrelationId(), QStringLiteral("tick:7"));
        }
        QCOMPARE(hourglass::logging::currentCorrelationId(), QStringLiteral("day:2024-01-15"));

        hourglass::logging::logEvent(hourglass::logging::LogLevel::Info,
                                     QStringLiteral("hourglass-test"),
                                     QStringLiteral("Test"),
                                     QStringLiteral("testCorrelationScope"),
                                     QStringLiteral("scoped_line"),
                                     QString(),
                                     QString(),
                                     hourglass::logging::defaultWho(),
                                     QString(),
                                     nlohmann::json::object());
    }
    QVERIFY(hourglass::logging::currentCorrelationId().isEmpty());

    QFile file(logPath(".log"));
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto parsed = nlohmann::json::parse(file.readLine().toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("day:2024-01-15"));
}

void LoggingTests::testTraceRequested()
{
    QByteArray program("hourglass-daemon");
    QByteArray flag("--trace");
    char *withFlag[] = {program.data(), flag.data()};
    char *withoutFlag[] = {program.data()};

    QVERIFY(hourglass::logging::traceRequested(2, withFlag));
    QVERIFY(!hourglass::logging::traceRequested(1, withoutFlag));

    qputenv("HOURGLASS_TRACE", "1");
    QVERIFY(hourglass::logging::traceRequested(1, withoutFlag));
    qunsetenv("HOURGLASS_TRACE");
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
