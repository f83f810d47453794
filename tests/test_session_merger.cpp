#include <QtTest/QtTest>

#include <QSignalSpy>
#include <QTemporaryDir>

#include <ctime>
#include <memory>

#include <sqlite3.h>

#include "common/json_utils.hpp"
#include "common/models.hpp"
#include "daemon/activity_store.hpp"
#include "daemon/rule_engine.hpp"
#include "daemon/session_merger.hpp"

namespace {

std::chrono::system_clock::time_point localTime(int year, int month, int day,
                                                int hour, int minute, int second)
{
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

hourglass::Heartbeat heartbeat(const std::string &app,
                               const std::string &title,
                               std::chrono::system_clock::time_point at)
{
    hourglass::Heartbeat beat;
    beat.appName = app;
    beat.bundleId = "bundle." + app;
    beat.windowTitle = title;
    beat.timestamp = at;
    return beat;
}

hourglass::MergerSettings settings()
{
    hourglass::MergerSettings merger;
    merger.intervalSeconds = 2;
    merger.idleThresholdSeconds = 600;
    merger.passiveBundleIds = {"org.videolan.vlc"};
    return merger;
}

} // namespace

class SessionMergerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    void testSameWindowExtendsOneRecord();
    void testWindowChangeOpensNewRecord();
    void testUrlChangeOpensNewRecord();
    void testIdleClosesSession();
    void testShortIdleKeepsSession();
    void testPassiveAppSurvivesIdle();
    void testPdfTitleSurvivesIdle();
    void testDayRollover();
    void testClockStepBackDoesNotCompleteDay();
    void testOpenSessionIsClassified();
    void testStoreFailureDoesNotThrow();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    int m_dbCounter = 0;
    std::string m_dbPath;
    std::unique_ptr<hourglass::ActivityStore> m_store;

    const std::string m_date = "2024-01-15";
};

void SessionMergerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void SessionMergerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void SessionMergerTests::init()
{
    m_dbPath = m_tempDir.path().toStdString() + "/merger-" + std::to_string(++m_dbCounter) + ".db";
    m_store = std::make_unique<hourglass::ActivityStore>(m_dbPath);
}

void SessionMergerTests::cleanup()
{
    m_store.reset();
}

void SessionMergerTests::testSameWindowExtendsOneRecord()
{
    hourglass::SessionMerger merger(*m_store, settings());
    const auto start = localTime(2024, 1, 15, 10, 0, 0);
    for (int i = 0; i < 15; ++i) {
        merger.merge(heartbeat("Terminal", "vim", start + std::chrono::seconds(2 * i)));
    }

    QVERIFY(merger.isTracking());
    QCOMPARE(merger.currentDurationSeconds(), 30);

    const auto timeline = m_store->queryTimeline(m_date);
    QCOMPARE(timeline.size(), std::size_t(1));
    QCOMPARE(timeline.front().durationSeconds, 30);
    QCOMPARE(timeline.front().id, *merger.currentRecordId());
}

void SessionMergerTests::testWindowChangeOpensNewRecord()
{
    hourglass::SessionMerger merger(*m_store, settings());
    const auto start = localTime(2024, 1, 15, 10, 0, 0);
    for (int i = 0; i < 5; ++i) {
        merger.merge(heartbeat("Terminal", "vim", start + std::chrono::seconds(2 * i)));
    }
    for (int i = 5; i < 8; ++i) {
        merger.merge(heartbeat("Firefox", "Docs", start + std::chrono::seconds(2 * i)));
    }

    const auto timeline = m_store->queryTimeline(m_date);
    QCOMPARE(timeline.size(), std::size_t(2));
    QCOMPARE(QString::fromStdString(timeline.at(0).appName), QStringLiteral("Terminal"));
    QCOMPARE(timeline.at(0).durationSeconds, 10);
    QCOMPARE(QString::fromStdString(timeline.at(1).appName), QStringLiteral("Firefox"));
    QCOMPARE(timeline.at(1).durationSeconds, 6);
}

void SessionMergerTests::testUrlChangeOpensNewRecord()
{
    hourglass::SessionMerger merger(*m_store, settings());
    const auto start = localTime(2024, 1, 15, 10, 0, 0);
    auto first = heartbeat("Firefox", "Docs", start);
    first.url = "https://acme.com/a";
    auto second = heartbeat("Firefox", "Docs", start + std::chrono::seconds(2));
    second.url = "https://acme.com/b";

    merger.merge(first);
    merger.merge(second);
    QCOMPARE(m_store->queryTimeline(m_date).size(), std::size_t(2));
}

void SessionMergerTests::testIdleClosesSession()
{
    hourglass::SessionMerger merger(*m_store, settings());
    const auto start = localTime(2024, 1, 15, 10, 0, 0);
    merger.merge(heartbeat("Terminal", "vim", start));
    merger.merge(heartbeat("Terminal", "vim", start + std::chrono::seconds(2)));

    auto idle = heartbeat("Terminal", "vim", start + std::chrono::seconds(4));
    idle.idle = true;
    idle.idleSeconds = 900;
    merger.merge(idle);
    QVERIFY(!merger.isTracking());

    merger.merge(heartbeat("Terminal", "vim", start + std::chrono::seconds(6)));

    const auto timeline = m_store->queryTimeline(m_date);
    QCOMPARE(timeline.size(), std::size_t(2));
    QCOMPARE(timeline.at(0).durationSeconds, 4);
    QCOMPARE(timeline.at(1).durationSeconds, 2);
}

void SessionMergerTests::testShortIdleKeepsSession()
{
    hourglass::SessionMerger merger(*m_store, settings());
    const auto start = localTime(2024, 1, 15, 10, 0, 0);
    merger.merge(heartbeat("Terminal", "vim", start));

    auto briefly = heartbeat("Terminal", "vim", start + std::chrono::seconds(2));
    briefly.idle = true;
    briefly.idleSeconds = 30;
    merger.merge(briefly);

    QVERIFY(merger.isTracking());
    QCOMPARE(merger.currentDurationSeconds(), 4);
}

void SessionMergerTests::testPassiveAppSurvivesIdle()
{
    hourglass::SessionMerger merger(*m_store, settings());
    const auto start = localTime(2024, 1, 15, 20, 0, 0);
    auto video = heartbeat("VLC", "movie.mkv", start);
    video.bundleId = "org.videolan.vlc";
    merger.merge(video);

    for (int i = 1; i <= 3; ++i) {
        auto still = video;
        still.timestamp = start + std::chrono::seconds(2 * i);
        still.idle = true;
        still.idleSeconds = 1200;
        merger.merge(still);
    }

    QVERIFY(merger.isTracking());
    QCOMPARE(merger.currentDurationSeconds(), 8);

    // An idle heartbeat with nothing open records nothing.
    merger.close();
    auto idle = heartbeat("Terminal", "vim", start + std::chrono::seconds(10));
    idle.idle = true;
    merger.merge(idle);
    QVERIFY(!merger.isTracking());
    QCOMPARE(m_store->queryTimeline(m_date).size(), std::size_t(1));
}

void SessionMergerTests::testPdfTitleSurvivesIdle()
{
    hourglass::SessionMerger merger(*m_store, settings());
    const auto start = localTime(2024, 1, 15, 14, 0, 0);
    merger.merge(heartbeat("Reader", "Annual Report.PDF", start));

    auto idle = heartbeat("Reader", "Annual Report.PDF", start + std::chrono::seconds(2));
    idle.idle = true;
    merger.merge(idle);

    QVERIFY(merger.isTracking());
    QCOMPARE(merger.currentDurationSeconds(), 4);
}

void SessionMergerTests::testDayRollover()
{
    hourglass::SessionMerger merger(*m_store, settings());
    QSignalSpy spy(&merger, &hourglass::SessionMerger::dayChanged);

    merger.merge(heartbeat("Terminal", "vim", localTime(2024, 1, 15, 23, 59, 56)));
    merger.merge(heartbeat("Terminal", "vim", localTime(2024, 1, 15, 23, 59, 58)));
    QCOMPARE(spy.count(), 0);

    merger.merge(heartbeat("Terminal", "vim", localTime(2024, 1, 16, 0, 0, 0)));
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.takeFirst().at(0).toString(), QStringLiteral("2024-01-15"));

    merger.merge(heartbeat("Terminal", "vim", localTime(2024, 1, 16, 0, 0, 2)));
    QCOMPARE(spy.count(), 0);

    const auto before = m_store->queryTimeline("2024-01-15");
    QCOMPARE(before.size(), std::size_t(1));
    QCOMPARE(before.front().durationSeconds, 4);
    const auto after = m_store->queryTimeline("2024-01-16");
    QCOMPARE(after.size(), std::size_t(1));
    QCOMPARE(after.front().durationSeconds, 4);
}

void SessionMergerTests::testClockStepBackDoesNotCompleteDay()
{
    hourglass::SessionMerger merger(*m_store, settings());
    QSignalSpy spy(&merger, &hourglass::SessionMerger::dayChanged);

    merger.merge(heartbeat("Terminal", "vim", localTime(2024, 1, 16, 0, 0, 10)));
    merger.merge(heartbeat("Terminal", "vim", localTime(2024, 1, 15, 23, 59, 50)));
    QCOMPARE(spy.count(), 0);
    merger.merge(heartbeat("Terminal", "vim", localTime(2024, 1, 15, 23, 59, 52)));
    QCOMPARE(spy.count(), 0);

    merger.merge(heartbeat("Terminal", "vim", localTime(2024, 1, 16, 0, 0, 12)));
    QCOMPARE(spy.count(), 0);

    merger.merge(heartbeat("Terminal", "vim", localTime(2024, 1, 17, 9, 0, 0)));
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.takeFirst().at(0).toString(), QStringLiteral("2024-01-16"));

    const auto stepped = m_store->queryTimeline("2024-01-15");
    QCOMPARE(stepped.size(), std::size_t(1));
    QCOMPARE(stepped.front().durationSeconds, 4);
    QCOMPARE(m_store->queryTimeline("2024-01-16").size(), std::size_t(2));
}

void SessionMergerTests::testOpenSessionIsClassified()
{
    const auto brand = m_store->insertBrand("Acme");
    const auto project = m_store->insertProject(brand, "Web");
    m_store->insertRule(project, hourglass::RuleType::UrlDomain, "acme.com", false);
    hourglass::RuleEngine engine(*m_store);

    hourglass::SessionMerger merger(*m_store, settings(), &engine);
    auto beat = heartbeat("Firefox", "Acme", localTime(2024, 1, 15, 9, 0, 0));
    beat.url = "https://app.acme.com/";
    merger.merge(beat);

    const auto record = m_store->getActivity(*merger.currentRecordId());
    QVERIFY(record.has_value());
    QCOMPARE(*record->projectId, project);
    QCOMPARE(*record->projectSource, hourglass::ProjectSource::Auto);
}

void SessionMergerTests::testStoreFailureDoesNotThrow()
{
    hourglass::SessionMerger merger(*m_store, settings());
    const auto start = localTime(2024, 1, 15, 10, 0, 0);
    merger.merge(heartbeat("Terminal", "vim", start));
    QVERIFY(merger.isTracking());

    sqlite3 *raw = nullptr;
    QCOMPARE(sqlite3_open(m_dbPath.c_str(), &raw), SQLITE_OK);
    QCOMPARE(sqlite3_exec(raw, "DROP TABLE activities;", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(raw);

    merger.merge(heartbeat("Terminal", "vim", start + std::chrono::seconds(2)));
    QCOMPARE(merger.currentDurationSeconds(), 4);
    merger.merge(heartbeat("Firefox", "Docs", start + std::chrono::seconds(4)));
    QVERIFY(!merger.isTracking());
    merger.close();
}

QTEST_MAIN(SessionMergerTests)
#include "test_session_merger.moc"
