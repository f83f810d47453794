#include "daemon/hourglass_daemon.hpp"

#include <exception>
#include <optional>
#include <utility>

#include <QDebug>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/hourglass_version.hpp"
#include "common/logging.hpp"
#include "daemon/heartbeat_source.hpp"
#include "daemon/rule_engine.hpp"
#include "daemon/session_merger.hpp"

namespace hourglass {

namespace {

constexpr int kMaxConsecutiveErrors = 3;

} // namespace

HourglassDaemon::HourglassDaemon(HourglassConfig config,
                                 std::unique_ptr<HeartbeatSource> source,
                                 QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_store(std::make_unique<ActivityStore>(m_config.databasePath))
    , m_ruleEngine(std::make_unique<RuleEngine>(*m_store))
    , m_source(std::move(source))
{
    MergerSettings settings;
    settings.intervalSeconds = m_config.sampleIntervalSeconds;
    settings.idleThresholdSeconds = m_config.idleThresholdSeconds;
    settings.passiveBundleIds = m_config.passiveBundleIds;
    m_merger = std::make_unique<SessionMerger>(*m_store, settings, m_ruleEngine.get());
    connect(m_merger.get(), &SessionMerger::dayChanged, this, &HourglassDaemon::onDayChanged);

    if (!m_source && !m_config.sensorCommand.empty()) {
        m_source = std::make_unique<CommandHeartbeatSource>(m_config.sensorCommand,
                                                            m_config.sensorTimeoutMs);
    }

    std::string integrityMessage;
    if (!m_store->integrityCheck(&integrityMessage)) {
        qWarning() << "Hourglass: SQLite integrity check failed, database may be corrupt:"
                   << QString::fromStdString(integrityMessage);
        m_samplingEnabled = false;
    }
}

HourglassDaemon::~HourglassDaemon() = default;

ActivityStore &HourglassDaemon::store()
{
    return *m_store;
}

SessionMerger &HourglassDaemon::merger()
{
    return *m_merger;
}

bool HourglassDaemon::isRunning() const
{
    return m_running;
}

void HourglassDaemon::start()
{
    qInfo() << "Hourglass: daemon starting (version" << HOURGLASS_VERSION << ")";
    if (!m_source) {
        HGLOG_WARN("daemon",
                   "HourglassDaemon::start",
                   "no_sensor",
                   "sensorCommand is not configured",
                   "config",
                   ::hourglass::logging::defaultWho(),
                   "",
                   (nlohmann::json{{"config", configFilePath()}}));
    }

    m_timer = new QTimer(this);
    m_timer->setInterval(m_config.sampleIntervalSeconds * 1000);
    connect(m_timer, &QTimer::timeout, this, &HourglassDaemon::runSamplingTick);
    m_timer->start();
    m_running = true;

    HGLOG_INFO("daemon",
               "HourglassDaemon::start",
               "sampling_started",
               "daemon start",
               "QTimer",
               ::hourglass::logging::defaultWho(),
               "",
               (nlohmann::json{{"intervalSeconds", m_config.sampleIntervalSeconds},
                               {"idleThresholdSeconds", m_config.idleThresholdSeconds},
                               {"database", m_config.databasePath}}));
}

void HourglassDaemon::requestStop()
{
    m_stopRequested = true;
}

void HourglassDaemon::runSamplingTick()
{
    if (m_stopRequested) {
        finishStop();
        return;
    }
    if (!m_samplingEnabled || !m_source) {
        return;
    }

    try {
        const std::optional<Heartbeat> heartbeat = m_source->next();
        if (heartbeat) {
            m_merger->merge(*heartbeat);
        }
        m_consecutiveErrors = 0;
    } catch (const std::exception &ex) {
        ++m_consecutiveErrors;
        HGLOG_ERROR("daemon",
                    "HourglassDaemon::runSamplingTick",
                    "tick_failed",
                    "sample or merge threw",
                    "heartbeat source",
                    ::hourglass::logging::defaultWho(),
                    "",
                    (nlohmann::json{{"error", ex.what()},
                                    {"consecutiveErrors", m_consecutiveErrors}}));
        if (m_consecutiveErrors == kMaxConsecutiveErrors) {
            qWarning() << "Hourglass: repeated sampling failures, see daemon log";
        }
    }
}

void HourglassDaemon::finishStop()
{
    if (!m_running) {
        return;
    }
    if (m_timer) {
        m_timer->stop();
    }
    m_merger->close();
    m_running = false;

    HGLOG_INFO("daemon",
               "HourglassDaemon::finishStop",
               "sampling_stopped",
               "stop requested",
               "cooperative stop flag",
               ::hourglass::logging::defaultWho(),
               "",
               nlohmann::json::object());
    emit stopped();
}

void HourglassDaemon::onDayChanged(const QString &completedDate)
{
    ::hourglass::logging::CorrelationScope scope(QStringLiteral("day:") + completedDate);
    HGLOG_INFO("daemon",
               "HourglassDaemon::onDayChanged",
               "day_completed",
               "local date rolled over",
               "SessionMerger::dayChanged",
               ::hourglass::logging::defaultWho(),
               "",
               (nlohmann::json{{"date", completedDate.toStdString()}}));
    try {
        m_ruleEngine->autoAssignUnclassified(completedDate.toStdString());
    } catch (const std::exception &ex) {
        HGLOG_ERROR("daemon",
                    "HourglassDaemon::onDayChanged",
                    "auto_assign_failed",
                    "rule engine threw",
                    "RuleEngine::autoAssignUnclassified",
                    ::hourglass::logging::defaultWho(),
                    "",
                    (nlohmann::json{{"date", completedDate.toStdString()}, {"error", ex.what()}}));
    }
}

} // namespace hourglass
