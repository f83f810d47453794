#pragma once

#include <atomic>
#include <memory>

#include <QObject>
#include <QString>

#include "common/config.hpp"
#include "daemon/activity_store.hpp"

class QTimer;

namespace hourglass {

class HeartbeatSource;
class RuleEngine;
class SessionMerger;

/**
 * HourglassDaemon drives the sampling loop:
 * - asks the heartbeat source for one sample per tick
 * - feeds it to the session merger
 * - runs auto-assignment for a day once it is complete
 *
 * It is owned from main() and driven by Qt's event loop. A stop request
 * is honored at the next tick.
 */
class HourglassDaemon : public QObject
{
    Q_OBJECT
public:
    explicit HourglassDaemon(HourglassConfig config,
                             std::unique_ptr<HeartbeatSource> source = nullptr,
                             QObject *parent = nullptr);
    ~HourglassDaemon() override;

    void start();
    void requestStop();
    bool isRunning() const;

    ActivityStore &store();
    SessionMerger &merger();

signals:
    void stopped();

public slots:
    void runSamplingTick();

private slots:
    void onDayChanged(const QString &completedDate);

private:
    void finishStop();

    HourglassConfig m_config;
    std::unique_ptr<ActivityStore> m_store;
    std::unique_ptr<RuleEngine> m_ruleEngine;
    std::unique_ptr<SessionMerger> m_merger;
    std::unique_ptr<HeartbeatSource> m_source;
    QTimer *m_timer = nullptr;

    bool m_samplingEnabled = true;
    bool m_running = false;
    std::atomic<bool> m_stopRequested{false};
    int m_consecutiveErrors = 0;
};

} // namespace hourglass
