#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include <QObject>
#include <QString>

#include "common/models.hpp"
#include "daemon/activity_store.hpp"

namespace hourglass {

class RuleEngine;

struct MergerSettings {
    int intervalSeconds = 2;
    int idleThresholdSeconds = 600;
    // Sessions of these apps survive idle heartbeats.
    std::set<std::string> passiveBundleIds;
};

/**
 * SessionMerger folds the heartbeat stream into activity sessions.
 *
 * Idle: no open session. Tracking: one open session whose identity is
 * (app name, window title, url, extra info). A heartbeat with the same
 * identity extends the session by one sampling interval; a different one
 * closes it and opens a new record. Idle heartbeats close the session
 * unless it belongs to a passive media app.
 *
 * Store failures are logged and never escape merge(), so one lost record
 * does not stop tracking.
 */
class SessionMerger : public QObject
{
    Q_OBJECT
public:
    SessionMerger(ActivityStore &store,
                  MergerSettings settings,
                  RuleEngine *ruleEngine = nullptr,
                  QObject *parent = nullptr);

    void merge(const Heartbeat &heartbeat);

    // Finalizes the open session, if any. Used on shutdown.
    void close();

    bool isTracking() const;
    std::optional<std::int64_t> currentRecordId() const;
    int currentDurationSeconds() const;

signals:
    // Emitted once when heartbeats move to a later local date. A clock that
    // steps back closes the open session without emitting.
    void dayChanged(const QString &completedDate);

private:
    struct OpenSession {
        std::int64_t recordId = 0;
        std::string appName;
        std::string bundleId;
        std::string windowTitle;
        std::optional<std::string> url;
        std::optional<std::string> extraInfo;
        std::string date;
        int durationSeconds = 0;
        // Last duration write failed; retried when the session closes.
        bool dirty = false;
    };

    bool isIdle(const Heartbeat &heartbeat) const;
    bool isPassive(const OpenSession &session) const;
    static bool sameIdentity(const OpenSession &session, const Heartbeat &heartbeat);

    void openSession(const Heartbeat &heartbeat, const std::string &date);
    void extendSession();
    void closeSession(const char *reason);

    ActivityStore &m_store;
    MergerSettings m_settings;
    RuleEngine *m_ruleEngine = nullptr;

    std::optional<OpenSession> m_session;
    // Latest local date seen.
    std::optional<std::string> m_lastDate;
};

} // namespace hourglass
