#include "daemon/session_merger.hpp"

#include <exception>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/string_utils.hpp"
#include "daemon/rule_engine.hpp"

namespace hourglass {

namespace {

bool looksLikePdf(const std::string &title)
{
    const std::string lowered = toLower(title);
    return endsWith(lowered, ".pdf")
        || lowered.find(".pdf ") != std::string::npos;
}

void logStoreFailure(const char *where, const char *what, const std::exception &ex,
                     nlohmann::json context)
{
    context["error"] = ex.what();
    HGLOG_ERROR("merger",
                where,
                what,
                "store write failed",
                "sqlite3",
                ::hourglass::logging::defaultWho(),
                "",
                context);
}

} // namespace

SessionMerger::SessionMerger(ActivityStore &store,
                             MergerSettings settings,
                             RuleEngine *ruleEngine,
                             QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_settings(std::move(settings))
    , m_ruleEngine(ruleEngine)
{
}

bool SessionMerger::isTracking() const
{
    return m_session.has_value();
}

std::optional<std::int64_t> SessionMerger::currentRecordId() const
{
    if (!m_session) {
        return std::nullopt;
    }
    return m_session->recordId;
}

int SessionMerger::currentDurationSeconds() const
{
    return m_session ? m_session->durationSeconds : 0;
}

bool SessionMerger::isIdle(const Heartbeat &heartbeat) const
{
    if (!heartbeat.idle) {
        return false;
    }
    return !heartbeat.idleSeconds || *heartbeat.idleSeconds >= m_settings.idleThresholdSeconds;
}

bool SessionMerger::isPassive(const OpenSession &session) const
{
    return m_settings.passiveBundleIds.count(session.bundleId) > 0
        || looksLikePdf(session.windowTitle);
}

bool SessionMerger::sameIdentity(const OpenSession &session, const Heartbeat &heartbeat)
{
    return session.appName == heartbeat.appName
        && session.windowTitle == heartbeat.windowTitle
        && session.url == heartbeat.url
        && session.extraInfo == heartbeat.extraInfo;
}

void SessionMerger::merge(const Heartbeat &heartbeat)
{
    const std::string date = localDateString(heartbeat.timestamp);
    if (m_session && m_session->date != date) {
        closeSession("day_boundary");
    }
    // YYYY-MM-DD strings order chronologically.
    if (!m_lastDate) {
        m_lastDate = date;
    } else if (date > *m_lastDate) {
        const std::string completed = *m_lastDate;
        m_lastDate = date;
        emit dayChanged(QString::fromStdString(completed));
    }

    const bool idle = isIdle(heartbeat) && !(m_session && isPassive(*m_session));
    if (idle) {
        closeSession("idle");
        return;
    }

    if (!m_session) {
        openSession(heartbeat, date);
        return;
    }

    if (sameIdentity(*m_session, heartbeat)) {
        extendSession();
        return;
    }

    closeSession("window_changed");
    openSession(heartbeat, date);
}

void SessionMerger::close()
{
    closeSession("shutdown");
}

void SessionMerger::openSession(const Heartbeat &heartbeat, const std::string &date)
{
    ActivityRecord record;
    record.timestamp = heartbeat.timestamp;
    record.appName = heartbeat.appName;
    record.bundleId = heartbeat.bundleId;
    record.windowTitle = heartbeat.windowTitle;
    record.url = heartbeat.url;
    record.extraInfo = heartbeat.extraInfo;
    record.durationSeconds = m_settings.intervalSeconds;
    record.date = date;

    if (m_ruleEngine) {
        try {
            record.projectId = m_ruleEngine->match(record);
            if (record.projectId) {
                record.projectSource = ProjectSource::Auto;
            }
        } catch (const std::exception &ex) {
            logStoreFailure("SessionMerger::openSession", "classify_failed", ex,
                            nlohmann::json{{"app", heartbeat.appName}});
        }
    }

    try {
        const std::int64_t id = m_store.insertActivity(record);
        OpenSession session;
        session.recordId = id;
        session.appName = heartbeat.appName;
        session.bundleId = heartbeat.bundleId;
        session.windowTitle = heartbeat.windowTitle;
        session.url = heartbeat.url;
        session.extraInfo = heartbeat.extraInfo;
        session.date = date;
        session.durationSeconds = record.durationSeconds;
        m_session = std::move(session);

        HGLOG_DEBUG("merger",
                    "SessionMerger::openSession",
                    "session_opened",
                    "window identity changed",
                    "heartbeat",
                    ::hourglass::logging::defaultWho(),
                    "",
                    (nlohmann::json{{"id", id}, {"app", heartbeat.appName}, {"date", date}}));
    } catch (const std::exception &ex) {
        logStoreFailure("SessionMerger::openSession", "insert_failed", ex,
                        nlohmann::json{{"app", heartbeat.appName}, {"date", date}});
    }
}

void SessionMerger::extendSession()
{
    m_session->durationSeconds += m_settings.intervalSeconds;
    try {
        m_store.updateDuration(m_session->recordId, m_session->durationSeconds);
        m_session->dirty = false;
    } catch (const std::exception &ex) {
        m_session->dirty = true;
        logStoreFailure("SessionMerger::extendSession", "update_failed", ex,
                        nlohmann::json{{"id", m_session->recordId},
                                       {"durationSeconds", m_session->durationSeconds}});
    }
}

void SessionMerger::closeSession(const char *reason)
{
    if (!m_session) {
        return;
    }

    if (m_session->dirty) {
        try {
            m_store.updateDuration(m_session->recordId, m_session->durationSeconds);
        } catch (const std::exception &ex) {
            logStoreFailure("SessionMerger::closeSession", "final_write_failed", ex,
                            nlohmann::json{{"id", m_session->recordId},
                                           {"durationSeconds", m_session->durationSeconds}});
        }
    }

    HGLOG_DEBUG("merger",
                "SessionMerger::closeSession",
                "session_closed",
                reason,
                "heartbeat",
                ::hourglass::logging::defaultWho(),
                "",
                (nlohmann::json{{"id", m_session->recordId},
                                {"durationSeconds", m_session->durationSeconds}}));
    m_session.reset();
}

} // namespace hourglass
