#include <csignal>
#include <exception>

#include <QCoreApplication>
#include <QDebug>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "daemon/hourglass_daemon.hpp"

namespace {

volatile std::sig_atomic_t g_stopSignal = 0;

void handleStopSignal(int)
{
    g_stopSignal = 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("hourglass-daemon"));
    qInfo() << "Hourglass daemon starting...";

    hourglass::logging::initLogging(QStringLiteral("hourglass-daemon"),
                                    hourglass::logging::traceRequested(argc, argv));

    const hourglass::HourglassConfig config = hourglass::loadConfig();
    HGLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QStringLiteral("config_file"),
               hourglass::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"config", hourglass::configFilePath()}}));

    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);

    try {
        // The daemon lives for the lifetime of the process.
        hourglass::HourglassDaemon daemon(config);
        QObject::connect(&daemon, &hourglass::HourglassDaemon::stopped,
                         &app, &QCoreApplication::quit);

        QTimer signalPoll;
        signalPoll.setInterval(200);
        QObject::connect(&signalPoll, &QTimer::timeout, [&daemon]() {
            if (g_stopSignal) {
                daemon.requestStop();
            }
        });
        signalPoll.start();

        daemon.start();
        return app.exec();
    } catch (const std::exception &ex) {
        HGLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("daemon_failed"),
                    QStringLiteral("startup error"),
                    QStringLiteral("exception"),
                    hourglass::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
        qCritical() << "Hourglass: daemon failed:" << ex.what();
        return 1;
    }
}
