#pragma once

#include <QString>
#include <QStringList>

namespace hourglass {

class ActivityStore;

class ReportCli
{
public:
    // CLI dispatcher for reports, taxonomy edits, classification and
    // suggestions. Returns the process exit code.
    int run(int argc, char *argv[]);

private:
    // Reports render markdown by default, json with --format json.
    int runDayReport(ActivityStore &store, const QStringList &args);
    int runWeekReport(ActivityStore &store, const QStringList &args);
    int runMonthReport(ActivityStore &store, const QStringList &args);
    int runRangeReport(ActivityStore &store, const QStringList &args);
    int runAppReport(ActivityStore &store, const QStringList &args);
    int runTimelineReport(ActivityStore &store, const QStringList &args);
    int runProjectsReport(ActivityStore &store, const QStringList &args);
    int runUnassignedReport(ActivityStore &store, const QStringList &args);

    // Taxonomy and classification commands print json.
    int runBrandCommand(ActivityStore &store, const QStringList &args);
    int runProjectCommand(ActivityStore &store, const QStringList &args);
    int runRuleCommand(ActivityStore &store, const QStringList &args);
    int runClassify(ActivityStore &store, const QStringList &args);
    int runAutoAssign(ActivityStore &store, const QStringList &args);
    int runSuggestCommand(ActivityStore &store, const QStringList &args);

    int dispatch(const QString &command, const QStringList &args);
};

} // namespace hourglass
