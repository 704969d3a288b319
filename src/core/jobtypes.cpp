module;
#include <QString>

module nava.core.jobtypes;

bool Job::isActiveStatus(JobStatus status)
{
    switch (status) {
    case JobStatus::Starting:
    case JobStatus::Downloading:
    case JobStatus::Converting:
    case JobStatus::DownloadComplete:
        return true;
    case JobStatus::Completed:
    case JobStatus::Failed:
    case JobStatus::Cancelled:
        break;
    }
    return false;
}

bool Job::isTerminalStatus(JobStatus status)
{
    return status == JobStatus::Completed || status == JobStatus::Failed;
}

QString Job::statusString(JobStatus status)
{
    switch (status) {
    case JobStatus::Starting: return QStringLiteral("starting");
    case JobStatus::Downloading: return QStringLiteral("downloading");
    case JobStatus::Converting: return QStringLiteral("converting");
    case JobStatus::DownloadComplete: return QStringLiteral("download_complete");
    case JobStatus::Completed: return QStringLiteral("completed");
    case JobStatus::Failed: return QStringLiteral("failed");
    case JobStatus::Cancelled: return QStringLiteral("cancelled");
    }
    return QString();
}

JobStatus Job::statusFromString(const QString& value, bool* ok)
{
    const QString v = value.trimmed().toLower();
    if (ok) *ok = true;
    if (v == "starting") return JobStatus::Starting;
    if (v == "downloading") return JobStatus::Downloading;
    if (v == "converting") return JobStatus::Converting;
    if (v == "download_complete") return JobStatus::DownloadComplete;
    if (v == "completed") return JobStatus::Completed;
    if (v == "failed" || v == "error") return JobStatus::Failed;
    if (v == "cancelled" || v == "canceled") return JobStatus::Cancelled;
    if (ok) *ok = false;
    return JobStatus::Downloading;
}
