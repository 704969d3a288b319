module;
#include <QAbstractListModel>
#include <QByteArray>
#include <QHash>
#include <QModelIndex>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVector>
#include <QtGlobal>

module nava.core.joblistmodel;

JobListModel::JobListModel(QObject *parent) : QAbstractListModel(parent) {}

int JobListModel::rowCount(const QModelIndex &parent) const {
    if (parent.isValid()) return 0;
    return m_jobs.size();
}

QVariant JobListModel::data(const QModelIndex &index, int role) const {
    if (!index.isValid() || index.row() >= m_jobs.size()) return {};
    const auto &job = m_jobs[index.row()];

    switch (role) {
    case Qt::DisplayRole:
    case TitleRole: return job.title;
    case IdRole: return job.id;
    case KindRole: return job.kind;
    case ProgressRole: return job.progress;
    case StatusRole: return Job::statusString(job.status);
    case StatusTextRole: return statusText(job);
    case ConvertingRole: return job.converting;
    case CancellableRole: return isCancellable(job);
    }
    return {};
}

QHash<int, QByteArray> JobListModel::roleNames() const {
    return {
        {IdRole, "jobId"},
        {TitleRole, "title"},
        {KindRole, "kind"},
        {ProgressRole, "progress"},
        {StatusRole, "status"},
        {StatusTextRole, "statusText"},
        {ConvertingRole, "converting"},
        {CancellableRole, "cancellable"}
    };
}

void JobListModel::sync(const QVector<Job>& jobs) {
    QHash<QString, int> incoming;
    incoming.reserve(jobs.size());
    for (int i = 0; i < jobs.size(); ++i) incoming.insert(jobs[i].id, i);

    // Remove rows that left the active view, back to front to keep indices valid.
    for (int row = m_jobs.size() - 1; row >= 0; --row) {
        if (incoming.contains(m_jobs[row].id)) continue;
        beginRemoveRows(QModelIndex(), row, row);
        m_jobs.removeAt(row);
        endRemoveRows();
    }

    // Update surviving rows in place.
    QSet<QString> shown;
    for (int row = 0; row < m_jobs.size(); ++row) {
        const Job &next = jobs[incoming.value(m_jobs[row].id)];
        shown.insert(next.id);
        const QList<int> roles = changedRoles(m_jobs[row], next);
        if (roles.isEmpty()) continue;
        m_jobs[row] = next;
        const QModelIndex idx = index(row);
        emit dataChanged(idx, idx, roles);
    }

    // Append newly active jobs in incoming order.
    QVector<Job> added;
    for (const Job &job : jobs) {
        if (!shown.contains(job.id)) added.append(job);
    }
    if (added.isEmpty()) return;
    beginInsertRows(QModelIndex(), m_jobs.size(), m_jobs.size() + added.size() - 1);
    m_jobs += added;
    endInsertRows();
}

int JobListModel::rowOf(const QString& id) const {
    for (int i = 0; i < m_jobs.size(); ++i) {
        if (m_jobs[i].id == id) return i;
    }
    return -1;
}

Job JobListModel::jobAt(int row) const {
    if (row < 0 || row >= m_jobs.size()) return {};
    return m_jobs[row];
}

QStringList JobListModel::ids() const {
    QStringList out;
    out.reserve(m_jobs.size());
    for (const auto &job : m_jobs) out.append(job.id);
    return out;
}

QString JobListModel::statusText(const Job& job) {
    if (job.status == JobStatus::DownloadComplete) return QStringLiteral("Download complete");
    if (job.converting || job.status == JobStatus::Converting)
        return QStringLiteral("Converting %1%").arg(qRound(job.progress));
    return Job::statusString(job.status);
}

bool JobListModel::isCancellable(const Job& job) {
    switch (job.status) {
    case JobStatus::Downloading:
    case JobStatus::Converting:
    case JobStatus::DownloadComplete:
        return true;
    default:
        return false;
    }
}

QList<int> JobListModel::changedRoles(const Job& before, const Job& after) {
    QList<int> roles;
    auto add = [&roles](int role) {
        if (!roles.contains(role)) roles.append(role);
    };

    if (before.title != after.title) {
        add(Qt::DisplayRole);
        add(TitleRole);
    }
    if (before.kind != after.kind) add(KindRole);
    if (before.progress != after.progress) add(ProgressRole);
    if (before.status != after.status) {
        add(StatusRole);
        add(CancellableRole);
    }
    if (before.converting != after.converting) add(ConvertingRole);
    if (statusText(before) != statusText(after)) add(StatusTextRole);
    return roles;
}
