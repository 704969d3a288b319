module;
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

module nava.core.jobregistry;

namespace {

double clampProgress(double value)
{
    if (qIsNaN(value)) return 0.0;
    return qBound(0.0, value, 100.0);
}

} // namespace

JobRegistry::UpsertResult JobRegistry::upsert(const QString& id, const JobPatch& patch)
{
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) {
        Job job;
        job.id = id;
        job.title = patch.title.isEmpty() ? QStringLiteral("Unknown") : patch.title;
        job.kind = patch.kind.isEmpty() ? QStringLiteral("video") : patch.kind;
        job.status = patch.status.value_or(JobStatus::Starting);
        job.progress = clampProgress(patch.progress.value_or(0.0));
        job.converting = patch.converting.value_or(false);
        m_jobs.insert(id, job);
        m_order.append(id);
        return UpsertResult::Created;
    }

    Job& job = it.value();
    if (job.isTerminal()) return UpsertResult::Ignored;

    if (patch.status) job.status = *patch.status;
    if (patch.progress) job.progress = clampProgress(*patch.progress);
    if (!patch.title.isEmpty()) job.title = patch.title;
    if (!patch.kind.isEmpty()) job.kind = patch.kind;
    if (patch.converting) job.converting = *patch.converting;
    return UpsertResult::Updated;
}

bool JobRegistry::remove(const QString& id)
{
    if (!m_jobs.remove(id)) return false;
    m_order.removeOne(id);
    return true;
}

void JobRegistry::clear()
{
    m_jobs.clear();
    m_order.clear();
}

const Job* JobRegistry::job(const QString& id) const
{
    auto it = m_jobs.constFind(id);
    return it == m_jobs.constEnd() ? nullptr : &it.value();
}

QVector<Job> JobRegistry::snapshot() const
{
    QVector<Job> out;
    out.reserve(m_order.size());
    for (const QString& id : m_order) {
        out.append(m_jobs.value(id));
    }
    return out;
}
