module;
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include <QDebug>
#include <QElapsedTimer>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QVector>
#include <QtGlobal>

module nava.core.eventreconciler;

EventReconciler::EventReconciler(JobRegistry& registry, const TombstoneSet& tombstones, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
    , m_tombstones(tombstones)
{
    m_monotonic.start();
    m_evictionTimer.setSingleShot(true);
    m_evictionTimer.setTimerType(Qt::PreciseTimer);
    connect(&m_evictionTimer, &QTimer::timeout, this, [this]() {
        pollEvictions(now());
    });
}

bool EventReconciler::apply(const EngineEvent& event)
{
    bool changed = false;
    std::visit([this, &changed](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ProgressUpdate>) {
            changed = applyProgress(e);
        } else if constexpr (std::is_same_v<T, TerminalUpdate>) {
            changed = applyTerminal(e);
        } else {
            applyError(e);
            changed = true;
        }
    }, event);
    return changed;
}

bool EventReconciler::onEvent(const QString& id, JobStatus status, double progress,
                              const QString& title, const QString& kind,
                              std::optional<bool> converting)
{
    if (Job::isTerminalStatus(status) || status == JobStatus::Cancelled) {
        TerminalUpdate update;
        update.id = id;
        update.status = status;
        update.progress = progress;
        update.title = title;
        return apply(update);
    }

    ProgressUpdate update;
    update.id = id;
    update.status = status;
    update.progress = progress;
    update.title = title;
    update.kind = kind;
    update.converting = converting;
    return apply(update);
}

void EventReconciler::onError(const QString& sourceKey, const QString& message)
{
    apply(EngineError { sourceKey, message });
}

bool EventReconciler::registerStarted(const QString& id, const QString& title, const QString& kind)
{
    if (m_tombstones.contains(id)) {
        qDebug() << "EventReconciler: start of tombstoned job ignored" << id;
        return false;
    }

    JobPatch patch;
    patch.title = title;
    patch.kind = kind;
    if (!m_registry.contains(id)) patch.status = JobStatus::Starting;
    m_registry.upsert(id, patch);
    reconcile();
    return true;
}

void EventReconciler::removeJob(const QString& id)
{
    m_evictions.cancel(id);
    if (m_registry.remove(id)) {
        qDebug() << "EventReconciler: removed job" << id;
    }
    armEvictionTimer();
    reconcile();
}

void EventReconciler::clearJobs()
{
    m_evictions.clear();
    m_evictionTimer.stop();
    m_registry.clear();
    reconcile();
}

void EventReconciler::reconcile()
{
    const QVector<Job> snapshot = m_registry.snapshot();
    bool scheduled = false;
    for (const Job& job : snapshot) {
        if (!job.isTerminal()) continue;
        if (m_evictions.schedule(job.id, now() + m_evictionDelayMs)) {
            qDebug() << "EventReconciler: eviction scheduled for" << job.id
                     << "in" << m_evictionDelayMs << "ms";
            scheduled = true;
        }
    }
    if (scheduled) armEvictionTimer();

    emit activeJobsChanged(deriveActive(snapshot, m_tombstones));
}

int EventReconciler::pollEvictions(qint64 nowMs)
{
    const QStringList due = m_evictions.takeDue(nowMs);
    int evicted = 0;
    for (const QString& id : due) {
        if (m_registry.remove(id)) {
            qDebug() << "EventReconciler: evicted terminal job" << id;
            ++evicted;
            emit jobEvicted(id);
        }
    }
    armEvictionTimer();
    return evicted;
}

QVector<Job> EventReconciler::activeJobs() const
{
    return deriveActive(m_registry.snapshot(), m_tombstones);
}

QVector<Job> EventReconciler::deriveActive(const QVector<Job>& snapshot, const TombstoneSet& tombstones)
{
    QVector<Job> active;
    for (const Job& job : snapshot) {
        if (job.isActive() && !tombstones.contains(job.id)) active.append(job);
    }
    return active;
}

void EventReconciler::setEvictionDelay(int ms)
{
    m_evictionDelayMs = qMax(0, ms);
}

void EventReconciler::setClock(Clock clock)
{
    m_clock = std::move(clock);
    armEvictionTimer();
}

bool EventReconciler::applyProgress(const ProgressUpdate& update)
{
    if (m_tombstones.contains(update.id)) {
        qDebug() << "EventReconciler: dropped event for cancelled job" << update.id;
        return false;
    }
    if (update.status == JobStatus::Cancelled) {
        const bool known = m_registry.contains(update.id);
        removeJob(update.id);
        return known;
    }
    if (Job::isTerminalStatus(update.status)) {
        TerminalUpdate terminal;
        terminal.id = update.id;
        terminal.status = update.status;
        terminal.progress = update.progress;
        terminal.title = update.title;
        return applyTerminal(terminal);
    }

    JobPatch patch;
    patch.status = update.status;
    patch.progress = update.progress;
    patch.title = update.title;
    patch.kind = update.kind;
    patch.converting = update.converting;
    const auto result = m_registry.upsert(update.id, patch);
    if (result == JobRegistry::UpsertResult::Created) {
        qDebug() << "EventReconciler: implicit creation of job" << update.id
                 << "at" << Job::statusString(update.status);
    }
    if (result == JobRegistry::UpsertResult::Ignored) return false;

    reconcile();
    return true;
}

bool EventReconciler::applyTerminal(const TerminalUpdate& update)
{
    if (m_tombstones.contains(update.id)) {
        qDebug() << "EventReconciler: dropped terminal event for cancelled job" << update.id;
        return false;
    }
    if (update.status == JobStatus::Cancelled) {
        const bool known = m_registry.contains(update.id);
        removeJob(update.id);
        return known;
    }

    JobPatch patch;
    patch.status = update.status;
    patch.progress = update.progress;
    patch.title = update.title;
    patch.converting = false;
    const auto result = m_registry.upsert(update.id, patch);
    if (result == JobRegistry::UpsertResult::Ignored) return false;

    const Job* job = m_registry.job(update.id);
    const QString title = job ? job->title : update.title;
    const bool success = update.status == JobStatus::Completed;
    if (!success) {
        qWarning() << "EventReconciler: job failed" << update.id << update.error;
    }

    reconcile();
    emit jobFinished(update.id, success, title, update.error);
    return true;
}

void EventReconciler::applyError(const EngineError& error)
{
    const auto category = nava::utils::classifyError(error.message);
    qWarning() << "EventReconciler: engine error for" << error.sourceKey << error.message;
    emit engineError(error.sourceKey, error.message, category);
}

qint64 EventReconciler::now() const
{
    return m_clock ? m_clock() : m_monotonic.elapsed();
}

void EventReconciler::armEvictionTimer()
{
    const qint64 next = m_evictions.nextDeadline();
    if (next < 0) {
        m_evictionTimer.stop();
        return;
    }
    m_evictionTimer.start(int(qMax<qint64>(0, next - now())));
}
