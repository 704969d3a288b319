/*!
 * @file        eventreconciler.cppm
 * @brief       Applies the engine's asynchronous event stream to the job registry.
 * @details     The reconciler is the only writer of engine-reported state. It
 *              consults the tombstone set before touching the registry, turns
 *              out-of-order sightings of unknown IDs into implicit creations,
 *              derives the active view after every change, and evicts
 *              terminal jobs once their grace period has elapsed.
 *
 *              Evictions are kept in a single deadline-ordered queue that is
 *              drained by one single-shot timer armed for the earliest
 *              deadline.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/nava/blob/main/LICENSE.md
 */

module;
#include <functional>
#include <optional>

#include <QElapsedTimer>
#include <QObject>
#include <QString>
#include <QTimer>
#include <QVector>

#ifndef Q_MOC_RUN
export module nava.core.eventreconciler;
import nava.core.jobtypes;
import nava.core.jobregistry;
import nava.core.tombstoneset;
import nava.core.evictionqueue;
import nava.utils.error_utils;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Reconciles engine events into the job registry.
 *
 * The registry and tombstone set are owned by the orchestrator and passed by
 * reference; the reconciler must not outlive them.
 */
NAVA_MODULE_EXPORT class EventReconciler : public QObject {

    Q_OBJECT

public:
    //!< @brief Monotonic millisecond clock used for eviction deadlines.
    using Clock = std::function<qint64()>;

    /**
     * @brief Construct a reconciler.
     * @param registry Job registry to mutate.
     * @param tombstones Tombstone set to consult.
     * @param parent Optional parent QObject.
     */
    EventReconciler(JobRegistry& registry, const TombstoneSet& tombstones, QObject* parent = nullptr);

    /**
     * @brief Apply one engine event.
     *
     * Events for tombstoned IDs are dropped. A cancelled status removes the
     * job. Any other job event is merged into the registry, creating the job
     * if its ID is unknown. Error events are classified and re-emitted.
     *
     * @param event Engine event.
     * @return True if the registry changed or an error was raised.
     */
    bool apply(const EngineEvent& event);

    /**
     * @brief Apply a job event given as separate fields.
     * @param id Job identifier.
     * @param status Reported status.
     * @param progress Reported progress.
     * @param title Reported title, empty if omitted.
     * @param kind Reported kind, empty if omitted.
     * @param converting Reported converting flag, if any.
     * @return True if the registry changed.
     */
    bool onEvent(const QString& id, JobStatus status, double progress,
                 const QString& title = {}, const QString& kind = {},
                 std::optional<bool> converting = std::nullopt);

    /**
     * @brief Raise an error not attributable to a job ID.
     * @param sourceKey Request identity, usually the item URL.
     * @param message Free-text error message.
     */
    void onError(const QString& sourceKey, const QString& message);

    /**
     * @brief Record a job returned by a successful start call.
     *
     * Known jobs keep their current status; only title and kind are merged.
     *
     * @param id Engine-assigned job identifier.
     * @param title Item title.
     * @param kind Output kind.
     * @return False if the ID is tombstoned.
     */
    bool registerStarted(const QString& id, const QString& title, const QString& kind);

    /**
     * @brief Remove a job from the registry and its pending eviction.
     * @param id Job identifier.
     */
    void removeJob(const QString& id);

    //!< @brief Remove every job and every pending eviction.
    void clearJobs();

    /**
     * @brief Schedule evictions for newly terminal jobs and publish the active view.
     */
    void reconcile();

    /**
     * @brief Evict every job whose grace period has elapsed.
     * @param nowMs Current time on the reconciler's clock.
     * @return Number of evicted jobs.
     */
    int pollEvictions(qint64 nowMs);

    //!< @brief Current active view in first-sighting order.
    QVector<Job> activeJobs() const;

    /**
     * @brief Derive the active view from a registry snapshot.
     * @param snapshot Jobs in first-sighting order.
     * @param tombstones IDs to exclude.
     * @return Jobs whose status is starting, downloading, converting or download_complete.
     */
    static QVector<Job> deriveActive(const QVector<Job>& snapshot, const TombstoneSet& tombstones);

    //!< @brief Grace period before a terminal job is evicted.
    int evictionDelay() const { return m_evictionDelayMs; }
    void setEvictionDelay(int ms);

    //!< @brief Replace the clock, mainly for tests. Passing an empty function restores the default.
    void setClock(Clock clock);

    //!< @brief Number of jobs awaiting eviction.
    int pendingEvictions() const { return m_evictions.size(); }

    //!< @brief True if the job has a pending eviction.
    bool isEvictionScheduled(const QString& id) const { return m_evictions.isScheduled(id); }

signals:
    /**
     * @brief Emitted after every reconciliation pass.
     * @param jobs Full active view.
     */
    void activeJobsChanged(const QVector<Job>& jobs);

    /**
     * @brief Emitted once when a job first reaches completed or failed.
     * @param id Job identifier.
     * @param success True for completed.
     * @param title Job title.
     * @param error Failure details, empty on success.
     */
    void jobFinished(const QString& id, bool success, const QString& title, const QString& error);

    /**
     * @brief Emitted for every error event.
     * @param sourceKey Request identity.
     * @param message Free-text message.
     * @param category Classification of the message.
     */
    void engineError(const QString& sourceKey, const QString& message, nava::utils::ErrorCategory category);

    //!< @brief Emitted when a job is evicted after its grace period.
    void jobEvicted(const QString& id);

private:
    bool applyProgress(const ProgressUpdate& update);
    bool applyTerminal(const TerminalUpdate& update);
    void applyError(const EngineError& error);
    qint64 now() const;
    void armEvictionTimer();

    JobRegistry& m_registry;                //!< Registry owned by the orchestrator.
    const TombstoneSet& m_tombstones;       //!< Tombstones owned by the orchestrator.
    EvictionQueue m_evictions;              //!< Pending evictions by deadline.
    QTimer m_evictionTimer;                 //!< Single-shot timer for the earliest deadline.
    QElapsedTimer m_monotonic;              //!< Default clock source.
    Clock m_clock;                          //!< Injected clock, empty for the default.
    int m_evictionDelayMs = 3000;           //!< Terminal grace period.
};

#include "eventreconciler.moc"
