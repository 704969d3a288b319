/*!
 * @file        downloadmanager.cppm
 * @brief       Session-scoped download orchestrator.
 * @details     Provides the controller that sits between a presentation
 *              surface and the download engine. It owns every piece of
 *              orchestration state for one application session: the job
 *              registry, the cancellation tombstones, the candidate
 *              selection, the event reconciler, the batch dispatcher and
 *              the list model built from the active view.
 *
 *              Responsibilities include:
 *              - Metadata lookup and selection of candidates
 *              - Concurrency-bounded dispatch of the selection
 *              - Single and bulk cancellation with permanent tombstones
 *              - User notifications for every visible outcome
 *
 *              Nothing outside this class writes the registry, the
 *              tombstones or the selection; the view only reads the
 *              active snapshot.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/nava/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QVector>

#ifndef Q_MOC_RUN
export module nava.core.downloadmanager;
import nava.core.jobtypes;
import nava.core.jobregistry;
import nava.core.tombstoneset;
import nava.core.selectionset;
import nava.core.eventreconciler;
import nava.core.batchdispatcher;
import nava.core.joblistmodel;
import nava.services.downloadengine;
import nava.services.settings;
import nava.utils.error_utils;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Central coordinator for one download session.
 *
 * DownloadManager exposes invokable operations for fetching, selecting,
 * dispatching and cancelling downloads, and reports every user-visible
 * outcome through toastRequested().
 *
 * The engine is not owned and must outlive the manager.
 */
NAVA_MODULE_EXPORT class DownloadManager : public QObject {

    Q_OBJECT

    //!< @brief Active job list model.
    Q_PROPERTY(JobListModel* model READ model CONSTANT)

    //!< @brief Concurrency budget of the next dispatch (1 – 5).
    Q_PROPERTY(int maxConcurrent READ maxConcurrent WRITE setMaxConcurrent NOTIFY maxConcurrentChanged)

    //!< @brief Number of jobs in the active view.
    Q_PROPERTY(int activeCount READ activeCount NOTIFY jobsChanged)

    //!< @brief Number of selected candidates.
    Q_PROPERTY(int selectionCount READ selectionCount NOTIFY selectionChanged)

    //!< @brief Whether every candidate is selected.
    Q_PROPERTY(bool allSelected READ isAllSelected NOTIFY selectionChanged)

    //!< @brief Number of fetched candidates.
    Q_PROPERTY(int candidateCount READ candidateCount NOTIFY collectionChanged)

    //!< @brief Title of the fetched collection.
    Q_PROPERTY(QString collectionTitle READ collectionTitle NOTIFY collectionChanged)

    //!< @brief Output kind ("video" or "audio").
    Q_PROPERTY(QString kind READ kind WRITE setKind NOTIFY outputOptionsChanged)

    //!< @brief Video quality label.
    Q_PROPERTY(QString quality READ quality WRITE setQuality NOTIFY outputOptionsChanged)

    //!< @brief Output directory.
    Q_PROPERTY(QString outputPath READ outputPath WRITE setOutputPath NOTIFY outputOptionsChanged)

    //!< @brief Whether a metadata lookup is running.
    Q_PROPERTY(bool fetching READ isFetching NOTIFY fetchingChanged)

    //!< @brief Whether a dispatch still has admissions pending.
    Q_PROPERTY(bool dispatching READ isDispatching NOTIFY dispatchingChanged)

public:
    /**
     * @brief Construct a manager.
     * @param engine Engine used for every job; not owned.
     * @param parent Optional parent QObject.
     */
    explicit DownloadManager(DownloadEngine* engine, QObject* parent = nullptr);

    /**
     * @brief Apply start-up tunables.
     * @param settings Orchestrator settings.
     */
    void applySettings(const OrchestratorSettings& settings);

    /**
     * @brief Resolve a URL into candidates.
     *
     * On success the selection is reset with every candidate selected.
     *
     * @param url Video or playlist URL.
     * @return False if the request was rejected before reaching the engine.
     */
    Q_INVOKABLE bool fetchMetadata(const QString& url);

    /**
     * @brief Replace the current collection without a lookup.
     * @param collection Candidates to select from.
     */
    void setCollection(const MediaCollection& collection);

    //!< @brief The fetched collection.
    const MediaCollection& collection() const { return m_collection; }

    /**
     * @brief Flip selection of one candidate.
     * @param index Candidate index.
     * @return False if the index is out of range.
     */
    Q_INVOKABLE bool toggleSelection(int index);

    //!< @brief Select every candidate.
    Q_INVOKABLE void selectAll();

    //!< @brief Clear the selection.
    Q_INVOKABLE void deselectAll();

    //!< @brief Deselect all when everything is selected, otherwise select all.
    Q_INVOKABLE void toggleSelectAll();

    //!< @brief Check whether a candidate is selected.
    Q_INVOKABLE bool isSelected(int index) const { return m_selection.isSelected(index); }

    Q_INVOKABLE int selectionCount() const { return m_selection.count(); }
    Q_INVOKABLE bool isAllSelected() const { return m_selection.isAllSelected(); }

    /**
     * @brief Dispatch the selected candidates with the current budget.
     * @return False if nothing was fetched or nothing is selected.
     */
    Q_INVOKABLE bool dispatchSelected();

    /**
     * @brief Dispatch explicit items.
     * @param items Items in dispatch order.
     * @param budget Concurrency budget, clamped to 1 – 5.
     * @return False if there is nothing to dispatch.
     */
    bool dispatch(const QVector<MediaItem>& items, int budget);

    /**
     * @brief Cancel one job.
     *
     * The job is tombstoned before the engine is asked to stop it and is
     * removed once the engine answers, whatever the answer.
     *
     * @param jobId Job identifier.
     * @return False if the ID is empty or already cancelled.
     */
    Q_INVOKABLE bool cancel(const QString& jobId);

    /**
     * @brief Cancel every tracked job and clear the registry.
     */
    Q_INVOKABLE void cancelAll();

    //!< @brief Ordered snapshot of the active view.
    QVector<Job> activeJobs() const { return m_reconciler.activeJobs(); }

    JobListModel* model() { return &m_model; }
    int maxConcurrent() const { return m_maxConcurrent; }
    void setMaxConcurrent(int value);
    int activeCount() const { return m_reconciler.activeJobs().size(); }
    int candidateCount() const { return m_collection.items.size(); }
    QString collectionTitle() const { return m_collection.title; }
    QString kind() const { return m_options.kind; }
    void setKind(const QString& kind);
    QString quality() const { return m_options.videoQuality; }
    void setQuality(const QString& quality);
    QString outputPath() const { return m_options.outputPath; }
    void setOutputPath(const QString& path);
    const OutputOptions& outputOptions() const { return m_options; }
    bool isFetching() const { return m_fetching; }
    bool isDispatching() const { return m_dispatcher.isDispatching(); }

    //!< @brief Number of cancel requests awaiting an engine answer.
    int pendingCancels() const { return m_pendingCancels; }

    //!< @brief Tombstoned identifiers, read-only.
    const TombstoneSet& tombstones() const { return m_tombstones; }

    //!< @brief Registry, read-only.
    const JobRegistry& registry() const { return m_registry; }

    //!< @brief Reconciler, for wiring and tests.
    EventReconciler* reconciler() { return &m_reconciler; }

    //!< @brief Dispatcher, for tuning and tests.
    BatchDispatcher* dispatcher() { return &m_dispatcher; }

signals:
    void maxConcurrentChanged();
    void jobsChanged();
    void selectionChanged();
    void collectionChanged();
    void outputOptionsChanged();
    void fetchingChanged();
    void dispatchingChanged();

    /**
     * @brief Emitted when a dispatch has issued every admission attempt.
     * @param started Number of started jobs.
     * @param failed Number of failed starts.
     */
    void dispatchFinished(int started, int failed);

    /**
     * @brief Emitted when a metadata lookup fails.
     * @param error Error reported by the engine.
     */
    void fetchFailed(const QString& error);

    /**
     * @brief Emitted when a job reaches completed or failed.
     * @param jobId Job identifier.
     * @param success True for completed.
     * @param title Job title.
     */
    void jobFinished(const QString& jobId, bool success, const QString& title);

    /**
     * @brief Emitted for user-visible notifications.
     * @param message Notification text.
     * @param kind One of success, info, warning, danger, muted.
     */
    void toastRequested(const QString& message, const QString& kind);

private:
    void onJobStarted(const QString& jobId, const MediaItem& item, const QString& kind, int batchSize);
    void onStartFailed(const MediaItem& item, const QString& error, int batchSize);
    void onJobFinished(const QString& jobId, bool success, const QString& title, const QString& error);
    void onEngineError(const QString& sourceKey, const QString& message, nava::utils::ErrorCategory category);
    void onBatchFinished(int started, int failed);
    void setFetching(bool fetching);

    QPointer<DownloadEngine> m_engine;      //!< Engine used for every job.
    JobRegistry m_registry;                 //!< Authoritative job store.
    TombstoneSet m_tombstones;              //!< Permanently cancelled IDs.
    SelectionSet m_selection;               //!< Selected candidate indices.
    EventReconciler m_reconciler;           //!< Event stream applier.
    BatchDispatcher m_dispatcher;           //!< Paced batch admission.
    JobListModel m_model;                   //!< Active view model.
    MediaCollection m_collection;           //!< Current candidates.
    OutputOptions m_options;                //!< Pass-through output preferences.
    int m_maxConcurrent = 1;                //!< Concurrency budget.
    int m_pendingCancels = 0;               //!< Cancels awaiting an answer.
    bool m_fetching = false;                //!< Metadata lookup running.
};

#include "downloadmanager.moc"
