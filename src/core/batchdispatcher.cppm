/*!
 * @file        batchdispatcher.cppm
 * @brief       Concurrency-bounded, paced admission of items into the engine.
 * @details     A batch of selected items is admitted by a fixed number of
 *              workers that share one FIFO cursor. Each worker issues a
 *              start call, waits for it to settle, then waits a pacing delay
 *              before pulling the next item. A failed start never stops the
 *              batch.
 *
 *              The dispatcher only admits jobs. It does not wait for any job
 *              to finish and it never blocks cancellation of jobs that are
 *              already running.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/nava/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QPointer>
#include <QSharedPointer>
#include <QString>
#include <QVector>

#ifndef Q_MOC_RUN
export module nava.core.batchdispatcher;
import nava.core.jobtypes;
import nava.services.downloadengine;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Admits batches of items under a concurrency budget.
 */
NAVA_MODULE_EXPORT class BatchDispatcher : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct a dispatcher.
     * @param engine Engine that receives start calls.
     * @param parent Optional parent QObject.
     */
    explicit BatchDispatcher(DownloadEngine* engine, QObject* parent = nullptr);

    /**
     * @brief Admit a batch of items.
     *
     * A single item is started directly. Larger batches run
     * min(budget, items.size()) workers over a shared FIFO cursor. The
     * budget is read once; later changes only affect the next batch.
     *
     * @param items Selected items in dispatch order.
     * @param options Output preferences passed to every start call.
     * @param budget Maximum number of start calls in flight.
     * @return False if there is nothing to dispatch.
     */
    bool dispatchBatch(const QVector<MediaItem>& items, const OutputOptions& options, int budget);

    //!< @brief Delay a worker waits after each start call settles.
    int pacingDelay() const { return m_pacingDelayMs; }
    void setPacingDelay(int ms);

    //!< @brief True while any batch still has admissions pending.
    bool isDispatching() const { return m_activeBatches > 0; }

    //!< @brief Number of start calls awaiting their callback.
    int outstanding() const { return m_outstanding; }

signals:
    /**
     * @brief Emitted when a start call returns a job ID.
     * @param jobId Engine-assigned job identifier.
     * @param item Item that was started.
     * @param kind Output kind requested for the item.
     * @param batchSize Number of items in the batch the item belongs to.
     */
    void jobStarted(const QString& jobId, const MediaItem& item, const QString& kind, int batchSize);

    /**
     * @brief Emitted when a start call fails.
     * @param item Item that could not be started.
     * @param error Error reported by the engine.
     * @param batchSize Number of items in the batch the item belongs to.
     */
    void startFailed(const MediaItem& item, const QString& error, int batchSize);

    /**
     * @brief Emitted once every admission attempt of a batch has settled.
     * @param started Number of successful start calls.
     * @param failed Number of failed start calls.
     */
    void batchFinished(int started, int failed);

    //!< @brief Emitted when isDispatching() changes.
    void dispatchingChanged();

private:
    struct Batch {
        QVector<MediaItem> items;   //!< Items in FIFO order.
        OutputOptions options;      //!< Output preferences.
        int cursor = 0;             //!< Next unstarted item.
        int workers = 0;            //!< Workers still running.
        int started = 0;            //!< Successful start calls.
        int failed = 0;             //!< Failed start calls.
    };

    void pullNext(const QSharedPointer<Batch>& batch);
    void settle(const QSharedPointer<Batch>& batch, const MediaItem& item,
                const QString& jobId, const QString& error);
    void finishWorker(const QSharedPointer<Batch>& batch);

    QPointer<DownloadEngine> m_engine;  //!< Engine receiving start calls.
    int m_pacingDelayMs = 500;          //!< Inter-call delay per worker.
    int m_activeBatches = 0;            //!< Batches with pending admissions.
    int m_outstanding = 0;              //!< Start calls in flight.
};

#include "batchdispatcher.moc"
