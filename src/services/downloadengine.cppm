/*!
 * @file        downloadengine.cppm
 * @brief       Boundary between the orchestration core and a media engine.
 * @details     The orchestrator never performs network I/O itself. Every
 *              transfer, conversion and metadata lookup goes through an
 *              implementation of this interface, which completes its
 *              operations asynchronously through callbacks and reports job
 *              progress through the jobEvent() signal.
 *
 *              All callbacks and signals are delivered on the thread that
 *              owns the engine, which is the application's event loop.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/nava/blob/main/LICENSE.md
 */

module;
#include <functional>

#include <QObject>
#include <QString>

#ifndef Q_MOC_RUN
export module nava.services.downloadengine;
export import nava.core.jobtypes;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Abstract asynchronous download engine.
 *
 * Error strings are empty on success.
 */
NAVA_MODULE_EXPORT class DownloadEngine : public QObject {

    Q_OBJECT

public:
    //!< @brief Completion of startJob(): the assigned job ID, or an error.
    using StartCallback = std::function<void(const QString& jobId, const QString& error)>;

    //!< @brief Completion of cancelJob().
    using CancelCallback = std::function<void(bool ok, const QString& error)>;

    //!< @brief Completion of fetchMetadata().
    using MetadataCallback = std::function<void(const MediaCollection& collection, const QString& error)>;

    explicit DownloadEngine(QObject* parent = nullptr) : QObject(parent) {}
    ~DownloadEngine() override = default;

    /**
     * @brief Begin downloading one item.
     *
     * Safe to call repeatedly for different items.
     *
     * @param item Item to download.
     * @param options Output preferences.
     * @param done Receives the job ID or an error.
     */
    virtual void startJob(const MediaItem& item, const OutputOptions& options, StartCallback done) = 0;

    /**
     * @brief Stop a running job.
     * @param jobId Job identifier returned by startJob().
     * @param done Receives the outcome.
     */
    virtual void cancelJob(const QString& jobId, CancelCallback done) = 0;

    /**
     * @brief Resolve a URL into a collection of downloadable items.
     * @param url Video or playlist URL.
     * @param done Receives the collection or an error.
     */
    virtual void fetchMetadata(const QString& url, MetadataCallback done) = 0;

signals:
    /**
     * @brief Emitted for every progress, terminal or error report.
     * @param event Engine event.
     */
    void jobEvent(const EngineEvent& event);
};

#include "downloadengine.moc"
