/*!
 * @file        jobtypes.cppm
 * @brief       Value types shared by the job orchestration core.
 * @details     Declares the job record and its status machine, the media
 *              candidates produced by metadata retrieval, the opaque output
 *              options handed to the engine, and the tagged event variant
 *              delivered by the engine's asynchronous event stream.
 *
 *              Status values map one to one onto the status strings used on
 *              the engine boundary: starting, downloading, converting,
 *              download_complete, completed, failed and cancelled.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/nava/blob/main/LICENSE.md
 */

module;
#include <optional>
#include <variant>

#include <QString>
#include <QVector>

#ifndef Q_MOC_RUN
export module nava.core.jobtypes;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Per-job lifecycle states.
 *
 * starting → downloading → converting → download_complete → completed.
 * downloading, converting and download_complete may also end in failed or
 * cancelled. Cancelled is never stored; it is represented by removal.
 */
NAVA_MODULE_EXPORT enum class JobStatus {
    Starting,           //!< Admitted, engine has not reported progress yet.
    Downloading,        //!< Transfer in progress.
    Converting,         //!< Post-processing after the transfer.
    DownloadComplete,   //!< Transfer done, final output not yet confirmed.
    Completed,          //!< Terminal success.
    Failed,             //!< Terminal failure.
    Cancelled           //!< Stopped by the user or the engine.
};

/**
 * @brief One in-flight or recently finished unit of work.
 */
NAVA_MODULE_EXPORT struct Job {

    //!< @brief Engine-assigned identifier, stable for the job's lifetime.
    QString id;

    //!< @brief Human-readable label, "Unknown" until backfilled.
    QString title;

    //!< @brief Output category ("video" or "audio"), informational only.
    QString kind;

    //!< @brief Last reported percentage in [0, 100]; may regress.
    double progress = 0.0;

    //!< @brief Current lifecycle state.
    JobStatus status = JobStatus::Starting;

    //!< @brief Post-processing sub-phase flag, orthogonal to status.
    bool converting = false;

    //!< @brief True if the status belongs to the active view.
    bool isActive() const { return isActiveStatus(status); }

    //!< @brief True if the status is completed or failed.
    bool isTerminal() const { return isTerminalStatus(status); }

    //!< @brief True for starting, downloading, converting and download_complete.
    static bool isActiveStatus(JobStatus status);

    //!< @brief True for completed and failed.
    static bool isTerminalStatus(JobStatus status);

    /**
     * @brief Return the boundary string for a status.
     * @param status Status value.
     * @return Lower-case status string.
     */
    static QString statusString(JobStatus status);

    /**
     * @brief Parse a boundary status string.
     *
     * "error" is accepted as an alias of "failed".
     *
     * @param value Status string.
     * @param ok Set to false when the string is not recognised.
     * @return Parsed status, Downloading when unrecognised.
     */
    static JobStatus statusFromString(const QString& value, bool* ok = nullptr);

    friend bool operator==(const Job&, const Job&) = default;
};

/**
 * @brief Partial update merged into a job by the registry.
 *
 * Unset optionals and empty strings leave the stored value untouched.
 */
NAVA_MODULE_EXPORT struct JobPatch {
    std::optional<JobStatus> status;    //!< New status, if reported.
    std::optional<double> progress;     //!< New progress, if reported.
    QString title;                      //!< New title, empty if omitted.
    QString kind;                       //!< New kind, empty if omitted.
    std::optional<bool> converting;     //!< New converting flag, if reported.
};

/**
 * @brief One candidate item produced by metadata retrieval.
 */
NAVA_MODULE_EXPORT struct MediaItem {
    QString id;             //!< Site identifier of the item.
    QString title;          //!< Display title.
    QString url;            //!< Canonical item URL handed to the engine.
    QString duration;       //!< Optional duration text.
    QString thumbnail;      //!< Optional thumbnail URL.

    friend bool operator==(const MediaItem&, const MediaItem&) = default;
};

/**
 * @brief Ordered, immutable list of candidates for one fetched URL.
 */
NAVA_MODULE_EXPORT struct MediaCollection {
    QString title;                  //!< Collection or single video title.
    QVector<MediaItem> items;       //!< Candidates in site order.

    friend bool operator==(const MediaCollection&, const MediaCollection&) = default;
};

/**
 * @brief User preferences passed through to the engine untouched.
 */
NAVA_MODULE_EXPORT struct OutputOptions {
    QString kind = QStringLiteral("video");     //!< "video" or "audio".
    QString outputPath;                         //!< Target directory.
    QString videoQuality = QStringLiteral("1080p"); //!< Quality label for video.

    friend bool operator==(const OutputOptions&, const OutputOptions&) = default;
};

/**
 * @brief Non-terminal progress report for a job.
 */
NAVA_MODULE_EXPORT struct ProgressUpdate {
    QString id;                             //!< Job identifier.
    JobStatus status = JobStatus::Downloading; //!< Reported status.
    double progress = 0.0;                  //!< Reported percentage.
    QString title;                          //!< Title, empty if omitted.
    QString kind;                           //!< Kind, empty if omitted.
    std::optional<bool> converting;         //!< Converting flag, if reported.

    friend bool operator==(const ProgressUpdate&, const ProgressUpdate&) = default;
};

/**
 * @brief Terminal report for a job (completed, failed or cancelled).
 */
NAVA_MODULE_EXPORT struct TerminalUpdate {
    QString id;                             //!< Job identifier.
    JobStatus status = JobStatus::Completed; //!< Terminal status.
    double progress = 0.0;                  //!< Final percentage.
    QString title;                          //!< Title, empty if omitted.
    QString error;                          //!< Failure details for failed jobs.

    friend bool operator==(const TerminalUpdate&, const TerminalUpdate&) = default;
};

/**
 * @brief Error not attributable to a job ID.
 *
 * Keyed by the original request identity, usually the item URL.
 */
NAVA_MODULE_EXPORT struct EngineError {
    QString sourceKey;      //!< Request identity.
    QString message;        //!< Free-text error message.

    friend bool operator==(const EngineError&, const EngineError&) = default;
};

//!< @brief Tagged event delivered by the engine.
NAVA_MODULE_EXPORT using EngineEvent = std::variant<ProgressUpdate, TerminalUpdate, EngineError>;
