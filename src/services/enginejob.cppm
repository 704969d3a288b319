/*!
 * @file        enginejob.cppm
 * @brief       One yt-dlp process and the events it produces.
 * @details     Wraps a single QProcess running yt-dlp with `--newline`,
 *              turning its line-oriented stdout into progress updates and
 *              its exit status into a terminal update. stderr is collected
 *              and reported as the failure message.
 *
 *              A job is owned by the engine that spawned it and deletes
 *              itself through the engine once the process is gone.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/nava/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module nava.services.enginejob;
import nava.core.jobtypes;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief A single running yt-dlp download.
 */
NAVA_MODULE_EXPORT class EngineJob : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct a job that is not yet running.
     * @param id Job identifier.
     * @param item Item to download.
     * @param kind Output kind.
     * @param outputDir Directory the process writes into.
     * @param parent Optional parent QObject.
     */
    EngineJob(const QString& id, const MediaItem& item, const QString& kind,
              const QString& outputDir, QObject* parent = nullptr);
    ~EngineJob() override;

    /**
     * @brief Spawn the process.
     *
     * Exactly one of started() or startFailed() follows.
     *
     * @param program Engine program.
     * @param arguments Command-line arguments.
     */
    void start(const QString& program, const QStringList& arguments);

    /**
     * @brief Kill the process, report cancellation and remove partial files.
     *
     * The cancelled update is emitted immediately. Partial files are removed
     * and finished() is emitted once the process has exited, without
     * blocking the event loop. No further progress or terminal update is
     * emitted afterwards.
     */
    void cancel();

    /**
     * @brief Interpret one line of process output.
     * @param line Output line without the line terminator.
     */
    void handleOutputLine(const QString& line);

    /**
     * @brief Report the end of the process.
     * @param exitCode Process exit code.
     * @param crashed True if the process did not exit normally.
     */
    void handleExit(int exitCode, bool crashed = false);

    /**
     * @brief Remove the process' temporary files from the output directory.
     * @return Number of removed files.
     */
    int removePartialFiles() const;

    //!< @brief Append diagnostic output used as the failure message.
    void appendErrorOutput(const QByteArray& data);

    //!< @brief Bytes of diagnostic output kept so far.
    qsizetype errorOutputSize() const { return m_stderr.size(); }

    QString id() const { return m_id; }
    QString title() const { return m_item.title; }
    QString kind() const { return m_kind; }
    QString outputDir() const { return m_outputDir; }
    bool isCancelled() const { return m_cancelled; }
    bool isFinished() const { return m_finished; }

signals:
    //!< @brief The process was spawned.
    void started();

    /**
     * @brief The process could not be spawned.
     * @param error Reason reported by QProcess.
     */
    void startFailed(const QString& error);

    /**
     * @brief Progress or terminal report for this job.
     * @param event Engine event.
     */
    void jobEvent(const EngineEvent& event);

    //!< @brief The job is over and may be released.
    void finished();

private slots:
    void onReadyReadStandardOutput();
    void onReadyReadStandardError();
    void onProcessFinished(int exitCode, QProcess::ExitStatus status);
    void onProcessError(QProcess::ProcessError error);

private:
    void emitProgress(JobStatus status, double progress);
    void finishCancel();

    QString m_id;                   //!< Job identifier.
    MediaItem m_item;               //!< Item being downloaded.
    QString m_kind;                 //!< Output kind.
    QString m_outputDir;            //!< Output directory.
    QProcess* m_process = nullptr;  //!< Owned process.
    QByteArray m_stdoutBuffer;      //!< Incomplete stdout line.
    QByteArray m_stderr;            //!< Collected stderr.
    double m_progress = 0.0;        //!< Last reported percentage.
    bool m_converting = false;      //!< Post-processing observed.
    bool m_spawned = false;         //!< started() was emitted.
    bool m_cancelled = false;       //!< cancel() was called.
    bool m_finished = false;        //!< Terminal state reached.
    bool m_cleanedUp = false;       //!< Cancellation cleanup done.
};

#include "enginejob.moc"
