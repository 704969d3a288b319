/*!
 * @file        ytdlpengine.cppm
 * @brief       Download engine backed by the yt-dlp command-line program.
 * @details     Runs one yt-dlp process per job, validates every request
 *              before anything is spawned, and resolves video and playlist
 *              URLs into media collections with `--dump-json`.
 *
 *              Output directories are restricted to the user's Downloads
 *              folder and the application data folder.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/nava/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module nava.services.ytdlpengine;
import nava.core.jobtypes;
import nava.services.downloadengine;
import nava.services.enginejob;
import nava.services.settings;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief yt-dlp implementation of DownloadEngine.
 */
NAVA_MODULE_EXPORT class YtDlpEngine : public DownloadEngine {

    Q_OBJECT

public:
    /**
     * @brief Construct an engine.
     * @param settings Program and request options.
     * @param parent Optional parent QObject.
     */
    explicit YtDlpEngine(const EngineSettings& settings, QObject* parent = nullptr);
    ~YtDlpEngine() override;

    void startJob(const MediaItem& item, const OutputOptions& options, StartCallback done) override;
    void cancelJob(const QString& jobId, CancelCallback done) override;
    void fetchMetadata(const QString& url, MetadataCallback done) override;

    /**
     * @brief Check that the engine program runs.
     * @param timeoutMs Maximum time to wait for `--version`.
     * @return True if the program exited successfully.
     */
    bool isAvailable(int timeoutMs = 5000) const;

    //!< @brief Directories output paths must resolve into.
    QStringList allowedRoots() const { return m_allowedRoots; }
    void setAllowedRoots(const QStringList& roots) { m_allowedRoots = roots; }

    /**
     * @brief Validate an output directory.
     * @param path Requested directory; empty selects the default download folder.
     * @param error Receives the reason on failure.
     * @return Absolute directory, or an empty string on failure.
     */
    QString validateOutputPath(const QString& path, QString* error) const;

    /**
     * @brief Build the arguments of a download process.
     * @param item Item to download.
     * @param options Output preferences.
     * @param outputDir Validated output directory.
     * @return Argument list, ending with the item URL.
     */
    QStringList downloadArguments(const MediaItem& item, const OutputOptions& options, const QString& outputDir) const;

    /**
     * @brief Build the arguments of a metadata lookup.
     * @param url Video or playlist URL.
     * @return Argument list, ending with the URL.
     */
    QStringList metadataArguments(const QString& url) const;

    /**
     * @brief Build a collection from `--flat-playlist --dump-json` output.
     * @param output One JSON object per line.
     * @return Collection titled after the number of videos.
     */
    static MediaCollection parsePlaylistOutput(const QByteArray& output);

    /**
     * @brief Build a one-item collection from `--dump-json` output.
     * @param output Single JSON object.
     * @param url URL the item is downloaded from.
     * @param collection Receives the parsed collection.
     * @return False if the output is not a JSON object.
     */
    static bool parseVideoOutput(const QByteArray& output, const QString& url, MediaCollection* collection);

    //!< @brief Number of jobs with a live process.
    int runningJobs() const { return m_jobs.size(); }

private:
    QStringList commonArguments() const;

    EngineSettings m_settings;                      //!< Program and request options.
    QStringList m_allowedRoots;                     //!< Permitted output roots.
    QHash<QString, QPointer<EngineJob>> m_jobs;     //!< Running jobs by ID.
};

#include "ytdlpengine.moc"
