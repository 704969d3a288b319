/*!
 * @file        settings.cppm
 * @brief       Start-up configuration for the engine and the orchestrator.
 * @details     Reads the "engine" and "orchestrator" groups of the
 *              application's QSettings store once at start-up. Values that
 *              are missing keep their built-in defaults; values out of range
 *              are clamped. Nothing is ever written back.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/nava/blob/main/LICENSE.md
 */

module;
#include <QSettings>
#include <QString>

#ifndef Q_MOC_RUN
export module nava.services.settings;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Options used to drive the yt-dlp process.
 */
NAVA_MODULE_EXPORT struct EngineSettings {

    //!< @brief Program name or absolute path of the engine binary.
    QString program = QStringLiteral("yt-dlp");

    //!< @brief User agent passed to the engine.
    QString userAgent = QStringLiteral("Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
                                       "(KHTML, like Gecko) Chrome/131.0.0.0 Safari/537.36");

    //!< @brief Referer passed to the engine.
    QString referer = QStringLiteral("https://www.youtube.com/");

    //!< @brief Extractor retry count.
    int extractorRetries = 3;

    //!< @brief Socket timeout in seconds.
    int socketTimeoutSec = 30;
};

/**
 * @brief Tunables of the orchestration core.
 */
NAVA_MODULE_EXPORT struct OrchestratorSettings {
    int maxConcurrent = 1;          //!< Concurrency budget (1 – 5).
    int pacingDelayMs = 500;        //!< Delay between start calls of a worker.
    int evictionDelayMs = 3000;     //!< Grace period of terminal jobs.
};

/**
 * @brief Loads application settings from QSettings.
 */
NAVA_MODULE_EXPORT class AppSettings {
public:
    //!< @brief Smallest accepted concurrency budget.
    static constexpr int kMinConcurrent = 1;

    //!< @brief Largest accepted concurrency budget.
    static constexpr int kMaxConcurrent = 5;

    /**
     * @brief Load from the application's default settings store.
     */
    void load();

    /**
     * @brief Load from an explicit settings store.
     * @param settings Store to read.
     */
    void load(QSettings& settings);

    const EngineSettings& engine() const { return m_engine; }
    const OrchestratorSettings& orchestrator() const { return m_orchestrator; }

    /**
     * @brief Clamp a concurrency budget to the accepted range.
     * @param value Requested budget.
     * @return Budget in [kMinConcurrent, kMaxConcurrent].
     */
    static int clampConcurrency(int value);

private:
    EngineSettings m_engine;                //!< Engine options.
    OrchestratorSettings m_orchestrator;    //!< Orchestrator options.
};
