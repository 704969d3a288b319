/*!
 * @file        download_utils.cppm
 * @brief       Common utility helpers for media URLs, engine output and paths.
 * @details     Provides a collection of small, reusable helper functions shared
 *              by the orchestration core and the yt-dlp engine adapter. These
 *              utilities handle URL validation, playlist detection, parsing of
 *              the engine's line-oriented progress output, format selection,
 *              partial artifact matching, and output path checks.
 *
 *              All helpers are side-effect free with the exception of
 *              defaultDownloadFolder(), which only queries the environment.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/nava/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QStringList>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module nava.utils.download_utils;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

NAVA_MODULE_EXPORT namespace nava::utils {

/**
 * @brief Normalizes a local filesystem path or file URL.
 *
 * Converts file URLs to local paths and strips trailing separators so that
 * directory comparisons are stable.
 *
 * @param path Local path or file:// URL.
 * @return Normalized local filesystem path.
 */
QString normalizeFilePath(const QString& path);

/**
 * @brief Checks whether a URL names a single video or playlist the engine accepts.
 *
 * Only http(s) URLs of the form youtube.com/watch?v=ID or youtu.be/ID are
 * accepted. Anything else is rejected before a process is spawned.
 *
 * @param url Candidate URL.
 * @return true if the URL is accepted.
 */
bool isValidVideoUrl(const QString& url);

/**
 * @brief Checks whether a URL refers to a playlist-like collection.
 * @param url Candidate URL.
 * @return true if the URL contains a playlist marker.
 */
bool isPlaylistUrl(const QString& url);

/**
 * @brief Extracts the percentage from an engine progress line.
 *
 * Recognises lines such as `[download]  45.2% of 10.00MiB at 1.00MiB/s ETA 00:05`.
 *
 * @param line Raw output line.
 * @param percent Receives the parsed percentage on success.
 * @return true if the line is a progress line with a valid percentage.
 */
bool parseProgressLine(const QString& line, double* percent);

/**
 * @brief Checks whether an engine output line announces post-processing.
 *
 * Post-processing covers merging, audio extraction and remuxing steps that
 * run after the transfer has finished.
 *
 * @param line Raw output line.
 * @return true if the line belongs to a post-processor.
 */
bool isPostProcessingLine(const QString& line);

/**
 * @brief Builds the engine format selector for a download kind and quality.
 *
 * Video selectors only pick pre-merged files so that no external muxer is
 * required.
 *
 * @param kind "video" or "audio".
 * @param quality Quality label ("4k", "1080p", "720p", "480p"); anything else selects the best file.
 * @return Format selector string.
 */
QString formatSelector(const QString& kind, const QString& quality);

/**
 * @brief Checks whether a file is a temporary artifact of a download.
 *
 * The file must start with the download title and carry one of the engine's
 * temporary suffixes (`.part`, `.temp`, `.ytdl`).
 *
 * @param fileName File name (without directory).
 * @param title Download title used in the output template.
 * @return true if the file can be removed after a cancellation.
 */
bool isPartialArtifact(const QString& fileName, const QString& title);

/**
 * @brief Truncates a diagnostic message to a maximum length.
 * @param text Message text.
 * @param limit Maximum number of characters kept.
 * @return The message, suffixed with "... (truncated)" when shortened.
 */
QString truncateMessage(const QString& text, int limit = 500);

/**
 * @brief Checks whether a path lies inside one of the allowed roots.
 *
 * Both sides are made absolute and symlinks are resolved before
 * comparison. For a path that does not exist yet, the nearest existing
 * ancestor is resolved and the missing components are appended.
 *
 * @param path Candidate path.
 * @param roots Allowed root directories.
 * @return true if the path equals or is nested inside a root.
 */
bool isWithinRoots(const QString& path, const QStringList& roots);

//!< @brief Return the user's download folder, falling back to the application data folder.
QString defaultDownloadFolder();

} // namespace nava::utils
