/*!
 * @file        error_utils.cppm
 * @brief       Engine error classification helpers.
 * @details     Maps free-text error messages reported by the download engine
 *              to a small set of categories so that the UI can raise a more
 *              actionable notification when the remote site blocks automated
 *              access.
 *
 *              Classification is best effort. A message that is not
 *              recognised falls back to the generic category.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/nava/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module nava.utils.error_utils;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

NAVA_MODULE_EXPORT namespace nava::utils {

/**
 * @brief Categories of engine errors surfaced to the user.
 */
enum class ErrorCategory {
    Generic,        //!< Any failure without a more specific handling.
    BotDetection    //!< The site asked to confirm the client is not a bot.
};

/**
 * @brief Classifies an engine error message.
 *
 * Performs a case-insensitive substring match against the phrases returned
 * by botDetectionPhrases().
 *
 * @param message Free-text error message.
 * @return Detected category.
 */
ErrorCategory classifyError(const QString& message);

//!< @brief Phrases that identify anti-automation responses.
QStringList botDetectionPhrases();

/**
 * @brief Builds the user notification text for a classified error.
 * @param category Error category.
 * @param message Original message, used by the generic category.
 * @return Notification text.
 */
QString notificationText(ErrorCategory category, const QString& message);

/**
 * @brief Returns the toast kind used for a category.
 * @param category Error category.
 * @return "warning" for bot detection, "danger" otherwise.
 */
QString notificationKind(ErrorCategory category);

} // namespace nava::utils
