module;
#include <QString>
#include <QStringList>

module nava.utils.error_utils;

namespace nava::utils {

ErrorCategory classifyError(const QString& message)
{
    const QString lower = message.toLower();
    for (const QString& phrase : botDetectionPhrases()) {
        if (lower.contains(phrase)) return ErrorCategory::BotDetection;
    }
    return ErrorCategory::Generic;
}

QStringList botDetectionPhrases()
{
    return { "bot", "sign in to confirm" };
}

QString notificationText(ErrorCategory category, const QString& message)
{
    switch (category) {
    case ErrorCategory::BotDetection:
        return QStringLiteral("YouTube bot detected. Try updating yt-dlp.");
    case ErrorCategory::Generic:
        break;
    }
    return QStringLiteral("Download failed: %1").arg(message);
}

QString notificationKind(ErrorCategory category)
{
    return category == ErrorCategory::BotDetection ? QStringLiteral("warning") : QStringLiteral("danger");
}

} // namespace nava::utils
