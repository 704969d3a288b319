module;
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStandardPaths>
#include <QStringList>
#include <QUrl>
#include <QtGlobal>

module nava.utils.download_utils;

namespace nava::utils {

QString normalizeFilePath(const QString& path)
{
    QString out = path.trimmed();
    if (out.startsWith("file://")) {
        QUrl url(out);
        if (url.isValid() && url.isLocalFile()) {
            out = url.toLocalFile();
        }
    }
    if (out.isEmpty()) return out;
    return QDir::cleanPath(out);
}

bool isValidVideoUrl(const QString& url)
{
    if (!url.startsWith("http://") && !url.startsWith("https://")) {
        return false;
    }
    static const QRegularExpression re(
        QStringLiteral("^(https?://)?(www\\.)?(youtube\\.com/watch\\?v=[\\w-]+|youtu\\.be/[\\w-]+)"));
    return re.match(url).hasMatch();
}

bool isPlaylistUrl(const QString& url)
{
    return url.contains(QStringLiteral("playlist")) || url.contains(QStringLiteral("list="));
}

bool parseProgressLine(const QString& line, double* percent)
{
    if (!line.contains(QStringLiteral("[download]")) || !line.contains('%')) {
        return false;
    }
    static const QRegularExpression re(QStringLiteral("\\[download\\]\\s*(\\d+(?:\\.\\d+)?)%"));
    const QRegularExpressionMatch match = re.match(line);
    if (!match.hasMatch()) return false;

    bool ok = false;
    const double value = match.captured(1).toDouble(&ok);
    if (!ok) return false;
    if (percent) *percent = value;
    return true;
}

bool isPostProcessingLine(const QString& line)
{
    const QString trimmed = line.trimmed();
    return trimmed.startsWith(QStringLiteral("[Merger]"))
        || trimmed.startsWith(QStringLiteral("[ExtractAudio]"))
        || trimmed.startsWith(QStringLiteral("[VideoConvertor]"))
        || trimmed.startsWith(QStringLiteral("[VideoRemuxer]"))
        || trimmed.startsWith(QStringLiteral("[FixupM3u8]"));
}

QString formatSelector(const QString& kind, const QString& quality)
{
    if (kind == "audio") return QStringLiteral("bestaudio/best");

    if (quality == "4k") return QStringLiteral("best[height<=?2160][ext=mp4]/best[ext=mp4]/best");
    if (quality == "1080p") return QStringLiteral("best[height<=?1080][ext=mp4]/best[ext=mp4]/best");
    if (quality == "720p") return QStringLiteral("best[height<=?720][ext=mp4]/best[ext=mp4]/best");
    if (quality == "480p") return QStringLiteral("best[height<=?480][ext=mp4]/best[ext=mp4]/best");
    return QStringLiteral("best[ext=mp4]/best");
}

bool isPartialArtifact(const QString& fileName, const QString& title)
{
    if (title.isEmpty() || !fileName.startsWith(title)) return false;
    return fileName.endsWith(QStringLiteral(".part"))
        || fileName.endsWith(QStringLiteral(".temp"))
        || fileName.contains(QStringLiteral(".ytdl"));
}

QString truncateMessage(const QString& text, int limit)
{
    if (limit < 0 || text.size() <= limit) return text;
    return text.left(limit) + QStringLiteral("... (truncated)");
}

namespace {

// Canonical form of the nearest existing ancestor with the missing tail appended.
QString resolvedPath(const QString& path)
{
    const QString absolute = QDir::cleanPath(QDir(normalizeFilePath(path)).absolutePath());
    QString current = absolute;
    QStringList missing;
    while (!current.isEmpty()) {
        const QString canonical = QFileInfo(current).canonicalFilePath();
        if (!canonical.isEmpty()) {
            if (missing.isEmpty()) return canonical;
            return QDir::cleanPath(canonical + '/' + missing.join('/'));
        }
        const qsizetype slash = current.lastIndexOf('/');
        if (slash < 0 || current == QStringLiteral("/")) break;
        missing.prepend(current.mid(slash + 1));
        current = slash == 0 ? QStringLiteral("/") : current.left(slash);
    }
    return absolute;
}

} // namespace

bool isWithinRoots(const QString& path, const QStringList& roots)
{
    if (path.trimmed().isEmpty()) return false;
    const QString candidate = resolvedPath(path);
    if (candidate.isEmpty()) return false;

    for (const QString& root : roots) {
        if (root.trimmed().isEmpty()) continue;
        const QString base = resolvedPath(root);
        if (candidate == base) return true;
        const QString prefix = base.endsWith('/') ? base : base + '/';
        if (candidate.startsWith(prefix)) return true;
    }
    return false;
}

QString defaultDownloadFolder()
{
    const QString downloads = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (!downloads.isEmpty()) return downloads;
    return QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
}

} // namespace nava::utils
