module;
#include <utility>

#include <QByteArray>
#include <QDebug>
#include <QDir>
#include <QHash>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QObject>
#include <QPointer>
#include <QProcess>
#include <QSharedPointer>
#include <QStandardPaths>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <QtGlobal>

module nava.services.ytdlpengine;

import nava.utils.download_utils;

namespace utils = nava::utils;

namespace {

QString jsonString(const QJsonObject& obj, const QString& key, const QString& fallback = QString())
{
    const QJsonValue value = obj.value(key);
    if (value.isString()) return value.toString();
    return fallback;
}

QString durationText(const QJsonValue& value)
{
    if (value.isString()) return value.toString();
    if (!value.isDouble()) return QString();

    const int total = qMax(0, qRound(value.toDouble()));
    const int hours = total / 3600;
    const int minutes = (total % 3600) / 60;
    const int seconds = total % 60;
    if (hours > 0)
        return QStringLiteral("%1:%2:%3").arg(hours).arg(minutes, 2, 10, QLatin1Char('0')).arg(seconds, 2, 10, QLatin1Char('0'));
    return QStringLiteral("%1:%2").arg(minutes).arg(seconds, 2, 10, QLatin1Char('0'));
}

} // namespace

YtDlpEngine::YtDlpEngine(const EngineSettings& settings, QObject* parent)
    : DownloadEngine(parent)
    , m_settings(settings)
{
    const QString downloads = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    const QString appData = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (!downloads.isEmpty()) m_allowedRoots << downloads;
    if (!appData.isEmpty()) m_allowedRoots << appData;
}

YtDlpEngine::~YtDlpEngine()
{
    for (const auto& job : std::as_const(m_jobs)) {
        if (job) job->disconnect(this);
    }
    m_jobs.clear();
}

void YtDlpEngine::startJob(const MediaItem& item, const OutputOptions& options, StartCallback done)
{
    if (!utils::isValidVideoUrl(item.url)) {
        done(QString(), QStringLiteral("Invalid URL. Only YouTube URLs (youtube.com or youtu.be) are allowed."));
        return;
    }

    QString error;
    const QString outputDir = validateOutputPath(options.outputPath, &error);
    if (outputDir.isEmpty()) {
        done(QString(), error);
        return;
    }
    if (!QDir().mkpath(outputDir)) {
        done(QString(), QStringLiteral("Failed to create output directory: %1").arg(outputDir));
        return;
    }

    const QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    auto* job = new EngineJob(id, item, options.kind, outputDir, this);
    m_jobs.insert(id, job);

    connect(job, &EngineJob::jobEvent, this, &DownloadEngine::jobEvent);
    connect(job, &EngineJob::started, this, [this, id, item, kind = options.kind, done]() {
        qDebug() << "YtDlpEngine: started" << id << item.url;
        done(id, QString());

        ProgressUpdate update;
        update.id = id;
        update.status = JobStatus::Starting;
        update.progress = 0.0;
        update.title = item.title;
        update.kind = kind;
        emit jobEvent(update);
    });
    connect(job, &EngineJob::startFailed, this, [done](const QString& reason) {
        done(QString(), QStringLiteral("Failed to spawn download process: %1").arg(reason));
    });
    connect(job, &EngineJob::finished, this, [this, id, job]() {
        if (m_jobs.value(id) == job) m_jobs.remove(id);
        job->deleteLater();
    });

    job->start(m_settings.program, downloadArguments(item, options, outputDir));
}

void YtDlpEngine::cancelJob(const QString& jobId, CancelCallback done)
{
    QPointer<EngineJob> job = m_jobs.take(jobId);
    if (!job || job->isFinished()) {
        done(false, QStringLiteral("Download not found"));
        return;
    }

    qDebug() << "YtDlpEngine: cancelling" << jobId;
    job->cancel();
    done(true, QString());
}

void YtDlpEngine::fetchMetadata(const QString& url, MetadataCallback done)
{
    const bool playlist = utils::isPlaylistUrl(url);
    auto* proc = new QProcess(this);
    auto reported = QSharedPointer<bool>::create(false);

    connect(proc, &QProcess::finished, this, [proc, url, playlist, done, reported](int exitCode, QProcess::ExitStatus status) {
        proc->deleteLater();
        if (*reported) return;
        *reported = true;

        const QByteArray out = proc->readAllStandardOutput();
        if (status != QProcess::NormalExit || exitCode != 0) {
            const QString err = QString::fromUtf8(proc->readAllStandardError()).trimmed();
            done(MediaCollection(), playlist
                 ? QStringLiteral("Failed to fetch playlist: %1").arg(err)
                 : QStringLiteral("Failed to fetch video: %1").arg(err));
            return;
        }

        if (playlist) {
            done(parsePlaylistOutput(out), QString());
            return;
        }
        MediaCollection collection;
        if (!parseVideoOutput(out, url, &collection)) {
            qWarning() << "YtDlpEngine: unparsable metadata for" << url;
            done(MediaCollection(), QStringLiteral("Failed to parse video metadata"));
            return;
        }
        done(collection, QString());
    });
    connect(proc, &QProcess::errorOccurred, this, [proc, done, reported](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart || *reported) return;
        *reported = true;
        qWarning() << "YtDlpEngine: failed to run" << proc->program() << proc->errorString();
        done(MediaCollection(), QStringLiteral("Failed to execute yt-dlp: %1").arg(proc->errorString()));
        proc->deleteLater();
    });

    qDebug() << "YtDlpEngine: fetching metadata for" << url << (playlist ? "(playlist)" : "");
    proc->start(m_settings.program, metadataArguments(url));
}

bool YtDlpEngine::isAvailable(int timeoutMs) const
{
    QProcess proc;
    proc.start(m_settings.program, QStringList{ QStringLiteral("--version") });
    if (!proc.waitForStarted(timeoutMs)) return false;
    if (!proc.waitForFinished(timeoutMs)) {
        proc.kill();
        proc.waitForFinished(1000);
        return false;
    }
    return proc.exitStatus() == QProcess::NormalExit && proc.exitCode() == 0;
}

QString YtDlpEngine::validateOutputPath(const QString& path, QString* error) const
{
    QString requested = utils::normalizeFilePath(path);
    if (requested.isEmpty()) requested = utils::defaultDownloadFolder();

    const QString absolute = QDir::cleanPath(QDir(requested).absolutePath());
    if (!utils::isWithinRoots(absolute, m_allowedRoots)) {
        if (error) {
            *error = QStringLiteral("Path not allowed. Only Downloads and app data directories are permitted.\n"
                                    "Requested: %1\nAllowed: %2")
                         .arg(absolute, m_allowedRoots.join(QStringLiteral(" or ")));
        }
        return QString();
    }
    return absolute;
}

QStringList YtDlpEngine::commonArguments() const
{
    return {
        QStringLiteral("--user-agent"), m_settings.userAgent,
        QStringLiteral("--referer"), m_settings.referer,
        QStringLiteral("--extractor-retries"), QString::number(m_settings.extractorRetries),
        QStringLiteral("--no-cache-dir")
    };
}

QStringList YtDlpEngine::downloadArguments(const MediaItem& item, const OutputOptions& options, const QString& outputDir) const
{
    QStringList args = commonArguments();
    args << QStringLiteral("--socket-timeout") << QString::number(m_settings.socketTimeoutSec)
         << QStringLiteral("-f") << utils::formatSelector(options.kind, options.videoQuality)
         << QStringLiteral("-o") << outputDir + QStringLiteral("/%(title)s.%(ext)s")
         << QStringLiteral("--newline")
         << QStringLiteral("--no-playlist")
         << item.url;
    return args;
}

QStringList YtDlpEngine::metadataArguments(const QString& url) const
{
    QStringList args{ QStringLiteral("--dump-json") };
    if (utils::isPlaylistUrl(url)) args << QStringLiteral("--flat-playlist");
    args << commonArguments() << url;
    return args;
}

MediaCollection YtDlpEngine::parsePlaylistOutput(const QByteArray& output)
{
    MediaCollection collection;
    const QList<QByteArray> lines = output.split('\n');
    for (const QByteArray& line : lines) {
        if (line.trimmed().isEmpty()) continue;
        const QJsonDocument doc = QJsonDocument::fromJson(line);
        if (!doc.isObject()) continue;
        const QJsonObject obj = doc.object();

        MediaItem item;
        const QString id = jsonString(obj, QStringLiteral("id"));
        item.id = id.isEmpty() ? QStringLiteral("unknown") : id;
        item.title = jsonString(obj, QStringLiteral("title"), QStringLiteral("Unknown"));
        item.url = QStringLiteral("https://www.youtube.com/watch?v=%1").arg(id);
        item.duration = durationText(obj.value(QStringLiteral("duration")));
        item.thumbnail = jsonString(obj, QStringLiteral("thumbnail"));
        collection.items.append(item);
    }

    collection.title = collection.items.isEmpty()
        ? QStringLiteral("Empty Playlist")
        : QStringLiteral("Playlist with %1 videos").arg(collection.items.size());
    return collection;
}

bool YtDlpEngine::parseVideoOutput(const QByteArray& output, const QString& url, MediaCollection* collection)
{
    const QJsonDocument doc = QJsonDocument::fromJson(output.trimmed());
    if (!doc.isObject() || !collection) return false;
    const QJsonObject obj = doc.object();

    MediaItem item;
    item.id = jsonString(obj, QStringLiteral("id"), QStringLiteral("unknown"));
    item.title = jsonString(obj, QStringLiteral("title"), QStringLiteral("Unknown"));
    item.url = url;
    item.duration = durationText(obj.value(QStringLiteral("duration")));
    item.thumbnail = jsonString(obj, QStringLiteral("thumbnail"));

    collection->title = jsonString(obj, QStringLiteral("title"), QStringLiteral("Unknown Video"));
    collection->items = { item };
    return true;
}
