#include <utility>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QHash>
#include <QList>
#include <QLoggingCategory>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QtGlobal>

import nava.core.jobtypes;
import nava.core.downloadmanager;
import nava.core.joblistmodel;
import nava.services.settings;
import nava.services.ytdlpengine;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

namespace {

// Parses a 1-based, comma-separated list such as "1,3,4" into 0-based indices.
bool parseItemList(const QString& text, int count, QList<int>* out)
{
    const QStringList parts = text.split(QLatin1Char(','), Qt::SkipEmptyParts);
    if (parts.isEmpty()) return false;
    for (const QString& part : parts) {
        bool ok = false;
        const int value = part.trimmed().toInt(&ok);
        if (!ok || value < 1 || value > count) return false;
        if (!out->contains(value - 1)) out->append(value - 1);
    }
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("Nava"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));
    qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type}: %{message}"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Download a video or a playlist with yt-dlp."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("url"), QStringLiteral("Video or playlist URL."));

    const QCommandLineOption outputOption({ QStringLiteral("o"), QStringLiteral("output") },
                                          QStringLiteral("Output directory."), QStringLiteral("dir"));
    const QCommandLineOption audioOption({ QStringLiteral("a"), QStringLiteral("audio") },
                                         QStringLiteral("Download audio only."));
    const QCommandLineOption qualityOption({ QStringLiteral("q"), QStringLiteral("quality") },
                                           QStringLiteral("Video quality: 4k, 1080p, 720p, 480p or best."),
                                           QStringLiteral("quality"), QStringLiteral("1080p"));
    const QCommandLineOption concurrencyOption({ QStringLiteral("c"), QStringLiteral("concurrency") },
                                               QStringLiteral("Concurrent downloads (1-5)."), QStringLiteral("n"));
    const QCommandLineOption itemsOption({ QStringLiteral("i"), QStringLiteral("items") },
                                         QStringLiteral("Comma-separated 1-based item numbers to download."),
                                         QStringLiteral("list"));
    const QCommandLineOption listOption(QStringLiteral("list"), QStringLiteral("List the fetched items and exit."));
    const QCommandLineOption verboseOption(QStringLiteral("verbose"), QStringLiteral("Print debug output."));
    parser.addOptions({ outputOption, audioOption, qualityOption, concurrencyOption, itemsOption, listOption, verboseOption });
    parser.process(app);

    QLoggingCategory::setFilterRules(parser.isSet(verboseOption)
                                     ? QStringLiteral("default.debug=true")
                                     : QStringLiteral("default.debug=false"));

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(1);
    }
    const QString url = positional.first();

    AppSettings settings;
    settings.load();

    YtDlpEngine engine(settings.engine());
    if (!engine.isAvailable()) {
        qCritical() << "yt-dlp is not installed or not runnable:" << settings.engine().program;
        return 1;
    }

    DownloadManager manager(&engine);
    manager.applySettings(settings.orchestrator());
    if (parser.isSet(concurrencyOption)) {
        bool ok = false;
        const int value = parser.value(concurrencyOption).toInt(&ok);
        if (!ok) {
            qCritical() << "Invalid concurrency:" << parser.value(concurrencyOption);
            return 2;
        }
        manager.setMaxConcurrent(value);
    }
    if (parser.isSet(outputOption)) manager.setOutputPath(parser.value(outputOption));
    manager.setKind(parser.isSet(audioOption) ? QStringLiteral("audio") : QStringLiteral("video"));
    manager.setQuality(parser.value(qualityOption));

    QObject::connect(&manager, &DownloadManager::toastRequested, &app, [](const QString& message, const QString& kind) {
        if (kind == QStringLiteral("danger") || kind == QStringLiteral("warning"))
            qWarning().noquote() << message;
        else
            qInfo().noquote() << message;
    });

    QHash<QString, QString> lastStatus;
    QObject::connect(&manager, &DownloadManager::jobsChanged, &app, [&manager, &lastStatus]() {
        for (const Job& job : manager.activeJobs()) {
            const QString text = JobListModel::statusText(job);
            const QString line = job.status == JobStatus::Downloading
                ? QStringLiteral("%1: %2%").arg(job.title).arg(job.progress, 0, 'f', 1)
                : QStringLiteral("%1: %2").arg(job.title, text);
            if (lastStatus.value(job.id) == line) continue;
            lastStatus.insert(job.id, line);
            qInfo().noquote() << line;
        }
    });

    bool dispatchDone = false;
    int failures = 0;
    auto finishIfIdle = [&]() {
        if (dispatchDone && manager.activeCount() == 0 && manager.pendingCancels() == 0) {
            QCoreApplication::exit(failures > 0 ? 1 : 0);
        }
    };

    QObject::connect(&manager, &DownloadManager::jobFinished, &app, [&failures](const QString&, bool success, const QString&) {
        if (!success) ++failures;
    });
    QObject::connect(&manager, &DownloadManager::dispatchFinished, &app, [&](int started, int failed) {
        failures += failed;
        qInfo().noquote() << QStringLiteral("%1 download(s) started, %2 failed to start").arg(started).arg(failed);
        dispatchDone = true;
        finishIfIdle();
    });
    QObject::connect(&manager, &DownloadManager::jobsChanged, &app, finishIfIdle);
    QObject::connect(&manager, &DownloadManager::fetchFailed, &app, [](const QString&) {
        QCoreApplication::exit(1);
    });

    QObject::connect(&manager, &DownloadManager::collectionChanged, &app, [&]() {
        const MediaCollection& collection = manager.collection();
        if (parser.isSet(listOption)) {
            qInfo().noquote() << collection.title;
            for (int i = 0; i < collection.items.size(); ++i) {
                const MediaItem& item = collection.items.at(i);
                qInfo().noquote() << QStringLiteral("%1. %2 %3").arg(i + 1).arg(item.title, item.duration);
            }
            QCoreApplication::exit(0);
            return;
        }

        if (parser.isSet(itemsOption)) {
            QList<int> indices;
            if (!parseItemList(parser.value(itemsOption), collection.items.size(), &indices)) {
                qCritical() << "Invalid item list:" << parser.value(itemsOption);
                QCoreApplication::exit(2);
                return;
            }
            manager.deselectAll();
            for (int index : std::as_const(indices)) manager.toggleSelection(index);
        }

        if (!manager.dispatchSelected()) QCoreApplication::exit(1);
    });

    QTimer::singleShot(0, &app, [&manager, url]() {
        if (!manager.fetchMetadata(url)) QCoreApplication::exit(1);
    });

    return app.exec();
}
