module;
#include <QCoreApplication>
#include <QDebug>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

module nava.core.downloadmanager;

import nava.utils.download_utils;

namespace utils = nava::utils;

DownloadManager::DownloadManager(DownloadEngine* engine, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_reconciler(m_registry, m_tombstones)
    , m_dispatcher(engine)
{
    m_options.outputPath = utils::defaultDownloadFolder();

    if (m_engine) {
        connect(m_engine, &DownloadEngine::jobEvent, this, [this](const EngineEvent& event) {
            m_reconciler.apply(event);
        });
    }

    connect(&m_reconciler, &EventReconciler::activeJobsChanged, this, [this](const QVector<Job>& jobs) {
        m_model.sync(jobs);
        emit jobsChanged();
    });
    connect(&m_reconciler, &EventReconciler::jobFinished, this, &DownloadManager::onJobFinished);
    connect(&m_reconciler, &EventReconciler::engineError, this, &DownloadManager::onEngineError);

    connect(&m_dispatcher, &BatchDispatcher::jobStarted, this, &DownloadManager::onJobStarted);
    connect(&m_dispatcher, &BatchDispatcher::startFailed, this, &DownloadManager::onStartFailed);
    connect(&m_dispatcher, &BatchDispatcher::batchFinished, this, &DownloadManager::onBatchFinished);
    connect(&m_dispatcher, &BatchDispatcher::dispatchingChanged, this, &DownloadManager::dispatchingChanged);

    if (auto* app = QCoreApplication::instance()) {
        connect(app, &QCoreApplication::aboutToQuit, this, &DownloadManager::cancelAll);
    }
}

void DownloadManager::applySettings(const OrchestratorSettings& settings)
{
    setMaxConcurrent(settings.maxConcurrent);
    m_dispatcher.setPacingDelay(settings.pacingDelayMs);
    m_reconciler.setEvictionDelay(settings.evictionDelayMs);
}

bool DownloadManager::fetchMetadata(const QString& url)
{
    const QString trimmed = url.trimmed();
    if (trimmed.isEmpty()) {
        emit toastRequested(QStringLiteral("Please enter a URL first"), QStringLiteral("danger"));
        return false;
    }
    if (!m_engine) {
        emit toastRequested(QStringLiteral("yt-dlp is not installed"), QStringLiteral("danger"));
        return false;
    }
    if (m_fetching) {
        qWarning() << "DownloadManager: metadata lookup already running, ignoring" << trimmed;
        return false;
    }

    setFetching(true);
    QPointer<DownloadManager> self(this);
    m_engine->fetchMetadata(trimmed, [self](const MediaCollection& collection, const QString& error) {
        if (!self) return;
        self->setFetching(false);

        if (!error.isEmpty()) {
            qWarning() << "DownloadManager: metadata lookup failed:" << error;
            const auto category = utils::classifyError(error);
            if (category == utils::ErrorCategory::BotDetection) {
                emit self->toastRequested(utils::notificationText(category, error), utils::notificationKind(category));
            } else {
                emit self->toastRequested(QStringLiteral("Failed to fetch metadata: %1").arg(error), QStringLiteral("danger"));
            }
            emit self->fetchFailed(error);
            return;
        }

        self->setCollection(collection);
        emit self->toastRequested(QStringLiteral("Found %1 video(s)").arg(collection.items.size()), QStringLiteral("success"));
    });
    return true;
}

void DownloadManager::setCollection(const MediaCollection& collection)
{
    m_collection = collection;
    m_selection.reset(m_collection.items.size());
    emit collectionChanged();
    emit selectionChanged();
}

bool DownloadManager::toggleSelection(int index)
{
    if (!m_selection.toggle(index)) return false;
    emit selectionChanged();
    return true;
}

void DownloadManager::selectAll()
{
    m_selection.selectAll();
    emit selectionChanged();
}

void DownloadManager::deselectAll()
{
    m_selection.deselectAll();
    emit selectionChanged();
}

void DownloadManager::toggleSelectAll()
{
    if (m_selection.isAllSelected())
        deselectAll();
    else
        selectAll();
}

bool DownloadManager::dispatchSelected()
{
    if (!m_engine || m_collection.items.isEmpty()) {
        emit toastRequested(QStringLiteral("Cannot start download"), QStringLiteral("danger"));
        return false;
    }
    if (m_selection.count() == 0) {
        emit toastRequested(QStringLiteral("No videos selected for download"), QStringLiteral("danger"));
        return false;
    }

    QVector<MediaItem> items;
    for (int index : m_selection.selectedIndices()) {
        items.append(m_collection.items.at(index));
    }
    return dispatch(items, m_maxConcurrent);
}

bool DownloadManager::dispatch(const QVector<MediaItem>& items, int budget)
{
    if (items.isEmpty()) return false;

    const int clamped = AppSettings::clampConcurrency(budget);
    if (items.size() > 1) {
        emit toastRequested(QStringLiteral("Starting %1 videos (max %2 concurrent)").arg(items.size()).arg(clamped),
                            QStringLiteral("info"));
    }
    return m_dispatcher.dispatchBatch(items, m_options, clamped);
}

bool DownloadManager::cancel(const QString& jobId)
{
    if (jobId.isEmpty() || m_tombstones.contains(jobId)) return false;

    // Tombstone first: any event already queued for this ID is dropped from here on.
    m_tombstones.insert(jobId);
    m_reconciler.reconcile();

    if (!m_engine) {
        m_reconciler.removeJob(jobId);
        emit toastRequested(QStringLiteral("Failed to cancel download: %1").arg(QStringLiteral("Download engine unavailable")),
                            QStringLiteral("danger"));
        return true;
    }

    ++m_pendingCancels;
    QPointer<DownloadManager> self(this);
    m_engine->cancelJob(jobId, [self, jobId](bool ok, const QString& error) {
        if (!self) return;
        --self->m_pendingCancels;
        self->m_reconciler.removeJob(jobId);
        if (ok) {
            qDebug() << "DownloadManager: cancelled" << jobId;
            emit self->toastRequested(QStringLiteral("Download cancelled"), QStringLiteral("info"));
        } else {
            qWarning() << "DownloadManager: cancel failed for" << jobId << error;
            emit self->toastRequested(QStringLiteral("Failed to cancel download: %1").arg(error), QStringLiteral("danger"));
        }
    });
    return true;
}

void DownloadManager::cancelAll()
{
    const QStringList ids = m_registry.ids();
    if (ids.isEmpty()) return;
    m_tombstones.insertAll(ids);

    if (m_engine) {
        for (const QString& id : ids) {
            m_engine->cancelJob(id, [id](bool ok, const QString& error) {
                if (!ok) qWarning() << "DownloadManager: failed to cancel download" << id << error;
            });
        }
    }

    m_reconciler.clearJobs();
    qDebug() << "DownloadManager: cancelled" << ids.size() << "download(s)";
    emit toastRequested(QStringLiteral("All downloads cancelled"), QStringLiteral("info"));
}

void DownloadManager::setMaxConcurrent(int value)
{
    const int clamped = AppSettings::clampConcurrency(value);
    if (m_maxConcurrent == clamped) return;
    m_maxConcurrent = clamped;
    emit maxConcurrentChanged();
}

void DownloadManager::setKind(const QString& kind)
{
    const QString next = kind == QStringLiteral("audio") ? kind : QStringLiteral("video");
    if (m_options.kind == next) return;
    m_options.kind = next;
    emit outputOptionsChanged();
}

void DownloadManager::setQuality(const QString& quality)
{
    if (m_options.videoQuality == quality) return;
    m_options.videoQuality = quality;
    emit outputOptionsChanged();
}

void DownloadManager::setOutputPath(const QString& path)
{
    const QString normalized = utils::normalizeFilePath(path);
    if (m_options.outputPath == normalized) return;
    m_options.outputPath = normalized;
    emit outputOptionsChanged();
}

void DownloadManager::onJobStarted(const QString& jobId, const MediaItem& item, const QString& kind, int batchSize)
{
    if (!m_reconciler.registerStarted(jobId, item.title, kind)) return;
    if (batchSize == 1) {
        emit toastRequested(QStringLiteral("Started downloading: %1").arg(item.title), QStringLiteral("info"));
    }
}

void DownloadManager::onStartFailed(const MediaItem& item, const QString& error, int batchSize)
{
    if (batchSize == 1) {
        emit toastRequested(QStringLiteral("Failed to start download: %1").arg(error), QStringLiteral("danger"));
        return;
    }
    m_reconciler.onError(item.url, error);
}

void DownloadManager::onJobFinished(const QString& jobId, bool success, const QString& title, const QString& error)
{
    if (success) {
        emit toastRequested(QStringLiteral("Download finished: %1").arg(title), QStringLiteral("success"));
    } else {
        const auto category = utils::classifyError(error);
        if (category == utils::ErrorCategory::BotDetection)
            emit toastRequested(utils::notificationText(category, error), utils::notificationKind(category));
        else
            emit toastRequested(QStringLiteral("Download failed: %1").arg(title), QStringLiteral("danger"));
    }
    emit jobFinished(jobId, success, title);
}

void DownloadManager::onEngineError(const QString& sourceKey, const QString& message, utils::ErrorCategory category)
{
    Q_UNUSED(sourceKey)
    emit toastRequested(utils::notificationText(category, message), utils::notificationKind(category));
}

void DownloadManager::onBatchFinished(int started, int failed)
{
    const int total = started + failed;
    if (total > 1) {
        emit toastRequested(QStringLiteral("All %1 selected downloads initiated!").arg(total), QStringLiteral("success"));
    }
    emit dispatchFinished(started, failed);
}

void DownloadManager::setFetching(bool fetching)
{
    if (m_fetching == fetching) return;
    m_fetching = fetching;
    emit fetchingChanged();
}
