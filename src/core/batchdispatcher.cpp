module;
#include <QDebug>
#include <QObject>
#include <QPointer>
#include <QSharedPointer>
#include <QString>
#include <QTimer>
#include <QVector>
#include <QtGlobal>

module nava.core.batchdispatcher;

BatchDispatcher::BatchDispatcher(DownloadEngine* engine, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
{
}

void BatchDispatcher::setPacingDelay(int ms)
{
    m_pacingDelayMs = qMax(0, ms);
}

bool BatchDispatcher::dispatchBatch(const QVector<MediaItem>& items, const OutputOptions& options, int budget)
{
    if (items.isEmpty()) return false;

    auto batch = QSharedPointer<Batch>::create();
    batch->items = items;
    batch->options = options;
    // A single item runs on one worker and finishes without any pacing wait.
    batch->workers = qMin(qMax(1, budget), int(items.size()));

    qDebug() << "BatchDispatcher: dispatching" << items.size() << "item(s) with"
             << batch->workers << "worker(s)";

    if (m_activeBatches++ == 0) emit dispatchingChanged();

    const int workers = batch->workers;
    for (int i = 0; i < workers; ++i) {
        pullNext(batch);
    }
    return true;
}

void BatchDispatcher::pullNext(const QSharedPointer<Batch>& batch)
{
    if (batch->cursor >= batch->items.size()) {
        finishWorker(batch);
        return;
    }

    const MediaItem item = batch->items.at(batch->cursor++);
    if (!m_engine) {
        settle(batch, item, QString(), QStringLiteral("Download engine unavailable"));
        return;
    }

    ++m_outstanding;
    QPointer<BatchDispatcher> self(this);
    m_engine->startJob(item, batch->options, [self, batch, item](const QString& jobId, const QString& error) {
        if (!self) return;
        --self->m_outstanding;
        self->settle(batch, item, jobId, error);
    });
}

void BatchDispatcher::settle(const QSharedPointer<Batch>& batch, const MediaItem& item,
                             const QString& jobId, const QString& error)
{
    if (error.isEmpty() && !jobId.isEmpty()) {
        ++batch->started;
        emit jobStarted(jobId, item, batch->options.kind, int(batch->items.size()));
    } else {
        ++batch->failed;
        const QString reason = error.isEmpty() ? QStringLiteral("No job identifier returned") : error;
        qWarning() << "BatchDispatcher: failed to start" << item.url << reason;
        emit startFailed(item, reason, int(batch->items.size()));
    }

    if (batch->cursor >= batch->items.size()) {
        finishWorker(batch);
        return;
    }

    QPointer<BatchDispatcher> self(this);
    QTimer::singleShot(m_pacingDelayMs, Qt::PreciseTimer, this, [self, batch]() {
        if (self) self->pullNext(batch);
    });
}

void BatchDispatcher::finishWorker(const QSharedPointer<Batch>& batch)
{
    if (--batch->workers > 0) return;

    qDebug() << "BatchDispatcher: batch settled," << batch->started << "started,"
             << batch->failed << "failed";
    --m_activeBatches;
    emit batchFinished(batch->started, batch->failed);
    if (m_activeBatches == 0) emit dispatchingChanged();
}
