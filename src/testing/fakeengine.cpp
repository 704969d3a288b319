module;
#include <QObject>
#include <QString>
#include <QTimer>
#include <QtGlobal>

module nava.testing.fakeengine;

FakeEngine::FakeEngine(QObject* parent)
    : DownloadEngine(parent)
{
}

void FakeEngine::startJob(const MediaItem& item, const OutputOptions& options, StartCallback done)
{
    m_startedUrls.append(item.url);
    m_lastKind = options.kind;
    ++m_outstanding;
    m_peakOutstanding = qMax(m_peakOutstanding, m_outstanding);

    QTimer::singleShot(m_startLatencyMs, this, [this, item, done]() {
        --m_outstanding;
        const auto failure = m_startFailures.constFind(item.url);
        if (failure != m_startFailures.constEnd()) {
            done(QString(), failure.value());
            return;
        }
        const QString id = QStringLiteral("job-%1").arg(m_nextId++);
        m_assignedIds.append(id);
        m_known.insert(id);
        done(id, QString());
    });
}

void FakeEngine::cancelJob(const QString& jobId, CancelCallback done)
{
    m_cancelledIds.append(jobId);
    QTimer::singleShot(m_cancelLatencyMs, this, [this, jobId, done]() {
        if (!m_cancelError.isEmpty()) {
            done(false, m_cancelError);
            return;
        }
        if (!m_known.remove(jobId)) {
            done(false, QStringLiteral("Download not found"));
            return;
        }
        done(true, QString());
    });
}

void FakeEngine::setMetadata(const MediaCollection& collection, const QString& error)
{
    m_metadata = collection;
    m_metadataError = error;
}

void FakeEngine::fetchMetadata(const QString& url, MetadataCallback done)
{
    Q_UNUSED(url)
    ++m_metadataRequests;
    QTimer::singleShot(0, this, [this, done]() {
        done(m_metadataError.isEmpty() ? m_metadata : MediaCollection(), m_metadataError);
    });
}
