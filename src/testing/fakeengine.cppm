/*!
 * @file        fakeengine.cppm
 * @brief       Scriptable in-process download engine for tests.
 * @details     Answers start, cancel and metadata requests from the event
 *              loop after a configurable latency, records every call and
 *              lets tests push engine events directly.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/nava/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>

export module nava.testing.fakeengine;
export import nava.services.downloadengine;

export class FakeEngine : public DownloadEngine {
public:
    explicit FakeEngine(QObject* parent = nullptr);

    void startJob(const MediaItem& item, const OutputOptions& options, StartCallback done) override;
    void cancelJob(const QString& jobId, CancelCallback done) override;
    void fetchMetadata(const QString& url, MetadataCallback done) override;

    //!< @brief Push an event as if the engine produced it.
    void emitEvent(const EngineEvent& event) { emit jobEvent(event); }

    void setStartLatency(int ms) { m_startLatencyMs = ms; }
    void setCancelLatency(int ms) { m_cancelLatencyMs = ms; }

    //!< @brief Make start calls for this URL fail with the given error.
    void failStart(const QString& url, const QString& error) { m_startFailures.insert(url, error); }

    //!< @brief Make every cancel call fail with the given error.
    void failCancels(const QString& error) { m_cancelError = error; }

    //!< @brief Answer the next metadata lookup with a collection or an error.
    void setMetadata(const MediaCollection& collection, const QString& error = {});

    //!< @brief URLs passed to startJob(), in call order.
    QStringList startedUrls() const { return m_startedUrls; }

    //!< @brief Job IDs handed out, in answer order.
    QStringList assignedIds() const { return m_assignedIds; }

    //!< @brief Job IDs passed to cancelJob(), in call order.
    QStringList cancelledIds() const { return m_cancelledIds; }

    QString lastOutputKind() const { return m_lastKind; }
    int metadataRequests() const { return m_metadataRequests; }

    //!< @brief Start calls not yet answered.
    int outstanding() const { return m_outstanding; }

    //!< @brief Highest number of simultaneously unanswered start calls.
    int peakOutstanding() const { return m_peakOutstanding; }

private:
    int m_startLatencyMs = 0;
    int m_cancelLatencyMs = 0;
    QHash<QString, QString> m_startFailures;
    QString m_cancelError;
    MediaCollection m_metadata;
    QString m_metadataError;
    QStringList m_startedUrls;
    QStringList m_assignedIds;
    QStringList m_cancelledIds;
    QSet<QString> m_known;
    QString m_lastKind;
    int m_metadataRequests = 0;
    int m_outstanding = 0;
    int m_peakOutstanding = 0;
    int m_nextId = 1;
};
