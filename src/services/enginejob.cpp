module;
#include <QByteArray>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>
#include <QTimer>

module nava.services.enginejob;

import nava.utils.download_utils;

namespace utils = nava::utils;

namespace {
constexpr int kKillWaitMs = 3000;
constexpr int kStderrLimit = 500;
// Enough UTF-8 bytes for more than kStderrLimit characters.
constexpr qsizetype kStderrBufferBytes = kStderrLimit * 4 + 4;
}

EngineJob::EngineJob(const QString& id, const MediaItem& item, const QString& kind,
                     const QString& outputDir, QObject* parent)
    : QObject(parent)
    , m_id(id)
    , m_item(item)
    , m_kind(kind)
    , m_outputDir(outputDir)
{
}

EngineJob::~EngineJob()
{
    if (m_process && m_process->state() != QProcess::NotRunning) {
        m_process->disconnect(this);
        m_process->kill();
        m_process->waitForFinished(kKillWaitMs);
    }
}

void EngineJob::start(const QString& program, const QStringList& arguments)
{
    if (m_process) return;

    m_process = new QProcess(this);
    m_process->setProgram(program);
    m_process->setArguments(arguments);
    m_process->setProcessChannelMode(QProcess::SeparateChannels);

    connect(m_process, &QProcess::started, this, [this]() {
        m_spawned = true;
        qDebug() << "EngineJob: spawned" << m_id << "pid" << m_process->processId();
        emit started();
    });
    connect(m_process, &QProcess::readyReadStandardOutput, this, &EngineJob::onReadyReadStandardOutput);
    connect(m_process, &QProcess::readyReadStandardError, this, &EngineJob::onReadyReadStandardError);
    connect(m_process, &QProcess::finished, this, &EngineJob::onProcessFinished);
    connect(m_process, &QProcess::errorOccurred, this, &EngineJob::onProcessError);

    m_process->start();
}

void EngineJob::cancel()
{
    if (m_finished) return;
    m_cancelled = true;
    m_finished = true;

    TerminalUpdate update;
    update.id = m_id;
    update.status = JobStatus::Cancelled;
    update.progress = 0.0;
    update.title = m_item.title;
    emit jobEvent(update);

    if (m_process) {
        m_process->disconnect(this);
        if (m_process->state() != QProcess::NotRunning) {
            connect(m_process, &QProcess::finished, this, &EngineJob::finishCancel);
            QTimer::singleShot(kKillWaitMs, this, &EngineJob::finishCancel);
            m_process->kill();
            return;
        }
    }
    finishCancel();
}

void EngineJob::finishCancel()
{
    if (m_cleanedUp) return;
    m_cleanedUp = true;

    if (m_process && m_process->state() != QProcess::NotRunning) {
        qWarning() << "EngineJob: process did not exit after kill" << m_id;
    }
    const int removed = removePartialFiles();
    qDebug() << "EngineJob: cancelled" << m_id << "removed" << removed << "partial file(s)";
    emit finished();
}

void EngineJob::appendErrorOutput(const QByteArray& data)
{
    const qsizetype room = kStderrBufferBytes - m_stderr.size();
    if (room <= 0) return;
    m_stderr.append(data.left(room));
}

void EngineJob::handleOutputLine(const QString& line)
{
    if (m_finished) return;

    if (utils::isPostProcessingLine(line)) {
        m_converting = true;
        emitProgress(JobStatus::Converting, m_progress);
        return;
    }

    double percent = 0.0;
    if (!utils::parseProgressLine(line, &percent)) return;

    m_progress = percent;
    if (percent >= 100.0)
        emitProgress(JobStatus::DownloadComplete, 100.0);
    else
        emitProgress(JobStatus::Downloading, percent);
}

void EngineJob::handleExit(int exitCode, bool crashed)
{
    if (m_finished) return;
    m_finished = true;

    TerminalUpdate update;
    update.id = m_id;
    update.title = m_item.title;

    if (!crashed && exitCode == 0) {
        update.status = JobStatus::Completed;
        update.progress = 100.0;
        qDebug() << "EngineJob: completed" << m_id;
    } else {
        update.status = JobStatus::Failed;
        update.progress = m_progress;
        const QString stderrText = QString::fromUtf8(m_stderr).trimmed();
        update.error = stderrText.isEmpty()
            ? QStringLiteral("Download failed with exit code %1 (no stderr output)").arg(exitCode)
            : utils::truncateMessage(stderrText, kStderrLimit);
        qWarning() << "EngineJob: failed" << m_id << "exit code" << exitCode;
    }
    emit jobEvent(update);
}

int EngineJob::removePartialFiles() const
{
    QDir dir(m_outputDir);
    if (m_outputDir.isEmpty() || !dir.exists()) return 0;

    int removed = 0;
    const QStringList entries = dir.entryList(QDir::Files | QDir::Hidden);
    for (const QString& name : entries) {
        if (!utils::isPartialArtifact(name, m_item.title)) continue;
        if (QFile::remove(dir.filePath(name))) {
            ++removed;
        } else {
            qWarning() << "EngineJob: failed to remove partial file" << dir.filePath(name);
        }
    }
    return removed;
}

void EngineJob::onReadyReadStandardOutput()
{
    m_stdoutBuffer.append(m_process->readAllStandardOutput());
    qsizetype newline = m_stdoutBuffer.indexOf('\n');
    while (newline >= 0) {
        const QByteArray raw = m_stdoutBuffer.left(newline);
        m_stdoutBuffer.remove(0, newline + 1);
        handleOutputLine(QString::fromUtf8(raw).trimmed());
        newline = m_stdoutBuffer.indexOf('\n');
    }
}

void EngineJob::onReadyReadStandardError()
{
    appendErrorOutput(m_process->readAllStandardError());
}

void EngineJob::onProcessFinished(int exitCode, QProcess::ExitStatus status)
{
    onReadyReadStandardOutput();
    if (!m_stdoutBuffer.isEmpty()) {
        handleOutputLine(QString::fromUtf8(m_stdoutBuffer).trimmed());
        m_stdoutBuffer.clear();
    }
    onReadyReadStandardError();

    handleExit(exitCode, status == QProcess::CrashExit);
    emit finished();
}

void EngineJob::onProcessError(QProcess::ProcessError error)
{
    if (error != QProcess::FailedToStart) {
        qWarning() << "EngineJob: process error" << m_id << m_process->errorString();
        return;
    }
    if (m_spawned || m_finished) return;

    m_finished = true;
    qWarning() << "EngineJob: failed to spawn" << m_process->program() << m_process->errorString();
    emit startFailed(m_process->errorString());
    emit finished();
}

void EngineJob::emitProgress(JobStatus status, double progress)
{
    ProgressUpdate update;
    update.id = m_id;
    update.status = status;
    update.progress = progress;
    update.converting = m_converting;
    emit jobEvent(update);
}
