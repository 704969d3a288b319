module;
#include <QSettings>
#include <QString>
#include <QtGlobal>

module nava.services.settings;

void AppSettings::load()
{
    QSettings settings;
    load(settings);
}

void AppSettings::load(QSettings& settings)
{
    settings.beginGroup(QStringLiteral("engine"));
    m_engine.program = settings.value(QStringLiteral("program"), m_engine.program).toString().trimmed();
    if (m_engine.program.isEmpty()) m_engine.program = QStringLiteral("yt-dlp");
    m_engine.userAgent = settings.value(QStringLiteral("userAgent"), m_engine.userAgent).toString();
    m_engine.referer = settings.value(QStringLiteral("referer"), m_engine.referer).toString();
    m_engine.extractorRetries = qMax(0, settings.value(QStringLiteral("extractorRetries"), m_engine.extractorRetries).toInt());
    m_engine.socketTimeoutSec = qMax(1, settings.value(QStringLiteral("socketTimeoutSec"), m_engine.socketTimeoutSec).toInt());
    settings.endGroup();

    settings.beginGroup(QStringLiteral("orchestrator"));
    m_orchestrator.maxConcurrent = clampConcurrency(settings.value(QStringLiteral("maxConcurrent"), m_orchestrator.maxConcurrent).toInt());
    m_orchestrator.pacingDelayMs = qMax(0, settings.value(QStringLiteral("pacingDelayMs"), m_orchestrator.pacingDelayMs).toInt());
    m_orchestrator.evictionDelayMs = qMax(0, settings.value(QStringLiteral("evictionDelayMs"), m_orchestrator.evictionDelayMs).toInt());
    settings.endGroup();
}

int AppSettings::clampConcurrency(int value)
{
    return qBound(kMinConcurrent, value, kMaxConcurrent);
}
