module;
#include <QHash>
#include <QMultiMap>
#include <QString>
#include <QStringList>
#include <QtGlobal>

module nava.core.evictionqueue;

bool EvictionQueue::schedule(const QString& id, qint64 dueMs)
{
    if (m_dueById.contains(id)) return false;
    m_dueById.insert(id, dueMs);
    m_byDeadline.insert(dueMs, id);
    return true;
}

bool EvictionQueue::cancel(const QString& id)
{
    auto it = m_dueById.find(id);
    if (it == m_dueById.end()) return false;
    m_byDeadline.remove(it.value(), id);
    m_dueById.erase(it);
    return true;
}

QStringList EvictionQueue::takeDue(qint64 nowMs)
{
    QStringList due;
    auto it = m_byDeadline.begin();
    while (it != m_byDeadline.end() && it.key() <= nowMs) {
        due.append(it.value());
        m_dueById.remove(it.value());
        it = m_byDeadline.erase(it);
    }
    return due;
}

qint64 EvictionQueue::nextDeadline() const
{
    return m_byDeadline.isEmpty() ? -1 : m_byDeadline.firstKey();
}

void EvictionQueue::clear()
{
    m_byDeadline.clear();
    m_dueById.clear();
}
