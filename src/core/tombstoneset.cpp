module;
#include <QSet>
#include <QString>
#include <QStringList>

module nava.core.tombstoneset;

bool TombstoneSet::insert(const QString& id)
{
    if (id.isEmpty() || m_ids.contains(id)) return false;
    m_ids.insert(id);
    return true;
}

int TombstoneSet::insertAll(const QStringList& ids)
{
    int added = 0;
    for (const QString& id : ids) {
        if (insert(id)) ++added;
    }
    return added;
}
