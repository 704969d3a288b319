module;
#include <algorithm>
#include <QList>
#include <QSet>
#include <QtGlobal>

module nava.core.selectionset;

void SelectionSet::reset(int candidateCount)
{
    m_candidateCount = qMax(0, candidateCount);
    selectAll();
}

void SelectionSet::selectAll()
{
    m_selected.clear();
    m_selected.reserve(m_candidateCount);
    for (int i = 0; i < m_candidateCount; ++i) {
        m_selected.insert(i);
    }
}

void SelectionSet::deselectAll()
{
    m_selected.clear();
}

bool SelectionSet::toggle(int index)
{
    if (index < 0 || index >= m_candidateCount) return false;
    if (m_selected.contains(index))
        m_selected.remove(index);
    else
        m_selected.insert(index);
    return true;
}

QList<int> SelectionSet::selectedIndices() const
{
    QList<int> out(m_selected.cbegin(), m_selected.cend());
    std::sort(out.begin(), out.end());
    return out;
}
