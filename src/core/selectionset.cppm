/*!
 * @file        selectionset.cppm
 * @brief       User-chosen subset of fetched candidates.
 * @details     Tracks selected candidate indices for the current media
 *              collection. Every fetch resets the set to "all selected".
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/nava/blob/main/LICENSE.md
 */

module;
#include <QList>
#include <QSet>

#ifndef Q_MOC_RUN
export module nava.core.selectionset;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Set of selected indices in [0, candidateCount).
 */
NAVA_MODULE_EXPORT class SelectionSet {

public:
    /**
     * @brief Replace the candidate range and select every index.
     * @param candidateCount Number of candidates in the new collection.
     */
    void reset(int candidateCount);

    //!< @brief Select every candidate.
    void selectAll();

    //!< @brief Clear the selection.
    void deselectAll();

    /**
     * @brief Flip membership of one index.
     * @param index Candidate index.
     * @return False if the index is out of range.
     */
    bool toggle(int index);

    //!< @brief Check whether an index is selected.
    bool isSelected(int index) const { return m_selected.contains(index); }

    //!< @brief True if every candidate is selected.
    bool isAllSelected() const { return m_selected.size() == m_candidateCount; }

    //!< @brief Number of selected indices.
    int count() const { return m_selected.size(); }

    //!< @brief Number of candidates the selection ranges over.
    int candidateCount() const { return m_candidateCount; }

    //!< @brief Selected indices in ascending order.
    QList<int> selectedIndices() const;

private:
    QSet<int> m_selected;       //!< Selected indices.
    int m_candidateCount = 0;   //!< Size of the candidate range.
};
