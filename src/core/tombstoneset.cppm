/*!
 * @file        tombstoneset.cppm
 * @brief       Permanent record of cancelled job identifiers.
 * @details     A tombstoned job ID never affects visible state again for the
 *              lifetime of the session, whatever the engine reports later and
 *              whatever the outcome of the cancel request itself.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/nava/blob/main/LICENSE.md
 */

module;
#include <QSet>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module nava.core.tombstoneset;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Monotonically growing set of job IDs.
 *
 * There is deliberately no removal operation.
 */
NAVA_MODULE_EXPORT class TombstoneSet {

public:
    /**
     * @brief Tombstone one identifier.
     * @param id Job identifier.
     * @return True if the identifier was not tombstoned before.
     */
    bool insert(const QString& id);

    /**
     * @brief Tombstone a batch of identifiers in one step.
     * @param ids Job identifiers.
     * @return Number of identifiers newly tombstoned.
     */
    int insertAll(const QStringList& ids);

    //!< @brief Check whether an identifier is tombstoned.
    bool contains(const QString& id) const { return m_ids.contains(id); }

    //!< @brief Number of tombstoned identifiers.
    int size() const { return m_ids.size(); }

private:
    QSet<QString> m_ids;    //!< Tombstoned identifiers.
};
