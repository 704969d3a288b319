/*!
 * @file        evictionqueue.cppm
 * @brief       Deadline-ordered queue of pending job removals.
 * @details     Terminal jobs stay visible for a short grace period before
 *              they are dropped from the registry. The queue keeps one
 *              deadline per job ID and hands out the IDs whose deadline has
 *              passed, earliest first.
 *
 *              Deadlines are plain millisecond values from a monotonic
 *              clock supplied by the caller, which keeps the queue free of
 *              any timer and easy to drive from tests.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/nava/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QMultiMap>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module nava.core.evictionqueue;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

NAVA_MODULE_EXPORT class EvictionQueue {

public:
    /**
     * @brief Schedule a removal.
     *
     * A job that is already scheduled keeps its first deadline.
     *
     * @param id Job identifier.
     * @param dueMs Deadline on the caller's monotonic clock.
     * @return True if the job was newly scheduled.
     */
    bool schedule(const QString& id, qint64 dueMs);

    /**
     * @brief Drop a scheduled removal.
     * @param id Job identifier.
     * @return True if the job was scheduled.
     */
    bool cancel(const QString& id);

    /**
     * @brief Remove and return every job whose deadline is at or before now.
     * @param nowMs Current time on the caller's monotonic clock.
     * @return Job identifiers in deadline order.
     */
    QStringList takeDue(qint64 nowMs);

    //!< @brief Earliest pending deadline, or -1 when nothing is scheduled.
    qint64 nextDeadline() const;

    bool isScheduled(const QString& id) const { return m_dueById.contains(id); }
    int size() const { return m_dueById.size(); }
    void clear();

private:
    QMultiMap<qint64, QString> m_byDeadline;    //!< Deadline → job IDs.
    QHash<QString, qint64> m_dueById;           //!< Job ID → deadline.
};
