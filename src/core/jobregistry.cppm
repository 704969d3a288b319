/*!
 * @file        jobregistry.cppm
 * @brief       Authoritative in-memory store of known jobs.
 * @details     Holds every job the session has seen, keyed by engine job ID,
 *              together with the order in which jobs were first sighted.
 *
 *              The registry is a plain value container owned by the
 *              orchestrator. It performs no filtering of its own; tombstone
 *              checks and active-view derivation live in the reconciler.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/nava/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#ifndef Q_MOC_RUN
export module nava.core.jobregistry;
import nava.core.jobtypes;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Keyed job store with first-sighting order.
 *
 * upsert() creates a job on first sighting and merges partial updates on
 * every later sighting. A job in a terminal status is never moved back to a
 * non-terminal one.
 */
NAVA_MODULE_EXPORT class JobRegistry {

public:
    /**
     * @brief Outcome of an upsert.
     */
    enum class UpsertResult {
        Created,    //!< The job did not exist and was created.
        Updated,    //!< The job existed and the patch was merged.
        Ignored     //!< The job is terminal and the patch was discarded.
    };

    /**
     * @brief Create or merge a job.
     *
     * Defaults for a new job: title "Unknown", kind "video", status
     * starting, progress 0, converting false. A stored title is only
     * replaced by a non-empty incoming title.
     *
     * @param id Job identifier.
     * @param patch Fields to set.
     * @return What happened to the registry.
     */
    UpsertResult upsert(const QString& id, const JobPatch& patch);

    /**
     * @brief Delete a job unconditionally.
     * @param id Job identifier.
     * @return True if the job existed.
     */
    bool remove(const QString& id);

    //!< @brief Delete every job.
    void clear();

    //!< @brief Check whether a job is present.
    bool contains(const QString& id) const { return m_jobs.contains(id); }

    /**
     * @brief Look up a job.
     * @param id Job identifier.
     * @return Pointer to the stored job or null. Invalidated by the next mutation.
     */
    const Job* job(const QString& id) const;

    //!< @brief Job identifiers in first-sighting order.
    QStringList ids() const { return m_order; }

    //!< @brief Copy of all jobs in first-sighting order.
    QVector<Job> snapshot() const;

    //!< @brief Number of stored jobs.
    int size() const { return m_jobs.size(); }

    //!< @brief True when no job is stored.
    bool isEmpty() const { return m_jobs.isEmpty(); }

private:
    QHash<QString, Job> m_jobs;     //!< Jobs keyed by identifier.
    QStringList m_order;            //!< First-sighting order.
};
