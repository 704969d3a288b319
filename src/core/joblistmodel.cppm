/*!
 * @file        joblistmodel.cppm
 * @brief       QAbstractListModel over the active job view.
 * @details     Presents the reconciler's active view as a Qt item model.
 *              Every reconciliation pass hands the model the full active
 *              set; the model diffs it against its rows by job ID so that
 *              existing rows are updated in place, new jobs are appended and
 *              jobs that left the active view are removed.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/nava/blob/main/LICENSE.md
 */

module;
#include <QAbstractListModel>
#include <QByteArray>
#include <QHash>
#include <QStringList>
#include <QVariant>
#include <QVector>

#ifndef Q_MOC_RUN
export module nava.core.joblistmodel;
import nava.core.jobtypes;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Qt list model exposing active jobs to a view.
 */
NAVA_MODULE_EXPORT class JobListModel : public QAbstractListModel {
    Q_OBJECT

public:
    /**
     * @brief Custom model roles.
     */
    enum Roles {
        IdRole = Qt::UserRole + 1,  //!< Job identifier
        TitleRole,                  //!< Display title
        KindRole,                   //!< "video" or "audio"
        ProgressRole,               //!< Percentage (0 – 100)
        StatusRole,                 //!< Status string
        StatusTextRole,             //!< Human-readable status line
        ConvertingRole,             //!< Post-processing flag
        CancellableRole             //!< Whether a cancel action applies
    };

    explicit JobListModel(QObject* parent = nullptr);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    /**
     * @brief Replace the model contents with a new active view.
     *
     * Rows are matched by job ID. Matching rows only emit dataChanged for
     * the roles whose value changed.
     *
     * @param jobs Active jobs in display order.
     */
    void sync(const QVector<Job>& jobs);

    /**
     * @brief Returns the row of a job.
     * @param id Job identifier.
     * @return Row index, or -1 if the job is not shown.
     */
    Q_INVOKABLE int rowOf(const QString& id) const;

    //!< @brief Returns the job at a row; a default job when out of range.
    Job jobAt(int row) const;

    //!< @brief Job identifiers in row order.
    QStringList ids() const;

    /**
     * @brief Builds the status line shown for a job.
     * @param job Job to describe.
     * @return "Download complete", "Converting N%" or the status string.
     */
    static QString statusText(const Job& job);

    //!< @brief True for downloading, converting and download_complete.
    static bool isCancellable(const Job& job);

private:
    static QList<int> changedRoles(const Job& before, const Job& after);

    QVector<Job> m_jobs;    //!< Rows in display order.
};

#include "joblistmodel.moc"
