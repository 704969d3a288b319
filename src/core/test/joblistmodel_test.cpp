#include <QByteArray>
#include <QList>
#include <QModelIndex>
#include <QObject>
#include <QString>
#include <QVariant>
#include <QVector>

#include "testing/nava_gtest.h"

import nava.core.jobtypes;
import nava.core.joblistmodel;

using testing::Contains;
using testing::ElementsAre;
using testing::Eq;
using testing::IsFalse;
using testing::IsTrue;
using testing::Not;

namespace {

Job makeJob(const QString& id, JobStatus status, double progress = 0.0)
{
    Job job;
    job.id = id;
    job.title = QStringLiteral("Title %1").arg(id);
    job.kind = QStringLiteral("video");
    job.status = status;
    job.progress = progress;
    return job;
}

class JobListModelTest : public testing::Test {
protected:
    void SetUp() override
    {
        QObject::connect(&model_, &QAbstractItemModel::rowsInserted, [this](const QModelIndex&, int first, int last) {
            inserted_ += last - first + 1;
        });
        QObject::connect(&model_, &QAbstractItemModel::rowsRemoved, [this](const QModelIndex&, int first, int last) {
            removed_ += last - first + 1;
        });
        QObject::connect(&model_, &QAbstractItemModel::dataChanged,
                         [this](const QModelIndex& topLeft, const QModelIndex&, const QList<int>& roles) {
                             changedRows_.append(topLeft.row());
                             lastRoles_ = roles;
                         });
    }

    JobListModel model_;
    int inserted_ = 0;
    int removed_ = 0;
    QList<int> changedRows_;
    QList<int> lastRoles_;
};

NOLINT_TEST_F(JobListModelTest, SyncAppendsNewJobsInOrder)
{
    model_.sync({ makeJob(QStringLiteral("a"), JobStatus::Starting), makeJob(QStringLiteral("b"), JobStatus::Downloading, 5.0) });

    EXPECT_THAT(model_.rowCount(), Eq(2));
    EXPECT_THAT(inserted_, Eq(2));
    EXPECT_THAT(model_.ids(), ElementsAre(QStringLiteral("a"), QStringLiteral("b")));
    EXPECT_THAT(model_.rowOf(QStringLiteral("b")), Eq(1));
    EXPECT_THAT(model_.rowOf(QStringLiteral("zzz")), Eq(-1));
}

NOLINT_TEST_F(JobListModelTest, SyncUpdatesOnlyChangedRows)
{
    model_.sync({ makeJob(QStringLiteral("a"), JobStatus::Downloading, 5.0), makeJob(QStringLiteral("b"), JobStatus::Downloading, 5.0) });
    model_.sync({ makeJob(QStringLiteral("a"), JobStatus::Downloading, 5.0), makeJob(QStringLiteral("b"), JobStatus::Downloading, 40.0) });

    EXPECT_THAT(changedRows_, ElementsAre(1));
    EXPECT_THAT(lastRoles_, Contains(int(JobListModel::ProgressRole)));
    EXPECT_THAT(lastRoles_, Not(Contains(int(JobListModel::TitleRole))));
    EXPECT_THAT(model_.data(model_.index(1), JobListModel::ProgressRole).toDouble(), Eq(40.0));
    EXPECT_THAT(inserted_, Eq(2));
    EXPECT_THAT(removed_, Eq(0));
}

NOLINT_TEST_F(JobListModelTest, SyncRemovesJobsThatLeftTheView)
{
    model_.sync({ makeJob(QStringLiteral("a"), JobStatus::Downloading), makeJob(QStringLiteral("b"), JobStatus::Downloading),
                  makeJob(QStringLiteral("c"), JobStatus::Downloading) });
    model_.sync({ makeJob(QStringLiteral("c"), JobStatus::Downloading) });

    EXPECT_THAT(removed_, Eq(2));
    EXPECT_THAT(model_.ids(), ElementsAre(QStringLiteral("c")));

    model_.sync({});
    EXPECT_THAT(model_.rowCount(), Eq(0));
}

NOLINT_TEST_F(JobListModelTest, RolesExposeJobFields)
{
    Job job = makeJob(QStringLiteral("a"), JobStatus::Converting, 100.0);
    job.converting = true;
    job.kind = QStringLiteral("audio");
    model_.sync({ job });

    const QModelIndex idx = model_.index(0);
    EXPECT_THAT(model_.data(idx, JobListModel::IdRole).toString(), Eq(QStringLiteral("a")));
    EXPECT_THAT(model_.data(idx, Qt::DisplayRole).toString(), Eq(QStringLiteral("Title a")));
    EXPECT_THAT(model_.data(idx, JobListModel::KindRole).toString(), Eq(QStringLiteral("audio")));
    EXPECT_THAT(model_.data(idx, JobListModel::StatusRole).toString(), Eq(QStringLiteral("converting")));
    EXPECT_THAT(model_.data(idx, JobListModel::StatusTextRole).toString(), Eq(QStringLiteral("Converting 100%")));
    EXPECT_THAT(model_.data(idx, JobListModel::ConvertingRole).toBool(), IsTrue());
    EXPECT_THAT(model_.data(idx, JobListModel::CancellableRole).toBool(), IsTrue());
    EXPECT_THAT(model_.data(model_.index(5), JobListModel::IdRole).isValid(), IsFalse());
}

NOLINT_TEST_F(JobListModelTest, RoleNamesAreStable)
{
    const auto names = model_.roleNames();
    EXPECT_THAT(names.value(JobListModel::IdRole), Eq(QByteArray("jobId")));
    EXPECT_THAT(names.value(JobListModel::StatusTextRole), Eq(QByteArray("statusText")));
    EXPECT_THAT(names.value(JobListModel::CancellableRole), Eq(QByteArray("cancellable")));
}

NOLINT_TEST(JobListModelStatusTest, StatusTextAndCancellability)
{
    EXPECT_THAT(JobListModel::statusText(makeJob(QStringLiteral("a"), JobStatus::DownloadComplete, 100.0)),
                Eq(QStringLiteral("Download complete")));
    EXPECT_THAT(JobListModel::statusText(makeJob(QStringLiteral("a"), JobStatus::Downloading, 12.0)),
                Eq(QStringLiteral("downloading")));

    EXPECT_THAT(JobListModel::isCancellable(makeJob(QStringLiteral("a"), JobStatus::Starting)), IsFalse());
    EXPECT_THAT(JobListModel::isCancellable(makeJob(QStringLiteral("a"), JobStatus::Downloading)), IsTrue());
    EXPECT_THAT(JobListModel::isCancellable(makeJob(QStringLiteral("a"), JobStatus::DownloadComplete)), IsTrue());
    EXPECT_THAT(JobListModel::isCancellable(makeJob(QStringLiteral("a"), JobStatus::Completed)), IsFalse());
}

} // namespace
