#include <variant>

#include <QByteArray>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTemporaryDir>
#include <QVector>

#include "testing/nava_gtest.h"

import nava.core.jobtypes;
import nava.services.enginejob;

using testing::DoubleEq;
using testing::Eq;
using testing::IsEmpty;
using testing::IsFalse;
using testing::IsTrue;
using testing::Le;
using testing::Lt;
using testing::NotNull;

using nava::testing::waitUntil;

namespace {

MediaItem clipItem()
{
    MediaItem item;
    item.id = QStringLiteral("abc");
    item.title = QStringLiteral("Clip");
    item.url = QStringLiteral("https://youtu.be/abc");
    return item;
}

bool touch(const QString& path)
{
    QFile file(path);
    return file.open(QIODevice::WriteOnly);
}

class EngineJobTest : public testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_THAT(dir_.isValid(), IsTrue());
        job_ = new EngineJob(QStringLiteral("job-1"), clipItem(), QStringLiteral("video"), dir_.path());
        QObject::connect(job_, &EngineJob::jobEvent, [this](const EngineEvent& event) { events_.append(event); });
        QObject::connect(job_, &EngineJob::finished, [this]() { ++finished_; });
    }

    void TearDown() override { delete job_; }

    const ProgressUpdate* progressAt(int i) const { return std::get_if<ProgressUpdate>(&events_.at(i)); }
    const TerminalUpdate* terminalAt(int i) const { return std::get_if<TerminalUpdate>(&events_.at(i)); }

    QTemporaryDir dir_;
    EngineJob* job_ = nullptr;
    QVector<EngineEvent> events_;
    int finished_ = 0;
};

NOLINT_TEST_F(EngineJobTest, ProgressLinesBecomeProgressEvents)
{
    job_->handleOutputLine(QStringLiteral("[youtube] abc: Downloading webpage"));
    job_->handleOutputLine(QStringLiteral("[download]  12.5% of 10.00MiB at 1.00MiB/s ETA 00:09"));
    job_->handleOutputLine(QStringLiteral("[download] 100% of 10.00MiB in 00:10"));

    ASSERT_THAT(events_.size(), Eq(2));
    ASSERT_THAT(progressAt(0), NotNull());
    EXPECT_THAT(progressAt(0)->id, Eq(QStringLiteral("job-1")));
    EXPECT_THAT(progressAt(0)->status, Eq(JobStatus::Downloading));
    EXPECT_THAT(progressAt(0)->progress, DoubleEq(12.5));
    ASSERT_THAT(progressAt(1), NotNull());
    EXPECT_THAT(progressAt(1)->status, Eq(JobStatus::DownloadComplete));
    EXPECT_THAT(progressAt(1)->progress, DoubleEq(100.0));
}

NOLINT_TEST_F(EngineJobTest, PostProcessingSetsConverting)
{
    job_->handleOutputLine(QStringLiteral("[download] 100% of 10.00MiB in 00:10"));
    job_->handleOutputLine(QStringLiteral("[Merger] Merging formats into \"Clip.mp4\""));

    ASSERT_THAT(events_.size(), Eq(2));
    ASSERT_THAT(progressAt(1), NotNull());
    EXPECT_THAT(progressAt(1)->status, Eq(JobStatus::Converting));
    EXPECT_THAT(progressAt(1)->progress, DoubleEq(100.0));
    ASSERT_THAT(progressAt(1)->converting.has_value(), IsTrue());
    EXPECT_THAT(*progressAt(1)->converting, IsTrue());
}

NOLINT_TEST_F(EngineJobTest, CleanExitCompletes)
{
    job_->handleExit(0);

    ASSERT_THAT(events_.size(), Eq(1));
    ASSERT_THAT(terminalAt(0), NotNull());
    EXPECT_THAT(terminalAt(0)->status, Eq(JobStatus::Completed));
    EXPECT_THAT(terminalAt(0)->progress, DoubleEq(100.0));
    EXPECT_THAT(terminalAt(0)->title, Eq(QStringLiteral("Clip")));
    EXPECT_THAT(job_->isFinished(), IsTrue());

    job_->handleExit(1);
    job_->handleOutputLine(QStringLiteral("[download]  50.0% of 1MiB"));
    EXPECT_THAT(events_.size(), Eq(1));
}

NOLINT_TEST_F(EngineJobTest, FailedExitCarriesStderr)
{
    job_->handleOutputLine(QStringLiteral("[download]  40.0% of 1MiB"));
    job_->appendErrorOutput("ERROR: HTTP Error 403: Forbidden\n");
    job_->handleExit(1);

    ASSERT_THAT(events_.size(), Eq(2));
    ASSERT_THAT(terminalAt(1), NotNull());
    EXPECT_THAT(terminalAt(1)->status, Eq(JobStatus::Failed));
    EXPECT_THAT(terminalAt(1)->progress, DoubleEq(40.0));
    EXPECT_THAT(terminalAt(1)->error, Eq(QStringLiteral("ERROR: HTTP Error 403: Forbidden")));
}

NOLINT_TEST_F(EngineJobTest, StderrIsCappedToWhatTheMessageUses)
{
    for (int i = 0; i < 100; ++i) job_->appendErrorOutput(QByteArray(1000, 'x'));
    EXPECT_THAT(job_->errorOutputSize(), Le(4 * 500 + 4));

    job_->handleExit(1);
    ASSERT_THAT(terminalAt(0), NotNull());
    EXPECT_THAT(terminalAt(0)->error, Eq(QString(500, QLatin1Char('x')) + QStringLiteral("... (truncated)")));
}

NOLINT_TEST_F(EngineJobTest, FailedExitWithoutStderrNamesTheExitCode)
{
    job_->handleExit(2);

    ASSERT_THAT(terminalAt(0), NotNull());
    EXPECT_THAT(terminalAt(0)->error, Eq(QStringLiteral("Download failed with exit code 2 (no stderr output)")));
}

NOLINT_TEST_F(EngineJobTest, CrashIsAFailure)
{
    job_->handleExit(0, true);

    ASSERT_THAT(terminalAt(0), NotNull());
    EXPECT_THAT(terminalAt(0)->status, Eq(JobStatus::Failed));
}

NOLINT_TEST_F(EngineJobTest, CancelRemovesPartialFilesOfTheJob)
{
    const QDir dir(dir_.path());
    ASSERT_THAT(touch(dir.filePath(QStringLiteral("Clip.mp4.part"))), IsTrue());
    ASSERT_THAT(touch(dir.filePath(QStringLiteral("Clip.f137.mp4.ytdl"))), IsTrue());
    ASSERT_THAT(touch(dir.filePath(QStringLiteral("Clip.mp4"))), IsTrue());
    ASSERT_THAT(touch(dir.filePath(QStringLiteral("Other.mp4.part"))), IsTrue());

    job_->cancel();

    EXPECT_THAT(QFileInfo::exists(dir.filePath(QStringLiteral("Clip.mp4.part"))), IsFalse());
    EXPECT_THAT(QFileInfo::exists(dir.filePath(QStringLiteral("Clip.f137.mp4.ytdl"))), IsFalse());
    EXPECT_THAT(QFileInfo::exists(dir.filePath(QStringLiteral("Clip.mp4"))), IsTrue());
    EXPECT_THAT(QFileInfo::exists(dir.filePath(QStringLiteral("Other.mp4.part"))), IsTrue());

    ASSERT_THAT(events_.size(), Eq(1));
    ASSERT_THAT(terminalAt(0), NotNull());
    EXPECT_THAT(terminalAt(0)->status, Eq(JobStatus::Cancelled));
    EXPECT_THAT(finished_, Eq(1));
    EXPECT_THAT(job_->isCancelled(), IsTrue());

    job_->cancel();
    job_->handleExit(0);
    EXPECT_THAT(events_.size(), Eq(1));
    EXPECT_THAT(finished_, Eq(1));
}

NOLINT_TEST_F(EngineJobTest, MissingProgramFailsToStart)
{
    QString error;
    QObject::connect(job_, &EngineJob::startFailed, [&error](const QString& reason) { error = reason; });

    job_->start(dir_.filePath(QStringLiteral("no-such-program")), {});
    ASSERT_THAT(waitUntil([this]() { return finished_ > 0; }), IsTrue());
    EXPECT_THAT(error.isEmpty(), IsFalse());
    EXPECT_THAT(events_, IsEmpty());
}

NOLINT_TEST_F(EngineJobTest, ProcessOutputIsStreamed)
{
    if (!QFileInfo::exists(QStringLiteral("/bin/sh"))) GTEST_SKIP() << "no POSIX shell";

    bool started = false;
    QObject::connect(job_, &EngineJob::started, [&started]() { started = true; });

    job_->start(QStringLiteral("/bin/sh"),
                { QStringLiteral("-c"),
                  QStringLiteral("echo '[download]  50.0% of 1MiB'; echo '[download] 100% of 1MiB'; exit 0") });
    ASSERT_THAT(waitUntil([this]() { return finished_ > 0; }), IsTrue());

    EXPECT_THAT(started, IsTrue());
    ASSERT_THAT(events_.size(), Eq(3));
    EXPECT_THAT(progressAt(0)->progress, DoubleEq(50.0));
    EXPECT_THAT(progressAt(1)->status, Eq(JobStatus::DownloadComplete));
    ASSERT_THAT(terminalAt(2), NotNull());
    EXPECT_THAT(terminalAt(2)->status, Eq(JobStatus::Completed));
}

NOLINT_TEST_F(EngineJobTest, NonZeroExitReportsStderr)
{
    if (!QFileInfo::exists(QStringLiteral("/bin/sh"))) GTEST_SKIP() << "no POSIX shell";

    job_->start(QStringLiteral("/bin/sh"),
                { QStringLiteral("-c"), QStringLiteral("echo 'ERROR: Video unavailable' >&2; exit 1") });
    ASSERT_THAT(waitUntil([this]() { return finished_ > 0; }), IsTrue());

    ASSERT_THAT(events_.size(), Eq(1));
    ASSERT_THAT(terminalAt(0), NotNull());
    EXPECT_THAT(terminalAt(0)->status, Eq(JobStatus::Failed));
    EXPECT_THAT(terminalAt(0)->error.startsWith(QStringLiteral("ERROR: Video unavailable")), IsTrue());
}

NOLINT_TEST_F(EngineJobTest, CancellingARunningProcessDoesNotBlock)
{
    if (!QFileInfo::exists(QStringLiteral("/bin/sh"))) GTEST_SKIP() << "no POSIX shell";

    const QString partial = QDir(dir_.path()).filePath(QStringLiteral("Clip.mp4.part"));
    ASSERT_THAT(touch(partial), IsTrue());

    bool started = false;
    QObject::connect(job_, &EngineJob::started, [&started]() { started = true; });
    job_->start(QStringLiteral("/bin/sh"), { QStringLiteral("-c"), QStringLiteral("sleep 30") });
    ASSERT_THAT(waitUntil([&started]() { return started; }), IsTrue());

    QElapsedTimer timer;
    timer.start();
    job_->cancel();
    EXPECT_THAT(timer.elapsed(), Lt(1000));

    ASSERT_THAT(events_.size(), Eq(1));
    ASSERT_THAT(terminalAt(0), NotNull());
    EXPECT_THAT(terminalAt(0)->status, Eq(JobStatus::Cancelled));

    ASSERT_THAT(waitUntil([this]() { return finished_ > 0; }), IsTrue());
    EXPECT_THAT(finished_, Eq(1));
    EXPECT_THAT(QFileInfo::exists(partial), IsFalse());
    EXPECT_THAT(events_.size(), Eq(1));
}

} // namespace
