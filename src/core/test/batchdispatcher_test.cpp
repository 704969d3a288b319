#include <QElapsedTimer>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include "testing/nava_gtest.h"

import nava.core.jobtypes;
import nava.core.batchdispatcher;
import nava.testing.fakeengine;

using testing::ElementsAre;
using testing::Eq;
using testing::Ge;
using testing::IsFalse;
using testing::IsTrue;
using testing::Le;

using nava::testing::waitUntil;

namespace {

MediaItem makeItem(int n)
{
    MediaItem item;
    item.id = QStringLiteral("v%1").arg(n);
    item.title = QStringLiteral("Video %1").arg(n);
    item.url = QStringLiteral("https://youtu.be/v%1").arg(n);
    return item;
}

QVector<MediaItem> makeItems(int count)
{
    QVector<MediaItem> items;
    for (int i = 1; i <= count; ++i) items.append(makeItem(i));
    return items;
}

class BatchDispatcherTest : public testing::Test {
protected:
    void SetUp() override
    {
        dispatcher_.setPacingDelay(5);
        QObject::connect(&dispatcher_, &BatchDispatcher::jobStarted,
                         [this](const QString& id, const MediaItem& item, const QString&, int) {
                             startedIds_.append(id);
                             startedUrls_.append(item.url);
                             startTimes_.append(clock_.elapsed());
                         });
        QObject::connect(&dispatcher_, &BatchDispatcher::startFailed,
                         [this](const MediaItem& item, const QString& error, int) {
                             failedUrls_.append(item.url);
                             errors_.append(error);
                         });
        QObject::connect(&dispatcher_, &BatchDispatcher::batchFinished, [this](int started, int failed) {
            ++batches_;
            started_ += started;
            failed_ += failed;
        });
        clock_.start();
    }

    bool waitForBatches(int count, int timeoutMs = 5000)
    {
        return waitUntil([this, count]() { return batches_ >= count; }, timeoutMs);
    }

    FakeEngine engine_;
    BatchDispatcher dispatcher_ { &engine_ };
    QElapsedTimer clock_;
    QStringList startedIds_;
    QStringList startedUrls_;
    QStringList failedUrls_;
    QStringList errors_;
    QVector<qint64> startTimes_;
    int batches_ = 0;
    int started_ = 0;
    int failed_ = 0;
};

NOLINT_TEST_F(BatchDispatcherTest, EmptyBatchIsRejected)
{
    EXPECT_THAT(dispatcher_.dispatchBatch({}, OutputOptions {}, 3), IsFalse());
    EXPECT_THAT(dispatcher_.isDispatching(), IsFalse());
}

NOLINT_TEST_F(BatchDispatcherTest, BudgetOfOneStartsInSelectionOrder)
{
    engine_.setStartLatency(5);
    ASSERT_THAT(dispatcher_.dispatchBatch(makeItems(3), OutputOptions {}, 1), IsTrue());
    EXPECT_THAT(dispatcher_.isDispatching(), IsTrue());

    ASSERT_THAT(waitForBatches(1), IsTrue());
    EXPECT_THAT(engine_.startedUrls(), ElementsAre(QStringLiteral("https://youtu.be/v1"),
                                                   QStringLiteral("https://youtu.be/v2"),
                                                   QStringLiteral("https://youtu.be/v3")));
    EXPECT_THAT(engine_.peakOutstanding(), Eq(1));
    EXPECT_THAT(started_, Eq(3));
    EXPECT_THAT(failed_, Eq(0));
    EXPECT_THAT(dispatcher_.isDispatching(), IsFalse());
    EXPECT_THAT(dispatcher_.outstanding(), Eq(0));
}

NOLINT_TEST_F(BatchDispatcherTest, InFlightStartsNeverExceedTheBudget)
{
    engine_.setStartLatency(30);
    dispatcher_.dispatchBatch(makeItems(5), OutputOptions {}, 2);

    ASSERT_THAT(waitForBatches(1), IsTrue());
    EXPECT_THAT(engine_.peakOutstanding(), Eq(2));
    EXPECT_THAT(started_, Eq(5));
    EXPECT_THAT(startedUrls_.size(), Eq(5));
}

NOLINT_TEST_F(BatchDispatcherTest, BudgetLargerThanBatchUsesOneWorkerPerItem)
{
    engine_.setStartLatency(20);
    dispatcher_.dispatchBatch(makeItems(2), OutputOptions {}, 5);

    ASSERT_THAT(waitForBatches(1), IsTrue());
    EXPECT_THAT(engine_.peakOutstanding(), Eq(2));
    EXPECT_THAT(started_, Eq(2));
}

NOLINT_TEST_F(BatchDispatcherTest, FailedStartDoesNotStopTheBatch)
{
    engine_.failStart(QStringLiteral("https://youtu.be/v2"), QStringLiteral("Failed to spawn download process: boom"));
    dispatcher_.dispatchBatch(makeItems(3), OutputOptions {}, 1);

    ASSERT_THAT(waitForBatches(1), IsTrue());
    EXPECT_THAT(failedUrls_, ElementsAre(QStringLiteral("https://youtu.be/v2")));
    EXPECT_THAT(errors_, ElementsAre(QStringLiteral("Failed to spawn download process: boom")));
    EXPECT_THAT(startedUrls_, ElementsAre(QStringLiteral("https://youtu.be/v1"), QStringLiteral("https://youtu.be/v3")));
    EXPECT_THAT(started_, Eq(2));
    EXPECT_THAT(failed_, Eq(1));
}

NOLINT_TEST_F(BatchDispatcherTest, WorkersWaitThePacingDelayBetweenStarts)
{
    dispatcher_.setPacingDelay(100);
    dispatcher_.dispatchBatch(makeItems(2), OutputOptions {}, 1);

    ASSERT_THAT(waitForBatches(1), IsTrue());
    ASSERT_THAT(startTimes_.size(), Eq(2));
    EXPECT_THAT(startTimes_[1] - startTimes_[0], Ge(90));
}

NOLINT_TEST_F(BatchDispatcherTest, SingleItemFinishesWithoutPacing)
{
    dispatcher_.setPacingDelay(10000);
    dispatcher_.dispatchBatch(makeItems(1), OutputOptions {}, 3);

    ASSERT_THAT(waitForBatches(1, 2000), IsTrue());
    EXPECT_THAT(clock_.elapsed(), Le(2000));
    EXPECT_THAT(started_, Eq(1));
}

NOLINT_TEST_F(BatchDispatcherTest, OutputOptionsReachTheEngine)
{
    OutputOptions options;
    options.kind = QStringLiteral("audio");
    dispatcher_.dispatchBatch(makeItems(1), options, 1);

    ASSERT_THAT(waitForBatches(1), IsTrue());
    EXPECT_THAT(engine_.lastOutputKind(), Eq(QStringLiteral("audio")));
}

NOLINT_TEST_F(BatchDispatcherTest, ConcurrentBatchesAreIndependent)
{
    int changes = 0;
    QObject::connect(&dispatcher_, &BatchDispatcher::dispatchingChanged, [&changes]() { ++changes; });

    engine_.setStartLatency(10);
    dispatcher_.dispatchBatch(makeItems(2), OutputOptions {}, 1);
    dispatcher_.dispatchBatch(makeItems(2), OutputOptions {}, 1);

    ASSERT_THAT(waitForBatches(2), IsTrue());
    EXPECT_THAT(started_, Eq(4));
    EXPECT_THAT(changes, Eq(2));
    EXPECT_THAT(dispatcher_.isDispatching(), IsFalse());
}

NOLINT_TEST(BatchDispatcherNoEngineTest, EveryStartFailsWithoutAnEngine)
{
    BatchDispatcher dispatcher(nullptr);
    dispatcher.setPacingDelay(0);
    QStringList errors;
    int finishedStarted = -1;
    int finishedFailed = -1;
    QObject::connect(&dispatcher, &BatchDispatcher::startFailed, [&errors](const MediaItem&, const QString& error, int) {
        errors.append(error);
    });
    QObject::connect(&dispatcher, &BatchDispatcher::batchFinished, [&](int started, int failed) {
        finishedStarted = started;
        finishedFailed = failed;
    });

    dispatcher.dispatchBatch(makeItems(2), OutputOptions {}, 2);
    ASSERT_THAT(waitUntil([&]() { return finishedFailed >= 0; }), IsTrue());
    EXPECT_THAT(finishedStarted, Eq(0));
    EXPECT_THAT(finishedFailed, Eq(2));
    EXPECT_THAT(errors, ElementsAre(QStringLiteral("Download engine unavailable"), QStringLiteral("Download engine unavailable")));
}

} // namespace
