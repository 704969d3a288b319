#include <QString>
#include <QStringList>

#include "testing/nava_gtest.h"

import nava.core.tombstoneset;

using testing::Eq;
using testing::IsFalse;
using testing::IsTrue;

namespace {

NOLINT_TEST(TombstoneSetTest, InsertIsIdempotent)
{
    TombstoneSet tombstones;
    EXPECT_THAT(tombstones.insert(QStringLiteral("a")), IsTrue());
    EXPECT_THAT(tombstones.insert(QStringLiteral("a")), IsFalse());
    EXPECT_THAT(tombstones.contains(QStringLiteral("a")), IsTrue());
    EXPECT_THAT(tombstones.size(), Eq(1));
}

NOLINT_TEST(TombstoneSetTest, EmptyIdIsRejected)
{
    TombstoneSet tombstones;
    EXPECT_THAT(tombstones.insert(QString()), IsFalse());
    EXPECT_THAT(tombstones.size(), Eq(0));
}

NOLINT_TEST(TombstoneSetTest, InsertAllCountsNewIds)
{
    TombstoneSet tombstones;
    tombstones.insert(QStringLiteral("b"));
    EXPECT_THAT(tombstones.insertAll({ QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c") }), Eq(2));
    EXPECT_THAT(tombstones.contains(QStringLiteral("c")), IsTrue());
    EXPECT_THAT(tombstones.contains(QStringLiteral("d")), IsFalse());
}

} // namespace
