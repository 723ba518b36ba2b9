#include <gtest/gtest.h>

#include "congestion.h"

namespace {

NodeRecord channel(NodeKind kind, int x, int y, int track) {
    NodeRecord r;
    r.kind = kind;
    r.x = x;
    r.y = y;
    r.track = track;
    return r;
}

CongestionKey key(NodeKind kind, int x, int y, int track) {
    CongestionKey k;
    k.kind = kind;
    k.x = x;
    k.y = y;
    k.track = track;
    return k;
}

}  // namespace

TEST(CongestionAccumulator, CountsOnlyChannelNodes) {
    CongestionAccumulator acc;
    acc.add(channel(SOURCE, 0, 0, 0));
    acc.add(channel(OPIN, 0, 0, 0));
    acc.add(channel(IPIN, 1, 0, 0));
    acc.add(channel(SINK, 1, 0, 0));
    EXPECT_TRUE(acc.empty());
    EXPECT_TRUE(acc.normalize().empty());

    acc.add(channel(CHANX, 0, 0, 2));
    acc.add(channel(CHANY, 0, 0, 2));
    EXPECT_EQ(acc.counts().size(), 2u);
}

TEST(CongestionAccumulator, NormalizesByMaximum) {
    CongestionAccumulator acc;
    acc.add(channel(CHANX, 1, 1, 0));
    acc.add(channel(CHANX, 1, 1, 0));
    acc.add(channel(CHANX, 1, 1, 0));
    acc.add(channel(CHANX, 1, 1, 0));
    acc.add(channel(CHANY, 2, 1, 3));

    EXPECT_EQ(acc.max_count(), 4);
    CongestionMap map = acc.normalize();
    ASSERT_EQ(map.size(), 2u);
    EXPECT_DOUBLE_EQ(map.at(key(CHANX, 1, 1, 0)), 1.0);
    EXPECT_DOUBLE_EQ(map.at(key(CHANY, 2, 1, 3)), 0.25);
}

TEST(CongestionAccumulator, TrackIsPartOfTheKey) {
    CongestionAccumulator acc;
    acc.add(channel(CHANX, 1, 1, 0));
    acc.add(channel(CHANX, 1, 1, 1));
    acc.add(channel(CHANY, 1, 1, 0));
    EXPECT_EQ(acc.counts().size(), 3u);
}

TEST(CongestionAccumulator, MergeSumsCounts) {
    CongestionAccumulator a, b;
    a.add(channel(CHANX, 0, 0, 2));
    b.add(channel(CHANX, 0, 0, 2));
    b.add(channel(CHANY, 3, 3, 1));

    a.merge(b);
    EXPECT_EQ(a.counts().at(key(CHANX, 0, 0, 2)), 2);
    EXPECT_EQ(a.counts().at(key(CHANY, 3, 3, 1)), 1);
    // merge does not touch the source
    EXPECT_EQ(b.counts().at(key(CHANX, 0, 0, 2)), 1);
}

TEST(CongestionKey, BoundaryString) {
    EXPECT_EQ(key(CHANX, 0, 0, 2).to_string(), "CHANX_0_0_2");
    EXPECT_EQ(key(CHANY, 12, 7, 31).to_string(), "CHANY_12_7_31");
}
