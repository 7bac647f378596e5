#include <gtest/gtest.h>
#include "hex/HexMath.h"
#include <stdexcept>
#include <unordered_set>

using namespace HexMath;

static HexCoord Cube(int q, int r, int s) { return HexCoord::FromCube(q, r, s); }

TEST(HexMath, AddSubtract) {
    HexCoord a = Cube(1, -3, 2);
    HexCoord b = Cube(3, -7, 4);
    EXPECT_EQ(Add(a, b), Cube(4, -10, 6));
    EXPECT_EQ(Subtract(a, b), Cube(-2, 4, -2));
    EXPECT_EQ(Subtract(Add(a, b), b), a);
}

TEST(HexMath, ScaleRejectsNegativeFactor) {
    EXPECT_EQ(Scale(Cube(1, -3, 2), 2), Cube(2, -6, 4));
    EXPECT_EQ(Scale(Cube(1, -3, 2), 0), HexCoord());
    EXPECT_THROW((void)Scale(Cube(1, -3, 2), -1), std::invalid_argument);
}

TEST(HexMath, InvalidCubeIsRejected) {
    HexCoord bad;
    bad.q = 1;
    bad.r = 1;
    bad.s = 1;
    EXPECT_THROW((void)Add(bad, HexCoord()), std::invalid_argument);
    EXPECT_THROW((void)Distance(bad, HexCoord()), std::invalid_argument);
    EXPECT_THROW((void)Ring(bad, 1), std::invalid_argument);
}

TEST(HexMath, RotateLeftFormula) {
    EXPECT_EQ(RotateLeft(Cube(1, -3, 2)), Cube(3, -2, -1));
    EXPECT_EQ(RotateRight(Cube(1, -3, 2)), Cube(-2, -1, 3));
}

TEST(HexMath, RotationClosure) {
    for (const auto& h : Spiral(HexCoord(), 4)) {
        HexCoord x = h;
        for (int i = 0; i < 6; ++i) x = RotateLeft(x);
        EXPECT_EQ(x, h);
        EXPECT_EQ(RotateRight(RotateLeft(h)), h);
        EXPECT_EQ(RotateLeft(RotateRight(h)), h);
    }
}

TEST(HexMath, RotateLeftStepsDirectionsDown) {
    for (int d = 0; d < 6; ++d) {
        EXPECT_EQ(RotateLeft(Direction(d)), Direction((d + 5) % 6));
    }
}

TEST(HexMath, RotateAroundCenter) {
    HexCoord center(2, -1);
    HexCoord h = center + Direction(0);
    EXPECT_EQ(RotateAround(h, center, 1), center + Direction(5));
    EXPECT_EQ(RotateAround(h, center, -1), center + Direction(1));
    EXPECT_EQ(RotateAround(h, center, 6), h);
}

TEST(HexMath, DistanceValues) {
    EXPECT_EQ(Distance(Cube(0, 0, 0), Cube(2, -1, -1)), 2);
    EXPECT_EQ(Distance(Cube(3, -7, 4), Cube(0, 0, 0)), 7);
    EXPECT_EQ(Length(Cube(-3, 0, 3)), 3);
}

TEST(HexMath, DistanceMetricProperties) {
    std::vector<HexCoord> region = Spiral(HexCoord(), 3);
    for (const auto& a : region) {
        EXPECT_EQ(Distance(a, a), 0);
        for (const auto& b : region) {
            EXPECT_GE(Distance(a, b), 0);
            EXPECT_EQ(Distance(a, b), Distance(b, a));
            for (size_t k = 0; k < region.size(); k += 5) {
                const HexCoord& c = region[k];
                EXPECT_LE(Distance(a, c), Distance(a, b) + Distance(b, c));
            }
        }
    }
}

TEST(HexMath, AxialAndOffsetDistanceMatchCube) {
    HexCoord a(3, -1);
    HexCoord b(-2, 4);
    EXPECT_EQ(AxialDistance(CubeToAxial(a), CubeToAxial(b)), Distance(a, b));
    EXPECT_EQ(OffsetDistance(CubeToOffset(a, OffsetScheme::OddQ), CubeToOffset(b, OffsetScheme::OddQ)), Distance(a, b));
    // Mixed schemes are each read under their own tag
    EXPECT_EQ(OffsetDistance(CubeToOffset(a, OffsetScheme::EvenR), CubeToOffset(b, OffsetScheme::OddQ)), Distance(a, b));
}

TEST(HexMath, NeighborsInDirectionOrder) {
    HexCoord h(1, -2);
    auto n = Neighbors(h);
    for (int d = 0; d < 6; ++d) {
        EXPECT_EQ(n[d], Neighbor(h, d));
        EXPECT_EQ(Distance(h, n[d]), 1);
        EXPECT_EQ(Add(Direction(d), Direction(OppositeDirection(d))), HexCoord());
    }
    EXPECT_THROW((void)Neighbor(h, 6), std::invalid_argument);
    EXPECT_THROW((void)Direction(-1), std::invalid_argument);
}

TEST(HexMath, DiagonalNeighborsAreTwoAway) {
    for (int d = 0; d < 6; ++d) {
        HexCoord n = DiagonalNeighbor(HexCoord(), d);
        EXPECT_TRUE(n.IsValid());
        EXPECT_EQ(Length(n), 2);
        EXPECT_EQ(n, Direction(d) + Direction((d + 1) % 6));
    }
}

TEST(HexMath, RingCardinalityAndDistance) {
    HexCoord center(2, -3);
    EXPECT_EQ(Ring(center, 0), std::vector<HexCoord>{ center });
    for (int k = 1; k <= 6; ++k) {
        auto ring = Ring(center, k);
        ASSERT_EQ(ring.size(), static_cast<size_t>(6 * k));
        std::unordered_set<HexCoord, HexCoordHash> unique(ring.begin(), ring.end());
        EXPECT_EQ(unique.size(), ring.size());
        for (size_t i = 0; i < ring.size(); ++i) {
            EXPECT_TRUE(ring[i].IsValid());
            EXPECT_EQ(Distance(center, ring[i]), k);
            // Consecutive hexes (cyclically) are adjacent
            EXPECT_EQ(Distance(ring[i], ring[(i + 1) % ring.size()]), 1);
        }
        EXPECT_EQ(ring.front(), center + Scale(Direction(4), k));
    }
    EXPECT_THROW((void)Ring(center, -1), std::invalid_argument);
}

TEST(HexMath, SpiralCardinality) {
    for (int k = 0; k <= 6; ++k) {
        auto spiral = Spiral(HexCoord(), k);
        ASSERT_EQ(spiral.size(), static_cast<size_t>(3 * k * (k + 1) + 1));
        std::unordered_set<HexCoord, HexCoordHash> unique(spiral.begin(), spiral.end());
        EXPECT_EQ(unique.size(), spiral.size());
        EXPECT_EQ(spiral.front(), HexCoord());
    }
    EXPECT_THROW((void)Spiral(HexCoord(), -2), std::invalid_argument);
}

TEST(HexMath, RangeMatchesSpiral) {
    HexCoord center(-1, 3);
    auto range = Range(center, 4);
    auto spiral = Spiral(center, 4);
    EXPECT_EQ(HexSet(range.begin(), range.end()), HexSet(spiral.begin(), spiral.end()));
    EXPECT_EQ(range.size(), spiral.size());
}
