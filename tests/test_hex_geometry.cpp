#include <gtest/gtest.h>
#include "hex/HexGeometry.h"
#include "hex/HexMath.h"
#include <cmath>
#include <stdexcept>

using namespace HexGeometry;

TEST(HexGeometry, PointyPixelMapping) {
    PixelPoint p0 = HexToPixel(HexCoord(0, 0), 40.0, HexLayout::Pointy);
    PixelPoint p1 = HexToPixel(HexCoord(1, 0), 40.0, HexLayout::Pointy);
    PixelPoint p2 = HexToPixel(HexCoord(0, 1), 40.0, HexLayout::Pointy);
    EXPECT_NEAR(p1.x - p0.x, 69.282, 0.01);
    EXPECT_NEAR(p1.y - p0.y, 0.0, 1e-9);
    EXPECT_NEAR(p2.x, 34.641, 0.01);
    EXPECT_NEAR(p2.y, 60.0, 1e-9);
}

TEST(HexGeometry, FlatPixelMapping) {
    PixelPoint p1 = HexToPixel(HexCoord(1, 0), 10.0, HexLayout::Flat);
    PixelPoint p2 = HexToPixel(HexCoord(0, 1), 10.0, HexLayout::Flat);
    EXPECT_NEAR(p1.x, 15.0, 1e-9);
    EXPECT_NEAR(p1.y, 8.660, 0.001);
    EXPECT_NEAR(p2.x, 0.0, 1e-9);
    EXPECT_NEAR(p2.y, 17.321, 0.001);
}

TEST(HexGeometry, PixelRoundTrip) {
    const HexLayout layouts[] = { HexLayout::Pointy, HexLayout::Flat };
    const double sizes[] = { 1.0, 10.0, 37.5 };
    for (HexLayout layout : layouts) {
        for (double size : sizes) {
            for (const auto& h : HexMath::Spiral(HexCoord(), 8)) {
                EXPECT_EQ(PixelToHex(HexToPixel(h, size, layout), size, layout), h);
            }
        }
    }
}

TEST(HexGeometry, FarPixelIsRejected) {
    EXPECT_THROW((void)PixelToHex({ 1e12, 0.0 }, 1.0, HexLayout::Pointy), std::invalid_argument);
    EXPECT_THROW((void)PixelToHex({ 0.0, -1e12 }, 1.0, HexLayout::Flat), std::invalid_argument);
    EXPECT_THROW((void)PixelToHex({ INFINITY, 0.0 }, 1.0, HexLayout::Pointy), std::invalid_argument);
    // Large but representable points still map
    HexCoord far(100000, -40000);
    EXPECT_EQ(PixelToHex(HexToPixel(far, 1.0, HexLayout::Pointy), 1.0, HexLayout::Pointy), far);
}

TEST(HexGeometry, PointsInsideHexMapBack) {
    const double size = 20.0;
    HexCoord h(3, -5);
    PixelPoint center = HexToPixel(h, size, HexLayout::Pointy);
    // Anything within the inner radius belongs to the hex
    const double reach = InnerRadius(size) * 0.9;
    for (int i = 0; i < 12; ++i) {
        const double angle = i * 3.14159265358979 / 6.0;
        PixelPoint p = center + PixelPoint(reach * std::cos(angle), reach * std::sin(angle));
        EXPECT_EQ(PixelToHex(p, size, HexLayout::Pointy), h);
    }
}

TEST(HexGeometry, CornersSurroundCenter) {
    const double size = 12.0;
    HexCoord h(-2, 1);
    for (HexLayout layout : { HexLayout::Pointy, HexLayout::Flat }) {
        PixelPoint center = HexToPixel(h, size, layout);
        auto corners = PolygonCorners(h, size, layout);
        for (int i = 0; i < 6; ++i) {
            EXPECT_NEAR(center.DistanceBetween(corners[i]), size, 1e-9);
            // Adjacent corners are one side length apart
            EXPECT_NEAR(corners[i].DistanceBetween(corners[(i + 1) % 6]), size, 1e-9);
        }
    }
}

TEST(HexGeometry, CornerStartAngles) {
    PixelPoint pointy = CornerOffset(0, 10.0, HexLayout::Pointy);
    EXPECT_NEAR(pointy.x, 8.660, 0.001);
    EXPECT_NEAR(pointy.y, 5.0, 1e-9);
    PixelPoint flat = CornerOffset(0, 10.0, HexLayout::Flat);
    EXPECT_NEAR(flat.x, 10.0, 1e-9);
    EXPECT_NEAR(flat.y, 0.0, 1e-9);
}

TEST(HexGeometry, NeighboringHexesShareTwoCorners) {
    const double size = 5.0;
    auto a = PolygonCorners(HexCoord(0, 0), size, HexLayout::Flat);
    auto b = PolygonCorners(HexCoord(1, 0), size, HexLayout::Flat);
    int shared = 0;
    for (const auto& ca : a) {
        for (const auto& cb : b) {
            if (ca.DistanceBetween(cb) < 1e-9) ++shared;
        }
    }
    EXPECT_EQ(shared, 2);
}

TEST(HexGeometry, RejectsBadSize) {
    EXPECT_THROW((void)HexToPixel(HexCoord(), 0.0, HexLayout::Pointy), std::invalid_argument);
    EXPECT_THROW((void)PixelToHex({ 1.0, 1.0 }, -3.0, HexLayout::Flat), std::invalid_argument);
    EXPECT_THROW((void)PolygonCorners(HexCoord(), NAN, HexLayout::Flat), std::invalid_argument);
    EXPECT_THROW((void)PixelToHex({ NAN, 1.0 }, 3.0, HexLayout::Flat), std::invalid_argument);
}
