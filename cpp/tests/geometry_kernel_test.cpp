#include "tests/selcore_test_common.h"
#include "selcore/geometry/geometry_kernel.h"
#include <stdexcept>

using namespace selcore_test;

TEST(GeometryKernelTest, UnrotatedRectangleIsTranslatedBox) {
    const Shape rect = makeRect(1, 10.0f, 20.0f, 30.0f, 40.0f);
    const Bounds b = rotatedBounds(rect);
    EXPECT_EQ(b, (Bounds{10.0f, 20.0f, 40.0f, 60.0f}));
}

TEST(GeometryKernelTest, UnrotatedDiamondMatchesItsBox) {
    const Shape diamond = makeDiamond(1, 3.0f, 4.0f, 10.0f, 20.0f);
    const Bounds b = rotatedBounds(diamond);
    EXPECT_EQ(b, (Bounds{3.0f, 4.0f, 13.0f, 24.0f}));
}

TEST(GeometryKernelTest, UnrotatedLinearUsesRawVertexExtents) {
    const Shape line = makeLinear(ShapeKind::Line, 1, 100.0f, 100.0f, {{0.0f, 0.0f}, {5.0f, -3.0f}, {12.0f, 4.0f}});
    const Bounds b = rotatedBounds(line);
    EXPECT_EQ(b, (Bounds{100.0f, 97.0f, 112.0f, 104.0f}));
}

TEST(GeometryKernelTest, QuarterTurnSwapsExtentsAboutCenter) {
    const Shape rect = makeRect(1, 0.0f, 0.0f, 10.0f, 20.0f, kPi / 2.0f);
    expectBoundsNear(rotatedBounds(rect), Bounds{-5.0f, 5.0f, 15.0f, 15.0f});
}

TEST(GeometryKernelTest, RotatedSquareGrowsToDiagonal) {
    const Shape rect = makeRect(1, 0.0f, 0.0f, 10.0f, 10.0f, kPi / 4.0f);
    const float half = 5.0f * std::sqrt(2.0f);
    expectBoundsNear(rotatedBounds(rect), Bounds{5.0f - half, 5.0f - half, 5.0f + half, 5.0f + half});
}

TEST(GeometryKernelTest, RotatedDiamondStaysTight) {
    // The rhombus tips land on the diagonals, so the box shrinks.
    const Shape diamond = makeDiamond(1, 0.0f, 0.0f, 10.0f, 10.0f, kPi / 4.0f);
    const float half = 5.0f * std::sqrt(0.5f);
    expectBoundsNear(rotatedBounds(diamond), Bounds{5.0f - half, 5.0f - half, 5.0f + half, 5.0f + half});
}

TEST(GeometryKernelTest, LinearPivotIsBoxCenterNotCentroid) {
    // Centroid is (4, 0); the box centre is (5, 0).
    const Shape line = makeLinear(ShapeKind::Line, 1, 0.0f, 0.0f, {{0.0f, 0.0f}, {2.0f, 0.0f}, {10.0f, 0.0f}}, kPi / 2.0f);
    expectBoundsNear(rotatedBounds(line), Bounds{5.0f, -5.0f, 5.0f, 5.0f});
}

TEST(GeometryKernelTest, FlippedRectangleProducesOrderedBounds) {
    const Shape rect = makeRect(1, 10.0f, 10.0f, -10.0f, -4.0f);
    const Bounds b = rotatedBounds(rect);
    EXPECT_EQ(b, (Bounds{0.0f, 6.0f, 10.0f, 10.0f}));
    EXPECT_LE(b.minX, b.maxX);
    EXPECT_LE(b.minY, b.maxY);

    const Shape rotated = makeRect(2, 10.0f, 10.0f, -10.0f, -4.0f, degToRad(30.0f));
    const Bounds rb = rotatedBounds(rotated);
    EXPECT_LE(rb.minX, rb.maxX);
    EXPECT_LE(rb.minY, rb.maxY);
}

TEST(GeometryKernelTest, SingleVertexAndZeroSizeAreDegenerate) {
    const Shape dot = makeLinear(ShapeKind::FreeDraw, 1, 7.0f, 8.0f, {{0.0f, 0.0f}}, 1.0f);
    EXPECT_EQ(rotatedBounds(dot), (Bounds{7.0f, 8.0f, 7.0f, 8.0f}));

    const Shape flat = makeRect(2, 1.0f, 2.0f, 0.0f, 0.0f, 0.3f);
    expectBoundsNear(rotatedBounds(flat), Bounds{1.0f, 2.0f, 1.0f, 2.0f});
}

TEST(GeometryKernelTest, EmptyVertexSetIsRejected) {
    const Shape empty = makeLinear(ShapeKind::Arrow, 1, 0.0f, 0.0f, {});
    EXPECT_THROW(rotatedBounds(empty), std::invalid_argument);
    EXPECT_THROW(extentsOf({}), std::invalid_argument);
}

TEST(GeometryKernelTest, InverseRotationRoundTrips) {
    const Shape rect = makeRect(1, 3.0f, -2.0f, 14.0f, 6.0f, degToRad(37.0f));
    const std::vector<Point2> local = localVertices(rect);
    const Extents original = extentsOf(local);
    const Point2 pivot{original.cx, original.cy};

    std::vector<Point2> roundTrip;
    for (const Point2& p : local) {
        roundTrip.push_back(rotatePoint(rotatePoint(p, pivot, rect.angle), pivot, -rect.angle));
    }
    const Extents back = extentsOf(roundTrip);
    EXPECT_NEAR(back.minX, original.minX, kEps);
    EXPECT_NEAR(back.minY, original.minY, kEps);
    EXPECT_NEAR(back.maxX, original.maxX, kEps);
    EXPECT_NEAR(back.maxY, original.maxY, kEps);

    // A rectangle is symmetric about its centre: +theta and -theta give the same box.
    Shape mirrored = rect;
    mirrored.angle = -rect.angle;
    expectBoundsNear(rotatedBounds(rect), rotatedBounds(mirrored));
}

TEST(GeometryKernelTest, AbsoluteCoordsIgnoreRotationAndSign) {
    const Shape rect = makeRect(1, 20.0f, 5.0f, -8.0f, 6.0f, 1.2f);
    const AbsoluteCoords c = absoluteCoords(rect);
    EXPECT_FLOAT_EQ(c.x1, 12.0f);
    EXPECT_FLOAT_EQ(c.y1, 5.0f);
    EXPECT_FLOAT_EQ(c.x2, 20.0f);
    EXPECT_FLOAT_EQ(c.y2, 11.0f);
    EXPECT_FLOAT_EQ(c.cx, 16.0f);
    EXPECT_FLOAT_EQ(c.cy, 8.0f);
}

TEST(GeometryKernelTest, SegmentDistanceClampsToEndpoints) {
    const Point2 a{0.0f, 0.0f};
    const Point2 b{10.0f, 0.0f};
    EXPECT_NEAR(distanceToSegment(Point2{5.0f, 5.0f}, a, b), 5.0f, kEps);
    EXPECT_NEAR(distanceToSegment(Point2{-3.0f, 4.0f}, a, b), 5.0f, kEps);
    EXPECT_NEAR(distanceToSegment(Point2{13.0f, -4.0f}, a, b), 5.0f, kEps);
    EXPECT_NEAR(distanceToSegment(Point2{3.0f, 4.0f}, a, a), 5.0f, kEps);

    EXPECT_TRUE(segmentIncludesPoint(Point2{5.0f, 2.0f}, Segment{a, b}, 2.0f));
    EXPECT_FALSE(segmentIncludesPoint(Point2{5.0f, 2.5f}, Segment{a, b}, 2.0f));
}

TEST(GeometryKernelTest, SelectionBordersRunClockwiseFromTop) {
    const SelectionBorders borders =
        selectionBorders(Point2{0.0f, 0.0f}, Point2{10.0f, 4.0f}, Point2{5.0f, 2.0f}, 0.0f);
    // n
    EXPECT_FLOAT_EQ(borders[0].a.x, 0.0f);
    EXPECT_FLOAT_EQ(borders[0].b.x, 10.0f);
    EXPECT_FLOAT_EQ(borders[0].a.y, 0.0f);
    // e
    EXPECT_FLOAT_EQ(borders[1].a.x, 10.0f);
    EXPECT_FLOAT_EQ(borders[1].b.y, 4.0f);
    // s
    EXPECT_FLOAT_EQ(borders[2].a.y, 4.0f);
    EXPECT_FLOAT_EQ(borders[2].b.x, 0.0f);
    // w
    EXPECT_FLOAT_EQ(borders[3].a.x, 0.0f);
    EXPECT_FLOAT_EQ(borders[3].b.y, 0.0f);

    const SelectionBorders turned =
        selectionBorders(Point2{0.0f, 0.0f}, Point2{10.0f, 4.0f}, Point2{5.0f, 2.0f}, kPi / 2.0f);
    // After a quarter turn the top edge is vertical, on the right of the centre.
    EXPECT_NEAR(turned[0].a.x, 7.0f, kEps);
    EXPECT_NEAR(turned[0].b.x, 7.0f, kEps);
}
