#pragma once

#include "selcore/core/types.h"
#include "selcore/core/shape.h"
#include <array>
#include <vector>

namespace selcore {

// Min/max extents of a vertex set plus the midpoint of those extents.
struct Extents {
    float minX, minY, maxX, maxY;
    float cx, cy;
};

// Unrotated world-space extents of a shape and its rotation pivot.
struct AbsoluteCoords {
    float x1, y1, x2, y2;
    float cx, cy;
};

struct Segment {
    Point2 a;
    Point2 b;
};

// Rotated edges of a box, ordered n, e, s, w.
using SelectionBorders = std::array<Segment, 4>;

// Rotate `p` about `center` by `angle` radians:
//   x' = cx + dx*cos - dy*sin,  y' = cy + dx*sin + dy*cos
Point2 rotatePoint(Point2 p, Point2 center, float angle) noexcept;

// Vertices relative to the shape's top-left origin, unrotated.
// Throws std::invalid_argument for a points-based shape without vertices.
std::vector<Point2> localVertices(const Shape& shape);

// Throws std::invalid_argument for an empty set.
Extents extentsOf(const std::vector<Point2>& points);

// Minimal axis-aligned box around the shape's rotated outline, in world space.
Bounds rotatedBounds(const Shape& shape);

AbsoluteCoords absoluteCoords(const Shape& shape);

float distanceToSegment(Point2 p, Point2 a, Point2 b) noexcept;
bool segmentIncludesPoint(Point2 p, const Segment& segment, float threshold) noexcept;

// Corners (topLeft, bottomRight) are rotated about `center`.
SelectionBorders selectionBorders(Point2 topLeft, Point2 bottomRight, Point2 center, float angle) noexcept;

} // namespace selcore
