#include "selcore/geometry/geometry_kernel.h"
#include "selcore/core/selection_constants.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace selcore {

namespace {
inline float distSq(float x1, float y1, float x2, float y2) {
    const float dx = x1 - x2;
    const float dy = y1 - y2;
    return dx * dx + dy * dy;
}

inline bool isUnrotated(float angle) {
    return std::abs(angle) < selection_constants::ROTATION_EPSILON_RAD;
}
} // namespace

Point2 rotatePoint(Point2 p, Point2 center, float angle) noexcept {
    if (isUnrotated(angle)) return p;
    const float cosR = std::cos(angle);
    const float sinR = std::sin(angle);
    const float dx = p.x - center.x;
    const float dy = p.y - center.y;
    return Point2{center.x + dx * cosR - dy * sinR, center.y + dx * sinR + dy * cosR};
}

std::vector<Point2> localVertices(const Shape& shape) {
    const float w = shape.width;
    const float h = shape.height;
    switch (vertexRuleFor(shape.kind)) {
        case VertexRule::Diamond:
            return {{w / 2.0f, 0.0f}, {w, h / 2.0f}, {w / 2.0f, h}, {0.0f, h / 2.0f}};
        case VertexRule::Points:
            if (shape.points.empty()) {
                throw std::invalid_argument("selcore: points-based shape has no vertices");
            }
            return shape.points;
        case VertexRule::RectangleLike:
        default:
            return {{0.0f, 0.0f}, {w, 0.0f}, {w, h}, {0.0f, h}};
    }
}

Extents extentsOf(const std::vector<Point2>& points) {
    if (points.empty()) {
        throw std::invalid_argument("selcore: extents of an empty vertex set");
    }
    Extents e{
        std::numeric_limits<float>::infinity(),
        std::numeric_limits<float>::infinity(),
        -std::numeric_limits<float>::infinity(),
        -std::numeric_limits<float>::infinity(),
        0.0f,
        0.0f};
    for (const Point2& p : points) {
        e.minX = std::min(e.minX, p.x);
        e.minY = std::min(e.minY, p.y);
        e.maxX = std::max(e.maxX, p.x);
        e.maxY = std::max(e.maxY, p.y);
    }
    e.cx = (e.minX + e.maxX) / 2.0f;
    e.cy = (e.minY + e.maxY) / 2.0f;
    return e;
}

Bounds rotatedBounds(const Shape& shape) {
    std::vector<Point2> points = localVertices(shape);

    if (!isUnrotated(shape.angle)) {
        const Extents local = extentsOf(points);
        const Point2 pivot{local.cx, local.cy};
        for (Point2& p : points) {
            p = rotatePoint(p, pivot, shape.angle);
        }
    }

    const Extents rotated = extentsOf(points);
    return Bounds{
        rotated.minX + shape.x,
        rotated.minY + shape.y,
        rotated.maxX + shape.x,
        rotated.maxY + shape.y};
}

AbsoluteCoords absoluteCoords(const Shape& shape) {
    const Extents e = extentsOf(localVertices(shape));
    return AbsoluteCoords{
        e.minX + shape.x,
        e.minY + shape.y,
        e.maxX + shape.x,
        e.maxY + shape.y,
        e.cx + shape.x,
        e.cy + shape.y};
}

float distanceToSegment(Point2 p, Point2 a, Point2 b) noexcept {
    const float l2 = distSq(a.x, a.y, b.x, b.y);
    if (l2 == 0.0f) return std::sqrt(distSq(p.x, p.y, a.x, a.y));
    float t = ((p.x - a.x) * (b.x - a.x) + (p.y - a.y) * (b.y - a.y)) / l2;
    t = std::max(0.0f, std::min(1.0f, t));
    return std::sqrt(distSq(p.x, p.y, a.x + t * (b.x - a.x), a.y + t * (b.y - a.y)));
}

bool segmentIncludesPoint(Point2 p, const Segment& segment, float threshold) noexcept {
    return distanceToSegment(p, segment.a, segment.b) <= threshold;
}

SelectionBorders selectionBorders(Point2 topLeft, Point2 bottomRight, Point2 center, float angle) noexcept {
    const Point2 tl = rotatePoint(topLeft, center, angle);
    const Point2 tr = rotatePoint(Point2{bottomRight.x, topLeft.y}, center, angle);
    const Point2 bl = rotatePoint(Point2{topLeft.x, bottomRight.y}, center, angle);
    const Point2 br = rotatePoint(bottomRight, center, angle);

    return SelectionBorders{{
        Segment{tl, tr}, // n
        Segment{tr, br}, // e
        Segment{br, bl}, // s
        Segment{bl, tl}, // w
    }};
}

} // namespace selcore
