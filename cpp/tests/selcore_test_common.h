#pragma once

#include <gtest/gtest.h>
#include "selcore/core/shape.h"
#include "selcore/core/types.h"
#include "selcore/interaction/transform_handles.h"
#include <cmath>
#include <unordered_map>
#include <utility>
#include <vector>

namespace selcore_test {
using namespace selcore;

inline constexpr float kPi = 3.14159265358979323846f;
inline constexpr float kEps = 1e-4f;

inline float degToRad(float deg) { return deg * kPi / 180.0f; }

inline Shape makeRect(ShapeId id, float x, float y, float w, float h, float angle = 0.0f) {
    Shape s;
    s.id = id;
    s.kind = ShapeKind::Rectangle;
    s.x = x;
    s.y = y;
    s.width = w;
    s.height = h;
    s.angle = angle;
    return s;
}

inline Shape makeDiamond(ShapeId id, float x, float y, float w, float h, float angle = 0.0f) {
    Shape s = makeRect(id, x, y, w, h, angle);
    s.kind = ShapeKind::Diamond;
    return s;
}

inline Shape makeLinear(ShapeKind kind, ShapeId id, float x, float y, std::vector<Point2> points, float angle = 0.0f) {
    Shape s;
    s.id = id;
    s.kind = kind;
    s.x = x;
    s.y = y;
    s.angle = angle;
    s.points = std::move(points);
    return s;
}

inline Shape makeText(ShapeId id, float x, float y, float w, float h, ShapeId container) {
    Shape s = makeRect(id, x, y, w, h);
    s.kind = ShapeKind::Text;
    s.containerId = container;
    return s;
}

inline void expectBoundsNear(const Bounds& actual, const Bounds& expected, float tol = kEps) {
    EXPECT_NEAR(actual.minX, expected.minX, tol);
    EXPECT_NEAR(actual.minY, expected.minY, tol);
    EXPECT_NEAR(actual.maxX, expected.maxX, tol);
    EXPECT_NEAR(actual.maxY, expected.maxY, tol);
}

// Square handle of `size` centred on (cx, cy).
inline TransformHandle handleAt(float cx, float cy, float size = 8.0f) {
    return TransformHandle{cx - size / 2.0f, cy - size / 2.0f, size, size};
}

// Lays out unrotated handles around a box: corners, side midpoints (unless
// omitted) and a rotation knob 20 units above the top edge. Records the
// arguments it was called with.
class BoxHandleLayout : public TransformHandleLayout {
public:
    TransformHandles handlesForShape(
        const Shape& shape,
        const ShapeMap& /*shapes*/,
        float zoom,
        PointerType pointerType,
        OmitSides omitSides) const override {
        ++shapeCalls;
        const auto it = overrides.find(shape.id);
        if (it != overrides.end()) {
            lastOmitSides = omitSides;
            return it->second;
        }
        return layout(Bounds::fromCorners(shape.x, shape.y, shape.x + shape.width, shape.y + shape.height),
                      zoom, pointerType, omitSides);
    }

    TransformHandles handlesForBounds(
        const Bounds& bounds,
        float angle,
        float zoom,
        PointerType pointerType,
        OmitSides omitSides) const override {
        lastAngle = angle;
        return layout(bounds, zoom, pointerType, omitSides);
    }

    std::unordered_map<ShapeId, TransformHandles> overrides;
    mutable OmitSides lastOmitSides = OmitSides::None;
    mutable float lastAngle = -1.0f;
    mutable int shapeCalls = 0;

private:
    TransformHandles layout(const Bounds& b, float zoom, PointerType /*pointerType*/, OmitSides omitSides) const {
        lastOmitSides = omitSides;
        const float size = 8.0f / zoom;
        TransformHandles h;
        h.set(HandleType::NW, handleAt(b.minX, b.minY, size));
        h.set(HandleType::NE, handleAt(b.maxX, b.minY, size));
        h.set(HandleType::SW, handleAt(b.minX, b.maxY, size));
        h.set(HandleType::SE, handleAt(b.maxX, b.maxY, size));
        if (!hasSide(omitSides, OmitSides::N)) h.set(HandleType::N, handleAt(b.centerX(), b.minY, size));
        if (!hasSide(omitSides, OmitSides::S)) h.set(HandleType::S, handleAt(b.centerX(), b.maxY, size));
        if (!hasSide(omitSides, OmitSides::W)) h.set(HandleType::W, handleAt(b.minX, b.centerY(), size));
        if (!hasSide(omitSides, OmitSides::E)) h.set(HandleType::E, handleAt(b.maxX, b.centerY(), size));
        h.set(HandleType::Rotation, handleAt(b.centerX(), b.minY - 20.0f / zoom, size));
        return h;
    }
};

inline Device desktopDevice() { return Device{}; }

inline Device phoneDevice() {
    Device d;
    d.isMobileViewport = true;
    d.isTouchScreen = true;
    d.isMobilePlatform = true;
    return d;
}

} // namespace selcore_test
