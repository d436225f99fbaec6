#ifndef SELCORE_CORE_TYPES_H
#define SELCORE_CORE_TYPES_H

#include <cstdint>
#include <algorithm>

// Lightweight value types shared by every selcore module.

namespace selcore {

using ShapeId = std::uint32_t;

struct Point2 { float x; float y; };

// Axis-aligned world-space rectangle. minX <= maxX and minY <= maxY always hold;
// zero-area bounds are valid.
struct Bounds {
    float minX, minY, maxX, maxY;

    float width() const { return maxX - minX; }
    float height() const { return maxY - minY; }
    float centerX() const { return (minX + maxX) * 0.5f; }
    float centerY() const { return (minY + maxY) * 0.5f; }

    // Builds bounds from two arbitrary corners, normalising the order.
    static Bounds fromCorners(float x0, float y0, float x1, float y1) {
        return Bounds{std::min(x0, x1), std::min(y0, y1), std::max(x0, x1), std::max(y0, y1)};
    }

    Bounds inflated(float margin) const {
        return Bounds{minX - margin, minY - margin, maxX + margin, maxY + margin};
    }
};

inline bool operator==(const Bounds& a, const Bounds& b) {
    return a.minX == b.minX && a.minY == b.minY && a.maxX == b.maxX && a.maxY == b.maxY;
}
inline bool operator!=(const Bounds& a, const Bounds& b) { return !(a == b); }

} // namespace selcore

#endif // SELCORE_CORE_TYPES_H
