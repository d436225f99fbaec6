#include "selcore/query/spatial_query.h"
#include "selcore/core/logging.h"
#include "selcore/geometry/geometry_kernel.h"
#include <unordered_set>

namespace selcore {

namespace {
inline bool rangeIncludes(float value, float lo, float hi) {
    return value >= lo && value <= hi;
}

inline bool contains(const Bounds& outer, const Bounds& inner) {
    return outer.minX <= inner.minX &&
           outer.maxX >= inner.maxX &&
           outer.minY <= inner.minY &&
           outer.maxY >= inner.maxY;
}

bool classify(const Shape& shape, const Bounds& bbox, OverlapMode mode) {
    switch (mode) {
        case OverlapMode::Overlap:
            return overlapsOrContains(shape, bbox);
        case OverlapMode::Contain:
            return isInside(shape, bbox, true);
        case OverlapMode::Inside:
        default:
            return isInside(shape, bbox);
    }
}

// Relation targets are added without classification and are not expanded.
void addRelations(const Shape& shape, std::unordered_set<ShapeId>& included) {
    for (const ShapeId bound : shape.boundElements) {
        included.insert(bound);
    }
    if (isTextLike(shape) && shape.containerId) {
        included.insert(*shape.containerId);
    }
    if (isArrowLike(shape)) {
        if (shape.startBinding) included.insert(*shape.startBinding);
        if (shape.endBinding) included.insert(*shape.endBinding);
    }
}
} // namespace

std::optional<OverlapMode> parseOverlapMode(std::string_view name) {
    if (name == "inside") return OverlapMode::Inside;
    if (name == "contain") return OverlapMode::Contain;
    if (name == "overlap") return OverlapMode::Overlap;
    return std::nullopt;
}

Bounds RotatedBoundsResolver::boundsOf(const Shape& shape, const ShapeMap& /*shapes*/) const {
    return rotatedBounds(shape);
}

bool isInside(const Shape& shape, const Bounds& bbox, bool eitherDirection) {
    const Bounds shapeBounds = rotatedBounds(shape);
    if (contains(bbox, shapeBounds)) return true;
    return eitherDirection && contains(shapeBounds, bbox);
}

bool overlapsOrContains(const Shape& shape, const Bounds& bbox) {
    const Bounds s = rotatedBounds(shape);
    const bool overlapX =
        rangeIncludes(s.minX, bbox.minX, bbox.maxX) || rangeIncludes(bbox.minX, s.minX, s.maxX);
    const bool overlapY =
        rangeIncludes(s.minY, bbox.minY, bbox.maxY) || rangeIncludes(bbox.minY, s.minY, s.maxY);
    return overlapX && overlapY;
}

std::vector<ShapeId> selectOverlapping(
    const std::vector<Shape>& elements,
    const Bounds& bounds,
    OverlapMode mode,
    float errorMargin) {
    const Bounds adjusted = bounds.inflated(errorMargin);

    std::unordered_set<ShapeId> included;
    for (const Shape& element : elements) {
        if (included.find(element.id) != included.end()) continue;
        if (!classify(element, adjusted, mode)) continue;
        included.insert(element.id);
        addRelations(element, included);
    }

    std::vector<ShapeId> result;
    result.reserve(included.size());
    for (const Shape& element : elements) {
        if (included.find(element.id) != included.end()) {
            result.push_back(element.id);
        }
    }
    if (result.size() < included.size()) {
        SELCORE_LOG_DEBUG("selectOverlapping: dropped %zu relation ids not in collection",
                          included.size() - result.size());
    }
    return result;
}

std::vector<ShapeId> selectOverlapping(
    const std::vector<Shape>& elements,
    const Shape& reference,
    const BoundsResolver& resolver,
    OverlapMode mode,
    float errorMargin) {
    const ShapeMap shapes = indexShapes(elements);
    return selectOverlapping(elements, resolver.boundsOf(reference, shapes), mode, errorMargin);
}

} // namespace selcore
