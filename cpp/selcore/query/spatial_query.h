#pragma once

#include "selcore/core/shape.h"
#include "selcore/core/types.h"
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace selcore {

enum class OverlapMode : std::uint8_t {
    Inside = 0,  // element inside bounds
    Contain = 1, // element inside bounds, or bounds inside element
    Overlap = 2  // element overlapping or containing bounds
};

std::optional<OverlapMode> parseOverlapMode(std::string_view name);

// Maps a shape to its world-space bounds. May consult the shape's relations
// through `shapes` (e.g. a container sizing around its label).
class BoundsResolver {
public:
    virtual ~BoundsResolver() = default;
    virtual Bounds boundsOf(const Shape& shape, const ShapeMap& shapes) const = 0;
};

// Resolves bounds through rotatedBounds(); relations are not consulted.
class RotatedBoundsResolver : public BoundsResolver {
public:
    Bounds boundsOf(const Shape& shape, const ShapeMap& shapes) const override;
};

bool isInside(const Shape& shape, const Bounds& bbox, bool eitherDirection = false);
bool overlapsOrContains(const Shape& shape, const Bounds& bbox);

// Ids of the elements matching `mode` against `bounds` expanded by
// `errorMargin`, plus the single-hop relation closure of every match, in the
// order of `elements`.
std::vector<ShapeId> selectOverlapping(
    const std::vector<Shape>& elements,
    const Bounds& bounds,
    OverlapMode mode,
    float errorMargin = 0.0f);

// Same, with the bounds of `reference` resolved against the whole collection.
std::vector<ShapeId> selectOverlapping(
    const std::vector<Shape>& elements,
    const Shape& reference,
    const BoundsResolver& resolver,
    OverlapMode mode,
    float errorMargin = 0.0f);

} // namespace selcore
