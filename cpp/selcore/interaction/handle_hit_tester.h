#pragma once

#include "selcore/core/selection_constants.h"
#include "selcore/core/shape.h"
#include "selcore/core/types.h"
#include "selcore/entity/selection_state.h"
#include "selcore/geometry/geometry_kernel.h"
#include "selcore/interaction/transform_handles.h"
#include <optional>
#include <vector>

namespace selcore {

struct HitTestConfig {
    // Screen-space tolerance for grabbing a bounding-box side.
    float sideResizeThresholdPx = selection_constants::SIDE_RESIZING_THRESHOLD_PX;
};

struct ElementHandleHit {
    const Shape* element; // borrowed from the tested collection
    HandleType handle;
};

// Rotation first, then nw, ne, sw, se, n, s, w, e. First hit wins.
HandleType hitTestHandles(float x, float y, const TransformHandles& handles) noexcept;

// Tests the pointer against the n, e, s, w borders of `coords` inflated by
// `spacing` and rotated by `angle` about its centre.
HandleType hitTestSides(const AbsoluteCoords& coords, float angle, float x, float y, float spacing) noexcept;

class HandleHitTester {
public:
    explicit HandleHitTester(const TransformHandleLayout& layout, HitTestConfig config = HitTestConfig{});

    // World-space side tolerance at `zoom`. Throws std::invalid_argument
    // unless zoom is finite and positive.
    float sideSpacing(float zoom) const;

    // Pure form: positioned handles and the side-resize capability are given.
    HandleType resizeTest(
        const Shape& shape,
        const SelectionState& selection,
        Point2 pointer,
        const TransformHandles& handles,
        float zoom,
        bool sideResizeEnabled) const;

    // Handles come from the layout, with sides omitted when the device can
    // resize from the border.
    HandleType resizeTest(
        const Shape& shape,
        const ShapeMap& shapes,
        const SelectionState& selection,
        Point2 pointer,
        float zoom,
        PointerType pointerType,
        const Device& device) const;

    // Multi-element selection box (axis aligned, unrotated).
    HandleType hitTestAgainstFixedBounds(
        const Bounds& bounds,
        Point2 pointer,
        float zoom,
        PointerType pointerType,
        const Device& device) const;

    std::optional<ElementHandleHit> firstHitElement(
        const std::vector<Shape>& elements,
        const ShapeMap& shapes,
        const SelectionState& selection,
        Point2 pointer,
        float zoom,
        PointerType pointerType,
        const Device& device) const;

    const HitTestConfig& config() const { return config_; }

private:
    const TransformHandleLayout& layout_;
    HitTestConfig config_;
};

} // namespace selcore
