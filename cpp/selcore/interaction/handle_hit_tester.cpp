#include "selcore/interaction/handle_hit_tester.h"
#include "selcore/core/logging.h"
#include <cmath>
#include <stdexcept>

namespace selcore {

namespace {
constexpr HandleType kDirectionalOrder[] = {
    HandleType::NW, HandleType::NE, HandleType::SW, HandleType::SE,
    HandleType::N, HandleType::S, HandleType::W, HandleType::E,
};

constexpr HandleType kSideOrder[] = {
    HandleType::N, HandleType::E, HandleType::S, HandleType::W,
};

// Two-point lines and arrows resize from their endpoints only.
inline bool hasResizableSides(const Shape& shape) {
    return !(isLinear(shape) &&
             shape.points.size() < selection_constants::SIDE_RESIZE_MIN_LINEAR_POINTS);
}

inline void requireValidZoom(float zoom) {
    if (!std::isfinite(zoom) || zoom <= 0.0f) {
        throw std::invalid_argument("selcore: zoom must be finite and positive");
    }
}
} // namespace

HandleType hitTestHandles(float x, float y, const TransformHandles& handles) noexcept {
    const auto& rotation = handles.get(HandleType::Rotation);
    if (rotation && isInsideTransformHandle(*rotation, x, y)) {
        return HandleType::Rotation;
    }

    for (const HandleType type : kDirectionalOrder) {
        const auto& handle = handles.get(type);
        if (handle && isInsideTransformHandle(*handle, x, y)) {
            return type;
        }
    }
    return HandleType::None;
}

HandleType hitTestSides(const AbsoluteCoords& coords, float angle, float x, float y, float spacing) noexcept {
    const SelectionBorders borders = selectionBorders(
        Point2{coords.x1 - spacing, coords.y1 - spacing},
        Point2{coords.x2 + spacing, coords.y2 + spacing},
        Point2{coords.cx, coords.cy},
        angle);

    const Point2 p{x, y};
    for (std::size_t i = 0; i < borders.size(); ++i) {
        if (segmentIncludesPoint(p, borders[i], spacing)) {
            return kSideOrder[i];
        }
    }
    return HandleType::None;
}

HandleHitTester::HandleHitTester(const TransformHandleLayout& layout, HitTestConfig config)
    : layout_(layout), config_(config) {}

float HandleHitTester::sideSpacing(float zoom) const {
    requireValidZoom(zoom);
    return config_.sideResizeThresholdPx / zoom;
}

HandleType HandleHitTester::resizeTest(
    const Shape& shape,
    const SelectionState& selection,
    Point2 pointer,
    const TransformHandles& handles,
    float zoom,
    bool sideResizeEnabled) const {
    if (!selection.isSelected(shape.id)) return HandleType::None;
    const float spacing = sideSpacing(zoom);

    const HandleType hit = hitTestHandles(pointer.x, pointer.y, handles);
    if (hit != HandleType::None) return hit;

    if (!sideResizeEnabled || !hasResizableSides(shape)) return HandleType::None;

    return hitTestSides(absoluteCoords(shape), shape.angle, pointer.x, pointer.y, spacing);
}

HandleType HandleHitTester::resizeTest(
    const Shape& shape,
    const ShapeMap& shapes,
    const SelectionState& selection,
    Point2 pointer,
    float zoom,
    PointerType pointerType,
    const Device& device) const {
    if (!selection.isSelected(shape.id)) return HandleType::None;
    requireValidZoom(zoom);

    const TransformHandles handles =
        layout_.handlesForShape(shape, shapes, zoom, pointerType, omitSidesForDevice(device));
    return resizeTest(shape, selection, pointer, handles, zoom, canResizeFromSides(device));
}

HandleType HandleHitTester::hitTestAgainstFixedBounds(
    const Bounds& bounds,
    Point2 pointer,
    float zoom,
    PointerType pointerType,
    const Device& device) const {
    const float spacing = sideSpacing(zoom);
    const TransformHandles handles =
        layout_.handlesForBounds(bounds, 0.0f, zoom, pointerType, omitSidesForDevice(device));

    const HandleType hit = hitTestHandles(pointer.x, pointer.y, handles);
    if (hit != HandleType::None) return hit;

    if (!canResizeFromSides(device)) return HandleType::None;

    const AbsoluteCoords coords{
        bounds.minX, bounds.minY, bounds.maxX, bounds.maxY, bounds.centerX(), bounds.centerY()};
    return hitTestSides(coords, 0.0f, pointer.x, pointer.y, spacing);
}

std::optional<ElementHandleHit> HandleHitTester::firstHitElement(
    const std::vector<Shape>& elements,
    const ShapeMap& shapes,
    const SelectionState& selection,
    Point2 pointer,
    float zoom,
    PointerType pointerType,
    const Device& device) const {
    for (const Shape& element : elements) {
        const HandleType handle = resizeTest(element, shapes, selection, pointer, zoom, pointerType, device);
        if (handle != HandleType::None) {
            SELCORE_LOG_DEBUG("firstHitElement: id=%u handle=%s", element.id, handleTypeName(handle));
            return ElementHandleHit{&element, handle};
        }
    }
    return std::nullopt;
}

} // namespace selcore
