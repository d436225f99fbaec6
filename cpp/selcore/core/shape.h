#pragma once

#include "selcore/core/types.h"
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace selcore {

enum class ShapeKind : std::uint8_t {
    Rectangle = 0,
    Ellipse = 1,
    Text = 2,
    Image = 3,
    Frame = 4,
    Diamond = 5,
    Line = 6,
    Arrow = 7,
    FreeDraw = 8
};

// How a shape's local outline is generated from its fields.
enum class VertexRule : std::uint8_t {
    RectangleLike = 0, // four corners of width x height
    Diamond = 1,       // four edge midpoints of width x height
    Points = 2         // stored local-space vertices, verbatim
};

// Immutable drawable primitive. Relations hold identifiers only; they are
// resolved through a caller-owned ShapeMap.
struct Shape {
    ShapeId id = 0;
    ShapeKind kind = ShapeKind::Rectangle;
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;  // negative when flipped horizontally
    float height = 0.0f; // negative when flipped vertically
    float angle = 0.0f;  // radians, about the shape centre

    // Local-space outline for Line/Arrow/FreeDraw (relative to x, y).
    std::vector<Point2> points;

    // Relations
    std::vector<ShapeId> boundElements;
    std::optional<ShapeId> containerId;  // Text only
    std::optional<ShapeId> startBinding; // Arrow only
    std::optional<ShapeId> endBinding;   // Arrow only
};

using ShapeMap = std::unordered_map<ShapeId, const Shape*>;

VertexRule vertexRuleFor(ShapeKind kind) noexcept;

inline bool isTextLike(const Shape& s) { return s.kind == ShapeKind::Text; }
inline bool isArrowLike(const Shape& s) { return s.kind == ShapeKind::Arrow; }
inline bool isLinear(const Shape& s) { return s.kind == ShapeKind::Line || s.kind == ShapeKind::Arrow; }
inline bool isFreeDraw(const Shape& s) { return s.kind == ShapeKind::FreeDraw; }

// Index a collection by id. Pointers borrow from `shapes`; the map must not
// outlive it. Later duplicates replace earlier ones.
ShapeMap indexShapes(const std::vector<Shape>& shapes);

} // namespace selcore
