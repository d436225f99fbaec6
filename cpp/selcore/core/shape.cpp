#include "selcore/core/shape.h"

namespace selcore {

VertexRule vertexRuleFor(ShapeKind kind) noexcept {
    switch (kind) {
        case ShapeKind::Diamond:
            return VertexRule::Diamond;
        case ShapeKind::Line:
        case ShapeKind::Arrow:
        case ShapeKind::FreeDraw:
            return VertexRule::Points;
        case ShapeKind::Rectangle:
        case ShapeKind::Ellipse:
        case ShapeKind::Text:
        case ShapeKind::Image:
        case ShapeKind::Frame:
        default:
            return VertexRule::RectangleLike;
    }
}

ShapeMap indexShapes(const std::vector<Shape>& shapes) {
    ShapeMap map;
    map.reserve(shapes.size());
    for (const Shape& s : shapes) {
        map[s.id] = &s;
    }
    return map;
}

} // namespace selcore
