#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/val.h>
#endif

#include "selcore/core/logging.h"
#include "selcore/core/shape.h"
#include "selcore/entity/selection_state.h"
#include "selcore/geometry/geometry_kernel.h"
#include "selcore/interaction/cursor_resolver.h"
#include "selcore/interaction/handle_hit_tester.h"
#include "selcore/interaction/transform_handles.h"
#include "selcore/query/spatial_query.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#ifdef EMSCRIPTEN
using emscripten::val;
using namespace selcore;

namespace {

ShapeKind parseShapeKind(const std::string& type) {
    if (type == "ellipse") return ShapeKind::Ellipse;
    if (type == "text") return ShapeKind::Text;
    if (type == "image") return ShapeKind::Image;
    if (type == "frame") return ShapeKind::Frame;
    if (type == "diamond") return ShapeKind::Diamond;
    if (type == "line") return ShapeKind::Line;
    if (type == "arrow") return ShapeKind::Arrow;
    if (type == "freedraw") return ShapeKind::FreeDraw;
    return ShapeKind::Rectangle;
}

std::optional<ShapeId> optionalId(const val& v) {
    if (v.isUndefined() || v.isNull()) return std::nullopt;
    return v.as<ShapeId>();
}

// { id, type, x, y, width, height, angle, points: [[x, y]...],
//   boundElements: [id...], containerId, startBinding, endBinding }
Shape shapeFromVal(const val& v) {
    Shape s;
    s.id = v["id"].as<ShapeId>();
    s.kind = parseShapeKind(v["type"].as<std::string>());
    s.x = v["x"].as<float>();
    s.y = v["y"].as<float>();
    s.width = v["width"].as<float>();
    s.height = v["height"].as<float>();
    s.angle = v["angle"].isUndefined() ? 0.0f : v["angle"].as<float>();

    const val points = v["points"];
    if (!points.isUndefined() && !points.isNull()) {
        const unsigned n = points["length"].as<unsigned>();
        s.points.reserve(n);
        for (unsigned i = 0; i < n; ++i) {
            const val p = points[i];
            s.points.push_back(Point2{p[0].as<float>(), p[1].as<float>()});
        }
    }

    const val bound = v["boundElements"];
    if (!bound.isUndefined() && !bound.isNull()) {
        const unsigned n = bound["length"].as<unsigned>();
        for (unsigned i = 0; i < n; ++i) {
            s.boundElements.push_back(bound[i].as<ShapeId>());
        }
    }
    s.containerId = optionalId(v["containerId"]);
    s.startBinding = optionalId(v["startBinding"]);
    s.endBinding = optionalId(v["endBinding"]);
    return s;
}

std::vector<Shape> shapesFromVal(const val& array) {
    std::vector<Shape> shapes;
    const unsigned n = array["length"].as<unsigned>();
    shapes.reserve(n);
    for (unsigned i = 0; i < n; ++i) {
        shapes.push_back(shapeFromVal(array[i]));
    }
    return shapes;
}

// { n: [x, y, w, h], rotation: [...], ... }
TransformHandles handlesFromVal(const val& obj) {
    std::vector<std::pair<std::string, TransformHandle>> entries;
    if (obj.isUndefined() || obj.isNull()) return TransformHandles{};
    const val keys = val::global("Object").call<val>("keys", obj);
    const unsigned n = keys["length"].as<unsigned>();
    for (unsigned i = 0; i < n; ++i) {
        const std::string key = keys[i].as<std::string>();
        const val h = obj[key];
        if (h.isUndefined() || h.isNull()) continue;
        entries.emplace_back(key, TransformHandle{
            h[0].as<float>(), h[1].as<float>(), h[2].as<float>(), h[3].as<float>()});
    }
    return TransformHandles::fromKeyed(entries);
}

Device deviceFromVal(const val& v) {
    Device d;
    d.isMobileViewport = v["isMobileViewport"].as<bool>();
    d.isTouchScreen = v["isTouchScreen"].as<bool>();
    d.isMobilePlatform = v["isMobilePlatform"].as<bool>();
    return d;
}

// Delegates handle positioning to the host's layout callbacks:
//   forShape(id, zoom, pointerType, omitSidesMask)
//   forBounds([minX, minY, maxX, maxY], angle, zoom, pointerType, omitSidesMask)
class JsHandleLayout : public TransformHandleLayout {
public:
    explicit JsHandleLayout(val layout) : layout_(std::move(layout)) {}

    TransformHandles handlesForShape(
        const Shape& shape,
        const ShapeMap& /*shapes*/,
        float zoom,
        PointerType pointerType,
        OmitSides omitSides) const override {
        return handlesFromVal(layout_.call<val>(
            "forShape",
            shape.id,
            zoom,
            static_cast<unsigned>(pointerType),
            static_cast<unsigned>(omitSides)));
    }

    TransformHandles handlesForBounds(
        const Bounds& bounds,
        float angle,
        float zoom,
        PointerType pointerType,
        OmitSides omitSides) const override {
        val box = val::array();
        box.call<void>("push", bounds.minX, bounds.minY, bounds.maxX, bounds.maxY);
        return handlesFromVal(layout_.call<val>(
            "forBounds",
            box,
            angle,
            zoom,
            static_cast<unsigned>(pointerType),
            static_cast<unsigned>(omitSides)));
    }

private:
    val layout_;
};

SelectionState selectionFromVal(const val& ids) {
    SelectionState selection;
    const unsigned n = ids["length"].as<unsigned>();
    std::vector<ShapeId> list;
    list.reserve(n);
    for (unsigned i = 0; i < n; ++i) list.push_back(ids[i].as<ShapeId>());
    selection.setSelection(list, SelectionState::Mode::Replace);
    return selection;
}

Bounds jsRotatedBounds(val shape) {
    return rotatedBounds(shapeFromVal(shape));
}

bool jsIsInside(val shape, Bounds bbox, bool eitherDirection) {
    return isInside(shapeFromVal(shape), bbox, eitherDirection);
}

bool jsOverlapsOrContains(val shape, Bounds bbox) {
    return overlapsOrContains(shapeFromVal(shape), bbox);
}

std::vector<ShapeId> jsSelectOverlapping(val elements, Bounds bounds, std::string mode, float errorMargin) {
    const std::optional<OverlapMode> parsed = parseOverlapMode(mode);
    if (!parsed) {
        SELCORE_LOG_WARN("selectOverlapping: unknown mode '%s'", mode.c_str());
        return {};
    }
    return selectOverlapping(shapesFromVal(elements), bounds, *parsed, errorMargin);
}

std::string jsHitTestHandles(float x, float y, val handles) {
    return handleTypeName(hitTestHandles(x, y, handlesFromVal(handles)));
}

std::string jsResizeTest(val shape, val selectedIds, float x, float y, float zoom,
                         unsigned pointerType, val device, val layout) {
    const Shape s = shapeFromVal(shape);
    const JsHandleLayout jsLayout(layout);
    const HandleHitTester tester(jsLayout);
    const ShapeMap shapes{{s.id, &s}};
    return handleTypeName(tester.resizeTest(
        s, shapes, selectionFromVal(selectedIds), Point2{x, y}, zoom,
        static_cast<PointerType>(pointerType), deviceFromVal(device)));
}

std::string jsHitTestAgainstFixedBounds(Bounds bounds, float x, float y, float zoom,
                                        unsigned pointerType, val device, val layout) {
    const JsHandleLayout jsLayout(layout);
    const HandleHitTester tester(jsLayout);
    return handleTypeName(tester.hitTestAgainstFixedBounds(
        bounds, Point2{x, y}, zoom, static_cast<PointerType>(pointerType), deviceFromVal(device)));
}

val jsFirstHitElement(val elements, val selectedIds, float x, float y, float zoom,
                      unsigned pointerType, val device, val layout) {
    const std::vector<Shape> shapes = shapesFromVal(elements);
    const ShapeMap map = indexShapes(shapes);
    const JsHandleLayout jsLayout(layout);
    const HandleHitTester tester(jsLayout);
    const auto hit = tester.firstHitElement(
        shapes, map, selectionFromVal(selectedIds), Point2{x, y}, zoom,
        static_cast<PointerType>(pointerType), deviceFromVal(device));
    if (!hit) return val::null();
    val result = val::object();
    result.set("id", hit->element->id);
    result.set("handle", std::string(handleTypeName(hit->handle)));
    return result;
}

std::string jsCursorFor(std::string handle, float angle, float width, float height) {
    const std::optional<HandleType> type = parseHandleType(handle);
    if (!type) return std::string();
    return cursorFor(*type, angle, width, height);
}

} // namespace

EMSCRIPTEN_BINDINGS(selcore_module) {
    emscripten::value_object<Bounds>("Bounds")
        .field("minX", &Bounds::minX)
        .field("minY", &Bounds::minY)
        .field("maxX", &Bounds::maxX)
        .field("maxY", &Bounds::maxY);

    emscripten::register_vector<ShapeId>("VectorShapeId");

    emscripten::function("rotatedBounds", &jsRotatedBounds);
    emscripten::function("isInside", &jsIsInside);
    emscripten::function("overlapsOrContains", &jsOverlapsOrContains);
    emscripten::function("selectOverlapping", &jsSelectOverlapping);
    emscripten::function("hitTestHandles", &jsHitTestHandles);
    emscripten::function("resizeTest", &jsResizeTest);
    emscripten::function("hitTestAgainstFixedBounds", &jsHitTestAgainstFixedBounds);
    emscripten::function("firstHitElement", &jsFirstHitElement);
    emscripten::function("cursorFor", &jsCursorFor);
}
#endif
