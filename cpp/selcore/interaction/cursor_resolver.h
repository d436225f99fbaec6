#pragma once

#include "selcore/core/shape.h"
#include "selcore/interaction/transform_handles.h"
#include <string>

namespace selcore {

// Bi-directional resize cursor for `handle` on a shape with the given
// orientation, e.g. "nwse-resize". Rotation yields "grab", None yields "".
std::string cursorFor(HandleType handle, float angle, float width, float height);

// No shape (multi-element selection box): no flip swap, no rotation.
std::string cursorFor(HandleType handle);

inline std::string cursorForShape(HandleType handle, const Shape& shape) {
    return cursorFor(handle, shape.angle, shape.width, shape.height);
}

} // namespace selcore
