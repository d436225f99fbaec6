#include "selcore/interaction/cursor_resolver.h"
#include "selcore/core/selection_constants.h"
#include <array>
#include <cmath>

namespace selcore {

namespace {
// Ordered clockwise in 45 degree steps.
constexpr std::array<const char*, 4> kResizeCursors = {"ns", "nesw", "ew", "nwse"};
constexpr int kNs = 0;
constexpr int kNesw = 1;
constexpr int kEw = 2;
constexpr int kNwse = 3;

inline int signOf(float v) {
    return (v > 0.0f) - (v < 0.0f);
}

// -1 when no resize cursor applies.
int baseCursorIndex(HandleType handle, bool swapCorners) {
    switch (handle) {
        case HandleType::N:
        case HandleType::S:
            return kNs;
        case HandleType::W:
        case HandleType::E:
            return kEw;
        case HandleType::NW:
        case HandleType::SE:
            return swapCorners ? kNesw : kNwse;
        case HandleType::NE:
        case HandleType::SW:
            return swapCorners ? kNwse : kNesw;
        default:
            return -1;
    }
}

std::string resizeCursor(int index) {
    return std::string(kResizeCursors[static_cast<std::size_t>(index)]) +
           selection_constants::CURSOR_RESIZE_SUFFIX;
}
} // namespace

std::string cursorFor(HandleType handle, float angle, float width, float height) {
    if (handle == HandleType::Rotation) return selection_constants::CURSOR_ROTATE;

    const bool flipped = signOf(width) * signOf(height) == -1;
    const int base = baseCursorIndex(handle, flipped);
    if (base < 0) return std::string();

    // Full turns do not change the cursor; fold them away before rounding.
    const float turn = 8.0f * selection_constants::CURSOR_STEP_RAD;
    const float folded = std::isfinite(angle) ? std::fmod(angle, turn) : 0.0f;
    // Half-up rounding, then a non-negative ring index for negative angles.
    const int steps = static_cast<int>(std::floor(folded / selection_constants::CURSOR_STEP_RAD + 0.5f));
    const int count = static_cast<int>(kResizeCursors.size());
    const int index = ((base + steps) % count + count) % count;
    return resizeCursor(index);
}

std::string cursorFor(HandleType handle) {
    if (handle == HandleType::Rotation) return selection_constants::CURSOR_ROTATE;
    const int base = baseCursorIndex(handle, false);
    if (base < 0) return std::string();
    return resizeCursor(base);
}

} // namespace selcore
