#pragma once

/**
 * @file selection_constants.h
 * @brief Constants for selection geometry and handle hit-testing.
 *
 * Host-side constants (cursor names, handle layout) MUST mirror these values.
 *
 * Handle test order (first hit wins):
 *   rotation, nw, ne, sw, se, n, s, w, e
 *
 * Side test order:
 *   n (top), e (right), s (bottom), w (left)
 */

namespace selcore {
namespace selection_constants {

// =============================================================================
// Side Resize
// =============================================================================

/// Distance from a bounding-box edge (in screen pixels) that still counts as
/// grabbing that edge. Converted to world units by dividing by zoom.
constexpr float SIDE_RESIZING_THRESHOLD_PX = 4.0f;

/// Linear shapes with this many points or fewer have no sides to resize from.
constexpr unsigned SIDE_RESIZE_MIN_LINEAR_POINTS = 3;

// =============================================================================
// Rotation
// =============================================================================

/// Angles with a magnitude below this are treated as unrotated.
constexpr float ROTATION_EPSILON_RAD = 1e-6f;

/// Cursor rotation step (45 degrees, in radians).
constexpr float CURSOR_STEP_RAD = 0.785398163397448f; // pi/4

// =============================================================================
// Cursor Tokens
// =============================================================================

constexpr const char* CURSOR_RESIZE_SUFFIX = "-resize";
constexpr const char* CURSOR_ROTATE = "grab";

} // namespace selection_constants
} // namespace selcore
