#pragma once

#include "selcore/core/shape.h"
#include "selcore/core/types.h"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace selcore {

enum class HandleType : std::uint8_t {
    None = 0,
    N = 1,
    S = 2,
    W = 3,
    E = 4,
    NW = 5,
    NE = 6,
    SW = 7,
    SE = 8,
    Rotation = 9
};

constexpr std::size_t kHandleTypeCount = 10;

// Short name as used by hosts ("n", "nw", "rotation"); "" for None.
const char* handleTypeName(HandleType type) noexcept;
std::optional<HandleType> parseHandleType(std::string_view name) noexcept;

enum class PointerType : std::uint8_t { Mouse = 0, Pen = 1, Touch = 2 };

struct Device {
    bool isMobileViewport = false;
    bool isTouchScreen = false;
    bool isMobilePlatform = false; // Android / iOS
};

// Bitmask of side handles the layout should leave out.
enum class OmitSides : std::uint8_t {
    None = 0,
    N = 1 << 0,
    S = 1 << 1,
    E = 1 << 2,
    W = 1 << 3,
    All = (1 << 0) | (1 << 1) | (1 << 2) | (1 << 3)
};

inline OmitSides operator|(OmitSides a, OmitSides b) {
    return static_cast<OmitSides>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}
inline bool hasSide(OmitSides sides, OmitSides side) {
    return (static_cast<std::uint8_t>(sides) & static_cast<std::uint8_t>(side)) != 0;
}

bool canResizeFromSides(const Device& device) noexcept;
// When sides can be grabbed along the border, the side handles are dropped.
OmitSides omitSidesForDevice(const Device& device) noexcept;

// Positioned handle rectangle, in pointer space.
struct TransformHandle {
    float x, y, width, height;
};

bool isInsideTransformHandle(const TransformHandle& handle, float x, float y) noexcept;

// At most one positioned rectangle per handle type.
class TransformHandles {
public:
    void set(HandleType type, const TransformHandle& handle);
    void erase(HandleType type);
    bool has(HandleType type) const;
    const std::optional<TransformHandle>& get(HandleType type) const;
    bool empty() const;

    // Entries with unknown names (or "none") are skipped.
    static TransformHandles fromKeyed(const std::vector<std::pair<std::string, TransformHandle>>& entries);

private:
    std::array<std::optional<TransformHandle>, kHandleTypeCount> handles_{};
};

// Positions handle rectangles. Implemented by the host's layout module.
class TransformHandleLayout {
public:
    virtual ~TransformHandleLayout() = default;

    virtual TransformHandles handlesForShape(
        const Shape& shape,
        const ShapeMap& shapes,
        float zoom,
        PointerType pointerType,
        OmitSides omitSides) const = 0;

    virtual TransformHandles handlesForBounds(
        const Bounds& bounds,
        float angle,
        float zoom,
        PointerType pointerType,
        OmitSides omitSides) const = 0;
};

} // namespace selcore
