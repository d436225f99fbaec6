#include "selcore/interaction/transform_handles.h"
#include "selcore/core/logging.h"

namespace selcore {

namespace {
constexpr std::array<const char*, kHandleTypeCount> kHandleNames = {
    "", "n", "s", "w", "e", "nw", "ne", "sw", "se", "rotation"};

inline std::size_t slot(HandleType type) {
    return static_cast<std::size_t>(type);
}
} // namespace

const char* handleTypeName(HandleType type) noexcept {
    const std::size_t i = slot(type);
    return i < kHandleNames.size() ? kHandleNames[i] : "";
}

std::optional<HandleType> parseHandleType(std::string_view name) noexcept {
    for (std::size_t i = 1; i < kHandleNames.size(); ++i) {
        if (name == kHandleNames[i]) return static_cast<HandleType>(i);
    }
    return std::nullopt;
}

bool canResizeFromSides(const Device& device) noexcept {
    if (device.isMobileViewport) return false;
    if (device.isTouchScreen && device.isMobilePlatform) return false;
    return true;
}

OmitSides omitSidesForDevice(const Device& device) noexcept {
    return canResizeFromSides(device) ? OmitSides::All : OmitSides::None;
}

bool isInsideTransformHandle(const TransformHandle& handle, float x, float y) noexcept {
    return x >= handle.x &&
           x <= handle.x + handle.width &&
           y >= handle.y &&
           y <= handle.y + handle.height;
}

void TransformHandles::set(HandleType type, const TransformHandle& handle) {
    if (type == HandleType::None) return;
    handles_[slot(type)] = handle;
}

void TransformHandles::erase(HandleType type) {
    handles_[slot(type)].reset();
}

bool TransformHandles::has(HandleType type) const {
    return handles_[slot(type)].has_value();
}

const std::optional<TransformHandle>& TransformHandles::get(HandleType type) const {
    return handles_[slot(type)];
}

bool TransformHandles::empty() const {
    for (const auto& h : handles_) {
        if (h) return false;
    }
    return true;
}

TransformHandles TransformHandles::fromKeyed(
    const std::vector<std::pair<std::string, TransformHandle>>& entries) {
    TransformHandles handles;
    for (const auto& entry : entries) {
        const std::optional<HandleType> type = parseHandleType(entry.first);
        if (!type) {
            SELCORE_LOG_WARN("ignoring unknown transform handle key '%s'", entry.first.c_str());
            continue;
        }
        handles.set(*type, entry.second);
    }
    return handles;
}

} // namespace selcore
