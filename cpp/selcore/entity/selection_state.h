#pragma once

#include "selcore/core/types.h"
#include <cstdint>
#include <initializer_list>
#include <unordered_set>
#include <vector>

namespace selcore {

// Explicit selection passed into hit-testing. Owned by the caller; selcore
// only reads it during a call.
class SelectionState {
public:
    enum class Mode : std::uint32_t { Replace = 0, Add = 1, Remove = 2, Toggle = 3 };

    SelectionState() = default;
    SelectionState(std::initializer_list<ShapeId> ids);

    void setSelection(const ShapeId* ids, std::uint32_t count, Mode mode);
    void setSelection(const std::vector<ShapeId>& ids, Mode mode) {
        setSelection(ids.data(), static_cast<std::uint32_t>(ids.size()), mode);
    }
    void clearSelection();

    // Ids in the order they were first selected.
    const std::vector<ShapeId>& getOrdered() const { return ordered_; }
    std::uint32_t getGeneration() const { return generation_; }
    bool isEmpty() const { return set_.empty(); }
    bool isSelected(ShapeId id) const { return set_.find(id) != set_.end(); }

private:
    std::unordered_set<ShapeId> set_;
    std::vector<ShapeId> ordered_;
    std::uint32_t generation_ = 0;
};

} // namespace selcore
