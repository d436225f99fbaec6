#include "selcore/entity/selection_state.h"
#include <algorithm>

namespace selcore {

SelectionState::SelectionState(std::initializer_list<ShapeId> ids) {
    const std::vector<ShapeId> list(ids);
    setSelection(list, Mode::Replace);
}

void SelectionState::setSelection(const ShapeId* ids, std::uint32_t count, Mode mode) {
    bool changed = false;

    auto applyInsert = [&](ShapeId id) {
        if (set_.insert(id).second) {
            ordered_.push_back(id);
            changed = true;
        }
    };
    auto applyErase = [&](ShapeId id) {
        const auto it = set_.find(id);
        if (it != set_.end()) {
            set_.erase(it);
            ordered_.erase(std::remove(ordered_.begin(), ordered_.end(), id), ordered_.end());
            changed = true;
        }
    };

    if (mode == Mode::Replace) {
        if (!set_.empty()) {
            set_.clear();
            ordered_.clear();
            changed = true;
        }
    }

    for (std::uint32_t i = 0; i < count; i++) {
        const ShapeId id = ids[i];
        switch (mode) {
            case Mode::Replace:
            case Mode::Add:
                applyInsert(id);
                break;
            case Mode::Remove:
                applyErase(id);
                break;
            case Mode::Toggle:
                if (set_.find(id) != set_.end()) {
                    applyErase(id);
                } else {
                    applyInsert(id);
                }
                break;
        }
    }

    if (changed) {
        generation_++;
    }
}

void SelectionState::clearSelection() {
    if (set_.empty()) return;
    set_.clear();
    ordered_.clear();
    generation_++;
}

} // namespace selcore
