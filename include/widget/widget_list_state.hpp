#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace rev::widget {

class WidgetListState {
public:
    /// Index of the currently selected item.
    std::optional<std::size_t> selected() const { return selected_; }

    /// Index of the first item on screen.
    std::size_t offset() const { return offset_; }

    /// Clearing the selection scrolls back to the top.
    void select(std::optional<std::size_t> index);

    /**
     * Recomputes the visible window for this frame and returns the height
     * each visible item gets, top to bottom, starting at offset().
     *
     * Starts at the current offset and walks forward while items fit. If the
     * selection is in that window nothing moves. Otherwise it walks backward
     * from the selection to find the first item that still fits and makes it
     * the new offset. With `truncate` the last (forward) or first (backward)
     * item is cut to fill the remaining rows.
     */
    std::vector<int> updateViewPort(const std::vector<int>& heights, int max_height, bool truncate);

private:
    std::size_t                offset_ {0};
    std::optional<std::size_t> selected_;
};

} // namespace rev::widget
