#include "widget/widget_list_state.hpp"

#include <algorithm>

namespace rev::widget {

void WidgetListState::select(std::optional<std::size_t> index)
{
    selected_ = index;
    if (!index)
        offset_ = 0;
}

std::vector<int> WidgetListState::updateViewPort(const std::vector<int>& heights,
                                                 int max_height,
                                                 bool truncate)
{
    std::vector<int> view_heights;
    if (heights.empty() || max_height <= 0) {
        offset_ = 0;
        return view_heights;
    }

    // Nothing selected behaves like the first item; past the end like the last.
    const std::size_t selected = std::min(selected_.value_or(0), heights.size() - 1);

    if (selected < offset_)
        offset_ = selected;

    /* ───── forward: is the selection inside the current window? ───── */
    int  y     = 0;
    bool found = false;
    for (std::size_t i = offset_; i < heights.size(); ++i) {
        const int h = std::max(heights[i], 0);
        if (y + h > max_height) {
            if (truncate && y < max_height)
                view_heights.push_back(max_height - y);
            break;
        }
        if (i == selected)
            found = true;
        y += h;
        view_heights.push_back(h);
    }
    if (found)
        return view_heights;

    /* ───── backward: first item that still fits above the selection ───── */
    view_heights.clear();
    y = 0;
    for (std::size_t i = selected + 1; i-- > 0;) {
        const int h = std::max(heights[i], 0);
        if (y + h >= max_height) {
            if (truncate || view_heights.empty()) {
                // Cut the item; a selection taller than the viewport is
                // always shown this way so it never scrolls out of sight.
                view_heights.insert(view_heights.begin(), max_height - y);
                offset_ = i;
            } else {
                offset_ = i + 1;
            }
            return view_heights;
        }
        view_heights.insert(view_heights.begin(), h);
        y += h;
    }
    offset_ = 0;
    return view_heights;
}

} // namespace rev::widget
