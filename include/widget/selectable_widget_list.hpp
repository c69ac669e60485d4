#pragma once

#include "widget/rect.hpp"
#include "widget/widget_list_state.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace rev::widget {

/**
 * Scrollable list of variable-height items with one selected entry.
 *
 * T must provide
 *   int  height(bool selected) const;
 *   void render(const Rect& area, bool selected) const;
 * Heights are asked for on every render since an item may change size when
 * it is (de)selected.
 */
template <typename T>
class SelectableWidgetList {
public:
    SelectableWidgetList() = default;
    explicit SelectableWidgetList(std::vector<T> items) : items_(std::move(items)) {}

    /// Wrap around at either end instead of stopping.
    SelectableWidgetList& circular(bool on) { circular_ = on; return *this; }
    /// Fill the whole area, cutting the first/last visible item if needed.
    SelectableWidgetList& truncate(bool on) { truncate_ = on; return *this; }

    bool isCircular() const { return circular_; }
    bool isTruncating() const { return truncate_; }

    std::vector<T>&       items()       { return items_; }
    const std::vector<T>& items() const { return items_; }
    void push(T item) { items_.push_back(std::move(item)); }
    void clear()
    {
        items_.clear();
        state_.select(std::nullopt);
    }

    bool empty() const { return items_.empty(); }
    std::size_t size() const { return items_.size(); }

    WidgetListState&       state()       { return state_; }
    const WidgetListState& state() const { return state_; }

    void select(std::optional<std::size_t> index) { state_.select(index); }

    void next()
    {
        if (items_.empty()) return;
        std::size_t i = 0;
        if (auto cur = state_.selected()) {
            if (*cur >= items_.size() - 1)
                i = circular_ ? 0 : *cur;
            else
                i = *cur + 1;
        }
        state_.select(i);
    }

    void previous()
    {
        if (items_.empty()) return;
        std::size_t i = 0;
        if (auto cur = state_.selected()) {
            if (*cur == 0)
                i = circular_ ? items_.size() - 1 : 0;
            else
                i = *cur - 1;
        }
        state_.select(i);
    }

    const T* getSelected() const
    {
        auto i = state_.selected();
        return i && *i < items_.size() ? &items_[*i] : nullptr;
    }

    T* getSelected()
    {
        auto i = state_.selected();
        return i && *i < items_.size() ? &items_[*i] : nullptr;
    }

    /// Draws the visible window into `area`; returns where each item went.
    std::vector<Rect> render(const Rect& area)
    {
        std::vector<Rect> placed;
        if (items_.empty() || area.empty()) return placed;

        const auto sel = state_.selected();
        std::vector<int> heights;
        heights.reserve(items_.size());
        for (std::size_t i = 0; i < items_.size(); ++i)
            heights.push_back(items_[i].height(sel && *sel == i));

        const std::vector<int> view = state_.updateViewPort(heights, area.height, truncate_);
        const std::size_t first = state_.offset();

        int y = area.y;
        for (std::size_t n = 0; n < view.size() && first + n < items_.size(); ++n) {
            const std::size_t idx = first + n;
            Rect cell{area.x, y, area.width, view[n]};
            items_[idx].render(cell, sel && *sel == idx);
            placed.push_back(cell);
            y += view[n];
        }
        return placed;
    }

private:
    std::vector<T>  items_;
    WidgetListState state_;
    bool circular_ {true};
    bool truncate_ {true};
};

} // namespace rev::widget
