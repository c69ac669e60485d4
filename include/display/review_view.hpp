#pragma once

#include "display/component.hpp"
#include "pipeline/detail_fanout.hpp"
#include "pipeline/stream_reaper.hpp"
#include "widget/selectable_widget_list.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rev::display {

/// Bordered comment box; wraps its text to the width it was laid out for.
class CommentItem {
public:
    CommentItem(std::string author, std::string text)
        : author_(std::move(author)), text_(std::move(text)) {}

    void setWidth(int width);

    int  height(bool selected) const;
    void render(const widget::Rect& area, bool selected) const;

private:
    std::string author_;
    std::string text_;
    std::vector<std::string> lines_;
};

/// Walks through enriched reviews one at a time.
class ReviewView final : public Component {
public:
    ReviewView(pipeline::DetailFanout fanout, source::ReviewFilter filter,
               bool circular = true, bool truncate = true);

    std::optional<Action> handleKey(int key) override;
    std::optional<Action> update(const Action& action) override;
    void draw(const widget::Rect& area) override;

    const std::optional<source::ReviewDetail>& current() const { return current_; }
    bool waiting() const { return waiting_; }
    int  reviewed() const { return reviewed_; }

private:
    std::optional<Action> pullNext();
    void show(source::ReviewDetail review);
    void reset();

    int drawHeader(const widget::Rect& area) const;
    int drawChecks(const widget::Rect& area) const;

    pipeline::DetailFanout fanout_;
    source::ReviewFilter   filter_;
    pipeline::StreamReaper reaper_;   // outlives stream_
    std::optional<pipeline::ReviewStream<source::ReviewDetail>> stream_;
    std::optional<source::ReviewDetail> current_;
    widget::SelectableWidgetList<CommentItem> comments_;
    bool waiting_      {false};
    bool back_pending_ {false};
    int  reviewed_ {0};
};

} // namespace rev::display
