#pragma once

#include "display/component.hpp"
#include "pipeline/pagination_pump.hpp"
#include "pipeline/stream_reaper.hpp"
#include "widget/selectable_widget_list.hpp"

#include <optional>
#include <string>

namespace rev::display {

/// One pull request row (plus a blank spacer line) of the list screen.
class SummaryRow {
public:
    explicit SummaryRow(source::ReviewSummary summary) : summary_(std::move(summary)) {}

    int  height(bool /*selected*/) const { return 2; }
    void render(const widget::Rect& area, bool selected) const;

    const source::ReviewSummary& summary() const { return summary_; }

private:
    source::ReviewSummary summary_;
};

class ReviewListView final : public Component {
public:
    ReviewListView(pipeline::PaginationPump pump, source::ReviewFilter filter,
                   bool circular = true, bool truncate = true);

    std::optional<Action> handleKey(int key) override;
    std::optional<Action> update(const Action& action) override;
    void draw(const widget::Rect& area) override;

    const widget::SelectableWidgetList<SummaryRow>& list() const { return list_; }
    bool processing() const { return processing_; }
    const std::string& error() const { return error_; }

private:
    void scheduleFetch();
    void drainStream();
    void retireStream();

    pipeline::PaginationPump pump_;
    source::ReviewFilter     filter_;
    pipeline::StreamReaper   reaper_;   // outlives stream_
    std::optional<pipeline::ReviewStream<source::ReviewSummary>> stream_;
    widget::SelectableWidgetList<SummaryRow> list_;
    bool        processing_ {false};
    std::string error_;
};

} // namespace rev::display
