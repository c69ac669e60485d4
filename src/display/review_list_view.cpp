#include "display/review_list_view.hpp"
#include "display/terminal.hpp"
#include "util/log.hpp"

#include <ncurses.h>
#include <fmt/core.h>

namespace rev::display {

namespace {

// Items taken off the stream per tick, so a burst never stalls a frame.
constexpr int kDrainPerTick = 32;

struct Columns { int owner, repo, title, age; };

Columns layout(int width)
{
    Columns c;
    c.owner = width * 10 / 100;
    c.repo  = width * 15 / 100;
    c.age   = width * 20 / 100;
    c.title = width - c.owner - c.repo - c.age;
    return c;
}

} // namespace

void SummaryRow::render(const widget::Rect& area, bool selected) const
{
    const Columns c = layout(area.width);
    const int attrs = selected ? A_REVERSE : 0;
    int x = area.x;

    DrawText(area.y, x, c.owner - 1, summary_.owner, kText, attrs);          x += c.owner;
    DrawText(area.y, x, c.repo - 1,  summary_.name,  kAccent, attrs);        x += c.repo;
    DrawText(area.y, x, c.title - 1,
             fmt::format("#{} {}", summary_.number, summary_.title), kName, attrs);
    x += c.title;
    DrawText(area.y, x, c.age, source::FormatAge(summary_.created_at), kText, attrs);
}

ReviewListView::ReviewListView(pipeline::PaginationPump pump, source::ReviewFilter filter,
                               bool circular, bool truncate)
    : pump_(std::move(pump)), filter_(std::move(filter))
{
    list_.circular(circular).truncate(truncate);
}

void ReviewListView::scheduleFetch()
{
    util::LogInfo("ReviewList", "schedule fetch");
    retireStream();
    list_.clear();
    error_.clear();
    stream_.emplace(pump_.start(filter_));
    processing_ = true;
}

void ReviewListView::retireStream()
{
    if (!stream_) return;
    stream_->release(reaper_);
    stream_.reset();
}

void ReviewListView::drainStream()
{
    if (!stream_) return;

    int taken = 0;
    while (taken < kDrainPerTick) {
        auto item = stream_->tryReceive();
        if (!item) break;
        list_.push(SummaryRow(std::move(*item)));
        ++taken;
    }
    if (taken > 0)
        util::LogDebug("ReviewList", "added {} reviews ({} total)", taken, list_.size());

    if (stream_->finished()) {
        absl::Status st = stream_->status();
        if (!st.ok()) {
            error_ = std::string(st.message());
            util::LogError("ReviewList", "stream closed with error: {}", st.ToString());
        }
        processing_ = false;
        retireStream();
    }
}

std::optional<Action> ReviewListView::handleKey(int key)
{
    switch (key) {
        case KEY_DOWN: case 'j': list_.next();     break;
        case KEY_UP:   case 'k': list_.previous(); break;
        case '\n': case KEY_ENTER: case 'r':
            return Action{ActionType::BeginReview, {}};
        case 'g':
            return Action{ActionType::Refresh, {}};
        default: break;
    }
    return std::nullopt;
}

std::optional<Action> ReviewListView::update(const Action& action)
{
    switch (action.type) {
        case ActionType::GotoPage:
            if (action.payload == kReviewListPage && !stream_ && list_.empty())
                scheduleFetch();
            break;
        case ActionType::Refresh:
            scheduleFetch();
            break;
        case ActionType::Tick:
            drainStream();
            break;
        default: break;
    }
    return std::nullopt;
}

void ReviewListView::draw(const widget::Rect& area)
{
    if (area.height < 4) return;

    const widget::Rect body{area.x, area.y, area.width, area.height - 1};
    DrawBox(body, fmt::format("Github pull requests ({})", list_.size()));

    const widget::Rect inner{body.x + 1, body.y + 1, body.width - 2, body.height - 2};
    if (list_.empty()) {
        std::string msg = processing_ ? "processing"
                          : !error_.empty() ? fmt::format("failed to fetch reviews: {}", error_)
                          : "no open reviews";
        DrawText(inner.y, inner.x + 1, inner.width - 1, msg, error_.empty() ? kText : kFailure);
    } else {
        const Columns c = layout(inner.width);
        int x = inner.x;
        DrawText(inner.y, x, c.owner, "Owner", kText, A_BOLD);        x += c.owner;
        DrawText(inner.y, x, c.repo, "Repository", kText, A_BOLD);    x += c.repo;
        DrawText(inner.y, x, c.title, "Title", kText, A_BOLD);        x += c.title;
        DrawText(inner.y, x, c.age, "Date created", kText, A_BOLD);

        list_.render(widget::Rect{inner.x, inner.y + 2, inner.width, inner.height - 2});
    }

    const widget::Rect footer{area.x, area.y + area.height - 1, area.width, 1};
    FillRect(footer, kHeader);
    DrawText(footer.y, footer.x, footer.width,
             processing_ ? " fetching... | j/k : Move   Enter : Review   g : Refresh   q : Quit"
                         : " j/k : Move   Enter : Review   g : Refresh   q : Quit",
             kHeader);
}

} // namespace rev::display
