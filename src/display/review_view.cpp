#include "display/review_view.hpp"
#include "display/terminal.hpp"
#include "util/log.hpp"
#include "widget/text_wrap.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>
#include <ncurses.h>
#include <fmt/core.h>

namespace rev::display {

namespace {

constexpr int kMaxDescriptionLines = 6;
constexpr int kMaxCheckLines       = 8;

short pairFor(source::CurrentState state)
{
    switch (state) {
        case source::CurrentState::Success: return kSuccess;
        case source::CurrentState::Pending: return kPending;
        case source::CurrentState::Failure: return kFailure;
        case source::CurrentState::Expired: return kExpired;
    }
    return kText;
}

} // namespace

/* ───── CommentItem ───── */

void CommentItem::setWidth(int width)
{
    lines_ = widget::WrapText(text_, std::max(width - 2, 1));
}

int CommentItem::height(bool /*selected*/) const
{
    return static_cast<int>(std::max<std::size_t>(lines_.size(), 1)) + 2;
}

void CommentItem::render(const widget::Rect& area, bool selected) const
{
    const short pair = selected ? kSelected : kText;
    if (selected)
        FillRect(area, kSelected);
    DrawBox(area, author_, pair);
    for (int i = 0; i < area.height - 2 && i < static_cast<int>(lines_.size()); ++i)
        DrawText(area.y + 1 + i, area.x + 1, area.width - 2, lines_[i], pair);
}

/* ───── ReviewView ───── */

ReviewView::ReviewView(pipeline::DetailFanout fanout, source::ReviewFilter filter,
                       bool circular, bool truncate)
    : fanout_(std::move(fanout)), filter_(std::move(filter))
{
    comments_.circular(circular).truncate(truncate);
}

void ReviewView::reset()
{
    if (stream_) {
        stream_->release(reaper_);
        stream_.reset();
    }
    current_.reset();
    comments_.clear();
    waiting_  = false;
    reviewed_ = 0;
}

void ReviewView::show(source::ReviewDetail review)
{
    util::LogInfo("Review", "showing {}#{}", review.repository, review.number);
    comments_.clear();
    for (const auto& c : review.comments.comments)
        comments_.push(CommentItem(c.author, c.text));
    current_ = std::move(review);
    waiting_ = false;
    ++reviewed_;
}

std::optional<Action> ReviewView::pullNext()
{
    if (!stream_) return std::nullopt;

    if (auto review = stream_->tryReceive()) {
        show(std::move(*review));
        return std::nullopt;
    }
    if (!stream_->finished())
        return std::nullopt;

    absl::Status st = stream_->status();
    util::LogInfo("Review", "done review after {} items", reviewed_);
    reset();
    if (!st.ok()) {
        back_pending_ = true;
        return Action::Error(fmt::format("review stream failed: {}", std::string(st.message())));
    }
    return Action::GotoPage(kReviewListPage);
}

std::optional<Action> ReviewView::handleKey(int key)
{
    switch (key) {
        case KEY_DOWN: case 'j': comments_.next();     break;
        case KEY_UP:   case 'k': comments_.previous(); break;
        case 'n': case 's':
            return Action{ActionType::SkipReview, {}};
        case 'b': case 27:
            reset();
            return Action::GotoPage(kReviewListPage);
        default: break;
    }
    return std::nullopt;
}

std::optional<Action> ReviewView::update(const Action& action)
{
    switch (action.type) {
        case ActionType::GotoPage:
            if (action.payload == kReviewPage && !stream_) {
                util::LogInfo("Review", "schedule fetch");
                stream_.emplace(fanout_.start(filter_));
                waiting_ = true;
            }
            break;
        case ActionType::SkipReview:
            current_.reset();
            comments_.clear();
            waiting_ = true;
            break;
        case ActionType::Tick:
            if (back_pending_) {
                back_pending_ = false;
                return Action::GotoPage(kReviewListPage);
            }
            if (waiting_)
                return pullNext();
            break;
        default: break;
    }
    return std::nullopt;
}

int ReviewView::drawHeader(const widget::Rect& area) const
{
    const auto& r = *current_;
    int y = area.y;

    DrawText(y++, area.x, area.width, fmt::format("{}#{}", r.repository, r.number), kAccent, A_BOLD);
    DrawText(y++, area.x, area.width, r.title, kName, A_BOLD);

    std::string meta = fmt::format("by {}", r.author);
    if (r.publish_at)
        meta += fmt::format(", published {}", source::FormatAge(*r.publish_at));
    DrawText(y++, area.x, area.width, meta);

    if (!r.labels.empty()) {
        std::string labels;
        for (const auto& l : r.labels)
            labels += fmt::format("[{}] ", l);
        DrawText(y++, area.x, area.width, labels, kPending);
    }

    auto desc = widget::WrapText(r.description.empty() ? "no description" : r.description, area.width);
    for (int i = 0; i < kMaxDescriptionLines && i < static_cast<int>(desc.size()); ++i)
        DrawText(y++, area.x, area.width, desc[i]);
    if (static_cast<int>(desc.size()) > kMaxDescriptionLines)
        DrawText(y++, area.x, area.width, "...");

    return y - area.y + 1;
}

int ReviewView::drawChecks(const widget::Rect& area) const
{
    const auto& checks = current_->status_checks;
    if (checks.empty()) return 0;

    const int rows = std::min<int>(static_cast<int>(checks.size()), kMaxCheckLines);
    DrawBox(widget::Rect{area.x, area.y, area.width, rows + 2}, "Status checks");
    for (int i = 0; i < rows; ++i) {
        const auto& check = checks[i];
        std::string text = std::visit([](const auto& c) -> std::string {
            using C = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<C, source::CheckRun>)
                return fmt::format("{}: {} ({})", c.name, c.conclusion, c.status);
            else
                return fmt::format("{}: {} - {}", c.context, c.state,
                                   c.description.value_or("no description"));
        }, check);
        DrawText(area.y + 1 + i, area.x + 1, area.width - 2, text,
                 pairFor(source::CurrentStateOf(check)));
    }
    return rows + 2;
}

void ReviewView::draw(const widget::Rect& area)
{
    if (area.height < 4) return;

    const widget::Rect body{area.x, area.y, area.width, area.height - 1};
    DrawBox(body, fmt::format("Review ({} seen)", reviewed_));
    widget::Rect inner{body.x + 1, body.y + 1, body.width - 2, body.height - 2};

    if (!current_) {
        DrawText(inner.y, inner.x + 1, inner.width - 1, waiting_ ? "processing" : "done review");
    } else {
        int used = drawHeader(inner);
        inner.y += used;      inner.height -= used;

        if (inner.height > 0) {
            used = drawChecks(inner);
            inner.y += used;  inner.height -= used;
        }

        if (inner.height > 0) {
            std::string title = current_->comments.has_previous ? "Comments (older hidden)" : "Comments";
            DrawText(inner.y, inner.x, inner.width, title, kText, A_BOLD);
            inner.y += 1;     inner.height -= 1;
            if (comments_.empty())
                DrawText(inner.y, inner.x, inner.width, "no comments");
            for (auto& c : comments_.items())
                c.setWidth(inner.width);
            comments_.render(inner);
        }
    }

    const widget::Rect footer{area.x, area.y + area.height - 1, area.width, 1};
    FillRect(footer, kHeader);
    DrawText(footer.y, footer.x, footer.width,
             " j/k : Comments   n : Next review   b : Back   q : Quit", kHeader);
}

} // namespace rev::display
