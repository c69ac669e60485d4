#include "display/app.hpp"
#include "display/terminal.hpp"
#include "util/log.hpp"

#include <ncurses.h>
#include <fmt/core.h>

namespace rev::display {

const char* ActionName(ActionType type)
{
    switch (type) {
        case ActionType::Tick:        return "Tick";
        case ActionType::Render:      return "Render";
        case ActionType::Resize:      return "Resize";
        case ActionType::Quit:        return "Quit";
        case ActionType::Refresh:     return "Refresh";
        case ActionType::Error:       return "Error";
        case ActionType::GotoPage:    return "GotoPage";
        case ActionType::BeginReview: return "BeginReview";
        case ActionType::SkipReview:  return "SkipReview";
    }
    return "?";
}

void App::registerPage(const std::string& name, std::unique_ptr<Component> page)
{
    pages_[name] = std::move(page);
}

Component* App::page()
{
    auto it = pages_.find(current_);
    return it == pages_.end() ? nullptr : it->second.get();
}

void App::render()
{
    if (!term_) return;
    term_->clear();
    widget::Rect area = term_->size();
    if (Component* p = page())
        p->draw(area);
    if (!last_error_.empty())
        DrawText(0, 2, area.width - 4, fmt::format(" error: {} ", last_error_), kFailure, A_BOLD);
    term_->present();
}

void App::dispatch(const Action& action)
{
    if (action.type != ActionType::Tick && action.type != ActionType::Render)
        util::LogDebug("App", "{} {}", ActionName(action.type), action.payload);

    switch (action.type) {
        case ActionType::GotoPage:
            current_ = action.payload;
            break;
        case ActionType::Quit:
            should_quit_ = true;
            break;
        case ActionType::BeginReview:
            push(Action::GotoPage(kReviewPage));
            break;
        case ActionType::Error:
            last_error_ = action.payload;
            util::LogError("App", "{}", action.payload);
            break;
        case ActionType::Resize:
        case ActionType::Render:
            render();
            break;
        default: break;
    }

    if (Component* p = page()) {
        if (auto next = p->update(action))
            push(std::move(*next));
    }
}

void App::drain()
{
    while (!queue_.empty()) {
        Action action = std::move(queue_.front());
        queue_.pop_front();
        dispatch(action);
    }
}

void App::run(const std::string& start_page)
{
    Terminal term;
    term_ = &term;
    push(Action::GotoPage(start_page));

    while (!should_quit_) {
        for (int key = term.pollKey(); key != ERR; key = term.pollKey()) {
            if (key == 'q') {
                push(Action{ActionType::Quit, {}});
                break;
            }
            if (key == KEY_RESIZE) {
                push(Action{ActionType::Resize, {}});
                continue;
            }
            if (!last_error_.empty())
                last_error_.clear();
            if (Component* p = page())
                if (auto action = p->handleKey(key))
                    push(std::move(*action));
        }
        push(Action{ActionType::Tick, {}});
        push(Action{ActionType::Render, {}});
        drain();

        napms(options_.tick_ms);
    }
    term_ = nullptr;
}

} // namespace rev::display
