#pragma once

#include "widget/rect.hpp"

#include <optional>
#include <string>

namespace rev::display {

enum class ActionType {
    Tick,
    Render,
    Resize,
    Quit,
    Refresh,
    Error,
    GotoPage,
    BeginReview,
    SkipReview,
};

struct Action {
    ActionType  type;
    std::string payload;   ///< page name for GotoPage, message for Error

    static Action GotoPage(std::string page) { return {ActionType::GotoPage, std::move(page)}; }
    static Action Error(std::string msg)     { return {ActionType::Error, std::move(msg)}; }
};

const char* ActionName(ActionType type);

inline constexpr const char* kReviewListPage = "review_list";
inline constexpr const char* kReviewPage     = "review";

/// One screen of the app. Only the current page sees keys and actions.
class Component {
public:
    virtual ~Component() = default;

    virtual std::optional<Action> handleKey(int /*key*/) { return std::nullopt; }
    virtual std::optional<Action> update(const Action& action) = 0;
    virtual void draw(const widget::Rect& area) = 0;
};

} // namespace rev::display
