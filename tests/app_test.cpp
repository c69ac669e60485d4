#include "display/app.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

using namespace rev::display;

namespace {

class RecordingPage : public Component {
public:
    explicit RecordingPage(std::vector<ActionType>* log) : log_(log) {}

    std::optional<Action> update(const Action& action) override
    {
        log_->push_back(action.type);
        if (action.type == ActionType::Refresh)
            return Action::Error("refresh failed");
        return std::nullopt;
    }
    void draw(const rev::widget::Rect&) override {}

private:
    std::vector<ActionType>* log_;
};

} // namespace

TEST(App, GotoPageSwitchesAndNotifiesTheNewPage)
{
    std::vector<ActionType> list_log, review_log;
    App app;
    app.registerPage(kReviewListPage, std::make_unique<RecordingPage>(&list_log));
    app.registerPage(kReviewPage, std::make_unique<RecordingPage>(&review_log));

    app.push(Action::GotoPage(kReviewListPage));
    app.push(Action{ActionType::Tick, {}});
    app.drain();
    EXPECT_EQ(app.currentPage(), kReviewListPage);
    EXPECT_EQ(list_log, (std::vector<ActionType>{ActionType::GotoPage, ActionType::Tick}));

    app.push(Action{ActionType::BeginReview, {}});
    app.drain();
    EXPECT_EQ(app.currentPage(), kReviewPage);
    EXPECT_EQ(review_log, (std::vector<ActionType>{ActionType::GotoPage}));
}

TEST(App, ActionsReturnedByPagesAreQueued)
{
    std::vector<ActionType> log;
    App app;
    app.registerPage(kReviewListPage, std::make_unique<RecordingPage>(&log));
    app.dispatch(Action::GotoPage(kReviewListPage));

    app.dispatch(Action{ActionType::Refresh, {}});
    EXPECT_TRUE(app.lastError().empty());
    app.drain();
    EXPECT_EQ(app.lastError(), "refresh failed");
}

TEST(App, QuitStopsTheLoop)
{
    App app;
    EXPECT_FALSE(app.shouldQuit());
    app.dispatch(Action{ActionType::Quit, {}});
    EXPECT_TRUE(app.shouldQuit());
}
