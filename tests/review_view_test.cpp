#include "display/review_view.hpp"
#include "fake_review_source.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace rev;
using namespace std::chrono_literals;
using display::Action;
using display::ActionType;
using rev::testing::FakeReviewSource;

namespace {

/// Ticks until the page answers with an action, or gives up.
std::optional<Action> tickForAction(display::Component& page, std::chrono::milliseconds limit = 2s)
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto action = page.update(Action{ActionType::Tick, {}}))
            return action;
        std::this_thread::sleep_for(2ms);
    }
    return std::nullopt;
}

bool tickUntilShown(display::ReviewView& view, std::chrono::milliseconds limit = 2s)
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!view.current()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        view.update(Action{ActionType::Tick, {}});
        std::this_thread::sleep_for(2ms);
    }
    return true;
}

} // namespace

TEST(ReviewView, SkipsThroughReviewsThenReturnsToTheList)
{
    auto src = std::make_shared<FakeReviewSource>();
    src->pages = {{{"a", "b"}, false}};
    display::ReviewView view(pipeline::DetailFanout(src), {});

    view.update(Action::GotoPage(display::kReviewPage));
    EXPECT_TRUE(view.waiting());

    ASSERT_TRUE(tickUntilShown(view));
    std::string first = view.current()->title;
    EXPECT_FALSE(view.waiting());

    auto skip = view.handleKey('n');
    ASSERT_TRUE(skip.has_value());
    EXPECT_EQ(skip->type, ActionType::SkipReview);
    view.update(*skip);
    EXPECT_FALSE(view.current().has_value());

    ASSERT_TRUE(tickUntilShown(view));
    EXPECT_NE(view.current()->title, first);
    EXPECT_EQ(view.reviewed(), 2);

    view.update(Action{ActionType::SkipReview, {}});
    auto back = tickForAction(view);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->type, ActionType::GotoPage);
    EXPECT_EQ(back->payload, display::kReviewListPage);
}

TEST(ReviewView, StreamFailureReportsThenGoesBack)
{
    auto src = std::make_shared<FakeReviewSource>();
    src->fail_on_page = 0;
    display::ReviewView view(pipeline::DetailFanout(src), {});

    view.update(Action::GotoPage(display::kReviewPage));

    auto error = tickForAction(view);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->type, ActionType::Error);
    EXPECT_NE(error->payload.find("listing failed"), std::string::npos);

    auto back = tickForAction(view);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->type, ActionType::GotoPage);
    EXPECT_EQ(back->payload, display::kReviewListPage);
}

TEST(ReviewView, BackDoesNotWaitForLookupsInFlight)
{
    auto src = std::make_shared<FakeReviewSource>();
    src->pages = {{{"slow"}, false}};
    src->detail_delay = {{"slow", 800ms}};
    display::ReviewView view(pipeline::DetailFanout(src), {});

    view.update(Action::GotoPage(display::kReviewPage));
    std::this_thread::sleep_for(50ms);

    auto before = std::chrono::steady_clock::now();
    auto back = view.handleKey('b');
    EXPECT_LT(std::chrono::steady_clock::now() - before, 300ms);

    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->type, ActionType::GotoPage);
    EXPECT_FALSE(view.waiting());
    EXPECT_EQ(view.reviewed(), 0);

    // A later visit starts a fresh stream.
    view.update(Action::GotoPage(display::kReviewPage));
    EXPECT_TRUE(view.waiting());
}
