#include "display/review_list_view.hpp"
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

const Action kTick {ActionType::Tick, {}};

/// Ticks the page until `done` holds or the time runs out.
template <typename Pred>
bool tickUntil(display::Component& page, Pred done, std::chrono::milliseconds limit = 2s)
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        page.update(kTick);
        std::this_thread::sleep_for(2ms);
    }
    return true;
}

} // namespace

TEST(ReviewListView, FetchesOnFirstVisitAndFinishes)
{
    auto src = std::make_shared<FakeReviewSource>();
    src->pages = {{{"A", "B", "C"}, false}};
    display::ReviewListView view(pipeline::PaginationPump(src), {});

    EXPECT_FALSE(view.processing());
    view.update(Action::GotoPage(display::kReviewListPage));
    EXPECT_TRUE(view.processing());

    ASSERT_TRUE(tickUntil(view, [&] { return !view.processing(); }));
    EXPECT_EQ(view.list().size(), 3u);
    EXPECT_EQ(view.list().items()[0].summary().title, "A");
    EXPECT_TRUE(view.error().empty());

    // Coming back to a filled list does not list again.
    view.update(Action::GotoPage(display::kReviewListPage));
    EXPECT_FALSE(view.processing());
    EXPECT_EQ(src->listCalls(), 1);
}

TEST(ReviewListView, ShowsTheErrorTheStreamEndedWith)
{
    auto src = std::make_shared<FakeReviewSource>();
    src->fail_on_page = 0;
    display::ReviewListView view(pipeline::PaginationPump(src), {});

    view.update(Action::GotoPage(display::kReviewListPage));
    ASSERT_TRUE(tickUntil(view, [&] { return !view.processing(); }));

    EXPECT_TRUE(view.list().empty());
    EXPECT_EQ(view.error(), "listing failed");
}

TEST(ReviewListView, RefreshStartsOverWithoutWaitingOnTheOldRequest)
{
    auto src = std::make_shared<FakeReviewSource>();
    src->pages = {{{"A"}, true}, {{"B"}, false}};
    src->list_delay = {{1, 800ms}};
    display::ReviewListView view(pipeline::PaginationPump(src), {});

    view.update(Action::GotoPage(display::kReviewListPage));
    ASSERT_TRUE(tickUntil(view, [&] { return view.list().size() == 1 && src->listCalls() == 2; }));

    auto before = std::chrono::steady_clock::now();
    view.update(Action{ActionType::Refresh, {}});
    EXPECT_LT(std::chrono::steady_clock::now() - before, 300ms);

    EXPECT_TRUE(view.processing());
    EXPECT_TRUE(view.list().empty());
}

TEST(ReviewListView, KeysMapToActions)
{
    auto src = std::make_shared<FakeReviewSource>();
    src->pages = {{{"A", "B"}, false}};
    display::ReviewListView view(pipeline::PaginationPump(src), {});
    view.update(Action::GotoPage(display::kReviewListPage));
    ASSERT_TRUE(tickUntil(view, [&] { return !view.processing(); }));

    EXPECT_FALSE(view.handleKey('j').has_value());
    EXPECT_EQ(view.list().state().selected(), std::optional<std::size_t>(0));
    view.handleKey('j');
    EXPECT_EQ(view.list().state().selected(), std::optional<std::size_t>(1));

    auto begin = view.handleKey('\n');
    ASSERT_TRUE(begin.has_value());
    EXPECT_EQ(begin->type, ActionType::BeginReview);

    auto refresh = view.handleKey('g');
    ASSERT_TRUE(refresh.has_value());
    EXPECT_EQ(refresh->type, ActionType::Refresh);
}
