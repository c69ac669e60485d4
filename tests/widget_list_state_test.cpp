#include "widget/widget_list_state.hpp"

#include <gtest/gtest.h>

#include <numeric>

using rev::widget::WidgetListState;

namespace {

int sum(const std::vector<int>& v) { return std::accumulate(v.begin(), v.end(), 0); }

} // namespace

TEST(WidgetListState, ClearingSelectionResetsOffset)
{
    WidgetListState state;
    state.select(4);
    state.updateViewPort({3, 3, 3, 3, 3}, 7, false);
    ASSERT_GT(state.offset(), 0u);

    state.select(std::nullopt);
    EXPECT_EQ(state.offset(), 0u);
    EXPECT_FALSE(state.selected().has_value());
}

TEST(WidgetListState, VisibleSelectionKeepsOffset)
{
    WidgetListState state;
    state.select(1);
    auto view = state.updateViewPort({3, 3, 3, 3, 3}, 7, false);

    EXPECT_EQ(state.offset(), 0u);
    EXPECT_EQ(view, (std::vector<int>{3, 3}));
}

TEST(WidgetListState, ScrollsDownToSelectionWithoutTruncation)
{
    WidgetListState state;
    state.select(4);
    auto view = state.updateViewPort({3, 3, 3, 3, 3}, 7, false);

    EXPECT_EQ(state.offset(), 3u);
    EXPECT_EQ(view, (std::vector<int>{3, 3}));
    EXPECT_LE(sum(view), 7);
    EXPECT_LT(4u, state.offset() + view.size());
}

TEST(WidgetListState, ScrollsDownWithTruncatedLeadingItem)
{
    WidgetListState state;
    state.select(4);
    auto view = state.updateViewPort({3, 3, 3, 3, 3}, 7, true);

    EXPECT_EQ(state.offset(), 2u);
    EXPECT_EQ(view, (std::vector<int>{1, 3, 3}));
    EXPECT_EQ(sum(view), 7);
}

TEST(WidgetListState, TruncatesTrailingItemWhenSelectionIsVisible)
{
    WidgetListState state;
    state.select(0);
    auto view = state.updateViewPort({3, 3, 3, 3, 3}, 7, true);

    EXPECT_EQ(state.offset(), 0u);
    EXPECT_EQ(view, (std::vector<int>{3, 3, 1}));
    EXPECT_EQ(sum(view), 7);
}

TEST(WidgetListState, ScrollsUpWhenSelectionIsAboveWindow)
{
    WidgetListState state;
    state.select(4);
    state.updateViewPort({3, 3, 3, 3, 3}, 7, false);
    ASSERT_EQ(state.offset(), 3u);

    state.select(1);
    auto view = state.updateViewPort({3, 3, 3, 3, 3}, 7, false);
    EXPECT_EQ(state.offset(), 1u);
    EXPECT_EQ(view, (std::vector<int>{3, 3}));
}

TEST(WidgetListState, NoSelectionRendersFromTheTop)
{
    WidgetListState state;
    auto view = state.updateViewPort({2, 2, 2}, 10, false);
    EXPECT_EQ(state.offset(), 0u);
    EXPECT_EQ(view, (std::vector<int>{2, 2, 2}));
}

TEST(WidgetListState, HeterogeneousHeights)
{
    WidgetListState state;
    state.select(3);
    auto view = state.updateViewPort({1, 5, 2, 4, 1}, 6, false);

    // Walking back, 2 + 4 meets the viewport exactly, which counts as full.
    EXPECT_EQ(state.offset(), 3u);
    EXPECT_EQ(view, (std::vector<int>{4}));
}

TEST(WidgetListState, EmptyHeightsYieldEmptyView)
{
    WidgetListState state;
    state.select(2);
    EXPECT_TRUE(state.updateViewPort({}, 10, true).empty());
    EXPECT_EQ(state.offset(), 0u);
}

TEST(WidgetListState, SelectionPastTheEndIsTreatedAsLastItem)
{
    WidgetListState state;
    state.select(9);
    auto view = state.updateViewPort({3, 3, 3, 3}, 7, false);
    EXPECT_EQ(state.offset(), 2u);
    EXPECT_EQ(view, (std::vector<int>{3, 3}));
}

TEST(WidgetListState, OversizedSelectionIsShownCutToViewport)
{
    WidgetListState state;
    state.select(1);
    auto view = state.updateViewPort({2, 20, 2}, 6, false);
    EXPECT_EQ(state.offset(), 1u);
    EXPECT_EQ(view, (std::vector<int>{6}));
}
