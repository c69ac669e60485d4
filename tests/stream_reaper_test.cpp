#include "pipeline/pagination_pump.hpp"
#include "pipeline/stream_reaper.hpp"
#include "fake_review_source.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <functional>
#include <chrono>
#include <thread>

using namespace rev;
using namespace std::chrono_literals;
using rev::testing::FakeReviewSource;

namespace {

bool waitFor(const std::function<bool()>& done, std::chrono::milliseconds limit)
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace

TEST(StreamReaper, JoinsAdoptedThreads)
{
    std::atomic<bool> ran {false};
    pipeline::StreamReaper reaper;
    reaper.adopt(std::jthread([&] {
        std::this_thread::sleep_for(20ms);
        ran = true;
    }));

    EXPECT_TRUE(waitFor([&] { return reaper.pending() == 0; }, 2s));
    EXPECT_TRUE(ran);
}

TEST(StreamReaper, IgnoresEmptyThreads)
{
    pipeline::StreamReaper reaper;
    reaper.adopt(std::jthread());
    EXPECT_EQ(reaper.pending(), 0u);
}

TEST(StreamReaper, DestructionJoinsWhatIsLeft)
{
    std::atomic<bool> ran {false};
    {
        pipeline::StreamReaper reaper;
        reaper.adopt(std::jthread([&] {
            std::this_thread::sleep_for(50ms);
            ran = true;
        }));
    }
    EXPECT_TRUE(ran);
}

TEST(ReviewStream, ReleaseDoesNotWaitForARequestInFlight)
{
    auto src = std::make_shared<FakeReviewSource>();
    src->pages = {{{"A", "B"}, true}, {{"C"}, false}};
    src->list_delay = {{1, 800ms}};

    pipeline::StreamReaper reaper;
    pipeline::PaginationPump pump(src, pipeline::PumpOptions{15, 100, 20});
    {
        auto stream = pump.start({});
        ASSERT_TRUE(stream.receive().has_value());
        ASSERT_TRUE(waitFor([&] { return src->listCalls() == 2; }, 2s));

        auto before = std::chrono::steady_clock::now();
        stream.release(reaper);
        {
            auto dropped = std::move(stream);
        }
        EXPECT_LT(std::chrono::steady_clock::now() - before, 300ms);
    }

    EXPECT_EQ(reaper.pending(), 1u);
    EXPECT_TRUE(waitFor([&] { return reaper.pending() == 0; }, 3s));
    EXPECT_EQ(src->listCalls(), 2);
}
