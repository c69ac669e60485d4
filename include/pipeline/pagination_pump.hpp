// -----------------------------------------------------------------------------
// Pagination pump: turns a cursor-paged source into a backpressured stream
// -----------------------------------------------------------------------------
#pragma once

#include "pipeline/bounded_channel.hpp"
#include "pipeline/review_stream.hpp"
#include "source/review_source.hpp"
#include "util/log.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <absl/status/status.h>

namespace rev::pipeline {

struct PumpOptions {
    std::size_t low_water        {15};   ///< refetch when backlog <= this
    std::size_t hard_cap         {100};  ///< stop sourcing once more were observed
    std::size_t channel_capacity {20};
};

/// Producer-local state of one pipeline run. Never shared.
template <typename T>
struct PipelineState {
    std::deque<T>              backlog;
    std::optional<std::string> cursor;
    bool                       has_more {true};
    std::size_t                seen     {0};
    std::size_t                low_water;
    std::size_t                hard_cap;

    explicit PipelineState(const PumpOptions& opts)
        : low_water(opts.low_water), hard_cap(opts.hard_cap) {}
};

/// Fetches one page into `state` (backlog, cursor, has_more, seen).
template <typename T>
using RefillFn = std::function<absl::Status(PipelineState<T>&)>;

/// Drives `refill` and `tx` until the cap is exceeded, the source is
/// exhausted or the receiver is gone. A refill error is returned and the
/// backlog is abandoned; otherwise the backlog is flushed before returning.
template <typename T>
absl::Status RunPump(PipelineState<T>& state, Sender<T>& tx, const RefillFn<T>& refill)
{
    for (;;) {
        if (tx.isClosed()) {
            util::LogDebug("Pump", "receiver closed, stopping");
            return absl::OkStatus();
        }

        if (state.backlog.size() <= state.low_water && state.has_more) {
            util::LogDebug("Pump", "fetching more: len {}", state.backlog.size());
            if (absl::Status st = refill(state); !st.ok())
                return st;
            if (!state.has_more)
                break;
        }

        if (state.seen > state.hard_cap)
            break;

        if (state.backlog.empty()) {
            if (!state.has_more) break;
            continue;
        }

        T item = std::move(state.backlog.front());
        state.backlog.pop_front();
        if (!tx.send(std::move(item))) {
            util::LogDebug("Pump", "receiver closed, stopping");
            return absl::OkStatus();
        }
    }

    while (!state.backlog.empty()) {
        T item = std::move(state.backlog.front());
        state.backlog.pop_front();
        if (!tx.send(std::move(item)))
            break;
    }
    return absl::OkStatus();
}

/// Spawns the producer thread for `refill` and returns the consumer handle.
template <typename T>
ReviewStream<T> SpawnPump(const PumpOptions& opts, RefillFn<T> refill, const char* tag)
{
    auto [tx, rx] = MakeChannel<T>(opts.channel_capacity);
    std::jthread producer(
        [opts, refill = std::move(refill), tag](Sender<T> sender) mutable {
            PipelineState<T> state(opts);
            absl::Status st = RunPump(state, sender, refill);
            if (!st.ok())
                util::LogError(tag, "faced error: {}", st.ToString());
            else
                util::LogDebug(tag, "finished after {} items", state.seen);
            sender.close(std::move(st));
        },
        std::move(tx));
    return ReviewStream<T>(std::move(rx), std::move(producer));
}

/// Appends one page of summaries, advancing the cursor.
absl::Status RefillSummaries(source::IReviewSource& source,
                             const source::ReviewFilter& filter,
                             PipelineState<source::ReviewSummary>& state);

class PaginationPump {
public:
    explicit PaginationPump(std::shared_ptr<source::IReviewSource> source,
                            PumpOptions options = {})
        : source_(std::move(source)), options_(options) {}

    ReviewStream<source::ReviewSummary> start(source::ReviewFilter filter) const;

    const PumpOptions& options() const { return options_; }

private:
    std::shared_ptr<source::IReviewSource> source_;
    PumpOptions options_;
};

} // namespace rev::pipeline
