#pragma once

#include "pipeline/pagination_pump.hpp"

#include <memory>

namespace rev::pipeline {

/// Refill step for enriched reviews: lists one page of summaries, then fetches
/// every detail of that page concurrently and joins on all of them. Details
/// land in the backlog in completion order; absent ones are dropped. The
/// first failed lookup fails the whole page.
absl::Status RefillDetails(const std::shared_ptr<source::IReviewSource>& source,
                           const source::ReviewFilter& filter,
                           PipelineState<source::ReviewDetail>& state);

class DetailFanout {
public:
    static PumpOptions DefaultOptions() { return PumpOptions{10, 100, 15}; }

    explicit DetailFanout(std::shared_ptr<source::IReviewSource> source,
                          PumpOptions options = DefaultOptions())
        : source_(std::move(source)), options_(options) {}

    ReviewStream<source::ReviewDetail> start(source::ReviewFilter filter) const;

    const PumpOptions& options() const { return options_; }

private:
    std::shared_ptr<source::IReviewSource> source_;
    PumpOptions options_;
};

} // namespace rev::pipeline
