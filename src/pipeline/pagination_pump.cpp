#include "pipeline/pagination_pump.hpp"

namespace rev::pipeline {

absl::Status RefillSummaries(source::IReviewSource& source,
                             const source::ReviewFilter& filter,
                             PipelineState<source::ReviewSummary>& state)
{
    auto page = source.listPage(filter, state.cursor);
    if (!page.ok())
        return page.status();

    state.has_more = page->has_more;
    state.cursor   = std::move(page->next_cursor);
    state.seen    += page->items.size();
    util::LogDebug("Pump", "get user reviews got items: {}", page->items.size());

    for (auto& item : page->items)
        state.backlog.push_back(std::move(item));
    return absl::OkStatus();
}

ReviewStream<source::ReviewSummary> PaginationPump::start(source::ReviewFilter filter) const
{
    auto src = source_;
    RefillFn<source::ReviewSummary> refill =
        [src, filter = std::move(filter)](PipelineState<source::ReviewSummary>& state) {
            return RefillSummaries(*src, filter, state);
        };
    return SpawnPump<source::ReviewSummary>(options_, std::move(refill), "PaginationPump");
}

} // namespace rev::pipeline
