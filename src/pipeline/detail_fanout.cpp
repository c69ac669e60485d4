#include "pipeline/detail_fanout.hpp"

#include <thread>
#include <vector>
#include <absl/status/statusor.h>

namespace rev::pipeline {

using source::DetailReference;
using source::ReviewDetail;
using DetailResult = absl::StatusOr<std::optional<ReviewDetail>>;

absl::Status RefillDetails(const std::shared_ptr<source::IReviewSource>& source,
                           const source::ReviewFilter& filter,
                           PipelineState<ReviewDetail>& state)
{
    auto page = source->listPage(filter, state.cursor);
    if (!page.ok())
        return page.status();

    state.has_more = page->has_more;
    state.cursor   = std::move(page->next_cursor);
    state.seen    += page->items.size();
    util::LogDebug("Fanout", "get user reviews got items: {}", page->items.size());

    if (page->items.empty())
        return absl::OkStatus();

    // Sized to the page so no worker ever blocks; declared before the
    // workers so they are joined while it is still alive.
    auto [tx, rx] = MakeChannel<DetailResult>(page->items.size());
    std::vector<ReviewDetail> fetched;
    {
        std::vector<std::jthread> workers;
        workers.reserve(page->items.size());
        for (const auto& summary : page->items) {
            auto ref = DetailReference::From(summary);
            util::LogDebug("Fanout", "fetching git pull request {}/{}#{}", ref.owner, ref.repo, ref.number);
            workers.emplace_back([source, ref, out = tx]() mutable {
                if (!out.send(source->getDetail(ref)))
                    util::LogDebug("Fanout", "result for {}#{} dropped", ref.repo, ref.number);
            });
        }

        for (std::size_t i = 0; i < page->items.size(); ++i) {
            std::optional<DetailResult> result = rx.receive();
            if (!result)
                return absl::InternalError("detail worker exited without a result");
            if (!result->ok())
                return result->status();
            if (result->value())
                fetched.push_back(std::move(*result->value()));
        }
    }

    for (auto& detail : fetched)
        state.backlog.push_back(std::move(detail));
    return absl::OkStatus();
}

ReviewStream<ReviewDetail> DetailFanout::start(source::ReviewFilter filter) const
{
    auto src = source_;
    RefillFn<ReviewDetail> refill =
        [src, filter = std::move(filter)](PipelineState<ReviewDetail>& state) {
            return RefillDetails(src, filter, state);
        };
    return SpawnPump<ReviewDetail>(options_, std::move(refill), "DetailFanout");
}

} // namespace rev::pipeline
