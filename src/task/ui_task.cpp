#include "task/ui_task.hpp"
#include "task/runtime.hpp"
#include "display/app.hpp"
#include "display/review_list_view.hpp"
#include "display/review_view.hpp"
#include "pipeline/detail_fanout.hpp"
#include "util/log.hpp"

#include <memory>

namespace rev::task {

int StartUi()
{
    auto& rt = Runtime::getInstance();
    if (!rt.source) {
        util::LogError("UiTask", "Init has not produced a review source");
        return 1;
    }

    display::App app(rt.app_options);
    app.registerPage(display::kReviewListPage,
                     std::make_unique<display::ReviewListView>(
                         pipeline::PaginationPump(rt.source, rt.summary_options),
                         rt.filter, rt.circular, rt.truncate));
    app.registerPage(display::kReviewPage,
                     std::make_unique<display::ReviewView>(
                         pipeline::DetailFanout(rt.source, rt.detail_options),
                         rt.filter, rt.circular, rt.truncate));

    util::LogInfo("UiTask", "starting tui");
    app.run(display::kReviewListPage);
    util::LogInfo("UiTask", "stopping tui");
    return 0;
}

} // namespace rev::task
