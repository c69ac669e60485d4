#pragma once

#include "display/app.hpp"
#include "pipeline/pagination_pump.hpp"
#include "source/review_source.hpp"

#include <memory>
#include <absl/base/no_destructor.h>

namespace rev::task {

/// Everything Init() resolves and the UI task consumes.
struct Runtime {
    std::shared_ptr<source::IReviewSource> source;
    source::ReviewFilter  filter;
    pipeline::PumpOptions summary_options;
    pipeline::PumpOptions detail_options;
    display::AppOptions   app_options;
    bool circular {true};
    bool truncate {true};

    static Runtime& getInstance();

 private:
    friend class absl::NoDestructor<Runtime>;
    Runtime() = default;
};

} // namespace rev::task
