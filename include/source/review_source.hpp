// -----------------------------------------------------------------------------
// Review source *interface* layer
// -----------------------------------------------------------------------------
#pragma once

#include "source/review_models.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <absl/status/statusor.h>

namespace rev::source {

/// Remote capability the pipeline pulls from. Implementations must tolerate
/// concurrent calls from several threads (the detail fan-out issues them).
class IReviewSource {
    public:
        virtual ~IReviewSource() = default;

        virtual absl::StatusOr<ReviewPage> listPage(const ReviewFilter& filter,
                                                    const std::optional<std::string>& cursor) = 0;

        /// std::nullopt when the review no longer exists or is not accessible.
        virtual absl::StatusOr<std::optional<ReviewDetail>> getDetail(const DetailReference& ref) = 0;

        /// Builds the backend named in `[github] backend` ("github").
        static absl::StatusOr<std::shared_ptr<IReviewSource>> create(std::string_view backend);

        // non-copyable
        IReviewSource(const IReviewSource&)            = delete;
        IReviewSource& operator=(const IReviewSource&) = delete;

    protected:
        IReviewSource() = default;  ///< protected constructor to prevent instantiation
};

} // namespace rev::source
