#pragma once

#include "source/review_source.hpp"
#include "source/http_transport.hpp"

#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace rev::source {

struct GithubOptions {
    std::string uri        {"https://api.github.com/graphql"};
    bool        use_gh     {true};     ///< ask `gh auth token` when no token is configured
    long        timeout_ms {30000};
    int         page_size  {10};       ///< search results per page
};

/// config token -> `gh auth token` -> $GITHUB_API_TOKEN
absl::StatusOr<std::string> ResolveGithubToken(const std::string& configured, bool use_gh);

/// Search qualifier string for the GitHub issue search API.
std::string BuildSearchQuery(const ReviewFilter& filter);

class GithubSource final : public IReviewSource {
    public:
        GithubSource(std::shared_ptr<IHttpTransport> transport,
                     std::string token,
                     GithubOptions options = {});

        absl::StatusOr<ReviewPage> listPage(const ReviewFilter& filter,
                                            const std::optional<std::string>& cursor) override;
        absl::StatusOr<std::optional<ReviewDetail>> getDetail(const DetailReference& ref) override;

        // Response mapping, exposed for tests.
        static absl::StatusOr<ReviewPage> ParseSearchResponse(const nlohmann::json& data);
        static absl::StatusOr<std::optional<ReviewDetail>> ParseReviewResponse(const nlohmann::json& data);

    private:
        /// POSTs a GraphQL document and returns its `data` member.
        absl::StatusOr<nlohmann::json> query(const std::string& document,
                                             const nlohmann::json& variables);

        std::shared_ptr<IHttpTransport> transport_;
        std::string   token_;
        GithubOptions options_;
};

} // namespace rev::source
