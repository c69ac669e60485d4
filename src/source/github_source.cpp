// src/source/github_source.cpp
#include "source/github_source.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <absl/status/status.h>
#include <fmt/core.h>

using json = nlohmann::json;

namespace rev::source {

namespace {

constexpr const char* kPullRequestsQuery = R"(
query PullRequests($query: String!, $cursor: String, $first: Int!) {
  search(query: $query, type: ISSUE, first: $first, after: $cursor) {
    pageInfo { endCursor hasNextPage }
    nodes {
      __typename
      ... on PullRequest {
        id number title createdAt
        repository { name owner { login } }
      }
    }
  }
})";

constexpr const char* kPullRequestQuery = R"(
query PullRequest($owner: String!, $name: String!, $number: Int!) {
  repository(owner: $owner, name: $name) {
    nameWithOwner
    pullRequest(number: $number) {
      id number title bodyText publishedAt
      author { login }
      labels(first: 20) { nodes { name } }
      comments(last: 20) {
        pageInfo { hasPreviousPage }
        nodes { author { login } bodyText }
      }
      commits(last: 1) {
        nodes {
          commit {
            statusCheckRollup {
              contexts(first: 50) {
                nodes {
                  __typename
                  ... on CheckRun { id name status conclusion }
                  ... on StatusContext { id state description context }
                }
              }
            }
          }
        }
      }
    }
  }
})";

std::string str(const json& j, const char* key, const std::string& def = "")
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return def;
    return it->get<std::string>();
}

bool flag(const json& j, const char* key)
{
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

uint64_t number(const json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) return 0;
    return it->get<uint64_t>();
}

std::string login(const json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return "ghost";
    return str(*it, "login", "ghost");
}

const json* member(const json& j, const char* key)
{
    if (!j.is_object()) return nullptr;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullptr;
    return &*it;
}

/// IN_PROGRESS -> "in progress"
std::string humanEnum(const std::string& raw)
{
    std::string out;
    out.reserve(raw.size());
    for (unsigned char c : raw)
        out += c == '_' ? ' ' : static_cast<char>(std::tolower(c));
    return out;
}

StatusCheck parseStatusCheck(const json& node)
{
    if (str(node, "__typename") == "CheckRun") {
        CheckRun run;
        run.id         = str(node, "id");
        run.name       = str(node, "name");
        run.status     = humanEnum(str(node, "status"));
        run.conclusion = node.contains("conclusion") && node["conclusion"].is_string()
                             ? humanEnum(node["conclusion"].get<std::string>())
                             : std::string("unknown");
        return run;
    }

    StatusContext ctx;
    ctx.id      = str(node, "id");
    ctx.state   = humanEnum(str(node, "state"));
    ctx.context = str(node, "context");
    if (node.contains("description") && node["description"].is_string())
        ctx.description = node["description"].get<std::string>();
    return ctx;
}

} // namespace

absl::StatusOr<std::string> ResolveGithubToken(const std::string& configured, bool use_gh)
{
    if (!configured.empty()) return configured;

    if (use_gh) {
        if (FILE* pipe = ::popen("gh auth token 2>/dev/null", "r")) {
            std::string out;
            std::array<char, 256> buf{};
            while (std::fgets(buf.data(), static_cast<int>(buf.size()), pipe))
                out += buf.data();
            int rc = ::pclose(pipe);
            while (!out.empty() && std::isspace(static_cast<unsigned char>(out.back())))
                out.pop_back();
            if (rc == 0 && !out.empty()) {
                util::LogDebug("Github", "found github token using gh");
                return out;
            }
            util::LogDebug("Github", "gh auth token unavailable (rc={})", rc);
        }
    }

    util::LogDebug("Github", "falling back on GITHUB_API_TOKEN");
    if (const char* env = std::getenv("GITHUB_API_TOKEN"); env && *env)
        return std::string(env);

    return absl::UnauthenticatedError("GITHUB_API_TOKEN was not found");
}

std::string BuildSearchQuery(const ReviewFilter& filter)
{
    std::string requested = "review-requested:@me";
    if (filter.requested) {
        auto slash = filter.requested->find('/');
        requested = slash == std::string::npos
                        ? fmt::format("review-requested:{}", *filter.requested)
                        : fmt::format("team-review-requested:{}", *filter.requested);
    }

    std::string query = fmt::format("is:pr {} state:open", requested);
    if (filter.org)
        query += fmt::format(" org:{}", *filter.org);
    if (!filter.labels.empty()) {
        std::string joined;
        for (const auto& l : filter.labels)
            joined += (joined.empty() ? "" : ",") + l;
        query += fmt::format(" label:{}", joined);
    }
    return query;
}

GithubSource::GithubSource(std::shared_ptr<IHttpTransport> transport,
                           std::string token,
                           GithubOptions options)
    : transport_(std::move(transport)), token_(std::move(token)), options_(std::move(options))
{
}

absl::StatusOr<json> GithubSource::query(const std::string& document, const json& variables)
{
    json request = {{"query", document}, {"variables", variables}};
    std::vector<std::string> headers = {
        fmt::format("Authorization: Bearer {}", token_),
        "Content-Type: application/json",
        "User-Agent: rev",
    };

    auto res = transport_->post(options_.uri, headers, request.dump());
    if (!res.ok())
        return absl::UnavailableError(
            fmt::format("github call graphql query failed: {}", std::string(res.status().message())));

    if (res->status < 200 || res->status >= 300) {
        util::LogError("Github", "GraphQL Error: {}", res->body);
        return absl::UnavailableError(
            fmt::format("failed to query graphql endpoint (HTTP {})", res->status));
    }

    json body = json::parse(res->body, nullptr, /*allow_exceptions=*/false);
    if (body.is_discarded())
        return absl::DataLossError("failed to get json from response");

    if (auto errors = body.find("errors"); errors != body.end() && errors->is_array() && !errors->empty()) {
        std::string msg;
        for (const auto& e : *errors)
            msg += (msg.empty() ? "" : "; ") + str(e, "message", e.dump());
        return absl::InternalError(fmt::format("GitHub error: {}", msg));
    }

    const json* data = member(body, "data");
    if (!data)
        return absl::DataLossError("data to be present");
    return *data;
}

absl::StatusOr<ReviewPage> GithubSource::listPage(const ReviewFilter& filter,
                                                  const std::optional<std::string>& cursor)
{
    json vars = {{"query", BuildSearchQuery(filter)}, {"first", options_.page_size}};
    vars["cursor"] = cursor ? json(*cursor) : json(nullptr);

    auto data = query(kPullRequestsQuery, vars);
    if (!data.ok()) return data.status();
    return ParseSearchResponse(*data);
}

absl::StatusOr<std::optional<ReviewDetail>> GithubSource::getDetail(const DetailReference& ref)
{
    json vars = {{"owner", ref.owner}, {"name", ref.repo}, {"number", ref.number}};
    auto data = query(kPullRequestQuery, vars);
    if (!data.ok()) return data.status();
    return ParseReviewResponse(*data);
}

absl::StatusOr<ReviewPage> GithubSource::ParseSearchResponse(const json& data)
{
    const json* search = member(data, "search");
    if (!search)
        return absl::DataLossError("search to be present");
    const json* nodes = member(*search, "nodes");
    if (!nodes || !nodes->is_array())
        return absl::DataLossError("nodes to be present");

    ReviewPage page;
    if (const json* info = member(*search, "pageInfo")) {
        if (info->contains("endCursor") && (*info)["endCursor"].is_string())
            page.next_cursor = (*info)["endCursor"].get<std::string>();
        page.has_more = flag(*info, "hasNextPage");
    }

    for (const auto& node : *nodes) {
        if (!node.is_object() || str(node, "__typename") != "PullRequest") continue;

        ReviewSummary item;
        item.id     = str(node, "id");
        item.title  = str(node, "title");
        item.number = number(node, "number");
        if (auto ts = ParseTimestamp(str(node, "createdAt")))
            item.created_at = *ts;
        if (const json* repo = member(node, "repository")) {
            item.name  = str(*repo, "name");
            item.owner = login(*repo, "owner");
        }
        page.items.push_back(std::move(item));
    }
    return page;
}

absl::StatusOr<std::optional<ReviewDetail>> GithubSource::ParseReviewResponse(const json& data)
{
    const json* repo = member(data, "repository");
    if (!repo) return std::optional<ReviewDetail>{};
    const json* pr = member(*repo, "pullRequest");
    if (!pr) return std::optional<ReviewDetail>{};

    ReviewDetail review;
    review.id          = str(*pr, "id");
    review.number      = number(*pr, "number");
    review.title       = str(*pr, "title");
    review.description = str(*pr, "bodyText");
    review.repository  = str(*repo, "nameWithOwner");
    review.author      = login(*pr, "author");
    review.publish_at  = ParseTimestamp(str(*pr, "publishedAt"));

    if (const json* labels = member(*pr, "labels"))
        if (const json* nodes = member(*labels, "nodes"); nodes && nodes->is_array())
            for (const auto& n : *nodes)
                if (n.is_object()) review.labels.push_back(str(n, "name"));

    if (const json* comments = member(*pr, "comments")) {
        if (const json* info = member(*comments, "pageInfo"))
            review.comments.has_previous = flag(*info, "hasPreviousPage");
        if (const json* nodes = member(*comments, "nodes"); nodes && nodes->is_array())
            for (const auto& n : *nodes)
                if (n.is_object())
                    review.comments.comments.push_back({login(n, "author"), str(n, "bodyText")});
    }

    if (const json* commits = member(*pr, "commits")) {
        const json* nodes = member(*commits, "nodes");
        if (!nodes || !nodes->is_array()) return std::optional<ReviewDetail>(std::move(review));
        for (const auto& n : *nodes) {
            const json* commit = member(n, "commit");
            const json* rollup = commit ? member(*commit, "statusCheckRollup") : nullptr;
            const json* ctxs   = rollup ? member(*rollup, "contexts") : nullptr;
            const json* cnodes = ctxs ? member(*ctxs, "nodes") : nullptr;
            if (!cnodes || !cnodes->is_array()) continue;
            for (const auto& c : *cnodes)
                if (c.is_object()) review.status_checks.push_back(parseStatusCheck(c));
        }
    }

    return std::optional<ReviewDetail>(std::move(review));
}

} // namespace rev::source
