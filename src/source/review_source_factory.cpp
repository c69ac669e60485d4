// src/source/review_source_factory.cpp
#include "source/review_source.hpp"
#include "source/github_source.hpp"
#include "source/curl_transport.hpp"
#include "config/config_loader.hpp"
#include "util/log.hpp"

#include <absl/status/status.h>
#include <fmt/core.h>

namespace rev::source {

absl::StatusOr<std::shared_ptr<IReviewSource>> IReviewSource::create(std::string_view backend)
{
    if (backend == "github") {
        auto& cfg = rev::config::ConfigLoader::getInstance();

        GithubOptions opts;
        opts.uri        = cfg.Get("github", "uri", opts.uri);
        opts.use_gh     = cfg.GetBool("github", "use_gh", opts.use_gh);
        opts.timeout_ms = cfg.GetInt("github", "timeout_ms", static_cast<int>(opts.timeout_ms));
        opts.page_size  = cfg.GetInt("github", "page_size", opts.page_size);

        auto token = ResolveGithubToken(cfg.Get("github", "token", ""), opts.use_gh);
        if (!token.ok()) return token.status();

        auto transport = std::make_shared<CurlTransport>(opts.timeout_ms);
        return std::shared_ptr<IReviewSource>(
            std::make_shared<GithubSource>(std::move(transport), *token, opts));
    }

    util::LogError("IReviewSource::create", "Unknown backend: {}", backend);
    return absl::InvalidArgumentError(fmt::format("unknown review backend: {}", backend));
}

} // namespace rev::source
