#pragma once

#include "source/http_transport.hpp"

namespace rev::source {

/// libcurl backed transport. Each call uses its own easy handle, so one
/// instance may be shared by concurrent callers.
class CurlTransport final : public IHttpTransport {
    public:
        explicit CurlTransport(long timeout_ms = 30000);

        absl::StatusOr<HttpResponse> post(const std::string& url,
                                          const std::vector<std::string>& headers,
                                          const std::string& body) override;

    private:
        long timeout_ms_;
};

} // namespace rev::source
