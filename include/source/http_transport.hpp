#pragma once

#include <string>
#include <vector>
#include <absl/status/statusor.h>

namespace rev::source {

struct HttpResponse {
    long        status {0};
    std::string body;
};

class IHttpTransport {
    public:
        virtual ~IHttpTransport() = default;
        /// Non-OK only for transport failures; HTTP error codes come back in `status`.
        virtual absl::StatusOr<HttpResponse> post(const std::string& url,
                                                  const std::vector<std::string>& headers,
                                                  const std::string& body) = 0;
};

} // namespace rev::source
