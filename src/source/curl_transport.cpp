// src/source/curl_transport.cpp
#include "source/curl_transport.hpp"
#include "util/log.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <absl/status/status.h>
#include <fmt/core.h>

namespace rev::source {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

} // namespace

CurlTransport::CurlTransport(long timeout_ms) : timeout_ms_(timeout_ms)
{
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT); rc != CURLE_OK)
            util::LogError("CurlTransport", "curl_global_init failed: {}", curl_easy_strerror(rc));
    });
}

absl::StatusOr<HttpResponse> CurlTransport::post(const std::string& url,
                                                 const std::vector<std::string>& headers,
                                                 const std::string& body)
{
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl)
        return absl::UnavailableError("failed to init curl");

    curl_slist* raw_list = nullptr;
    for (const auto& h : headers)
        raw_list = curl_slist_append(raw_list, h.c_str());
    std::unique_ptr<curl_slist, CurlSlistDeleter> header_list(raw_list);

    HttpResponse response;
    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::string msg = fmt::format("curl POST {} failed: {}", url, curl_easy_strerror(res));
        if (errbuf[0] != '\0')
            msg += fmt::format(" - {}", errbuf);
        util::LogError("CurlTransport", "{}", msg);
        return absl::UnavailableError(msg);
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace rev::source
