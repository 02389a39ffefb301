#pragma once

#include "network/IHttpClient.h"
#include <curl/curl.h>
#include <mutex>

namespace kestrel {
namespace network {

// libcurl easy handle shared by all callers, serialized by a mutex
class CurlHttpClient : public IHttpClient {
public:
    explicit CurlHttpClient(long timeout_seconds = 30);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const std::string& url, const HeaderMap& headers) override;
    HttpResponse post(const std::string& url, const std::string& body, const HeaderMap& headers) override;
    HttpResponse del(const std::string& url, const HeaderMap& headers) override;

private:
    HttpResponse performRequest(
        const std::string& method,
        const std::string& url,
        const std::string& body_data,
        const HeaderMap& headers
    );

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

    CURL* curl_;
    long timeout_seconds_;
    std::mutex mutex_;
};

} // namespace network
} // namespace kestrel
