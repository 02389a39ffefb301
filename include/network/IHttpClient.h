#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace kestrel {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

using HeaderMap = std::map<std::string, std::string>;

// Plain transport. Throws std::runtime_error when no response was received.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse get(const std::string& url, const HeaderMap& headers) = 0;
    virtual HttpResponse post(const std::string& url, const std::string& body, const HeaderMap& headers) = 0;
    virtual HttpResponse del(const std::string& url, const HeaderMap& headers) = 0;
};

} // namespace network
} // namespace kestrel
