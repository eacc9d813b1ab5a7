#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace revscan {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isOk() const { return status_code == 200; }
    bool isRateLimited() const { return status_code == 429; }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

// Browser-like headers the quote pages expect
inline std::map<std::string, std::string> defaultBrowserHeaders() {
    return {
        {"User-Agent",
         "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
         "(KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36"},
        {"Accept-Language", "en-US,en;q=0.9"},
    };
}

// Percent-encodes everything outside the RFC 3986 unreserved set
inline std::string encodeUrlComponent(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // GET an absolute URL. Transport failures (DNS, TLS, timeout) throw
    // std::runtime_error; any HTTP status is returned as a response.
    virtual HttpResponse get(
        const std::string& url,
        int timeout_seconds,
        const std::map<std::string, std::string>& headers = {}
    ) = 0;
};

} // namespace network
} // namespace revscan
