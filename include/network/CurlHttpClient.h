#pragma once

#include "network/IHttpClient.h"
#include <curl/curl.h>
#include <map>
#include <string>

namespace revscan {
namespace network {

// libcurl-backed client. Every request uses its own easy handle so
// concurrent symbol pipelines do not serialize on one connection.
class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(
        const std::string& url,
        int timeout_seconds,
        const std::map<std::string, std::string>& headers = {}
    ) override;

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
};

} // namespace network
} // namespace revscan
