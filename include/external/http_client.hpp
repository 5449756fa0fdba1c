#pragma once

#include <curl/curl.h>
#include <string>
#include <vector>

namespace fxsig {
namespace external {

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * HttpClient - blocking libcurl wrapper for the slow-path collaborators
 *
 * One reusable easy handle per client. Not thread-safe; each owner keeps
 * its own client. Every request has a hard timeout.
 *
 * Transport failures throw std::runtime_error; HTTP status codes are
 * returned as-is for the caller to judge.
 */
class HttpClient {
public:
    explicit HttpClient(long timeout_seconds = 30);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse get(const std::string& url, const std::vector<std::string>& headers = {});
    HttpResponse post(const std::string& url, const std::string& body, const std::vector<std::string>& headers = {});

    // Percent-encode a query parameter
    std::string escape(const std::string& value);

private:
    CURL* curl_ = nullptr;
    long timeout_seconds_;

    HttpResponse perform(const std::string& url, const std::string* body, const std::vector<std::string>& headers);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};

} // namespace external
} // namespace fxsig
