#pragma once
#include <string>
#include <utility>
#include <vector>

namespace agentd {

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    long timeout_ms{15000};
};

struct HttpResponse {
    long status{0};
    std::string body;
};

// Outbound POST seam used by the result sinks.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Returns false on transport failure (no HTTP status), filling `err`.
    // Any HTTP status, 2xx or not, returns true with `resp->status` set.
    virtual bool post(const HttpRequest& req, HttpResponse* resp, std::string* err) = 0;
};

// libcurl implementation. One easy handle per call; redirects are not
// followed. curl_global_init must have run before the first call.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::string user_agent = "agentd/1.0") : user_agent_(std::move(user_agent)) {}
    bool post(const HttpRequest& req, HttpResponse* resp, std::string* err) override;

private:
    std::string user_agent_;
};

// Extract the host from scheme://[userinfo@]host[:port]/...; empty on failure.
std::string url_host(const std::string& url);

} // namespace agentd
