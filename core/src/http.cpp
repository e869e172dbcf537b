#include "agentd/http.h"

#include <curl/curl.h>

namespace agentd {

static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    // sink replies are small; cap to avoid buffering a hostile response
    if (s->size() < 1024 * 1024) s->append(static_cast<char*>(contents), total);
    return total;
}

bool CurlHttpClient::post(const HttpRequest& req, HttpResponse* resp, std::string* err) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        if (err) *err = "curl_easy_init failed";
        return false;
    }

    struct curl_slist* headers = nullptr;
    for (const auto& h : req.headers) {
        std::string line = h.first + ": " + h.second;
        headers = curl_slist_append(headers, line.c_str());
    }

    std::string buf;
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)req.body.size());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, req.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
        if (err) *err = std::string("curl_easy_perform failed: ") + curl_easy_strerror(code);
        return false;
    }
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (resp) {
        resp->status = status;
        resp->body = std::move(buf);
    }
    return true;
}

std::string url_host(const std::string& url) {
    auto p = url.find("://");
    if (p == std::string::npos) return "";
    auto rest = url.substr(p + 3);
    auto slash = rest.find_first_of("/?#");
    if (slash != std::string::npos) rest = rest.substr(0, slash);
    auto at = rest.rfind('@');
    if (at != std::string::npos) rest = rest.substr(at + 1);
    if (!rest.empty() && rest[0] == '[') {
        auto close = rest.find(']');
        return close == std::string::npos ? "" : rest.substr(1, close - 1);
    }
    auto colon = rest.find(':');
    if (colon != std::string::npos) rest = rest.substr(0, colon);
    return rest;
}

} // namespace agentd
