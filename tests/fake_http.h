#pragma once

#include "agentd/http.h"

#include <mutex>
#include <vector>

// Records every request and answers with a fixed status, or a transport
// error when `fail_transport` is set.
class RecordingHttpClient : public agentd::HttpClient {
public:
    long status{200};
    bool fail_transport{false};
    std::vector<agentd::HttpRequest> requests;

    bool post(const agentd::HttpRequest& req, agentd::HttpResponse* resp, std::string* err) override {
        std::lock_guard<std::mutex> lk(mu_);
        requests.push_back(req);
        if (fail_transport) {
            if (err) *err = "connection refused";
            return false;
        }
        resp->status = status;
        resp->body = status >= 300 ? "{\"message\":\"nope\"}" : "{}";
        return true;
    }

    std::string header(size_t i, const std::string& name) const {
        for (auto& kv : requests.at(i).headers) {
            if (kv.first == name) return kv.second;
        }
        return "";
    }

private:
    std::mutex mu_;
};
