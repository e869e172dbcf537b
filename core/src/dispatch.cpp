#include "agentd/dispatch.h"
#include "agentd/encoding.h"
#include "agentd/json_mini.h"

#include <json-c/json.h>

namespace agentd {

const char* dispatch_error_to_str(DispatchError e) {
    switch (e) {
        case DispatchError::NONE: return "NONE";
        case DispatchError::REJECTED_TARGET: return "REJECTED_TARGET";
        case DispatchError::TRANSPORT: return "TRANSPORT";
        case DispatchError::HTTP_STATUS: return "HTTP_STATUS";
    }
    return "TRANSPORT";
}

static std::string lower_ascii(std::string s) {
    for (char& c : s) if (c>='A' && c<='Z') c = (char)(c - 'A' + 'a');
    return s;
}

static bool ends_with(const std::string& s, const std::string& suf) {
    if (s.size() < suf.size()) return false;
    return s.compare(s.size()-suf.size(), suf.size(), suf) == 0;
}

// {"<key>": text} with json-c escaping.
static std::string single_field_json(const char* key, const std::string& text) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, key, json_object_new_string_len(text.c_str(), (int)text.size()));
    std::string out = json_mini::to_string(o);
    json_object_put(o);
    return out;
}

bool ResultDispatcher::callback_host_allowed(const std::string& host) const {
    if (cfg_.callback_allowed_hosts.empty()) return !cfg_.callback_default_deny;

    std::string h = lower_ascii(host);
    for (auto tok : cfg_.callback_allowed_hosts) {
        tok = lower_ascii(tok);
        if (tok == "*") return true;
        if (tok.rfind("*.", 0) == 0) {
            std::string suf = tok.substr(1); // ".example.com"
            if (ends_with(h, suf)) return true;
            continue;
        }
        if (h == tok) return true;
    }
    return false;
}

DispatchReport ResultDispatcher::post_json(const std::string& url,
                                           const std::vector<std::pair<std::string, std::string>>& headers,
                                           const std::string& body) {
    DispatchReport rep;
    HttpRequest req;
    req.url = url;
    req.headers = headers;
    req.headers.emplace_back("Content-Type", "application/json");
    req.body = body;
    req.timeout_ms = cfg_.http_timeout_ms;

    HttpResponse resp;
    std::string err;
    rep.called = true;
    if (!http_.post(req, &resp, &err)) {
        rep.error = DispatchError::TRANSPORT;
        rep.message = err;
        return rep;
    }
    rep.http_status = resp.status;
    if (resp.status < 200 || resp.status >= 300) {
        rep.error = DispatchError::HTTP_STATUS;
        rep.message = "HTTP " + std::to_string(resp.status) + ": " + utf8_prefix(resp.body, 500);
    }
    return rep;
}

DispatchReport ResultDispatcher::dispatch(const ReplyDescriptor& reply, const ExecutionResult& result) {
    switch (reply.kind) {
    case ReplyDescriptor::Kind::NONE:
        return DispatchReport{};

    case ReplyDescriptor::Kind::ISSUE_COMMENT: {
        std::string text = utf8_prefix(result.stdout_data, cfg_.comment_max_bytes);
        bool truncated = text.size() < result.stdout_data.size();
        if (text.empty()) text = "(agent produced no output)";

        std::string url = cfg_.github_api_base + "/repos/" + reply.repo +
                          "/issues/" + std::to_string(reply.number) + "/comments";
        DispatchReport rep = post_json(url,
            {{"Authorization", "Bearer " + reply.token},
             {"Accept", "application/vnd.github+json"},
             {"X-GitHub-Api-Version", "2022-11-28"}},
            single_field_json("body", text));
        rep.bytes_sent = text.size();
        rep.truncated = truncated;
        return rep;
    }

    case ReplyDescriptor::Kind::CHAT_MESSAGE: {
        DispatchReport rep;
        const std::string& url = reply.callback_url;
        if (!(url.rfind("https://", 0) == 0 || url.rfind("http://", 0) == 0)) {
            rep.error = DispatchError::REJECTED_TARGET;
            rep.message = "only http/https callback urls allowed";
            return rep;
        }
        std::string host = url_host(url);
        if (host.empty()) {
            rep.error = DispatchError::REJECTED_TARGET;
            rep.message = "cannot parse callback host";
            return rep;
        }
        if (!callback_host_allowed(host)) {
            rep.error = DispatchError::REJECTED_TARGET;
            rep.message = "callback host not allowed: " + host;
            return rep;
        }

        std::string text = utf8_prefix(result.stdout_data, cfg_.chat_max_bytes);
        rep = post_json(url, {}, single_field_json("text", text));
        rep.bytes_sent = text.size();
        rep.truncated = text.size() < result.stdout_data.size();
        return rep;
    }
    }
    return DispatchReport{};
}

} // namespace agentd
