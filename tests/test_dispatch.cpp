#include "test_common.h"
#include "fake_http.h"
#include "agentd/dispatch.h"
#include "agentd/json_mini.h"

using namespace agentd;

static ExecutionResult output(const std::string& s) {
    ExecutionResult r;
    r.exit_code = 0;
    r.stdout_data = s;
    return r;
}

static ReplyDescriptor chat(const std::string& url) {
    ReplyDescriptor d;
    d.kind = ReplyDescriptor::Kind::CHAT_MESSAGE;
    d.source_type = "slack.message";
    d.callback_url = url;
    return d;
}

static std::string body_field(const HttpRequest& req, const char* key) {
    auto d = json_mini::parse(req.body);
    return json_mini::get_string(d.root, key).value_or("<missing>");
}

int main() {
    WorkerConfig cfg;
    cfg.github_api_base = "https://api.github.test";

    // Test 1: none makes no call
    {
        RecordingHttpClient http;
        ResultDispatcher d(cfg, http);
        auto rep = d.dispatch(ReplyDescriptor{}, output("hello"));
        expect_true(rep.ok(), "none is ok");
        expect_true(!rep.called, "none makes no call");
        expect_eq_ll((long long)http.requests.size(), 0, "no requests");
    }

    // Test 2: chat output cut to 39000 bytes
    {
        RecordingHttpClient http;
        ResultDispatcher d(cfg, http);
        auto rep = d.dispatch(chat("https://hooks.slack.com/commands/1"), output(std::string(50000, 'x')));
        expect_true(rep.ok(), "chat post ok: " + rep.message);
        expect_eq_ll((long long)http.requests.size(), 1, "one request");
        expect_eq_str(http.requests[0].url, "https://hooks.slack.com/commands/1", "posted to callback url");
        expect_eq_ll((long long)body_field(http.requests[0], "text").size(), 39000, "text capped");
        expect_eq_ll((long long)rep.bytes_sent, 39000, "bytes reported");
        expect_true(rep.truncated, "truncation reported");
        expect_eq_str(http.header(0, "Content-Type"), "application/json", "json content type");
    }

    // Test 3: issue comment url, headers and body
    {
        RecordingHttpClient http;
        http.status = 201;
        ResultDispatcher d(cfg, http);
        ReplyDescriptor r;
        r.kind = ReplyDescriptor::Kind::ISSUE_COMMENT;
        r.repo = "octo/hello";
        r.number = 42;
        r.token = "t0k";
        auto rep = d.dispatch(r, output("review: \"looks good\"\n"));
        expect_true(rep.ok(), "comment ok");
        expect_eq_ll(rep.http_status, 201, "status recorded");
        expect_eq_str(http.requests[0].url, "https://api.github.test/repos/octo/hello/issues/42/comments", "comment url");
        expect_eq_str(http.header(0, "Authorization"), "Bearer t0k", "bearer token");
        expect_eq_str(http.header(0, "Accept"), "application/vnd.github+json", "accept header");
        expect_eq_str(body_field(http.requests[0], "body"), "review: \"looks good\"\n", "body escaped and intact");
        expect_eq_ll(http.requests[0].timeout_ms, cfg.http_timeout_ms, "timeout from config");

        rep = d.dispatch(r, output(std::string(70000, 'y')));
        expect_eq_ll((long long)body_field(http.requests[1], "body").size(), 65000, "comment capped");

        rep = d.dispatch(r, output(""));
        expect_eq_str(body_field(http.requests[2], "body"), "(agent produced no output)", "empty output placeholder");
    }

    // Test 4: non-2xx and transport errors
    {
        RecordingHttpClient http;
        http.status = 404;
        ResultDispatcher d(cfg, http);
        auto rep = d.dispatch(chat("https://hooks.slack.com/x"), output("hi"));
        expect_true(rep.error == DispatchError::HTTP_STATUS, "404 is an HTTP_STATUS error");
        expect_true(rep.message.find("404") != std::string::npos, "message names status");

        http.fail_transport = true;
        rep = d.dispatch(chat("https://hooks.slack.com/x"), output("hi"));
        expect_true(rep.error == DispatchError::TRANSPORT, "transport error");
        expect_true(rep.called, "transport error still counts as a call");
    }

    // Test 5: callback target policy
    {
        RecordingHttpClient http;
        WorkerConfig strict = cfg;
        strict.callback_default_deny = true;
        ResultDispatcher deny_all(strict, http);
        auto rep = deny_all.dispatch(chat("https://hooks.slack.com/x"), output("hi"));
        expect_true(rep.error == DispatchError::REJECTED_TARGET, "default deny without allowlist");

        strict.callback_allowed_hosts = {"*.slack.com", "example.org"};
        ResultDispatcher allow(strict, http);
        expect_true(allow.dispatch(chat("https://hooks.slack.com/x"), output("hi")).ok(), "wildcard host");
        expect_true(allow.dispatch(chat("http://EXAMPLE.org:8080/cb"), output("hi")).ok(), "exact host, any case, port");
        expect_true(allow.dispatch(chat("https://evil.test/cb"), output("hi")).error == DispatchError::REJECTED_TARGET,
                    "host not listed");
        expect_true(allow.dispatch(chat("https://hooks.slack.com.evil.test/"), output("hi")).error ==
                    DispatchError::REJECTED_TARGET, "suffix trick rejected");
        expect_true(allow.dispatch(chat("file:///etc/passwd"), output("hi")).error == DispatchError::REJECTED_TARGET,
                    "non-http scheme");
        expect_eq_ll((long long)http.requests.size(), 2, "rejected targets make no call");
    }

    // Test 6: url_host
    {
        expect_eq_str(url_host("https://user:pw@Host.example:443/p?q"), "Host.example", "host with userinfo and port");
        expect_eq_str(url_host("http://[::1]:8080/"), "::1", "ipv6 literal");
        expect_eq_str(url_host("nonsense"), "", "no scheme");
    }

    std::cerr << "test_dispatch: ALL PASSED" << std::endl;
    return 0;
}
