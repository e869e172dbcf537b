#include "agentd/config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace agentd {

Profile detect_profile() {
    const char* env = std::getenv("AGENTD_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("AGENTD_HTTP_TIMEOUT_MS",        "30000", NO_OVERWRITE);
            setenv("AGENTD_CALLBACK_DEFAULT_DENY",  "0",     NO_OVERWRITE);
            setenv("AGENTD_REQUIRE_API_KEY",        "0",     NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("AGENTD_HTTP_TIMEOUT_MS",        "15000", NO_OVERWRITE);
            // callbacks: default deny, set AGENTD_CALLBACK_ALLOWED_HOSTS explicitly
            setenv("AGENTD_CALLBACK_DEFAULT_DENY",  "1",     NO_OVERWRITE);
            setenv("AGENTD_REQUIRE_API_KEY",        "1",     NO_OVERWRITE);
            setenv("AGENTD_KEEP_SANDBOXES",         "0",     NO_OVERWRITE);
            break;
    }
}

namespace {

std::string getenv_str(const char* k, const std::string& defv) {
    const char* v = std::getenv(k);
    if (!v || !*v) return defv;
    return v;
}

int64_t getenv_i64(const char* k, int64_t defv) {
    if (const char* e = std::getenv(k)) {
        try { return std::stoll(e); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

bool getenv_bool(const char* k, bool defv) {
    const char* v = std::getenv(k);
    if (!v) return defv;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

std::string trim_ws(std::string s) {
    while (!s.empty() && (s.back()=='\n' || s.back()=='\r' || s.back()==' ' || s.back()=='\t')) s.pop_back();
    size_t i=0;
    while (i<s.size() && (s[i]=='\n' || s[i]=='\r' || s[i]==' ' || s[i]=='\t')) i++;
    if (i) s.erase(0,i);
    return s;
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') {
            cur = trim_ws(cur);
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    cur = trim_ws(cur);
    if (!cur.empty()) out.push_back(cur);
    return out;
}

} // namespace

WorkerConfig load_worker_config() {
    WorkerConfig c;

    c.agent_binary = getenv_str("AGENTD_AGENT_BIN", c.agent_binary);
    c.api_key_var = getenv_str("AGENTD_API_KEY_VAR", c.api_key_var);
    c.api_key = getenv_str(c.api_key_var.c_str(), "");
    c.require_api_key = getenv_bool("AGENTD_REQUIRE_API_KEY", c.require_api_key);
    if (c.require_api_key && c.api_key.empty()) {
        throw std::runtime_error("missing " + c.api_key_var);
    }
    if (!c.api_key.empty()) c.extra_env.emplace_back(c.api_key_var, c.api_key);

    c.sandbox_root = getenv_str("AGENTD_SANDBOX_ROOT", c.sandbox_root);
    c.keep_sandboxes = getenv_bool("AGENTD_KEEP_SANDBOXES", c.keep_sandboxes);

    int64_t deadline = getenv_i64("AGENTD_DEFAULT_DEADLINE_S", c.default_deadline_seconds);
    if (deadline > 0 && deadline <= 7 * 24 * 3600) c.default_deadline_seconds = (int)deadline;

    auto positive_size = [](const char* k, size_t defv) -> size_t {
        int64_t v = getenv_i64(k, (int64_t)defv);
        return v > 0 ? (size_t)v : defv;
    };
    c.stdout_max_bytes = positive_size("AGENTD_STDOUT_MAX_BYTES", c.stdout_max_bytes);
    c.stderr_max_bytes = positive_size("AGENTD_STDERR_MAX_BYTES", c.stderr_max_bytes);
    c.stderr_report_bytes = positive_size("AGENTD_STDERR_REPORT_BYTES", c.stderr_report_bytes);
    c.comment_max_bytes = positive_size("AGENTD_COMMENT_MAX_BYTES", c.comment_max_bytes);
    c.chat_max_bytes = positive_size("AGENTD_CHAT_MAX_BYTES", c.chat_max_bytes);

    int64_t nofile = getenv_i64("AGENTD_RLIMIT_NOFILE", 0);
    c.rlimit_nofile = (nofile > 0 && nofile < 1 << 20) ? (int)nofile : 0;
    int64_t fsize = getenv_i64("AGENTD_RLIMIT_FSIZE_MB", 0);
    c.rlimit_fsize_mb = fsize > 0 ? (size_t)fsize : 0;

    c.github_api_base = getenv_str("AGENTD_GITHUB_API", c.github_api_base);
    while (!c.github_api_base.empty() && c.github_api_base.back() == '/') c.github_api_base.pop_back();
    int64_t http_timeout = getenv_i64("AGENTD_HTTP_TIMEOUT_MS", c.http_timeout_ms);
    if (http_timeout > 0) c.http_timeout_ms = (long)http_timeout;
    c.callback_allowed_hosts = split_csv(getenv_str("AGENTD_CALLBACK_ALLOWED_HOSTS", ""));
    c.callback_default_deny = getenv_bool("AGENTD_CALLBACK_DEFAULT_DENY", c.callback_default_deny);

    c.retry_agent_errors = getenv_bool("AGENTD_RETRY_AGENT_ERRORS", c.retry_agent_errors);
    c.log_path = getenv_str("AGENTD_LOG_PATH", "");
    return c;
}

} // namespace agentd
