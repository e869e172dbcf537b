#include "test_common.h"
#include "agentd/config.h"

#include <cstdlib>
#include <initializer_list>
#include <stdexcept>

static void clear_env() {
    for (const char* k : {"AGENTD_PROFILE", "AGENTD_HTTP_TIMEOUT_MS", "AGENTD_CALLBACK_DEFAULT_DENY",
                          "AGENTD_REQUIRE_API_KEY", "AGENTD_KEEP_SANDBOXES", "AGENTD_AGENT_BIN",
                          "AGENTD_API_KEY_VAR", "CURSOR_API_KEY", "TEST_AGENT_KEY",
                          "AGENTD_DEFAULT_DEADLINE_S", "AGENTD_CALLBACK_ALLOWED_HOSTS",
                          "AGENTD_GITHUB_API", "AGENTD_STDERR_REPORT_BYTES", "AGENTD_RETRY_AGENT_ERRORS"}) {
        unsetenv(k);
    }
}

int main() {
    clear_env();

    // Test 1: Default profile is DEV
    auto p = agentd::detect_profile();
    expect_true(p == agentd::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive, long form
    setenv("AGENTD_PROFILE", "prod", 1);
    expect_true(agentd::detect_profile() == agentd::Profile::PROD, "should detect PROD");
    setenv("AGENTD_PROFILE", "PRODUCTION", 1);
    expect_true(agentd::detect_profile() == agentd::Profile::PROD, "should detect PRODUCTION");
    setenv("AGENTD_PROFILE", "staging", 1);
    expect_true(agentd::detect_profile() == agentd::Profile::DEV, "unknown profile falls back to DEV");

    // Test 3: Apply defaults (won't override existing)
    setenv("AGENTD_HTTP_TIMEOUT_MS", "42", 1);
    agentd::apply_profile_defaults(agentd::Profile::PROD);
    std::string val = std::getenv("AGENTD_HTTP_TIMEOUT_MS") ? std::getenv("AGENTD_HTTP_TIMEOUT_MS") : "";
    expect_true(val == "42", "should NOT override pre-existing env var");

    // Test 4: PROD denies callbacks by default and requires the key
    val = std::getenv("AGENTD_CALLBACK_DEFAULT_DENY") ? std::getenv("AGENTD_CALLBACK_DEFAULT_DENY") : "";
    expect_true(val == "1", "PROD should set CALLBACK_DEFAULT_DENY=1");
    val = std::getenv("AGENTD_REQUIRE_API_KEY") ? std::getenv("AGENTD_REQUIRE_API_KEY") : "";
    expect_true(val == "1", "PROD should set REQUIRE_API_KEY=1");

    // Test 5: missing required key throws
    bool threw = false;
    try {
        (void)agentd::load_worker_config();
    } catch (const std::runtime_error& e) {
        threw = true;
        expect_true(std::string(e.what()).find("CURSOR_API_KEY") != std::string::npos,
                    "error should name the missing variable");
    }
    expect_true(threw, "missing CURSOR_API_KEY should throw when required");

    // Test 6: key present is passed to children, numbers parsed
    setenv("CURSOR_API_KEY", "k-123", 1);
    setenv("AGENTD_DEFAULT_DEADLINE_S", "120", 1);
    setenv("AGENTD_CALLBACK_ALLOWED_HOSTS", "hooks.slack.com, example.org ,", 1);
    setenv("AGENTD_GITHUB_API", "https://ghe.local/api/v3/", 1);
    auto cfg = agentd::load_worker_config();
    expect_true(cfg.api_key == "k-123", "api key read");
    bool found = false;
    for (auto& kv : cfg.extra_env) {
        if (kv.first == "CURSOR_API_KEY" && kv.second == "k-123") found = true;
    }
    expect_true(found, "api key should be in child env");
    expect_eq_ll(cfg.default_deadline_seconds, 120, "deadline from env");
    expect_eq_ll((long long)cfg.callback_allowed_hosts.size(), 2, "allowed hosts parsed");
    expect_true(cfg.callback_allowed_hosts[1] == "example.org", "hosts trimmed");
    expect_true(cfg.github_api_base == "https://ghe.local/api/v3", "trailing slash stripped");
    expect_eq_ll(cfg.http_timeout_ms, 42, "http timeout from env");
    expect_true(cfg.callback_default_deny, "default deny from profile");

    // Test 7: invalid numbers fall back to defaults
    setenv("AGENTD_DEFAULT_DEADLINE_S", "soon", 1);
    setenv("AGENTD_STDERR_REPORT_BYTES", "-5", 1);
    cfg = agentd::load_worker_config();
    expect_eq_ll(cfg.default_deadline_seconds, 900, "bad deadline falls back");
    expect_eq_ll((long long)cfg.stderr_report_bytes, 4000, "bad report size falls back");

    // Test 8: custom key variable, key optional
    clear_env();
    setenv("AGENTD_API_KEY_VAR", "TEST_AGENT_KEY", 1);
    setenv("AGENTD_REQUIRE_API_KEY", "0", 1);
    setenv("AGENTD_AGENT_BIN", "/opt/agent/bin/agent", 1);
    cfg = agentd::load_worker_config();
    expect_true(cfg.api_key.empty(), "no key");
    expect_true(cfg.extra_env.empty(), "no key in child env");
    expect_true(cfg.agent_binary == "/opt/agent/bin/agent", "binary from env");

    // Test 9: Profile name
    expect_true(std::string(agentd::profile_name(agentd::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(agentd::profile_name(agentd::Profile::PROD)) == "prod", "prod name");

    clear_env();
    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
