#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace agentd {

enum class Profile { DEV, PROD };

// Detect profile from AGENTD_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (callbacks to any host, long http timeout)
// PROD: strict (callback hosts default-deny, shorter http timeout)
void apply_profile_defaults(Profile p);

// Process-wide settings for a worker, built once at startup and passed by
// reference into WorkerLoop.
struct WorkerConfig {
    // external binary
    std::string agent_binary{"cursor-agent"};
    std::string api_key_var{"CURSOR_API_KEY"};
    std::string api_key;
    bool require_api_key{true};
    std::vector<std::pair<std::string, std::string>> extra_env; // added to every child env

    // sandbox
    std::string sandbox_root{"/tmp/agentd"};
    bool keep_sandboxes{false};

    // execution
    int default_deadline_seconds{900};
    size_t stdout_max_bytes{8 * 1024 * 1024};
    size_t stderr_max_bytes{8 * 1024 * 1024};
    size_t stderr_report_bytes{4000};
    int rlimit_nofile{0};       // 0 = leave unchanged
    size_t rlimit_fsize_mb{0};  // 0 = leave unchanged

    // dispatch
    std::string github_api_base{"https://api.github.com"};
    size_t comment_max_bytes{65000};
    size_t chat_max_bytes{39000};
    long http_timeout_ms{15000};
    std::vector<std::string> callback_allowed_hosts;
    bool callback_default_deny{false};

    // policy
    bool retry_agent_errors{false};

    // logging
    std::string log_path; // empty = stderr
};

// Build a WorkerConfig from AGENTD_* environment variables. Invalid numbers
// fall back to defaults. Throws std::runtime_error when the API key is
// required but its variable is unset or empty.
WorkerConfig load_worker_config();

} // namespace agentd
