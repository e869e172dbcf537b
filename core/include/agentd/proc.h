#pragma once

#include "sandbox.h"
#include "types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentd {

struct ProcLimits {
    size_t stdout_max_bytes{8 * 1024 * 1024};
    size_t stderr_max_bytes{8 * 1024 * 1024};

    int rlimit_nofile{0};       // 0 = leave unchanged
    size_t rlimit_fsize_mb{0};  // 0 = leave unchanged

    bool no_new_privs{true};
    bool inherit_env{true};     // start from this process's environment
};

struct RunRequest {
    std::string binary;              // absolute, relative, or looked up on PATH
    std::vector<std::string> args;   // argv[1..], never joined into a shell string
    EnvOverlay env;                  // applied last, overrides inherited values
    std::string cwd;                 // empty = inherit
    int64_t deadline_ms{900 * 1000};
};

enum class RunStatus {
    OK,           // process exited on its own; exit_code may be non-zero
    SPAWN_FAILED, // binary missing, not executable, exec or chdir failed
    TIMEOUT,      // deadline hit; process group killed, partial output kept
};

const char* run_status_to_str(RunStatus s);

// Runs one external process per call in its own process group, stdin on
// /dev/null, stdout and stderr captured separately. A single poll loop
// multiplexes both pipes with the deadline so a stuck or silent child never
// delays the kill. On expiry the whole group gets SIGKILL (falling back to
// the leader pid) and the leader is reaped before returning.
class ProcessRunner {
public:
    explicit ProcessRunner(ProcLimits lim = {}) : lim_(lim) {}

    RunStatus run(const RunRequest& req, ExecutionResult* res, std::string* err) const;


private:
    ProcLimits lim_;
};

// Resolve `name` the way execvp would: names containing '/' are used as-is,
// others are searched on `path_env` (PATH when null). Returns the path of an
// executable regular file.
std::optional<std::string> resolve_executable(const std::string& name, const char* path_env = nullptr);

// Child environment: inherited (minus LD_PRELOAD / LD_LIBRARY_PATH) when
// `inherit` is set, then `overlay` entries replacing same-named variables.
std::vector<std::string> build_child_env(bool inherit, const EnvOverlay& overlay);

} // namespace agentd
