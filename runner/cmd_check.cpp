#include "cmd_check.h"

#include "agentd/proc.h"

#include <iostream>

using namespace agentd;

namespace {

constexpr int64_t kVersionCheckDeadlineMs = 10000;

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

bool check_agent_binary(const WorkerConfig& cfg, std::string* version, std::string* err) {
    ProcLimits lim;
    lim.stdout_max_bytes = 64 * 1024;
    lim.stderr_max_bytes = 64 * 1024;
    ProcessRunner runner(lim);

    RunRequest req;
    req.binary = cfg.agent_binary;
    req.args = {"--version"};
    req.env = cfg.extra_env;
    req.deadline_ms = kVersionCheckDeadlineMs;

    ExecutionResult res;
    std::string rerr;
    RunStatus st = runner.run(req, &res, &rerr);
    if (st != RunStatus::OK) {
        if (err) *err = std::string(run_status_to_str(st)) + ": " + rerr;
        return false;
    }
    if (res.exit_code != 0) {
        if (err) *err = "exit code " + std::to_string(res.exit_code) + ": " + trim(res.stderr_data);
        return false;
    }
    if (version) *version = trim(res.stdout_data);
    return true;
}

int cmd_check(const WorkerConfig& cfg, int argc, char** argv) {
    (void)argc;
    (void)argv;
    std::string version, err;
    if (!check_agent_binary(cfg, &version, &err)) {
        std::cerr << "[agentd] cold-start check failed: \"" << cfg.agent_binary
                  << "\" is not installed or not on PATH (" << err << ")\n";
        return 1;
    }
    std::cout << cfg.agent_binary << " " << version << "\n";
    return 0;
}
