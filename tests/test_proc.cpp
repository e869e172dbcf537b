#include "test_common.h"
#include "agentd/proc.h"

#include <signal.h>
#include <sys/types.h>

#include <chrono>
#include <thread>

namespace fs = std::filesystem;
using agentd::ExecutionResult;
using agentd::ProcessRunner;
using agentd::RunRequest;
using agentd::RunStatus;

static bool proc_gone(pid_t pid) {
    // a killed descendant may linger as a zombie until init reaps it
    for (int i = 0; i < 40; i++) {
        if (kill(pid, 0) != 0) return true;
        std::string stat = read_file("/proc/" + std::to_string(pid) + "/stat");
        auto rp = stat.rfind(')');
        if (rp != std::string::npos && rp + 2 < stat.size() && stat[rp + 2] == 'Z') return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

int main() {
    const fs::path dir = make_temp_dir("agentd_proc");
    ProcessRunner runner;

    // Test 1: stdout captured, exit 0
    {
        auto bin = write_script(dir / "echo_ok", "printf ok");
        RunRequest req;
        req.binary = bin.string();
        req.deadline_ms = 5000;
        ExecutionResult res;
        std::string err;
        auto st = runner.run(req, &res, &err);
        expect_true(st == RunStatus::OK, "echo should run: " + err);
        expect_eq_ll(res.exit_code, 0, "exit code");
        expect_eq_str(res.stdout_data, "ok", "stdout");
        expect_true(!res.timed_out, "not timed out");
    }

    // Test 2: stderr kept separate, non-zero exit is not a runner failure
    {
        auto bin = write_script(dir / "fails", "echo out; echo boom >&2; exit 3");
        RunRequest req;
        req.binary = bin.string();
        req.deadline_ms = 5000;
        ExecutionResult res;
        std::string err;
        auto st = runner.run(req, &res, &err);
        expect_true(st == RunStatus::OK, "non-zero exit still returns OK");
        expect_eq_ll(res.exit_code, 3, "exit code 3");
        expect_eq_str(res.stdout_data, "out\n", "stdout separate");
        expect_eq_str(res.stderr_data, "boom\n", "stderr separate");
    }

    // Test 3: missing binary is a spawn failure, not exit 127
    {
        RunRequest req;
        req.binary = (dir / "no_such_agent").string();
        ExecutionResult res;
        std::string err;
        auto st = runner.run(req, &res, &err);
        expect_true(st == RunStatus::SPAWN_FAILED, "missing binary should fail to spawn");
        expect_true(!err.empty(), "spawn failure has a message");

        req.binary = "agentd-definitely-not-on-path";
        expect_true(runner.run(req, &res, &err) == RunStatus::SPAWN_FAILED, "missing PATH lookup");

        write_file(dir / "not_exec", "#!/bin/sh\necho hi\n");
        req.binary = (dir / "not_exec").string();
        expect_true(runner.run(req, &res, &err) == RunStatus::SPAWN_FAILED, "non-executable file");
    }

    // Test 4: arguments are passed verbatim, no shell interpretation
    {
        auto bin = write_script(dir / "args", "for a in \"$@\"; do printf '[%s]' \"$a\"; done");
        RunRequest req;
        req.binary = bin.string();
        req.args = {"--name", "my agent", "--input", "{\"a\":\"$(rm -rf /)\"}"};
        req.deadline_ms = 5000;
        ExecutionResult res;
        std::string err;
        expect_true(runner.run(req, &res, &err) == RunStatus::OK, "args run");
        expect_eq_str(res.stdout_data, "[--name][my agent][--input][{\"a\":\"$(rm -rf /)\"}]", "argv verbatim");
    }

    // Test 5: environment overlay and working directory
    {
        auto bin = write_script(dir / "env", "printf '%s|%s|%s|%s' \"$HOME\" \"$XDG_CACHE_HOME\" \"$(pwd -P)\" \"$LD_PRELOAD\"");
        const fs::path work = dir / "work";
        fs::create_directories(work);
        setenv("LD_PRELOAD", "/tmp/evil.so", 1);
        RunRequest req;
        req.binary = bin.string();
        req.env = {{"HOME", work.string()}, {"XDG_CACHE_HOME", (work / ".cache").string()}};
        req.cwd = work.string();
        req.deadline_ms = 5000;
        ExecutionResult res;
        std::string err;
        expect_true(runner.run(req, &res, &err) == RunStatus::OK, "env run: " + err);
        unsetenv("LD_PRELOAD");
        const std::string real = fs::canonical(work).string();
        expect_eq_str(res.stdout_data, work.string() + "|" + (work / ".cache").string() + "|" + real + "|",
                      "overlay applied, cwd set, LD_PRELOAD scrubbed");

        req.cwd = (dir / "missing_dir").string();
        expect_true(runner.run(req, &res, &err) == RunStatus::SPAWN_FAILED, "bad cwd is a spawn failure");
    }

    // Test 6: hard deadline kills the whole process group
    {
        const fs::path pidfile = dir / "child.pid";
        auto bin = write_script(dir / "hang", "sleep 30 &\necho $! > '" + pidfile.string() + "'\necho started\nwait");
        RunRequest req;
        req.binary = bin.string();
        req.deadline_ms = 1000;
        ExecutionResult res;
        std::string err;
        auto t0 = std::chrono::steady_clock::now();
        auto st = runner.run(req, &res, &err);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        expect_true(st == RunStatus::TIMEOUT, "hang should time out");
        expect_true(res.timed_out, "timed_out flag");
        expect_true(ms >= 950 && ms < 3000, "returned near the deadline (" + std::to_string(ms) + "ms)");
        expect_true(err.find("1s") != std::string::npos, "message names the deadline: " + err);
        expect_eq_str(res.stdout_data, "started\n", "partial output kept");
        std::string pid_s = read_file(pidfile);
        expect_true(!pid_s.empty(), "descendant pid recorded");
        expect_true(proc_gone((pid_t)std::stol(pid_s)), "descendant killed");
    }

    // Test 7: silent child with a background holder of the pipes still times out
    {
        auto bin = write_script(dir / "detach", "(sleep 30) &\nexit 0");
        RunRequest req;
        req.binary = bin.string();
        req.deadline_ms = 1000;
        ExecutionResult res;
        std::string err;
        auto t0 = std::chrono::steady_clock::now();
        auto st = runner.run(req, &res, &err);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        expect_true(st == RunStatus::TIMEOUT, "pipe held past the deadline counts as timeout");
        expect_true(ms < 3000, "no wait for the background holder");
    }

    // Test 8: capture cap
    {
        agentd::ProcLimits lim;
        lim.stdout_max_bytes = 1000;
        ProcessRunner capped(lim);
        auto bin = write_script(dir / "noisy", "i=0; while [ $i -lt 500 ]; do echo 0123456789; i=$((i+1)); done");
        RunRequest req;
        req.binary = bin.string();
        req.deadline_ms = 5000;
        ExecutionResult res;
        std::string err;
        expect_true(capped.run(req, &res, &err) == RunStatus::OK, "noisy run");
        expect_eq_ll((long long)res.stdout_data.size(), 1000, "stdout capped");
        expect_true(res.stdout_truncated, "truncation flagged");
        expect_eq_ll(res.exit_code, 0, "noisy exits cleanly after cap");
    }

    // Test 9: executable lookup
    {
        expect_true(agentd::resolve_executable("sh").has_value(), "sh on PATH");
        auto p = agentd::resolve_executable("echo_ok", dir.c_str());
        expect_true(p.has_value() && *p == (dir / "echo_ok").string(), "lookup on custom PATH");
        expect_true(!agentd::resolve_executable("not_exec", dir.c_str()).has_value(), "non-executable skipped");
    }

    remove_tree(dir);
    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
