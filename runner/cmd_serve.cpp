#include "cmd_serve.h"
#include "cmd_check.h"
#include "runner_utils.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <vector>

using namespace agentd;

static std::atomic<bool> g_serve_running{true};

int cmd_serve(Runtime& rt, int argc, char** argv) {
    g_serve_running.store(true);
    std::signal(SIGTERM, [](int) { g_serve_running.store(false); });
    std::signal(SIGINT,  [](int) { g_serve_running.store(false); });
    std::signal(SIGPIPE, SIG_IGN);

    std::filesystem::path q = default_queue_dir();
    bool once = false;
    bool skip_check = false;
    int sleepms = getenv_int("AGENTD_SERVE_SLEEP_MS", 500);
    int workers = getenv_int("AGENTD_WORKERS", 1);

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--once") { once = true; continue; }
        if (a == "--skip_check") { skip_check = true; continue; }
        if (a == "--sleep_ms" && i + 1 < argc) { sleepms = std::atoi(argv[++i]); continue; }
        if (a == "--workers" && i + 1 < argc) { workers = std::atoi(argv[++i]); continue; }
        if (!a.empty() && a[0] != '-') { q = a; continue; }
        std::cerr << "usage: agentd serve [queue_dir] [--workers N] [--once] [--sleep_ms N] [--skip_check]\n";
        return 2;
    }
    if (workers < 1) workers = 1;
    if (workers > 64) workers = 64;
    if (sleepms < 10) sleepms = 10;

    if (!skip_check) {
        std::string version, err;
        if (!check_agent_binary(rt.cfg, &version, &err)) {
            std::cerr << "[agentd] cold-start check failed: \"" << rt.cfg.agent_binary
                      << "\" is not installed or not on PATH (" << err << ")\n";
            return 2;
        }
        std::cerr << "[agentd] cold-start check passed: " << rt.cfg.agent_binary << " " << version << "\n";
    }

    if (!q.is_absolute()) q = std::filesystem::absolute(q);
    ensure_queue_dirs(q);

    const QueuePolicy policy = load_queue_policy();
    auto inbox = q / "inbox";
    auto processing = q / "processing";
    auto retry = q / "retry";

    // Crash recovery: jobs claimed by a previous process that never finished
    int recovered = recover_processing(processing, inbox);
    if (recovered > 0) {
        std::cerr << "[agentd] recovered " << recovered << " job(s) from " << processing << "\n";
    }

    std::cerr << "[agentd] queue=" << q << " workers=" << workers
              << " max_attempts=" << policy.max_attempts
              << " sandbox_root=" << rt.cfg.sandbox_root << "\n";

    std::atomic<uint64_t> jobs_processed{0}, jobs_acked{0}, jobs_retried{0}, jobs_dead{0};

    auto worker_fn = [&](int wid) {
        WorkerLoop loop(rt.cfg, rt.dispatcher, rt.log);
        while (g_serve_running.load()) {
            if (wid == 0) {
                move_due_retries(retry, inbox);
            }

            auto jobs = list_inbox_json(inbox);
            if (jobs.empty()) {
                if (once) return;
                sleep_ms(sleepms);
                continue;
            }

            auto job = jobs.front();
            std::string base = job.filename().string();
            std::filesystem::path proc = claim_job(job, processing);
            if (proc.empty()) {
                sleep_ms(10);
                continue;
            }

            WorkerOutcome out = loop.process(slurp_file(proc));
            JobResult jr = finish_queue_job(proc, base, q, out, policy);

            jobs_processed.fetch_add(1);
            if (jr.applied == Disposition::ACK) jobs_acked.fetch_add(1);
            else if (jr.scheduled_retry) jobs_retried.fetch_add(1);
            else jobs_dead.fetch_add(1);
        }
    };

    std::vector<std::thread> th;
    th.reserve((size_t)workers);
    for (int i = 0; i < workers; i++) {
        th.emplace_back(worker_fn, i);
    }
    for (auto& t : th) t.join();

    std::cerr << "[agentd] stopped: processed=" << jobs_processed.load()
              << " acked=" << jobs_acked.load()
              << " retried=" << jobs_retried.load()
              << " dead_lettered=" << jobs_dead.load() << "\n";
    return 0;
}
