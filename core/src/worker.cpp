#include "agentd/worker.h"
#include "agentd/codec.h"
#include "agentd/encoding.h"
#include "agentd/json_mini.h"

#include <chrono>
#include <filesystem>
#include <sstream>

namespace agentd {

namespace {

ProcLimits limits_from(const WorkerConfig& cfg) {
    ProcLimits lim;
    lim.stdout_max_bytes = cfg.stdout_max_bytes;
    lim.stderr_max_bytes = cfg.stderr_max_bytes;
    lim.rlimit_nofile = cfg.rlimit_nofile;
    lim.rlimit_fsize_mb = cfg.rlimit_fsize_mb;
    return lim;
}

std::string jq(const std::string& s) {
    return "\"" + json_mini::json_escape(s) + "\"";
}

int64_t now_ms() {
    using namespace std::chrono;
    return (int64_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

} // namespace

Disposition classify_failure(FailureKind k, bool retry_agent_errors) {
    switch (k) {
        case FailureKind::NONE:
        case FailureKind::DISPATCH_ONLY:
            return Disposition::ACK;
        case FailureKind::INFRASTRUCTURE:
            return Disposition::RETRY;
        case FailureKind::AGENT_ERROR:
            return retry_agent_errors ? Disposition::RETRY : Disposition::DEAD_LETTER;
        case FailureKind::MALFORMED:
        case FailureKind::UNSAFE_IDENTIFIER:
        case FailureKind::TIMEOUT:
            return Disposition::DEAD_LETTER;
    }
    return Disposition::DEAD_LETTER;
}

WorkerLoop::WorkerLoop(const WorkerConfig& cfg, ResultDispatcher& dispatcher, EventLog& log)
    : cfg_(cfg),
      sandboxes_(cfg.sandbox_root),
      runner_(limits_from(cfg)),
      dispatcher_(dispatcher),
      log_(log) {}

WorkerOutcome WorkerLoop::fail(WorkerOutcome out, WorkerState in, FailureKind kind, const std::string& detail) {
    out.state = WorkerState::FAILED;
    out.failed_in = in;
    out.failure = kind;
    out.disposition = classify_failure(kind, cfg_.retry_agent_errors);
    out.detail = detail;

    std::ostringstream p;
    p << "{\"kind\":" << jq(failure_kind_to_str(kind))
      << ",\"state\":" << jq(worker_state_to_str(in))
      << ",\"disposition\":" << jq(disposition_to_str(out.disposition))
      << ",\"detail\":" << jq(detail) << "}";
    LogLevel lvl = kind == FailureKind::DISPATCH_ONLY ? LogLevel::WARN : LogLevel::ERROR;
    log_.event(lvl, out.correlation_id, "task_failed", p.str());
    return out;
}

WorkerOutcome WorkerLoop::process(const std::string& raw_envelope) {
    const int64_t t0 = now_ms();
    WorkerOutcome out;
    out.state = WorkerState::DECODING;
    log_.event(LogLevel::DEBUG, "", "task_received",
               "{\"bytes\":" + std::to_string(raw_envelope.size()) + "}");

    DecodeResult dr = decode_envelope(raw_envelope, cfg_.default_deadline_seconds);
    if (!dr.ok()) {
        out.correlation_id = dr.task.correlation_id;
        log_.event(LogLevel::ERROR, out.correlation_id, "decode_failed",
                   "{\"error\":" + jq(dr.message) + ",\"message_id\":" + jq(dr.task.message_id) + "}");
        out = fail(out, WorkerState::DECODING, FailureKind::MALFORMED, dr.message);
        out.duration_ms = now_ms() - t0;
        return out;
    }

    const Task& task = dr.task;
    std::ostringstream p;
    p << "{\"agent\":" << jq(task.agent_name)
      << ",\"reply\":" << jq(reply_kind_to_str(task.reply.kind))
      << ",\"hard_seconds\":" << task.hard_deadline_seconds
      << ",\"generated_id\":" << (task.correlation_id_generated ? "true" : "false")
      << ",\"message_id\":" << jq(task.message_id)
      << ",\"delivery_attempt\":" << task.delivery_attempt << "}";
    log_.event(LogLevel::INFO, task.correlation_id, "task_decoded", p.str());
    if (!dr.unknown_reply_type.empty()) {
        log_.event(LogLevel::WARN, task.correlation_id, "reply_type_ignored",
                   "{\"type\":" + jq(dr.unknown_reply_type) + "}");
    }

    out = process_task(task);
    out.duration_ms = now_ms() - t0;
    return out;
}

WorkerOutcome WorkerLoop::process_task(const Task& task) {
    WorkerOutcome out;
    out.correlation_id = task.correlation_id;

    // ---- PROVISIONING ----
    out.state = WorkerState::PROVISIONING;
    Sandbox sb;
    std::string perr;
    ProvisionError pe = sandboxes_.acquire(task.correlation_id, &sb, &perr);
    if (pe != ProvisionError::NONE) {
        log_.event(LogLevel::ERROR, task.correlation_id,
                   pe == ProvisionError::UNSAFE_IDENTIFIER ? "sandbox_rejected" : "sandbox_failed",
                   "{\"reason\":" + jq(provision_error_to_str(pe)) + ",\"error\":" + jq(perr) + "}");
        out.sandbox_released = true;
        if (pe == ProvisionError::CREATE_FAILED) {
            // acquire() removes what it built; anything else at the path is not ours
            std::error_code ec;
            auto st = std::filesystem::symlink_status(std::filesystem::path(cfg_.sandbox_root) / task.correlation_id, ec);
            out.sandbox_released = !std::filesystem::is_directory(st);
        }
        return fail(out, WorkerState::PROVISIONING,
                    pe == ProvisionError::UNSAFE_IDENTIFIER ? FailureKind::UNSAFE_IDENTIFIER
                                                            : FailureKind::INFRASTRUCTURE,
                    perr);
    }
    log_.event(LogLevel::DEBUG, task.correlation_id, "sandbox_acquired",
               "{\"path\":" + jq(sb.root.string()) + "}");

    SandboxLease lease(sandboxes_, std::move(sb), cfg_.keep_sandboxes);
    auto release = [&](WorkerOutcome o) {
        std::string rerr;
        o.sandbox_released = lease.release(&rerr);
        if (!o.sandbox_released) {
            log_.event(LogLevel::WARN, task.correlation_id, "sandbox_release_failed",
                       "{\"error\":" + jq(rerr) + "}");
        }
        return o;
    };

    // ---- EXECUTING ----
    out.state = WorkerState::EXECUTING;
    RunRequest req;
    req.binary = cfg_.agent_binary;
    req.args = {"--name", task.agent_name, "--input", task_to_invocation_json(task)};
    req.env = cfg_.extra_env;
    req.env.insert(req.env.end(), lease.get().env.begin(), lease.get().env.end());
    req.cwd = lease.get().root.string();
    req.deadline_ms = (int64_t)task.hard_deadline_seconds * 1000;

    ExecutionResult res;
    std::string rerr;
    RunStatus rs = runner_.run(req, &res, &rerr);
    out.exit_code = res.exit_code;

    if (rs == RunStatus::SPAWN_FAILED) {
        log_.event(LogLevel::ERROR, task.correlation_id, "spawn_failed", "{\"error\":" + jq(rerr) + "}");
        return release(fail(out, WorkerState::EXECUTING, FailureKind::INFRASTRUCTURE, rerr));
    }
    if (rs == RunStatus::TIMEOUT) {
        std::ostringstream tp;
        tp << "{\"hard_seconds\":" << task.hard_deadline_seconds
           << ",\"duration_ms\":" << res.duration_ms
           << ",\"stdout_bytes\":" << res.stdout_data.size()
           << ",\"stderr_bytes\":" << res.stderr_data.size() << "}";
        log_.event(LogLevel::ERROR, task.correlation_id, "process_timeout", tp.str());
        return release(fail(out, WorkerState::EXECUTING, FailureKind::TIMEOUT, rerr));
    }

    std::ostringstream ep;
    ep << "{\"exit_code\":" << res.exit_code
       << ",\"duration_ms\":" << res.duration_ms
       << ",\"stdout_bytes\":" << res.stdout_data.size()
       << ",\"stderr_bytes\":" << res.stderr_data.size()
       << ",\"stdout_truncated\":" << (res.stdout_truncated ? "true" : "false")
       << ",\"stderr_truncated\":" << (res.stderr_truncated ? "true" : "false") << "}";
    log_.event(LogLevel::INFO, task.correlation_id, "process_exited", ep.str());

    if (res.exit_code != 0) {
        std::string detail = "agent exited with code " + std::to_string(res.exit_code) + ": " +
                             utf8_prefix(res.stderr_data, cfg_.stderr_report_bytes);
        return release(fail(out, WorkerState::EXECUTING, FailureKind::AGENT_ERROR, detail));
    }

    // The process is done with the sandbox; drop it before touching the network.
    out = release(out);

    // ---- DISPATCHING ----
    out.state = WorkerState::DISPATCHING;
    DispatchReport rep = dispatcher_.dispatch(task.reply, res);
    if (!rep.ok()) {
        std::ostringstream dp;
        dp << "{\"sink\":" << jq(reply_kind_to_str(task.reply.kind))
           << ",\"error\":" << jq(dispatch_error_to_str(rep.error))
           << ",\"http_status\":" << rep.http_status
           << ",\"message\":" << jq(rep.message) << "}";
        log_.event(LogLevel::WARN, task.correlation_id, "dispatch_failed", dp.str());
        return fail(out, WorkerState::DISPATCHING, FailureKind::DISPATCH_ONLY, rep.message);
    }
    if (rep.called) {
        std::ostringstream dp;
        dp << "{\"sink\":" << jq(reply_kind_to_str(task.reply.kind))
           << ",\"http_status\":" << rep.http_status
           << ",\"bytes\":" << rep.bytes_sent
           << ",\"truncated\":" << (rep.truncated ? "true" : "false") << "}";
        log_.event(LogLevel::INFO, task.correlation_id, "dispatch_ok", dp.str());
    }

    out.state = WorkerState::DONE;
    out.disposition = Disposition::ACK;
    log_.event(LogLevel::INFO, task.correlation_id, "task_done",
               "{\"exit_code\":" + std::to_string(res.exit_code) + "}");
    return out;
}

} // namespace agentd
