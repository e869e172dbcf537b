#pragma once
#include "config.h"
#include "dispatch.h"
#include "log.h"
#include "proc.h"
#include "sandbox.h"
#include "types.h"

#include <string>

namespace agentd {

struct WorkerOutcome {
    WorkerState state{WorkerState::DECODING}; // DONE or FAILED once process() returns
    WorkerState failed_in{WorkerState::DECODING};
    FailureKind failure{FailureKind::NONE};
    Disposition disposition{Disposition::ACK};
    std::string correlation_id;
    std::string detail;                       // diagnostic text, never credentials
    int exit_code{-1};
    bool sandbox_released{false};
    int64_t duration_ms{0};

    bool retryable() const { return disposition == Disposition::RETRY; }
};

// Retry classification of a failure kind under the configured policy.
Disposition classify_failure(FailureKind k, bool retry_agent_errors);

// One pass per delivered message:
//   DECODING -> PROVISIONING -> EXECUTING -> DISPATCHING -> DONE
// with FAILED reachable from every state. The sandbox acquired in
// PROVISIONING is released on every exit path. No retries happen here;
// the outcome's disposition tells the queue what to do.
class WorkerLoop {
public:
    WorkerLoop(const WorkerConfig& cfg, ResultDispatcher& dispatcher, EventLog& log);

    WorkerOutcome process(const std::string& raw_envelope);

    // Entry point after decoding (used by process()).
    WorkerOutcome process_task(const Task& task);

private:
    WorkerOutcome fail(WorkerOutcome out, WorkerState in, FailureKind kind, const std::string& detail);

    const WorkerConfig& cfg_;
    SandboxProvisioner sandboxes_;
    ProcessRunner runner_;
    ResultDispatcher& dispatcher_;
    EventLog& log_;
};

} // namespace agentd
