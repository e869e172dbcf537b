#pragma once
#include <cstdint>
#include <string>

namespace agentd {

constexpr int kDefaultHardDeadlineSeconds = 900;

// Which sink receives the task's output.
struct ReplyDescriptor {
    enum class Kind { NONE, ISSUE_COMMENT, CHAT_MESSAGE };
    Kind kind{Kind::NONE};

    std::string source_type;  // reply.type as delivered ("github.pr_review", ...)

    // ISSUE_COMMENT
    std::string repo;         // "owner/name"
    int64_t number{0};        // issue or pull request number
    std::string token;        // bearer credential, never logged

    // CHAT_MESSAGE
    std::string callback_url;
};

// One decoded unit of work. Immutable after MessageCodec builds it.
struct Task {
    std::string correlation_id;
    bool correlation_id_generated{false};
    std::string agent_name;
    std::string args_payload{"{}"};     // serialized agent.args, opaque to the core
    std::string context_payload{"{}"};  // serialized context, opaque to the core
    ReplyDescriptor reply;
    int hard_deadline_seconds{kDefaultHardDeadlineSeconds};

    // Delivery metadata from the transport wrapper (informational only).
    std::string message_id;
    int delivery_attempt{0};
};

struct ExecutionResult {
    int exit_code{-1};
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out{false};
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    int64_t duration_ms{0};
};

// Failure taxonomy of a WorkerLoop pass.
enum class FailureKind {
    NONE,
    MALFORMED,
    UNSAFE_IDENTIFIER,
    INFRASTRUCTURE,
    TIMEOUT,
    AGENT_ERROR,
    DISPATCH_ONLY,
};

// What the queue should do with the message after a pass.
enum class Disposition {
    ACK,
    RETRY,
    DEAD_LETTER,
};

enum class WorkerState {
    DECODING,
    PROVISIONING,
    EXECUTING,
    DISPATCHING,
    DONE,
    FAILED,
};

const char* reply_kind_to_str(ReplyDescriptor::Kind k);
const char* failure_kind_to_str(FailureKind k);
const char* disposition_to_str(Disposition d);
const char* worker_state_to_str(WorkerState s);

// Task as handed to the external binary: everything except reply credentials.
std::string task_to_invocation_json(const Task& t);

} // namespace agentd
