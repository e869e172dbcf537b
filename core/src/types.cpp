#include "agentd/types.h"
#include "agentd/json_mini.h"

#include <json-c/json.h>

namespace agentd {

const char* reply_kind_to_str(ReplyDescriptor::Kind k) {
    switch (k) {
        case ReplyDescriptor::Kind::ISSUE_COMMENT: return "issue_comment";
        case ReplyDescriptor::Kind::CHAT_MESSAGE: return "chat_message";
        default: return "none";
    }
}

const char* failure_kind_to_str(FailureKind k) {
    switch (k) {
        case FailureKind::NONE: return "NONE";
        case FailureKind::MALFORMED: return "MALFORMED";
        case FailureKind::UNSAFE_IDENTIFIER: return "UNSAFE_IDENTIFIER";
        case FailureKind::INFRASTRUCTURE: return "INFRASTRUCTURE";
        case FailureKind::TIMEOUT: return "TIMEOUT";
        case FailureKind::AGENT_ERROR: return "AGENT_ERROR";
        case FailureKind::DISPATCH_ONLY: return "DISPATCH_ONLY";
    }
    return "NONE";
}

const char* disposition_to_str(Disposition d) {
    switch (d) {
        case Disposition::ACK: return "ACK";
        case Disposition::RETRY: return "RETRY";
        case Disposition::DEAD_LETTER: return "DEAD_LETTER";
    }
    return "ACK";
}

const char* worker_state_to_str(WorkerState s) {
    switch (s) {
        case WorkerState::DECODING: return "DECODING";
        case WorkerState::PROVISIONING: return "PROVISIONING";
        case WorkerState::EXECUTING: return "EXECUTING";
        case WorkerState::DISPATCHING: return "DISPATCHING";
        case WorkerState::DONE: return "DONE";
        case WorkerState::FAILED: return "FAILED";
    }
    return "FAILED";
}

// Re-parses the opaque payloads so they nest as objects; a payload that no
// longer parses is passed as a string.
static json_object* payload_node(const std::string& raw) {
    auto d = json_mini::parse(raw);
    if (!d) return json_object_new_string_len(raw.c_str(), (int)raw.size());
    json_object* out = d.root;
    d.root = nullptr;
    return out;
}

std::string task_to_invocation_json(const Task& t) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "correlation_id",
        json_object_new_string_len(t.correlation_id.c_str(), (int)t.correlation_id.size()));

    json_object* agent = json_object_new_object();
    json_object_object_add(agent, "name",
        json_object_new_string_len(t.agent_name.c_str(), (int)t.agent_name.size()));
    json_object_object_add(agent, "args", payload_node(t.args_payload));
    json_object_object_add(root, "agent", agent);

    json_object_object_add(root, "context", payload_node(t.context_payload));

    json_object* reply = json_object_new_object();
    json_object_object_add(reply, "kind", json_object_new_string(reply_kind_to_str(t.reply.kind)));
    if (!t.reply.source_type.empty()) {
        json_object_object_add(reply, "type", json_object_new_string(t.reply.source_type.c_str()));
    }
    if (t.reply.kind == ReplyDescriptor::Kind::ISSUE_COMMENT) {
        json_object_object_add(reply, "repo", json_object_new_string(t.reply.repo.c_str()));
        json_object_object_add(reply, "number", json_object_new_int64(t.reply.number));
    }
    json_object_object_add(root, "reply", reply);

    json_object* timeouts = json_object_new_object();
    json_object_object_add(timeouts, "hard_seconds", json_object_new_int(t.hard_deadline_seconds));
    json_object_object_add(root, "timeouts", timeouts);

    std::string out = json_mini::to_string(root);
    json_object_put(root);
    return out;
}

} // namespace agentd
