#include "agentd/codec.h"
#include "agentd/encoding.h"
#include "agentd/ids.h"
#include "agentd/json_mini.h"

#include <climits>
#include <cmath>
#include <cstdlib>
#include <initializer_list>

namespace agentd {

namespace {

DecodeResult malformed(const std::string& why) {
    DecodeResult r;
    r.error = DecodeError::MALFORMED;
    r.message = why;
    return r;
}

// targets.pr / targets.number as an integer or a decimal string.
bool read_issue_number(json_object* targets, int64_t* out) {
    for (const char* key : {"pr", "number"}) {
        json_object* v = json_mini::member(targets, key);
        if (!v) continue;
        if (json_object_is_type(v, json_type_int)) {
            *out = json_object_get_int64(v);
            return *out > 0;
        }
        if (json_object_is_type(v, json_type_string)) {
            std::string s = json_object_get_string(v);
            if (s.empty() || s.size() > 18) return false;
            for (char c : s) if (c < '0' || c > '9') return false;
            *out = std::stoll(s);
            return *out > 0;
        }
        return false;
    }
    return false;
}

bool valid_repo_slug(const std::string& repo) {
    auto slash = repo.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= repo.size()) return false;
    if (repo.find('/', slash + 1) != std::string::npos) return false;
    return is_safe_path_segment(repo.substr(0, slash)) && is_safe_path_segment(repo.substr(slash + 1));
}

int read_deadline(json_object* msg, int defv) {
    json_object* timeouts = json_mini::member_object(msg, "timeouts");
    auto v = json_mini::get_number(timeouts, "hard_seconds");
    if (!v || !std::isfinite(*v) || *v <= 0) return defv;
    double secs = std::ceil(*v);
    if (secs > (double)(INT_MAX / 1000)) return INT_MAX / 1000;
    return (int)secs;
}

} // namespace

DecodeResult decode_message(const std::string& message_json, int default_deadline_seconds) {
    if (default_deadline_seconds <= 0) default_deadline_seconds = kDefaultHardDeadlineSeconds;

    auto doc = json_mini::parse(message_json);
    if (!doc) return malformed("message is not valid JSON");
    if (!json_object_is_type(doc.root, json_type_object)) return malformed("message is not a JSON object");
    json_object* msg = doc.root;

    DecodeResult r;
    Task& t = r.task;
    // failures after this point keep whatever correlation id was read
    auto fail = [&r](const std::string& why) {
        r.error = DecodeError::MALFORMED;
        r.message = why;
        return r;
    };

    // correlation_id: optional, generated when absent or empty
    if (json_object* cid = json_mini::member(msg, "correlation_id")) {
        if (json_object_is_type(cid, json_type_string)) {
            t.correlation_id = json_object_get_string(cid);
        } else if (!json_object_is_type(cid, json_type_null)) {
            return malformed("correlation_id must be a string");
        }
    }
    if (t.correlation_id.empty()) {
        t.correlation_id = new_correlation_id();
        t.correlation_id_generated = true;
    }

    // agent.name: required
    json_object* agent = json_mini::member_object(msg, "agent");
    if (!agent) return fail("missing agent");
    auto name = json_mini::get_string(agent, "name");
    if (!name || name->empty()) return fail("missing agent.name");
    t.agent_name = *name;
    if (json_object* args = json_mini::member(agent, "args")) {
        if (!json_object_is_type(args, json_type_null)) t.args_payload = json_mini::to_string(args);
    }
    if (json_object* ctx = json_mini::member(msg, "context")) {
        if (!json_object_is_type(ctx, json_type_null)) t.context_payload = json_mini::to_string(ctx);
    }

    // reply
    json_object* reply = json_mini::member_object(msg, "reply");
    auto type = json_mini::get_string(reply, "type").value_or("");
    t.reply.source_type = type;
    json_object* targets = json_mini::member_object(reply, "targets");
    if (type.empty() || type == "none") {
        t.reply.kind = ReplyDescriptor::Kind::NONE;
    } else if (type.rfind("github.", 0) == 0) {
        t.reply.kind = ReplyDescriptor::Kind::ISSUE_COMMENT;
        t.reply.repo = json_mini::get_string(targets, "repo").value_or("");
        t.reply.token = json_mini::get_string(targets, "token").value_or("");
        if (!valid_repo_slug(t.reply.repo)) return fail("reply.targets.repo must be owner/name");
        if (!read_issue_number(targets, &t.reply.number)) return fail("reply.targets.pr must be a positive integer");
        if (t.reply.token.empty()) return fail("missing reply.targets.token");
    } else if (type == "slack.message") {
        t.reply.kind = ReplyDescriptor::Kind::CHAT_MESSAGE;
        t.reply.callback_url = json_mini::get_string(targets, "response_url").value_or("");
        if (t.reply.callback_url.empty()) return fail("missing reply.targets.response_url");
    } else {
        t.reply.kind = ReplyDescriptor::Kind::NONE;
        r.unknown_reply_type = type;
    }

    t.hard_deadline_seconds = read_deadline(msg, default_deadline_seconds);
    return r;
}

DecodeResult decode_envelope(const std::string& raw_envelope, int default_deadline_seconds) {
    auto doc = json_mini::parse(raw_envelope);
    if (!doc || !json_object_is_type(doc.root, json_type_object)) {
        return malformed("envelope is not a JSON object");
    }

    json_object* message = json_mini::member_object(doc.root, "message");
    if (!message) {
        json_object* data = json_mini::member_object(doc.root, "data");
        message = json_mini::member_object(data, "message");
    }
    auto b64 = json_mini::get_string(message, "data");
    if (!b64 || b64->empty()) return malformed("missing message.data");

    auto inner = base64_decode(*b64);
    if (!inner) return malformed("message.data is not valid base64");

    DecodeResult r = decode_message(*inner, default_deadline_seconds);

    if (auto id = json_mini::get_string(message, "messageId")) r.task.message_id = *id;
    else if (auto id2 = json_mini::get_string(message, "message_id")) r.task.message_id = *id2;
    if (auto n = json_mini::get_int(doc.root, "deliveryAttempt")) {
        if (*n > 0 && *n < INT_MAX) r.task.delivery_attempt = (int)*n;
    }
    return r;
}

std::string encode_envelope(const std::string& message_json,
                            const std::string& message_id,
                            int delivery_attempt) {
    json_object* root = json_object_new_object();
    json_object* message = json_object_new_object();
    std::string b64 = base64_encode(message_json);
    json_object_object_add(message, "data", json_object_new_string(b64.c_str()));
    if (!message_id.empty()) {
        json_object_object_add(message, "messageId", json_object_new_string(message_id.c_str()));
    }
    json_object_object_add(root, "message", message);
    if (delivery_attempt > 0) {
        json_object_object_add(root, "deliveryAttempt", json_object_new_int(delivery_attempt));
    }
    std::string out = json_mini::to_string(root);
    json_object_put(root);
    return out;
}

} // namespace agentd
