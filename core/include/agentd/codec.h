#pragma once
#include "types.h"

#include <string>

namespace agentd {

enum class DecodeError {
    NONE,
    MALFORMED,
};

struct DecodeResult {
    DecodeError error{DecodeError::NONE};
    std::string message;   // why decoding failed
    Task task;             // valid only when error == NONE
    std::string unknown_reply_type; // reply.type that mapped to NONE because it is not recognised

    bool ok() const { return error == DecodeError::NONE; }
};

// Decode a transport delivery wrapper into a Task.
//
// Accepted wrappers:
//   push:  {"message":{"data":"<base64>","messageId":..},"deliveryAttempt":N}
//   event: {"data":{"message":{"data":"<base64>",..}}}
//
// `default_deadline_seconds` replaces an absent or non-positive
// timeouts.hard_seconds. A missing correlation_id is generated.
DecodeResult decode_envelope(const std::string& raw_envelope,
                             int default_deadline_seconds = kDefaultHardDeadlineSeconds);

// Decode the inner task message (already base64-decoded JSON text).
DecodeResult decode_message(const std::string& message_json,
                            int default_deadline_seconds = kDefaultHardDeadlineSeconds);

// Wrap a task message JSON into a push-style delivery wrapper.
std::string encode_envelope(const std::string& message_json,
                            const std::string& message_id = "",
                            int delivery_attempt = 0);

} // namespace agentd
