#pragma once
#include "config.h"
#include "http.h"
#include "types.h"

#include <string>

namespace agentd {

enum class DispatchError {
    NONE,
    REJECTED_TARGET, // callback url scheme or host not allowed
    TRANSPORT,       // no HTTP response
    HTTP_STATUS,     // non-2xx response
};

const char* dispatch_error_to_str(DispatchError e);

struct DispatchReport {
    DispatchError error{DispatchError::NONE};
    std::string message;
    long http_status{0};
    size_t bytes_sent{0};   // size of the text placed in the sink
    bool truncated{false};
    bool called{false};     // an outbound request was attempted

    bool ok() const { return error == DispatchError::NONE; }
};

// Routes a successful execution's stdout to the sink named by the reply
// descriptor. Text is cut to a fixed per-sink byte limit on a UTF-8
// boundary; the cut is silent.
class ResultDispatcher {
public:
    ResultDispatcher(const WorkerConfig& cfg, HttpClient& http) : cfg_(cfg), http_(http) {}

    DispatchReport dispatch(const ReplyDescriptor& reply, const ExecutionResult& result);

    bool callback_host_allowed(const std::string& host) const;

private:
    DispatchReport post_json(const std::string& url,
                             const std::vector<std::pair<std::string, std::string>>& headers,
                             const std::string& body);

    const WorkerConfig& cfg_;
    HttpClient& http_;
};

} // namespace agentd
