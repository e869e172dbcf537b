#pragma once
#include <fstream>
#include <iosfwd>
#include <mutex>
#include <string>

namespace agentd {

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

const char* log_level_name(LogLevel l);

// JSONL event log. One canonical (sorted-key) JSON object per line:
// {"correlation_id":..,"event":..,"level":..,"payload":{..},"ts":..}
// Safe to share between worker threads; whole lines are written under a lock.
class EventLog {
public:
    // Writes to `path`, appending. Empty path writes to stderr.
    explicit EventLog(const std::string& path = "");
    // Writes to a caller-owned stream (tests).
    explicit EventLog(std::ostream& out);

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    // payload_json must be a JSON object; anything else is logged as a string.
    void event(LogLevel level,
               const std::string& correlation_id,
               const std::string& name,
               const std::string& payload_json = "{}");

    bool ok() const { return out_ != nullptr; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ofstream file_;
    std::ostream* out_{nullptr};
    std::mutex mu_;
};

} // namespace agentd
