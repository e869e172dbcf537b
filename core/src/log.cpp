#include "agentd/log.h"

#include <json-c/json.h>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace agentd {

const char* log_level_name(LogLevel l) {
    switch (l) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "info";
}

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

// Recursively serialize JSON with sorted keys so identical events produce
// identical lines.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        int len = (int)json_object_array_length(obj);
        for (int i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

EventLog::EventLog(const std::string& path) : path_(path) {
    if (path_.empty()) {
        out_ = &std::cerr;
        return;
    }
    file_.open(path_, std::ios::out | std::ios::app);
    if (file_) {
        out_ = &file_;
    } else {
        std::cerr << "[WARN] cannot open event log " << path_ << ", using stderr\n";
        out_ = &std::cerr;
    }
}

EventLog::EventLog(std::ostream& out) : out_(&out) {}

void EventLog::event(LogLevel level,
                     const std::string& correlation_id,
                     const std::string& name,
                     const std::string& payload_json) {
    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "ts", json_object_new_string(iso_now().c_str()));
    json_object_object_add(rec, "level", json_object_new_string(log_level_name(level)));
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));
    json_object_object_add(rec, "correlation_id",
        json_object_new_string_len(correlation_id.c_str(), (int)correlation_id.size()));

    json_object* pobj = json_tokener_parse(payload_json.c_str());
    if (pobj && !json_object_is_type(pobj, json_type_object)) {
        json_object_put(pobj);
        pobj = nullptr;
    }
    json_object_object_add(rec, "payload",
        pobj ? pobj : json_object_new_string_len(payload_json.c_str(), (int)payload_json.size()));

    std::ostringstream line;
    canonical_serialize(rec, line);
    json_object_put(rec);

    std::lock_guard<std::mutex> lk(mu_);
    if (!out_) return;
    (*out_) << line.str() << "\n";
    out_->flush();
}

} // namespace agentd
