#include "runner_utils.h"

#include "agentd/ids.h"
#include "agentd/json_mini.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <thread>

namespace agentd {

int64_t now_ms_i64() {
    using namespace std::chrono;
    return (int64_t)duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

bool ends_with(const std::string& s, const std::string& suf) {
    return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

std::string slurp_file(const std::filesystem::path& p) {
    std::ifstream f(p.string(), std::ios::binary);
    if (!f) return "";
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

int64_t getenv_i64(const char* k, int64_t defv) {
    const char* e = std::getenv(k);
    if (!e || !*e) return defv;
    char* end = nullptr;
    long long v = std::strtoll(e, &end, 10);
    if (!end || *end != '\0') return defv;
    return (int64_t)v;
}

int getenv_int(const char* k, int defv) {
    int64_t v = getenv_i64(k, defv);
    if (v < INT32_MIN || v > INT32_MAX) return defv;
    return (int)v;
}

std::string write_atomic_json(const std::filesystem::path& dst, const std::string& body) {
    std::error_code ec;
    std::filesystem::create_directories(dst.parent_path(), ec);
    auto tmp = dst;
    tmp += ".tmp";
    {
        std::ofstream f(tmp.string(), std::ios::binary);
        if (!f) return "cannot write " + tmp.string();
        f << body;
        if (!f) return "short write " + tmp.string();
    }
    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::error_code ec2;
        std::filesystem::remove(tmp, ec2);
        return "rename failed: " + ec.message();
    }
    return "";
}

QueuePolicy load_queue_policy() {
    QueuePolicy p;
    p.max_attempts = getenv_int("AGENTD_MAX_DELIVERY_ATTEMPTS", p.max_attempts);
    p.backoff_base_ms = getenv_i64("AGENTD_BACKOFF_BASE_MS", p.backoff_base_ms);
    p.backoff_mult = getenv_i64("AGENTD_BACKOFF_MULT", p.backoff_mult);
    p.backoff_max_ms = getenv_i64("AGENTD_BACKOFF_MAX_MS", p.backoff_max_ms);
    p.backoff_jitter_ms = getenv_i64("AGENTD_BACKOFF_JITTER_MS", p.backoff_jitter_ms);
    if (p.max_attempts < 1) p.max_attempts = 1;
    return p;
}

std::filesystem::path default_queue_dir() {
    if (const char* e = std::getenv("AGENTD_QUEUE_DIR")) {
        if (*e) return std::filesystem::path(e);
    }
    return std::filesystem::current_path() / "queue";
}

void ensure_queue_dirs(const std::filesystem::path& q) {
    std::error_code ec;
    for (const char* d : {"inbox", "processing", "retry", "done", "dlq", "out"}) {
        std::filesystem::create_directories(q / d, ec);
        if (ec) {
            std::cerr << "[WARN] cannot create " << (q / d) << ": " << ec.message() << "\n";
            ec.clear();
        }
    }
}

std::vector<std::filesystem::path> list_inbox_json(const std::filesystem::path& inbox) {
    std::vector<std::filesystem::path> v;
    std::error_code ec;
    if (!std::filesystem::exists(inbox, ec)) return v;
    for (auto& e : std::filesystem::directory_iterator(inbox, ec)) {
        if (ec) break;
        if (!e.is_regular_file(ec)) continue;
        auto p = e.path();
        if (p.extension() == ".json") v.push_back(p);
    }
    std::sort(v.begin(), v.end(), [](const std::filesystem::path& a, const std::filesystem::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return v;
}

std::filesystem::path claim_job(const std::filesystem::path& job, const std::filesystem::path& processing_dir) {
    std::filesystem::path proc = processing_dir / (job.filename().string() + ".processing");
    std::error_code ec;
    std::filesystem::rename(job, proc, ec);
    if (ec) return {};
    return proc;
}

bool parse_retry_name(const std::string& fname, int64_t& due_ms, std::string& rest_name) {
    due_ms = 0;
    rest_name.clear();
    if (fname.rfind("retry_", 0) != 0) return false;
    size_t p1 = 6;
    size_t p2 = fname.find('_', p1);
    if (p2 == std::string::npos || p2 == p1) return false;
    std::string num = fname.substr(p1, p2 - p1);
    for (char c : num) if (c < '0' || c > '9') return false;
    if (num.size() > 18) return false;
    due_ms = std::stoll(num);
    rest_name = fname.substr(p2 + 1);
    return !rest_name.empty();
}

void move_due_retries(const std::filesystem::path& retry_dir, const std::filesystem::path& inbox_dir) {
    std::error_code ec;
    if (!std::filesystem::exists(retry_dir, ec)) return;
    int64_t now = now_ms_i64();
    for (auto& e : std::filesystem::directory_iterator(retry_dir, ec)) {
        if (ec) break;
        if (!e.is_regular_file(ec)) continue;
        auto p = e.path();
        if (p.extension() != ".json") continue;
        std::string fname = p.filename().string();
        std::string rest;
        int64_t due = 0;
        if (parse_retry_name(fname, due, rest)) {
            if (due > now) continue;
            fname = rest;
        }
        auto dst = free_name_in(inbox_dir, fname, std::to_string(now));
        std::error_code mv;
        std::filesystem::rename(p, dst, mv);
        if (mv) {
            std::cerr << "[WARN] cannot requeue " << p << ": " << mv.message() << "\n";
        }
    }
}

int recover_processing(const std::filesystem::path& processing_dir, const std::filesystem::path& inbox_dir) {
    static const std::string kSuffix = ".processing";
    int moved = 0;
    std::error_code ec;
    if (!std::filesystem::exists(processing_dir, ec)) return 0;
    const std::string tag = std::to_string(now_ms_i64());
    for (auto& e : std::filesystem::directory_iterator(processing_dir, ec)) {
        if (ec) break;
        if (!e.is_regular_file(ec)) continue;
        std::string fn = e.path().filename().string();
        if (!ends_with(fn, kSuffix)) continue;
        std::string rest = fn.substr(0, fn.size() - kSuffix.size());
        if (rest.empty()) continue;
        auto dst = free_name_in(inbox_dir, rest, tag);
        std::error_code mv;
        std::filesystem::rename(e.path(), dst, mv);
        if (mv) {
            std::cerr << "[WARN] cannot recover " << e.path() << ": " << mv.message() << "\n";
            continue;
        }
        moved++;
    }
    return moved;
}

int parse_attempt_from_name(const std::string& name) {
    auto pos = name.rfind(".a");
    if (pos == std::string::npos) return 1;
    auto dot = name.find('.', pos + 2);
    if (dot == std::string::npos || dot == pos + 2 || dot - pos - 2 > 4) return 1;
    std::string num = name.substr(pos + 2, dot - (pos + 2));
    for (char c : num) if (c < '0' || c > '9') return 1;
    int n = std::stoi(num);
    return (n >= 1 && n <= 1000) ? n : 1;
}

std::string with_attempt_suffix(const std::string& name, int attempt) {
    std::string rest = name;
    if (ends_with(rest, ".json")) rest.resize(rest.size() - 5);
    auto a_pos = rest.rfind(".a");
    if (a_pos != std::string::npos && a_pos + 2 < rest.size() &&
        rest.find_first_not_of("0123456789", a_pos + 2) == std::string::npos) {
        rest.erase(a_pos);
    }
    return rest + ".a" + std::to_string(attempt) + ".json";
}

std::string disambiguate_name(const std::string& name, const std::string& tag) {
    std::string rest = name;
    bool json = ends_with(rest, ".json");
    if (json) rest.resize(rest.size() - 5);
    std::string attempt;
    auto a_pos = rest.rfind(".a");
    if (a_pos != std::string::npos && a_pos + 2 < rest.size() &&
        rest.find_first_not_of("0123456789", a_pos + 2) == std::string::npos) {
        attempt = rest.substr(a_pos);
        rest.erase(a_pos);
    }
    return rest + "_" + tag + attempt + (json ? ".json" : "");
}

std::filesystem::path free_name_in(const std::filesystem::path& dir, const std::string& name, const std::string& tag) {
    std::error_code ec;
    auto dst = dir / name;
    if (!std::filesystem::exists(dst, ec)) return dst;
    dst = dir / disambiguate_name(name, tag);
    for (int i = 1; std::filesystem::exists(dst, ec) && i < 1000; i++) {
        dst = dir / disambiguate_name(name, tag + "-" + std::to_string(i));
    }
    return dst;
}

int64_t backoff_delay_ms(int next_attempt,
                         int64_t base_ms,
                         int64_t mult,
                         int64_t max_ms,
                         int64_t jitter_ms) {
    if (base_ms < 0) base_ms = 0;
    if (mult < 1) mult = 1;
    if (max_ms < 0) max_ms = 0;
    if (jitter_ms < 0) jitter_ms = 0;
    int exp = next_attempt - 2;
    if (exp < 0) exp = 0;
    long double d = (long double)base_ms;
    for (int i = 0; i < exp; i++) {
        d *= (long double)mult;
        if (max_ms > 0 && d > (long double)max_ms) break;
    }
    int64_t delay = (int64_t)d;
    if (delay > max_ms && max_ms > 0) delay = max_ms;
    if (jitter_ms > 0) {
        delay += (int64_t)(secure_rand64() % (uint64_t)(jitter_ms + 1));
    }
    return delay;
}

namespace {

// Envelope with deliveryAttempt set to `attempt`; unchanged when it does
// not parse as an object.
std::string bump_delivery_attempt(const std::string& envelope, int attempt) {
    json_mini::Doc d = json_mini::parse(envelope);
    if (!d || !json_object_is_type(d.root, json_type_object)) return envelope;
    json_object_object_add(d.root, "deliveryAttempt", json_object_new_int(attempt));
    return json_mini::to_string(d.root);
}

} // namespace

JobResult finish_queue_job(const std::filesystem::path& proc_file,
                           const std::string& base_name,
                           const std::filesystem::path& queue_dir,
                           const WorkerOutcome& outcome,
                           const QueuePolicy& policy) {
    JobResult jr;
    auto retry_dir = queue_dir / "retry";
    auto done_dir  = queue_dir / "done";
    auto dlq_dir   = queue_dir / "dlq";
    auto out_dir   = queue_dir / "out";

    jr.attempt = parse_attempt_from_name(base_name);
    jr.max_attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    jr.requested = outcome.disposition;
    jr.applied = outcome.disposition;

    std::error_code ec;
    switch (outcome.disposition) {
        case Disposition::ACK:
            jr.final_path = done_dir / base_name;
            std::filesystem::rename(proc_file, jr.final_path, ec);
            break;
        case Disposition::RETRY:
            if (jr.attempt < jr.max_attempts) {
                int next_attempt = jr.attempt + 1;
                int64_t delay = backoff_delay_ms(next_attempt, policy.backoff_base_ms, policy.backoff_mult,
                                                 policy.backoff_max_ms, policy.backoff_jitter_ms);
                int64_t due = now_ms_i64() + delay;
                std::string retry_name = "retry_" + std::to_string(due) + "_" +
                                         with_attempt_suffix(base_name, next_attempt);
                std::filesystem::path retry_path = retry_dir / retry_name;
                std::string werr = write_atomic_json(retry_path, bump_delivery_attempt(slurp_file(proc_file), next_attempt));
                if (werr.empty()) {
                    jr.scheduled_retry = true;
                    jr.final_path = retry_path;
                    std::filesystem::remove(proc_file, ec);
                    break;
                }
                std::cerr << "[WARN] cannot schedule retry for " << base_name << ": " << werr << "\n";
            }
            jr.applied = Disposition::DEAD_LETTER;
            jr.final_path = dlq_dir / base_name;
            jr.deadletter = true;
            std::filesystem::rename(proc_file, jr.final_path, ec);
            break;
        case Disposition::DEAD_LETTER:
            jr.final_path = dlq_dir / base_name;
            jr.deadletter = true;
            std::filesystem::rename(proc_file, jr.final_path, ec);
            break;
    }
    if (ec) {
        std::cerr << "[WARN] move failed for " << base_name << ": " << ec.message() << "\n";
    }

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "correlation_id", json_object_new_string(outcome.correlation_id.c_str()));
    json_object_object_add(rec, "state", json_object_new_string(worker_state_to_str(outcome.state)));
    json_object_object_add(rec, "failure", json_object_new_string(failure_kind_to_str(outcome.failure)));
    json_object_object_add(rec, "disposition", json_object_new_string(disposition_to_str(jr.applied)));
    json_object_object_add(rec, "exit_code", json_object_new_int(outcome.exit_code));
    json_object_object_add(rec, "detail",
        json_object_new_string_len(outcome.detail.c_str(), (int)outcome.detail.size()));
    json_object_object_add(rec, "duration_ms", json_object_new_int64(outcome.duration_ms));
    json_object_object_add(rec, "job", json_object_new_string(jr.final_path.filename().string().c_str()));
    json_object_object_add(rec, "attempt", json_object_new_int(jr.attempt));
    json_object_object_add(rec, "max_attempts", json_object_new_int(jr.max_attempts));
    json_object_object_add(rec, "scheduled_retry", json_object_new_boolean(jr.scheduled_retry));
    json_object_object_add(rec, "deadletter", json_object_new_boolean(jr.deadletter));
    jr.result_json = json_mini::to_string(rec);
    json_object_put(rec);

    std::string rname = base_name + ".attempt" + std::to_string(jr.attempt) + ".result.json";
    std::string werr = write_atomic_json(out_dir / rname, jr.result_json);
    if (!werr.empty()) {
        std::cerr << "[WARN] cannot write result record: " << werr << "\n";
    }
    return jr;
}

} // namespace agentd
