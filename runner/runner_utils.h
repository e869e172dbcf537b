#pragma once

#include "agentd/worker.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace agentd {

// ---- Small helpers shared by the commands ----

int64_t now_ms_i64();
void sleep_ms(int ms);
bool ends_with(const std::string& s, const std::string& suf);
std::string slurp_file(const std::filesystem::path& p);
int64_t getenv_i64(const char* k, int64_t defv);
int getenv_int(const char* k, int defv);

// Write `body` to `dst` via a sibling .tmp file and rename. Returns an
// error string, empty on success.
std::string write_atomic_json(const std::filesystem::path& dst, const std::string& body);

// ---- Spool queue ----
//
// <queue>/inbox       new envelopes (*.json)
//        /processing  claimed by a worker (*.json.processing)
//        /retry       retry_<due_ms>_<name>.a<N>.json, moved back when due
//        /done        acknowledged
//        /dlq         dead-lettered
//        /out         one result record per attempt

struct QueuePolicy {
    int max_attempts{10};
    int64_t backoff_base_ms{10000};
    int64_t backoff_mult{2};
    int64_t backoff_max_ms{300000};
    int64_t backoff_jitter_ms{1000};
};

// AGENTD_MAX_DELIVERY_ATTEMPTS, AGENTD_BACKOFF_{BASE_MS,MULT,MAX_MS,JITTER_MS}.
QueuePolicy load_queue_policy();

std::filesystem::path default_queue_dir();
void ensure_queue_dirs(const std::filesystem::path& q);

std::vector<std::filesystem::path> list_inbox_json(const std::filesystem::path& inbox);

// Move `job` into processing/. Returns the claimed path, empty if another
// worker got there first.
std::filesystem::path claim_job(const std::filesystem::path& job, const std::filesystem::path& processing_dir);

bool parse_retry_name(const std::string& fname, int64_t& due_ms, std::string& rest_name);
void move_due_retries(const std::filesystem::path& retry_dir, const std::filesystem::path& inbox_dir);

// Crash recovery: move every processing/<name>.processing back to inbox/.
// Returns the number of jobs moved.
int recover_processing(const std::filesystem::path& processing_dir, const std::filesystem::path& inbox_dir);

// Attempt number from a ".a<N>.json" suffix; 1 when absent.
int parse_attempt_from_name(const std::string& name);
// "<stem>.a<attempt>.json" with any previous attempt suffix replaced.
std::string with_attempt_suffix(const std::string& name, int attempt);

// "<stem>_<tag>[.a<N>].json": the tag goes before the attempt suffix so
// the attempt number still parses.
std::string disambiguate_name(const std::string& name, const std::string& tag);
// dir/name, or dir/disambiguate_name(name, tag...) when that is taken.
std::filesystem::path free_name_in(const std::filesystem::path& dir, const std::string& name, const std::string& tag);

int64_t backoff_delay_ms(int next_attempt,
                         int64_t base_ms,
                         int64_t mult,
                         int64_t max_ms,
                         int64_t jitter_ms);

struct JobResult {
    Disposition requested{Disposition::ACK};
    Disposition applied{Disposition::ACK}; // RETRY becomes DEAD_LETTER when the budget is spent
    int attempt{1};
    int max_attempts{10};
    bool scheduled_retry{false};
    bool deadletter{false};
    std::filesystem::path final_path;
    std::string result_json;  // record written to out/
};

// Move a processed job to its final place according to `outcome` and write
// the result record.
JobResult finish_queue_job(const std::filesystem::path& proc_file,
                           const std::string& base_name,
                           const std::filesystem::path& queue_dir,
                           const WorkerOutcome& outcome,
                           const QueuePolicy& policy);

} // namespace agentd
