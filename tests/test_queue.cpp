#include "test_common.h"
#include "runner_utils.h"
#include "agentd/codec.h"
#include "agentd/json_mini.h"

#include <initializer_list>

namespace fs = std::filesystem;
using namespace agentd;

static WorkerOutcome outcome(Disposition d, FailureKind k = FailureKind::NONE) {
    WorkerOutcome o;
    o.state = k == FailureKind::NONE ? WorkerState::DONE : WorkerState::FAILED;
    o.failure = k;
    o.disposition = d;
    o.correlation_id = "q-1";
    return o;
}

static fs::path stage(const fs::path& q, const std::string& name) {
    write_file(q / "inbox" / name, encode_envelope(R"({"agent":{"name":"a"}})", "m", 1));
    fs::path proc = claim_job(q / "inbox" / name, q / "processing");
    if (proc.empty()) die("claim failed for " + name);
    return proc;
}

int main() {
    const fs::path q = make_temp_dir("agentd_queue");
    ensure_queue_dirs(q);
    for (const char* d : {"inbox", "processing", "retry", "done", "dlq", "out"}) {
        expect_true(fs::is_directory(q / d), std::string("queue dir ") + d);
    }

    // Test 1: attempt suffix parsing
    expect_eq_ll(parse_attempt_from_name("job.json"), 1, "no suffix");
    expect_eq_ll(parse_attempt_from_name("job.a3.json"), 3, "suffix a3");
    expect_eq_ll(parse_attempt_from_name("job.abc.json"), 1, "non-numeric suffix");
    expect_eq_str(with_attempt_suffix("job.json", 2), "job.a2.json", "add suffix");
    expect_eq_str(with_attempt_suffix("job.a2.json", 3), "job.a3.json", "replace suffix");
    expect_eq_str(with_attempt_suffix("my.app.json", 2), "my.app.a2.json", "dotted name kept");

    // Test 2: retry names
    {
        int64_t due = 0;
        std::string rest;
        expect_true(parse_retry_name("retry_1700000000000_job.a2.json", due, rest), "retry name parses");
        expect_eq_ll(due, 1700000000000LL, "due");
        expect_eq_str(rest, "job.a2.json", "rest");
        expect_true(!parse_retry_name("retry_x_job.json", due, rest), "bad due");
        expect_true(!parse_retry_name("job.json", due, rest), "not a retry");
    }

    // Test 3: backoff grows from the base and is capped
    expect_eq_ll(backoff_delay_ms(2, 10000, 2, 300000, 0), 10000, "first retry at base");
    expect_eq_ll(backoff_delay_ms(3, 10000, 2, 300000, 0), 20000, "doubles");
    expect_eq_ll(backoff_delay_ms(10, 10000, 2, 300000, 0), 300000, "capped");
    {
        int64_t d = backoff_delay_ms(2, 10000, 2, 300000, 500);
        expect_true(d >= 10000 && d <= 10500, "jitter bounded");
    }

    QueuePolicy policy;
    policy.backoff_jitter_ms = 0;
    policy.max_attempts = 3;

    // Test 4: ACK goes to done/ with a result record
    {
        fs::path proc = stage(q, "ok.json");
        auto jr = finish_queue_job(proc, "ok.json", q, outcome(Disposition::ACK), policy);
        expect_true(jr.applied == Disposition::ACK, "ack applied");
        expect_true(fs::exists(q / "done" / "ok.json"), "moved to done");
        expect_true(!fs::exists(proc), "processing file gone");
        fs::path rec = q / "out" / "ok.json.attempt1.result.json";
        expect_true(fs::exists(rec), "result record written");
        auto d = json_mini::parse(read_file(rec));
        expect_eq_str(json_mini::get_string(d.root, "disposition").value_or(""), "ACK", "record disposition");
        expect_eq_str(json_mini::get_string(d.root, "correlation_id").value_or(""), "q-1", "record id");
    }

    // Test 5: DEAD_LETTER goes to dlq/
    {
        fs::path proc = stage(q, "bad.json");
        auto jr = finish_queue_job(proc, "bad.json", q, outcome(Disposition::DEAD_LETTER, FailureKind::TIMEOUT), policy);
        expect_true(jr.deadletter, "dead-lettered");
        expect_true(fs::exists(q / "dlq" / "bad.json"), "moved to dlq");
    }

    // Test 6: RETRY schedules the next attempt with a bumped delivery count
    {
        fs::path proc = stage(q, "flaky.json");
        auto jr = finish_queue_job(proc, "flaky.json", q, outcome(Disposition::RETRY, FailureKind::INFRASTRUCTURE), policy);
        expect_true(jr.scheduled_retry, "retry scheduled");
        expect_true(jr.final_path.parent_path() == q / "retry", "in retry dir");
        int64_t due = 0;
        std::string rest;
        expect_true(parse_retry_name(jr.final_path.filename().string(), due, rest), "retry file name");
        expect_eq_str(rest, "flaky.a2.json", "next attempt suffix");
        expect_true(due >= now_ms_i64() + 9000, "due after the base delay");
        auto env = json_mini::parse(read_file(jr.final_path));
        expect_eq_ll(json_mini::get_int(env.root, "deliveryAttempt").value_or(0), 2, "delivery attempt bumped");
        expect_true(decode_envelope(read_file(jr.final_path)).ok(), "retry file still decodes");

        // not due yet: stays put
        move_due_retries(q / "retry", q / "inbox");
        expect_true(fs::exists(jr.final_path), "future retry not moved");

        // due now: back to inbox under its plain name
        fs::path now_name = q / "retry" / ("retry_0_" + rest);
        fs::rename(jr.final_path, now_name);
        move_due_retries(q / "retry", q / "inbox");
        expect_true(fs::exists(q / "inbox" / "flaky.a2.json"), "due retry requeued");
        expect_true(list_inbox_json(q / "inbox").size() == 1, "one job waiting");
    }

    // Test 7: RETRY with the budget spent dead-letters
    {
        fs::path proc = claim_job(q / "inbox" / "flaky.a2.json", q / "processing");
        expect_true(!proc.empty(), "claim retried job");
        fs::rename(proc, q / "processing" / "flaky.a3.json.processing");
        auto jr = finish_queue_job(q / "processing" / "flaky.a3.json.processing", "flaky.a3.json", q,
                                   outcome(Disposition::RETRY, FailureKind::INFRASTRUCTURE), policy);
        expect_true(jr.requested == Disposition::RETRY, "retry requested");
        expect_true(jr.applied == Disposition::DEAD_LETTER, "budget spent");
        expect_eq_ll(jr.attempt, 3, "attempt from name");
        expect_true(fs::exists(q / "dlq" / "flaky.a3.json"), "moved to dlq");
    }

    // Test 8: a claimed job cannot be claimed twice
    {
        write_file(q / "inbox" / "once.json", "{}");
        fs::path first = claim_job(q / "inbox" / "once.json", q / "processing");
        fs::path second = claim_job(q / "inbox" / "once.json", q / "processing");
        expect_true(!first.empty() && second.empty(), "single claim");
    }

    // Test 9: jobs stranded in processing/ by a dead process go back to inbox/
    {
        const fs::path q2 = make_temp_dir("agentd_recover");
        ensure_queue_dirs(q2);
        write_file(q2 / "processing" / "stale.a4.json.processing", "{}");
        write_file(q2 / "processing" / "other.json.processing", "{}");
        write_file(q2 / "processing" / "notes.txt", "x");
        write_file(q2 / "inbox" / "other.json", "{}"); // name already taken
        expect_eq_ll(recover_processing(q2 / "processing", q2 / "inbox"), 2, "two jobs recovered");
        expect_true(fs::exists(q2 / "inbox" / "stale.a4.json"), "stale job back in inbox");
        expect_true(!fs::exists(q2 / "processing" / "stale.a4.json.processing"), "processing entry gone");
        expect_true(fs::exists(q2 / "processing" / "notes.txt"), "unrelated files left alone");
        expect_eq_ll((long long)list_inbox_json(q2 / "inbox").size(), 3, "collision kept both jobs");
        expect_eq_ll(parse_attempt_from_name("stale.a4.json"), 4, "attempt survives recovery");
        expect_eq_ll(recover_processing(q2 / "processing", q2 / "inbox"), 0, "nothing left to recover");
        remove_tree(q2);
    }

    // Test 10: a requeued retry colliding with an inbox name keeps its attempt number
    {
        expect_eq_str(disambiguate_name("flaky.a2.json", "1700000000000"), "flaky_1700000000000.a2.json",
                      "tag goes before the attempt suffix");
        expect_eq_str(disambiguate_name("plain.json", "7"), "plain_7.json", "no attempt suffix");
        expect_eq_ll(parse_attempt_from_name(disambiguate_name("flaky.a2.json", "1700000000000")), 2,
                     "attempt still parses");

        const fs::path q3 = make_temp_dir("agentd_collide");
        ensure_queue_dirs(q3);
        write_file(q3 / "inbox" / "dup.a3.json", "{}");
        write_file(q3 / "retry" / "retry_0_dup.a3.json", "{}");
        move_due_retries(q3 / "retry", q3 / "inbox");
        auto jobs = list_inbox_json(q3 / "inbox");
        expect_eq_ll((long long)jobs.size(), 2, "both copies in inbox");
        for (auto& j : jobs) {
            expect_eq_ll(parse_attempt_from_name(j.filename().string()), 3,
                         "attempt kept for " + j.filename().string());
        }
        remove_tree(q3);
    }

    remove_tree(q);
    std::cerr << "test_queue: ALL PASSED" << std::endl;
    return 0;
}
