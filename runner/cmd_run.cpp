#include "cmd_run.h"
#include "runner_utils.h"

#include <filesystem>
#include <iostream>

using namespace agentd;

int disposition_exit_code(Disposition d) {
    switch (d) {
        case Disposition::ACK: return 0;
        case Disposition::DEAD_LETTER: return 1;
        case Disposition::RETRY: return 3;
    }
    return 1;
}

int cmd_run(Runtime& rt, int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: agentd run <envelope.json>\n";
        return 2;
    }
    const std::filesystem::path path = argv[2];
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        std::cerr << "[agentd] not a file: " << path << "\n";
        return 2;
    }

    WorkerOutcome out = rt.worker.process(slurp_file(path));

    std::cerr << "[agentd] " << (out.correlation_id.empty() ? "-" : out.correlation_id)
              << " state=" << worker_state_to_str(out.state)
              << " failure=" << failure_kind_to_str(out.failure)
              << " disposition=" << disposition_to_str(out.disposition)
              << " duration_ms=" << out.duration_ms << "\n";
    if (!out.detail.empty()) {
        std::cerr << "[agentd] " << out.detail << "\n";
    }
    return disposition_exit_code(out.disposition);
}
