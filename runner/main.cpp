#include "cmd_check.h"
#include "cmd_run.h"
#include "cmd_serve.h"

#include "agentd/config.h"

#include <curl/curl.h>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

// Keeps libcurl's global state alive for the whole process.
struct CurlGlobal {
    CURLcode rc;
    CurlGlobal() : rc(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    ~CurlGlobal() { if (rc == CURLE_OK) curl_global_cleanup(); }
};

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "agentd <run|serve|check> ...\n";
        return 2;
    }
    const std::string cmd = argv[1];
    if (cmd != "run" && cmd != "serve" && cmd != "check") {
        std::cerr << "unknown command: " << cmd << "\n";
        return 2;
    }

    CurlGlobal curl;
    if (curl.rc != CURLE_OK) {
        std::cerr << "[agentd] curl_global_init failed: " << curl_easy_strerror(curl.rc) << "\n";
        return 2;
    }

    const agentd::Profile profile = agentd::detect_profile();
    agentd::apply_profile_defaults(profile);

    agentd::WorkerConfig cfg;
    try {
        cfg = agentd::load_worker_config();
    } catch (const std::runtime_error& e) {
        std::cerr << "[agentd] configuration error: " << e.what() << "\n";
        return 2;
    }
    std::cerr << "[agentd] profile=" << agentd::profile_name(profile)
              << " agent=" << cfg.agent_binary << "\n";

    if (cmd == "check") return cmd_check(cfg, argc, argv);

    auto rt = std::make_unique<agentd::Runtime>(std::move(cfg));
    if (!rt->log.ok()) {
        std::cerr << "[WARN] event log unavailable\n";
    } else {
        std::cerr << "[agentd] event log: " << (rt->log.path().empty() ? "stderr" : rt->log.path()) << "\n";
    }
    if (cmd == "run") return cmd_run(*rt, argc, argv);
    return cmd_serve(*rt, argc, argv);
}
