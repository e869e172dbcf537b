#pragma once

#include "agentd/config.h"
#include "agentd/dispatch.h"
#include "agentd/http.h"
#include "agentd/log.h"
#include "agentd/worker.h"

#include <utility>

namespace agentd {

// Process-wide objects. Members are built in declaration order; each one
// only refers to those above it. `serve` gives each thread its own
// WorkerLoop over the shared config, dispatcher and log.
struct Runtime {
    WorkerConfig cfg;
    EventLog log;
    CurlHttpClient http;
    ResultDispatcher dispatcher;
    WorkerLoop worker;

    explicit Runtime(WorkerConfig c)
        : cfg(std::move(c)),
          log(cfg.log_path),
          dispatcher(cfg, http),
          worker(cfg, dispatcher, log) {}

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;
};

} // namespace agentd
