#pragma once

#include "agentd/config.h"

#include <string>

// Runs `<agent binary> --version` with a 10 s deadline. On success fills
// `version` with the trimmed stdout.
bool check_agent_binary(const agentd::WorkerConfig& cfg, std::string* version, std::string* err);

// agentd check
int cmd_check(const agentd::WorkerConfig& cfg, int argc, char** argv);
