#pragma once

#include "runtime.h"

// agentd run <envelope.json>
// Exit codes: 0 ACK, 1 DEAD_LETTER, 3 RETRY, 2 usage error.
int cmd_run(agentd::Runtime& rt, int argc, char** argv);

int disposition_exit_code(agentd::Disposition d);
