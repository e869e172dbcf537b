#pragma once

#include "runtime.h"

// agentd serve [queue_dir] [--workers N] [--once] [--sleep_ms N] [--skip_check]
int cmd_serve(agentd::Runtime& rt, int argc, char** argv);
