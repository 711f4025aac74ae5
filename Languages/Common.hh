#pragma once

#include <stdint.h>

enum DebugFlag {
  ShowCompilationEvents  = 0x01,
  ShowAssembly           = 0x02,
  TraceExecution         = 0x04,
};

// used when the caller doesn't give a step ceiling
static const uint64_t DEFAULT_MAX_STEPS = 1000000;
