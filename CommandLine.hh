#pragma once

#include <inttypes.h>

#include <string>

#include "Languages/Bloop.hh"



enum class Behavior {
  Interpret = 0,
  Execute = 1,
};

struct Options {
  Behavior behavior;
  uint64_t max_steps;
  bool verbose;
  bool assembly;
  bool trace;
  bool show_time;
  const char* input_filename;
  const char* inline_code;
  size_t num_bad_options;

  Options();

  uint64_t debug_flags() const;
};

// problems are described on stderr and counted in num_bad_options
Options parse_options(int argc, const char* const* argv);

// accepts only a complete, positive decimal/hex/octal number
bool parse_max_steps(const char* s, uint64_t* max_steps);

bool has_bloop_extension(const std::string& filename);

int exit_status_for_result(const ExecutionResult& result);

void print_usage(const char* argv0);
