#include "CommandLine.hh"

#include <ctype.h>
#include <errno.h>
#include <inttypes.h>
#include <stdlib.h>
#include <string.h>
#include <stdio.h>

#include <phosg/Strings.hh>
#include <string>

#include "Languages/Bloop.hh"
#include "Languages/Common.hh"

using namespace std;



Options::Options() : behavior(Behavior::Execute),
    max_steps(DEFAULT_MAX_STEPS), verbose(false), assembly(false),
    trace(false), show_time(false), input_filename(NULL), inline_code(NULL),
    num_bad_options(0) { }

uint64_t Options::debug_flags() const {
  return (this->assembly ? (DebugFlag::ShowCompilationEvents | DebugFlag::ShowAssembly) : 0) |
      (this->trace ? DebugFlag::TraceExecution : 0);
}



bool parse_max_steps(const char* s, uint64_t* max_steps) {
  if (!*s || (*s == '-') || (*s == '+') || isspace(*s)) {
    return false;
  }
  char* end = NULL;
  errno = 0;
  uint64_t value = strtoull(s, &end, 0);
  if (*end || (errno == ERANGE) || (value == 0)) {
    return false;
  }
  *max_steps = value;
  return true;
}

bool has_bloop_extension(const string& filename) {
  string lower_filename = filename;
  for (char& ch : lower_filename) {
    ch = tolower(ch);
  }
  return ends_with(lower_filename, ".bloop");
}

int exit_status_for_result(const ExecutionResult& result) {
  return result.completed() ? 0 : 2;
}

Options parse_options(int argc, const char* const* argv) {
  Options ret;

  int x;
  for (x = 1; x < argc; x++) {

    // general options
    if (!strcmp(argv[x], "--verbose")) {
      ret.verbose = true;
    } else if (!strcmp(argv[x], "--show-assembly")) {
      ret.assembly = true;
    } else if (!strcmp(argv[x], "--trace")) {
      ret.trace = true;
    } else if (!strcmp(argv[x], "--time")) {
      ret.show_time = true;

    // mode selection
    } else if (!strcmp(argv[x], "--interpret")) {
      ret.behavior = Behavior::Interpret;
    } else if (!strcmp(argv[x], "--execute")) {
      ret.behavior = Behavior::Execute;

    // limits
    } else if (!strncmp(argv[x], "--max-steps=", 12)) {
      if (!parse_max_steps(&argv[x][12], &ret.max_steps)) {
        fprintf(stderr, "--max-steps must be a positive integer (got %s)\n",
            &argv[x][12]);
        ret.num_bad_options++;
      }

    // program source
    } else if (!strncmp(argv[x], "--code=", 7)) {
      ret.inline_code = &argv[x][7];
    } else if (!ret.input_filename) {
      ret.input_filename = argv[x];
    } else {
      fprintf(stderr, "too many positional arguments given\n");
      ret.num_bad_options++;
    }
  }

  if (ret.input_filename && ret.inline_code) {
    fprintf(stderr, "bloop: both an input file and --code were given\n");
    ret.num_bad_options++;
  } else if (!ret.input_filename && !ret.inline_code) {
    fprintf(stderr, "bloop: no input file\n");
    ret.num_bad_options++;
  }

  return ret;
}

void print_usage(const char* argv0) {
  fprintf(stderr, "\n\
Usage: %s [options] program_file\n\
       %s [options] --code=program_text\n\
\n\
Modes:\n\
  --interpret\n\
      Run the code under an interpreter.\n\
  --execute\n\
      Compile the code to AMD64 assembly and run it (default).\n\
\n\
Options:\n\
  --max-steps=num\n\
      Stop the program after this many commands have run (default %" PRIu64 ").\n\
      Every B, L, O, P, ( and ) counts, including repeated loop iterations.\n\
  --show-assembly\n\
      In execute mode, output the compiled code\'s disassembly before running.\n\
      No effect in interpret mode.\n\
  --trace\n\
      In interpret mode, describe every command on stderr as it runs.\n\
      No effect in execute mode.\n\
  --time\n\
      Show how long the run took on stderr when it finishes. In execute mode\n\
      this includes compilation time.\n\
  --verbose\n\
      Describe the run\'s outcome on stderr when it finishes.\n\
", argv0, argv0, DEFAULT_MAX_STEPS);
}
