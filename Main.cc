#include <inttypes.h>
#include <stdlib.h>
#include <stdio.h>

#include <phosg/Filesystem.hh>
#include <phosg/Strings.hh>
#include <phosg/Time.hh>
#include <string>

#include "CommandLine.hh"
#include "Languages/Bloop.hh"
#include "Languages/BloopInterpreter.hh"
#include "Languages/BloopJITCompiler.hh"
#include "Languages/Common.hh"

using namespace std;



int main(int argc, char* argv[]) {
  Options opts = parse_options(argc, argv);
  if (opts.num_bad_options) {
    print_usage(argv[0]);
    return 1;
  }

  ExecutionResult result;
  uint64_t elapsed_usecs = 0;
  try {
    string code;
    if (opts.inline_code) {
      code = opts.inline_code;
    } else {
      if (!has_bloop_extension(opts.input_filename)) {
        fprintf(stderr, "warning: file %s does not have a .bloop extension\n",
            opts.input_filename);
      }
      code = load_file(opts.input_filename);
    }

    uint64_t start_time = now();
    if (opts.behavior == Behavior::Interpret) {
      BloopInterpreter i(code, opts.max_steps, opts.debug_flags());
      result = i.execute();
    } else if (opts.behavior == Behavior::Execute) {
      BloopJITCompiler c(code, opts.max_steps, opts.debug_flags());
      result = c.execute();
    }
    elapsed_usecs = now() - start_time;

  } catch (const exception& e) {
    fprintf(stderr, "failed: %s\n", e.what());
    return 1;
  }

  fwrite(result.output.data(), 1, result.output.size(), stdout);
  fflush(stdout);

  if (opts.verbose) {
    string result_str = result.str();
    fprintf(stderr, "\n%s\n", result_str.c_str());
  }

  if (opts.show_time) {
    string duration_str = format_duration(elapsed_usecs);
    fprintf(stderr, "\nexecution time: %s\n", duration_str.c_str());
  }

  if (!result.completed()) {
    fprintf(stderr, "\nstep limit reached (%" PRIu64 " steps)\n",
        result.max_steps);
  }
  return exit_status_for_result(result);
}
