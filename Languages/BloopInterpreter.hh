#pragma once

#include <inttypes.h>

#include <string>
#include <vector>

#include "Bloop.hh"
#include "Common.hh"



class BloopInterpreter {
public:
  explicit BloopInterpreter(const std::string& code,
      uint64_t max_steps = DEFAULT_MAX_STEPS, uint64_t debug_flags = 0);
  ~BloopInterpreter() = default;

  ExecutionResult execute();

private:
  struct LoopEntry {
    size_t return_offset;
    Parity entry_parity;

    LoopEntry(size_t return_offset, Parity entry_parity);
  };

  // runs the command at this->pc and moves pc to the next command to run
  void execute_opcode(char opcode);

  std::string code;
  uint64_t max_steps;
  uint64_t debug_flags;

  // per-run state; reset at the start of every execute()
  int64_t value;
  size_t pc;
  std::vector<LoopEntry> loops;
  std::string output;
};
