#include "BloopInterpreter.hh"

#include <inttypes.h>
#include <stdio.h>

#include <phosg/Strings.hh>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "Bloop.hh"
#include "Common.hh"

using namespace std;



BloopInterpreter::LoopEntry::LoopEntry(size_t return_offset,
    Parity entry_parity) : return_offset(return_offset),
    entry_parity(entry_parity) { }

BloopInterpreter::BloopInterpreter(const string& code, uint64_t max_steps,
    uint64_t debug_flags) : code(code), max_steps(max_steps),
    debug_flags(debug_flags), value(MIN_ACCUMULATOR), pc(0) {
  if (this->max_steps == 0) {
    throw invalid_argument("step limit must be positive");
  }
}



ExecutionResult BloopInterpreter::execute() {
  this->value = MIN_ACCUMULATOR;
  this->pc = 0;
  this->loops.clear();
  this->output.clear();

  ExecutionResult ret(this->max_steps);
  while (this->pc < this->code.size()) {
    char opcode = this->code[this->pc];
    if (!is_command(opcode)) {
      this->pc++;
      continue;
    }

    size_t prev_pc = this->pc;
    int64_t prev_value = this->value;
    this->execute_opcode(opcode);
    ret.steps++;

    if (this->debug_flags & DebugFlag::TraceExecution) {
      fprintf(stderr, "[%" PRIu64 "] pc=%zu %c acc=%" PRId64 " -> %" PRId64
          " loops=%zu\n", ret.steps, prev_pc, opcode, prev_value, this->value,
          this->loops.size());
    }

    if (ret.steps >= this->max_steps) {
      ret.outcome = Outcome::StepLimitExceeded;
      break;
    }
  }

  ret.output = move(this->output);
  ret.accumulator = this->value;
  this->output.clear();
  return ret;
}



void BloopInterpreter::execute_opcode(char opcode) {
  switch (opcode) {
    case 'B':
      this->value = value_after_B(this->value);
      break;

    case 'L':
      this->value = value_after_L(this->value);
      break;

    case 'P':
      this->value = value_after_P(this->value);
      break;

    case 'O':
      this->output.push_back(output_char_for_value(this->value));
      break;

    case '(':
      this->loops.emplace_back(this->pc + 1, parity_for_value(this->value));
      break;

    case ')': {
      // an unmatched ) does nothing
      if (this->loops.empty()) {
        break;
      }
      const LoopEntry& loop = this->loops.back();
      if (this->value != exit_value_for_parity(loop.entry_parity)) {
        this->pc = loop.return_offset;
        return;
      }
      this->loops.pop_back();
      break;
    }

    default:
      throw logic_error(string_printf(
          "execute_opcode called on non-command byte %02hhX", opcode));
  }
  this->pc++;
}
