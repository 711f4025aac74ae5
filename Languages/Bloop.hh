#pragma once

#include <inttypes.h>

#include <string>



enum class Parity {
  Odd = 0,
  Even,
};

enum class Outcome {
  Completed = 0,
  StepLimitExceeded,
};

static const int64_t MIN_ACCUMULATOR = 1;
static const int64_t MAX_ACCUMULATOR = 6;

Parity parity_for_value(int64_t value);
const char* name_for_parity(Parity p);
const char* name_for_outcome(Outcome o);

// returns the value in [1, 6] congruent to value + delta (mod 6). delta may be
// negative or larger than the ring
int64_t wrap(int64_t value, int64_t delta);

bool is_command(char cmd);

// accumulator transitions. the amount depends on the parity of the value
// before the command runs
int64_t value_after_B(int64_t value);
int64_t value_after_L(int64_t value);
int64_t value_after_P(int64_t value);

// the character O emits: the decimal digit for odd values, the letter at that
// position in the alphabet for even values (2 => B, 4 => D, 6 => F)
char output_char_for_value(int64_t value);

// the value at which ) stops repeating a loop entered with this parity
int64_t exit_value_for_parity(Parity entry_parity);

struct ExecutionResult {
  std::string output;
  Outcome outcome;
  uint64_t steps;
  uint64_t max_steps;
  int64_t accumulator;

  ExecutionResult(uint64_t max_steps = 0);

  bool completed() const;
  std::string str() const;
};
