#include "Bloop.hh"

#include <inttypes.h>

#include <phosg/Strings.hh>
#include <stdexcept>
#include <string>

using namespace std;



Parity parity_for_value(int64_t value) {
  return (value & 1) ? Parity::Odd : Parity::Even;
}

const char* name_for_parity(Parity p) {
  return (p == Parity::Odd) ? "odd" : "even";
}

const char* name_for_outcome(Outcome o) {
  switch (o) {
    case Outcome::Completed:
      return "completed";
    case Outcome::StepLimitExceeded:
      return "step limit exceeded";
  }
  throw invalid_argument("unknown outcome");
}

int64_t wrap(int64_t value, int64_t delta) {
  // delta is reduced first so the sum can't overflow. % can be negative for
  // negative operands, so add the modulus back in before reducing again
  int64_t ring_size = MAX_ACCUMULATOR - MIN_ACCUMULATOR + 1;
  return ((value - MIN_ACCUMULATOR + delta % ring_size) % ring_size + ring_size)
      % ring_size + MIN_ACCUMULATOR;
}

bool is_command(char cmd) {
  return (cmd == 'B') || (cmd == 'L') || (cmd == 'O') || (cmd == 'P') ||
         (cmd == '(') || (cmd == ')');
}

int64_t value_after_B(int64_t value) {
  return wrap(value, (parity_for_value(value) == Parity::Odd) ? 1 : 2);
}

int64_t value_after_L(int64_t value) {
  return wrap(value, (parity_for_value(value) == Parity::Odd) ? -1 : -2);
}

int64_t value_after_P(int64_t value) {
  return wrap(value, (parity_for_value(value) == Parity::Odd) ? 1 : -1);
}

char output_char_for_value(int64_t value) {
  if ((value < MIN_ACCUMULATOR) || (value > MAX_ACCUMULATOR)) {
    throw out_of_range(string_printf(
        "accumulator value %" PRId64 " is out of range", value));
  }
  if (parity_for_value(value) == Parity::Odd) {
    return '0' + value;
  }
  return 'A' + value - 1;
}

int64_t exit_value_for_parity(Parity entry_parity) {
  return (entry_parity == Parity::Odd) ? MIN_ACCUMULATOR : MAX_ACCUMULATOR;
}



ExecutionResult::ExecutionResult(uint64_t max_steps) :
    outcome(Outcome::Completed), steps(0), max_steps(max_steps),
    accumulator(MIN_ACCUMULATOR) { }

bool ExecutionResult::completed() const {
  return this->outcome == Outcome::Completed;
}

string ExecutionResult::str() const {
  return string_printf("[%s after %" PRIu64 "/%" PRIu64 " steps; acc=%" PRId64
      "; %zu output bytes]", name_for_outcome(this->outcome), this->steps,
      this->max_steps, this->accumulator, this->output.size());
}
