#include "BloopJITCompiler.hh"

#include <inttypes.h>
#include <stdlib.h>
#include <stdio.h>

#include <map>
#include <phosg/Strings.hh>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <libamd64/AMD64Assembler.hh>
#include <libamd64/CodeBuffer.hh>

#include "Bloop.hh"
#include "Common.hh"

using namespace std;



BloopJITCompiler::BloopJITCompiler(const string& code, uint64_t max_steps,
    uint64_t debug_flags) : code(code), max_steps(max_steps),
    debug_flags(debug_flags) {
  if (this->max_steps == 0) {
    throw invalid_argument("step limit must be positive");
  }

  // strip all the non-opcode data out of the code
  char* write_ptr = const_cast<char*>(this->code.data());
  for (char ch : this->code) {
    if (is_command(ch)) {
      *(write_ptr++) = ch;
    }
  }
  this->code.resize(write_ptr - this->code.data());
}



unordered_map<size_t, size_t> BloopJITCompiler::assign_loop_slots() const {
  // each ( gets its own slot. a ( can't run again while its own loop is still
  // open (the loop only ever jumps to the command after it), so slots are
  // never shared between live loops
  unordered_map<size_t, size_t> ret;
  for (size_t offset = 0; offset < this->code.size(); offset++) {
    if (this->code[offset] == '(') {
      size_t slot = ret.size();
      ret.emplace(offset, slot);
    }
  }
  return ret;
}

void BloopJITCompiler::dispatch_output(BloopJITCompiler* c, int64_t value) {
  c->output.push_back(output_char_for_value(value));
}

void BloopJITCompiler::write_step(AMD64Assembler& as) {
  as.write_inc(r14);
  as.write_cmp(r14, r15);
  as.write_jae("exit"); // step counts are unsigned
}

void BloopJITCompiler::write_transition(AMD64Assembler& as,
    size_t table_offset) {
  as.write_mov(r13, MemoryReference(rbx, table_offset, r13, 8));
}

ExecutionResult BloopJITCompiler::execute() {
  auto loop_slots = this->assign_loop_slots();

  this->runtime_data.clear();
  this->runtime_data.resize((LOOP_SLOTS_OFFSET / 8) + loop_slots.size(), 0);
  for (int64_t v = MIN_ACCUMULATOR; v <= MAX_ACCUMULATOR; v++) {
    this->runtime_data[(B_TABLE_OFFSET / 8) + v] = value_after_B(v);
    this->runtime_data[(L_TABLE_OFFSET / 8) + v] = value_after_L(v);
    this->runtime_data[(P_TABLE_OFFSET / 8) + v] = value_after_P(v);
    this->runtime_data[(EXIT_TABLE_OFFSET / 8) + v] =
        exit_value_for_parity(parity_for_value(v));
  }
  this->output.clear();

  AMD64Assembler as;

  // rbx = runtime data
  // r12 = output function ptr
  // r13 = accumulator
  // r14 = steps executed
  // r15 = step limit

  // generate lead-in code
  as.write_push(rbp);
  as.write_mov(rbp, rsp);
  as.write_push(rbx);
  as.write_push(r12);
  as.write_push(r13);
  as.write_push(r14);
  as.write_push(r15);
  as.write_mov(rbx, reinterpret_cast<int64_t>(this->runtime_data.data()));
  as.write_mov(r12, reinterpret_cast<int64_t>(&BloopJITCompiler::dispatch_output));
  as.write_mov(r13, MIN_ACCUMULATOR);
  as.write_xor(r14, r14);
  as.write_mov(r15, static_cast<int64_t>(this->max_steps));

  // generate program assembly
  vector<size_t> open_offsets;
  size_t unmatched_close_count = 0;
  for (size_t offset = 0; offset < this->code.size(); offset++) {
    switch (this->code[offset]) {
      case 'B':
        this->write_transition(as, B_TABLE_OFFSET);
        this->write_step(as);
        break;

      case 'L':
        this->write_transition(as, L_TABLE_OFFSET);
        this->write_step(as);
        break;

      case 'P':
        this->write_transition(as, P_TABLE_OFFSET);
        this->write_step(as);
        break;

      case 'O':
        as.write_mov(rdi, reinterpret_cast<int64_t>(this));
        as.write_mov(rsi, r13);
        as.write_sub(rsp, 8);
        as.write_call(r12);
        as.write_add(rsp, 8);
        this->write_step(as);
        break;

      case '(': {
        size_t slot_offset = LOOP_SLOTS_OFFSET + 8 * loop_slots.at(offset);
        as.write_mov(rax, MemoryReference(rbx, EXIT_TABLE_OFFSET, r13, 8));
        as.write_mov(MemoryReference(rbx, slot_offset), rax);
        this->write_step(as);
        as.write_label(string_printf("loop_%zu_begin", offset));
        open_offsets.emplace_back(offset);
        break;
      }

      case ')': {
        this->write_step(as);
        if (open_offsets.empty()) {
          unmatched_close_count++;
          break;
        }
        size_t open_offset = open_offsets.back();
        size_t slot_offset = LOOP_SLOTS_OFFSET + 8 * loop_slots.at(open_offset);
        as.write_mov(rax, MemoryReference(rbx, slot_offset));
        as.write_cmp(r13, rax);
        as.write_jne(string_printf("loop_%zu_begin", open_offset));
        open_offsets.pop_back();
        break;
      }
    }
  }

  // generate lead-out code. both normal completion and the step limit land
  // here; r14 reaches r15 only in the latter case
  as.write_label("exit");
  as.write_mov(MemoryReference(rbx, ACCUMULATOR_OFFSET), r13);
  as.write_mov(rax, r14);
  as.write_pop(r15);
  as.write_pop(r14);
  as.write_pop(r13);
  as.write_pop(r12);
  as.write_pop(rbx);
  as.write_pop(rbp);
  as.write_ret();

  // assemble it all
  multimap<size_t, string> compiled_labels;
  unordered_set<size_t> patch_offsets;
  string data = as.assemble(&patch_offsets, &compiled_labels);
  void* executable_data = this->buf.append(data, &patch_offsets);
  int64_t (*function)() = reinterpret_cast<int64_t(*)()>(executable_data);

  if (this->debug_flags & DebugFlag::ShowCompilationEvents) {
    fprintf(stderr, "compiled %zu commands (%zu loops, %zu left open, %zu unmatched closes)\n",
        this->code.size(), loop_slots.size(), open_offsets.size(),
        unmatched_close_count);
  }

  if (this->debug_flags & DebugFlag::ShowAssembly) {
    string disassembly = AMD64Assembler::disassemble(executable_data,
        data.size(), reinterpret_cast<int64_t>(executable_data),
        &compiled_labels);
    fprintf(stderr, "%s\n", disassembly.c_str());
    string size_str = format_size(data.size());
    fprintf(stderr, "code buffer size: %s\n", size_str.c_str());
  }

  // run it
  ExecutionResult ret(this->max_steps);
  ret.steps = function();
  ret.outcome = (ret.steps >= this->max_steps) ?
      Outcome::StepLimitExceeded : Outcome::Completed;
  ret.accumulator = this->runtime_data[ACCUMULATOR_OFFSET / 8];
  ret.output = move(this->output);
  this->output.clear();
  return ret;
}
