#pragma once

#include <stddef.h>

#include <libamd64/AMD64Assembler.hh>
#include <libamd64/CodeBuffer.hh>
#include <string>
#include <unordered_map>
#include <vector>

#include "Bloop.hh"
#include "Common.hh"



class BloopJITCompiler {
public:
  explicit BloopJITCompiler(const std::string& code,
      uint64_t max_steps = DEFAULT_MAX_STEPS, uint64_t debug_flags = 0);
  ~BloopJITCompiler() = default;

  ExecutionResult execute();

private:
  static void dispatch_output(BloopJITCompiler* c, int64_t value);
  void write_step(AMD64Assembler& as);
  void write_transition(AMD64Assembler& as, size_t table_offset);

  // maps the offset of each ( to its loop slot index
  std::unordered_map<size_t, size_t> assign_loop_slots() const;

  std::string code;
  uint64_t max_steps;
  uint64_t debug_flags;

  // transition tables indexed by accumulator value, the final accumulator,
  // then one exit value per loop
  std::vector<int64_t> runtime_data;
  std::string output;

  CodeBuffer buf;

  static const size_t B_TABLE_OFFSET = 0x00;
  static const size_t L_TABLE_OFFSET = 0x40;
  static const size_t P_TABLE_OFFSET = 0x80;
  static const size_t EXIT_TABLE_OFFSET = 0xC0;
  static const size_t ACCUMULATOR_OFFSET = 0x100;
  static const size_t LOOP_SLOTS_OFFSET = 0x108;
};
