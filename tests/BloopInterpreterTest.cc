#include <inttypes.h>

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "Languages/Bloop.hh"
#include "Languages/BloopInterpreter.hh"

using namespace std;



static ExecutionResult run(const string& code,
    uint64_t max_steps = DEFAULT_MAX_STEPS) {
  BloopInterpreter i(code, max_steps);
  return i.execute();
}

static string output_for(const string& code) {
  ExecutionResult r = run(code);
  EXPECT_TRUE(r.completed()) << code;
  return r.output;
}



TEST(BloopInterpreterTest, EmptyProgram) {
  ExecutionResult r = run("");
  EXPECT_TRUE(r.completed());
  EXPECT_EQ("", r.output);
  EXPECT_EQ(0u, r.steps);
  EXPECT_EQ(1, r.accumulator);
}

TEST(BloopInterpreterTest, ProgramWithoutCommands) {
  ExecutionResult r = run("hello, world\n\tbloop?");
  EXPECT_TRUE(r.completed());
  EXPECT_EQ("", r.output);
  EXPECT_EQ(0u, r.steps);
  EXPECT_EQ(1, r.accumulator);
}

TEST(BloopInterpreterTest, SingleCommands) {
  EXPECT_EQ("1", output_for("O"));
  EXPECT_EQ("B", output_for("BO"));
  EXPECT_EQ("D", output_for("BBO"));
  EXPECT_EQ("F", output_for("LO"));
  EXPECT_EQ("D", output_for("LLO"));
  EXPECT_EQ("B", output_for("PO"));
  EXPECT_EQ("1", output_for("BPO"));
  EXPECT_EQ("5", output_for("BBBPO"));
}

TEST(BloopInterpreterTest, OutputMapping) {
  EXPECT_EQ("1BD", output_for("OBOBO"));
  EXPECT_EQ("BDFBDF", output_for("BOBOBOBOBOBO"));
  EXPECT_EQ("FDBFDB", output_for("LOLOLOLOLOLO"));
  EXPECT_EQ("B1B", output_for("POPOPO"));
}

TEST(BloopInterpreterTest, CommandsWithoutOutputProduceNothing) {
  ExecutionResult r = run("B");
  EXPECT_EQ("", r.output);
  EXPECT_EQ(2, r.accumulator);
  EXPECT_EQ(1u, r.steps);
}

TEST(BloopInterpreterTest, IgnoredCharacters) {
  ExecutionResult plain = run("O");
  ExecutionResult padded = run(" O \t xyz ");
  EXPECT_EQ(plain.output, padded.output);
  EXPECT_EQ(plain.accumulator, padded.accumulator);
  EXPECT_EQ(plain.steps, padded.steps);

  plain = run("B(B)O");
  padded = run("b B\n( bloop B ) \r\nO!");
  EXPECT_EQ("F", padded.output);
  EXPECT_EQ(plain.output, padded.output);
  EXPECT_EQ(plain.accumulator, padded.accumulator);
  EXPECT_EQ(plain.steps, padded.steps);
}

TEST(BloopInterpreterTest, LoopRepetition) {
  // 1 -> 2, even entry exits at 6: 2 -> 4 (repeat), 4 -> 6 (exit)
  ExecutionResult r = run("B(B)O");
  EXPECT_TRUE(r.completed());
  EXPECT_EQ("F", r.output);
  EXPECT_EQ(7u, r.steps);
  EXPECT_EQ(6, r.accumulator);
}

TEST(BloopInterpreterTest, LoopWithoutRepetition) {
  ExecutionResult r = run("B(BB)O");
  EXPECT_TRUE(r.completed());
  EXPECT_EQ("F", r.output);
  EXPECT_EQ(6u, r.steps);
}

TEST(BloopInterpreterTest, OddEntryExitsAtOne) {
  // 1 -> 2 (repeat), 2 -> 1 (exit)
  ExecutionResult r = run("(P)O");
  EXPECT_TRUE(r.completed());
  EXPECT_EQ("1", r.output);
  EXPECT_EQ(6u, r.steps);
}

TEST(BloopInterpreterTest, LoopBodyOutput) {
  EXPECT_EQ("BDFF", output_for("L(BO)O"));
  EXPECT_EQ("DFF", output_for("B(BO)O"));
  EXPECT_EQ("FF", output_for("B(LO)O"));
  EXPECT_EQ("BFF", output_for("BO(LO)O"));
}

TEST(BloopInterpreterTest, NestedLoopsAreIndependent) {
  EXPECT_EQ("FF", output_for("B(B(L)O)O"));
  EXPECT_EQ("FF", output_for("B((B)O)O"));
  EXPECT_EQ(11u, run("B(B(L)O)O").steps);
}

TEST(BloopInterpreterTest, InnerLoopThatNeverExits) {
  // the outer loop is entered at 2 (exits at 6), the inner one at 1 (exits at
  // 1), but the inner body only cycles through 2, 4 and 6
  ExecutionResult r = run("B(P(B)O)O", 1000);
  EXPECT_FALSE(r.completed());
  EXPECT_EQ("", r.output);
  EXPECT_EQ(1000u, r.steps);
}

TEST(BloopInterpreterTest, UnmatchedCloseIsIgnored) {
  ExecutionResult r = run(")O");
  EXPECT_TRUE(r.completed());
  EXPECT_EQ("1", r.output);
  EXPECT_EQ(2u, r.steps);

  r = run("))B)O");
  EXPECT_TRUE(r.completed());
  EXPECT_EQ("B", r.output);
  EXPECT_EQ(5u, r.steps);
}

TEST(BloopInterpreterTest, UnmatchedOpenIsIgnored) {
  EXPECT_EQ("1", output_for("(O"));
  EXPECT_EQ("B", output_for("B(O"));
}

TEST(BloopInterpreterTest, StepLimit) {
  // 1 -> 2 -> 4 -> 6 -> 2 -> ... never returns to 1
  ExecutionResult r = run("(B)", 100);
  EXPECT_FALSE(r.completed());
  EXPECT_EQ(Outcome::StepLimitExceeded, r.outcome);
  EXPECT_EQ(100u, r.steps);
  EXPECT_EQ(100u, r.max_steps);
  EXPECT_EQ("", r.output);
}

TEST(BloopInterpreterTest, StepLimitKeepsOutput) {
  ExecutionResult r = run("(BO)O", 1000);
  EXPECT_FALSE(r.completed());
  EXPECT_EQ(1000u, r.steps);
  EXPECT_EQ(0u, r.output.size() % 3);
  EXPECT_EQ("BDFBDFBDF", r.output.substr(0, 9));
}

TEST(BloopInterpreterTest, StepLimitOnLastCommand) {
  EXPECT_TRUE(run("B(B)O", 8).completed());

  ExecutionResult r = run("B(B)O", 7);
  EXPECT_FALSE(r.completed());
  EXPECT_EQ("F", r.output);

  r = run("B(B)O", 6);
  EXPECT_FALSE(r.completed());
  EXPECT_EQ("", r.output);
  EXPECT_EQ(6, r.accumulator);
}

TEST(BloopInterpreterTest, ZeroStepLimitIsRejected) {
  EXPECT_THROW(BloopInterpreter("O", 0), invalid_argument);
}

TEST(BloopInterpreterTest, Determinism) {
  BloopInterpreter i("L(BO)OB(P(B)O)O", 500);
  ExecutionResult first = i.execute();
  ExecutionResult second = i.execute();
  EXPECT_EQ(first.output, second.output);
  EXPECT_EQ(first.outcome, second.outcome);
  EXPECT_EQ(first.steps, second.steps);
  EXPECT_EQ(first.accumulator, second.accumulator);

  ExecutionResult third = run("L(BO)OB(P(B)O)O", 500);
  EXPECT_EQ(first.output, third.output);
  EXPECT_EQ(first.steps, third.steps);
}
