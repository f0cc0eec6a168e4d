#include "shell/command_engine.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "gtest/gtest.h"

TEST(CommandEngineTest, UnknownAndBlank) {
  std::stringstream out;
  CommandEngine engine(out);
  EXPECT_EQ(SIM_SUCCESS, engine.Execute(""));
  EXPECT_EQ(SIM_SUCCESS, engine.Execute("   # comment"));
  EXPECT_EQ(SIM_UNKNOWN_COMMAND, engine.Execute("jump 3"));
  EXPECT_EQ(SIM_QUIT, engine.Execute("QUIT"));
  engine.ExecuteInformation(SIM_QUIT);
  EXPECT_NE(std::string::npos, out.str().find("Bye."));
}

TEST(CommandEngineTest, CommandsBeforeInit) {
  std::stringstream out;
  CommandEngine engine(out);
  EXPECT_EQ(SIM_NOT_STARTED, engine.Execute("step"));
  EXPECT_EQ(SIM_NOT_STARTED, engine.Execute("back"));
  EXPECT_EQ(SIM_NOT_STARTED, engine.Execute("play"));
  EXPECT_EQ(SIM_NOT_STARTED, engine.Execute("show"));
  EXPECT_EQ(SIM_NOT_STARTED, engine.Execute("stats"));
}

TEST(CommandEngineTest, InitWithArguments) {
  std::stringstream out;
  CommandEngine engine(out);
  ASSERT_EQ(SIM_SUCCESS, engine.Execute("init 2 1, 2, 1, 2"));
  EXPECT_NE(std::string::npos, out.str().find("Simulation initialized. Ready to start."));
  EXPECT_NE(std::string::npos, out.str().find("Physical Memory Frames (Clock)"));

  // runs until the machine reports the end of the run
  EXPECT_EQ(SIM_FINISHED, engine.Execute("step 100"));
  EXPECT_NE(std::string::npos, out.str().find("Reference string finished."));
  EXPECT_EQ(SIM_FINISHED, engine.Execute("step"));
  ASSERT_EQ(SIM_SUCCESS, engine.Execute("stats"));
  EXPECT_NE(std::string::npos, out.str().find("Hits: 2 | Faults: 2 | Hit ratio: 50.00%"));
}

TEST(CommandEngineTest, InitDefaults) {
  std::stringstream out;
  CommandEngine engine(out);
  ASSERT_EQ(SIM_SUCCESS, engine.Execute("init"));
  ClockState state(1);
  ASSERT_EQ(SIM_SUCCESS, engine.GetDriver().GetSnapshot(&state));
  EXPECT_EQ(DEFAULT_FRAME_COUNT, state.frame_table_.Size());
}

TEST(CommandEngineTest, InvalidArguments) {
  std::stringstream out;
  CommandEngine engine(out);
  EXPECT_EQ(SIM_INVALID_INPUT, engine.Execute("init 0 1,2"));
  EXPECT_EQ(SIM_INVALID_INPUT, engine.Execute("init 3 ,,,"));
  ASSERT_EQ(SIM_SUCCESS, engine.Execute("init 3 1,2"));
  EXPECT_EQ(SIM_INVALID_INPUT, engine.Execute("step 0"));
  EXPECT_EQ(SIM_INVALID_INPUT, engine.Execute("step two"));
  EXPECT_EQ(SIM_INVALID_INPUT, engine.Execute("speed fast"));
  EXPECT_EQ(SIM_INVALID_INPUT, engine.Execute("speed 10"));
  EXPECT_EQ(SIM_INVALID_INPUT, engine.Execute("speed 100x"));
  EXPECT_EQ(SIM_INVALID_INPUT, engine.Execute("execfile"));
}

TEST(CommandEngineTest, StepAndBack) {
  std::stringstream out;
  CommandEngine engine(out);
  ASSERT_EQ(SIM_SUCCESS, engine.Execute("init 1 5,5,5"));
  ASSERT_EQ(SIM_SUCCESS, engine.Execute("step 5"));
  EXPECT_NE(std::string::npos, out.str().find("Loading Page 5 into empty frame 0. Setting bit to 1."));
  EXPECT_EQ(5u, engine.GetDriver().GetHistoryDepth());

  ASSERT_EQ(SIM_SUCCESS, engine.Execute("back 2"));
  EXPECT_NE(std::string::npos, out.str().find("Stepped back 2 steps."));
  EXPECT_EQ(3u, engine.GetDriver().GetHistoryDepth());

  // more undo than history stops at the initial state
  ASSERT_EQ(SIM_SUCCESS, engine.Execute("back 10"));
  EXPECT_EQ(0u, engine.GetDriver().GetHistoryDepth());
  EXPECT_EQ(SIM_HISTORY_EMPTY, engine.Execute("back"));
}

TEST(CommandEngineTest, SpeedAndLog) {
  std::stringstream out;
  CommandEngine engine(out);
  ASSERT_EQ(SIM_SUCCESS, engine.Execute("speed 1500"));
  EXPECT_NE(std::string::npos, out.str().find("Step interval set to 500 ms."));

  ASSERT_EQ(SIM_SUCCESS, engine.Execute("init 2 a"));
  ASSERT_EQ(SIM_SUCCESS, engine.Execute("step 2"));
  ASSERT_EQ(SIM_SUCCESS, engine.Execute("log"));
  EXPECT_NE(std::string::npos, out.str().find("[INFO] Accessing page a..."));
  EXPECT_NE(std::string::npos, out.str().find("[FAULT] Page a is a FAULT. Searching for victim..."));
}

TEST(CommandEngineTest, Execfile) {
  const std::string path = "clocksim_execfile_test.txt";
  {
    std::ofstream file(path);
    file << "# scripted run" << std::endl
         << "init 2 1,2,1,2" << std::endl
         << "step 100" << std::endl
         << "quit" << std::endl
         << "init 3 9" << std::endl;
  }
  std::stringstream out;
  CommandEngine engine(out);
  // quit inside the script ends the session
  ASSERT_EQ(SIM_QUIT, engine.Execute("execfile " + path));
  std::remove(path.c_str());

  ClockState state(1);
  ASSERT_EQ(SIM_SUCCESS, engine.GetDriver().GetSnapshot(&state));
  // lines after quit are not run
  EXPECT_EQ(2u, state.frame_table_.Size());
  EXPECT_EQ(2u, state.hits_);
  EXPECT_EQ(SIM_FAILED, engine.Execute("execfile no_such_file.txt"));
}

TEST(CommandEngineTest, FinishedReportedOnce) {
  std::stringstream out;
  CommandEngine engine(out);
  ASSERT_EQ(SIM_SUCCESS, engine.Execute("init 1 x"));
  simerr_t result = engine.Execute("step 100");
  ASSERT_EQ(SIM_FINISHED, result);
  engine.ExecuteInformation(result);

  const std::string text = out.str();
  size_t first = text.find("Simulation finished.");
  ASSERT_NE(std::string::npos, first);
  EXPECT_EQ(std::string::npos, text.find("Simulation finished.", first + 1));
  EXPECT_NE(std::string::npos, text.find("Reference string finished."));
}

TEST(CommandEngineTest, ExecfileWithoutQuit) {
  const std::string path = "clocksim_execfile_noquit_test.txt";
  {
    std::ofstream file(path);
    file << "init 1 5,5" << std::endl << "step 3" << std::endl;
  }
  std::stringstream out;
  CommandEngine engine(out);
  EXPECT_EQ(SIM_SUCCESS, engine.Execute("execfile " + path));
  std::remove(path.c_str());
  EXPECT_EQ(3u, engine.GetDriver().GetHistoryDepth());
}

TEST(CommandEngineTest, ExecfileRecursion) {
  const std::string path = "clocksim_execfile_self_test.txt";
  {
    std::ofstream file(path);
    file << "execfile " << path << std::endl << "init 2 1,2" << std::endl;
  }
  std::stringstream out;
  CommandEngine engine(out);
  // a script that runs itself stops at the nesting limit instead of overflowing the stack
  EXPECT_EQ(SIM_SUCCESS, engine.Execute("execfile " + path));
  EXPECT_NE(std::string::npos, out.str().find("Command failed."));
  EXPECT_TRUE(engine.GetDriver().IsStarted());

  // the depth counter unwinds, so the engine can run scripts again
  EXPECT_EQ(SIM_SUCCESS, engine.Execute("execfile " + path));
  std::remove(path.c_str());
}
