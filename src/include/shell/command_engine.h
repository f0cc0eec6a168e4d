#ifndef CLOCKSIM_COMMAND_ENGINE_H
#define CLOCKSIM_COMMAND_ENGINE_H

#include <iostream>
#include <string>

#include "common/simerr.h"
#include "driver/simulation_driver.h"

/**
 * Line based front end of the simulator. Each Execute() call runs one
 * command against the session's SimulationDriver and prints its result.
 *
 *   init [frames] [ref,string]   start a new run
 *   step [n] / back [n]          move forward / undo
 *   play                         toggle auto play
 *   speed <50-1950>              auto play speed
 *   show | stats | log           inspect the run
 *   execfile <path>              run commands from a file, quit in the
 *                                file ends the session
 *   help | quit
 */
class CommandEngine {
 public:
  explicit CommandEngine(std::ostream &out = std::cout) : out_(out) {}

  simerr_t Execute(const std::string &line);

  /**
   * Print a user message for a command result.
   */
  void ExecuteInformation(simerr_t result);

  SimulationDriver &GetDriver() { return driver_; }

 private:
  simerr_t ExecuteInit(const std::string &args);

  simerr_t ExecuteStep(const std::string &args);

  simerr_t ExecuteBack(const std::string &args);

  simerr_t ExecutePlay(const std::string &args);

  simerr_t ExecuteSpeed(const std::string &args);

  simerr_t ExecuteShow(const std::string &args);

  simerr_t ExecuteStats(const std::string &args);

  simerr_t ExecuteLog(const std::string &args);

  simerr_t ExecuteExecfile(const std::string &args);

  simerr_t ExecuteHelp(const std::string &args);

  simerr_t ExecuteQuit(const std::string &args);

  void PrintLogSince(size_t index);

  /**
   * Print log entries in [begin, end).
   */
  void PrintLogRange(size_t begin, size_t end);

  std::ostream &out_;
  SimulationDriver driver_;
  uint32_t execfile_depth_{0};
};

#endif  // CLOCKSIM_COMMAND_ENGINE_H
