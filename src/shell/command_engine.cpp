#include "shell/command_engine.h"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "glog/logging.h"
#include "parser/reference_parser.h"

namespace {

/**
 * Optional repeat count argument, 1 when absent.
 */
bool ParseRepeat(const std::string &args, uint32_t *count) {
  std::string text = ReferenceParser::Trim(args);
  if (text.empty()) {
    *count = 1;
    return true;
  }
  for (char ch : text) {
    if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
  }
  try {
    unsigned long value = std::stoul(text);
    if (value == 0 || value > 100000) return false;
    *count = static_cast<uint32_t>(value);
  } catch (const std::exception &ex) {
    return false;
  }
  return true;
}

}  // namespace

simerr_t CommandEngine::Execute(const std::string &line) {
  std::string command_line = ReferenceParser::Trim(line);
  if (command_line.empty() || command_line[0] == '#') {
    return SIM_SUCCESS;
  }
  std::string command;
  std::string args;
  size_t split = command_line.find_first_of(" \t");
  if (split == std::string::npos) {
    command = command_line;
  } else {
    command = command_line.substr(0, split);
    args = ReferenceParser::Trim(command_line.substr(split + 1));
  }
  for (auto &ch : command) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

  if (command == "init" || command == "reset") return ExecuteInit(args);
  if (command == "step") return ExecuteStep(args);
  if (command == "back") return ExecuteBack(args);
  if (command == "play" || command == "pause") return ExecutePlay(args);
  if (command == "speed") return ExecuteSpeed(args);
  if (command == "show") return ExecuteShow(args);
  if (command == "stats") return ExecuteStats(args);
  if (command == "log") return ExecuteLog(args);
  if (command == "execfile") return ExecuteExecfile(args);
  if (command == "help") return ExecuteHelp(args);
  if (command == "quit" || command == "exit") return ExecuteQuit(args);
  return SIM_UNKNOWN_COMMAND;
}

void CommandEngine::ExecuteInformation(simerr_t result) {
  switch (result) {
    case SIM_FAILED:
      out_ << "Command failed." << std::endl;
      break;
    case SIM_INVALID_INPUT:
      out_ << "Invalid input. Check frames or reference string." << std::endl;
      break;
    case SIM_NOT_STARTED:
      out_ << "No simulation initialized. Use init first." << std::endl;
      break;
    case SIM_PLAYING:
      out_ << "Pause playback before stepping back." << std::endl;
      break;
    case SIM_FINISHED:
      out_ << "Simulation finished." << std::endl;
      break;
    case SIM_HISTORY_EMPTY:
      out_ << "Nothing to step back to." << std::endl;
      break;
    case SIM_UNKNOWN_COMMAND:
      out_ << "Unknown command. Type help for a list of commands." << std::endl;
      break;
    case SIM_QUIT:
      out_ << "Bye." << std::endl;
      break;
    default:
      break;
  }
}

simerr_t CommandEngine::ExecuteInit(const std::string &args) {
#ifdef ENABLE_EXECUTE_DEBUG
  LOG(INFO) << "ExecuteInit" << std::endl;
#endif
  std::string frames_text = std::to_string(DEFAULT_FRAME_COUNT);
  std::string ref_text = DEFAULT_REFERENCE_STRING;
  if (!args.empty()) {
    size_t split = args.find_first_of(" \t");
    if (split == std::string::npos) {
      frames_text = args;
    } else {
      frames_text = args.substr(0, split);
      ref_text = args.substr(split + 1);
    }
  }
  simerr_t result = driver_.Initialize(frames_text, ref_text);
  if (result != SIM_SUCCESS) {
    return result;
  }
  PrintLogSince(0);
  out_ << driver_.Render();
  return SIM_SUCCESS;
}

simerr_t CommandEngine::ExecuteStep(const std::string &args) {
#ifdef ENABLE_EXECUTE_DEBUG
  LOG(INFO) << "ExecuteStep" << std::endl;
#endif
  uint32_t count;
  if (!ParseRepeat(args, &count)) {
    return SIM_INVALID_INPUT;
  }
  size_t log_index = driver_.GetLogSize();
  size_t log_end = log_index;
  simerr_t result = SIM_SUCCESS;
  for (uint32_t i = 0; i < count && result == SIM_SUCCESS; ++i) {
    log_end = driver_.GetLogSize();
    result = driver_.Step();
  }
  // the end of the run is reported by ExecuteInformation
  if (result == SIM_FINISHED) {
    PrintLogRange(log_index, log_end);
  } else {
    PrintLogSince(log_index);
  }
  if (result == SIM_SUCCESS) {
    out_ << driver_.GetStats() << std::endl;
  }
  return result;
}

simerr_t CommandEngine::ExecuteBack(const std::string &args) {
#ifdef ENABLE_EXECUTE_DEBUG
  LOG(INFO) << "ExecuteBack" << std::endl;
#endif
  uint32_t count;
  if (!ParseRepeat(args, &count)) {
    return SIM_INVALID_INPUT;
  }
  simerr_t result = SIM_SUCCESS;
  uint32_t undone = 0;
  for (uint32_t i = 0; i < count; ++i) {
    result = driver_.StepBack();
    if (result != SIM_SUCCESS) break;
    ++undone;
  }
  if (undone > 0) {
    out_ << "Stepped back " << undone << (undone == 1 ? " step." : " steps.") << std::endl;
    out_ << driver_.Render();
    // partial undo still counts as done
    return SIM_SUCCESS;
  }
  return result;
}

simerr_t CommandEngine::ExecutePlay(const std::string &args) {
#ifdef ENABLE_EXECUTE_DEBUG
  LOG(INFO) << "ExecutePlay" << std::endl;
#endif
  simerr_t result = driver_.TogglePlay();
  if (result == SIM_SUCCESS) {
    out_ << (driver_.IsPlaying() ? "Playing." : "Paused.") << std::endl;
  }
  return result;
}

simerr_t CommandEngine::ExecuteSpeed(const std::string &args) {
#ifdef ENABLE_EXECUTE_DEBUG
  LOG(INFO) << "ExecuteSpeed" << std::endl;
#endif
  int slider_value;
  try {
    size_t used = 0;
    slider_value = std::stoi(args, &used);
    if (used != args.size()) {
      return SIM_INVALID_INPUT;
    }
  } catch (const std::exception &ex) {
    return SIM_INVALID_INPUT;
  }
  simerr_t result = driver_.SetSpeed(slider_value);
  if (result == SIM_SUCCESS) {
    out_ << "Step interval set to " << driver_.GetInterval().count() << " ms." << std::endl;
  }
  return result;
}

simerr_t CommandEngine::ExecuteShow(const std::string &args) {
#ifdef ENABLE_EXECUTE_DEBUG
  LOG(INFO) << "ExecuteShow" << std::endl;
#endif
  if (!driver_.IsStarted()) {
    return SIM_NOT_STARTED;
  }
  out_ << driver_.Render();
  return SIM_SUCCESS;
}

simerr_t CommandEngine::ExecuteStats(const std::string &args) {
#ifdef ENABLE_EXECUTE_DEBUG
  LOG(INFO) << "ExecuteStats" << std::endl;
#endif
  if (!driver_.IsStarted()) {
    return SIM_NOT_STARTED;
  }
  out_ << driver_.GetStats() << std::endl;
  return SIM_SUCCESS;
}

simerr_t CommandEngine::ExecuteLog(const std::string &args) {
#ifdef ENABLE_EXECUTE_DEBUG
  LOG(INFO) << "ExecuteLog" << std::endl;
#endif
  out_ << driver_.GetLog();
  return SIM_SUCCESS;
}

simerr_t CommandEngine::ExecuteExecfile(const std::string &args) {
#ifdef ENABLE_EXECUTE_DEBUG
  LOG(INFO) << "ExecuteExecfile" << std::endl;
#endif
  if (args.empty()) {
    return SIM_INVALID_INPUT;
  }
  if (execfile_depth_ >= MAX_EXECFILE_DEPTH) {
    LOG(WARNING) << "execfile nested deeper than " << MAX_EXECFILE_DEPTH << " levels, skipping " << args;
    return SIM_FAILED;
  }
  std::ifstream file(args);
  if (!file.is_open()) {
    LOG(WARNING) << "Cannot open command file " << args;
    return SIM_FAILED;
  }
  ++execfile_depth_;
  simerr_t status = SIM_SUCCESS;
  std::string line;
  while (std::getline(file, line)) {
    simerr_t result = Execute(line);
    if (result == SIM_QUIT) {
      status = SIM_QUIT;
      break;
    }
    ExecuteInformation(result);
  }
  --execfile_depth_;
  return status;
}

simerr_t CommandEngine::ExecuteHelp(const std::string &args) {
  out_ << "init [frames] [ref,string]  start or reset a simulation" << std::endl
       << "step [n]                    advance n micro-steps" << std::endl
       << "back [n]                    undo n micro-steps" << std::endl
       << "play                        toggle automatic play" << std::endl
       << "speed <" << MIN_SPEED_SLIDER << "-" << MAX_SPEED_SLIDER << ">             set play speed" << std::endl
       << "show                        draw the frames" << std::endl
       << "stats                       print hits, faults and hit ratio" << std::endl
       << "log                         print the execution log" << std::endl
       << "execfile <path>             run commands from a file" << std::endl
       << "quit                        leave" << std::endl;
  return SIM_SUCCESS;
}

simerr_t CommandEngine::ExecuteQuit(const std::string &args) {
#ifdef ENABLE_EXECUTE_DEBUG
  LOG(INFO) << "ExecuteQuit" << std::endl;
#endif
  return SIM_QUIT;
}

void CommandEngine::PrintLogSince(size_t index) {
  for (const auto &entry : driver_.GetLogEntriesSince(index)) {
    out_ << entry.message_ << std::endl;
  }
}

void CommandEngine::PrintLogRange(size_t begin, size_t end) {
  auto entries = driver_.GetLogEntriesSince(begin);
  for (size_t i = 0; i < entries.size() && begin + i < end; ++i) {
    out_ << entries[i].message_ << std::endl;
  }
}
