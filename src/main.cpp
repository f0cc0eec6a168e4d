#include <iostream>
#include <string>

#include "glog/logging.h"
#include "shell/command_engine.h"

void InitGoogleLog(char *argv) {
  FLAGS_logtostderr = true;
  FLAGS_colorlogtostderr = true;
  google::InitGoogleLogging(argv);
}

bool InputCommand(std::string *input) {
  std::cout << "clocksim > " << std::flush;
  return static_cast<bool>(std::getline(std::cin, *input));
}

int main(int argc, char **argv) {
  InitGoogleLog(argv[0]);
  CommandEngine engine;
  std::string cmd;

  // a command file given on the command line runs before the prompt
  if (argc > 1) {
    auto result = engine.Execute(std::string("execfile ") + argv[1]);
    engine.ExecuteInformation(result);
    if (result == SIM_QUIT) {
      return 0;
    }
  }

  while (InputCommand(&cmd)) {
    auto result = engine.Execute(cmd);
    engine.ExecuteInformation(result);
    if (result == SIM_QUIT) {
      break;
    }
  }
  return 0;
}
