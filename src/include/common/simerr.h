#ifndef CLOCKSIM_SIMERR_H
#define CLOCKSIM_SIMERR_H

enum simerr_t {
  SIM_SUCCESS = 0,
  SIM_FAILED,
  SIM_INVALID_INPUT,
  SIM_NOT_STARTED,
  SIM_PLAYING,
  SIM_FINISHED,
  SIM_HISTORY_EMPTY,
  SIM_UNKNOWN_COMMAND,
  SIM_QUIT
};

#endif  // CLOCKSIM_SIMERR_H
