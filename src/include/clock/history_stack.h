#ifndef CLOCKSIM_HISTORY_STACK_H
#define CLOCKSIM_HISTORY_STACK_H

#include <vector>

#include "clock/clock_state.h"

class ClockStateMachine;

/**
 * HistoryStack keeps one snapshot per forward micro-step for linear undo.
 *
 * The caller pushes the machine's snapshot right before each Step(). There
 * is no redo: stepping forward after an undo simply pushes a new snapshot.
 */
class HistoryStack {
 public:
  HistoryStack() = default;

  ~HistoryStack() = default;

  void Push(ClockState state);

  /**
   * Remove the most recent snapshot.
   * @return false if there is nothing to pop
   */
  bool Pop(ClockState *state);

  /**
   * Pop the most recent snapshot and restore it into the machine in place.
   * @return false (and leave the machine untouched) when the stack is empty
   */
  bool Undo(ClockStateMachine *machine);

  /**
   * Push the machine's current state, then step it forward once.
   */
  void RecordStep(ClockStateMachine *machine);

  void Clear() { snapshots_.clear(); }

  size_t Size() const { return snapshots_.size(); }

  bool Empty() const { return snapshots_.empty(); }

 private:
  std::vector<ClockState> snapshots_{};
};

#endif  // CLOCKSIM_HISTORY_STACK_H
