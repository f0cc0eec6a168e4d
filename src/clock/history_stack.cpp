#include "clock/history_stack.h"

#include <utility>

#include "clock/clock_state_machine.h"

void HistoryStack::Push(ClockState state) { snapshots_.push_back(std::move(state)); }

bool HistoryStack::Pop(ClockState *state) {
  if (snapshots_.empty()) {
    return false;
  }
  *state = std::move(snapshots_.back());
  snapshots_.pop_back();
  return true;
}

bool HistoryStack::Undo(ClockStateMachine *machine) {
  if (snapshots_.empty()) {
    return false;
  }
  machine->Restore(snapshots_.back());
  snapshots_.pop_back();
  return true;
}

void HistoryStack::RecordStep(ClockStateMachine *machine) {
  Push(machine->Snapshot());
  machine->Step();
}
