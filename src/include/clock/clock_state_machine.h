#ifndef CLOCKSIM_CLOCK_STATE_MACHINE_H
#define CLOCKSIM_CLOCK_STATE_MACHINE_H

#include <string>
#include <vector>

#include "clock/clock_state.h"
#include "clock/frame_table.h"
#include "common/config.h"

/**
 * ClockStateMachine runs the Clock (second chance) replacement algorithm
 * over a fixed reference string, one observable micro-step per Step() call.
 *
 * Inputs are validated by ReferenceParser before construction. The machine
 * keeps no history; Snapshot() and Restore() let a HistoryStack rewind it.
 */
class ClockStateMachine {
 public:
  ClockStateMachine(uint32_t num_frames, std::vector<page_id_t> ref_string);

  ~ClockStateMachine() = default;

  /**
   * Advance exactly one micro-state transition. A call after DONE only
   * re-emits the completion message.
   */
  void Step();

  ClockState Snapshot() const { return state_; }

  /**
   * Overwrite every mutable field with a snapshot taken from this machine.
   */
  void Restore(const ClockState &state);

  bool IsDone() const { return state_.state_ == MicroState::kDone; }

  uint32_t GetFrameCount() const { return num_frames_; }

  const FrameTable &GetFrameTable() const { return state_.frame_table_; }

  frame_id_t GetPointer() const { return state_.pointer_; }

  const std::vector<page_id_t> &GetRefString() const { return ref_string_; }

  uint32_t GetRefIndex() const { return state_.ref_index_; }

  bool HasCurrentPage() const { return !state_.current_page_.empty(); }

  const page_id_t &GetCurrentPage() const { return state_.current_page_; }

  MicroState GetState() const { return state_.state_; }

  const std::string &GetMessage() const { return state_.message_; }

  MessageType GetMessageType() const { return state_.message_type_; }

  frame_id_t GetHighlightFrame() const { return state_.highlight_frame_; }

  HighlightColor GetHighlightColor() const { return state_.highlight_color_; }

  uint32_t GetHits() const { return state_.hits_; }

  uint32_t GetFaults() const { return state_.faults_; }

  double GetHitRatio() const;

 private:
  void StepStart();
  void StepCheckHit();
  void StepHit();
  void StepFaultStartSearch();
  void StepFaultCheckBit();
  void StepFaultSetBitZero();
  void StepFaultReplace();
  void StepDone();

  void Emit(std::string message, MessageType type);

  void AdvancePointer() { state_.pointer_ = (state_.pointer_ + 1) % static_cast<frame_id_t>(num_frames_); }

  const uint32_t num_frames_;
  const std::vector<page_id_t> ref_string_;
  ClockState state_;
};

#endif  // CLOCKSIM_CLOCK_STATE_MACHINE_H
