#include "clock/clock_state_machine.h"

#include <sstream>
#include <utility>

#include "common/macros.h"

ClockStateMachine::ClockStateMachine(uint32_t num_frames, std::vector<page_id_t> ref_string)
    : num_frames_(num_frames), ref_string_(std::move(ref_string)), state_(num_frames) {
  ASSERT(num_frames_ >= 1, "Clock needs at least one frame.");
  ASSERT(!ref_string_.empty(), "Reference string is empty.");
  state_.message_ = "Simulation initialized.";
}

void ClockStateMachine::Step() {
  switch (state_.state_) {
    case MicroState::kStart:
      StepStart();
      break;
    case MicroState::kCheckHit:
      StepCheckHit();
      break;
    case MicroState::kHit:
      StepHit();
      break;
    case MicroState::kFaultStartSearch:
      StepFaultStartSearch();
      break;
    case MicroState::kFaultCheckBit:
      StepFaultCheckBit();
      break;
    case MicroState::kFaultSetBitZero:
      StepFaultSetBitZero();
      break;
    case MicroState::kFaultReplace:
      StepFaultReplace();
      break;
    case MicroState::kDone:
      StepDone();
      break;
  }
}

void ClockStateMachine::Restore(const ClockState &state) {
  ASSERT(state.frame_table_.Size() == num_frames_, "Snapshot belongs to another simulation.");
  state_ = state;
}

double ClockStateMachine::GetHitRatio() const {
  uint32_t total = state_.hits_ + state_.faults_;
  if (total == 0) {
    return 0.0;
  }
  return static_cast<double>(state_.hits_) / total;
}

void ClockStateMachine::StepStart() {
  if (state_.ref_index_ >= ref_string_.size()) {
    state_.state_ = MicroState::kDone;
    state_.current_page_.clear();
    state_.highlight_frame_ = INVALID_FRAME_ID;
    Emit("Reference string finished.", MessageType::kInfo);
    return;
  }
  state_.current_page_ = ref_string_[state_.ref_index_];
  state_.state_ = MicroState::kCheckHit;
  Emit("Accessing page " + state_.current_page_ + "...", MessageType::kInfo);
}

void ClockStateMachine::StepCheckHit() {
  frame_id_t frame_id;
  if (state_.frame_table_.FindPage(state_.current_page_, &frame_id)) {
    state_.hits_++;
    state_.frame_table_.SetUseBit(frame_id, 1);
    state_.highlight_frame_ = frame_id;
    state_.highlight_color_ = HighlightColor::kGreen;
    state_.state_ = MicroState::kHit;
    Emit("Page " + state_.current_page_ + " is a HIT. Setting use bit to 1.", MessageType::kHit);
  } else {
    state_.faults_++;
    state_.highlight_frame_ = INVALID_FRAME_ID;
    state_.state_ = MicroState::kFaultStartSearch;
    Emit("Page " + state_.current_page_ + " is a FAULT. Searching for victim...", MessageType::kFault);
  }
}

// pause after a hit, the hit message stays on display
void ClockStateMachine::StepHit() {
  state_.ref_index_++;
  state_.state_ = MicroState::kStart;
}

void ClockStateMachine::StepFaultStartSearch() {
  const FrameTable &table = state_.frame_table_;
  std::stringstream ss;
  ss << "Clock hand at frame " << state_.pointer_ << " (";
  if (table.IsEmpty(state_.pointer_)) {
    ss << "empty";
  } else {
    ss << "Page " << table.GetPage(state_.pointer_);
  }
  ss << ").";
  state_.highlight_frame_ = state_.pointer_;
  state_.highlight_color_ = HighlightColor::kOrange;
  state_.state_ = MicroState::kFaultCheckBit;
  Emit(ss.str(), MessageType::kCheck);
}

void ClockStateMachine::StepFaultCheckBit() {
  uint8_t use_bit = state_.frame_table_.GetUseBit(state_.pointer_);
  std::stringstream ss;
  ss << "Checking frame " << state_.pointer_ << ". Use bit is " << static_cast<int>(use_bit) << ".";
  state_.highlight_frame_ = state_.pointer_;
  state_.state_ = use_bit == 1 ? MicroState::kFaultSetBitZero : MicroState::kFaultReplace;
  Emit(ss.str(), MessageType::kCheck);
}

void ClockStateMachine::StepFaultSetBitZero() {
  state_.frame_table_.SetUseBit(state_.pointer_, 0);
  std::stringstream ss;
  ss << "Set bit to 0 for frame " << state_.pointer_ << ". Advancing pointer.";
  state_.highlight_color_ = HighlightColor::kOrange;
  AdvancePointer();
  state_.state_ = MicroState::kFaultCheckBit;
  Emit(ss.str(), MessageType::kCheck);
}

void ClockStateMachine::StepFaultReplace() {
  frame_id_t frame_id = state_.pointer_;
  page_id_t victim = state_.frame_table_.Install(frame_id, state_.current_page_);
  std::stringstream ss;
  if (victim.empty()) {
    ss << "Loading Page " << state_.current_page_ << " into empty frame " << frame_id << ". Setting bit to 1.";
  } else {
    ss << "Replacing Page " << victim << " at frame " << frame_id << " with Page " << state_.current_page_
       << ". Setting bit to 1.";
  }
  state_.highlight_frame_ = frame_id;
  state_.highlight_color_ = HighlightColor::kRed;
  AdvancePointer();
  state_.ref_index_++;
  state_.state_ = MicroState::kStart;
  Emit(ss.str(), MessageType::kFault);
}

void ClockStateMachine::StepDone() { Emit("Simulation complete.", MessageType::kInfo); }

void ClockStateMachine::Emit(std::string message, MessageType type) {
  state_.message_ = std::move(message);
  state_.message_type_ = type;
}
