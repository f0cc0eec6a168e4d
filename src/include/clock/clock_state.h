#ifndef CLOCKSIM_CLOCK_STATE_H
#define CLOCKSIM_CLOCK_STATE_H

#include <cstdint>
#include <string>

#include "clock/frame_table.h"
#include "common/config.h"

/**
 * Where the machine is within processing the current reference.
 *
 *   START -> CHECK_HIT -> HIT -> START
 *                |
 *                v
 *   FAULT_START_SEARCH -> FAULT_CHECK_BIT <-> FAULT_SET_BIT_ZERO
 *                               |
 *                               v
 *                         FAULT_REPLACE -> START
 *
 *   START (stream exhausted) -> DONE
 */
enum class MicroState {
  kStart,
  kCheckHit,
  kHit,
  kFaultStartSearch,
  kFaultCheckBit,
  kFaultSetBitZero,
  kFaultReplace,
  kDone,
};

enum class MessageType {
  kInfo,
  kHit,
  kFault,
  kCheck,
};

enum class HighlightColor {
  kNone,
  kGreen,
  kOrange,
  kRed,
};

const char *MicroStateToString(MicroState state);

const char *MessageTypeToString(MessageType type);

const char *HighlightColorToString(HighlightColor color);

/**
 * Every mutable field of a ClockStateMachine as a plain value.
 *
 * Copies share nothing with the machine they were taken from, so a copy is
 * a complete history snapshot.
 */
struct ClockState {
  explicit ClockState(size_t num_frames) : frame_table_(num_frames) {}

  FrameTable frame_table_;
  frame_id_t pointer_{0};
  uint32_t ref_index_{0};
  page_id_t current_page_{};  // empty when no reference is being processed
  MicroState state_{MicroState::kStart};

  uint32_t hits_{0};
  uint32_t faults_{0};

  // output of the last micro-step
  std::string message_{};
  MessageType message_type_{MessageType::kInfo};
  frame_id_t highlight_frame_{INVALID_FRAME_ID};
  HighlightColor highlight_color_{HighlightColor::kNone};

  bool operator==(const ClockState &other) const {
    return frame_table_ == other.frame_table_ && pointer_ == other.pointer_ && ref_index_ == other.ref_index_ &&
           current_page_ == other.current_page_ && state_ == other.state_ && hits_ == other.hits_ &&
           faults_ == other.faults_ && message_ == other.message_ && message_type_ == other.message_type_ &&
           highlight_frame_ == other.highlight_frame_ && highlight_color_ == other.highlight_color_;
  }

  bool operator!=(const ClockState &other) const { return !(*this == other); }
};

#endif  // CLOCKSIM_CLOCK_STATE_H
