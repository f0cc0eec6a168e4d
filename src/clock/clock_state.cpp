#include "clock/clock_state.h"

#include "common/macros.h"

const char *MicroStateToString(MicroState state) {
  switch (state) {
    case MicroState::kStart:
      return "START";
    case MicroState::kCheckHit:
      return "CHECK_HIT";
    case MicroState::kHit:
      return "HIT";
    case MicroState::kFaultStartSearch:
      return "FAULT_START_SEARCH";
    case MicroState::kFaultCheckBit:
      return "FAULT_CHECK_BIT";
    case MicroState::kFaultSetBitZero:
      return "FAULT_SET_BIT_ZERO";
    case MicroState::kFaultReplace:
      return "FAULT_REPLACE";
    case MicroState::kDone:
      return "DONE";
  }
  UNREACHABLE("Unknown micro state.");
}

const char *MessageTypeToString(MessageType type) {
  switch (type) {
    case MessageType::kInfo:
      return "info";
    case MessageType::kHit:
      return "hit";
    case MessageType::kFault:
      return "fault";
    case MessageType::kCheck:
      return "check";
  }
  UNREACHABLE("Unknown message type.");
}

const char *HighlightColorToString(HighlightColor color) {
  switch (color) {
    case HighlightColor::kNone:
      return "none";
    case HighlightColor::kGreen:
      return "green";
    case HighlightColor::kOrange:
      return "orange";
    case HighlightColor::kRed:
      return "red";
  }
  UNREACHABLE("Unknown highlight color.");
}
