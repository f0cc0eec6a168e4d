#include "view/frame_renderer.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "clock/clock_state_machine.h"

namespace {

void Divider(std::stringstream &ss, int frame_width, int page_width) {
  ss << "+" << std::setfill('-') << std::setw(frame_width + 2) << "" << "+" << std::setw(page_width + 2) << ""
     << "+" << std::setw(5) << "" << "+" << std::setfill(' ') << std::endl;
}

}  // namespace

std::string FrameRenderer::Draw(const ClockStateMachine &machine) const {
  const FrameTable &table = machine.GetFrameTable();
  const int frame_width = 5;
  int page_width = 4;
  for (const auto &page : table.GetFrames()) {
    page_width = std::max(page_width, static_cast<int>(page.size()));
  }

  std::stringstream ss;
  ss << "Physical Memory Frames (Clock)" << std::endl;
  Divider(ss, frame_width, page_width);
  ss << "| " << std::left << std::setw(frame_width) << "Frame" << " | " << std::setw(page_width) << "Page"
     << " | Use |" << std::endl;
  Divider(ss, frame_width, page_width);
  for (size_t i = 0; i < table.Size(); ++i) {
    auto frame_id = static_cast<frame_id_t>(i);
    const std::string page = table.IsEmpty(frame_id) ? "-" : table.GetPage(frame_id);
    ss << "| " << std::left << std::setw(frame_width) << i << " | " << std::setw(page_width) << page << " | "
       << std::setw(3) << static_cast<int>(table.GetUseBit(frame_id)) << " |";
    if (machine.GetPointer() == frame_id) {
      ss << " <- hand";
    }
    if (machine.GetHighlightFrame() == frame_id && machine.GetHighlightColor() != HighlightColor::kNone) {
      ss << " [" << HighlightColorToString(machine.GetHighlightColor()) << "]";
    }
    ss << std::endl;
  }
  Divider(ss, frame_width, page_width);
  ss << "State: " << MicroStateToString(machine.GetState()) << " | Reference " << machine.GetRefIndex() << "/"
     << machine.GetRefString().size() << std::endl;
  ss << FormatStats(machine) << std::endl;
  return ss.str();
}

std::string FrameRenderer::FormatStats(const ClockStateMachine &machine) {
  std::stringstream ss;
  ss << "Current page: " << (machine.HasCurrentPage() ? machine.GetCurrentPage() : "N/A")
     << " | Hits: " << machine.GetHits() << " | Faults: " << machine.GetFaults()
     << " | Hit ratio: " << FormatHitRatio(machine.GetHitRatio());
  return ss.str();
}

std::string FrameRenderer::FormatHitRatio(double ratio) {
  std::stringstream ss;
  ss << std::fixed << std::setprecision(2) << ratio * 100 << "%";
  return ss.str();
}
