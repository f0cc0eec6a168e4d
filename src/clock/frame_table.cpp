#include "clock/frame_table.h"

#include <utility>

#include "common/macros.h"

FrameTable::FrameTable(size_t num_frames) {
  ASSERT(num_frames > 0, "Frame table needs at least one frame.");
  frames_.resize(num_frames);
  use_bits_.resize(num_frames);
  for (size_t i = 0; i < num_frames; ++i) {
    use_bits_[i] = 0;
  }
}

bool FrameTable::IsEmpty(frame_id_t frame_id) const {
  ASSERT(IsValid(frame_id), "Invalid frame id.");
  return frames_[frame_id].empty();
}

const page_id_t &FrameTable::GetPage(frame_id_t frame_id) const {
  ASSERT(IsValid(frame_id), "Invalid frame id.");
  return frames_[frame_id];
}

uint8_t FrameTable::GetUseBit(frame_id_t frame_id) const {
  ASSERT(IsValid(frame_id), "Invalid frame id.");
  // an empty frame never counts as recently used
  if (frames_[frame_id].empty()) {
    return 0;
  }
  return use_bits_[frame_id];
}

void FrameTable::SetUseBit(frame_id_t frame_id, uint8_t use_bit) {
  ASSERT(IsValid(frame_id), "Invalid frame id.");
  use_bits_[frame_id] = use_bit ? 1 : 0;
}

bool FrameTable::FindPage(const page_id_t &page, frame_id_t *frame_id) const {
  for (size_t i = 0; i < frames_.size(); ++i) {
    if (!frames_[i].empty() && frames_[i] == page) {
      *frame_id = static_cast<frame_id_t>(i);
      return true;
    }
  }
  *frame_id = INVALID_FRAME_ID;
  return false;
}

page_id_t FrameTable::Install(frame_id_t frame_id, page_id_t page) {
  ASSERT(IsValid(frame_id), "Invalid frame id.");
  ASSERT(!page.empty(), "Cannot install an empty page id.");
  page_id_t victim = std::move(frames_[frame_id]);
  frames_[frame_id] = std::move(page);
  use_bits_[frame_id] = 1;
  return victim;
}

size_t FrameTable::GetOccupiedCount() const {
  size_t count = 0;
  for (const auto &page : frames_) {
    if (!page.empty()) ++count;
  }
  return count;
}
