#ifndef CLOCKSIM_FRAME_TABLE_H
#define CLOCKSIM_FRAME_TABLE_H

#include <cstdint>
#include <vector>

#include "common/config.h"

/**
 * FrameTable holds the physical frames of the simulation and their use bits.
 *
 * A slot index is the identity of a physical frame, so the table never
 * grows, shrinks or reorders. An empty slot holds the empty page id and
 * always keeps use bit 0.
 */
class FrameTable {
 public:
  explicit FrameTable(size_t num_frames);

  ~FrameTable() = default;

  size_t Size() const { return frames_.size(); }

  bool IsEmpty(frame_id_t frame_id) const;

  const page_id_t &GetPage(frame_id_t frame_id) const;

  uint8_t GetUseBit(frame_id_t frame_id) const;

  void SetUseBit(frame_id_t frame_id, uint8_t use_bit);

  /**
   * Look up the frame currently holding the page.
   * @return false if the page is not resident, frame_id is set to INVALID_FRAME_ID
   */
  bool FindPage(const page_id_t &page, frame_id_t *frame_id) const;

  /**
   * Put page into the frame, use bit set to 1.
   * @return the evicted occupant, empty if the frame was free
   */
  page_id_t Install(frame_id_t frame_id, page_id_t page);

  size_t GetOccupiedCount() const;

  const std::vector<page_id_t> &GetFrames() const { return frames_; }

  const std::vector<uint8_t> &GetUseBits() const { return use_bits_; }

  bool operator==(const FrameTable &other) const {
    return frames_ == other.frames_ && use_bits_ == other.use_bits_;
  }

  bool operator!=(const FrameTable &other) const { return !(*this == other); }

 private:
  bool IsValid(frame_id_t frame_id) const { return frame_id >= 0 && static_cast<size_t>(frame_id) < frames_.size(); }

  std::vector<page_id_t> frames_;
  std::vector<uint8_t> use_bits_;
};

#endif  // CLOCKSIM_FRAME_TABLE_H
