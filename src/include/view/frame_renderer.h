#ifndef CLOCKSIM_FRAME_RENDERER_H
#define CLOCKSIM_FRAME_RENDERER_H

#include <string>

class ClockStateMachine;

/**
 * Text view of a ClockStateMachine: one table row per frame with its page,
 * use bit, the clock hand and the current highlight, followed by the
 * micro-state and the statistics. Reads state only.
 */
class FrameRenderer {
 public:
  std::string Draw(const ClockStateMachine &machine) const;

  /**
   * "Current page: P | Hits: h | Faults: f | Hit ratio: r%"
   */
  static std::string FormatStats(const ClockStateMachine &machine);

  /**
   * Ratio in [0, 1] as a percentage with two decimals, e.g. "42.86%".
   */
  static std::string FormatHitRatio(double ratio);
};

#endif  // CLOCKSIM_FRAME_RENDERER_H
