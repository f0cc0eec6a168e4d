#ifndef CLOCKSIM_SIMULATION_DRIVER_H
#define CLOCKSIM_SIMULATION_DRIVER_H

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "clock/clock_state_machine.h"
#include "clock/history_stack.h"
#include "common/config.h"
#include "common/macros.h"
#include "common/simerr.h"
#include "driver/execution_log.h"
#include "driver/play_timer.h"
#include "view/frame_renderer.h"

/**
 * SimulationDriver owns one simulation session: the state machine, its undo
 * history, the execution log and the auto-play timer.
 *
 * Every public method may be called from the shell thread while the timer
 * thread is ticking; latch_ serializes all access to the machine and the
 * history.
 */
class SimulationDriver {
 public:
  SimulationDriver();

  ~SimulationDriver();

  DISALLOW_COPY_AND_MOVE(SimulationDriver);

  /**
   * Start a new run, discarding the previous machine, history and log.
   * Rejected input leaves the previous run in place.
   */
  simerr_t Initialize(const std::string &frames_text, const std::string &ref_text);

  /**
   * Snapshot, then advance the machine one micro-step.
   */
  simerr_t Step();

  /**
   * Undo the last forward step. Not allowed while playing.
   */
  simerr_t StepBack();

  simerr_t TogglePlay();

  /**
   * Slider value in [MIN_SPEED_SLIDER, MAX_SPEED_SLIDER]; a higher value
   * plays faster.
   */
  simerr_t SetSpeed(int slider_value);

  /**
   * Timer callback. Steps once while playing.
   * @return false once playback has stopped
   */
  bool Tick();

  bool IsStarted();

  bool IsPlaying();

  bool CanStep();

  bool CanPlay();

  bool CanStepBack();

  size_t GetHistoryDepth();

  std::chrono::milliseconds GetInterval();

  std::string Render();

  std::string GetStats();

  std::string GetLog();

  simerr_t GetSnapshot(ClockState *state);

  /**
   * Copy of the log entries from index onwards.
   */
  std::vector<LogEntry> GetLogEntriesSince(size_t index);

  size_t GetLogSize();

 private:
  simerr_t StepLocked();

  std::mutex latch_;
  std::unique_ptr<ClockStateMachine> machine_{nullptr};
  HistoryStack history_{};
  ExecutionLog log_{};
  FrameRenderer renderer_{};
  bool playing_{false};
  bool finished_{false};
  std::chrono::milliseconds interval_{DEFAULT_PLAY_INTERVAL};
  PlayTimer timer_;
};

#endif  // CLOCKSIM_SIMULATION_DRIVER_H
