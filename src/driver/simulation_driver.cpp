#include "driver/simulation_driver.h"

#include <cstddef>
#include <utility>
#include <vector>

#include "glog/logging.h"
#include "parser/reference_parser.h"

SimulationDriver::SimulationDriver() : timer_([this] { return Tick(); }) {}

SimulationDriver::~SimulationDriver() {
  {
    std::lock_guard<std::mutex> lock(latch_);
    playing_ = false;
  }
  timer_.Stop();
}

simerr_t SimulationDriver::Initialize(const std::string &frames_text, const std::string &ref_text) {
  {
    std::lock_guard<std::mutex> lock(latch_);
    playing_ = false;
  }
  timer_.Stop();

  std::lock_guard<std::mutex> lock(latch_);
  uint32_t num_frames = 0;
  std::vector<page_id_t> pages;
  if (ReferenceParser::ParseFrameCount(frames_text, &num_frames) != SIM_SUCCESS ||
      ReferenceParser::ParseReferenceString(ref_text, &pages) != SIM_SUCCESS) {
    LOG(WARNING) << "Rejected simulation input, frames: \"" << frames_text << "\", references: \"" << ref_text
                 << "\"";
    log_.Append("Error: Invalid input. Check frames or reference string.", MessageType::kFault);
    return SIM_INVALID_INPUT;
  }

  machine_ = std::make_unique<ClockStateMachine>(num_frames, std::move(pages));
  history_.Clear();
  log_.Clear();
  finished_ = false;
  log_.Append("Simulation initialized. Ready to start.", MessageType::kInfo);
  LOG(INFO) << "Simulation initialized with " << num_frames << " frames and " << machine_->GetRefString().size()
            << " references.";
  return SIM_SUCCESS;
}

simerr_t SimulationDriver::Step() {
  std::lock_guard<std::mutex> lock(latch_);
  return StepLocked();
}

simerr_t SimulationDriver::StepLocked() {
  if (machine_ == nullptr) {
    return SIM_NOT_STARTED;
  }
  if (machine_->IsDone()) {
    if (!finished_) {
      log_.Append("Simulation finished.", MessageType::kInfo);
      LOG(INFO) << "Simulation finished. Hits: " << machine_->GetHits() << ", faults: " << machine_->GetFaults();
    }
    finished_ = true;
    playing_ = false;
    return SIM_FINISHED;
  }
  // leaving HIT emits nothing new
  bool pass_through = machine_->GetState() == MicroState::kHit;
  history_.RecordStep(machine_.get());
  if (!pass_through) {
    log_.Append(machine_->GetMessage(), machine_->GetMessageType());
  }
  return SIM_SUCCESS;
}

simerr_t SimulationDriver::StepBack() {
  std::lock_guard<std::mutex> lock(latch_);
  if (machine_ == nullptr) {
    return SIM_NOT_STARTED;
  }
  if (playing_) {
    return SIM_PLAYING;
  }
  if (!history_.Undo(machine_.get())) {
    return SIM_HISTORY_EMPTY;
  }
  finished_ = false;
  log_.Append("Stepped back one step.", MessageType::kInfo);
  return SIM_SUCCESS;
}

simerr_t SimulationDriver::TogglePlay() {
  bool start = false;
  std::chrono::milliseconds interval{0};
  {
    std::lock_guard<std::mutex> lock(latch_);
    if (machine_ == nullptr) {
      return SIM_NOT_STARTED;
    }
    if (!playing_ && machine_->IsDone()) {
      return SIM_FINISHED;
    }
    playing_ = !playing_;
    if (playing_) {
      // one step right away, the timer takes over from there
      StepLocked();
    }
    start = playing_;
    interval = interval_;
  }
  if (start) {
    timer_.Start(interval);
  } else {
    timer_.Stop();
  }
  return SIM_SUCCESS;
}

simerr_t SimulationDriver::SetSpeed(int slider_value) {
  if (slider_value < MIN_SPEED_SLIDER || slider_value > MAX_SPEED_SLIDER) {
    return SIM_INVALID_INPUT;
  }
  bool restart = false;
  std::chrono::milliseconds interval{0};
  {
    std::lock_guard<std::mutex> lock(latch_);
    interval_ = std::chrono::milliseconds(SPEED_SLIDER_BASE - slider_value);
    restart = playing_;
    interval = interval_;
  }
  if (restart) {
    timer_.Start(interval);
  }
  return SIM_SUCCESS;
}

bool SimulationDriver::Tick() {
  std::lock_guard<std::mutex> lock(latch_);
  if (!playing_) {
    return false;
  }
  StepLocked();
  return playing_;
}

bool SimulationDriver::IsStarted() {
  std::lock_guard<std::mutex> lock(latch_);
  return machine_ != nullptr;
}

bool SimulationDriver::IsPlaying() {
  std::lock_guard<std::mutex> lock(latch_);
  return playing_;
}

bool SimulationDriver::CanStep() {
  std::lock_guard<std::mutex> lock(latch_);
  return machine_ != nullptr && !finished_;
}

bool SimulationDriver::CanPlay() {
  std::lock_guard<std::mutex> lock(latch_);
  return machine_ != nullptr && !finished_;
}

bool SimulationDriver::CanStepBack() {
  std::lock_guard<std::mutex> lock(latch_);
  return machine_ != nullptr && !playing_ && !history_.Empty();
}

size_t SimulationDriver::GetHistoryDepth() {
  std::lock_guard<std::mutex> lock(latch_);
  return history_.Size();
}

std::chrono::milliseconds SimulationDriver::GetInterval() {
  std::lock_guard<std::mutex> lock(latch_);
  return interval_;
}

std::string SimulationDriver::Render() {
  std::lock_guard<std::mutex> lock(latch_);
  if (machine_ == nullptr) {
    return "No simulation initialized.\n";
  }
  return renderer_.Draw(*machine_);
}

std::string SimulationDriver::GetStats() {
  std::lock_guard<std::mutex> lock(latch_);
  if (machine_ == nullptr) {
    return "No simulation initialized.";
  }
  return FrameRenderer::FormatStats(*machine_);
}

std::string SimulationDriver::GetLog() {
  std::lock_guard<std::mutex> lock(latch_);
  return log_.ToString();
}

std::vector<LogEntry> SimulationDriver::GetLogEntriesSince(size_t index) {
  std::lock_guard<std::mutex> lock(latch_);
  const auto &entries = log_.Entries();
  if (index >= entries.size()) {
    return {};
  }
  return std::vector<LogEntry>(entries.begin() + static_cast<std::ptrdiff_t>(index), entries.end());
}

size_t SimulationDriver::GetLogSize() {
  std::lock_guard<std::mutex> lock(latch_);
  return log_.Size();
}

simerr_t SimulationDriver::GetSnapshot(ClockState *state) {
  std::lock_guard<std::mutex> lock(latch_);
  if (machine_ == nullptr) {
    return SIM_NOT_STARTED;
  }
  *state = machine_->Snapshot();
  return SIM_SUCCESS;
}
