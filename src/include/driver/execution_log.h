#ifndef CLOCKSIM_EXECUTION_LOG_H
#define CLOCKSIM_EXECUTION_LOG_H

#include <string>
#include <vector>

#include "clock/clock_state.h"

struct LogEntry {
  std::string message_;
  MessageType type_;
};

/**
 * Accumulates the per-step messages of one simulation run.
 */
class ExecutionLog {
 public:
  /**
   * Append an entry. Empty messages are ignored.
   */
  void Append(const std::string &message, MessageType type = MessageType::kInfo);

  void Clear() { entries_.clear(); }

  const std::vector<LogEntry> &Entries() const { return entries_; }

  size_t Size() const { return entries_.size(); }

  std::string ToString() const;

 private:
  std::vector<LogEntry> entries_{};
};

#endif  // CLOCKSIM_EXECUTION_LOG_H
