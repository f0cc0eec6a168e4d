#include "driver/execution_log.h"

#include <cctype>
#include <sstream>

#include "glog/logging.h"

void ExecutionLog::Append(const std::string &message, MessageType type) {
  if (message.empty()) {
    return;
  }
  VLOG(1) << "[" << MessageTypeToString(type) << "] " << message;
  entries_.push_back({message, type});
}

std::string ExecutionLog::ToString() const {
  std::stringstream ss;
  for (const auto &entry : entries_) {
    std::string tag = MessageTypeToString(entry.type_);
    for (auto &ch : tag) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    ss << "[" << tag << "] " << entry.message_ << std::endl;
  }
  return ss.str();
}
