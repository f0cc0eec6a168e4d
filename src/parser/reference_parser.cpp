#include "parser/reference_parser.h"

#include <cctype>
#include <sstream>
#include <utility>

simerr_t ReferenceParser::ParseFrameCount(const std::string &text, uint32_t *num_frames) {
  std::string digits = Trim(text);
  if (digits.empty() || digits.size() > 9) {
    return SIM_INVALID_INPUT;
  }
  uint32_t value = 0;
  for (char ch : digits) {
    if (!std::isdigit(static_cast<unsigned char>(ch))) {
      return SIM_INVALID_INPUT;
    }
    value = value * 10 + static_cast<uint32_t>(ch - '0');
  }
  if (value < 1 || value > MAX_FRAME_COUNT) {
    return SIM_INVALID_INPUT;
  }
  *num_frames = value;
  return SIM_SUCCESS;
}

simerr_t ReferenceParser::ParseReferenceString(const std::string &text, std::vector<page_id_t> *pages) {
  std::vector<page_id_t> result;
  std::stringstream ss(text);
  std::string token;
  while (std::getline(ss, token, ',')) {
    token = Trim(token);
    if (!token.empty()) {
      result.push_back(std::move(token));
    }
  }
  if (result.empty()) {
    return SIM_INVALID_INPUT;
  }
  *pages = std::move(result);
  return SIM_SUCCESS;
}

std::string ReferenceParser::Trim(const std::string &text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(begin, end - begin);
}
