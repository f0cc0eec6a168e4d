#ifndef CLOCKSIM_REFERENCE_PARSER_H
#define CLOCKSIM_REFERENCE_PARSER_H

#include <string>
#include <vector>

#include "common/config.h"
#include "common/simerr.h"

/**
 * Validates user input before a ClockStateMachine is built from it.
 */
class ReferenceParser {
 public:
  /**
   * Parse a decimal frame count in [1, MAX_FRAME_COUNT].
   * Surrounding whitespace is ignored.
   */
  static simerr_t ParseFrameCount(const std::string &text, uint32_t *num_frames);

  /**
   * Split a comma separated reference string into page ids. Tokens are
   * trimmed and empty tokens dropped; at least one page must remain.
   */
  static simerr_t ParseReferenceString(const std::string &text, std::vector<page_id_t> *pages);

  static std::string Trim(const std::string &text);
};

#endif  // CLOCKSIM_REFERENCE_PARSER_H
