// leak_detector.h
// Prompt Guard: Credential Leak Detection
//
// STRICT RULES:
// - Fixed, case-sensitive pattern table
// - Detection runs on the bounded prefix of the input
// - Redaction covers the full text and the whole credential token,
//   never the surrounding text

#ifndef PROMPT_GUARD_LEAK_DETECTOR_H
#define PROMPT_GUARD_LEAK_DETECTOR_H

#include <cstddef>
#include <string>
#include <vector>

#include "guard_config.h"

namespace prompt_guard {

class LeakDetector {
public:
  explicit LeakDetector(size_t max_input_length = DEFAULT_MAX_INPUT_LENGTH);

  // Names of matching patterns, in table order
  std::vector<std::string> detect(const std::string &text) const;

  bool is_clean(const std::string &text) const { return detect(text).empty(); }

  // Replace every credential with [REDACTED:<name>]
  std::string redact(const std::string &text) const;

private:
  size_t max_input_length_;
};

} // namespace prompt_guard

#endif // PROMPT_GUARD_LEAK_DETECTOR_H
