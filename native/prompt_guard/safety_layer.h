// safety_layer.h
// Prompt Guard: Combined Safety Decision
//
// STRICT RULES:
// - Combines the injection scan and the leak detector under one action
// - Scan blocks always win
// - Text longer than the bound is a finding, never silently allowed
// - The only component that writes diagnostics

#ifndef PROMPT_GUARD_SAFETY_LAYER_H
#define PROMPT_GUARD_SAFETY_LAYER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "guard_config.h"
#include "guard_types.h"
#include "leak_detector.h"
#include "prompt_guard.h"

namespace prompt_guard {

enum class SafetyVerdict : uint8_t {
  ALLOW = 0,
  WARN = 1,
  BLOCK = 2,
  SANITIZE = 3
};

struct SafetyDecision {
  SafetyVerdict verdict;
  std::string reason;
  std::string sanitized; // Set for SANITIZE only
  GuardResult scan;
  std::vector<std::string> leaks;
  bool too_long; // Text exceeds the configured bound

  SafetyDecision() : verdict(SafetyVerdict::ALLOW), too_long(false) {}

  bool allowed() const { return verdict != SafetyVerdict::BLOCK; }
};

struct SafetyLayerConfig {
  GuardConfig guard;
  bool log_decisions; // [PROMPT_GUARD] lines on stderr
};

SafetyLayerConfig default_safety_config();

class SafetyLayer {
public:
  explicit SafetyLayer(
      const SafetyLayerConfig &config = default_safety_config());

  // Inbound user text or tool arguments
  SafetyDecision inspect_prompt(const std::string &text) const;

  // Model output: credential leaks only
  SafetyDecision validate_output(const std::string &text) const;

  const PromptGuard &guard() const { return guard_; }
  const LeakDetector &leak_detector() const { return leaks_; }

private:
  SafetyDecision by_action(const std::string &text, SafetyDecision d,
                           bool rewrite_injection) const;
  std::string too_long_reason(size_t length) const;
  void log_decision(const SafetyDecision &d) const;

  SafetyLayerConfig config_;
  PromptGuard guard_;
  LeakDetector leaks_;
};

const char *verdict_name(SafetyVerdict verdict);

} // namespace prompt_guard

#endif // PROMPT_GUARD_SAFETY_LAYER_H
