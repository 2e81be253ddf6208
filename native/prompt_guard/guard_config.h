// guard_config.h
// Prompt Guard: Immutable Guard Configuration
//
// STRICT RULES:
// - Sensitivity is clamped to [0.0, 1.0], never rejected
// - Input is bounded before any pattern matching
// - Environment overrides are optional and never fatal

#ifndef PROMPT_GUARD_GUARD_CONFIG_H
#define PROMPT_GUARD_GUARD_CONFIG_H

#include <cstddef>
#include <string>

#include "guard_types.h"

namespace prompt_guard {

static constexpr double DEFAULT_SENSITIVITY = 0.7;
static constexpr double RECOMMENDED_BLOCK_SENSITIVITY = 0.15;
static constexpr double RECOMMENDED_WARN_SENSITIVITY = 0.10;

// Longest input the detectors will see (32 KiB)
static constexpr size_t DEFAULT_MAX_INPUT_LENGTH = 32768;

struct GuardConfig {
  GuardAction action;
  double sensitivity;      // [0.0, 1.0]
  size_t max_input_length; // Bytes scanned, longer input is truncated
};

double clamp_sensitivity(double sensitivity);

GuardConfig make_config(GuardAction action, double sensitivity,
                        size_t max_input_length = DEFAULT_MAX_INPUT_LENGTH);

GuardConfig default_config();

// Overlay PROMPT_GUARD_ACTION, PROMPT_GUARD_SENSITIVITY, PROMPT_GUARD_MAX_INPUT
GuardConfig config_from_env(const GuardConfig &base = default_config());

// Cut to at most max_len bytes without splitting a UTF-8 sequence
std::string bound_input(const std::string &content, size_t max_len,
                        bool *truncated);

} // namespace prompt_guard

#endif // PROMPT_GUARD_GUARD_CONFIG_H
