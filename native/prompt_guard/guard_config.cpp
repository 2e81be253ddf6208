// guard_config.cpp
// Prompt Guard: Immutable Guard Configuration Implementation

#include "guard_config.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace prompt_guard {

double clamp_sensitivity(double sensitivity) {
  if (std::isnan(sensitivity))
    return 0.0;
  if (sensitivity < 0.0)
    return 0.0;
  if (sensitivity > 1.0)
    return 1.0;
  return sensitivity;
}

GuardConfig make_config(GuardAction action, double sensitivity,
                        size_t max_input_length) {
  GuardConfig cfg;
  cfg.action = action;
  cfg.sensitivity = clamp_sensitivity(sensitivity);
  cfg.max_input_length =
      max_input_length > 0 ? max_input_length : DEFAULT_MAX_INPUT_LENGTH;
  return cfg;
}

GuardConfig default_config() {
  return make_config(GuardAction::WARN, DEFAULT_SENSITIVITY,
                     DEFAULT_MAX_INPUT_LENGTH);
}

GuardConfig config_from_env(const GuardConfig &base) {
  GuardConfig cfg = base;

  const char *action = std::getenv("PROMPT_GUARD_ACTION");
  if (action && action[0] != '\0') {
    if (!parse_action(action, &cfg.action)) {
      std::fprintf(stderr,
                   "[PROMPT_GUARD] WARNING: unknown PROMPT_GUARD_ACTION "
                   "'%s', using warn\n",
                   action);
      cfg.action = GuardAction::WARN;
    }
  }

  const char *sens = std::getenv("PROMPT_GUARD_SENSITIVITY");
  if (sens && sens[0] != '\0') {
    char *end = nullptr;
    double v = std::strtod(sens, &end);
    if (end == sens || *end != '\0' || std::isnan(v)) {
      std::fprintf(stderr,
                   "[PROMPT_GUARD] WARNING: ignoring PROMPT_GUARD_SENSITIVITY "
                   "'%s'\n",
                   sens);
    } else {
      cfg.sensitivity = v;
    }
  }

  const char *max_in = std::getenv("PROMPT_GUARD_MAX_INPUT");
  if (max_in && max_in[0] != '\0') {
    char *end = nullptr;
    unsigned long long v = std::strtoull(max_in, &end, 10);
    if (end == max_in || *end != '\0' || v == 0 || max_in[0] == '-') {
      std::fprintf(stderr,
                   "[PROMPT_GUARD] WARNING: ignoring PROMPT_GUARD_MAX_INPUT "
                   "'%s'\n",
                   max_in);
    } else {
      cfg.max_input_length = static_cast<size_t>(v);
    }
  }

  return make_config(cfg.action, cfg.sensitivity, cfg.max_input_length);
}

std::string bound_input(const std::string &content, size_t max_len,
                        bool *truncated) {
  if (content.size() <= max_len) {
    if (truncated)
      *truncated = false;
    return content;
  }

  // Back off while the first dropped byte is a UTF-8 continuation byte
  size_t cut = max_len;
  while (cut > 0 &&
         (static_cast<unsigned char>(content[cut]) & 0xC0) == 0x80)
    cut--;

  if (truncated)
    *truncated = true;
  return content.substr(0, cut);
}

} // namespace prompt_guard
