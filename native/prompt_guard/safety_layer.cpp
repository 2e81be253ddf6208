// safety_layer.cpp
// Prompt Guard: Combined Safety Decision Implementation

#include "safety_layer.h"

#include <cstdio>
#include <utility>

namespace prompt_guard {

static std::string join_list(const std::vector<std::string> &items) {
  std::string out = "[";
  for (size_t i = 0; i < items.size(); i++) {
    if (i > 0)
      out += ", ";
    out += items[i];
  }
  out += "]";
  return out;
}

static void append_reason(std::string &reason, const std::string &part) {
  if (!reason.empty())
    reason += "; ";
  reason += part;
}

SafetyLayerConfig default_safety_config() {
  SafetyLayerConfig cfg;
  cfg.guard = default_config();
  cfg.log_decisions = true;
  return cfg;
}

SafetyLayer::SafetyLayer(const SafetyLayerConfig &config)
    : config_(config), guard_(config.guard),
      leaks_(config.guard.max_input_length) {}

SafetyDecision SafetyLayer::inspect_prompt(const std::string &text) const {
  SafetyDecision d;
  d.scan = guard_.scan(text);
  d.leaks = leaks_.detect(text);
  d.too_long = text.size() > guard_.config().max_input_length;

  if (d.scan.blocked) {
    d.verdict = SafetyVerdict::BLOCK;
    d.reason = d.scan.message;
    log_decision(d);
    return d;
  }

  if (!d.scan.suspicious && d.leaks.empty() && !d.too_long) {
    d.verdict = SafetyVerdict::ALLOW;
    return d;
  }

  if (d.too_long)
    append_reason(d.reason, too_long_reason(text.size()));
  if (d.scan.suspicious) {
    char score[32];
    std::snprintf(score, sizeof(score), "%.2f", d.scan.score);
    append_reason(d.reason, "prompt patterns=" + join_list(d.scan.patterns) +
                                " score=" + score);
  }
  if (!d.leaks.empty())
    append_reason(d.reason, "leak patterns=" + join_list(d.leaks));

  d = by_action(text, std::move(d), true);
  log_decision(d);
  return d;
}

SafetyDecision SafetyLayer::validate_output(const std::string &text) const {
  SafetyDecision d;
  d.leaks = leaks_.detect(text);
  d.too_long = text.size() > guard_.config().max_input_length;

  if (d.leaks.empty() && !d.too_long) {
    d.verdict = SafetyVerdict::ALLOW;
    return d;
  }

  if (d.too_long)
    append_reason(d.reason, too_long_reason(text.size()));
  if (!d.leaks.empty())
    append_reason(d.reason, "leak patterns=" + join_list(d.leaks));

  d = by_action(text, std::move(d), false);
  log_decision(d);
  return d;
}

std::string SafetyLayer::too_long_reason(size_t length) const {
  char buf[96];
  std::snprintf(buf, sizeof(buf), "input too long: %zu bytes (max %zu)",
                length, guard_.config().max_input_length);
  return buf;
}

SafetyDecision SafetyLayer::by_action(const std::string &text,
                                      SafetyDecision d,
                                      bool rewrite_injection) const {
  switch (guard_.action()) {
  case GuardAction::BLOCK:
    d.verdict = SafetyVerdict::BLOCK;
    break;
  case GuardAction::SANITIZE:
    d.verdict = SafetyVerdict::SANITIZE;
    // Redact the full text; credentials past the scan bound are not detected
    d.sanitized =
        leaks_.redact(rewrite_injection ? guard_.sanitize(text) : text);
    break;
  case GuardAction::WARN:
    d.verdict = SafetyVerdict::WARN;
    break;
  }
  return d;
}

void SafetyLayer::log_decision(const SafetyDecision &d) const {
  if (!config_.log_decisions)
    return;

  switch (d.verdict) {
  case SafetyVerdict::BLOCK:
    std::fprintf(stderr, "[PROMPT_GUARD] BLOCKED: %s\n", d.reason.c_str());
    break;
  case SafetyVerdict::WARN:
  case SafetyVerdict::SANITIZE:
    std::fprintf(stderr, "[PROMPT_GUARD] WARNING: %s (%s)\n",
                 d.reason.c_str(), verdict_name(d.verdict));
    break;
  case SafetyVerdict::ALLOW:
    break;
  }
}

const char *verdict_name(SafetyVerdict verdict) {
  switch (verdict) {
  case SafetyVerdict::ALLOW:
    return "allow";
  case SafetyVerdict::WARN:
    return "warn";
  case SafetyVerdict::BLOCK:
    return "block";
  case SafetyVerdict::SANITIZE:
    return "sanitize";
  }
  return "allow";
}

} // namespace prompt_guard
