// guard_types.cpp
// Prompt Guard: Verdict and Category Types Implementation

#include "guard_types.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace prompt_guard {

GuardResult GuardResult::ok() { return GuardResult(); }

GuardResult GuardResult::warn(std::vector<std::string> patterns,
                              double score) {
  GuardResult r;
  r.safe = false;
  r.suspicious = true;
  r.patterns = std::move(patterns);
  r.score = score;
  return r;
}

GuardResult GuardResult::block(std::vector<std::string> patterns,
                               double score, std::string message) {
  GuardResult r = warn(std::move(patterns), score);
  r.blocked = true;
  r.message = std::move(message);
  return r;
}

bool parse_action(const std::string &text, GuardAction *out) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });

  if (lower == "warn") {
    *out = GuardAction::WARN;
  } else if (lower == "block") {
    *out = GuardAction::BLOCK;
  } else if (lower == "sanitize") {
    *out = GuardAction::SANITIZE;
  } else {
    return false;
  }
  return true;
}

GuardAction parse_action(const std::string &text) {
  GuardAction action = GuardAction::WARN;
  if (!parse_action(text, &action))
    return GuardAction::WARN;
  return action;
}

const char *action_name(GuardAction action) {
  switch (action) {
  case GuardAction::WARN:
    return "warn";
  case GuardAction::BLOCK:
    return "block";
  case GuardAction::SANITIZE:
    return "sanitize";
  }
  return "warn";
}

const char *category_name(Category category) {
  switch (category) {
  case Category::SYSTEM_PROMPT_OVERRIDE:
    return "system_prompt_override";
  case Category::ROLE_CONFUSION:
    return "role_confusion";
  case Category::TOOL_CALL_INJECTION:
    return "tool_call_injection";
  case Category::SECRET_EXTRACTION:
    return "secret_extraction";
  case Category::COMMAND_INJECTION:
    return "command_injection";
  case Category::JAILBREAK_ATTEMPT:
    return "jailbreak_attempt";
  }
  return "unknown";
}

} // namespace prompt_guard
