// prompt_guard.cpp
// Prompt Guard: Injection Scanning Facade Implementation

#include "prompt_guard.h"

#include <cstdio>
#include <cstring>
#include <new>
#include <utility>
#include <vector>

#include "category_detectors.h"
#include "score_aggregator.h"

namespace prompt_guard {

PromptGuard::PromptGuard(GuardAction action, double sensitivity)
    : PromptGuard(make_config(action, sensitivity)) {}

PromptGuard::PromptGuard(const GuardConfig &config)
    : config_(make_config(config.action, config.sensitivity,
                          config.max_input_length)),
      sanitizer_(config.action) {
  pattern_tables();
}

GuardResult PromptGuard::scan(const std::string &content) const {
  bool truncated = false;
  std::string bounded =
      bound_input(content, config_.max_input_length, &truncated);

  std::vector<std::string> patterns;
  CategoryScores scores = run_detectors(bounded, &patterns);
  double score = normalize_score(scores);

  GuardResult result =
      decide(std::move(patterns), score, config_.action, config_.sensitivity);
  result.truncated = truncated;
  return result;
}

std::string PromptGuard::sanitize(const std::string &content) const {
  return sanitizer_.sanitize(content);
}

// C interface
extern "C" {

void *prompt_guard_create(int action, double sensitivity) {
  std::string error;
  if (!pattern_tables_ok(&error)) {
    std::fprintf(stderr, "[PROMPT_GUARD] FATAL: %s\n", error.c_str());
    return nullptr;
  }

  GuardAction a = GuardAction::WARN;
  if (action == static_cast<int>(GuardAction::BLOCK))
    a = GuardAction::BLOCK;
  else if (action == static_cast<int>(GuardAction::SANITIZE))
    a = GuardAction::SANITIZE;

  return new (std::nothrow) PromptGuard(a, sensitivity);
}

void prompt_guard_destroy(void *guard) {
  delete static_cast<PromptGuard *>(guard);
}

int prompt_guard_scan(void *guard, const char *content, int *out_blocked,
                      int *out_suspicious, double *out_score,
                      char *out_patterns, int patterns_size) {
  if (!guard || !content)
    return -1;

  GuardResult r = static_cast<PromptGuard *>(guard)->scan(content);

  if (out_blocked)
    *out_blocked = r.blocked ? 1 : 0;
  if (out_suspicious)
    *out_suspicious = r.suspicious ? 1 : 0;
  if (out_score)
    *out_score = r.score;

  if (out_patterns && patterns_size > 0) {
    std::string joined;
    for (size_t i = 0; i < r.patterns.size(); i++) {
      if (i > 0)
        joined += ",";
      joined += r.patterns[i];
    }
    std::snprintf(out_patterns, patterns_size, "%s", joined.c_str());
  }

  return static_cast<int>(r.patterns.size());
}

int prompt_guard_sanitize(void *guard, const char *content, char *out,
                          int out_size) {
  if (!guard || !content || !out || out_size <= 0)
    return -1;

  std::string cleaned = static_cast<PromptGuard *>(guard)->sanitize(content);
  if (cleaned.size() + 1 > static_cast<size_t>(out_size))
    return -1;

  std::memcpy(out, cleaned.c_str(), cleaned.size() + 1);
  return static_cast<int>(cleaned.size());
}

} // extern "C"

} // namespace prompt_guard
