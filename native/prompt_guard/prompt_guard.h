// prompt_guard.h
// Prompt Guard: Injection Scanning Facade
//
// STRICT RULES:
// - scan() is observational: it never rewrites, blocks I/O, or keeps state
// - sanitize() is an explicit opt-in rewrite, gated on SANITIZE
// - Configuration is fixed at construction
// - Safe to share across threads without locking

#ifndef PROMPT_GUARD_PROMPT_GUARD_H
#define PROMPT_GUARD_PROMPT_GUARD_H

#include <string>

#include "guard_config.h"
#include "guard_types.h"
#include "prompt_sanitizer.h"

namespace prompt_guard {

class PromptGuard {
public:
  // Builds the pattern arena eagerly; throws PatternTableError if malformed
  PromptGuard(GuardAction action, double sensitivity);
  explicit PromptGuard(const GuardConfig &config);

  // Classify content; input beyond max_input_length is truncated first
  GuardResult scan(const std::string &content) const;

  // Rewrite dangerous literals; returns content unchanged unless SANITIZE
  std::string sanitize(const std::string &content) const;

  GuardAction action() const { return config_.action; }
  double sensitivity() const { return config_.sensitivity; }
  const GuardConfig &config() const { return config_; }

private:
  GuardConfig config_;
  PromptSanitizer sanitizer_;
};

// C interface
extern "C" {
void *prompt_guard_create(int action, double sensitivity);
void prompt_guard_destroy(void *guard);
int prompt_guard_scan(void *guard, const char *content, int *out_blocked,
                      int *out_suspicious, double *out_score,
                      char *out_patterns, int patterns_size);
int prompt_guard_sanitize(void *guard, const char *content, char *out,
                          int out_size);
}

} // namespace prompt_guard

#endif // PROMPT_GUARD_PROMPT_GUARD_H
