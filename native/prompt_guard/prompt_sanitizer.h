// prompt_sanitizer.h
// Prompt Guard: Literal Substring Rewriter
//
// STRICT RULES:
// - No-op unless the configured action is SANITIZE
// - Fixed, ordered literal replacements only (no parsing)
// - Idempotent: sanitize(sanitize(x)) == sanitize(x)

#ifndef PROMPT_GUARD_PROMPT_SANITIZER_H
#define PROMPT_GUARD_PROMPT_SANITIZER_H

#include <string>

#include "guard_types.h"

namespace prompt_guard {

static constexpr char ESCAPE_MARKER = '\\';
static constexpr const char *REDACTION_TOKEN = "[SANITIZED]";

struct SanitizeStats {
  int substitutions_escaped; // $(
  int backticks_escaped;     // `
  int tool_keys_redacted;    // {"tool_calls": / {"function_call":
  int total;
};

class PromptSanitizer {
public:
  explicit PromptSanitizer(GuardAction action) : action_(action) {}

  bool active() const { return action_ == GuardAction::SANITIZE; }

  std::string sanitize(const std::string &content,
                       SanitizeStats *stats = nullptr) const;

private:
  GuardAction action_;
};

} // namespace prompt_guard

#endif // PROMPT_GUARD_PROMPT_SANITIZER_H
