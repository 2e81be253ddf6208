// guard_types.h
// Prompt Guard: Verdict and Category Types
//
// STRICT RULES:
// - Verdicts are values, produced once per scan
// - safe == patterns.empty()
// - blocked implies suspicious

#ifndef PROMPT_GUARD_GUARD_TYPES_H
#define PROMPT_GUARD_GUARD_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

namespace prompt_guard {

// Policy applied when content is suspicious
enum class GuardAction : uint8_t {
  WARN = 0,    // Observe, never block
  BLOCK = 1,   // Block when score >= sensitivity
  SANITIZE = 2 // Rewrite dangerous substrings on request
};

// Attack families, in evaluation order
enum class Category : uint8_t {
  SYSTEM_PROMPT_OVERRIDE = 0,
  ROLE_CONFUSION = 1,
  TOOL_CALL_INJECTION = 2,
  SECRET_EXTRACTION = 3,
  COMMAND_INJECTION = 4,
  JAILBREAK_ATTEMPT = 5
};

static constexpr int CATEGORY_COUNT = 6;

// Scan verdict
struct GuardResult {
  bool safe;
  bool suspicious;
  bool blocked;
  bool truncated; // Input was cut to the configured bound before matching
  std::vector<std::string> patterns;
  double score;
  std::string message; // Non-empty only when blocked

  GuardResult()
      : safe(true), suspicious(false), blocked(false), truncated(false),
        score(0.0) {}

  bool has_message() const { return !message.empty(); }

  bool operator==(const GuardResult &other) const {
    return safe == other.safe && suspicious == other.suspicious &&
           blocked == other.blocked && truncated == other.truncated &&
           patterns == other.patterns && score == other.score &&
           message == other.message;
  }
  bool operator!=(const GuardResult &other) const { return !(*this == other); }

  static GuardResult ok();
  static GuardResult warn(std::vector<std::string> patterns, double score);
  static GuardResult block(std::vector<std::string> patterns, double score,
                           std::string message);
};

// "warn" / "block" / "sanitize", case-insensitive. Unknown -> WARN.
GuardAction parse_action(const std::string &text);
bool parse_action(const std::string &text, GuardAction *out);

const char *action_name(GuardAction action);
const char *category_name(Category category);

} // namespace prompt_guard

#endif // PROMPT_GUARD_GUARD_TYPES_H
