/*
 * test_guard_config.cpp — Tests for Guard Configuration
 *
 * Validates:
 *   - Sensitivity clamping, NaN handling, default bound substitution
 *   - Action parsing and naming
 *   - PROMPT_GUARD_* environment overrides, including bad values
 *   - Input bounding on UTF-8 boundaries
 */

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "guard_config.h"

#ifdef _WIN32
#define setenv(k, v, o) _putenv_s(k, v)
#define unsetenv(k) _putenv_s(k, "")
#endif

using namespace prompt_guard;

// =========================================================================
// TESTS
// =========================================================================

static int tests_passed = 0;
static int tests_failed = 0;

#define ASSERT_TRUE(expr, msg)                                                 \
  do {                                                                         \
    if (!(expr)) {                                                             \
      printf("FAIL: %s\n", msg);                                               \
      tests_failed++;                                                          \
    } else {                                                                   \
      printf("PASS: %s\n", msg);                                               \
      tests_passed++;                                                          \
    }                                                                          \
  } while (0)

#define ASSERT_FALSE(expr, msg) ASSERT_TRUE(!(expr), msg)

static void clear_env() {
  unsetenv("PROMPT_GUARD_ACTION");
  unsetenv("PROMPT_GUARD_SENSITIVITY");
  unsetenv("PROMPT_GUARD_MAX_INPUT");
}

void test_clamp() {
  ASSERT_TRUE(clamp_sensitivity(1.7) == 1.0, "Above range clamps to 1.0");
  ASSERT_TRUE(clamp_sensitivity(-0.4) == 0.0, "Below range clamps to 0.0");
  ASSERT_TRUE(clamp_sensitivity(0.15) == 0.15, "In range is unchanged");
  ASSERT_TRUE(clamp_sensitivity(std::nan("")) == 0.0, "NaN becomes 0.0");
}

void test_make_config() {
  GuardConfig c = make_config(GuardAction::BLOCK, 3.0, 0);
  ASSERT_TRUE(c.action == GuardAction::BLOCK, "Action kept");
  ASSERT_TRUE(c.sensitivity == 1.0, "Sensitivity clamped");
  ASSERT_TRUE(c.max_input_length == DEFAULT_MAX_INPUT_LENGTH,
              "Zero bound replaced by default");

  GuardConfig d = default_config();
  ASSERT_TRUE(d.action == GuardAction::WARN, "Default action is warn");
  ASSERT_TRUE(d.sensitivity == DEFAULT_SENSITIVITY, "Default sensitivity");
  ASSERT_TRUE(d.max_input_length == 32768, "Default bound is 32 KiB");
}

void test_parse_action() {
  ASSERT_TRUE(parse_action("block") == GuardAction::BLOCK, "block parses");
  ASSERT_TRUE(parse_action("BLOCK") == GuardAction::BLOCK,
              "Parsing is case-insensitive");
  ASSERT_TRUE(parse_action("Sanitize") == GuardAction::SANITIZE,
              "sanitize parses");
  ASSERT_TRUE(parse_action("warn") == GuardAction::WARN, "warn parses");
  ASSERT_TRUE(parse_action("unknown") == GuardAction::WARN,
              "Unknown falls back to warn");

  GuardAction a = GuardAction::BLOCK;
  ASSERT_FALSE(parse_action("ignore", &a), "Strict parse rejects unknown");
  ASSERT_TRUE(a == GuardAction::BLOCK, "Rejected parse leaves output alone");

  ASSERT_TRUE(std::string(action_name(GuardAction::SANITIZE)) == "sanitize",
              "Action name round-trips");
}

void test_env_overrides() {
  clear_env();
  setenv("PROMPT_GUARD_ACTION", "block", 1);
  setenv("PROMPT_GUARD_SENSITIVITY", "2.5", 1);
  setenv("PROMPT_GUARD_MAX_INPUT", "100", 1);

  GuardConfig c = config_from_env();
  ASSERT_TRUE(c.action == GuardAction::BLOCK, "Env action applied");
  ASSERT_TRUE(c.sensitivity == 1.0, "Env sensitivity clamped");
  ASSERT_TRUE(c.max_input_length == 100, "Env bound applied");
  clear_env();
}

void test_env_bad_values() {
  clear_env();
  setenv("PROMPT_GUARD_ACTION", "bogus", 1);
  setenv("PROMPT_GUARD_SENSITIVITY", "abc", 1);
  setenv("PROMPT_GUARD_MAX_INPUT", "0", 1);

  GuardConfig base = make_config(GuardAction::BLOCK, 0.15, 512);
  GuardConfig c = config_from_env(base);
  ASSERT_TRUE(c.action == GuardAction::WARN, "Bad env action becomes warn");
  ASSERT_TRUE(c.sensitivity == 0.15, "Bad env sensitivity ignored");
  ASSERT_TRUE(c.max_input_length == 512, "Bad env bound ignored");
  clear_env();
}

void test_env_absent() {
  clear_env();
  GuardConfig base = make_config(GuardAction::SANITIZE, 0.1, 1024);
  GuardConfig c = config_from_env(base);
  ASSERT_TRUE(c.action == GuardAction::SANITIZE && c.sensitivity == 0.1 &&
                  c.max_input_length == 1024,
              "No env leaves base untouched");
}

void test_bound_input() {
  bool truncated = true;
  ASSERT_TRUE(bound_input("short", 10, &truncated) == "short" && !truncated,
              "Short input kept");

  ASSERT_TRUE(bound_input("abcdef", 3, &truncated) == "abc" && truncated,
              "Long input cut to bound");

  // "a" followed by U+00E9 (two bytes)
  std::string s = "a\xC3\xA9";
  ASSERT_TRUE(bound_input(s, 2, &truncated) == "a" && truncated,
              "Cut backs off to a code point boundary");
  ASSERT_TRUE(bound_input(s, 3, nullptr) == s, "Exact fit kept");
}

// =========================================================================
// MAIN
// =========================================================================

int main() {
  printf("=== Guard Config Tests ===\n\n");

  test_clamp();
  test_make_config();
  test_parse_action();
  test_env_overrides();
  test_env_bad_values();
  test_env_absent();
  test_bound_input();

  printf("\n=== Results: %d passed, %d failed ===\n", tests_passed,
         tests_failed);

  return tests_failed > 0 ? 1 : 0;
}
