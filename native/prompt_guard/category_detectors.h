// category_detectors.h
// Prompt Guard: Attack Family Detectors
//
// STRICT RULES:
// - Six detectors, fixed order, no side effects
// - Phrase tables are compile-time constants, compiled once
// - Case-insensitive matching only
// - A detector records labels only when it contributes weight

#ifndef PROMPT_GUARD_CATEGORY_DETECTORS_H
#define PROMPT_GUARD_CATEGORY_DETECTORS_H

#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

#include "guard_types.h"

namespace prompt_guard {

// Evidence weights
static constexpr double WEIGHT_SYSTEM_OVERRIDE = 1.0;
static constexpr double WEIGHT_ROLE_CONFUSION = 0.9;
static constexpr double WEIGHT_TOOL_PAYLOAD = 0.8;
static constexpr double WEIGHT_JSON_ESCAPE = 0.7;
static constexpr double WEIGHT_SECRET_EXTRACTION = 0.95;
static constexpr double WEIGHT_COMMAND_SEQUENCE = 0.3;
static constexpr double WEIGHT_COMMAND_CAP = 1.0;
static constexpr double WEIGHT_JAILBREAK = 0.95;

// Raised once, when the phrase table fails to compile
class PatternTableError : public std::runtime_error {
public:
  explicit PatternTableError(const std::string &what)
      : std::runtime_error(what) {}
};

// Compiled phrase tables (process-wide, immutable after first build)
struct PatternTables {
  std::vector<std::regex> system_override;
  std::vector<std::regex> role_confusion;
  std::vector<std::regex> secret_extraction;
  std::vector<std::regex> jailbreak;
  std::regex tool_payload_opener;
};

// Throws PatternTableError on the first call if a table entry is malformed
const PatternTables &pattern_tables();

// Non-throwing health check of the arena
bool pattern_tables_ok(std::string *error);

// Per-category weights from one scan
struct CategoryScores {
  double weight[CATEGORY_COUNT];

  CategoryScores() {
    for (int i = 0; i < CATEGORY_COUNT; i++)
      weight[i] = 0.0;
  }

  double of(Category c) const { return weight[static_cast<int>(c)]; }
  double raw_total() const;
};

// Run all six detectors in order, appending labels to patterns
CategoryScores run_detectors(const std::string &content,
                             std::vector<std::string> *patterns);

// Run a single detector
double run_category(Category category, const std::string &content,
                    std::vector<std::string> *patterns);

} // namespace prompt_guard

#endif // PROMPT_GUARD_CATEGORY_DETECTORS_H
