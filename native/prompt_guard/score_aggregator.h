// score_aggregator.h
// Prompt Guard: Evidence Aggregation and Decision Policy
//
// STRICT RULES:
// - Divisor is fixed at 6.0 regardless of how many categories fired
// - Score is independent of configuration
// - Only BLOCK action with score >= sensitivity produces a blocked verdict

#ifndef PROMPT_GUARD_SCORE_AGGREGATOR_H
#define PROMPT_GUARD_SCORE_AGGREGATOR_H

#include <string>
#include <vector>

#include "category_detectors.h"
#include "guard_types.h"

namespace prompt_guard {

// One unit of weight per category
static constexpr double MAX_RAW_SCORE = 6.0;

double normalize_score(double raw_total);
double normalize_score(const CategoryScores &scores);

// "Potential prompt injection detected (score: 0.33): a, b"
std::string block_message(double score, const std::vector<std::string> &patterns);

GuardResult decide(std::vector<std::string> patterns, double score,
                   GuardAction action, double sensitivity);

} // namespace prompt_guard

#endif // PROMPT_GUARD_SCORE_AGGREGATOR_H
