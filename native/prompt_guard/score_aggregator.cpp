// score_aggregator.cpp
// Prompt Guard: Evidence Aggregation and Decision Policy Implementation

#include "score_aggregator.h"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace prompt_guard {

double normalize_score(double raw_total) {
  if (raw_total <= 0.0)
    return 0.0;
  return std::min(raw_total / MAX_RAW_SCORE, 1.0);
}

double normalize_score(const CategoryScores &scores) {
  return normalize_score(scores.raw_total());
}

std::string block_message(double score,
                          const std::vector<std::string> &patterns) {
  char head[96];
  std::snprintf(head, sizeof(head),
                "Potential prompt injection detected (score: %.2f): ", score);

  std::string message = head;
  for (size_t i = 0; i < patterns.size(); i++) {
    if (i > 0)
      message += ", ";
    message += patterns[i];
  }
  return message;
}

GuardResult decide(std::vector<std::string> patterns, double score,
                   GuardAction action, double sensitivity) {
  if (patterns.empty())
    return GuardResult::ok();

  if (action == GuardAction::BLOCK && score >= sensitivity) {
    std::string message = block_message(score, patterns);
    return GuardResult::block(std::move(patterns), score, std::move(message));
  }

  // WARN, SANITIZE, or below threshold: observe only
  return GuardResult::warn(std::move(patterns), score);
}

} // namespace prompt_guard
