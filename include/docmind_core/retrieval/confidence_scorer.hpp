#pragma once

#include <string>

namespace docmind_core {

/**
 * @class ConfidenceScorer
 * @brief Heuristic confidence for a final answer, from its length and content.
 *
 * Rules are checked in order and the first match wins. Lengths are in code points.
 *   - longer than 500 and containing "**"                         -> 0.95
 *   - longer than 200 and containing "analysis", "based on",
 *     "document" or "context" (case-insensitive)                  -> 0.85
 *   - longer than 100                                             -> 0.75
 *   - otherwise                                                   -> 0.5
 */
class ConfidenceScorer {
 public:
  static constexpr float VERY_HIGH = 0.95f;
  static constexpr float HIGH = 0.85f;
  static constexpr float MEDIUM = 0.75f;
  static constexpr float LOW = 0.5f;

  static float score(const std::string &answer);
};

}  // namespace docmind_core
