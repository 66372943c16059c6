#include "docmind_core/retrieval/confidence_scorer.hpp"

#include <array>

#include "docmind_core/utils/text_utils.hpp"

namespace docmind_core {

float ConfidenceScorer::score(const std::string &answer) {
  const size_t length = text::code_point_length(answer);

  if (length > 500 && answer.find("**") != std::string::npos) {
    return VERY_HIGH;
  }

  if (length > 200) {
    static const std::array<const char *, 4> keywords = {"analysis", "based on", "document",
                                                         "context"};
    const std::string lowered = text::to_lower(answer);
    for (const char *keyword : keywords) {
      if (lowered.find(keyword) != std::string::npos) {
        return HIGH;
      }
    }
  }

  if (length > 100) {
    return MEDIUM;
  }

  return LOW;
}

}  // namespace docmind_core
