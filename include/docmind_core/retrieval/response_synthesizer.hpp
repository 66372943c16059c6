#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docmind_core/index/vector_index.hpp"
#include "docmind_core/llm/completion_provider.hpp"

namespace docmind_core {

struct SynthesisResult {
  std::string answer;
  // True when the provider failed and answer is FALLBACK_ANSWER
  bool fallback_used = false;
};

/**
 * @class ResponseSynthesizer
 * @brief Turns an assembled prompt into the final answer text.
 *
 * A successful completion is followed by a sources footer listing the top five
 * chunks and a fixed analysis footer. Any provider failure yields
 * FALLBACK_ANSWER unchanged. Failed calls are never retried here.
 */
class ResponseSynthesizer {
 public:
  static const std::string FALLBACK_ANSWER;
  static constexpr size_t MAX_FOOTER_SOURCES = 5;

  explicit ResponseSynthesizer(std::shared_ptr<TextCompletionProvider> completion_provider,
                               CompletionOptions options = {});

  SynthesisResult synthesize(const std::string &prompt, const std::vector<SearchResult> &chunks) const;

  static std::string build_sources_footer(const std::vector<SearchResult> &chunks);
  static std::string build_analysis_footer(size_t section_count);

  const CompletionOptions &options() const {
    return options_;
  }

 private:
  std::shared_ptr<TextCompletionProvider> completion_provider_;
  CompletionOptions options_;
};

}  // namespace docmind_core
