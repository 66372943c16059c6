#pragma once

#include <string>
#include <vector>

#include "docmind_core/index/vector_index.hpp"
#include "docmind_core/types/conversation.hpp"

namespace docmind_core {

/**
 * @class ContextAssembler
 * @brief Builds the completion prompt from the question, retrieved chunks and history.
 *
 * The prompt consists of a fixed instruction preamble naming the detected
 * language, the last three conversation turns, every retrieved chunk with its
 * relevance, and the question itself.
 */
class ContextAssembler {
 public:
  static constexpr size_t MAX_HISTORY_TURNS = 3;

  std::string assemble(const std::string &query_text, const std::vector<SearchResult> &chunks,
                       const std::vector<ConversationTurn> &history = {}) const;

  // "Document N: <filename> (Relevance: 0.00)\nContent: <text>\n" per chunk, newline-joined
  static std::string format_context(const std::vector<SearchResult> &chunks);

  static std::string format_history(const std::vector<ConversationTurn> &history);

  /**
   * @brief Guesses the question's language from small per-language keyword sets.
   *
   * Languages are tried in a fixed order and the first with a keyword among the
   * query's words wins. Keywords of scripts written without spaces match
   * anywhere in the text. Defaults to English.
   */
  static std::string detect_language(const std::string &text);
};

}  // namespace docmind_core
