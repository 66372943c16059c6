#include "docmind_core/retrieval/context_assembler.hpp"

#include <iomanip>
#include <sstream>

#include "docmind_core/utils/text_utils.hpp"

namespace docmind_core {

namespace {

struct LanguageKeywords {
  const char *language;
  std::vector<std::string> keywords;
  // Chinese and Japanese are not space-delimited, so keywords match as substrings
  bool substring_match;
};

const std::vector<LanguageKeywords> &language_table() {
  static const std::vector<LanguageKeywords> table = {
      {"English", {"hello", "what", "how", "where", "when", "why", "the", "and", "or", "but"}, false},
      {"Spanish", {"hola", "qué", "cómo", "dónde", "cuándo", "por qué", "el", "la", "y", "o", "pero"},
       false},
      {"French",
       {"bonjour", "quoi", "comment", "où", "quand", "pourquoi", "le", "la", "et", "ou", "mais"},
       false},
      {"German", {"hallo", "was", "wie", "wo", "wann", "warum", "der", "die", "und", "oder", "aber"},
       false},
      {"Italian", {"ciao", "cosa", "come", "dove", "quando", "perché", "il", "la", "e", "o", "ma"},
       false},
      {"Portuguese", {"olá", "o que", "como", "onde", "quando", "por que", "o", "a", "e", "ou", "mas"},
       false},
      {"Russian", {"привет", "что", "как", "где", "когда", "почему", "и", "или", "но"}, false},
      {"Chinese", {"你好", "什么", "怎么", "哪里", "什么时候", "为什么", "的", "和", "或", "但是"}, true},
      {"Japanese", {"こんにちは", "何", "どう", "どこ", "いつ", "なぜ", "の", "と", "または", "しかし"},
       true},
      {"Korean", {"안녕하세요", "무엇", "어떻게", "어디", "언제", "왜", "의", "과", "또는", "하지만"},
       false},
  };
  return table;
}

bool contains_phrase(const std::vector<std::string> &words, const std::vector<std::string> &phrase) {
  if (phrase.empty() || phrase.size() > words.size()) {
    return false;
  }
  for (size_t i = 0; i + phrase.size() <= words.size(); ++i) {
    bool match = true;
    for (size_t j = 0; j < phrase.size(); ++j) {
      if (words[i + j] != phrase[j]) {
        match = false;
        break;
      }
    }
    if (match) {
      return true;
    }
  }
  return false;
}

const char *SYSTEM_PROMPT_HEAD =
    "You are DocuMind, an advanced AI-powered document analysis assistant. You excel at:\n"
    "- Analyzing and understanding complex documents\n"
    "- Providing comprehensive, detailed answers\n"
    "- Extracting key insights and information\n"
    "- Explaining technical concepts clearly\n"
    "- Summarizing large amounts of information\n"
    "- Answering questions with high accuracy\n"
    "- Supporting multiple languages (currently detected: ";

const char *SYSTEM_PROMPT_TAIL =
    ")\n"
    "\n"
    "Guidelines:\n"
    "- Always provide detailed, comprehensive responses\n"
    "- Use proper formatting with headers, bullet points, and structure\n"
    "- Cite specific information from the documents\n"
    "- Be professional and informative\n"
    "- If information is not available, clearly state this\n"
    "- Provide context and analysis, not just raw answers\n"
    "- Respond in the same language as the user's question";

}  // namespace

std::string ContextAssembler::detect_language(const std::string &text) {
  const std::vector<std::string> words = text::tokenize_words(text);
  const std::string lowered = text::to_lower(text);

  for (const auto &entry : language_table()) {
    for (const auto &keyword : entry.keywords) {
      if (entry.substring_match) {
        if (lowered.find(keyword) != std::string::npos) {
          return entry.language;
        }
      } else if (contains_phrase(words, text::tokenize_words(keyword))) {
        return entry.language;
      }
    }
  }
  return "English";
}

std::string ContextAssembler::format_context(const std::vector<SearchResult> &chunks) {
  std::stringstream ss;
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (i > 0) {
      ss << "\n";
    }
    ss << "Document " << (i + 1) << ": " << chunks[i].metadata.filename << " (Relevance: "
       << std::fixed << std::setprecision(2) << chunks[i].similarity << ")\n"
       << "Content: " << chunks[i].content << "\n";
  }
  return ss.str();
}

std::string ContextAssembler::format_history(const std::vector<ConversationTurn> &history) {
  if (history.empty()) {
    return "";
  }
  std::string out = "\n\nPrevious conversation:\n";
  const size_t first = history.size() > MAX_HISTORY_TURNS ? history.size() - MAX_HISTORY_TURNS : 0;
  for (size_t i = first; i < history.size(); ++i) {
    out += "- " + to_string(history[i].role) + ": " + history[i].content + "\n";
  }
  return out;
}

std::string ContextAssembler::assemble(const std::string &query_text,
                                       const std::vector<SearchResult> &chunks,
                                       const std::vector<ConversationTurn> &history) const {
  const std::string language = detect_language(query_text);

  std::string prompt;
  prompt += SYSTEM_PROMPT_HEAD + language + SYSTEM_PROMPT_TAIL;
  prompt += "\n\n" + format_history(history) + "\n\n";
  prompt += "Document Context:\n" + format_context(chunks) + "\n\n";
  prompt += "User Question (" + language + "): " + query_text + "\n\n";
  prompt +=
      "Please provide a comprehensive, detailed response based on the document context above. "
      "Structure your answer with clear sections, use formatting, and provide thorough analysis. "
      "Respond in " +
      language + ".";
  return prompt;
}

}  // namespace docmind_core
