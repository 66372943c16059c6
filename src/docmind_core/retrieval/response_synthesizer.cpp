#include "docmind_core/retrieval/response_synthesizer.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace docmind_core {

const std::string ResponseSynthesizer::FALLBACK_ANSWER =
    "I apologize, but I'm currently unable to access the advanced AI service. This could be "
    "because:\n"
    "\n"
    "1. Ollama is not installed or running\n"
    "2. No LLM models are available\n"
    "3. Network connectivity issues\n"
    "\n"
    "To enable full AI functionality, please:\n"
    "1. Install Ollama from https://ollama.ai\n"
    "2. Run: `ollama pull llama3.2`\n"
    "3. Start Ollama service\n"
    "\n"
    "For now, I can provide basic document analysis based on the available content.";

ResponseSynthesizer::ResponseSynthesizer(std::shared_ptr<TextCompletionProvider> completion_provider,
                                         CompletionOptions options)
    : completion_provider_(std::move(completion_provider)), options_(std::move(options)) {}

std::string ResponseSynthesizer::build_sources_footer(const std::vector<SearchResult> &chunks) {
  std::stringstream ss;
  ss << "\n\n**Document Sources:**\n";
  const size_t count = std::min(chunks.size(), MAX_FOOTER_SOURCES);
  for (size_t i = 0; i < count; ++i) {
    ss << (i + 1) << ". " << chunks[i].metadata.filename << " (Relevance: " << std::fixed
       << std::setprecision(1) << chunks[i].similarity * 100.0f << "%)\n";
  }
  return ss.str();
}

std::string ResponseSynthesizer::build_analysis_footer(size_t section_count) {
  return "\n\n---\n\n**Analysis Information:**\n"
         "- Query processed using advanced LLM (Ollama)\n"
         "- Analyzed " +
         std::to_string(section_count) +
         " relevant document sections\n"
         "- Response generated with comprehensive context understanding\n"
         "- Confidence level: High (LLM-powered analysis)";
}

SynthesisResult ResponseSynthesizer::synthesize(const std::string &prompt,
                                                const std::vector<SearchResult> &chunks) const {
  std::string completion;
  try {
    completion = completion_provider_->complete(prompt, options_);
  } catch (const SynthesisUnavailableError &e) {
    std::cerr << "ResponseSynthesizer: completion unavailable: " << e.what() << std::endl;
    return {FALLBACK_ANSWER, true};
  } catch (const CompletionError &e) {
    std::cerr << "ResponseSynthesizer: completion failed (status " << e.status()
              << "): " << e.what() << std::endl;
    return {FALLBACK_ANSWER, true};
  } catch (const std::exception &e) {
    std::cerr << "ResponseSynthesizer: unexpected provider error: " << e.what() << std::endl;
    return {FALLBACK_ANSWER, true};
  }

  std::cout << "Got completion (" << completion.size() << " bytes)" << std::endl;
  return {completion + build_sources_footer(chunks) + build_analysis_footer(chunks.size()), false};
}

}  // namespace docmind_core
