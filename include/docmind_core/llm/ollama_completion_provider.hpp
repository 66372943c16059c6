#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include "docmind_core/llm/completion_provider.hpp"

namespace docmind_core {

/**
 * @class OllamaCompletionProvider
 * @brief Text completion through an Ollama server's /api/generate.
 *
 * initialize() picks the model: the preferred model if the server has it,
 * otherwise the first available fallback, otherwise whatever model the server
 * lists first. A server that is down at startup is not fatal; complete() then
 * fails with SynthesisUnavailableError until the server is reachable.
 *
 * ollama-hpp keeps one process-wide client, so the read timeout is set once in
 * initialize(), before any request runs, and CompletionOptions::timeout is not
 * applied per call.
 */
class OllamaCompletionProvider : public TextCompletionProvider {
 public:
  OllamaCompletionProvider(const std::string &ollama_url, const std::string &preferred_model,
                           const std::vector<std::string> &fallback_models,
                           std::chrono::seconds read_timeout = std::chrono::seconds(60));

  OllamaCompletionProvider(const OllamaCompletionProvider &) = delete;
  OllamaCompletionProvider &operator=(const OllamaCompletionProvider &) = delete;

  void initialize() override;
  void shutdown() override;

  std::string complete(const std::string &prompt, const CompletionOptions &options) override;

  std::string model() const;

  // Model selection against a list of installed model names ("llama3.2:latest" matches "llama3.2")
  static std::string select_model(const std::string &preferred_model,
                                  const std::vector<std::string> &fallback_models,
                                  const std::vector<std::string> &available_models);

 private:
  std::string ollama_url_;
  std::vector<std::string> fallback_models_;
  std::chrono::seconds read_timeout_;
  mutable std::mutex model_mutex_;
  std::string model_;
  std::atomic<bool> shut_down_{false};
};

}  // namespace docmind_core
