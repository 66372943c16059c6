#include "docmind_core/llm/ollama_completion_provider.hpp"

#include <iostream>

#include "ollama.hpp"

namespace docmind_core {

OllamaCompletionProvider::OllamaCompletionProvider(const std::string &ollama_url,
                                                   const std::string &preferred_model,
                                                   const std::vector<std::string> &fallback_models,
                                                   std::chrono::seconds read_timeout)
    : ollama_url_(ollama_url),
      fallback_models_(fallback_models),
      read_timeout_(read_timeout),
      model_(preferred_model) {}

std::string OllamaCompletionProvider::select_model(
    const std::string &preferred_model, const std::vector<std::string> &fallback_models,
    const std::vector<std::string> &available_models) {
  std::vector<std::string> candidates{preferred_model};
  candidates.insert(candidates.end(), fallback_models.begin(), fallback_models.end());

  for (const auto &candidate : candidates) {
    for (const auto &available : available_models) {
      if (available.find(candidate) != std::string::npos) {
        return candidate;
      }
    }
  }
  if (!available_models.empty()) {
    return available_models.front();
  }
  return preferred_model;
}

void OllamaCompletionProvider::initialize() {
  ollama::setServerURL(ollama_url_);
  ollama::setReadTimeout(static_cast<int>(read_timeout_.count()));
  shut_down_.store(false);
  try {
    if (!ollama::is_running()) {
      std::cerr << "Warning: Ollama server is not running at " << ollama_url_
                << "; answers will use the fallback text." << std::endl;
      return;
    }
    std::vector<std::string> available = ollama::list_models();
    std::lock_guard<std::mutex> lock(model_mutex_);
    model_ = select_model(model_, fallback_models_, available);
    std::cout << "Completion model: " << model_ << std::endl;
  } catch (const ollama::exception &e) {
    std::cerr << "Warning: could not list Ollama models: " << e.what() << std::endl;
  }
}

void OllamaCompletionProvider::shutdown() {
  shut_down_.store(true);
}

std::string OllamaCompletionProvider::model() const {
  std::lock_guard<std::mutex> lock(model_mutex_);
  return model_;
}

std::string OllamaCompletionProvider::complete(const std::string &prompt,
                                               const CompletionOptions &options) {
  if (shut_down_.load()) {
    throw SynthesisUnavailableError("Completion provider has been shut down");
  }

  ollama::options request_options;
  request_options["temperature"] = options.temperature;
  request_options["top_p"] = options.top_p;
  request_options["num_predict"] = options.max_tokens;
  request_options["stop"] = options.stop_sequences;

  ollama::request request(model(), prompt, request_options, false);

  try {
    ollama::response response = ollama::generate(request);
    auto json_response = response.as_json();
    if (json_response.contains("error")) {
      throw CompletionError("Ollama generate failed: " +
                            json_response["error"].get<std::string>());
    }
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw SynthesisUnavailableError("Ollama generate failed: " + std::string(e.what()));
  }
}

}  // namespace docmind_core
