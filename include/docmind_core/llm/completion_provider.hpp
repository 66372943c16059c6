#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace docmind_core {

// The provider answered, but not successfully. status() carries the HTTP status when known.
class CompletionError : public std::exception {
 public:
  explicit CompletionError(const std::string &message, int status = 0)
      : message_(message), status_(status) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  int status() const noexcept {
    return status_;
  }

 private:
  std::string message_;
  int status_;
};

// The provider could not be reached, has no usable model, or timed out
class SynthesisUnavailableError : public std::exception {
 public:
  explicit SynthesisUnavailableError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct CompletionOptions {
  double temperature = 0.7;
  double top_p = 0.9;
  int max_tokens = 2000;
  std::vector<std::string> stop_sequences{"Human:", "Assistant:", "User:", "System:"};
  std::chrono::seconds timeout{60};
};

class TextCompletionProvider {
 public:
  virtual ~TextCompletionProvider() = default;

  virtual void initialize() {}
  virtual void shutdown() {}

  /**
   * @brief Completes the prompt. Blocks for at most options.timeout, or for the
   * adapter's own timeout where its client fixes one up front.
   * @throw CompletionError or SynthesisUnavailableError on failure.
   */
  virtual std::string complete(const std::string &prompt, const CompletionOptions &options) = 0;
};

}  // namespace docmind_core
