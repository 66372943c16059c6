#pragma once

#include <gmock/gmock.h>

#include "docmind_core/llm/completion_provider.hpp"
#include "docmind_core/llm/embedding_provider.hpp"
#include "docmind_core/metrics/metrics_sink.hpp"

namespace docmind_tests {

/**
 * Mock EmbeddingProvider. Returns a constant vector of the given dimension by default.
 */
class MockEmbeddingProvider : public docmind_core::EmbeddingProvider {
 public:
  explicit MockEmbeddingProvider(size_t dims = 8) {
    std::vector<float> default_embedding(dims, 0.1f);
    default_embedding[0] = 0.5f;

    ON_CALL(*this, embed(testing::_)).WillByDefault(testing::Return(default_embedding));
    ON_CALL(*this, dimension()).WillByDefault(testing::Return(dims));
  }

  MOCK_METHOD(std::vector<float>, embed, (const std::string& text), (override));
  MOCK_METHOD(size_t, dimension, (), (const, override));
};

/**
 * Mock TextCompletionProvider. Answers "Mock answer." by default.
 */
class MockCompletionProvider : public docmind_core::TextCompletionProvider {
 public:
  MockCompletionProvider() {
    ON_CALL(*this, complete(testing::_, testing::_))
        .WillByDefault(testing::Return(std::string("Mock answer.")));
  }

  MOCK_METHOD(std::string, complete,
              (const std::string& prompt, const docmind_core::CompletionOptions& options),
              (override));
};

class MockMetricsSink : public docmind_core::MetricsSink {
 public:
  MOCK_METHOD(void, record_query, (const docmind_core::QueryEvent& event), (override));
  MOCK_METHOD(void, record_document_access,
              (const std::string& owner_id, const std::string& document_id,
               docmind_core::DocumentAction action),
              (override));
};

/**
 * Utility functions for creating test data in tests
 */
namespace MockUtilities {

// A vector pointing mostly along one axis; vectors for different axes are nearly orthogonal
inline std::vector<float> axis_vector(size_t axis, size_t dimension = 8) {
  std::vector<float> vector(dimension, 0.01f);
  vector[axis % dimension] = 1.0f;
  return vector;
}

}  // namespace MockUtilities

}  // namespace docmind_tests
