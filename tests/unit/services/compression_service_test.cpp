#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include "docmind_core/services/compression_service.hpp"
#include "utilities_test.hpp"

namespace docmind_tests {

using docmind_core::CompressionError;
using docmind_core::CompressionService;

class CompressionServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    rng_.seed(12345);
  }

  // Helper to generate random binary data
  std::string generate_binary_data(size_t size) {
    std::string data(size, '\0');
    std::uniform_int_distribution<int> dist(0, 255);
    std::generate(data.begin(), data.end(), [this, &dist]() { return static_cast<char>(dist(rng_)); });
    return data;
  }

  std::mt19937 rng_;
};

TEST_F(CompressionServiceTest, EmptyInputGivesEmptyOutput) {
  EXPECT_TRUE(CompressionService::compress("").empty());
  EXPECT_EQ(CompressionService::decompress({}), "");
}

TEST_F(CompressionServiceTest, DocumentTextShrinksAndRestores) {
  const std::string text = TestUtilities::create_sentences(20000);

  auto compressed = CompressionService::compress(text);

  EXPECT_LT(compressed.size(), text.size() / 4);
  EXPECT_EQ(CompressionService::decompress(compressed), text);
}

TEST_F(CompressionServiceTest, MultibyteTextIsPreserved) {
  const std::string text = "Résumé: naïve café. Привет мир. 你好世界. こんにちは.";
  EXPECT_EQ(CompressionService::decompress(CompressionService::compress(text)), text);
}

TEST_F(CompressionServiceTest, BinaryDataWithEmbeddedNulsIsPreserved) {
  const std::string data = generate_binary_data(4096);
  EXPECT_EQ(CompressionService::decompress(CompressionService::compress(data)), data);
}

TEST_F(CompressionServiceTest, InvalidLevelIsRejected) {
  EXPECT_THROW(CompressionService::compress("text", 1000), CompressionError);
}

TEST_F(CompressionServiceTest, GarbageInputFailsToDecompress) {
  std::vector<char> garbage = {'n', 'o', 't', ' ', 'z', 's', 't', 'd'};
  EXPECT_THROW(CompressionService::decompress(garbage), CompressionError);
}

TEST_F(CompressionServiceTest, TruncatedFrameFailsToDecompress) {
  auto compressed = CompressionService::compress(TestUtilities::create_sentences(2000));
  compressed.resize(compressed.size() / 2);
  EXPECT_THROW(CompressionService::decompress(compressed), CompressionError);
}

}  // namespace docmind_tests
