#include <gtest/gtest.h>

#include "docmind_core/retrieval/retriever.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

namespace docmind_tests {

using namespace docmind_core;
using MockUtilities::axis_vector;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class RetrieverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    embedding_provider_ = std::make_shared<NiceMock<MockEmbeddingProvider>>();
    index_ = std::make_shared<VectorIndex>(8);

    index_->add(TestUtilities::make_index_entry("doc1", "alice", 0, "alpha", axis_vector(0)));
    index_->add(TestUtilities::make_index_entry("doc2", "alice", 0, "beta", axis_vector(1)));
    index_->add(TestUtilities::make_index_entry("doc3", "bob", 0, "gamma", axis_vector(0)));

    ON_CALL(*embedding_provider_, embed(_)).WillByDefault(Return(axis_vector(0)));
  }

  std::shared_ptr<NiceMock<MockEmbeddingProvider>> embedding_provider_;
  std::shared_ptr<VectorIndex> index_;
};

TEST_F(RetrieverTest, ReturnsBestMatchesFirst) {
  Retriever retriever(embedding_provider_, index_);
  auto results = retriever.retrieve("alpha?", 3);

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results.back().metadata.document_id, "doc2");
  EXPECT_GE(results[0].similarity, results[1].similarity);
  EXPECT_GE(results[1].similarity, results[2].similarity);
}

TEST_F(RetrieverTest, OwnerFilterHidesOtherUsersDocuments) {
  Retriever retriever(embedding_provider_, index_);
  auto results = retriever.retrieve("alpha?", 5, std::nullopt, std::string("bob"));

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].metadata.document_id, "doc3");
}

TEST_F(RetrieverTest, DocumentAndOwnerFiltersMustBothMatch) {
  Retriever retriever(embedding_provider_, index_);

  auto match = retriever.retrieve("q", 5, std::string("doc2"), std::string("alice"));
  ASSERT_EQ(match.size(), 1u);
  EXPECT_EQ(match[0].content, "beta");

  EXPECT_TRUE(retriever.retrieve("q", 5, std::string("doc3"), std::string("alice")).empty());
  EXPECT_TRUE(retriever.retrieve("q", 5, std::string("missing")).empty());
}

TEST_F(RetrieverTest, EmbeddingFailureYieldsNoResults) {
  EXPECT_CALL(*embedding_provider_, embed(_))
      .WillOnce(Throw(EmbeddingUnavailableError("connection refused")));

  Retriever retriever(embedding_provider_, index_);
  EXPECT_TRUE(retriever.retrieve("anything", 5).empty());
}

TEST_F(RetrieverTest, MinSimilarityDropsWeakMatches) {
  Retriever retriever(embedding_provider_, index_, 0.5f);
  auto results = retriever.retrieve("alpha?", 5);

  ASSERT_EQ(results.size(), 2u);
  for (const auto &result : results) {
    EXPECT_GT(result.similarity, 0.5f);
    EXPECT_NE(result.metadata.document_id, "doc2");
  }
}

TEST_F(RetrieverTest, DimensionMismatchPropagates) {
  ON_CALL(*embedding_provider_, embed(_)).WillByDefault(Return(std::vector<float>(4, 0.5f)));

  Retriever retriever(embedding_provider_, index_);
  EXPECT_THROW(retriever.retrieve("q", 5), DimensionMismatchError);
}

TEST_F(RetrieverTest, MakeFilterWithoutConstraintsIsEmpty) {
  EXPECT_FALSE(static_cast<bool>(Retriever::make_filter(std::nullopt, std::nullopt)));

  auto filter = Retriever::make_filter(std::string("doc1"), std::nullopt);
  IndexMetadata metadata;
  metadata.document_id = "doc1";
  EXPECT_TRUE(filter(metadata));
  metadata.document_id = "doc2";
  EXPECT_FALSE(filter(metadata));
}

}  // namespace docmind_tests
