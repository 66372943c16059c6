#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "docmind_core/services/document_ingestion_service.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

namespace docmind_tests {

using namespace docmind_core;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class DocumentIngestionServiceTest : public DocumentStoreTestBase {
 protected:
  void SetUp() override {
    DocumentStoreTestBase::SetUp();
    registry_ = std::make_shared<TextExtractorRegistry>();
    embedding_provider_ = std::make_shared<NiceMock<MockEmbeddingProvider>>();
    index_ = std::make_shared<VectorIndex>(8);
    pool_ = std::make_shared<async::WorkerPool>(2);
    pool_->start();
    metrics_ = std::make_shared<NiceMock<MockMetricsSink>>();
  }

  void TearDown() override {
    pool_->stop();
    for (const auto &path : temp_files_) {
      std::filesystem::remove(path);
    }
    DocumentStoreTestBase::TearDown();
  }

  std::unique_ptr<DocumentIngestionService> make_service(
      EmbeddingFailurePolicy policy = EmbeddingFailurePolicy::ZeroVector) {
    IngestionOptions options;
    options.embedding_failure_policy = policy;
    return std::make_unique<DocumentIngestionService>(registry_, embedding_provider_, index_,
                                                      document_store_, pool_, metrics_, options);
  }

  std::filesystem::path write_file(const std::string &extension, const std::string &content) {
    auto path = TestUtilities::write_temp_file(extension, content);
    temp_files_.push_back(path);
    return path;
  }

  std::shared_ptr<TextExtractorRegistry> registry_;
  std::shared_ptr<NiceMock<MockEmbeddingProvider>> embedding_provider_;
  std::shared_ptr<VectorIndex> index_;
  std::shared_ptr<async::WorkerPool> pool_;
  std::shared_ptr<NiceMock<MockMetricsSink>> metrics_;
  std::vector<std::filesystem::path> temp_files_;
};

TEST_F(DocumentIngestionServiceTest, IngestsFileIntoIndexAndStore) {
  const std::string text = TestUtilities::create_sentences(1500);
  auto path = write_file(".txt", text);
  EXPECT_CALL(*metrics_, record_document_access("alice", _, DocumentAction::Upload)).Times(1);

  auto service = make_service();
  auto result = service->ingest({path, "notes.txt", "alice"});

  EXPECT_FALSE(result.duplicate);
  EXPECT_GT(result.chunk_count, 1);
  EXPECT_EQ(index_->size(), static_cast<size_t>(result.chunk_count));
  EXPECT_EQ(count_rows("chunks"), result.chunk_count);

  auto stored = document_store_->get_document(result.document_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->owner_id, "alice");
  EXPECT_EQ(stored->filename, "notes.txt");
  EXPECT_EQ(stored->file_type, FileType::Text);
  EXPECT_EQ(stored->file_size, text.size());
  EXPECT_EQ(stored->content_hash, TextExtractor::compute_content_hash(text));
  EXPECT_EQ(document_store_->get_content(result.document_id), text);

  auto results = index_->search(MockUtilities::axis_vector(0), 1);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].metadata.document_id, result.document_id);
  EXPECT_EQ(results[0].metadata.owner_id, "alice");
}

TEST_F(DocumentIngestionServiceTest, FilenameDefaultsToThePathName) {
  auto path = write_file(".md", "# Title\n\n" + TestUtilities::create_sentences(300));

  auto result = make_service()->ingest({path, "", "alice"});

  auto stored = document_store_->get_document(result.document_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->filename, path.filename().string());
  EXPECT_EQ(stored->file_type, FileType::Markdown);
}

TEST_F(DocumentIngestionServiceTest, DuplicateUploadReturnsExistingDocument) {
  const std::string text = TestUtilities::create_sentences(800);
  auto service = make_service();

  auto first = service->ingest_text("alice", "a.txt", FileType::Text, text, text.size());
  auto second = service->ingest_text("alice", "b.txt", FileType::Text, text, text.size());

  EXPECT_TRUE(second.duplicate);
  EXPECT_EQ(second.document_id, first.document_id);
  EXPECT_EQ(second.chunk_count, first.chunk_count);
  EXPECT_EQ(count_rows("documents"), 1);
  EXPECT_EQ(index_->size(), static_cast<size_t>(first.chunk_count));
}

TEST_F(DocumentIngestionServiceTest, SameTextFromAnotherOwnerIsNotADuplicate) {
  const std::string text = TestUtilities::create_sentences(800);
  auto service = make_service();

  auto alice = service->ingest_text("alice", "a.txt", FileType::Text, text, text.size());
  auto bob = service->ingest_text("bob", "a.txt", FileType::Text, text, text.size());

  EXPECT_FALSE(bob.duplicate);
  EXPECT_NE(alice.document_id, bob.document_id);
  EXPECT_EQ(count_rows("documents"), 2);
}

TEST_F(DocumentIngestionServiceTest, UnsupportedExtensionIsRejected) {
  auto path = write_file(".exe", "MZ");
  EXPECT_THROW(make_service()->ingest({path, "", "alice"}), UnsupportedFormatError);
  EXPECT_EQ(count_rows("documents"), 0);
}

TEST_F(DocumentIngestionServiceTest, MissingFileIsAnExtractorError) {
  EXPECT_THROW(make_service()->ingest({"/nonexistent/dir/missing.txt", "", "alice"}),
               TextExtractorError);
}

TEST_F(DocumentIngestionServiceTest, BlankTextIsRejected) {
  auto service = make_service();
  EXPECT_THROW(service->ingest_text("alice", "blank.txt", FileType::Text, "  \n\t ", 5),
               UnsupportedFormatError);
  EXPECT_EQ(index_->size(), 0u);
  EXPECT_EQ(count_rows("documents"), 0);
}

TEST_F(DocumentIngestionServiceTest, ShortTextIsASingleChunk) {
  auto result = make_service()->ingest_text("alice", "short.txt", FileType::Text, " Short note. ", 13);

  EXPECT_EQ(result.chunk_count, 1);
  EXPECT_EQ(index_->get_content(result.document_id), "Short note.");
}

TEST_F(DocumentIngestionServiceTest, ZeroVectorPolicyIndexesFailedChunks) {
  EXPECT_CALL(*embedding_provider_, embed(_))
      .WillRepeatedly(Throw(EmbeddingUnavailableError("model not loaded")));
  const std::string text = TestUtilities::create_sentences(1200);

  auto result = make_service(EmbeddingFailurePolicy::ZeroVector)
                    ->ingest_text("alice", "a.txt", FileType::Text, text, text.size());

  EXPECT_GT(result.chunk_count, 0);
  auto entries = document_store_->load_index_entries();
  ASSERT_EQ(entries.size(), static_cast<size_t>(result.chunk_count));
  for (const auto &entry : entries) {
    EXPECT_EQ(entry.vector, std::vector<float>(8, 0.0f));
  }
}

TEST_F(DocumentIngestionServiceTest, AbortPolicyLeavesNothingBehind) {
  EXPECT_CALL(*embedding_provider_, embed(_))
      .WillOnce(Throw(EmbeddingUnavailableError("connection refused")))
      .WillRepeatedly(Return(MockUtilities::axis_vector(0)));
  EXPECT_CALL(*metrics_, record_document_access(_, _, _)).Times(0);
  const std::string text = TestUtilities::create_sentences(1200);

  EXPECT_THROW(make_service(EmbeddingFailurePolicy::Abort)
                   ->ingest_text("alice", "a.txt", FileType::Text, text, text.size()),
               EmbeddingUnavailableError);

  EXPECT_EQ(index_->size(), 0u);
  EXPECT_EQ(count_rows("documents"), 0);
  EXPECT_EQ(count_rows("chunks"), 0);
}

TEST_F(DocumentIngestionServiceTest, DimensionMismatchLeavesNothingBehind) {
  ON_CALL(*embedding_provider_, embed(_)).WillByDefault(Return(std::vector<float>(16, 0.1f)));
  const std::string text = TestUtilities::create_sentences(800);

  EXPECT_THROW(make_service()->ingest_text("alice", "a.txt", FileType::Text, text, text.size()),
               DimensionMismatchError);
  EXPECT_EQ(index_->size(), 0u);
  EXPECT_EQ(count_rows("documents"), 0);
}

TEST_F(DocumentIngestionServiceTest, StoreFailureRemovesTheDocumentFromTheIndex) {
  const std::string text = TestUtilities::create_sentences(800);
  auto service = make_service();
  service->ingest_text("alice", "a.txt", FileType::Text, text, text.size());
  const size_t indexed = index_->size();

  // Without the chunks table the next save fails after the document is indexed
  {
    PooledConnection conn(*db_manager_);
    *conn << "DROP TABLE chunks";
  }
  const std::string other = TestUtilities::create_sentences(900) + "Different ending.";
  EXPECT_THROW(service->ingest_text("bob", "b.txt", FileType::Text, other, other.size()),
               DocumentStoreError);

  EXPECT_EQ(index_->size(), indexed);
  for (const auto &doc : index_->list_documents()) {
    EXPECT_EQ(doc.owner_id, "alice");
  }
  EXPECT_EQ(count_rows("documents"), 1);
}

TEST(EmbeddingFailurePolicyTest, ParsesConfigNames) {
  EXPECT_EQ(embedding_failure_policy_from_string("zero_vector"), EmbeddingFailurePolicy::ZeroVector);
  EXPECT_EQ(embedding_failure_policy_from_string("abort"), EmbeddingFailurePolicy::Abort);
  EXPECT_THROW(embedding_failure_policy_from_string("retry"), std::invalid_argument);
}

}  // namespace docmind_tests
