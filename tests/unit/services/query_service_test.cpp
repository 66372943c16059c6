#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "docmind_core/services/document_ingestion_service.hpp"
#include "docmind_core/services/query_service.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

namespace docmind_tests {

using namespace docmind_core;
using MockUtilities::axis_vector;
using ::testing::_;
using ::testing::AnyOf;
using ::testing::DoAll;
using ::testing::FloatEq;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;

class QueryServiceTest : public DocumentStoreTestBase {
 protected:
  void SetUp() override {
    DocumentStoreTestBase::SetUp();
    embedding_provider_ = std::make_shared<NiceMock<MockEmbeddingProvider>>();
    completion_provider_ = std::make_shared<NiceMock<MockCompletionProvider>>();
    metrics_ = std::make_shared<NiceMock<MockMetricsSink>>();
    index_ = std::make_shared<VectorIndex>(8);

    auto retriever = std::make_shared<Retriever>(embedding_provider_, index_);
    auto synthesizer = std::make_shared<ResponseSynthesizer>(completion_provider_);
    service_ = std::make_unique<QueryService>(retriever, synthesizer, conversation_store_, metrics_);
  }

  void add_chunk(const std::string &doc, const std::string &owner, int chunk_index,
                 const std::string &content, size_t axis, const std::string &filename = "notes.txt") {
    index_->add(TestUtilities::make_index_entry(doc, owner, chunk_index, content, axis_vector(axis),
                                                filename));
  }

  QueryRequest request(const std::string &query, const std::string &owner = "alice") {
    QueryRequest req;
    req.query = query;
    req.owner_id = owner;
    return req;
  }

  std::shared_ptr<NiceMock<MockEmbeddingProvider>> embedding_provider_;
  std::shared_ptr<NiceMock<MockCompletionProvider>> completion_provider_;
  std::shared_ptr<NiceMock<MockMetricsSink>> metrics_;
  std::shared_ptr<VectorIndex> index_;
  std::unique_ptr<QueryService> service_;
};

TEST_F(QueryServiceTest, SingleChunkDocumentIsAnswered) {
  add_chunk("doc1", "alice", 0, "The warranty covers parts and labour for two years.", 0,
            "warranty.txt");
  ON_CALL(*embedding_provider_, embed(_)).WillByDefault(Return(axis_vector(0)));

  auto response = service_->answer(request("How long is the warranty?"));

  EXPECT_EQ(response.status, QueryStatus::Answered);
  ASSERT_EQ(response.sources.size(), 1u);
  EXPECT_EQ(response.sources[0].filename, "warranty.txt");
  EXPECT_EQ(response.sources[0].chunk_id, make_chunk_id("doc1", 0));
  EXPECT_NEAR(response.sources[0].similarity_score, 1.0f, 1e-4);
  EXPECT_EQ(response.sources[0].preview, "The warranty covers parts and labour for two years.");
  ASSERT_TRUE(response.document_searched.has_value());
  EXPECT_EQ(*response.document_searched, "warranty.txt");
  EXPECT_THAT(response.answer, HasSubstr("Mock answer."));
  EXPECT_THAT(response.answer, HasSubstr("1. warranty.txt (Relevance: 100.0%)"));
  EXPECT_FALSE(response.query_id.empty());
  EXPECT_FALSE(response.timestamp.empty());
}

TEST_F(QueryServiceTest, CapitalOfFranceReachesThePromptAndIsScored) {
  add_chunk("geo", "alice", 0, "Paris is the capital of France.", 0, "geo.txt");
  add_chunk("geo", "alice", 1, "Lyon is known for its cuisine.", 1, "geo.txt");
  ON_CALL(*embedding_provider_, embed(_)).WillByDefault(Return(axis_vector(0)));

  std::string prompt;
  EXPECT_CALL(*completion_provider_, complete(_, _))
      .WillOnce(DoAll(SaveArg<0>(&prompt), Return(std::string("The capital of France is Paris."))));

  auto response = service_->answer(request("What is the capital of France?"));

  EXPECT_THAT(prompt, HasSubstr("Document 1: geo.txt"));
  EXPECT_THAT(prompt, HasSubstr("Content: Paris is the capital of France."));
  EXPECT_THAT(prompt, HasSubstr("What is the capital of France?"));
  EXPECT_EQ(response.status, QueryStatus::Answered);
  EXPECT_EQ(response.sources.size(), 2u);
  EXPECT_EQ(response.sources[0].preview, "Paris is the capital of France.");
  EXPECT_THAT(response.confidence, AnyOf(FloatEq(0.5f), FloatEq(0.75f), FloatEq(0.85f),
                                         FloatEq(0.95f)));
}

TEST_F(QueryServiceTest, UnknownDocumentFilterGivesEmptyRetrieval) {
  add_chunk("doc1", "alice", 0, "Some content that matches.", 0);
  EXPECT_CALL(*completion_provider_, complete(_, _)).Times(0);

  QueryRequest req = request("What is in the document?");
  req.document_id = "does-not-exist";
  auto response = service_->answer(req);

  EXPECT_EQ(response.status, QueryStatus::EmptyRetrieval);
  EXPECT_EQ(response.answer, QueryService::NO_RELEVANT_INFORMATION_ANSWER);
  EXPECT_FLOAT_EQ(response.confidence, 0.0f);
  EXPECT_TRUE(response.sources.empty());
  EXPECT_FALSE(response.document_searched.has_value());
}

TEST_F(QueryServiceTest, UnavailableSynthesisFallsBackWithoutThrowing) {
  add_chunk("doc1", "alice", 0, "Some content that matches.", 0);
  ON_CALL(*completion_provider_, complete(_, _))
      .WillByDefault(Throw(SynthesisUnavailableError("request timed out")));

  QueryResponse response;
  EXPECT_NO_THROW(response = service_->answer(request("What is in the document?")));

  EXPECT_EQ(response.status, QueryStatus::SynthesisUnavailable);
  EXPECT_EQ(response.answer, ResponseSynthesizer::FALLBACK_ANSWER);
  EXPECT_FLOAT_EQ(response.confidence, 0.0f);
  // Retrieved sources are still reported
  EXPECT_EQ(response.sources.size(), 1u);
}

TEST_F(QueryServiceTest, OtherOwnersChunksAreNeverRetrieved) {
  add_chunk("bob_doc", "bob", 0, "Bob's private notes.", 0);

  auto response = service_->answer(request("What are Bob's notes?", "alice"));

  EXPECT_EQ(response.status, QueryStatus::EmptyRetrieval);
  EXPECT_TRUE(response.sources.empty());
}

TEST_F(QueryServiceTest, PreviewIsTruncatedToTwoHundredCodePoints) {
  add_chunk("doc1", "alice", 0, std::string(250, 'x'), 0);

  auto response = service_->answer(request("x?"));

  ASSERT_EQ(response.sources.size(), 1u);
  EXPECT_EQ(response.sources[0].preview, std::string(200, 'x') + "...");
}

TEST_F(QueryServiceTest, InvalidRequestsAreRejected) {
  QueryRequest zero = request("question");
  zero.max_results = 0;
  EXPECT_THROW(service_->answer(zero), std::invalid_argument);

  QueryRequest negative = request("question");
  negative.max_results = -3;
  EXPECT_THROW(service_->answer(negative), std::invalid_argument);

  EXPECT_THROW(service_->answer(request("   ")), std::invalid_argument);
}

TEST_F(QueryServiceTest, SessionExchangeIsRecordedAndReused) {
  add_chunk("doc1", "alice", 0, "Paris is the capital of France.", 0, "geo.txt");

  QueryRequest first = request("What is the capital of France?");
  first.session_id = "session-1";
  auto first_response = service_->answer(first);
  EXPECT_TRUE(first_response.conversation_updated);

  auto history = conversation_store_->history("alice", "session-1");
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].role, ConversationRole::User);
  EXPECT_EQ(history[0].content, "What is the capital of France?");
  EXPECT_EQ(history[1].role, ConversationRole::Assistant);
  EXPECT_EQ(history[1].content, first_response.answer);
  ASSERT_TRUE(history[1].query_id.has_value());
  EXPECT_EQ(*history[1].query_id, first_response.query_id);

  std::string prompt;
  EXPECT_CALL(*completion_provider_, complete(_, _))
      .WillOnce(DoAll(SaveArg<0>(&prompt), Return(std::string("About two million."))));
  QueryRequest follow_up = request("And its population?");
  follow_up.session_id = "session-1";
  service_->answer(follow_up);

  EXPECT_THAT(prompt, HasSubstr("Previous conversation:"));
  EXPECT_THAT(prompt, HasSubstr("- user: What is the capital of France?"));
  EXPECT_EQ(conversation_store_->history("alice", "session-1").size(), 4u);
}

TEST_F(QueryServiceTest, FailedReplyIsNotRecordedAsHalfAnExchange) {
  add_chunk("doc1", "alice", 0, "Paris is the capital of France.", 0, "geo.txt");
  reject_assistant_turns();

  QueryRequest req = request("What is the capital of France?");
  req.session_id = "session-1";
  auto response = service_->answer(req);

  EXPECT_FALSE(response.conversation_updated);
  EXPECT_EQ(count_rows("conversations"), 0);
}

TEST_F(QueryServiceTest, NoSessionMeansNoConversationUpdate) {
  add_chunk("doc1", "alice", 0, "Content.", 0);
  auto response = service_->answer(request("What?"));
  EXPECT_FALSE(response.conversation_updated);
  EXPECT_EQ(count_rows("conversations"), 0);
}

TEST_F(QueryServiceTest, RecordsQueryMetrics) {
  add_chunk("doc1", "alice", 0, "Content.", 0);

  EXPECT_CALL(*metrics_, record_query(::testing::AllOf(
                             ::testing::Field(&QueryEvent::owner_id, "alice"),
                             ::testing::Field(&QueryEvent::query, "What is here?"))))
      .Times(1);
  EXPECT_CALL(*metrics_, record_document_access("alice", "doc1", DocumentAction::Query)).Times(1);

  QueryRequest req = request("What is here?");
  req.document_id = "doc1";
  service_->answer(req);
}

TEST_F(QueryServiceTest, IngestedDocumentIsRetrievable) {
  auto registry = std::make_shared<TextExtractorRegistry>();
  auto pool = std::make_shared<async::WorkerPool>(2);
  pool->start();
  DocumentIngestionService ingestion(registry, embedding_provider_, index_, document_store_, pool,
                                     metrics_);

  const std::string text = TestUtilities::create_sentences(700);
  auto ingested = ingestion.ingest_text("alice", "sentences.txt", FileType::Text, text, text.size());
  pool->stop();

  QueryRequest req = request("Which sentence number?");
  req.document_id = ingested.document_id;
  auto response = service_->answer(req);

  EXPECT_EQ(response.status, QueryStatus::Answered);
  EXPECT_FALSE(response.sources.empty());
  for (const auto &source : response.sources) {
    EXPECT_EQ(source.filename, "sentences.txt");
  }
}

TEST_F(QueryServiceTest, ParisDocumentEndToEnd) {
  auto pool = std::make_shared<async::WorkerPool>(1);
  pool->start();
  DocumentIngestionService ingestion(std::make_shared<TextExtractorRegistry>(),
                                     embedding_provider_, index_, document_store_, pool, metrics_);

  const std::string text = "Paris is the capital of France. It has a population of over 2 million.";
  auto ingested = ingestion.ingest_text("alice", "paris.txt", FileType::Text, "  " + text + "\n",
                                        text.size() + 3);
  pool->stop();

  ASSERT_EQ(ingested.chunk_count, 1);
  EXPECT_EQ(index_->get_content(ingested.document_id), text);

  std::string prompt;
  EXPECT_CALL(*completion_provider_, complete(_, _))
      .WillOnce(DoAll(SaveArg<0>(&prompt), Return(std::string("Paris."))));

  QueryRequest req = request("What is the capital of France?");
  req.max_results = 5;
  auto response = service_->answer(req);

  ASSERT_EQ(response.sources.size(), 1u);
  EXPECT_GT(response.sources[0].similarity_score, 0.0f);
  EXPECT_THAT(prompt, HasSubstr("Document 1: paris.txt"));
  EXPECT_THAT(response.confidence, AnyOf(FloatEq(0.5f), FloatEq(0.75f), FloatEq(0.85f),
                                         FloatEq(0.95f)));
}

TEST(QueryStatusTest, Names) {
  EXPECT_EQ(to_string(QueryStatus::Answered), "answered");
  EXPECT_EQ(to_string(QueryStatus::EmptyRetrieval), "empty_retrieval");
  EXPECT_EQ(to_string(QueryStatus::SynthesisUnavailable), "synthesis_unavailable");
}

}  // namespace docmind_tests
