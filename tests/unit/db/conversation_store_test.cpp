#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "utilities_test.hpp"

namespace docmind_tests {

using namespace docmind_core;

class ConversationStoreTest : public DocumentStoreTestBase {
 protected:
  ConversationTurn turn(ConversationRole role, const std::string &content,
                        std::optional<std::string> query_id = std::nullopt) {
    ConversationTurn t;
    t.role = role;
    t.content = content;
    t.timestamp = std::chrono::time_point_cast<std::chrono::seconds>(
        std::chrono::system_clock::now());
    t.query_id = std::move(query_id);
    return t;
  }
};

TEST_F(ConversationStoreTest, EmptySessionHasNoHistory) {
  EXPECT_TRUE(conversation_store_->history("alice", "s1").empty());
}

TEST_F(ConversationStoreTest, HistoryIsOldestFirst) {
  conversation_store_->append("alice", "s1", turn(ConversationRole::User, "question", "q1"));
  conversation_store_->append("alice", "s1", turn(ConversationRole::Assistant, "answer", "q1"));

  auto history = conversation_store_->history("alice", "s1");
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].role, ConversationRole::User);
  EXPECT_EQ(history[0].content, "question");
  EXPECT_EQ(history[1].role, ConversationRole::Assistant);
  EXPECT_EQ(history[1].content, "answer");
  ASSERT_TRUE(history[1].query_id.has_value());
  EXPECT_EQ(*history[1].query_id, "q1");
}

TEST_F(ConversationStoreTest, LimitKeepsTheMostRecentTurns) {
  for (int i = 0; i < 15; ++i) {
    conversation_store_->append("alice", "s1",
                                turn(ConversationRole::User, "message " + std::to_string(i)));
  }

  auto history = conversation_store_->history("alice", "s1");
  ASSERT_EQ(history.size(), static_cast<size_t>(ConversationStore::DEFAULT_HISTORY_LIMIT));
  EXPECT_EQ(history.front().content, "message 5");
  EXPECT_EQ(history.back().content, "message 14");

  auto last_three = conversation_store_->history("alice", "s1", 3);
  ASSERT_EQ(last_three.size(), 3u);
  EXPECT_EQ(last_three.front().content, "message 12");

  EXPECT_TRUE(conversation_store_->history("alice", "s1", 0).empty());
}

TEST_F(ConversationStoreTest, SessionsAreIsolatedByOwner) {
  conversation_store_->append("alice", "shared", turn(ConversationRole::User, "alice's"));
  conversation_store_->append("bob", "shared", turn(ConversationRole::User, "bob's"));

  auto alice_history = conversation_store_->history("alice", "shared");
  ASSERT_EQ(alice_history.size(), 1u);
  EXPECT_EQ(alice_history[0].content, "alice's");
}

TEST_F(ConversationStoreTest, ClearReturnsDeletedCount) {
  conversation_store_->append("alice", "s1", turn(ConversationRole::User, "one"));
  conversation_store_->append("alice", "s1", turn(ConversationRole::Assistant, "two"));
  conversation_store_->append("alice", "s2", turn(ConversationRole::User, "other session"));

  EXPECT_EQ(conversation_store_->clear("alice", "s1"), 2);
  EXPECT_EQ(conversation_store_->clear("alice", "s1"), 0);
  EXPECT_TRUE(conversation_store_->history("alice", "s1").empty());
  EXPECT_EQ(conversation_store_->history("alice", "s2").size(), 1u);
  EXPECT_EQ(count_rows("conversations"), 1);
}

TEST_F(ConversationStoreTest, ExchangeStoresQuestionAndReplyTogether) {
  conversation_store_->append_exchange("alice", "s1", turn(ConversationRole::User, "q", "q1"),
                                       turn(ConversationRole::Assistant, "a", "q1"));

  auto history = conversation_store_->history("alice", "s1");
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].role, ConversationRole::User);
  EXPECT_EQ(history[1].role, ConversationRole::Assistant);
}

TEST_F(ConversationStoreTest, FailedReplyLeavesNoOrphanQuestion) {
  reject_assistant_turns();

  try {
    conversation_store_->append_exchange("alice", "s1", turn(ConversationRole::User, "q", "q1"),
                                         turn(ConversationRole::Assistant, "a", "q1"));
    FAIL() << "Expected ConversationStoreError";
  } catch (const ConversationStoreError &e) {
    EXPECT_EQ(e.kind(), DbErrorKind::Constraint);
    EXPECT_THAT(std::string(e.what()), ::testing::HasSubstr("append_conversation_exchange"));
  }
  EXPECT_EQ(count_rows("conversations"), 0);
}

TEST_F(ConversationStoreTest, BorrowingAfterShutdownIsAnUnavailableDatabase) {
  db_manager_->shutdown();
  try {
    conversation_store_->history("alice", "s1");
    FAIL() << "Expected DbError";
  } catch (const DbError &e) {
    EXPECT_EQ(e.kind(), DbErrorKind::Unavailable);
  }
}

}  // namespace docmind_tests
