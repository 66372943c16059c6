#pragma once

#include <string>
#include <vector>

#include "docmind_core/db/database_manager.hpp"
#include "docmind_core/db/db_error.hpp"
#include "docmind_core/types/conversation.hpp"

namespace docmind_core {

class ConversationStoreError : public DbError {
 public:
  using DbError::DbError;
};

// Append-only conversation turns, keyed by (owner, session)
class ConversationStore {
 public:
  static constexpr int DEFAULT_HISTORY_LIMIT = 10;

  explicit ConversationStore(DatabaseManager &db_manager);

  ConversationStore(const ConversationStore &) = delete;
  ConversationStore &operator=(const ConversationStore &) = delete;

  void append(const std::string &owner_id, const std::string &session_id,
              const ConversationTurn &turn);

  // Appends the question and its reply atomically: either both turns are stored or neither
  void append_exchange(const std::string &owner_id, const std::string &session_id,
                       const ConversationTurn &question, const ConversationTurn &reply);

  // The most recent `limit` turns, oldest first
  std::vector<ConversationTurn> history(const std::string &owner_id, const std::string &session_id,
                                        int limit = DEFAULT_HISTORY_LIMIT);

  // Deletes the session's turns and returns how many there were
  int clear(const std::string &owner_id, const std::string &session_id);

 private:
  DatabaseManager &db_manager_;
};

}  // namespace docmind_core
