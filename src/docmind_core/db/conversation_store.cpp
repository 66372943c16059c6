#include "docmind_core/db/conversation_store.hpp"

#include <algorithm>

#include "docmind_core/db/pooled_connection.hpp"
#include "docmind_core/utils/time_utils.hpp"

namespace docmind_core {

ConversationStore::ConversationStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

namespace {

void insert_turn(sqlite::database &db, const std::string &owner_id, const std::string &session_id,
                 const ConversationTurn &turn) {
  db << "INSERT INTO conversations (owner_id, session_id, role, content, query_id, "
        "created_at) VALUES (?, ?, ?, ?, ?, ?)"
     << owner_id << session_id << to_string(turn.role) << turn.content
     << turn.query_id.value_or("") << time_point_to_string(turn.timestamp);
}

}  // namespace

void ConversationStore::append(const std::string &owner_id, const std::string &session_id,
                               const ConversationTurn &turn) {
  try {
    PooledConnection conn(db_manager_);
    insert_turn(*conn, owner_id, session_id, turn);
  } catch (const sqlite::sqlite_exception &e) {
    throw ConversationStoreError("append_conversation_turn", e);
  }
}

void ConversationStore::append_exchange(const std::string &owner_id,
                                        const std::string &session_id,
                                        const ConversationTurn &question,
                                        const ConversationTurn &reply) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(conn, TransactionMode::Immediate);
    insert_turn(*conn, owner_id, session_id, question);
    insert_turn(*conn, owner_id, session_id, reply);
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw ConversationStoreError("append_conversation_exchange", e);
  }
}

std::vector<ConversationTurn> ConversationStore::history(const std::string &owner_id,
                                                         const std::string &session_id, int limit) {
  std::vector<ConversationTurn> turns;
  if (limit <= 0) {
    return turns;
  }
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT role, content, query_id, created_at FROM conversations "
             "WHERE owner_id = ? AND session_id = ? ORDER BY id DESC LIMIT ?"
          << owner_id << session_id << limit >>
        [&](std::string role, std::string content, std::string query_id, std::string created_at) {
          ConversationTurn turn;
          turn.role = conversation_role_from_string(role);
          turn.content = content;
          turn.timestamp = string_to_time_point(created_at);
          if (!query_id.empty()) {
            turn.query_id = query_id;
          }
          turns.push_back(std::move(turn));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw ConversationStoreError("conversation_history", e);
  }
  // Newest-first from the query; callers expect chronological order
  std::reverse(turns.begin(), turns.end());
  return turns;
}

int ConversationStore::clear(const std::string &owner_id, const std::string &session_id) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(conn, TransactionMode::Immediate);
    int count = 0;
    *conn << "SELECT count(*) FROM conversations WHERE owner_id = ? AND session_id = ?"
          << owner_id << session_id >>
        count;
    *conn << "DELETE FROM conversations WHERE owner_id = ? AND session_id = ?" << owner_id
          << session_id;
    tx.commit();
    return count;
  } catch (const sqlite::sqlite_exception &e) {
    throw ConversationStoreError("clear_conversation", e);
  }
}

}  // namespace docmind_core
