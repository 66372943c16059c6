#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docmind_core/db/conversation_store.hpp"
#include "docmind_core/db/database_manager.hpp"
#include "docmind_core/db/document_store.hpp"
#include "docmind_core/db/pooled_connection.hpp"
#include "docmind_core/index/vector_index.hpp"
#include "docmind_core/types/chunk.hpp"
#include "docmind_core/types/document.hpp"

namespace docmind_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Database utilities
  static std::filesystem::path create_temp_test_db();
  static void cleanup_temp_db(const std::filesystem::path& db_path);

  // Writes content to a uniquely named file in the temp test directory
  static std::filesystem::path write_temp_file(const std::string& extension,
                                               const std::string& content);

  // Deterministic unit-length vector derived from the seed text
  static std::vector<float> create_test_vector(const std::string& seed_text, size_t dimension = 8);

  static docmind_core::Document create_test_document(const std::string& id,
                                                     const std::string& owner_id,
                                                     const std::string& content,
                                                     const std::string& filename = "notes.txt");

  static std::vector<docmind_core::Chunk> create_test_chunks(const std::string& document_id,
                                                             int count, size_t dimension = 8);

  static docmind_core::IndexEntry make_index_entry(const std::string& document_id,
                                                   const std::string& owner_id, int chunk_index,
                                                   const std::string& content,
                                                   const std::vector<float>& vector,
                                                   const std::string& filename = "notes.txt");

  // Text of roughly the requested length built from numbered sentences
  static std::string create_sentences(size_t approximate_length);
};

/**
 * Base test fixture that provides a fresh encrypted database with both stores
 */
class DocumentStoreTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_db_path_ = TestUtilities::create_temp_test_db();
    db_manager_ = std::make_unique<docmind_core::DatabaseManager>();
    db_manager_->initialize(temp_db_path_, "docmind_test_key", /*pool_size*/ 4);
    document_store_ = std::make_shared<docmind_core::DocumentStore>(*db_manager_);
    conversation_store_ = std::make_shared<docmind_core::ConversationStore>(*db_manager_);
  }

  void TearDown() override {
    document_store_.reset();
    conversation_store_.reset();
    db_manager_->shutdown();
    db_manager_.reset();
    TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  int count_rows(const std::string& table) {
    docmind_core::PooledConnection conn(*db_manager_);
    int count = 0;
    *conn << "SELECT count(*) FROM " + table >> count;
    return count;
  }

  // Persists and indexes a document the way ingestion does
  void add_indexed_document(docmind_core::VectorIndex& index, const std::string& id,
                            const std::string& owner, int chunk_count) {
    auto document = TestUtilities::create_test_document(id, owner, "Full text of " + id);
    document.chunk_count = chunk_count;
    auto chunks = TestUtilities::create_test_chunks(id, chunk_count);

    std::vector<docmind_core::IndexEntry> entries;
    for (const auto& chunk : chunks) {
      entries.push_back({docmind_core::make_chunk_id(id, chunk.chunk_index),
                         chunk.vector_embedding,
                         docmind_core::index_metadata_for(document, chunk.chunk_index),
                         chunk.content});
    }
    index.add_document(entries);
    document_store_->save_document(document, chunks);
  }

  void execute(const std::string& sql) {
    docmind_core::PooledConnection conn(*db_manager_);
    *conn << sql;
  }

  // Makes every insert of an assistant turn fail inside SQLite
  void reject_assistant_turns() {
    execute(
        "CREATE TRIGGER reject_assistant BEFORE INSERT ON conversations "
        "WHEN NEW.role = 'assistant' BEGIN SELECT RAISE(ABORT, 'assistant turns rejected'); END;");
  }

  std::filesystem::path temp_db_path_;
  std::unique_ptr<docmind_core::DatabaseManager> db_manager_;
  std::shared_ptr<docmind_core::DocumentStore> document_store_;
  std::shared_ptr<docmind_core::ConversationStore> conversation_store_;
};

}  // namespace docmind_tests
