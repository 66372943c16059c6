#include "docmind_core/db/document_store.hpp"

#include <cstring>
#include <tuple>
#include <iostream>

#include "docmind_core/db/pooled_connection.hpp"
#include "docmind_core/services/compression_service.hpp"
#include "docmind_core/utils/time_utils.hpp"

namespace docmind_core {

namespace {

std::vector<char> vector_to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

std::vector<float> blob_to_vector(const std::vector<char> &blob) {
  std::vector<float> vector(blob.size() / sizeof(float));
  std::memcpy(vector.data(), blob.data(), vector.size() * sizeof(float));
  return vector;
}

DocumentSummary make_summary(const std::string &id, const std::string &owner_id,
                             const std::string &filename, const std::string &file_type,
                             int64_t file_size, const std::string &content_hash,
                             const std::string &uploaded_at, int chunk_count) {
  DocumentSummary summary;
  summary.id = id;
  summary.owner_id = owner_id;
  summary.filename = filename;
  summary.file_type = file_type_from_string(file_type);
  summary.file_size = static_cast<size_t>(file_size);
  summary.content_hash = content_hash;
  summary.uploaded_at = string_to_time_point(uploaded_at);
  summary.chunk_count = chunk_count;
  return summary;
}

}  // namespace

IndexMetadata index_metadata_for(const DocumentSummary &document, int chunk_index) {
  IndexMetadata metadata;
  metadata.document_id = document.id;
  metadata.owner_id = document.owner_id;
  metadata.chunk_index = chunk_index;
  metadata.filename = document.filename;
  metadata.file_type = document.file_type;
  metadata.uploaded_at = time_point_to_iso8601(document.uploaded_at);
  return metadata;
}

DocumentStore::DocumentStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

void DocumentStore::save_document(const Document &document, const std::vector<Chunk> &chunks) {
  try {
    const std::vector<char> compressed_content = CompressionService::compress(document.content);

    PooledConnection conn(db_manager_);
    Transaction tx(conn, TransactionMode::Immediate);

    *conn << "INSERT INTO documents (id, owner_id, filename, file_type, file_size, content_hash, "
             "uploaded_at, chunk_count, content) VALUES (?,?,?,?,?,?,?,?,?)"
          << document.id << document.owner_id << document.filename
          << to_string(document.file_type) << static_cast<int64_t>(document.file_size)
          << document.content_hash << time_point_to_string(document.uploaded_at)
          << static_cast<int>(chunks.size()) << compressed_content;

    for (const auto &chunk : chunks) {
      *conn << "INSERT INTO chunks (document_id, chunk_index, content, vector_blob) "
               "VALUES (?, ?, ?, ?)"
            << document.id << chunk.chunk_index << CompressionService::compress(chunk.content)
            << vector_to_blob(chunk.vector_embedding);
    }

    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError("save_document", e);
  }
}

std::optional<DocumentSummary> DocumentStore::get_document(const std::string &document_id) {
  try {
    std::optional<DocumentSummary> result;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, owner_id, filename, file_type, file_size, content_hash, uploaded_at, "
             "chunk_count FROM documents WHERE id = ?"
          << document_id >>
        [&](std::string id, std::string owner_id, std::string filename, std::string file_type,
            int64_t file_size, std::string content_hash, std::string uploaded_at, int chunk_count) {
          result = make_summary(id, owner_id, filename, file_type, file_size, content_hash,
                                uploaded_at, chunk_count);
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError("get_document", e);
  }
}

std::vector<DocumentSummary> DocumentStore::list_documents(const std::string &owner_id) {
  try {
    std::vector<DocumentSummary> documents;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, owner_id, filename, file_type, file_size, content_hash, uploaded_at, "
             "chunk_count FROM documents WHERE owner_id = ? ORDER BY uploaded_at DESC, rowid DESC"
          << owner_id >>
        [&](std::string id, std::string owner, std::string filename, std::string file_type,
            int64_t file_size, std::string content_hash, std::string uploaded_at, int chunk_count) {
          documents.push_back(make_summary(id, owner, filename, file_type, file_size,
                                           content_hash, uploaded_at, chunk_count));
        };
    return documents;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError("list_documents", e);
  }
}

CorpusStats DocumentStore::corpus_stats(std::chrono::system_clock::time_point since) {
  try {
    CorpusStats stats;
    PooledConnection conn(db_manager_);
    *conn << "SELECT count(*), count(DISTINCT owner_id) FROM documents" >>
        std::tie(stats.total_documents, stats.total_owners);
    *conn << "SELECT count(*) FROM chunks" >> stats.total_chunks;
    *conn << "SELECT count(*) FROM documents WHERE uploaded_at >= ?"
          << time_point_to_string(since) >>
        stats.recent_uploads;
    return stats;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError("corpus_stats", e);
  }
}

std::optional<std::string> DocumentStore::find_by_hash(const std::string &owner_id,
                                                       const std::string &content_hash) {
  try {
    std::optional<std::string> result;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id FROM documents WHERE owner_id = ? AND content_hash = ? LIMIT 1"
          << owner_id << content_hash >>
        [&](std::string id) { result = id; };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError("find_by_hash", e);
  }
}

std::optional<std::string> DocumentStore::get_content(const std::string &document_id) {
  try {
    std::optional<std::vector<char>> compressed;
    {
      PooledConnection conn(db_manager_);
      *conn << "SELECT content FROM documents WHERE id = ?" << document_id >>
          [&](std::vector<char> content) { compressed = std::move(content); };
    }
    if (!compressed) {
      return std::nullopt;
    }
    return CompressionService::decompress(*compressed);
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError("get_content", e);
  }
}

bool DocumentStore::delete_document(const std::string &document_id) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(conn, TransactionMode::Immediate);

    bool exists = false;
    *conn << "SELECT 1 FROM documents WHERE id = ? LIMIT 1" << document_id >>
        [&](int /*dummy*/) { exists = true; };
    if (!exists) {
      return false;
    }

    *conn << "DELETE FROM chunks WHERE document_id = ?" << document_id;
    *conn << "DELETE FROM documents WHERE id = ?" << document_id;
    tx.commit();
    return true;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError("delete_document", e);
  }
}

std::vector<IndexEntry> DocumentStore::load_index_entries() {
  try {
    std::vector<IndexEntry> entries;
    PooledConnection conn(db_manager_);
    *conn << "SELECT c.document_id, c.chunk_index, c.content, c.vector_blob, d.owner_id, "
             "d.filename, d.file_type, d.uploaded_at "
             "FROM chunks c JOIN documents d ON d.id = c.document_id "
             "ORDER BY c.document_id, c.chunk_index" >>
        [&](std::string document_id, int chunk_index, std::vector<char> content,
            std::vector<char> vector_blob, std::string owner_id, std::string filename,
            std::string file_type, std::string uploaded_at) {
          IndexEntry entry;
          entry.chunk_id = make_chunk_id(document_id, chunk_index);
          entry.vector = blob_to_vector(vector_blob);
          entry.content = CompressionService::decompress(content);
          entry.metadata.document_id = document_id;
          entry.metadata.owner_id = owner_id;
          entry.metadata.chunk_index = chunk_index;
          entry.metadata.filename = filename;
          entry.metadata.file_type = file_type_from_string(file_type);
          entry.metadata.uploaded_at = time_point_to_iso8601(string_to_time_point(uploaded_at));
          entries.push_back(std::move(entry));
        };
    std::cout << "Loaded " << entries.size() << " chunk entries from the document store"
              << std::endl;
    return entries;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError("load_index_entries", e);
  }
}

}  // namespace docmind_core
