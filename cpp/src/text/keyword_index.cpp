#include "recallcpp/keyword_index.hpp"
#include "recallcpp/errors.hpp"
#include "recallcpp/logging.hpp"

#include <sqlite3.h>

#include <cctype>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace recallcpp {
namespace {

StorageError SqliteError(sqlite3* db, const std::string& what) {
  return StorageError("keyword_index: " + what + ": " + (db != nullptr ? sqlite3_errmsg(db) : "no database"));
}

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens{};
  std::string current{};
  current.reserve(32);

  for (const unsigned char ch : text) {
    if (std::isalnum(ch) != 0) {
      current.push_back(static_cast<char>(std::tolower(ch)));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
      current.reserve(32);
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

class Statement final {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw SqliteError(db_, "prepare failed");
    }
  }

  ~Statement() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return stmt_; }

 private:
  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

void Exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  std::string message = err != nullptr ? err : "sqlite exec failed";
  if (err != nullptr) {
    sqlite3_free(err);
  }
  throw StorageError("keyword_index: " + message);
}

void RollbackAfterFailure(sqlite3* db) {
  if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
    log::Logger()->warn("keyword_index: rollback failed: {}", sqlite3_errmsg(db));
  }
}

// Runs `body` inside BEGIN IMMEDIATE / COMMIT, rolling back and rethrowing on failure.
template <typename Body>
void InTransaction(sqlite3* db, Body&& body) {
  Exec(db, "BEGIN IMMEDIATE TRANSACTION;");
  try {
    body();
    Exec(db, "COMMIT;");
  } catch (const std::exception&) {
    RollbackAfterFailure(db);
    throw;
  }
}

std::string BuildFtsMatchQuery(const std::vector<std::string>& query_tokens_raw) {
  std::unordered_set<std::string> seen{};
  std::string query{};
  for (const auto& token : query_tokens_raw) {
    if (!seen.insert(token).second) {
      continue;
    }
    if (!query.empty()) {
      query.append(" OR ");
    }
    query.push_back('"');
    query.append(token);
    query.push_back('"');
  }
  return query;
}

void InsertRow(sqlite3* db, sqlite3_stmt* stmt, DocumentId document_id, std::uint32_t chunk_index, const std::string& body) {
  sqlite3_reset(stmt);
  sqlite3_clear_bindings(stmt);
  if (sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(document_id)) != SQLITE_OK ||
      sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(chunk_index)) != SQLITE_OK ||
      sqlite3_bind_text(stmt, 3, body.c_str(), static_cast<int>(body.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
    throw SqliteError(db, "bind failed");
  }
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    throw SqliteError(db, "insert failed");
  }
}

}  // namespace

struct KeywordIndex::SQLiteState {
  sqlite3* db = nullptr;

  ~SQLiteState() {
    if (db != nullptr) {
      sqlite3_close(db);
      db = nullptr;
    }
  }
};

KeywordIndex::KeywordIndex() : sqlite_(std::make_unique<SQLiteState>()) {
  if (sqlite3_open_v2(":memory:",
                      &sqlite_->db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                      nullptr) != SQLITE_OK) {
    throw SqliteError(sqlite_->db, "open failed");
  }
  Exec(sqlite_->db, "PRAGMA journal_mode=OFF;");
  Exec(sqlite_->db, "PRAGMA synchronous=OFF;");
  Exec(sqlite_->db,
       "CREATE TABLE IF NOT EXISTS chunk_docs("
       "id INTEGER PRIMARY KEY,"
       "document_id INTEGER NOT NULL,"
       "chunk_index INTEGER NOT NULL,"
       "body TEXT NOT NULL,"
       "UNIQUE(document_id, chunk_index)"
       ");");
  Exec(sqlite_->db,
       "CREATE VIRTUAL TABLE IF NOT EXISTS chunk_docs_fts USING fts5("
       "body,"
       "content='chunk_docs',"
       "content_rowid='id',"
       "tokenize='unicode61 remove_diacritics 0'"
       ");");
  Exec(sqlite_->db,
       "CREATE TRIGGER IF NOT EXISTS chunk_docs_ai AFTER INSERT ON chunk_docs BEGIN "
       "INSERT INTO chunk_docs_fts(rowid, body) VALUES(new.id, new.body); "
       "END;");
  Exec(sqlite_->db,
       "CREATE TRIGGER IF NOT EXISTS chunk_docs_ad AFTER DELETE ON chunk_docs BEGIN "
       "INSERT INTO chunk_docs_fts(chunk_docs_fts, rowid, body) VALUES('delete', old.id, old.body); "
       "END;");
}

KeywordIndex::~KeywordIndex() = default;

void KeywordIndex::InsertBatch(DocumentId document_id, const std::vector<std::string>& chunk_texts) {
  if (chunk_texts.empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3* db = sqlite_->db;
  InTransaction(db, [&] {
    Statement insert_stmt(db, "INSERT INTO chunk_docs(document_id, chunk_index, body) VALUES(?1, ?2, ?3);");
    for (std::size_t i = 0; i < chunk_texts.size(); ++i) {
      InsertRow(db, insert_stmt.get(), document_id, static_cast<std::uint32_t>(i), chunk_texts[i]);
    }
  });
}

std::size_t KeywordIndex::DeleteDocument(DocumentId document_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3* db = sqlite_->db;
  Statement delete_stmt(db, "DELETE FROM chunk_docs WHERE document_id = ?1;");
  if (sqlite3_bind_int64(delete_stmt.get(), 1, static_cast<sqlite3_int64>(document_id)) != SQLITE_OK) {
    throw SqliteError(db, "bind failed");
  }
  if (sqlite3_step(delete_stmt.get()) != SQLITE_DONE) {
    throw SqliteError(db, "delete failed");
  }
  return static_cast<std::size_t>(sqlite3_changes(db));
}

std::vector<SearchHit> KeywordIndex::Search(const std::string& query,
                                            int top_k,
                                            const DocumentIdFilter& allow) const {
  if (top_k < 0) {
    throw InvalidArgumentError("keyword_index: top_k must be non-negative");
  }
  if (top_k == 0) {
    return {};
  }
  const auto fts_query = BuildFtsMatchQuery(Tokenize(query));
  if (fts_query.empty()) {
    return {};
  }

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3* db = sqlite_->db;
  Statement select_stmt(db,
                        "SELECT d.document_id, d.chunk_index, bm25(chunk_docs_fts) AS rank "
                        "FROM chunk_docs_fts JOIN chunk_docs d ON d.id = chunk_docs_fts.rowid "
                        "WHERE chunk_docs_fts MATCH ?1 "
                        "ORDER BY rank ASC, d.document_id ASC, d.chunk_index ASC "
                        "LIMIT ?2;");
  if (sqlite3_bind_text(select_stmt.get(), 1, fts_query.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
      sqlite3_bind_int(select_stmt.get(), 2, allow ? -1 : top_k) != SQLITE_OK) {
    throw SqliteError(db, "bind failed");
  }

  std::vector<SearchHit> hits{};
  while (hits.size() < static_cast<std::size_t>(top_k)) {
    const int rc = sqlite3_step(select_stmt.get());
    if (rc == SQLITE_DONE) {
      break;
    }
    if (rc != SQLITE_ROW) {
      throw SqliteError(db, "search step failed");
    }
    SearchHit hit{};
    hit.document_id = static_cast<DocumentId>(sqlite3_column_int64(select_stmt.get(), 0));
    if (allow && !allow(hit.document_id)) {
      continue;
    }
    hit.chunk_index = static_cast<std::uint32_t>(sqlite3_column_int64(select_stmt.get(), 1));
    hit.score = static_cast<float>(-sqlite3_column_double(select_stmt.get(), 2));
    hits.push_back(hit);
  }
  return hits;
}

std::size_t KeywordIndex::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement count_stmt(sqlite_->db, "SELECT COUNT(*) FROM chunk_docs;");
  if (sqlite3_step(count_stmt.get()) != SQLITE_ROW) {
    throw SqliteError(sqlite_->db, "count failed");
  }
  return static_cast<std::size_t>(sqlite3_column_int64(count_stmt.get(), 0));
}

void KeywordIndex::Replace(const std::vector<Chunk>& chunks) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3* db = sqlite_->db;
  InTransaction(db, [&] {
    Exec(db, "DELETE FROM chunk_docs;");
    Statement insert_stmt(db, "INSERT INTO chunk_docs(document_id, chunk_index, body) VALUES(?1, ?2, ?3);");
    for (const auto& chunk : chunks) {
      InsertRow(db, insert_stmt.get(), chunk.document_id, chunk.chunk_index, chunk.text);
    }
  });
}

void KeywordIndex::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  Exec(sqlite_->db, "DELETE FROM chunk_docs;");
}

}  // namespace recallcpp
