#pragma once

#include "recallcpp/types.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace recallcpp {

// Full-text index over chunk texts backed by an in-memory SQLite FTS5 table. Scores are negated
// BM25 ranks, so higher is better. All SQLite failures surface as StorageError.
class KeywordIndex {
 public:
  KeywordIndex();
  ~KeywordIndex();
  KeywordIndex(const KeywordIndex&) = delete;
  KeywordIndex& operator=(const KeywordIndex&) = delete;

  // chunk_texts[i] is stored as chunk i of `document_id`, in a single transaction.
  void InsertBatch(DocumentId document_id, const std::vector<std::string>& chunk_texts);
  std::size_t DeleteDocument(DocumentId document_id);
  // Rows of documents rejected by `allow` are skipped before the top_k cut.
  [[nodiscard]] std::vector<SearchHit> Search(const std::string& query,
                                              int top_k,
                                              const DocumentIdFilter& allow = {}) const;
  [[nodiscard]] std::size_t size() const;
  void Replace(const std::vector<Chunk>& chunks);
  void Clear();

 private:
  struct SQLiteState;

  std::unique_ptr<SQLiteState> sqlite_;
  mutable std::mutex mutex_{};
};

}  // namespace recallcpp
