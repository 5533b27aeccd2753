#pragma once

#include "recallcpp/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <shared_mutex>
#include <vector>

namespace recallcpp {

struct IndexedEmbedding {
  std::uint32_t chunk_index = 0;
  std::vector<float> embedding{};
};

class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  virtual int dimensions() const = 0;
  // All entries become visible together or not at all.
  virtual void InsertBatch(DocumentId document_id, const std::vector<IndexedEmbedding>& entries) = 0;
  // Idempotent; returns the number of entries removed.
  virtual std::size_t DeleteDocument(DocumentId document_id) = 0;
  // Documents rejected by `allow` are skipped during the scan.
  virtual std::vector<SearchHit> Search(const std::vector<float>& query,
                                        int top_k,
                                        const DocumentIdFilter& allow = {}) const = 0;
  virtual std::size_t size() const = 0;
  virtual std::size_t EntryCount(DocumentId document_id) const = 0;
  // Ordered by (document_id, chunk_index).
  virtual std::vector<VectorEntry> Entries() const = 0;
  // Atomically replaces the whole contents.
  virtual void Replace(const std::vector<VectorEntry>& entries) = 0;
  virtual void Clear() = 0;
};

// Exact linear-scan index. Embeddings are normalized on insert so scores are cosine similarities.
// Readers share a lock; structural mutations take it exclusively.
class FlatVectorIndex final : public VectorIndex {
 public:
  explicit FlatVectorIndex(int dimensions);

  int dimensions() const override;
  void InsertBatch(DocumentId document_id, const std::vector<IndexedEmbedding>& entries) override;
  std::size_t DeleteDocument(DocumentId document_id) override;
  std::vector<SearchHit> Search(const std::vector<float>& query,
                                int top_k,
                                const DocumentIdFilter& allow = {}) const override;
  std::size_t size() const override;
  std::size_t EntryCount(DocumentId document_id) const override;
  std::vector<VectorEntry> Entries() const override;
  void Replace(const std::vector<VectorEntry>& entries) override;
  void Clear() override;

 private:
  // Embeddings of one document stored contiguously, row i belonging to chunk_indices[i].
  struct DocumentSlab {
    std::vector<std::uint32_t> chunk_indices{};
    std::vector<float> values{};
  };

  int dimensions_;
  std::map<DocumentId, DocumentSlab> slabs_{};
  std::size_t entry_count_ = 0;
  mutable std::shared_mutex mutex_{};
};

namespace vector::testing {

void SetInsertFailCountdown(std::uint32_t countdown);
void ClearInsertFailCountdown();

}  // namespace vector::testing

}  // namespace recallcpp
