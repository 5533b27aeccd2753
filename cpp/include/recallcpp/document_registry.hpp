#pragma once

#include "recallcpp/cancellation.hpp"
#include "recallcpp/embeddings.hpp"
#include "recallcpp/extractors.hpp"
#include "recallcpp/keyword_index.hpp"
#include "recallcpp/snapshot_format.hpp"
#include "recallcpp/types.hpp"
#include "recallcpp/vector_index.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace recallcpp {

// Hits from both retrieval channels, resolved against the same committed state.
struct CandidateSet {
  bool corpus_empty = true;
  std::vector<QueryHit> vector_hits{};
  std::vector<QueryHit> keyword_hits{};
};

// Owns document identity and the indexes. Extraction, chunking and embedding run without the
// registry lock; the keyword rows, vector batch and document record are then committed together
// under the exclusive lock, or not at all.
class DocumentRegistry {
 public:
  DocumentRegistry(std::shared_ptr<EmbeddingProvider> embedder, ExtractorSet extractors, const EngineConfig& config);
  DocumentRegistry(const DocumentRegistry&) = delete;
  DocumentRegistry& operator=(const DocumentRegistry&) = delete;

  DocumentId IndexDocument(const std::string& source,
                           DocumentType type = DocumentType::kAuto,
                           const CancellationToken& cancel = {});
  // Skips extraction; `text` is chunked and embedded as if an extractor had produced it.
  DocumentId IndexText(const std::string& source,
                       const std::string& text,
                       DocumentType type = DocumentType::kText,
                       const CancellationToken& cancel = {});
  bool DeleteDocument(DocumentId document_id);
  // Throws NotFoundError.
  [[nodiscard]] Document GetDocument(DocumentId document_id) const;
  [[nodiscard]] std::optional<Document> FindDocument(DocumentId document_id) const;
  [[nodiscard]] std::vector<Document> Documents() const;
  [[nodiscard]] std::string ChunkText(DocumentId document_id, std::uint32_t chunk_index) const;
  [[nodiscard]] RegistryStats Stats() const;
  // True when no vector entries are live.
  [[nodiscard]] bool empty() const;
  // Ids keep increasing after a clear.
  void Clear();

  // `keyword_query` is skipped when empty or when the keyword index is disabled. Both channels only
  // consider documents matching `filter`.
  [[nodiscard]] CandidateSet RetrieveCandidates(const std::vector<float>& query_embedding,
                                                const std::string& keyword_query,
                                                int top_k,
                                                const QueryFilter& filter = {}) const;

  [[nodiscard]] Snapshot Export() const;
  // Validates `snapshot` fully, then swaps it in. Throws InvalidArgumentError when its dimension
  // differs from the provider's.
  void Import(const Snapshot& snapshot);

  [[nodiscard]] int dimensions() const;
  [[nodiscard]] EmbeddingProvider& embedder() const;
  [[nodiscard]] bool keyword_index_enabled() const;

 private:
  struct DocumentRecord {
    Document document{};
    std::vector<std::string> chunk_texts{};
  };

  DocumentId CommitDocument(const std::string& source,
                            DocumentType type,
                            std::vector<std::string> chunks,
                            std::vector<IndexedEmbedding> embeddings,
                            const CancellationToken& cancel);
  void RollbackCommit(DocumentId document_id, bool keyword_rows_written, bool vectors_written);
  std::vector<QueryHit> ResolveHits(const std::vector<SearchHit>& hits, SearchSource source) const;

  std::shared_ptr<EmbeddingProvider> embedder_;
  ExtractorSet extractors_;
  int chunk_size_;
  int ingest_batch_size_;
  bool keyword_index_enabled_;
  std::unique_ptr<VectorIndex> vector_index_;
  std::unique_ptr<KeywordIndex> keyword_index_;
  std::map<DocumentId, DocumentRecord> documents_{};
  std::atomic<DocumentId> next_document_id_{1};
  mutable std::shared_mutex mutex_{};
};

}  // namespace recallcpp
