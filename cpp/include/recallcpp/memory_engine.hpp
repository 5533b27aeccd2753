#pragma once

#include "recallcpp/cancellation.hpp"
#include "recallcpp/document_registry.hpp"
#include "recallcpp/embeddings.hpp"
#include "recallcpp/extractors.hpp"
#include "recallcpp/query_engine.hpp"
#include "recallcpp/types.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace recallcpp {

// Explicit handle over one memory store. Safe to share between an indexing thread and query
// threads. Close() waits for in-flight operations, then releases the registry and its indexes;
// every operation after it throws StorageError.
class MemoryEngine {
 public:
  MemoryEngine(const EngineConfig& config,
               std::shared_ptr<EmbeddingProvider> embedder,
               ExtractorSet extractors = {});

  DocumentId IndexDocument(const std::string& source,
                           DocumentType type = DocumentType::kAuto,
                           const CancellationToken& cancel = {});
  DocumentId IndexText(const std::string& source, const std::string& text, const CancellationToken& cancel = {});
  [[nodiscard]] QueryResponse Query(const std::string& text, const CancellationToken& cancel = {}) const;
  [[nodiscard]] QueryResponse Query(const std::string& text, int top_k, const CancellationToken& cancel = {}) const;
  [[nodiscard]] QueryResponse Query(const std::string& text,
                                    int top_k,
                                    const QueryFilter& filter,
                                    const CancellationToken& cancel = {}) const;
  bool DeleteDocument(DocumentId document_id);
  [[nodiscard]] Document GetDocument(DocumentId document_id) const;
  [[nodiscard]] std::optional<Document> FindDocument(DocumentId document_id) const;
  [[nodiscard]] std::vector<Document> Documents() const;
  [[nodiscard]] RegistryStats Stats() const;
  void Clear();

  void Save(const std::filesystem::path& path) const;
  // Replaces the in-memory state with the snapshot at `path`. Throws InvalidArgumentError when the
  // snapshot dimension differs from the provider's, StorageError when the file is unreadable or
  // corrupt. A failed load leaves the current state untouched.
  void Load(const std::filesystem::path& path);

  void Close();
  [[nodiscard]] bool closed() const;
  [[nodiscard]] const EngineConfig& config() const;

 private:
  void ThrowIfClosed() const;

  EngineConfig config_;
  std::unique_ptr<DocumentRegistry> registry_;
  std::unique_ptr<QueryEngine> query_engine_;
  bool closed_ = false;
  mutable std::shared_mutex mutex_{};
};

}  // namespace recallcpp
