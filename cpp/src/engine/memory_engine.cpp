#include "recallcpp/memory_engine.hpp"
#include "recallcpp/config.hpp"
#include "recallcpp/errors.hpp"
#include "recallcpp/logging.hpp"
#include "recallcpp/snapshot_format.hpp"

#include <mutex>
#include <utility>

namespace recallcpp {

MemoryEngine::MemoryEngine(const EngineConfig& config,
                           std::shared_ptr<EmbeddingProvider> embedder,
                           ExtractorSet extractors)
    : config_(config) {
  ValidateConfig(config_);
  if (config_.log_level.has_value()) {
    log::SetLevel(*config_.log_level);
  }
  if (embedder == nullptr) {
    throw InvalidArgumentError("MemoryEngine requires an embedding provider");
  }
  if (embedder->dimensions() <= 0) {
    throw InvalidArgumentError("embedding provider reports non-positive dimensions");
  }
  registry_ = std::make_unique<DocumentRegistry>(std::move(embedder), std::move(extractors), config_);
  query_engine_ = std::make_unique<QueryEngine>(*registry_, config_.query);
  log::Logger()->debug("memory engine ready: dimensions={} chunk_size={} keyword_index={}",
                       registry_->dimensions(),
                       config_.chunking.chunk_size,
                       config_.enable_keyword_index);
}

// Operations hold the lifecycle lock shared so Close() cannot release the registry under them.

DocumentId MemoryEngine::IndexDocument(const std::string& source, DocumentType type, const CancellationToken& cancel) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return registry_->IndexDocument(source, type, cancel);
}

DocumentId MemoryEngine::IndexText(const std::string& source, const std::string& text, const CancellationToken& cancel) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return registry_->IndexText(source, text, DocumentType::kText, cancel);
}

QueryResponse MemoryEngine::Query(const std::string& text, const CancellationToken& cancel) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return query_engine_->Query(text, cancel);
}

QueryResponse MemoryEngine::Query(const std::string& text, int top_k, const CancellationToken& cancel) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return query_engine_->Query(text, top_k, cancel);
}

QueryResponse MemoryEngine::Query(const std::string& text,
                                  int top_k,
                                  const QueryFilter& filter,
                                  const CancellationToken& cancel) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return query_engine_->Query(text, top_k, filter, cancel);
}

bool MemoryEngine::DeleteDocument(DocumentId document_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return registry_->DeleteDocument(document_id);
}

Document MemoryEngine::GetDocument(DocumentId document_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return registry_->GetDocument(document_id);
}

std::optional<Document> MemoryEngine::FindDocument(DocumentId document_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return registry_->FindDocument(document_id);
}

std::vector<Document> MemoryEngine::Documents() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return registry_->Documents();
}

RegistryStats MemoryEngine::Stats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  return registry_->Stats();
}

void MemoryEngine::Clear() {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  registry_->Clear();
}

void MemoryEngine::Save(const std::filesystem::path& path) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  const auto snapshot = registry_->Export();
  WriteSnapshotFile(path, snapshot);
  log::Logger()->info("saved snapshot {} ({} documents, {} entries)",
                      path.string(),
                      snapshot.documents.size(),
                      snapshot.entries.size());
}

void MemoryEngine::Load(const std::filesystem::path& path) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ThrowIfClosed();
  const auto snapshot = ReadSnapshotFile(path);
  registry_->Import(snapshot);
  log::Logger()->info("loaded snapshot {}", path.string());
}

void MemoryEngine::Close() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (closed_) {
    return;
  }
  query_engine_.reset();
  registry_.reset();
  closed_ = true;
  log::Logger()->debug("memory engine closed");
}

bool MemoryEngine::closed() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return closed_;
}

const EngineConfig& MemoryEngine::config() const {
  return config_;
}

void MemoryEngine::ThrowIfClosed() const {
  if (closed_) {
    throw StorageError("memory engine is closed");
  }
}

}  // namespace recallcpp
