#include "recallcpp/document_registry.hpp"
#include "recallcpp/chunker.hpp"
#include "recallcpp/errors.hpp"
#include "recallcpp/logging.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <mutex>
#include <utility>

namespace recallcpp {
namespace {

bool MatchesFilter(const Document& document, const QueryFilter& filter) {
  if (filter.type.has_value() && document.type != *filter.type) {
    return false;
  }
  return !filter.source.has_value() || document.source == *filter.source;
}

}  // namespace

DocumentRegistry::DocumentRegistry(std::shared_ptr<EmbeddingProvider> embedder,
                                   ExtractorSet extractors,
                                   const EngineConfig& config)
    : embedder_(std::move(embedder)),
      extractors_(std::move(extractors)),
      chunk_size_(config.chunking.chunk_size),
      ingest_batch_size_(config.ingest_batch_size),
      keyword_index_enabled_(config.enable_keyword_index) {
  if (embedder_ == nullptr) {
    throw InvalidArgumentError("DocumentRegistry requires an embedding provider");
  }
  if (chunk_size_ <= 1) {
    throw InvalidArgumentError("DocumentRegistry: chunk_size must be greater than 1");
  }
  vector_index_ = std::make_unique<FlatVectorIndex>(embedder_->dimensions());
  if (keyword_index_enabled_) {
    keyword_index_ = std::make_unique<KeywordIndex>();
  }
}

DocumentId DocumentRegistry::IndexDocument(const std::string& source,
                                           DocumentType type,
                                           const CancellationToken& cancel) {
  const auto resolved_type = type == DocumentType::kAuto ? DetectDocumentType(source) : type;
  cancel.ThrowIfCancelled("index_document");
  auto text = extractors_.Extract(resolved_type, source);
  cancel.ThrowIfCancelled("index_document: after extraction");
  return IndexText(source, text, resolved_type, cancel);
}

DocumentId DocumentRegistry::IndexText(const std::string& source,
                                       const std::string& text,
                                       DocumentType type,
                                       const CancellationToken& cancel) {
  if (type == DocumentType::kAuto) {
    type = DetectDocumentType(source);
  }
  auto chunks = recallcpp::ChunkText(text, chunk_size_);
  auto embeddings = EmbedTexts(*embedder_, chunks, ingest_batch_size_, cancel);

  std::vector<IndexedEmbedding> entries{};
  entries.reserve(embeddings.size());
  for (std::size_t i = 0; i < embeddings.size(); ++i) {
    entries.push_back(IndexedEmbedding{static_cast<std::uint32_t>(i), std::move(embeddings[i])});
  }
  return CommitDocument(source, type, std::move(chunks), std::move(entries), cancel);
}

DocumentId DocumentRegistry::CommitDocument(const std::string& source,
                                            DocumentType type,
                                            std::vector<std::string> chunks,
                                            std::vector<IndexedEmbedding> embeddings,
                                            const CancellationToken& cancel) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  cancel.ThrowIfCancelled("index_document: before commit");
  const auto document_id = next_document_id_.fetch_add(1);

  bool keyword_rows_written = false;
  bool vectors_written = false;
  try {
    if (keyword_index_ != nullptr) {
      keyword_index_->InsertBatch(document_id, chunks);
      keyword_rows_written = true;
    }
    vector_index_->InsertBatch(document_id, embeddings);
    vectors_written = true;

    DocumentRecord record{};
    record.document.id = document_id;
    record.document.source = source;
    record.document.type = type;
    record.document.chunk_count = static_cast<std::uint32_t>(chunks.size());
    record.document.created_at = std::chrono::system_clock::now();
    record.chunk_texts = std::move(chunks);
    documents_.emplace(document_id, std::move(record));
  } catch (const Error& ex) {
    log::Logger()->warn("index_document rolled back document {} ({}): {}", document_id, source, ex.what());
    RollbackCommit(document_id, keyword_rows_written, vectors_written);
    throw;
  } catch (const std::exception& ex) {
    log::Logger()->warn("index_document rolled back document {} ({}): {}", document_id, source, ex.what());
    RollbackCommit(document_id, keyword_rows_written, vectors_written);
    throw StorageError("index_document: commit failed for " + source + ": " + ex.what());
  }

  const auto chunk_count = documents_.at(document_id).document.chunk_count;
  lock.unlock();
  log::Logger()->info("indexed document {} source={} type={} chunks={}",
                      document_id,
                      source,
                      DocumentTypeName(type),
                      chunk_count);
  return document_id;
}

void DocumentRegistry::RollbackCommit(DocumentId document_id, bool keyword_rows_written, bool vectors_written) {
  if (vectors_written) {
    (void)vector_index_->DeleteDocument(document_id);
  }
  if (keyword_rows_written) {
    (void)keyword_index_->DeleteDocument(document_id);
  }
}

bool DocumentRegistry::DeleteDocument(DocumentId document_id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const auto it = documents_.find(document_id);
  if (it == documents_.end()) {
    return false;
  }
  if (keyword_index_ != nullptr) {
    (void)keyword_index_->DeleteDocument(document_id);
  }
  const auto removed = vector_index_->DeleteDocument(document_id);
  documents_.erase(it);
  lock.unlock();
  log::Logger()->info("deleted document {} ({} entries)", document_id, removed);
  return true;
}

Document DocumentRegistry::GetDocument(DocumentId document_id) const {
  auto document = FindDocument(document_id);
  if (!document.has_value()) {
    throw NotFoundError("document " + std::to_string(document_id) + " not found");
  }
  return *document;
}

std::optional<Document> DocumentRegistry::FindDocument(DocumentId document_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = documents_.find(document_id);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second.document;
}

std::vector<Document> DocumentRegistry::Documents() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<Document> out{};
  out.reserve(documents_.size());
  for (const auto& [id, record] : documents_) {
    out.push_back(record.document);
  }
  return out;
}

std::string DocumentRegistry::ChunkText(DocumentId document_id, std::uint32_t chunk_index) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = documents_.find(document_id);
  if (it == documents_.end() || chunk_index >= it->second.chunk_texts.size()) {
    throw NotFoundError("chunk " + std::to_string(chunk_index) + " of document " + std::to_string(document_id) +
                        " not found");
  }
  return it->second.chunk_texts[chunk_index];
}

RegistryStats DocumentRegistry::Stats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  RegistryStats stats{};
  stats.document_count = documents_.size();
  for (const auto& [id, record] : documents_) {
    stats.chunk_count += record.document.chunk_count;
    stats.documents_by_type[record.document.type] += 1;
  }
  return stats;
}

bool DocumentRegistry::empty() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return vector_index_->size() == 0;
}

void DocumentRegistry::Clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (keyword_index_ != nullptr) {
    keyword_index_->Clear();
  }
  vector_index_->Clear();
  const auto removed = documents_.size();
  documents_.clear();
  lock.unlock();
  log::Logger()->info("cleared {} documents", removed);
}

CandidateSet DocumentRegistry::RetrieveCandidates(const std::vector<float>& query_embedding,
                                                  const std::string& keyword_query,
                                                  int top_k,
                                                  const QueryFilter& filter) const {
  if (top_k < 0) {
    throw InvalidArgumentError("top_k must be non-negative");
  }
  std::shared_lock<std::shared_mutex> lock(mutex_);
  CandidateSet candidates{};
  candidates.corpus_empty = vector_index_->size() == 0;
  if (candidates.corpus_empty || top_k == 0) {
    return candidates;
  }
  // documents_ stays stable while the shared lock is held.
  DocumentIdFilter allow{};
  if (!filter.empty()) {
    allow = [this, &filter](DocumentId document_id) {
      const auto it = documents_.find(document_id);
      return it != documents_.end() && MatchesFilter(it->second.document, filter);
    };
  }
  candidates.vector_hits =
      ResolveHits(vector_index_->Search(query_embedding, top_k, allow), SearchSource::kVector);
  if (keyword_index_ != nullptr && !keyword_query.empty()) {
    candidates.keyword_hits =
        ResolveHits(keyword_index_->Search(keyword_query, top_k, allow), SearchSource::kKeyword);
  }
  return candidates;
}

std::vector<QueryHit> DocumentRegistry::ResolveHits(const std::vector<SearchHit>& hits, SearchSource source) const {
  std::vector<QueryHit> out{};
  out.reserve(hits.size());
  for (const auto& hit : hits) {
    const auto it = documents_.find(hit.document_id);
    if (it == documents_.end() || hit.chunk_index >= it->second.chunk_texts.size()) {
      throw StorageError("index entry for document " + std::to_string(hit.document_id) + " chunk " +
                         std::to_string(hit.chunk_index) + " has no registry record");
    }
    QueryHit resolved{};
    resolved.document_id = hit.document_id;
    resolved.source = it->second.document.source;
    resolved.chunk_index = hit.chunk_index;
    resolved.chunk_text = it->second.chunk_texts[hit.chunk_index];
    resolved.score = hit.score;
    resolved.sources = {source};
    out.push_back(std::move(resolved));
  }
  return out;
}

Snapshot DocumentRegistry::Export() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  Snapshot snapshot{};
  snapshot.dimension = static_cast<std::uint32_t>(vector_index_->dimensions());
  snapshot.next_document_id = next_document_id_.load();
  snapshot.documents.reserve(documents_.size());
  for (const auto& [id, record] : documents_) {
    snapshot.documents.push_back(SnapshotDocument{record.document, record.chunk_texts});
  }
  snapshot.entries = vector_index_->Entries();
  return snapshot;
}

void DocumentRegistry::Import(const Snapshot& snapshot) {
  if (snapshot.dimension != static_cast<std::uint32_t>(dimensions())) {
    throw InvalidArgumentError("snapshot dimension " + std::to_string(snapshot.dimension) +
                               " does not match embedding provider dimension " + std::to_string(dimensions()));
  }

  std::map<DocumentId, DocumentRecord> documents{};
  std::vector<Chunk> chunks{};
  for (const auto& doc : snapshot.documents) {
    if (doc.chunk_texts.size() != doc.document.chunk_count) {
      throw StorageError("snapshot document " + std::to_string(doc.document.id) + " chunk text count mismatch");
    }
    for (std::uint32_t i = 0; i < doc.document.chunk_count; ++i) {
      chunks.push_back(Chunk{doc.document.id, i, doc.chunk_texts[i]});
    }
    if (!documents.emplace(doc.document.id, DocumentRecord{doc.document, doc.chunk_texts}).second) {
      throw StorageError("snapshot has duplicate document id " + std::to_string(doc.document.id));
    }
  }
  for (const auto& entry : snapshot.entries) {
    if (documents.find(entry.document_id) == documents.end()) {
      throw StorageError("snapshot entry references unknown document " + std::to_string(entry.document_id));
    }
  }

  auto vector_index = std::make_unique<FlatVectorIndex>(dimensions());
  vector_index->Replace(snapshot.entries);
  for (const auto& [id, record] : documents) {
    if (vector_index->EntryCount(id) != record.document.chunk_count) {
      throw StorageError("snapshot document " + std::to_string(id) + " chunk_count does not match its entries");
    }
  }
  std::unique_ptr<KeywordIndex> keyword_index{};
  if (keyword_index_enabled_) {
    keyword_index = std::make_unique<KeywordIndex>();
    keyword_index->Replace(chunks);
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  vector_index_ = std::move(vector_index);
  keyword_index_ = std::move(keyword_index);
  documents_ = std::move(documents);
  next_document_id_.store(std::max(next_document_id_.load(), snapshot.next_document_id));
  lock.unlock();
  log::Logger()->info("imported snapshot with {} documents and {} entries",
                      snapshot.documents.size(),
                      snapshot.entries.size());
}

int DocumentRegistry::dimensions() const {
  return embedder_->dimensions();
}

EmbeddingProvider& DocumentRegistry::embedder() const {
  return *embedder_;
}

bool DocumentRegistry::keyword_index_enabled() const {
  return keyword_index_enabled_;
}

}  // namespace recallcpp
