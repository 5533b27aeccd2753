#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace recallcpp {

using DocumentId = std::uint64_t;
using Timestamp = std::chrono::system_clock::time_point;

enum class DocumentType : std::uint8_t {
  kText = 0,
  kPdf = 1,
  kImage = 2,
  kAudio = 3,
  kAuto = 255,
};

struct Document {
  DocumentId id = 0;
  std::string source;
  DocumentType type = DocumentType::kText;
  std::uint32_t chunk_count = 0;
  Timestamp created_at{};
};

struct Chunk {
  DocumentId document_id = 0;
  std::uint32_t chunk_index = 0;
  std::string text;
};

struct VectorEntry {
  DocumentId document_id = 0;
  std::uint32_t chunk_index = 0;
  std::vector<float> embedding{};
};

struct SearchHit {
  DocumentId document_id = 0;
  std::uint32_t chunk_index = 0;
  float score = 0.0F;
};

enum class SearchSource {
  kVector,
  kKeyword,
};

enum class SearchModeKind {
  kVectorOnly,
  kHybrid,
};

struct QueryHit {
  DocumentId document_id = 0;
  std::string source;
  std::uint32_t chunk_index = 0;
  std::string chunk_text;
  float score = 0.0F;
  std::vector<SearchSource> sources;
};

// Restricts retrieval to documents matching every field that is set. An empty filter matches all.
struct QueryFilter {
  std::optional<DocumentType> type;
  std::optional<std::string> source;

  [[nodiscard]] bool empty() const { return !type.has_value() && !source.has_value(); }
};

// Empty means every document is admitted.
using DocumentIdFilter = std::function<bool(DocumentId)>;

enum class QueryStatus {
  kOk,
  kEmptyIndex,
};

struct QueryResponse {
  std::string query;
  QueryStatus status = QueryStatus::kOk;
  std::vector<QueryHit> hits;
};

struct RegistryStats {
  std::uint64_t document_count = 0;
  std::uint64_t chunk_count = 0;
  std::unordered_map<DocumentType, std::uint64_t> documents_by_type;
};

struct ChunkingConfig {
  int chunk_size = 512;
};

struct QueryConfig {
  int default_top_k = 5;
  SearchModeKind mode = SearchModeKind::kVectorOnly;
  float alpha = 0.5F;
  int rrf_k = 60;
  bool rerank = false;
  float rerank_overlap_bonus = 0.05F;
  int candidate_multiplier = 2;
  int preview_max_bytes = 0;
};

struct EngineConfig {
  ChunkingConfig chunking{};
  QueryConfig query{};
  bool enable_keyword_index = true;
  int ingest_batch_size = 32;
  std::optional<std::string> log_level;
};

[[nodiscard]] const char* DocumentTypeName(DocumentType type);

}  // namespace recallcpp
