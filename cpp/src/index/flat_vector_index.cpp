#include "recallcpp/vector_index.hpp"
#include "recallcpp/embeddings.hpp"
#include "recallcpp/errors.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

namespace recallcpp {
namespace {

std::atomic<std::uint32_t> g_test_insert_fail_countdown{0};

float Dot(std::span<const float> lhs, std::span<const float> rhs) {
  float dot = 0.0F;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    dot += lhs[i] * rhs[i];
  }
  return dot;
}

bool HitLess(const SearchHit& lhs, const SearchHit& rhs) {
  if (lhs.score != rhs.score) {
    return lhs.score > rhs.score;
  }
  if (lhs.document_id != rhs.document_id) {
    return lhs.document_id < rhs.document_id;
  }
  return lhs.chunk_index < rhs.chunk_index;
}

void MaybeInjectInsertFailure() {
  auto remaining = g_test_insert_fail_countdown.load(std::memory_order_relaxed);
  while (remaining > 0) {
    if (g_test_insert_fail_countdown.compare_exchange_weak(remaining,
                                                           remaining - 1,
                                                           std::memory_order_relaxed,
                                                           std::memory_order_relaxed)) {
      throw std::runtime_error("FlatVectorIndex::InsertBatch injected failure");
    }
  }
}

}  // namespace

FlatVectorIndex::FlatVectorIndex(int dimensions) : dimensions_(dimensions) {
  if (dimensions_ <= 0) {
    throw InvalidArgumentError("FlatVectorIndex: dimensions must be positive");
  }
}

int FlatVectorIndex::dimensions() const {
  return dimensions_;
}

void FlatVectorIndex::InsertBatch(DocumentId document_id, const std::vector<IndexedEmbedding>& entries) {
  if (entries.empty()) {
    return;
  }

  // Everything that can fail happens before the exclusive section touches slabs_.
  DocumentSlab staged{};
  staged.chunk_indices.reserve(entries.size());
  staged.values.reserve(entries.size() * static_cast<std::size_t>(dimensions_));
  std::unordered_set<std::uint32_t> batch_indices{};
  batch_indices.reserve(entries.size());
  for (const auto& entry : entries) {
    if (!batch_indices.insert(entry.chunk_index).second) {
      throw InvalidArgumentError("FlatVectorIndex::InsertBatch duplicate chunk_index " +
                                 std::to_string(entry.chunk_index) + " in batch");
    }
    if (entry.embedding.size() != static_cast<std::size_t>(dimensions_)) {
      throw InvalidArgumentError("FlatVectorIndex::InsertBatch dimension mismatch, expected " +
                                 std::to_string(dimensions_) + " got " + std::to_string(entry.embedding.size()));
    }
    const auto normalized = NormalizeEmbedding(entry.embedding, dimensions_);
    staged.chunk_indices.push_back(entry.chunk_index);
    staged.values.insert(staged.values.end(), normalized.begin(), normalized.end());
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  MaybeInjectInsertFailure();
  auto it = slabs_.find(document_id);
  if (it == slabs_.end()) {
    slabs_.emplace(document_id, std::move(staged));
    entry_count_ += entries.size();
    return;
  }

  auto& slab = it->second;
  for (const auto chunk_index : slab.chunk_indices) {
    if (batch_indices.find(chunk_index) != batch_indices.end()) {
      throw InvalidArgumentError("FlatVectorIndex::InsertBatch chunk_index " + std::to_string(chunk_index) +
                                 " already indexed for document " + std::to_string(document_id));
    }
  }
  slab.chunk_indices.reserve(slab.chunk_indices.size() + staged.chunk_indices.size());
  slab.values.reserve(slab.values.size() + staged.values.size());
  slab.chunk_indices.insert(slab.chunk_indices.end(), staged.chunk_indices.begin(), staged.chunk_indices.end());
  slab.values.insert(slab.values.end(), staged.values.begin(), staged.values.end());
  entry_count_ += entries.size();
}

std::size_t FlatVectorIndex::DeleteDocument(DocumentId document_id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const auto it = slabs_.find(document_id);
  if (it == slabs_.end()) {
    return 0;
  }
  const auto removed = it->second.chunk_indices.size();
  slabs_.erase(it);
  entry_count_ -= removed;
  return removed;
}

std::vector<SearchHit> FlatVectorIndex::Search(const std::vector<float>& query,
                                               int top_k,
                                               const DocumentIdFilter& allow) const {
  if (top_k < 0) {
    throw InvalidArgumentError("FlatVectorIndex::Search top_k must be non-negative");
  }
  if (query.size() != static_cast<std::size_t>(dimensions_)) {
    throw InvalidArgumentError("FlatVectorIndex::Search dimension mismatch, expected " +
                               std::to_string(dimensions_) + " got " + std::to_string(query.size()));
  }
  if (top_k == 0) {
    return {};
  }
  const auto normalized_query = NormalizeEmbedding(query, dimensions_);
  const auto query_span = std::span<const float>(normalized_query.data(), normalized_query.size());
  const auto dims = static_cast<std::size_t>(dimensions_);

  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (entry_count_ == 0) {
    return {};
  }
  std::vector<SearchHit> results{};
  results.reserve(entry_count_);
  for (const auto& [document_id, slab] : slabs_) {
    if (allow && !allow(document_id)) {
      continue;
    }
    for (std::size_t row = 0; row < slab.chunk_indices.size(); ++row) {
      const auto candidate = std::span<const float>(slab.values.data() + row * dims, dims);
      results.push_back(SearchHit{document_id, slab.chunk_indices[row], Dot(query_span, candidate)});
    }
  }
  lock.unlock();

  const auto target_size = std::min<std::size_t>(results.size(), static_cast<std::size_t>(top_k));
  std::partial_sort(results.begin(), results.begin() + static_cast<std::ptrdiff_t>(target_size), results.end(), HitLess);
  results.resize(target_size);
  return results;
}

std::size_t FlatVectorIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entry_count_;
}

std::size_t FlatVectorIndex::EntryCount(DocumentId document_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = slabs_.find(document_id);
  return it == slabs_.end() ? 0 : it->second.chunk_indices.size();
}

std::vector<VectorEntry> FlatVectorIndex::Entries() const {
  const auto dims = static_cast<std::size_t>(dimensions_);
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<VectorEntry> out{};
  out.reserve(entry_count_);
  for (const auto& [document_id, slab] : slabs_) {
    const auto first = out.size();
    for (std::size_t row = 0; row < slab.chunk_indices.size(); ++row) {
      VectorEntry entry{};
      entry.document_id = document_id;
      entry.chunk_index = slab.chunk_indices[row];
      entry.embedding.assign(slab.values.begin() + static_cast<std::ptrdiff_t>(row * dims),
                             slab.values.begin() + static_cast<std::ptrdiff_t>((row + 1) * dims));
      out.push_back(std::move(entry));
    }
    std::sort(out.begin() + static_cast<std::ptrdiff_t>(first), out.end(), [](const auto& lhs, const auto& rhs) {
      return lhs.chunk_index < rhs.chunk_index;
    });
  }
  return out;
}

void FlatVectorIndex::Replace(const std::vector<VectorEntry>& entries) {
  std::map<DocumentId, DocumentSlab> rebuilt{};
  std::map<DocumentId, std::unordered_set<std::uint32_t>> seen{};
  for (const auto& entry : entries) {
    if (!seen[entry.document_id].insert(entry.chunk_index).second) {
      throw InvalidArgumentError("FlatVectorIndex::Replace duplicate entry for document " +
                                 std::to_string(entry.document_id) + " chunk " + std::to_string(entry.chunk_index));
    }
    if (entry.embedding.size() != static_cast<std::size_t>(dimensions_)) {
      throw InvalidArgumentError("FlatVectorIndex::Replace dimension mismatch");
    }
    const auto normalized = NormalizeEmbedding(entry.embedding, dimensions_);
    auto& slab = rebuilt[entry.document_id];
    slab.chunk_indices.push_back(entry.chunk_index);
    slab.values.insert(slab.values.end(), normalized.begin(), normalized.end());
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  slabs_ = std::move(rebuilt);
  entry_count_ = entries.size();
}

void FlatVectorIndex::Clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  slabs_.clear();
  entry_count_ = 0;
}

namespace vector::testing {

void SetInsertFailCountdown(std::uint32_t countdown) {
  g_test_insert_fail_countdown.store(countdown, std::memory_order_relaxed);
}

void ClearInsertFailCountdown() {
  g_test_insert_fail_countdown.store(0, std::memory_order_relaxed);
}

}  // namespace vector::testing

}  // namespace recallcpp
