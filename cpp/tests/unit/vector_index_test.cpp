#include "recallcpp/errors.hpp"
#include "recallcpp/vector_index.hpp"

#include "../test_logger.hpp"

#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

double L2Norm(const std::vector<float>& values) {
  double sum = 0.0;
  for (const auto value : values) {
    sum += static_cast<double>(value) * static_cast<double>(value);
  }
  return std::sqrt(sum);
}

std::vector<recallcpp::IndexedEmbedding> Batch(std::initializer_list<std::vector<float>> rows) {
  std::vector<recallcpp::IndexedEmbedding> out{};
  std::uint32_t index = 0;
  for (const auto& row : rows) {
    out.push_back(recallcpp::IndexedEmbedding{index++, row});
  }
  return out;
}

void ScenarioCtorValidation() {
  recallcpp::tests::Log("scenario: constructor validation");
  bool threw = false;
  try {
    recallcpp::FlatVectorIndex invalid(0);
  } catch (const recallcpp::InvalidArgumentError&) {
    threw = true;
  }
  Require(threw, "dimensions <= 0 must throw");
}

void ScenarioSearchOrderAndTieBreak() {
  recallcpp::tests::Log("scenario: search order and tie-break");
  recallcpp::FlatVectorIndex index(3);
  index.InsertBatch(10, Batch({{1.0F, 0.0F, 0.0F}}));
  index.InsertBatch(2, Batch({{0.0F, 1.0F, 0.0F}, {2.0F, 0.0F, 0.0F}}));
  index.InsertBatch(7, Batch({{1.0F, 1.0F, 0.0F}}));

  const auto results = index.Search({1.0F, 0.0F, 0.0F}, 10);
  Require(results.size() == 4, "search must return every live entry when top_k exceeds size");
  Require(results[0].document_id == 2 && results[0].chunk_index == 1, "tie-break should prefer lower document id");
  Require(results[1].document_id == 10, "second tie entry should be the higher document id");
  Require(results[0].score == results[1].score, "tie entries should have equal score");
  Require(std::fabs(results[0].score - 1.0F) <= 1e-6F, "identical direction must score 1");
  Require(results[2].document_id == 7, "diagonal vector ranks third");
  Require(std::fabs(results[2].score - 0.70710678F) <= 1e-5F, "diagonal cosine mismatch");
  for (std::size_t i = 1; i < results.size(); ++i) {
    Require(results[i - 1].score >= results[i].score, "scores must be non-increasing");
  }

  const auto limited = index.Search({1.0F, 0.0F, 0.0F}, 2);
  Require(limited.size() == 2, "search must honour top_k");
  Require(index.Search({1.0F, 0.0F, 0.0F}, 0).empty(), "top_k 0 returns nothing");
}

void ScenarioAllowFilterSkipsDocuments() {
  recallcpp::tests::Log("scenario: allow filter skips documents");
  recallcpp::FlatVectorIndex index(2);
  index.InsertBatch(1, Batch({{1.0F, 0.0F}, {0.9F, 0.1F}}));
  index.InsertBatch(2, Batch({{0.0F, 1.0F}}));
  const auto hits = index.Search({1.0F, 0.0F}, 1, [](recallcpp::DocumentId id) { return id != 1; });
  Require(hits.size() == 1 && hits[0].document_id == 2, "rejected documents must be skipped before ranking");
  Require(index.Search({1.0F, 0.0F}, 5, [](recallcpp::DocumentId) { return false; }).empty(),
          "rejecting every document returns nothing");
  Require(index.Search({1.0F, 0.0F}, 5).size() == 3, "no filter admits every entry");
}

void ScenarioStoredEmbeddingsAreUnitNorm() {
  recallcpp::tests::Log("scenario: stored embeddings are unit norm");
  recallcpp::FlatVectorIndex index(2);
  index.InsertBatch(1, Batch({{3.0F, 4.0F}, {0.5F, 0.0F}}));
  for (const auto& entry : index.Entries()) {
    Require(std::fabs(L2Norm(entry.embedding) - 1.0) <= 1e-5, "stored embedding must have unit norm");
  }
}

void ScenarioInvalidArguments() {
  recallcpp::tests::Log("scenario: invalid arguments");
  recallcpp::FlatVectorIndex index(2);
  index.InsertBatch(1, Batch({{1.0F, 0.0F}}));

  bool negative_threw = false;
  try {
    (void)index.Search({1.0F, 0.0F}, -1);
  } catch (const recallcpp::InvalidArgumentError&) {
    negative_threw = true;
  }
  Require(negative_threw, "negative top_k must throw InvalidArgumentError");

  bool query_dims_threw = false;
  try {
    (void)index.Search({1.0F, 0.0F, 0.0F}, 1);
  } catch (const recallcpp::InvalidArgumentError&) {
    query_dims_threw = true;
  }
  Require(query_dims_threw, "query dimension mismatch must throw InvalidArgumentError");

  bool batch_dims_threw = false;
  try {
    index.InsertBatch(2, Batch({{1.0F, 0.0F}, {1.0F, 0.0F, 0.0F}}));
  } catch (const recallcpp::InvalidArgumentError&) {
    batch_dims_threw = true;
  }
  Require(batch_dims_threw, "entry dimension mismatch must throw InvalidArgumentError");
  Require(index.EntryCount(2) == 0 && index.size() == 1, "rejected batch must leave no entries");

  bool duplicate_threw = false;
  try {
    index.InsertBatch(1, Batch({{0.0F, 1.0F}}));
  } catch (const recallcpp::InvalidArgumentError&) {
    duplicate_threw = true;
  }
  Require(duplicate_threw, "re-inserting an existing (document, chunk) pair must throw");
  Require(index.size() == 1, "duplicate rejection must not change the index");
}

void ScenarioInjectedFailureIsAtomic() {
  recallcpp::tests::Log("scenario: injected failure is atomic");
  recallcpp::FlatVectorIndex index(2);
  recallcpp::vector::testing::SetInsertFailCountdown(1);
  bool threw = false;
  try {
    index.InsertBatch(5, Batch({{1.0F, 0.0F}, {0.0F, 1.0F}, {1.0F, 1.0F}}));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  recallcpp::vector::testing::ClearInsertFailCountdown();
  Require(threw, "injected failure must surface");
  Require(index.size() == 0 && index.EntryCount(5) == 0, "failed batch must leave no entries");

  index.InsertBatch(5, Batch({{1.0F, 0.0F}}));
  Require(index.size() == 1, "insert after cleared countdown must succeed");
}

void ScenarioDeleteIsIdempotent() {
  recallcpp::tests::Log("scenario: delete is idempotent");
  recallcpp::FlatVectorIndex index(2);
  index.InsertBatch(1, Batch({{1.0F, 0.0F}, {0.0F, 1.0F}}));
  index.InsertBatch(2, Batch({{1.0F, 1.0F}}));

  Require(index.DeleteDocument(1) == 2, "delete must report removed entries");
  Require(index.DeleteDocument(1) == 0, "second delete must be a no-op");
  Require(index.DeleteDocument(99) == 0, "unknown document delete must be a no-op");
  Require(index.size() == 1, "only the other document remains");
  for (const auto& hit : index.Search({1.0F, 0.0F}, 10)) {
    Require(hit.document_id != 1, "deleted document must not be returned");
  }
}

void ScenarioReplaceAndClear() {
  recallcpp::tests::Log("scenario: replace and clear");
  recallcpp::FlatVectorIndex index(2);
  index.InsertBatch(1, Batch({{1.0F, 0.0F}}));

  std::vector<recallcpp::VectorEntry> entries = {
      {4, 1, {0.0F, 2.0F}},
      {4, 0, {2.0F, 0.0F}},
      {3, 0, {1.0F, 1.0F}},
  };
  index.Replace(entries);
  Require(index.size() == 3 && index.EntryCount(1) == 0, "replace must drop previous contents");
  const auto listed = index.Entries();
  Require(listed.size() == 3, "entries size mismatch");
  Require(listed[0].document_id == 3 && listed[1].document_id == 4 && listed[1].chunk_index == 0 &&
              listed[2].chunk_index == 1,
          "entries must be ordered by (document, chunk)");

  std::vector<recallcpp::VectorEntry> duplicated = {{9, 0, {1.0F, 0.0F}}, {9, 0, {0.0F, 1.0F}}};
  bool threw = false;
  try {
    index.Replace(duplicated);
  } catch (const recallcpp::InvalidArgumentError&) {
    threw = true;
  }
  Require(threw, "duplicate entries must be rejected");
  Require(index.size() == 3, "rejected replace must keep the old contents");

  index.Clear();
  Require(index.size() == 0 && index.Entries().empty(), "clear must remove everything");
  Require(index.Search({1.0F, 0.0F}, 5).empty(), "search on empty index returns nothing");
}

void ScenarioConcurrentReadersSeeWholeBatches() {
  recallcpp::tests::Log("scenario: concurrent readers see whole batches");
  constexpr std::uint32_t kChunksPerDocument = 8;
  constexpr std::uint64_t kDocuments = 200;
  recallcpp::FlatVectorIndex index(4);
  std::atomic<bool> writer_done{false};
  std::atomic<bool> torn_read{false};

  std::thread writer([&]() {
    for (std::uint64_t doc = 1; doc <= kDocuments; ++doc) {
      std::vector<recallcpp::IndexedEmbedding> batch{};
      for (std::uint32_t c = 0; c < kChunksPerDocument; ++c) {
        batch.push_back({c, {1.0F, static_cast<float>(c), 0.5F, static_cast<float>(doc % 7)}});
      }
      index.InsertBatch(doc, batch);
      if (doc % 3 == 0) {
        (void)index.DeleteDocument(doc - 1);
      }
    }
    writer_done.store(true);
  });

  std::vector<std::thread> readers{};
  for (int r = 0; r < 3; ++r) {
    readers.emplace_back([&]() {
      while (!writer_done.load()) {
        const auto hits = index.Search({1.0F, 0.0F, 0.0F, 0.0F}, 1000000);
        if (hits.size() % kChunksPerDocument != 0) {
          torn_read.store(true);
        }
      }
    });
  }
  writer.join();
  for (auto& reader : readers) {
    reader.join();
  }
  Require(!torn_read.load(), "a reader observed a partially inserted or deleted batch");
  Require(index.size() % kChunksPerDocument == 0, "final entry count must be whole batches");
}

}  // namespace

int main() {
  try {
    recallcpp::tests::Log("vector_index_test: start");
    ScenarioCtorValidation();
    ScenarioSearchOrderAndTieBreak();
    ScenarioAllowFilterSkipsDocuments();
    ScenarioStoredEmbeddingsAreUnitNorm();
    ScenarioInvalidArguments();
    ScenarioInjectedFailureIsAtomic();
    ScenarioDeleteIsIdempotent();
    ScenarioReplaceAndClear();
    ScenarioConcurrentReadersSeeWholeBatches();
    recallcpp::tests::Log("vector_index_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    recallcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
