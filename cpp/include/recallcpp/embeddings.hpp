#pragma once

#include "recallcpp/cancellation.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace recallcpp {

struct EmbeddingIdentity {
  std::optional<std::string> provider;
  std::optional<std::string> model;
  std::optional<int> dimensions;
  std::optional<bool> normalized;
};

// Injected text -> vector capability. Implementations must be safe to call from several threads;
// the registry embeds outside of any index lock.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual int dimensions() const = 0;
  virtual bool normalize() const = 0;
  virtual std::optional<EmbeddingIdentity> identity() const = 0;
  virtual std::vector<float> Embed(const std::string& text) = 0;
};

class BatchEmbeddingProvider : public EmbeddingProvider {
 public:
  ~BatchEmbeddingProvider() override = default;
  virtual std::vector<std::vector<float>> EmbedBatch(const std::vector<std::string>& texts) = 0;
};

// Deterministic bag-of-tokens embedder: every lower-cased alphanumeric token is hashed into one of
// `dimensions` signed buckets and the result is L2-normalized. Stands in for a model backend in
// tests and offline builds.
class HashingEmbedder final : public BatchEmbeddingProvider {
 public:
  explicit HashingEmbedder(int dimensions = 384, std::size_t memoization_capacity = 4096);

  int dimensions() const override;
  bool normalize() const override;
  std::optional<EmbeddingIdentity> identity() const override;
  std::vector<float> Embed(const std::string& text) override;
  std::vector<std::vector<float>> EmbedBatch(const std::vector<std::string>& texts) override;
  [[nodiscard]] std::size_t cache_size() const;

 private:
  int dimensions_;
  std::size_t memoization_capacity_ = 0;
  std::unordered_map<std::string, std::vector<float>> memoized_embeddings_{};
  std::deque<std::string> memoization_order_{};
  mutable std::mutex mutex_{};
};

// Returns `vector` scaled to unit L2 norm. Throws EmbeddingError when the vector is empty, has a
// non-finite component, or has zero norm, and InvalidArgumentError when its length differs from
// `expected_dimensions`.
[[nodiscard]] std::vector<float> NormalizeEmbedding(std::vector<float> vector, int expected_dimensions);

// Calls the provider for every text (batched when the provider supports it, `batch_size` texts per
// call, 0 meaning all at once) and normalizes each result. Provider exceptions are rethrown as
// EmbeddingError; `cancel` is checked before every provider call.
[[nodiscard]] std::vector<std::vector<float>> EmbedTexts(EmbeddingProvider& provider,
                                                        const std::vector<std::string>& texts,
                                                        int batch_size,
                                                        const CancellationToken& cancel = {});

}  // namespace recallcpp
