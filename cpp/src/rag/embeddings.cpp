#include "recallcpp/embeddings.hpp"
#include "recallcpp/chunker.hpp"
#include "recallcpp/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace recallcpp {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens{};
  std::string current{};
  current.reserve(32);

  for (const unsigned char ch : text) {
    if (std::isalnum(ch) != 0) {
      current.push_back(static_cast<char>(std::tolower(ch)));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(current);
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(current);
  }
  return tokens;
}

std::uint64_t HashToken(std::string_view token) {
  std::uint64_t hash = kFnvOffset;
  for (const unsigned char ch : token) {
    hash ^= static_cast<std::uint64_t>(ch);
    hash *= kFnvPrime;
  }
  return hash;
}

std::vector<float> BuildHashedEmbedding(const std::string& text, int dimensions) {
  std::vector<float> embedding(static_cast<std::size_t>(dimensions), 0.0F);
  auto tokens = Tokenize(text);
  if (tokens.empty()) {
    // Punctuation-only text still gets a stable non-zero vector.
    tokens = TokenizeWhitespace(text);
  }
  const auto accumulate = [&](bool signed_buckets) {
    for (const auto& token : tokens) {
      const auto hash = HashToken(token);
      const auto index = static_cast<std::size_t>(hash % static_cast<std::uint64_t>(dimensions));
      const bool negative = signed_buckets && (hash >> 63U) != 0U;
      embedding[index] += negative ? -1.0F : 1.0F;
    }
  };
  const auto squared_norm = [&]() {
    double sum_sq = 0.0;
    for (const auto x : embedding) {
      sum_sq += static_cast<double>(x) * static_cast<double>(x);
    }
    return sum_sq;
  };

  accumulate(true);
  double sum_sq = squared_norm();
  if (sum_sq == 0.0 && !tokens.empty()) {
    // Opposite signs cancelled in every shared bucket; unsigned counts cannot cancel.
    std::fill(embedding.begin(), embedding.end(), 0.0F);
    accumulate(false);
    sum_sq = squared_norm();
  }
  if (sum_sq > 0.0) {
    const auto inv_norm = 1.0 / std::sqrt(sum_sq);
    for (auto& x : embedding) {
      x = static_cast<float>(static_cast<double>(x) * inv_norm);
    }
  }
  return embedding;
}

}  // namespace

HashingEmbedder::HashingEmbedder(int dimensions, std::size_t memoization_capacity)
    : dimensions_(dimensions), memoization_capacity_(memoization_capacity) {
  if (dimensions_ <= 0) {
    throw InvalidArgumentError("HashingEmbedder: dimensions must be positive");
  }
}

int HashingEmbedder::dimensions() const {
  return dimensions_;
}

bool HashingEmbedder::normalize() const {
  return true;
}

std::optional<EmbeddingIdentity> HashingEmbedder::identity() const {
  return EmbeddingIdentity{
      .provider = std::string("recallcpp"),
      .model = std::string("token-hash"),
      .dimensions = dimensions_,
      .normalized = true,
  };
}

std::vector<float> HashingEmbedder::Embed(const std::string& text) {
  if (memoization_capacity_ > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cached = memoized_embeddings_.find(text);
    if (cached != memoized_embeddings_.end()) {
      return cached->second;
    }
  }

  auto embedding = BuildHashedEmbedding(text, dimensions_);

  if (memoization_capacity_ > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (memoized_embeddings_.find(text) == memoized_embeddings_.end()) {
      while (memoized_embeddings_.size() >= memoization_capacity_ && !memoization_order_.empty()) {
        memoized_embeddings_.erase(memoization_order_.front());
        memoization_order_.pop_front();
      }
      memoization_order_.push_back(text);
      memoized_embeddings_.emplace(text, embedding);
    }
  }
  return embedding;
}

std::vector<std::vector<float>> HashingEmbedder::EmbedBatch(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> out{};
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(Embed(text));
  }
  return out;
}

std::size_t HashingEmbedder::cache_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return memoized_embeddings_.size();
}

std::vector<float> NormalizeEmbedding(std::vector<float> vector, int expected_dimensions) {
  if (vector.empty()) {
    throw EmbeddingError("embedding: provider returned an empty vector");
  }
  if (vector.size() != static_cast<std::size_t>(expected_dimensions)) {
    throw InvalidArgumentError("embedding: dimension mismatch, expected " + std::to_string(expected_dimensions) +
                               " got " + std::to_string(vector.size()));
  }
  double sum_sq = 0.0;
  for (const auto x : vector) {
    if (!std::isfinite(x)) {
      throw EmbeddingError("embedding: vector has a non-finite component");
    }
    sum_sq += static_cast<double>(x) * static_cast<double>(x);
  }
  const double norm = std::sqrt(sum_sq);
  if (!std::isfinite(norm) || norm <= 0.0) {
    throw EmbeddingError("embedding: vector has zero or non-finite norm");
  }
  const double inv_norm = 1.0 / norm;
  for (auto& x : vector) {
    x = static_cast<float>(static_cast<double>(x) * inv_norm);
  }
  return vector;
}

std::vector<std::vector<float>> EmbedTexts(EmbeddingProvider& provider,
                                           const std::vector<std::string>& texts,
                                           int batch_size,
                                           const CancellationToken& cancel) {
  if (texts.empty()) {
    return {};
  }
  const int dims = provider.dimensions();
  std::vector<std::vector<float>> out{};
  out.reserve(texts.size());

  auto* batch_provider = dynamic_cast<BatchEmbeddingProvider*>(&provider);
  if (batch_provider != nullptr && texts.size() > 1) {
    const std::size_t slice_size = batch_size > 0 ? static_cast<std::size_t>(batch_size) : texts.size();
    for (std::size_t start = 0; start < texts.size(); start += slice_size) {
      cancel.ThrowIfCancelled("embedding");
      const auto end = std::min(texts.size(), start + slice_size);
      const std::vector<std::string> slice(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                           texts.begin() + static_cast<std::ptrdiff_t>(end));
      std::vector<std::vector<float>> partial{};
      try {
        partial = batch_provider->EmbedBatch(slice);
      } catch (const Error&) {
        throw;
      } catch (const std::exception& ex) {
        throw EmbeddingError(std::string("embedding: provider failed: ") + ex.what());
      }
      if (partial.size() != slice.size()) {
        throw EmbeddingError("embedding: provider returned " + std::to_string(partial.size()) +
                             " vectors for " + std::to_string(slice.size()) + " texts");
      }
      for (auto& vector : partial) {
        out.push_back(NormalizeEmbedding(std::move(vector), dims));
      }
    }
    return out;
  }

  for (const auto& text : texts) {
    cancel.ThrowIfCancelled("embedding");
    std::vector<float> vector{};
    try {
      vector = provider.Embed(text);
    } catch (const Error&) {
      throw;
    } catch (const std::exception& ex) {
      throw EmbeddingError(std::string("embedding: provider failed: ") + ex.what());
    }
    out.push_back(NormalizeEmbedding(std::move(vector), dims));
  }
  return out;
}

}  // namespace recallcpp
