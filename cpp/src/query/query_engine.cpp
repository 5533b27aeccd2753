#include "recallcpp/query_engine.hpp"
#include "recallcpp/chunker.hpp"
#include "recallcpp/embeddings.hpp"
#include "recallcpp/errors.hpp"
#include "recallcpp/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <set>
#include <unordered_set>
#include <utility>

namespace recallcpp {
namespace {

bool ScoreLess(const QueryHit& lhs, const QueryHit& rhs) {
  const float lhs_score = std::isnan(lhs.score) ? 0.0F : lhs.score;
  const float rhs_score = std::isnan(rhs.score) ? 0.0F : rhs.score;
  if (lhs_score != rhs_score) {
    return lhs_score > rhs_score;
  }
  if (lhs.document_id != rhs.document_id) {
    return lhs.document_id < rhs.document_id;
  }
  return lhs.chunk_index < rhs.chunk_index;
}

float ClampAlpha(float alpha) {
  return std::max(0.0F, std::min(1.0F, alpha));
}

std::string Lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return text;
}

std::unordered_set<std::string> LowercaseTerms(const std::string& text) {
  std::unordered_set<std::string> terms{};
  for (auto& token : TokenizeWhitespace(text)) {
    terms.insert(Lowercase(std::move(token)));
  }
  return terms;
}

std::string TruncateBytes(const std::string& text, int max_bytes) {
  if (max_bytes <= 0 || text.size() <= static_cast<std::size_t>(max_bytes)) {
    return text;
  }
  return text.substr(0, static_cast<std::size_t>(max_bytes));
}

int CandidateCount(int top_k, int multiplier) {
  const auto wanted = static_cast<std::int64_t>(top_k) * std::max(1, multiplier);
  return static_cast<int>(std::min<std::int64_t>(wanted, std::numeric_limits<int>::max()));
}

}  // namespace

QueryEngine::QueryEngine(const DocumentRegistry& registry, const QueryConfig& config)
    : registry_(registry), config_(config) {
  if (config_.mode == SearchModeKind::kHybrid && !registry_.keyword_index_enabled()) {
    throw InvalidArgumentError("hybrid search mode requires the keyword index to be enabled");
  }
}

QueryResponse QueryEngine::Query(const std::string& text, const CancellationToken& cancel) const {
  return Query(text, config_.default_top_k, cancel);
}

QueryResponse QueryEngine::Query(const std::string& text, int top_k, const CancellationToken& cancel) const {
  return Query(text, top_k, QueryFilter{}, cancel);
}

QueryResponse QueryEngine::Query(const std::string& text,
                                 int top_k,
                                 const QueryFilter& filter,
                                 const CancellationToken& cancel) const {
  if (top_k < 0) {
    throw InvalidArgumentError("query: top_k must be non-negative");
  }
  cancel.ThrowIfCancelled("query");

  QueryResponse response{};
  response.query = text;
  if (registry_.empty()) {
    response.status = QueryStatus::kEmptyIndex;
    return response;
  }
  if (TokenizeWhitespace(text).empty()) {
    throw InvalidArgumentError("query: text has no tokens");
  }

  auto embeddings = EmbedTexts(registry_.embedder(), {text}, 1, cancel);
  cancel.ThrowIfCancelled("query: after embedding");

  const bool hybrid = config_.mode == SearchModeKind::kHybrid;
  const int candidate_k = hybrid || config_.rerank ? CandidateCount(top_k, config_.candidate_multiplier) : top_k;
  auto candidates =
      registry_.RetrieveCandidates(embeddings.front(), hybrid ? text : std::string{}, candidate_k, filter);
  if (candidates.corpus_empty) {
    response.status = QueryStatus::kEmptyIndex;
    return response;
  }

  auto hits = hybrid ? FuseReciprocalRank(candidates.keyword_hits, candidates.vector_hits, config_.alpha, config_.rrf_k)
                     : std::move(candidates.vector_hits);
  if (config_.rerank) {
    RerankByTermOverlap(text, config_.rerank_overlap_bonus, hits);
  } else {
    std::sort(hits.begin(), hits.end(), ScoreLess);
  }
  if (hits.size() > static_cast<std::size_t>(top_k)) {
    hits.resize(static_cast<std::size_t>(top_k));
  }
  if (config_.preview_max_bytes > 0) {
    for (auto& hit : hits) {
      hit.chunk_text = TruncateBytes(hit.chunk_text, config_.preview_max_bytes);
    }
  }

  log::Logger()->debug("query top_k={} filtered={} candidates={} keyword_candidates={} hits={}",
                       top_k,
                       !filter.empty(),
                       candidate_k,
                       candidates.keyword_hits.size(),
                       hits.size());
  response.hits = std::move(hits);
  return response;
}

const QueryConfig& QueryEngine::config() const {
  return config_;
}

std::vector<QueryHit> FuseReciprocalRank(const std::vector<QueryHit>& keyword_hits,
                                         const std::vector<QueryHit>& vector_hits,
                                         float alpha,
                                         int rrf_k) {
  struct Aggregate {
    QueryHit hit{};
    std::set<SearchSource> sources{};
  };
  std::map<std::pair<DocumentId, std::uint32_t>, Aggregate> aggregates{};
  const float keyword_weight = ClampAlpha(alpha);
  const float vector_weight = 1.0F - keyword_weight;
  const float base = static_cast<float>(rrf_k <= 0 ? 60 : rrf_k);

  auto apply_channel = [&](std::vector<QueryHit> channel, float weight) {
    std::sort(channel.begin(), channel.end(), ScoreLess);
    for (std::size_t i = 0; i < channel.size(); ++i) {
      const auto rank = static_cast<float>(i + 1U);
      const auto key = std::make_pair(channel[i].document_id, channel[i].chunk_index);
      auto [it, inserted] = aggregates.try_emplace(key);
      if (inserted) {
        it->second.hit = channel[i];
        it->second.hit.score = 0.0F;
      }
      it->second.hit.score += weight * (1.0F / (base + rank));
      it->second.sources.insert(channel[i].sources.begin(), channel[i].sources.end());
    }
  };

  apply_channel(keyword_hits, keyword_weight);
  apply_channel(vector_hits, vector_weight);

  std::vector<QueryHit> out{};
  out.reserve(aggregates.size());
  for (auto& [key, agg] : aggregates) {
    agg.hit.sources.assign(agg.sources.begin(), agg.sources.end());
    out.push_back(std::move(agg.hit));
  }
  std::sort(out.begin(), out.end(), ScoreLess);
  return out;
}

void RerankByTermOverlap(const std::string& query, float overlap_bonus, std::vector<QueryHit>& hits) {
  const auto query_terms = LowercaseTerms(query);
  for (auto& hit : hits) {
    const auto chunk_terms = LowercaseTerms(hit.chunk_text);
    std::size_t overlap = 0;
    for (const auto& term : query_terms) {
      if (chunk_terms.count(term) != 0) {
        ++overlap;
      }
    }
    hit.score += static_cast<float>(overlap) * overlap_bonus;
  }
  std::sort(hits.begin(), hits.end(), ScoreLess);
}

std::string BuildContext(const QueryResponse& response, int max_bytes) {
  std::string out{};
  for (const auto& hit : response.hits) {
    if (!out.empty()) {
      out.append("\n\n");
    }
    out.append("[Source: ").append(hit.source).append("]\n").append(hit.chunk_text);
  }
  return TruncateBytes(out, max_bytes);
}

}  // namespace recallcpp
