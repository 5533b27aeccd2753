#pragma once

#include "recallcpp/cancellation.hpp"
#include "recallcpp/document_registry.hpp"
#include "recallcpp/types.hpp"

#include <string>
#include <vector>

namespace recallcpp {

class QueryEngine {
 public:
  QueryEngine(const DocumentRegistry& registry, const QueryConfig& config);

  // Uses config().default_top_k.
  [[nodiscard]] QueryResponse Query(const std::string& text, const CancellationToken& cancel = {}) const;
  // Throws InvalidArgumentError for top_k < 0 or a query without tokens on a non-empty corpus.
  // An empty corpus yields status kEmptyIndex and no hits.
  [[nodiscard]] QueryResponse Query(const std::string& text, int top_k, const CancellationToken& cancel = {}) const;
  // Same as above, restricted to documents matching `filter` in both retrieval channels.
  [[nodiscard]] QueryResponse Query(const std::string& text,
                                    int top_k,
                                    const QueryFilter& filter,
                                    const CancellationToken& cancel = {}) const;

  [[nodiscard]] const QueryConfig& config() const;

 private:
  const DocumentRegistry& registry_;
  QueryConfig config_;
};

// Weighted reciprocal-rank fusion of two ranked channels, de-duplicated by (document, chunk).
// alpha weights the keyword channel, 1 - alpha the vector channel.
[[nodiscard]] std::vector<QueryHit> FuseReciprocalRank(const std::vector<QueryHit>& keyword_hits,
                                                       const std::vector<QueryHit>& vector_hits,
                                                       float alpha,
                                                       int rrf_k);

// Adds `overlap_bonus` per distinct lower-cased query term that also appears in the chunk, then
// re-sorts.
void RerankByTermOverlap(const std::string& query, float overlap_bonus, std::vector<QueryHit>& hits);

// Renders hits as "[Source: <source>]\n<chunk text>" blocks separated by blank lines. A positive
// max_bytes truncates the result; 0 means unlimited.
[[nodiscard]] std::string BuildContext(const QueryResponse& response, int max_bytes = 0);

}  // namespace recallcpp
