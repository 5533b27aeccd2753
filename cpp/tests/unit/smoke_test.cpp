#include "recallcpp/errors.hpp"
#include "recallcpp/types.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

int main() {
  recallcpp::tests::Log("smoke_test: start");
  recallcpp::EngineConfig config;
  if (config.chunking.chunk_size != 512) {
    std::cerr << "chunk_size default mismatch\n";
    return EXIT_FAILURE;
  }
  if (config.query.default_top_k != 5) {
    std::cerr << "default_top_k default mismatch\n";
    return EXIT_FAILURE;
  }
  if (config.query.mode != recallcpp::SearchModeKind::kVectorOnly || config.query.rerank) {
    std::cerr << "query defaults must be plain vector similarity\n";
    return EXIT_FAILURE;
  }
  if (std::string(recallcpp::DocumentTypeName(recallcpp::DocumentType::kPdf)) != "pdf") {
    std::cerr << "document type name mismatch\n";
    return EXIT_FAILURE;
  }
  if (std::string(recallcpp::ErrorCodeName(recallcpp::ErrorCode::kNotFound)) != "NotFound") {
    std::cerr << "error code name mismatch\n";
    return EXIT_FAILURE;
  }

  recallcpp::tests::Log("smoke_test: finished");
  std::cout << "recallcpp smoke test passed\n";
  return EXIT_SUCCESS;
}
