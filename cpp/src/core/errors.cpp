#include "recallcpp/errors.hpp"
#include "recallcpp/types.hpp"

namespace recallcpp {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kExtraction:
      return "ExtractionError";
    case ErrorCode::kEmbedding:
      return "EmbeddingError";
    case ErrorCode::kNotFound:
      return "NotFound";
    case ErrorCode::kStorage:
      return "StorageError";
    case ErrorCode::kCancelled:
      return "Cancelled";
  }
  return "Unknown";
}

const char* DocumentTypeName(DocumentType type) {
  switch (type) {
    case DocumentType::kText:
      return "text";
    case DocumentType::kPdf:
      return "pdf";
    case DocumentType::kImage:
      return "image";
    case DocumentType::kAudio:
      return "audio";
    case DocumentType::kAuto:
      return "auto";
  }
  return "unknown";
}

}  // namespace recallcpp
