#pragma once

#include "recallcpp/types.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace recallcpp {

// Converts a source (path or URI) into plain text. Implementations may throw any std::exception;
// ExtractorSet reports failures as ExtractionError.
class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;
  virtual std::string Extract(const std::string& source) = 0;
};

// Reads a local file verbatim.
class PlainTextExtractor final : public ContentExtractor {
 public:
  std::string Extract(const std::string& source) override;
};

// Maps document types to extractors. Only kText is registered by default; pdf, image and audio
// decoders are supplied by the embedding application.
class ExtractorSet {
 public:
  ExtractorSet();

  void Register(DocumentType type, std::shared_ptr<ContentExtractor> extractor);
  [[nodiscard]] bool Has(DocumentType type) const;
  [[nodiscard]] std::string Extract(DocumentType type, const std::string& source) const;

 private:
  std::unordered_map<DocumentType, std::shared_ptr<ContentExtractor>> extractors_{};
};

// .txt/.md -> text, .pdf -> pdf, .jpg/.jpeg/.png -> image, .wav/.mp3/.m4a -> audio, else text.
// Extension matching ignores case.
[[nodiscard]] DocumentType DetectDocumentType(const std::string& source);

}  // namespace recallcpp
