#include "recallcpp/extractors.hpp"
#include "recallcpp/errors.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>

namespace recallcpp {
namespace {

std::string LowerExtension(const std::string& source) {
  auto extension = std::filesystem::path(source).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return extension;
}

}  // namespace

std::string PlainTextExtractor::Extract(const std::string& source) {
  std::ifstream in(source, std::ios::binary);
  if (!in) {
    throw ExtractionError("PlainTextExtractor: failed to open " + source);
  }
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw ExtractionError("PlainTextExtractor: failed to read " + source);
  }
  return text;
}

ExtractorSet::ExtractorSet() {
  extractors_[DocumentType::kText] = std::make_shared<PlainTextExtractor>();
}

void ExtractorSet::Register(DocumentType type, std::shared_ptr<ContentExtractor> extractor) {
  if (type == DocumentType::kAuto) {
    throw InvalidArgumentError("ExtractorSet::Register: auto is not a concrete document type");
  }
  if (extractor == nullptr) {
    throw InvalidArgumentError("ExtractorSet::Register: extractor must not be null");
  }
  extractors_[type] = std::move(extractor);
}

bool ExtractorSet::Has(DocumentType type) const {
  return extractors_.find(type) != extractors_.end();
}

std::string ExtractorSet::Extract(DocumentType type, const std::string& source) const {
  const auto it = extractors_.find(type);
  if (it == extractors_.end()) {
    throw ExtractionError(std::string("no extractor registered for document type ") + DocumentTypeName(type));
  }
  try {
    return it->second->Extract(source);
  } catch (const Error&) {
    throw;
  } catch (const std::exception& ex) {
    throw ExtractionError(std::string(DocumentTypeName(type)) + " extraction failed for " + source + ": " + ex.what());
  }
}

DocumentType DetectDocumentType(const std::string& source) {
  const auto extension = LowerExtension(source);
  if (extension == ".pdf") {
    return DocumentType::kPdf;
  }
  if (extension == ".jpg" || extension == ".jpeg" || extension == ".png") {
    return DocumentType::kImage;
  }
  if (extension == ".wav" || extension == ".mp3" || extension == ".m4a") {
    return DocumentType::kAudio;
  }
  return DocumentType::kText;
}

}  // namespace recallcpp
