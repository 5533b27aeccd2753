#pragma once

#include <stdexcept>
#include <string>

namespace recallcpp {

enum class ErrorCode {
  kInvalidArgument,
  kExtraction,
  kEmbedding,
  kNotFound,
  kStorage,
  kCancelled,
};

class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& message) : std::runtime_error(message), code_(code) {}

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

class InvalidArgumentError final : public Error {
 public:
  explicit InvalidArgumentError(const std::string& message) : Error(ErrorCode::kInvalidArgument, message) {}
};

class ExtractionError final : public Error {
 public:
  explicit ExtractionError(const std::string& message) : Error(ErrorCode::kExtraction, message) {}
};

class EmbeddingError final : public Error {
 public:
  explicit EmbeddingError(const std::string& message) : Error(ErrorCode::kEmbedding, message) {}
};

class NotFoundError final : public Error {
 public:
  explicit NotFoundError(const std::string& message) : Error(ErrorCode::kNotFound, message) {}
};

class StorageError final : public Error {
 public:
  explicit StorageError(const std::string& message) : Error(ErrorCode::kStorage, message) {}
};

class CancelledError final : public Error {
 public:
  explicit CancelledError(const std::string& message) : Error(ErrorCode::kCancelled, message) {}
};

[[nodiscard]] const char* ErrorCodeName(ErrorCode code);

}  // namespace recallcpp
