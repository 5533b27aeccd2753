#include "recallcpp/chunker.hpp"
#include "recallcpp/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>

namespace recallcpp {
namespace {

std::string JoinTokenRange(const std::vector<std::string>& tokens, std::size_t begin, std::size_t end) {
  end = std::min(end, tokens.size());
  if (begin >= end) {
    return {};
  }
  std::size_t total = end - begin - 1;
  for (std::size_t i = begin; i < end; ++i) {
    total += tokens[i].size();
  }
  std::string out{};
  out.reserve(total);
  out.append(tokens[begin]);
  for (std::size_t i = begin + 1; i < end; ++i) {
    out.push_back(' ');
    out.append(tokens[i]);
  }
  return out;
}

}  // namespace

std::vector<std::string> TokenizeWhitespace(std::string_view text) {
  std::vector<std::string> tokens{};
  std::size_t start = 0;
  while (start < text.size()) {
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
      ++start;
    }
    if (start >= text.size()) {
      break;
    }
    std::size_t end = start;
    while (end < text.size() && std::isspace(static_cast<unsigned char>(text[end])) == 0) {
      ++end;
    }
    tokens.emplace_back(text.substr(start, end - start));
    start = end;
  }
  return tokens;
}

std::vector<std::string> ChunkText(std::string_view text, int chunk_size) {
  if (chunk_size <= 1) {
    throw InvalidArgumentError("chunker: chunk_size must be greater than 1, got " + std::to_string(chunk_size));
  }
  const auto tokens = TokenizeWhitespace(text);
  if (tokens.empty()) {
    return {};
  }

  const auto window = static_cast<std::size_t>(chunk_size);
  const auto stride = window / 2;
  std::vector<std::string> chunks{};
  chunks.reserve(tokens.size() / stride + 1);
  for (std::size_t start = 0; start < tokens.size(); start += stride) {
    chunks.push_back(JoinTokenRange(tokens, start, start + window));
  }
  return chunks;
}

}  // namespace recallcpp
